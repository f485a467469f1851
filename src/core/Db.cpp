#include "Db.hpp"

#include "../debug/log.hpp"

#include <memory>
#include <stdexcept>

constexpr const uint64_t DB_TIME_BEFORE_CLEANUP_MS    = 1000 * 60 * 10; // 10 mins
constexpr const int64_t  DB_CHALLENGE_RETENTION_MS    = 1000 * 60 * 10; // kept past expiry, so late replays still read Expired

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

static StatementPtr prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        Debug::log(ERR, "sqlite3 error: failed to prepare:\n{}\nGot: {}", sql, sqlite3_errmsg(db));
        if (stmt)
            sqlite3_finalize(stmt);
        return StatementPtr{nullptr, &sqlite3_finalize};
    }
    return StatementPtr{stmt, &sqlite3_finalize};
}

static void bindText(sqlite3_stmt* stmt, int idx, const std::string& s) {
    sqlite3_bind_text(stmt, idx, s.c_str(), (int)s.size(), SQLITE_TRANSIENT);
}

static std::string columnText(sqlite3_stmt* stmt, int idx) {
    const auto* TEXT = sqlite3_column_text(stmt, idx);
    if (!TEXT)
        return "";
    return std::string{reinterpret_cast<const char*>(TEXT), (size_t)sqlite3_column_bytes(stmt, idx)};
}

CDatabase::CDatabase(const std::string& path, ClockFn clock) : m_clock(std::move(clock)) {
    if (path != DB_IN_MEMORY)
        Debug::log(LOG, "Opening challenge store at {}", path);

    if (sqlite3_open_v2(path.c_str(), &m_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
        const std::string ERR_MSG = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        if (m_db)
            sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("failed to open sqlite3 db: " + ERR_MSG);
    }

    const char* CHALLENGE_TABLE = R"#(
CREATE TABLE IF NOT EXISTS challenges (
	nonce TEXT NOT NULL,
	address TEXT NOT NULL,
	network TEXT NOT NULL,
	domain TEXT NOT NULL,
	uri TEXT NOT NULL,
	statement TEXT NOT NULL,
	version TEXT NOT NULL,
	issued_ms INTEGER NOT NULL,
	expires_ms INTEGER NOT NULL,
	used INTEGER NOT NULL DEFAULT 0,
	CONSTRAINT PK PRIMARY KEY (nonce)
);)#";

    const char* REVOKED_TABLE = R"#(
CREATE TABLE IF NOT EXISTS revoked_tokens (
	jti TEXT NOT NULL,
	expires_ms INTEGER NOT NULL,
	CONSTRAINT PK PRIMARY KEY (jti)
);)#";

    if (!exec(CHALLENGE_TABLE) || !exec(REVOKED_TABLE)) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("failed to create sqlite3 db layout");
    }

    cleanupDb();
}

CDatabase::~CDatabase() {
    if (m_db)
        sqlite3_close(m_db);
}

bool CDatabase::exec(const char* sql) {
    char* errmsg = nullptr;
    sqlite3_exec(m_db, sql, nullptr, nullptr, &errmsg);

    if (errmsg) {
        Debug::log(ERR, "sqlite3 error: tried to run:\n{}\nGot: {}", sql, errmsg);
        sqlite3_free(errmsg);
        return false;
    }

    return true;
}

std::expected<bool, eAuthError> CDatabase::putChallenge(const SChallenge& c) {
    std::lock_guard<std::mutex> lg(m_mutex);

    if (shouldCleanupDb())
        cleanupDb();

    auto stmt = prepare(m_db, "INSERT INTO challenges (nonce, address, network, domain, uri, statement, version, issued_ms, expires_ms, used) "
                              "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, 0);");
    if (!stmt)
        return std::unexpected(AUTH_ERROR_STORE_UNAVAILABLE);

    bindText(stmt.get(), 1, c.nonce);
    bindText(stmt.get(), 2, c.address);
    bindText(stmt.get(), 3, c.network);
    bindText(stmt.get(), 4, c.domain);
    bindText(stmt.get(), 5, c.uri);
    bindText(stmt.get(), 6, c.statement);
    bindText(stmt.get(), 7, c.version);
    sqlite3_bind_int64(stmt.get(), 8, NTimeUtils::toEpochMs(c.issuedAt));
    sqlite3_bind_int64(stmt.get(), 9, NTimeUtils::toEpochMs(c.expirationTime));

    const int RC = sqlite3_step(stmt.get());

    if (RC == SQLITE_DONE)
        return true;

    if (RC == SQLITE_CONSTRAINT) {
        Debug::log(WARN, "CDatabase::putChallenge: nonce collision");
        return false;
    }

    Debug::log(ERR, "sqlite3 error: insert challenge: {}", sqlite3_errmsg(m_db));
    return std::unexpected(AUTH_ERROR_STORE_UNAVAILABLE);
}

std::expected<SChallenge, eAuthError> CDatabase::claimAndConsume(const std::string& address, const std::string& network, const std::string& nonce) {
    std::lock_guard<std::mutex> lg(m_mutex);

    if (shouldCleanupDb())
        cleanupDb();

    const auto NOW_MS = NTimeUtils::toEpochMs(m_clock());

    auto       claim = prepare(m_db, "UPDATE challenges SET used = 1 WHERE nonce = ?1 AND address = ?2 AND network = ?3 AND used = 0 AND expires_ms > ?4;");
    if (!claim)
        return std::unexpected(AUTH_ERROR_STORE_UNAVAILABLE);

    bindText(claim.get(), 1, nonce);
    bindText(claim.get(), 2, address);
    bindText(claim.get(), 3, network);
    sqlite3_bind_int64(claim.get(), 4, NOW_MS);

    if (sqlite3_step(claim.get()) != SQLITE_DONE) {
        Debug::log(ERR, "sqlite3 error: claim challenge: {}", sqlite3_errmsg(m_db));
        return std::unexpected(AUTH_ERROR_STORE_UNAVAILABLE);
    }

    const bool CLAIMED = sqlite3_changes(m_db) == 1;

    auto       select = prepare(m_db, "SELECT domain, uri, statement, version, issued_ms, expires_ms FROM challenges WHERE nonce = ?1 AND address = ?2 AND network = ?3;");
    if (!select)
        return std::unexpected(AUTH_ERROR_STORE_UNAVAILABLE);

    bindText(select.get(), 1, nonce);
    bindText(select.get(), 2, address);
    bindText(select.get(), 3, network);

    const int RC = sqlite3_step(select.get());

    if (RC == SQLITE_DONE)
        return std::unexpected(AUTH_ERROR_NOT_FOUND);

    if (RC != SQLITE_ROW) {
        Debug::log(ERR, "sqlite3 error: read challenge: {}", sqlite3_errmsg(m_db));
        return std::unexpected(AUTH_ERROR_STORE_UNAVAILABLE);
    }

    SChallenge c;
    c.address        = address;
    c.network        = network;
    c.nonce          = nonce;
    c.domain         = columnText(select.get(), 0);
    c.uri            = columnText(select.get(), 1);
    c.statement      = columnText(select.get(), 2);
    c.version        = columnText(select.get(), 3);
    c.issuedAt       = NTimeUtils::fromEpochMs(sqlite3_column_int64(select.get(), 4));
    c.expirationTime = NTimeUtils::fromEpochMs(sqlite3_column_int64(select.get(), 5));

    if (CLAIMED)
        return c;

    if (NTimeUtils::toEpochMs(c.expirationTime) <= NOW_MS)
        return std::unexpected(AUTH_ERROR_EXPIRED);

    return std::unexpected(AUTH_ERROR_ALREADY_USED);
}

bool CDatabase::revokeToken(const std::string& tokenId, const TimePoint& expiresAt) {
    std::lock_guard<std::mutex> lg(m_mutex);

    auto                        stmt = prepare(m_db, "INSERT OR REPLACE INTO revoked_tokens (jti, expires_ms) VALUES (?1, ?2);");
    if (!stmt)
        return false;

    bindText(stmt.get(), 1, tokenId);
    sqlite3_bind_int64(stmt.get(), 2, NTimeUtils::toEpochMs(expiresAt));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        Debug::log(ERR, "sqlite3 error: revoke token: {}", sqlite3_errmsg(m_db));
        return false;
    }

    return true;
}

bool CDatabase::isTokenRevoked(const std::string& tokenId) {
    std::lock_guard<std::mutex> lg(m_mutex);

    auto                        stmt = prepare(m_db, "SELECT 1 FROM revoked_tokens WHERE jti = ?1;");
    if (!stmt)
        return true;

    bindText(stmt.get(), 1, tokenId);

    const int RC = sqlite3_step(stmt.get());
    if (RC == SQLITE_ROW)
        return true;
    if (RC == SQLITE_DONE)
        return false;

    Debug::log(ERR, "sqlite3 error: read revoked token: {}", sqlite3_errmsg(m_db));
    return true;
}

bool CDatabase::shouldCleanupDb() {
    const auto TIME = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count();
    const auto LAST = std::chrono::duration_cast<std::chrono::milliseconds>(m_lastDbCleanup.time_since_epoch()).count();

    if ((uint64_t)(TIME - LAST) > DB_TIME_BEFORE_CLEANUP_MS)
        return true;

    return false;
}

void CDatabase::cleanupDb() {
    m_lastDbCleanup = std::chrono::steady_clock::now();

    const auto NOW_MS = NTimeUtils::toEpochMs(m_clock());

    auto       challenges = prepare(m_db, "DELETE FROM challenges WHERE expires_ms < ?1;");
    if (challenges) {
        sqlite3_bind_int64(challenges.get(), 1, NOW_MS - DB_CHALLENGE_RETENTION_MS);
        if (sqlite3_step(challenges.get()) != SQLITE_DONE)
            Debug::log(ERR, "sqlite3 error: cleanup challenges: {}", sqlite3_errmsg(m_db));
    }

    auto tokens = prepare(m_db, "DELETE FROM revoked_tokens WHERE expires_ms < ?1;");
    if (tokens) {
        sqlite3_bind_int64(tokens.get(), 1, NOW_MS);
        if (sqlite3_step(tokens.get()) != SQLITE_DONE)
            Debug::log(ERR, "sqlite3 error: cleanup revoked tokens: {}", sqlite3_errmsg(m_db));
    }
}
