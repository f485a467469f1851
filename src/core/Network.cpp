#include "Network.hpp"

#include "Crypto.hpp"
#include "../helpers/Encoding.hpp"

#include <algorithm>

constexpr const char*   SOLANA_PREFIX              = "solana-";
constexpr const char*   STELLAR_PREFIX             = "stellar-";
constexpr const char*   STELLAR_MESSAGE_PREFIX     = "Stellar Signed Message:\n";
constexpr const uint8_t STELLAR_ACCOUNT_ID_VERSION = 6 << 3; // 'G'
constexpr const size_t  STELLAR_ADDRESS_LEN        = 56;
constexpr const size_t  SOLANA_SIGNATURE_MAX_LEN   = 88; // base58 of 64 bytes
constexpr const size_t  STELLAR_SIGNATURE_LEN      = 88; // padded base64 of 64 bytes

static const std::vector<std::string> KNOWN_NETWORKS = {
    "solana-mainnet", "solana-devnet", "solana-testnet", "stellar-pubnet", "stellar-testnet",
};

// CRC16-XModem, poly 0x1021, init 0
static uint16_t crc16XModem(const uint8_t* data, size_t len) {
    uint16_t crc = 0;
    for (size_t i = 0; i < len; ++i) {
        crc ^= (uint16_t)data[i] << 8;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 0x8000) ? (uint16_t)((crc << 1) ^ 0x1021) : (uint16_t)(crc << 1);
        }
    }
    return crc;
}

//

CSolanaScheme::CSolanaScheme(const std::string& cluster) : m_cluster(cluster) {
    ;
}

std::string CSolanaScheme::name() const {
    return SOLANA_PREFIX + m_cluster;
}

std::expected<Bytes, eAuthError> CSolanaScheme::deriveVerifyingKey(const std::string& address) const {
    // 32 bytes encode to 32..44 chars
    if (address.size() < 32 || address.size() > 44)
        return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);

    auto key = NEncoding::base58Decode(address);
    if (!key || key->size() != CRYPTO_ED25519_KEY_LEN)
        return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);

    // reject non-canonical spellings (extra leading '1's)
    if (NEncoding::base58Encode(*key) != address)
        return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);

    return *key;
}

std::expected<Bytes, eAuthError> CSolanaScheme::decodeSignature(const std::string& signature) const {
    // base58 decoding is quadratic, bound it before decoding
    if (signature.empty() || signature.size() > SOLANA_SIGNATURE_MAX_LEN)
        return std::unexpected(AUTH_ERROR_MALFORMED_SIGNATURE);

    auto sig = NEncoding::base58Decode(signature);
    if (!sig || sig->size() != CRYPTO_ED25519_SIG_LEN || NEncoding::base58Encode(*sig) != signature)
        return std::unexpected(AUTH_ERROR_MALFORMED_SIGNATURE);

    return *sig;
}

bool CSolanaScheme::verifySignature(const Bytes& key, const std::string& message, const Bytes& signature) const {
    return NCrypto::ed25519Verify(key, Bytes{message.begin(), message.end()}, signature);
}

//

CStellarScheme::CStellarScheme(const std::string& network) : m_network(network) {
    ;
}

std::string CStellarScheme::name() const {
    return STELLAR_PREFIX + m_network;
}

std::expected<Bytes, eAuthError> CStellarScheme::deriveVerifyingKey(const std::string& address) const {
    if (address.size() != STELLAR_ADDRESS_LEN || address.front() != 'G')
        return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);

    auto raw = NEncoding::base32Decode(address);
    if (!raw || raw->size() != 1 + CRYPTO_ED25519_KEY_LEN + 2 || raw->at(0) != STELLAR_ACCOUNT_ID_VERSION)
        return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);

    const uint16_t CRC      = crc16XModem(raw->data(), 1 + CRYPTO_ED25519_KEY_LEN);
    const uint16_t EXPECTED = (uint16_t)(raw->at(33) | (raw->at(34) << 8));
    if (CRC != EXPECTED)
        return std::unexpected(AUTH_ERROR_INVALID_ADDRESS);

    return Bytes{raw->begin() + 1, raw->begin() + 1 + CRYPTO_ED25519_KEY_LEN};
}

std::expected<Bytes, eAuthError> CStellarScheme::decodeSignature(const std::string& signature) const {
    if (signature.size() != STELLAR_SIGNATURE_LEN)
        return std::unexpected(AUTH_ERROR_MALFORMED_SIGNATURE);

    auto sig = NEncoding::base64Decode(signature);
    if (!sig || sig->size() != CRYPTO_ED25519_SIG_LEN)
        return std::unexpected(AUTH_ERROR_MALFORMED_SIGNATURE);

    return *sig;
}

bool CStellarScheme::verifySignature(const Bytes& key, const std::string& message, const Bytes& signature) const {
    return NCrypto::ed25519Verify(key, signedPayload(message), signature);
}

std::string CStellarScheme::encodeAddress(const Bytes& publicKey) {
    Bytes raw;
    raw.reserve(1 + publicKey.size() + 2);
    raw.push_back(STELLAR_ACCOUNT_ID_VERSION);
    raw.insert(raw.end(), publicKey.begin(), publicKey.end());

    const uint16_t CRC = crc16XModem(raw.data(), raw.size());
    raw.push_back(CRC & 0xFF);
    raw.push_back(CRC >> 8);

    return NEncoding::base32Encode(raw);
}

Bytes CStellarScheme::signedPayload(const std::string& message) {
    return NCrypto::sha256(std::string{STELLAR_MESSAGE_PREFIX} + message);
}

//

void CNetworkRegistry::registerScheme(std::unique_ptr<INetworkScheme>&& scheme) {
    const auto NAME = scheme->name();
    m_schemes[NAME] = std::move(scheme);
}

const INetworkScheme* CNetworkRegistry::get(const std::string& network) const {
    const auto IT = m_schemes.find(network);
    if (IT == m_schemes.end())
        return nullptr;
    return IT->second.get();
}

std::vector<std::string> CNetworkRegistry::supported() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : m_schemes) {
        names.emplace_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> CNetworkRegistry::knownNetworks() {
    return KNOWN_NETWORKS;
}

std::unique_ptr<INetworkScheme> CNetworkRegistry::makeScheme(const std::string& network) {
    if (std::find(KNOWN_NETWORKS.begin(), KNOWN_NETWORKS.end(), network) == KNOWN_NETWORKS.end())
        return nullptr;

    if (network.starts_with(SOLANA_PREFIX))
        return std::make_unique<CSolanaScheme>(network.substr(std::string_view{SOLANA_PREFIX}.size()));

    if (network.starts_with(STELLAR_PREFIX))
        return std::make_unique<CStellarScheme>(network.substr(std::string_view{STELLAR_PREFIX}.size()));

    return nullptr;
}

std::shared_ptr<CNetworkRegistry> CNetworkRegistry::fromNames(const std::vector<std::string>& networks) {
    auto registry = std::make_shared<CNetworkRegistry>();
    for (const auto& n : networks) {
        auto scheme = makeScheme(n);
        if (scheme)
            registry->registerScheme(std::move(scheme));
    }
    return registry;
}
