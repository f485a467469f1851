#include "Encoding.hpp"

#include <algorithm>
#include <array>
#include <climits>

#include <fmt/format.h>
#include <openssl/evp.h>

constexpr std::string_view BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr std::string_view BASE32_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

static constexpr std::array<int, 256> buildDecodeTable(std::string_view alphabet) {
    std::array<int, 256> table{};
    table.fill(-1);
    for (size_t i = 0; i < alphabet.size(); ++i) {
        table[(unsigned char)alphabet[i]] = (int)i;
    }
    return table;
}

static constexpr auto BASE58_TABLE = buildDecodeTable(BASE58_ALPHABET);
static constexpr auto BASE32_TABLE = buildDecodeTable(BASE32_ALPHABET);

std::string NEncoding::hexEncode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (const auto& b : data) {
        out += fmt::format("{:02x}", b);
    }
    return out;
}

std::optional<std::vector<uint8_t>> NEncoding::hexDecode(std::string_view str) {
    if (str.size() % 2 != 0)
        return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        return -1; // lowercase only
    };

    std::vector<uint8_t> out;
    out.reserve(str.size() / 2);
    for (size_t i = 0; i < str.size(); i += 2) {
        const int HI = nibble(str[i]);
        const int LO = nibble(str[i + 1]);
        if (HI < 0 || LO < 0)
            return std::nullopt;
        out.emplace_back((uint8_t)((HI << 4) | LO));
    }

    return out;
}

std::string NEncoding::base58Encode(const std::vector<uint8_t>& data) {
    size_t leadingZeros = 0;
    while (leadingZeros < data.size() && data[leadingZeros] == 0) {
        ++leadingZeros;
    }

    // little-endian base58 digits
    std::vector<uint8_t> digits;
    digits.reserve((data.size() - leadingZeros) * 138 / 100 + 1);

    for (size_t i = leadingZeros; i < data.size(); ++i) {
        int carry = data[i];
        for (auto& d : digits) {
            carry += 256 * d;
            d     = carry % 58;
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(carry % 58);
            carry /= 58;
        }
    }

    std::string result(leadingZeros, '1');
    result.reserve(leadingZeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }

    return result;
}

std::optional<std::vector<uint8_t>> NEncoding::base58Decode(std::string_view str) {
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    // little-endian base256 bytes
    std::vector<uint8_t> bytes;
    bytes.reserve((str.size() - zeroes) * 733 / 1000 + 1);

    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = BASE58_TABLE[(unsigned char)str[i]];
        if (carry < 0)
            return std::nullopt;

        for (auto& b : bytes) {
            carry += 58 * b;
            b     = carry & 0xFF;
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(carry & 0xFF);
            carry >>= 8;
        }
    }

    std::vector<uint8_t> result(zeroes, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

std::string NEncoding::base64Encode(const std::vector<uint8_t>& data) {
    // EVP_EncodeBlock also writes a trailing NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');

    const int   LEN = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(), (int)data.size());
    if (LEN < 0)
        return "";

    out.resize(LEN);
    return out;
}

std::optional<std::vector<uint8_t>> NEncoding::base64Decode(std::string_view str) {
    if (str.empty())
        return std::vector<uint8_t>{};

    if (str.size() % 4 != 0 || str.size() > (size_t)INT_MAX)
        return std::nullopt;

    std::vector<uint8_t> out(3 * (str.size() / 4));
    const int            LEN = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(str.data()), (int)str.size());
    if (LEN < 0)
        return std::nullopt;

    // the returned length counts the zero bytes decoded from padding
    size_t padding = 0;
    while (padding < 2 && str[str.size() - 1 - padding] == '=') {
        ++padding;
    }

    if ((size_t)LEN < padding)
        return std::nullopt;

    out.resize(LEN - padding);

    // EVP_DecodeBlock skips surrounding whitespace and ignores stray bits, only the canonical form is accepted
    if (base64Encode(out) != str)
        return std::nullopt;

    return out;
}

std::string NEncoding::base64UrlEncode(const std::vector<uint8_t>& data) {
    std::string out = base64Encode(data);

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }

    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::optional<std::vector<uint8_t>> NEncoding::base64UrlDecode(std::string_view str) {
    if (str.size() % 4 == 1 || str.find_first_of("+/=") != std::string_view::npos)
        return std::nullopt;

    std::string standard{str};
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');
    standard.append((4 - standard.size() % 4) % 4, '=');

    return base64Decode(standard);
}

std::string NEncoding::base32Encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t val  = 0;
    int      bits = 0;
    for (const auto& c : data) {
        val = (val << 8) | c;
        bits += 8;
        while (bits >= 5) {
            out.push_back(BASE32_ALPHABET[(val >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }

    if (bits > 0)
        out.push_back(BASE32_ALPHABET[(val << (5 - bits)) & 0x1F]);

    return out;
}

std::optional<std::vector<uint8_t>> NEncoding::base32Decode(std::string_view str) {
    std::vector<uint8_t> out;
    out.reserve(str.size() * 5 / 8);

    uint32_t val  = 0;
    int      bits = 0;
    for (const auto& c : str) {
        const int V = BASE32_TABLE[(unsigned char)c];
        if (V < 0)
            return std::nullopt;

        val = (val << 5) | (uint32_t)V;
        bits += 5;
        if (bits >= 8) {
            out.push_back((uint8_t)((val >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }

    // a full leftover character or nonzero leftover bits are not canonical
    if (bits >= 5 || (val & ((1u << bits) - 1)) != 0)
        return std::nullopt;

    return out;
}
