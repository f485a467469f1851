#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <optional>

// All decoders are strict: they reject characters outside the alphabet and
// non-canonical encodings, so two different strings never decode to the same bytes.
namespace NEncoding {
    std::string                         hexEncode(const std::vector<uint8_t>& data);
    std::optional<std::vector<uint8_t>> hexDecode(std::string_view str);

    std::string                         base58Encode(const std::vector<uint8_t>& data);
    std::optional<std::vector<uint8_t>> base58Decode(std::string_view str);

    // RFC 4648 alphabet, with '=' padding
    std::string                         base64Encode(const std::vector<uint8_t>& data);
    std::optional<std::vector<uint8_t>> base64Decode(std::string_view str);

    // RFC 4648 url-safe alphabet, no padding
    std::string                         base64UrlEncode(const std::vector<uint8_t>& data);
    std::optional<std::vector<uint8_t>> base64UrlDecode(std::string_view str);

    // RFC 4648 base32, no padding
    std::string                         base32Encode(const std::vector<uint8_t>& data);
    std::optional<std::vector<uint8_t>> base32Decode(std::string_view str);
};
