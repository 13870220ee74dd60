// ============================================================================
// KMS Header - Byte Encodings Implementation
// ============================================================================

#include "kmsheader/encoding.hpp"

// OpenSSL headers
#include <openssl/evp.h>

#include <climits>

namespace kmsheader {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

constexpr Byte hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<Byte>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<Byte>(c - 'a' + 10);
    return static_cast<Byte>(c - 'A' + 10);
}

bool is_base64_space(char c) noexcept {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // anonymous namespace

// ============================================================================
// Hex
// ============================================================================

std::string to_hex(ByteSpan data) {
    std::string hex;
    hex.reserve(data.size() * 2);
    for (Byte b : data) {
        hex.push_back(HEX_DIGITS[b >> 4]);
        hex.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return hex;
}

Result<ByteBuffer> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::unexpected(ErrorCode::InvalidEncoding);
    }

    ByteBuffer bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (!is_hex_digit(hex[i]) || !is_hex_digit(hex[i + 1])) {
            return std::unexpected(ErrorCode::InvalidEncoding);
        }
        bytes.push_back(static_cast<Byte>((hex_value(hex[i]) << 4) | hex_value(hex[i + 1])));
    }
    return bytes;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(ByteSpan data) {
    if (data.empty()) {
        return {};
    }

    // EVP_EncodeBlock output: ceil(n/3)*4 bytes + null terminator
    std::string out((data.size() + 2) / 3 * 4 + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(len));
    return out;
}

Result<ByteBuffer> base64_decode(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!is_base64_space(c)) {
            compact.push_back(c);
        }
    }

    if (compact.empty()) {
        return ByteBuffer{};
    }
    if (compact.size() % 4 != 0 || compact.size() > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected(ErrorCode::InvalidEncoding);
    }

    // '=' may only close the final group, one or two of them
    std::size_t first_pad = compact.find('=');
    if (first_pad != std::string::npos) {
        std::size_t pad_count = compact.size() - first_pad;
        if (pad_count > 2 || compact.find_first_not_of('=', first_pad) != std::string::npos) {
            return std::unexpected(ErrorCode::InvalidEncoding);
        }
    }

    ByteBuffer out(compact.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(compact.data()),
                              static_cast<int>(compact.size()));
    if (len < 0) {
        return std::unexpected(ErrorCode::InvalidEncoding);
    }

    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    std::size_t padding = 0;
    if (compact.back() == '=') ++padding;
    if (compact[compact.size() - 2] == '=') ++padding;

    out.resize(static_cast<std::size_t>(len) - padding);
    return out;
}

} // namespace kmsheader
