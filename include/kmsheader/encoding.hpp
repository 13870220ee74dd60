// ============================================================================
// KMS Header - Byte Encodings
// ============================================================================
// Hex and base64 conversions shared by the key reference codec, the header
// model and the command-line tool. Base64 is the standard alphabet with '='
// padding, computed by OpenSSL.
// ============================================================================

#ifndef KMSHEADER_ENCODING_HPP
#define KMSHEADER_ENCODING_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace kmsheader {

/// Encode bytes as lowercase hex (two characters per byte)
[[nodiscard]] std::string to_hex(ByteSpan data);

/// Decode hex text (either case) into bytes
/// @return The decoded bytes, or InvalidEncoding for odd length or non-hex characters
[[nodiscard]] Result<ByteBuffer> from_hex(std::string_view hex);

/// Encode bytes as standard base64
[[nodiscard]] std::string base64_encode(ByteSpan data);

/// Decode standard base64 text
/// Surrounding whitespace and line breaks are ignored.
/// @return The decoded bytes, or InvalidEncoding
[[nodiscard]] Result<ByteBuffer> base64_decode(std::string_view text);

/// Check whether a character is a hex digit
[[nodiscard]] constexpr bool is_hex_digit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/// Check whether a character is a lowercase hex digit
[[nodiscard]] constexpr bool is_lower_hex_digit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace kmsheader

#endif // KMSHEADER_ENCODING_HPP
