// ============================================================================
// KMS Header - Algorithm Codec
// ============================================================================
// A single header byte records how the symmetric key material was wrapped:
//
//   bits 7-4  encryption algorithm   0x1 = RSAES_OAEP_SHA_1
//                                    0x2 = RSAES_OAEP_SHA_256
//   bits 3-0  RSA key spec           0x1 = RSA_2048
//                                    0x2 = RSA_3072
//                                    0x3 = RSA_4096
//
// Either nibble may be zero, meaning "not recorded".
// ============================================================================

#ifndef KMSHEADER_ALGORITHM_HPP
#define KMSHEADER_ALGORITHM_HPP

#include "types.hpp"
#include <optional>
#include <string_view>

namespace kmsheader {

/// RSA-OAEP encryption algorithms (upper nibble of the algorithm byte)
enum class Algorithm : Byte {
    RsaesOaepSha1 = 0x10,
    RsaesOaepSha256 = 0x20,
};

/// RSA key specs (lower nibble of the algorithm byte)
enum class KeySpec : Byte {
    Rsa2048 = 0x01,
    Rsa3072 = 0x02,
    Rsa4096 = 0x03,
};

/// Both halves of a decoded algorithm byte
struct AlgorithmByte {
    std::optional<Algorithm> algorithm;
    std::optional<KeySpec> key_spec;

    bool operator==(const AlgorithmByte&) const = default;
};

// ============================================================================
// Names (as used by KMS)
// ============================================================================

/// "RSAES_OAEP_SHA_1" or "RSAES_OAEP_SHA_256"
[[nodiscard]] std::string_view to_string(Algorithm algorithm) noexcept;

/// "RSA_2048", "RSA_3072" or "RSA_4096"
[[nodiscard]] std::string_view to_string(KeySpec key_spec) noexcept;

/// Look up an algorithm by its KMS name
[[nodiscard]] Result<Algorithm> parse_algorithm(std::string_view name);

/// Look up a key spec by its KMS name
[[nodiscard]] Result<KeySpec> parse_key_spec(std::string_view name);

// ============================================================================
// Sizes
// ============================================================================

/// Map an RSA modulus size in bits to a key spec
/// @return The key spec, or UnsupportedKeySize
[[nodiscard]] Result<KeySpec> key_spec_from_bits(std::size_t bits);

/// RSA modulus size in bits
[[nodiscard]] std::size_t key_spec_bits(KeySpec key_spec) noexcept;

/// Length of the RSA cipher data in bytes (256, 384 or 512)
[[nodiscard]] std::size_t cipher_length(KeySpec key_spec) noexcept;

/// OAEP padding overhead in bytes: 2 * hash length + 2
[[nodiscard]] std::size_t oaep_overhead(Algorithm algorithm) noexcept;

/// Largest plaintext that fits in one RSA-OAEP block
[[nodiscard]] std::size_t max_plaintext_length(Algorithm algorithm, KeySpec key_spec) noexcept;

// ============================================================================
// Byte Codec
// ============================================================================

/// Pack an algorithm and a key spec into one byte
/// Absent halves encode as zero.
/// @return The algorithm byte, or UnsupportedAlgorithm / UnsupportedKeySize
///         for values outside the enumerations
[[nodiscard]] Result<Byte> encode_algorithm_byte(
    std::optional<Algorithm> algorithm,
    std::optional<KeySpec> key_spec
);

/// Unpack an algorithm byte
/// A zero nibble decodes as absent; a non-zero nibble without an entry fails
/// with UnrecognizedCode.
[[nodiscard]] Result<AlgorithmByte> decode_algorithm_byte(Byte value);

} // namespace kmsheader

#endif // KMSHEADER_ALGORITHM_HPP
