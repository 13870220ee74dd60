// ============================================================================
// KMS Header - Algorithm Codec Implementation
// ============================================================================

#include "kmsheader/algorithm.hpp"

namespace kmsheader {

namespace {

constexpr Byte ALGORITHM_MASK = 0xF0;
constexpr Byte KEY_SPEC_MASK = 0x0F;

constexpr bool is_known(Algorithm algorithm) noexcept {
    return algorithm == Algorithm::RsaesOaepSha1 || algorithm == Algorithm::RsaesOaepSha256;
}

constexpr bool is_known(KeySpec key_spec) noexcept {
    return key_spec == KeySpec::Rsa2048 || key_spec == KeySpec::Rsa3072 ||
           key_spec == KeySpec::Rsa4096;
}

} // anonymous namespace

// ============================================================================
// Names
// ============================================================================

std::string_view to_string(Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::RsaesOaepSha1: return "RSAES_OAEP_SHA_1";
        case Algorithm::RsaesOaepSha256: return "RSAES_OAEP_SHA_256";
    }
    return "UNKNOWN";
}

std::string_view to_string(KeySpec key_spec) noexcept {
    switch (key_spec) {
        case KeySpec::Rsa2048: return "RSA_2048";
        case KeySpec::Rsa3072: return "RSA_3072";
        case KeySpec::Rsa4096: return "RSA_4096";
    }
    return "UNKNOWN";
}

Result<Algorithm> parse_algorithm(std::string_view name) {
    if (name == "RSAES_OAEP_SHA_1") return Algorithm::RsaesOaepSha1;
    if (name == "RSAES_OAEP_SHA_256") return Algorithm::RsaesOaepSha256;
    return std::unexpected(ErrorCode::UnsupportedAlgorithm);
}

Result<KeySpec> parse_key_spec(std::string_view name) {
    if (name == "RSA_2048") return KeySpec::Rsa2048;
    if (name == "RSA_3072") return KeySpec::Rsa3072;
    if (name == "RSA_4096") return KeySpec::Rsa4096;
    return std::unexpected(ErrorCode::UnsupportedKeySize);
}

// ============================================================================
// Sizes
// ============================================================================

Result<KeySpec> key_spec_from_bits(std::size_t bits) {
    switch (bits) {
        case 2048: return KeySpec::Rsa2048;
        case 3072: return KeySpec::Rsa3072;
        case 4096: return KeySpec::Rsa4096;
        default: return std::unexpected(ErrorCode::UnsupportedKeySize);
    }
}

std::size_t key_spec_bits(KeySpec key_spec) noexcept {
    return cipher_length(key_spec) * 8;
}

std::size_t cipher_length(KeySpec key_spec) noexcept {
    switch (key_spec) {
        case KeySpec::Rsa2048: return 256;
        case KeySpec::Rsa3072: return 384;
        case KeySpec::Rsa4096: return 512;
    }
    return 0;
}

std::size_t oaep_overhead(Algorithm algorithm) noexcept {
    // 2 * hash_size + 2: SHA-1 is 20 bytes, SHA-256 is 32 bytes
    switch (algorithm) {
        case Algorithm::RsaesOaepSha1: return 42;
        case Algorithm::RsaesOaepSha256: return 66;
    }
    return 0;
}

std::size_t max_plaintext_length(Algorithm algorithm, KeySpec key_spec) noexcept {
    std::size_t key_bytes = cipher_length(key_spec);
    std::size_t overhead = oaep_overhead(algorithm);
    if (key_bytes <= overhead) return 0;
    return key_bytes - overhead;
}

// ============================================================================
// Byte Codec
// ============================================================================

Result<Byte> encode_algorithm_byte(
    std::optional<Algorithm> algorithm,
    std::optional<KeySpec> key_spec
) {
    Byte value = 0;

    if (algorithm) {
        if (!is_known(*algorithm)) {
            return std::unexpected(ErrorCode::UnsupportedAlgorithm);
        }
        value |= static_cast<Byte>(*algorithm);
    }

    if (key_spec) {
        if (!is_known(*key_spec)) {
            return std::unexpected(ErrorCode::UnsupportedKeySize);
        }
        value |= static_cast<Byte>(*key_spec);
    }

    return value;
}

Result<AlgorithmByte> decode_algorithm_byte(Byte value) {
    AlgorithmByte decoded;

    Byte algorithm_code = value & ALGORITHM_MASK;
    if (algorithm_code != 0) {
        auto algorithm = static_cast<Algorithm>(algorithm_code);
        if (!is_known(algorithm)) {
            return std::unexpected(ErrorCode::UnrecognizedCode);
        }
        decoded.algorithm = algorithm;
    }

    Byte key_spec_code = value & KEY_SPEC_MASK;
    if (key_spec_code != 0) {
        auto key_spec = static_cast<KeySpec>(key_spec_code);
        if (!is_known(key_spec)) {
            return std::unexpected(ErrorCode::UnrecognizedCode);
        }
        decoded.key_spec = key_spec;
    }

    return decoded;
}

} // namespace kmsheader
