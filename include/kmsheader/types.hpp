// ============================================================================
// KMS Header - Common Types and Error Handling
// ============================================================================
// This header defines the foundational types used throughout kmsheader:
// - Error codes and result types using C++23 std::expected
// - Byte containers and views
// - Layout constants of the binary header
// ============================================================================

#ifndef KMSHEADER_TYPES_HPP
#define KMSHEADER_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kmsheader {

// ============================================================================
// Byte Types
// ============================================================================

/// A single byte (unsigned 8-bit integer)
using Byte = std::uint8_t;

/// A dynamically-sized container for bytes (headers, cipher data, payloads)
using ByteBuffer = std::vector<Byte>;

/// A read-only view into a byte sequence (non-owning)
using ByteSpan = std::span<const Byte>;

// ============================================================================
// Error Codes
// ============================================================================

/// All possible error conditions in kmsheader
enum class ErrorCode {
    Success = 0,

    // Key Reference Errors (100-199)
    InvalidReference = 100,
    MalformedReference = 101,
    RegionNumberOutOfRange = 102,

    // Algorithm Errors (200-299)
    UnsupportedAlgorithm = 200,
    UnsupportedKeySize = 201,
    UnrecognizedCode = 202,

    // Header Errors (300-399)
    TooShort = 300,
    InvalidPrefixLength = 301,
    CipherLengthMismatch = 302,
    IncompleteHeader = 303,
    InvalidEncoding = 304,

    // Encryption Errors (400-499)
    PlaintextTooLarge = 400,
    MissingPublicKey = 401,
    InvalidPublicKey = 402,
    InvalidPrivateKey = 403,
    KeyGenerationFailed = 404,
    EncryptionFailed = 405,

    // KMS Errors (500-599)
    DecryptionFailed = 500,
    KeyNotFound = 501,
    Cancelled = 502,
    Timeout = 503,

    // File I/O Errors (600-699)
    FileNotFound = 600,
    FileReadError = 601,
    FileWriteError = 602,

    // General Errors (900-999)
    InvalidArgument = 900,
    InternalError = 901,
};

/// Convert an error code to a human-readable string
[[nodiscard]] constexpr std::string_view error_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Key Reference
        case ErrorCode::InvalidReference: return "Invalid KMS key ARN";
        case ErrorCode::MalformedReference: return "Malformed binary key reference";
        case ErrorCode::RegionNumberOutOfRange: return "Region number out of range (0-255)";

        // Algorithm
        case ErrorCode::UnsupportedAlgorithm: return "Unsupported algorithm";
        case ErrorCode::UnsupportedKeySize: return "Unsupported RSA key size (2048, 3072 or 4096)";
        case ErrorCode::UnrecognizedCode: return "Unrecognized algorithm code";

        // Header
        case ErrorCode::TooShort: return "Header data too short (minimum 35 bytes)";
        case ErrorCode::InvalidPrefixLength: return "Partial header must be 16, 32, 35 or 36 bytes";
        case ErrorCode::CipherLengthMismatch: return "Cipher data length does not match key spec";
        case ErrorCode::IncompleteHeader: return "Header is incomplete";
        case ErrorCode::InvalidEncoding: return "Invalid hex or base64 encoding";

        // Encryption
        case ErrorCode::PlaintextTooLarge: return "Plaintext too large for RSA-OAEP";
        case ErrorCode::MissingPublicKey: return "No public key loaded";
        case ErrorCode::InvalidPublicKey: return "Invalid RSA public key";
        case ErrorCode::InvalidPrivateKey: return "Invalid RSA private key";
        case ErrorCode::KeyGenerationFailed: return "Key generation failed";
        case ErrorCode::EncryptionFailed: return "Encryption failed";

        // KMS
        case ErrorCode::DecryptionFailed: return "Decryption failed";
        case ErrorCode::KeyNotFound: return "Key not found";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::Timeout: return "Operation timed out";

        // File I/O
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";

        // General
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";

        default: return "Unknown error";
    }
}

// ============================================================================
// Result Type (using C++23 std::expected)
// ============================================================================

/// A result type that either contains a value T or an ErrorCode
/// Usage: Result<KmsHeader> header = KmsHeader::from_bytes(data);
///        if (header) { use(*header); } else { handle(header.error()); }
template <typename T>
using Result = std::expected<T, ErrorCode>;

/// A result type for operations that don't return a value
using VoidResult = std::expected<void, ErrorCode>;

// ============================================================================
// Layout Constants
// ============================================================================

namespace constants {

/// Raw KMS key id (128 bits)
inline constexpr std::size_t KEY_ID_SIZE = 16;

/// Big-endian account number
inline constexpr std::size_t ACCOUNT_SIZE = 16;

/// Major region, cardinal direction, ordinal number
inline constexpr std::size_t REGION_SIZE = 3;

/// Binary key reference: key id + account + region
inline constexpr std::size_t KEY_REFERENCE_SIZE = KEY_ID_SIZE + ACCOUNT_SIZE + REGION_SIZE;

/// Hex form of the binary key reference
inline constexpr std::size_t KEY_REFERENCE_HEX_SIZE = KEY_REFERENCE_SIZE * 2;

/// Offset of the algorithm byte
inline constexpr std::size_t ALGORITHM_OFFSET = KEY_REFERENCE_SIZE;

/// Offset of the RSA cipher data
inline constexpr std::size_t CIPHER_DATA_OFFSET = ALGORITHM_OFFSET + 1;

/// Account numbers are displayed with at least this many digits
inline constexpr std::size_t ACCOUNT_DIGITS = 12;

/// Prefix lengths accepted by partial inspection
inline constexpr std::size_t PARTIAL_KEY_ID = KEY_ID_SIZE;
inline constexpr std::size_t PARTIAL_ACCOUNT = KEY_ID_SIZE + ACCOUNT_SIZE;
inline constexpr std::size_t PARTIAL_REGION = KEY_REFERENCE_SIZE;
inline constexpr std::size_t PARTIAL_ALGORITHM = CIPHER_DATA_OFFSET;

/// Default deadline for a KMS decrypt call
inline constexpr std::chrono::milliseconds DEFAULT_KMS_TIMEOUT{10'000};

} // namespace constants

} // namespace kmsheader

#endif // KMSHEADER_TYPES_HPP
