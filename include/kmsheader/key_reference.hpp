// ============================================================================
// KMS Header - Key Reference Codec
// ============================================================================
// A key reference names an asymmetric key held by KMS. Its string form is the
// key ARN:
//
//   arn:aws:kms:<region>:<account>:key/<key id>
//   arn:aws:kms:us-east-1:111122223333:key/1234abcd-12ab-34cd-56ef-1234567890ab
//
// Its binary form is always 35 bytes:
//
//   offset  size  field
//   0       16    key id (raw 128-bit identifier)
//   16      16    account (big-endian unsigned integer)
//   32      1     major region code
//   33      1     cardinal direction code
//   34      1     region number (0-255)
//
// Key id first, so that a 16-byte read of a stored blob is enough to tell
// which key wrapped it.
// ============================================================================

#ifndef KMSHEADER_KEY_REFERENCE_HPP
#define KMSHEADER_KEY_REFERENCE_HPP

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace kmsheader {

/// Leading component of a region name ("us" in "us-east-1")
enum class MajorRegion : Byte {
    Af = 0x00,
    Ap = 0x01,
    Ca = 0x02,
    Eu = 0x03,
    Il = 0x04,
    Me = 0x05,
    Sa = 0x06,
    Us = 0x07,
    UsGov = 0x08,
};

/// Middle component of a region name ("east" in "us-east-1")
enum class CardinalDirection : Byte {
    North = 0x00,
    East = 0x01,
    South = 0x02,
    West = 0x03,
    Central = 0x04,
    Northeast = 0x05,
    Southeast = 0x06,
    Southwest = 0x07,
    Northwest = 0x08,
};

[[nodiscard]] std::string_view to_string(MajorRegion major) noexcept;
[[nodiscard]] std::string_view to_string(CardinalDirection direction) noexcept;

// ============================================================================
// Region
// ============================================================================

/// A region such as "us-east-1" or "us-gov-west-1"
struct Region {
    MajorRegion major = MajorRegion::Us;
    CardinalDirection direction = CardinalDirection::East;
    std::uint8_t number = 1;

    /// Parse "<major>-<direction>-<number>"
    /// @return The region, InvalidReference for an unknown or malformed name,
    ///         or RegionNumberOutOfRange for a number above 255
    [[nodiscard]] static Result<Region> parse(std::string_view name);

    /// Decode the 3-byte binary form
    /// @return The region, or MalformedReference for unknown codes
    [[nodiscard]] static Result<Region> decode(ByteSpan bytes);

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::array<Byte, constants::REGION_SIZE> encode() const noexcept;

    bool operator==(const Region&) const = default;
};

// ============================================================================
// Key ID
// ============================================================================

/// A 128-bit KMS key id
struct KeyId {
    std::array<Byte, constants::KEY_ID_SIZE> bytes{};

    /// Parse the 8-4-4-4-12 lowercase hex form
    [[nodiscard]] static Result<KeyId> parse(std::string_view text);

    /// Copy the 16 raw bytes
    [[nodiscard]] static Result<KeyId> decode(ByteSpan bytes);

    /// Format as 8-4-4-4-12 lowercase hex
    [[nodiscard]] std::string to_string() const;

    bool operator==(const KeyId&) const = default;
};

// ============================================================================
// Account
// ============================================================================

/// Parse a 12-digit decimal account number
/// @return The account, or InvalidReference for anything but exactly 12 digits
[[nodiscard]] Result<std::uint64_t> parse_account(std::string_view text);

/// Format an account number, zero-padded to 12 digits
[[nodiscard]] std::string format_account(std::uint64_t account);

/// Encode an account as a 16-byte big-endian integer
[[nodiscard]] std::array<Byte, constants::ACCOUNT_SIZE> encode_account(std::uint64_t account) noexcept;

/// Decode a 16-byte big-endian account
/// Accounts are held in 64 bits, so the upper 8 bytes of the field must be zero.
/// @return The account, or MalformedReference if any of the upper 8 bytes is set
[[nodiscard]] Result<std::uint64_t> decode_account(ByteSpan bytes);

// ============================================================================
// Key Reference
// ============================================================================

/// Region, account and key id of a KMS key
struct KeyReference {
    Region region;
    std::uint64_t account = 0;
    KeyId key_id;

    /// Parse a KMS key ARN
    [[nodiscard]] static Result<KeyReference> parse(std::string_view arn);

    /// Decode the 35-byte binary form
    /// @return The reference, TooShort if bytes is not exactly 35 bytes long,
    ///         or MalformedReference for undecodable fields
    [[nodiscard]] static Result<KeyReference> decode(ByteSpan bytes);

    /// Decode the 70-character hex form of the binary encoding
    [[nodiscard]] static Result<KeyReference> from_hex(std::string_view hex);

    /// Format as a KMS key ARN
    [[nodiscard]] std::string to_string() const;

    /// Encode the 35-byte binary form
    [[nodiscard]] std::array<Byte, constants::KEY_REFERENCE_SIZE> encode() const noexcept;

    /// Hex of the binary form (70 characters)
    [[nodiscard]] std::string to_hex() const;

    bool operator==(const KeyReference&) const = default;
};

} // namespace kmsheader

#endif // KMSHEADER_KEY_REFERENCE_HPP
