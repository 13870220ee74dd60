// ============================================================================
// KMS Header - Partial Inspection
// ============================================================================
// Object stores allow ranged reads, so a blob's key can be audited without
// downloading it. Read only as many leading bytes as the question needs:
//
//   16 bytes  key id                 (has this blob been re-keyed?)
//   32 bytes  + account              (which account's key wrapped it?)
//   35 bytes  + region               (full key ARN)
//   36 bytes  + algorithm, key spec
// ============================================================================

#ifndef KMSHEADER_PARTIAL_HEADER_HPP
#define KMSHEADER_PARTIAL_HEADER_HPP

#include "algorithm.hpp"
#include "key_reference.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kmsheader {

/// Fields recovered from a header prefix
struct PartialHeader {
    KeyId key_id;
    std::optional<std::uint64_t> account;
    std::optional<Region> region;
    std::optional<Algorithm> algorithm;
    std::optional<KeySpec> key_spec;

    /// The key reference, once the region is known (35+ bytes)
    [[nodiscard]] std::optional<KeyReference> key_reference() const;

    /// The key ARN, once the region is known (35+ bytes)
    [[nodiscard]] std::optional<std::string> arn() const;

    bool operator==(const PartialHeader&) const = default;
};

/// Check whether a prefix length can be inspected
[[nodiscard]] constexpr bool is_partial_header_length(std::size_t size) noexcept {
    return size == constants::PARTIAL_KEY_ID || size == constants::PARTIAL_ACCOUNT ||
           size == constants::PARTIAL_REGION || size == constants::PARTIAL_ALGORITHM;
}

/// Decode the fields available in a header prefix
/// @param prefix Exactly the first 16, 32, 35 or 36 bytes of a header
/// @return The fields, InvalidPrefixLength, or a decode error
[[nodiscard]] Result<PartialHeader> inspect_partial_header(ByteSpan prefix);

} // namespace kmsheader

#endif // KMSHEADER_PARTIAL_HEADER_HPP
