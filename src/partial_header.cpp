// ============================================================================
// KMS Header - Partial Inspection Implementation
// ============================================================================

#include "kmsheader/partial_header.hpp"

namespace kmsheader {

std::optional<KeyReference> PartialHeader::key_reference() const {
    if (!account || !region) {
        return std::nullopt;
    }

    KeyReference reference;
    reference.region = *region;
    reference.account = *account;
    reference.key_id = key_id;
    return reference;
}

std::optional<std::string> PartialHeader::arn() const {
    auto reference = key_reference();
    if (!reference) {
        return std::nullopt;
    }
    return reference->to_string();
}

Result<PartialHeader> inspect_partial_header(ByteSpan prefix) {
    if (!is_partial_header_length(prefix.size())) {
        return std::unexpected(ErrorCode::InvalidPrefixLength);
    }

    PartialHeader partial;

    auto key_id = KeyId::decode(prefix.first(constants::KEY_ID_SIZE));
    if (!key_id) {
        return std::unexpected(key_id.error());
    }
    partial.key_id = *key_id;

    if (prefix.size() >= constants::PARTIAL_ACCOUNT) {
        auto account = decode_account(prefix.subspan(constants::KEY_ID_SIZE, constants::ACCOUNT_SIZE));
        if (!account) {
            return std::unexpected(account.error());
        }
        partial.account = *account;
    }

    if (prefix.size() >= constants::PARTIAL_REGION) {
        auto region = Region::decode(prefix.subspan(constants::PARTIAL_ACCOUNT, constants::REGION_SIZE));
        if (!region) {
            return std::unexpected(region.error());
        }
        partial.region = *region;
    }

    if (prefix.size() == constants::PARTIAL_ALGORITHM) {
        auto decoded = decode_algorithm_byte(prefix[constants::ALGORITHM_OFFSET]);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        partial.algorithm = decoded->algorithm;
        partial.key_spec = decoded->key_spec;
    }

    return partial;
}

} // namespace kmsheader
