// ============================================================================
// KMS Header - Local Keyring Implementation
// ============================================================================

#include "kmsheader/local_keyring.hpp"
#include "kmsheader/rsa_decryptor.hpp"

#include <utility>

namespace kmsheader {

// ============================================================================
// Keyring
// ============================================================================

VoidResult LocalKeyring::add_key(const KeyReference& reference, RsaKey private_key) {
    if (!private_key.has_private_key()) {
        return std::unexpected(ErrorCode::InvalidPrivateKey);
    }

    keys_.insert_or_assign(reference.to_string(), std::move(private_key));
    return {};
}

VoidResult LocalKeyring::add_key(std::string_view arn, RsaKey private_key) {
    auto reference = KeyReference::parse(arn);
    if (!reference) {
        return std::unexpected(reference.error());
    }
    return add_key(*reference, std::move(private_key));
}

VoidResult LocalKeyring::add_key_file(std::string_view arn, const std::filesystem::path& path) {
    auto reference = KeyReference::parse(arn);
    if (!reference) {
        return std::unexpected(reference.error());
    }

    auto key = RsaKey::load_private_key(path);
    if (!key) {
        return std::unexpected(key.error());
    }
    return add_key(*reference, std::move(*key));
}

const RsaKey* LocalKeyring::find(const KeyReference& reference) const {
    auto it = keys_.find(reference.to_string());
    if (it == keys_.end()) {
        return nullptr;
    }
    return &it->second;
}

Result<std::unique_ptr<KmsClient>> LocalKeyring::create(const Region& region) const {
    return std::make_unique<LocalKmsClient>(*this, region);
}

// ============================================================================
// Client
// ============================================================================

Result<ByteBuffer> LocalKmsClient::decrypt(
    const KeyReference& key,
    ByteSpan ciphertext,
    Algorithm algorithm,
    const DecryptOptions& options
) {
    if (options.stop_token.stop_requested()) {
        return std::unexpected(ErrorCode::Cancelled);
    }
    if (options.timeout.count() <= 0) {
        return std::unexpected(ErrorCode::Timeout);
    }

    auto start = std::chrono::steady_clock::now();

    // Keys live in exactly one region, as they do in KMS
    if (key.region != region_) {
        return std::unexpected(ErrorCode::KeyNotFound);
    }

    const RsaKey* private_key = keyring_.find(key);
    if (!private_key) {
        return std::unexpected(ErrorCode::KeyNotFound);
    }

    auto plaintext = RsaDecryptor::decrypt(ciphertext, *private_key, algorithm);
    if (!plaintext) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    if (options.stop_token.stop_requested()) {
        return std::unexpected(ErrorCode::Cancelled);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (elapsed > options.timeout) {
        return std::unexpected(ErrorCode::Timeout);
    }

    return plaintext;
}

} // namespace kmsheader
