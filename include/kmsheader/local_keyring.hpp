// ============================================================================
// KMS Header - Local Keyring
// ============================================================================
// A KMS binding that keeps RSA private keys in process, registered under
// their key ARNs. It behaves like the remote service for the purposes of the
// header: a client only sees keys of its own region, and decryption uses
// the algorithm recorded in the header.
//
// Registration is not synchronized. Populate the keyring first, then share
// it (read-only) with any number of clients.
// ============================================================================

#ifndef KMSHEADER_LOCAL_KEYRING_HPP
#define KMSHEADER_LOCAL_KEYRING_HPP

#include "kms_client.hpp"
#include "rsa_key.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace kmsheader {

/// Private keys indexed by key ARN
class LocalKeyring final : public KmsClientFactory {
public:
    LocalKeyring() = default;

    /// Register a private key under a key reference
    /// @return InvalidPrivateKey if the key has no private half
    [[nodiscard]] VoidResult add_key(const KeyReference& reference, RsaKey private_key);

    /// Register a private key under an ARN
    [[nodiscard]] VoidResult add_key(std::string_view arn, RsaKey private_key);

    /// Load a PEM private key file and register it under an ARN
    [[nodiscard]] VoidResult add_key_file(std::string_view arn, const std::filesystem::path& path);

    /// Look up the key registered under a reference
    [[nodiscard]] const RsaKey* find(const KeyReference& reference) const;

    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }

    /// Create a client for one region
    /// The client refers to this keyring, which must outlive it.
    [[nodiscard]] Result<std::unique_ptr<KmsClient>> create(const Region& region) const override;

private:
    std::map<std::string, RsaKey> keys_;
};

/// Client over a LocalKeyring for a single region
class LocalKmsClient final : public KmsClient {
public:
    LocalKmsClient(const LocalKeyring& keyring, const Region& region)
        : keyring_(keyring), region_(region) {}

    [[nodiscard]] const Region& region() const noexcept { return region_; }

    [[nodiscard]] Result<ByteBuffer> decrypt(
        const KeyReference& key,
        ByteSpan ciphertext,
        Algorithm algorithm,
        const DecryptOptions& options
    ) override;

private:
    const LocalKeyring& keyring_;
    Region region_;
};

} // namespace kmsheader

#endif // KMSHEADER_LOCAL_KEYRING_HPP
