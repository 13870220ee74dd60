// ============================================================================
// KMS Header - KMS Client Interface
// ============================================================================
// KmsHeader::decrypt never touches a private key. It asks a KmsClientFactory
// for a client in the region named by the key reference and hands it the
// cipher data. Bindings decide how the call is made (a networked KMS SDK, a
// local keyring, a caller-supplied decorator that retries or records calls).
// ============================================================================

#ifndef KMSHEADER_KMS_CLIENT_HPP
#define KMSHEADER_KMS_CLIENT_HPP

#include "algorithm.hpp"
#include "key_reference.hpp"
#include "types.hpp"

#include <chrono>
#include <memory>
#include <stop_token>

namespace kmsheader {

/// Bounds on a single decrypt call
struct DecryptOptions {
    /// Deadline for the call; bindings fail with Timeout once it passes
    std::chrono::milliseconds timeout = constants::DEFAULT_KMS_TIMEOUT;

    /// Cancellation; bindings fail with Cancelled once a stop is requested
    std::stop_token stop_token;
};

/// A client bound to one region
class KmsClient {
public:
    virtual ~KmsClient() = default;

    /// Decrypt cipher data under a key
    /// @param key Key the data was encrypted for
    /// @param ciphertext RSA cipher data from the header
    /// @param algorithm OAEP algorithm the data was encrypted with
    /// @param options Timeout and cancellation
    /// @return The plaintext verbatim, or DecryptionFailed / KeyNotFound /
    ///         Cancelled / Timeout
    [[nodiscard]] virtual Result<ByteBuffer> decrypt(
        const KeyReference& key,
        ByteSpan ciphertext,
        Algorithm algorithm,
        const DecryptOptions& options
    ) = 0;
};

/// Creates regional clients
class KmsClientFactory {
public:
    virtual ~KmsClientFactory() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<KmsClient>> create(const Region& region) const = 0;
};

} // namespace kmsheader

#endif // KMSHEADER_KMS_CLIENT_HPP
