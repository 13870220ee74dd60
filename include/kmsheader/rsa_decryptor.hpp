// ============================================================================
// KMS Header - RSA Decryptor
// ============================================================================
// Private-key RSA-OAEP decryption, the operation KMS performs server-side.
// Used by the local keyring client.
// ============================================================================

#ifndef KMSHEADER_RSA_DECRYPTOR_HPP
#define KMSHEADER_RSA_DECRYPTOR_HPP

#include "algorithm.hpp"
#include "rsa_key.hpp"
#include "types.hpp"

namespace kmsheader {

/// Provides RSA-OAEP decryption functionality
class RsaDecryptor {
public:
    RsaDecryptor() = delete;

    /// Decrypt RSA-OAEP cipher data
    /// @param ciphertext Cipher data (as long as the key's modulus)
    /// @param private_key Key holding the private exponent
    /// @param algorithm OAEP hash the data was encrypted with
    /// @return The plaintext, InvalidPrivateKey, or DecryptionFailed
    [[nodiscard]] static Result<ByteBuffer> decrypt(
        ByteSpan ciphertext,
        const RsaKey& private_key,
        Algorithm algorithm
    );
};

} // namespace kmsheader

#endif // KMSHEADER_RSA_DECRYPTOR_HPP
