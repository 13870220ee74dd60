// ============================================================================
// KMS Header - RSA Encryptor
// ============================================================================
// Public-key half of the header: wraps symmetric key material with RSA-OAEP.
//
// IMPORTANT: RSA can only encrypt small amounts of data!
// - RSA-2048: Max 214 bytes (OAEP-SHA1) / 190 bytes (OAEP-SHA256)
// - RSA-3072: Max 342 bytes / 318 bytes
// - RSA-4096: Max 470 bytes / 446 bytes
//
// The header stores only the wrapped key; the bulk data is encrypted
// symmetrically by the caller and appended after the header.
// ============================================================================

#ifndef KMSHEADER_RSA_ENCRYPTOR_HPP
#define KMSHEADER_RSA_ENCRYPTOR_HPP

#include "algorithm.hpp"
#include "rsa_key.hpp"
#include "types.hpp"

namespace kmsheader {

/// Performs the asymmetric encryption for KmsHeader::encrypt
class EncryptionProvider {
public:
    virtual ~EncryptionProvider() = default;

    /// Encrypt plaintext under a public key with the given OAEP hash
    /// @return Cipher data exactly as long as the key's modulus, or an error
    [[nodiscard]] virtual Result<ByteBuffer> encrypt(
        const RsaKey& public_key,
        ByteSpan plaintext,
        Algorithm algorithm
    ) const = 0;
};

/// RSA-OAEP encryption through OpenSSL
/// OAEP digest and MGF1 digest are both SHA-1 or both SHA-256, no label,
/// matching what KMS expects for RSAES_OAEP_SHA_1 / RSAES_OAEP_SHA_256.
class RsaEncryptor final : public EncryptionProvider {
public:
    RsaEncryptor() = default;

    [[nodiscard]] Result<ByteBuffer> encrypt(
        const RsaKey& public_key,
        ByteSpan plaintext,
        Algorithm algorithm
    ) const override;
};

} // namespace kmsheader

#endif // KMSHEADER_RSA_ENCRYPTOR_HPP
