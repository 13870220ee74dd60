// ============================================================================
// KMS Header - Header Model
// ============================================================================
// A KMS header prefixes symmetrically encrypted data. It records the KMS key
// that wrapped the symmetric key material, the RSA-OAEP algorithm and key
// spec used, and the wrapped key material itself:
//
//   [35 bytes key reference][1 byte algorithm][256/384/512 bytes cipher data]
//   [symmetric payload, not part of the header ...]
//
// A header is built up in order, and its length tells where the payload of
// a stored blob begins:
//
//   State           Fields present                     length()
//   Empty           -                                  0
//   HasReference    key reference                      35
//   HasAlgorithm    + key spec (and algorithm)         36
//   HasCipherData   + cipher data                      292 / 420 / 548
//
// Typical use:
//   Encrypting side
//     auto header = KmsHeader::from_arn(arn);
//     header->load_public_key(public_pem);   // sets the key spec
//     header->encrypt(symmetric_key);
//     blob = header->to_bytes() + symmetric_ciphertext;
//
//   Decrypting side
//     auto header = KmsHeader::from_bytes(blob);
//     auto symmetric_key = header->decrypt(kms_factory);
//     auto symmetric_ciphertext = header->payload(blob);
// ============================================================================

#ifndef KMSHEADER_KMS_HEADER_HPP
#define KMSHEADER_KMS_HEADER_HPP

#include "algorithm.hpp"
#include "key_reference.hpp"
#include "kms_client.hpp"
#include "rsa_encryptor.hpp"
#include "rsa_key.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kmsheader {

/// How far a header has been populated
enum class HeaderState {
    Empty,
    HasReference,
    HasAlgorithm,
    HasCipherData,
};

[[nodiscard]] std::string_view to_string(HeaderState state) noexcept;

/// A binary KMS header
class KmsHeader {
public:
    /// Create an empty header (algorithm defaults to RSAES_OAEP_SHA_256)
    KmsHeader() = default;

    /// Create a header for a key
    explicit KmsHeader(
        const KeyReference& reference,
        Algorithm algorithm = Algorithm::RsaesOaepSha256,
        std::optional<KeySpec> key_spec = std::nullopt
    );

    // ========================================================================
    // Construction
    // ========================================================================

    /// Create a header from a KMS key ARN
    /// @return The header, or InvalidReference / RegionNumberOutOfRange
    [[nodiscard]] static Result<KmsHeader> from_arn(
        std::string_view arn,
        Algorithm algorithm = Algorithm::RsaesOaepSha256,
        std::optional<KeySpec> key_spec = std::nullopt
    );

    /// Parse a binary header from the start of a blob
    /// Bytes past the header are payload and are not read.
    /// @return The header, TooShort under 35 bytes, or a decode error
    [[nodiscard]] static Result<KmsHeader> from_bytes(ByteSpan data);

    /// Parse a base64-encoded binary header
    [[nodiscard]] static Result<KmsHeader> from_base64(std::string_view text);

    // ========================================================================
    // Export
    // ========================================================================

    /// Current binary length (0, 35, 36, 292, 420 or 548)
    [[nodiscard]] std::size_t length() const noexcept;

    [[nodiscard]] HeaderState state() const noexcept;

    /// Binary header: reference, algorithm byte, cipher data, in that order,
    /// stopping at the first absent section
    [[nodiscard]] ByteBuffer to_bytes() const;

    [[nodiscard]] std::string to_base64() const;

    /// The symmetric payload of a blob that starts with this header
    /// @return blob past length(), or an empty span if blob is shorter
    [[nodiscard]] ByteSpan payload(ByteSpan blob) const noexcept;

    // ========================================================================
    // Fields
    // ========================================================================

    [[nodiscard]] const std::optional<KeyReference>& key_reference() const noexcept { return key_reference_; }
    [[nodiscard]] std::optional<std::string> arn() const;
    [[nodiscard]] std::optional<Algorithm> algorithm() const noexcept { return algorithm_; }
    [[nodiscard]] std::optional<KeySpec> key_spec() const noexcept { return key_spec_; }
    [[nodiscard]] const std::optional<ByteBuffer>& cipher_data() const noexcept { return cipher_data_; }
    [[nodiscard]] const std::optional<RsaKey>& public_key() const noexcept { return public_key_; }

    /// Replace the key reference; unchanged on failure
    [[nodiscard]] VoidResult set_arn(std::string_view arn);
    [[nodiscard]] VoidResult set_key_reference(const KeyReference& reference);

    [[nodiscard]] VoidResult set_algorithm(Algorithm algorithm);

    /// Set the key spec
    /// @return CipherLengthMismatch if cipher data of another length is present
    [[nodiscard]] VoidResult set_key_spec(KeySpec key_spec);

    /// Set an algorithm or a key spec by its KMS name
    /// ("RSAES_OAEP_SHA_1", "RSAES_OAEP_SHA_256", "RSA_2048", "RSA_3072", "RSA_4096")
    [[nodiscard]] VoidResult add_algorithm(std::string_view name);

    /// Store RSA cipher data
    /// @return IncompleteHeader without a key spec, CipherLengthMismatch if the
    ///         length differs from the key spec's; prior data kept on failure
    [[nodiscard]] VoidResult set_cipher_data(ByteSpan cipher_data);

    // ========================================================================
    // Encryption
    // ========================================================================

    /// Use a public key for encryption and set the key spec from its size
    /// @return InvalidPublicKey, UnsupportedKeySize or CipherLengthMismatch;
    ///         the previous key and key spec are kept on failure
    [[nodiscard]] VoidResult set_public_key(const RsaKey& public_key);

    /// Load a public key from PEM text or from a PEM file path
    [[nodiscard]] VoidResult load_public_key(std::string_view pem_or_path);

    /// Encrypt symmetric key material into the header's cipher data
    /// @return MissingPublicKey, IncompleteHeader, PlaintextTooLarge, or the
    ///         provider's error
    [[nodiscard]] VoidResult encrypt(ByteSpan plaintext);
    [[nodiscard]] VoidResult encrypt(ByteSpan plaintext, const EncryptionProvider& provider);

    /// Decrypt the cipher data through KMS
    /// @param factory Creates the client for the key's region
    /// @return The plaintext, IncompleteHeader, or the client's error unmodified
    [[nodiscard]] Result<ByteBuffer> decrypt(
        const KmsClientFactory& factory,
        const DecryptOptions& options = {}
    ) const;

private:
    [[nodiscard]] Byte algorithm_byte() const noexcept;

    std::optional<KeyReference> key_reference_;
    std::optional<Algorithm> algorithm_ = Algorithm::RsaesOaepSha256;
    std::optional<KeySpec> key_spec_;
    std::optional<ByteBuffer> cipher_data_;
    std::optional<RsaKey> public_key_;  // Not serialized
};

} // namespace kmsheader

#endif // KMSHEADER_KMS_HEADER_HPP
