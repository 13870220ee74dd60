// ============================================================================
// KMS Header - RSA Key
// ============================================================================
// Owning handle to an OpenSSL RSA key. A header only ever needs the public
// half to encrypt; the private half is held by KMS (or, for the local keyring,
// by the process that decrypts).
//
// Copies share the underlying key through OpenSSL's reference count.
// ============================================================================

#ifndef KMSHEADER_RSA_KEY_HPP
#define KMSHEADER_RSA_KEY_HPP

#include "types.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace kmsheader {

/// Holds an RSA public key, or a full key pair
class RsaKey {
public:
    /// Create an empty (invalid) key
    RsaKey() = default;
    ~RsaKey();

    RsaKey(const RsaKey& other) noexcept;
    RsaKey& operator=(const RsaKey& other) noexcept;
    RsaKey(RsaKey&& other) noexcept;
    RsaKey& operator=(RsaKey&& other) noexcept;

    // ========================================================================
    // Key Generation
    // ========================================================================

    /// Generate a new RSA key pair
    /// @param bits Modulus size in bits
    [[nodiscard]] static Result<RsaKey> generate(std::size_t bits);

    // ========================================================================
    // PEM Import/Export
    // ========================================================================

    /// Import a public key ("-----BEGIN PUBLIC KEY-----")
    /// @return The key, or InvalidPublicKey
    [[nodiscard]] static Result<RsaKey> import_public_key_pem(std::string_view pem);

    /// Import an unencrypted private key
    /// @return The key, or InvalidPrivateKey
    [[nodiscard]] static Result<RsaKey> import_private_key_pem(std::string_view pem);

    [[nodiscard]] Result<std::string> export_public_key_pem() const;
    [[nodiscard]] Result<std::string> export_private_key_pem() const;

    // ========================================================================
    // File Operations
    // ========================================================================

    [[nodiscard]] static Result<RsaKey> load_public_key(const std::filesystem::path& path);
    [[nodiscard]] static Result<RsaKey> load_private_key(const std::filesystem::path& path);

    [[nodiscard]] VoidResult save_public_key(const std::filesystem::path& path) const;
    [[nodiscard]] VoidResult save_private_key(const std::filesystem::path& path) const;

    // ========================================================================
    // Key Information
    // ========================================================================

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] bool has_private_key() const noexcept;

    /// Modulus size in bits (0 for an empty key)
    [[nodiscard]] std::size_t key_size_bits() const noexcept;

    // Internal: Get the OpenSSL EVP_PKEY handle (for providers and clients)
    [[nodiscard]] void* get_evp_pkey() const noexcept { return evp_pkey_; }

private:
    explicit RsaKey(void* evp_pkey);

    void reset() noexcept;

    void* evp_pkey_ = nullptr;  // OpenSSL EVP_PKEY*
};

/// Read a whole text file
/// @return The contents, FileNotFound or FileReadError
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path& path);

} // namespace kmsheader

#endif // KMSHEADER_RSA_KEY_HPP
