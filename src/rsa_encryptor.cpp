// ============================================================================
// KMS Header - RSA Encryptor Implementation
// ============================================================================

#include "kmsheader/rsa_encryptor.hpp"

// OpenSSL headers
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include <memory>

namespace kmsheader {

// ============================================================================
// RAII Helper
// ============================================================================

namespace {

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { if (ctx) EVP_PKEY_CTX_free(ctx); }
};
using UniqueEvpPkeyCtx = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;

const EVP_MD* oaep_digest(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::RsaesOaepSha1: return EVP_sha1();
        case Algorithm::RsaesOaepSha256: return EVP_sha256();
    }
    return nullptr;
}

} // anonymous namespace

// ============================================================================
// RSA-OAEP Encryption
// ============================================================================

Result<ByteBuffer> RsaEncryptor::encrypt(
    const RsaKey& public_key,
    ByteSpan plaintext,
    Algorithm algorithm
) const {
    if (!public_key.is_valid()) {
        return std::unexpected(ErrorCode::MissingPublicKey);
    }

    const EVP_MD* digest = oaep_digest(algorithm);
    if (!digest) {
        return std::unexpected(ErrorCode::UnsupportedAlgorithm);
    }

    // OAEP: maxLen = keyBytes - 2*hashLen - 2
    std::size_t key_bytes = public_key.key_size_bits() / 8;
    std::size_t overhead = oaep_overhead(algorithm);
    if (key_bytes <= overhead || plaintext.size() > key_bytes - overhead) {
        return std::unexpected(ErrorCode::PlaintextTooLarge);
    }

    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(public_key.get_evp_pkey());

    UniqueEvpPkeyCtx ctx(EVP_PKEY_CTX_new(pkey, nullptr));
    if (!ctx) {
        return std::unexpected(ErrorCode::EncryptionFailed);
    }

    if (EVP_PKEY_encrypt_init(ctx.get()) <= 0) {
        return std::unexpected(ErrorCode::EncryptionFailed);
    }

    if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0) {
        return std::unexpected(ErrorCode::EncryptionFailed);
    }

    if (EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), digest) <= 0) {
        return std::unexpected(ErrorCode::EncryptionFailed);
    }

    if (EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), digest) <= 0) {
        return std::unexpected(ErrorCode::EncryptionFailed);
    }

    // Determine output size
    std::size_t outlen = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outlen,
                         plaintext.data(), plaintext.size()) <= 0) {
        return std::unexpected(ErrorCode::EncryptionFailed);
    }

    ByteBuffer ciphertext(outlen);

    if (EVP_PKEY_encrypt(ctx.get(), ciphertext.data(), &outlen,
                         plaintext.data(), plaintext.size()) <= 0) {
        return std::unexpected(ErrorCode::EncryptionFailed);
    }

    ciphertext.resize(outlen);
    return ciphertext;
}

} // namespace kmsheader
