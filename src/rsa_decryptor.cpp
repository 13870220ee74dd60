// ============================================================================
// KMS Header - RSA Decryptor Implementation
// ============================================================================

#include "kmsheader/rsa_decryptor.hpp"

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
// RSA-OAEP Decryption
// ============================================================================

Result<ByteBuffer> RsaDecryptor::decrypt(
    ByteSpan ciphertext,
    const RsaKey& private_key,
    Algorithm algorithm
) {
    if (!private_key.has_private_key()) {
        return std::unexpected(ErrorCode::InvalidPrivateKey);
    }

    if (ciphertext.empty()) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    const EVP_MD* digest = oaep_digest(algorithm);
    if (!digest) {
        return std::unexpected(ErrorCode::UnsupportedAlgorithm);
    }

    EVP_PKEY* pkey = static_cast<EVP_PKEY*>(private_key.get_evp_pkey());

    UniqueEvpPkeyCtx ctx(EVP_PKEY_CTX_new(pkey, nullptr));
    if (!ctx) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    if (EVP_PKEY_decrypt_init(ctx.get()) <= 0) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    // Padding and digests must match encryption settings
    if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    if (EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), digest) <= 0) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    if (EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), digest) <= 0) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    // Determine output size
    std::size_t outlen = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &outlen,
                         ciphertext.data(), ciphertext.size()) <= 0) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    ByteBuffer plaintext(outlen);

    if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &outlen,
                         ciphertext.data(), ciphertext.size()) <= 0) {
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    plaintext.resize(outlen);
    return plaintext;
}

} // namespace kmsheader
