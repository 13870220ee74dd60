// ============================================================================
// KMS Header - RSA Key Implementation
// ============================================================================

#include "kmsheader/rsa_key.hpp"

// OpenSSL headers
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

// Standard library
#include <climits>
#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>

namespace kmsheader {

// ============================================================================
// RAII Helpers
// ============================================================================

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { if (bio) BIO_free(bio); }
};
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { if (key) EVP_PKEY_free(key); }
};
using UniqueEvpPkey = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { if (ctx) EVP_PKEY_CTX_free(ctx); }
};
using UniqueEvpPkeyCtx = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;

Result<std::string> bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len < 0 || (len > 0 && !data)) {
        return std::unexpected(ErrorCode::InternalError);
    }
    return std::string(data, static_cast<std::size_t>(len));
}

VoidResult write_text_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ErrorCode::FileWriteError);
    }

    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!file) {
        return std::unexpected(ErrorCode::FileWriteError);
    }

    return {};
}

} // anonymous namespace

Result<std::string> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(ErrorCode::FileNotFound);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ErrorCode::FileReadError);
    }

    std::string text((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(ErrorCode::FileReadError);
    }
    return text;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

RsaKey::RsaKey(void* evp_pkey) : evp_pkey_(evp_pkey) {}

RsaKey::~RsaKey() {
    reset();
}

RsaKey::RsaKey(const RsaKey& other) noexcept : evp_pkey_(other.evp_pkey_) {
    if (evp_pkey_) {
        EVP_PKEY_up_ref(static_cast<EVP_PKEY*>(evp_pkey_));
    }
}

RsaKey& RsaKey::operator=(const RsaKey& other) noexcept {
    if (this != &other) {
        if (other.evp_pkey_) {
            EVP_PKEY_up_ref(static_cast<EVP_PKEY*>(other.evp_pkey_));
        }
        reset();
        evp_pkey_ = other.evp_pkey_;
    }
    return *this;
}

RsaKey::RsaKey(RsaKey&& other) noexcept
    : evp_pkey_(other.evp_pkey_) {
    other.evp_pkey_ = nullptr;
}

RsaKey& RsaKey::operator=(RsaKey&& other) noexcept {
    if (this != &other) {
        reset();
        evp_pkey_ = other.evp_pkey_;
        other.evp_pkey_ = nullptr;
    }
    return *this;
}

void RsaKey::reset() noexcept {
    if (evp_pkey_) {
        EVP_PKEY_free(static_cast<EVP_PKEY*>(evp_pkey_));
        evp_pkey_ = nullptr;
    }
}

// ============================================================================
// Key Generation
// ============================================================================

Result<RsaKey> RsaKey::generate(std::size_t bits) {
    if (bits == 0 || bits > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected(ErrorCode::InvalidArgument);
    }

    UniqueEvpPkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        return std::unexpected(ErrorCode::KeyGenerationFailed);
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return std::unexpected(ErrorCode::KeyGenerationFailed);
    }

    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(bits)) <= 0) {
        return std::unexpected(ErrorCode::KeyGenerationFailed);
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0) {
        return std::unexpected(ErrorCode::KeyGenerationFailed);
    }

    return RsaKey(pkey);
}

// ============================================================================
// PEM Import/Export
// ============================================================================

Result<RsaKey> RsaKey::import_public_key_pem(std::string_view pem) {
    if (pem.size() > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected(ErrorCode::InvalidPublicKey);
    }

    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return std::unexpected(ErrorCode::InternalError);
    }

    UniqueEvpPkey pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey || EVP_PKEY_base_id(pkey.get()) != EVP_PKEY_RSA) {
        return std::unexpected(ErrorCode::InvalidPublicKey);
    }

    return RsaKey(pkey.release());
}

Result<RsaKey> RsaKey::import_private_key_pem(std::string_view pem) {
    if (pem.size() > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected(ErrorCode::InvalidPrivateKey);
    }

    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return std::unexpected(ErrorCode::InternalError);
    }

    UniqueEvpPkey pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey || EVP_PKEY_base_id(pkey.get()) != EVP_PKEY_RSA) {
        return std::unexpected(ErrorCode::InvalidPrivateKey);
    }

    return RsaKey(pkey.release());
}

Result<std::string> RsaKey::export_public_key_pem() const {
    if (!is_valid()) {
        return std::unexpected(ErrorCode::InvalidPublicKey);
    }

    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return std::unexpected(ErrorCode::InternalError);
    }

    if (PEM_write_bio_PUBKEY(bio.get(), static_cast<EVP_PKEY*>(evp_pkey_)) != 1) {
        return std::unexpected(ErrorCode::InternalError);
    }

    return bio_to_string(bio.get());
}

Result<std::string> RsaKey::export_private_key_pem() const {
    if (!has_private_key()) {
        return std::unexpected(ErrorCode::InvalidPrivateKey);
    }

    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return std::unexpected(ErrorCode::InternalError);
    }

    // Write private key WITHOUT encryption (pass null for cipher and password)
    if (PEM_write_bio_PrivateKey(bio.get(), static_cast<EVP_PKEY*>(evp_pkey_),
                                 nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return std::unexpected(ErrorCode::InternalError);
    }

    return bio_to_string(bio.get());
}

// ============================================================================
// File Operations
// ============================================================================

Result<RsaKey> RsaKey::load_public_key(const std::filesystem::path& path) {
    auto pem = read_text_file(path);
    if (!pem) {
        return std::unexpected(pem.error());
    }
    return import_public_key_pem(*pem);
}

Result<RsaKey> RsaKey::load_private_key(const std::filesystem::path& path) {
    auto pem = read_text_file(path);
    if (!pem) {
        return std::unexpected(pem.error());
    }
    return import_private_key_pem(*pem);
}

VoidResult RsaKey::save_public_key(const std::filesystem::path& path) const {
    auto pem = export_public_key_pem();
    if (!pem) {
        return std::unexpected(pem.error());
    }
    return write_text_file(path, *pem);
}

VoidResult RsaKey::save_private_key(const std::filesystem::path& path) const {
    auto pem = export_private_key_pem();
    if (!pem) {
        return std::unexpected(pem.error());
    }
    return write_text_file(path, *pem);
}

// ============================================================================
// Key Information
// ============================================================================

bool RsaKey::is_valid() const noexcept {
    return evp_pkey_ != nullptr;
}

bool RsaKey::has_private_key() const noexcept {
    if (!evp_pkey_) return false;

    // A public-only key will not have the private exponent
    BIGNUM* d = nullptr;
    if (EVP_PKEY_get_bn_param(static_cast<EVP_PKEY*>(evp_pkey_), "d", &d) != 1) {
        return false;
    }
    bool has_private = (d != nullptr);
    BN_free(d);

    return has_private;
}

std::size_t RsaKey::key_size_bits() const noexcept {
    if (!evp_pkey_) return 0;
    return static_cast<std::size_t>(EVP_PKEY_get_bits(static_cast<EVP_PKEY*>(evp_pkey_)));
}

} // namespace kmsheader
