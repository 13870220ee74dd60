// ============================================================================
// KMS Header - Header Model Implementation
// ============================================================================

#include "kmsheader/kms_header.hpp"
#include "kmsheader/encoding.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace kmsheader {

namespace {

constexpr std::string_view PUBLIC_KEY_MARKER = "-----BEGIN PUBLIC KEY-----";

} // anonymous namespace

std::string_view to_string(HeaderState state) noexcept {
    switch (state) {
        case HeaderState::Empty: return "empty";
        case HeaderState::HasReference: return "key reference";
        case HeaderState::HasAlgorithm: return "key reference, algorithm";
        case HeaderState::HasCipherData: return "key reference, algorithm, cipher data";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

KmsHeader::KmsHeader(
    const KeyReference& reference,
    Algorithm algorithm,
    std::optional<KeySpec> key_spec
) : key_reference_(reference), algorithm_(algorithm), key_spec_(key_spec) {}

Result<KmsHeader> KmsHeader::from_arn(
    std::string_view arn,
    Algorithm algorithm,
    std::optional<KeySpec> key_spec
) {
    if (auto check = encode_algorithm_byte(algorithm, key_spec); !check) {
        return std::unexpected(check.error());
    }

    auto reference = KeyReference::parse(arn);
    if (!reference) {
        return std::unexpected(reference.error());
    }

    return KmsHeader(*reference, algorithm, key_spec);
}

Result<KmsHeader> KmsHeader::from_bytes(ByteSpan data) {
    if (data.size() < constants::KEY_REFERENCE_SIZE) {
        return std::unexpected(ErrorCode::TooShort);
    }

    auto reference = KeyReference::decode(data.first(constants::KEY_REFERENCE_SIZE));
    if (!reference) {
        return std::unexpected(reference.error());
    }

    KmsHeader header(*reference);
    if (data.size() < constants::CIPHER_DATA_OFFSET) {
        return header;
    }

    auto decoded = decode_algorithm_byte(data[constants::ALGORITHM_OFFSET]);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }

    // An unrecorded algorithm keeps the default
    if (decoded->algorithm) {
        header.algorithm_ = decoded->algorithm;
    }
    header.key_spec_ = decoded->key_spec;
    if (!header.key_spec_) {
        return header;
    }

    std::size_t cipher_size = cipher_length(*header.key_spec_);
    if (data.size() >= constants::CIPHER_DATA_OFFSET + cipher_size) {
        auto cipher = data.subspan(constants::CIPHER_DATA_OFFSET, cipher_size);
        header.cipher_data_ = ByteBuffer(cipher.begin(), cipher.end());
    }

    return header;
}

Result<KmsHeader> KmsHeader::from_base64(std::string_view text) {
    auto data = base64_decode(text);
    if (!data) {
        return std::unexpected(data.error());
    }
    return from_bytes(*data);
}

// ============================================================================
// Export
// ============================================================================

std::size_t KmsHeader::length() const noexcept {
    if (!key_reference_) {
        return 0;
    }
    if (!key_spec_) {
        return constants::KEY_REFERENCE_SIZE;
    }
    if (!cipher_data_) {
        return constants::CIPHER_DATA_OFFSET;
    }
    return constants::CIPHER_DATA_OFFSET + cipher_length(*key_spec_);
}

HeaderState KmsHeader::state() const noexcept {
    if (!key_reference_) return HeaderState::Empty;
    if (!key_spec_) return HeaderState::HasReference;
    if (!cipher_data_) return HeaderState::HasAlgorithm;
    return HeaderState::HasCipherData;
}

ByteBuffer KmsHeader::to_bytes() const {
    ByteBuffer data;
    if (!key_reference_) {
        return data;
    }

    data.reserve(length());

    auto reference = key_reference_->encode();
    data.insert(data.end(), reference.begin(), reference.end());

    if (key_spec_) {
        data.push_back(algorithm_byte());
        if (cipher_data_) {
            data.insert(data.end(), cipher_data_->begin(), cipher_data_->end());
        }
    }

    return data;
}

std::string KmsHeader::to_base64() const {
    return base64_encode(to_bytes());
}

ByteSpan KmsHeader::payload(ByteSpan blob) const noexcept {
    std::size_t header_size = length();
    if (blob.size() < header_size) {
        return {};
    }
    return blob.subspan(header_size);
}

Byte KmsHeader::algorithm_byte() const noexcept {
    // Setters only store values the codec accepts
    Byte value = 0;
    if (algorithm_) value |= static_cast<Byte>(*algorithm_);
    if (key_spec_) value |= static_cast<Byte>(*key_spec_);
    return value;
}

// ============================================================================
// Fields
// ============================================================================

std::optional<std::string> KmsHeader::arn() const {
    if (!key_reference_) {
        return std::nullopt;
    }
    return key_reference_->to_string();
}

VoidResult KmsHeader::set_arn(std::string_view arn) {
    auto reference = KeyReference::parse(arn);
    if (!reference) {
        return std::unexpected(reference.error());
    }

    key_reference_ = *reference;
    return {};
}

VoidResult KmsHeader::set_key_reference(const KeyReference& reference) {
    // Reject enumerators outside the binary tables
    auto encoded = reference.encode();
    if (auto check = KeyReference::decode(encoded); !check) {
        return std::unexpected(ErrorCode::InvalidReference);
    }

    key_reference_ = reference;
    return {};
}

VoidResult KmsHeader::set_algorithm(Algorithm algorithm) {
    if (auto check = encode_algorithm_byte(algorithm, std::nullopt); !check) {
        return std::unexpected(check.error());
    }

    algorithm_ = algorithm;
    return {};
}

VoidResult KmsHeader::set_key_spec(KeySpec key_spec) {
    if (auto check = encode_algorithm_byte(std::nullopt, key_spec); !check) {
        return std::unexpected(check.error());
    }

    if (cipher_data_ && cipher_data_->size() != cipher_length(key_spec)) {
        return std::unexpected(ErrorCode::CipherLengthMismatch);
    }

    key_spec_ = key_spec;
    return {};
}

VoidResult KmsHeader::add_algorithm(std::string_view name) {
    if (auto algorithm = parse_algorithm(name); algorithm) {
        return set_algorithm(*algorithm);
    }
    if (auto key_spec = parse_key_spec(name); key_spec) {
        return set_key_spec(*key_spec);
    }
    return std::unexpected(ErrorCode::UnsupportedAlgorithm);
}

VoidResult KmsHeader::set_cipher_data(ByteSpan cipher_data) {
    if (!key_spec_) {
        return std::unexpected(ErrorCode::IncompleteHeader);
    }

    if (cipher_data.size() != cipher_length(*key_spec_)) {
        return std::unexpected(ErrorCode::CipherLengthMismatch);
    }

    cipher_data_ = ByteBuffer(cipher_data.begin(), cipher_data.end());
    return {};
}

// ============================================================================
// Encryption
// ============================================================================

VoidResult KmsHeader::set_public_key(const RsaKey& public_key) {
    if (!public_key.is_valid()) {
        return std::unexpected(ErrorCode::InvalidPublicKey);
    }

    auto key_spec = key_spec_from_bits(public_key.key_size_bits());
    if (!key_spec) {
        return std::unexpected(key_spec.error());
    }

    if (auto result = set_key_spec(*key_spec); !result) {
        return result;
    }

    public_key_ = public_key;
    return {};
}

VoidResult KmsHeader::load_public_key(std::string_view pem_or_path) {
    Result<RsaKey> key;

    if (pem_or_path.find(PUBLIC_KEY_MARKER) != std::string_view::npos) {
        key = RsaKey::import_public_key_pem(pem_or_path);
    } else {
        std::error_code ec;
        std::filesystem::path path(pem_or_path);
        if (pem_or_path.empty() || !std::filesystem::is_regular_file(path, ec)) {
            return std::unexpected(ErrorCode::InvalidPublicKey);
        }
        key = RsaKey::load_public_key(path);
    }

    if (!key) {
        return std::unexpected(key.error());
    }
    return set_public_key(*key);
}

VoidResult KmsHeader::encrypt(ByteSpan plaintext) {
    RsaEncryptor encryptor;
    return encrypt(plaintext, encryptor);
}

VoidResult KmsHeader::encrypt(ByteSpan plaintext, const EncryptionProvider& provider) {
    if (!public_key_) {
        return std::unexpected(ErrorCode::MissingPublicKey);
    }

    if (!algorithm_ || !key_spec_) {
        return std::unexpected(ErrorCode::IncompleteHeader);
    }

    if (plaintext.size() > max_plaintext_length(*algorithm_, *key_spec_)) {
        return std::unexpected(ErrorCode::PlaintextTooLarge);
    }

    auto cipher_data = provider.encrypt(*public_key_, plaintext, *algorithm_);
    if (!cipher_data) {
        return std::unexpected(cipher_data.error());
    }

    return set_cipher_data(*cipher_data);
}

Result<ByteBuffer> KmsHeader::decrypt(
    const KmsClientFactory& factory,
    const DecryptOptions& options
) const {
    if (!key_reference_ || !algorithm_ || !key_spec_ || !cipher_data_) {
        return std::unexpected(ErrorCode::IncompleteHeader);
    }

    auto client = factory.create(key_reference_->region);
    if (!client) {
        return std::unexpected(client.error());
    }

    return (*client)->decrypt(*key_reference_, *cipher_data_, *algorithm_, options);
}

} // namespace kmsheader
