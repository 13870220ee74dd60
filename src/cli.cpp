// ============================================================================
// KMS Header - Command Line Interface Implementation
// ============================================================================

#include "kmsheader/cli.hpp"
#include "kmsheader/kmsheader.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace kmsheader::cli {

namespace {

bool g_verbose = false;

void print_verbose(std::string_view message) {
    if (g_verbose) {
        print_info(message);
    }
}

std::string describe(ErrorCode error) {
    return std::string(error_to_string(error));
}

template <typename T>
bool parse_number(std::string_view text, T& value) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

/// Read a file, or only its first max_bytes bytes
Result<ByteBuffer> read_file(const std::string& path, std::optional<std::size_t> max_bytes = std::nullopt) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ErrorCode::FileNotFound);
    }

    ByteBuffer data;
    if (max_bytes) {
        data.resize(*max_bytes);
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        data.resize(static_cast<std::size_t>(file.gcount()));
    } else {
        data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    if (file.bad()) {
        return std::unexpected(ErrorCode::FileReadError);
    }
    return data;
}

VoidResult write_file(const std::string& path, ByteSpan data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ErrorCode::FileWriteError);
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return std::unexpected(ErrorCode::FileWriteError);
    }
    return {};
}

/// Read a blob, decoding base64 text when --base64 is given
Result<ByteBuffer> read_blob(const ParsedArgs& args, const std::string& path,
                             std::optional<std::size_t> max_bytes = std::nullopt) {
    if (!args.base64) {
        return read_file(path, max_bytes);
    }

    auto text = read_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }

    auto data = base64_decode(std::string_view(reinterpret_cast<const char*>(text->data()), text->size()));
    if (!data) {
        return std::unexpected(data.error());
    }
    if (max_bytes && data->size() > *max_bytes) {
        data->resize(*max_bytes);
    }
    return data;
}

void print_field(std::string_view label, std::string_view value) {
    std::cout << "  " << label;
    for (std::size_t i = label.size(); i < 14; ++i) {
        std::cout << ' ';
    }
    std::cout << value << "\n";
}

} // anonymous namespace

// ============================================================================
// Terminal Utilities
// ============================================================================

void print_error(std::string_view message) {
    std::cerr << "[ERROR] " << message << "\n";
}

void print_success(std::string_view message) {
    std::cout << "[OK] " << message << "\n";
}

void print_info(std::string_view message) {
    std::cout << "[INFO] " << message << "\n";
}

ExitCode exit_code_for(ErrorCode error) noexcept {
    switch (error) {
        case ErrorCode::Success:
            return ExitCode::Success;

        case ErrorCode::FileNotFound:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError:
            return ExitCode::FileError;

        case ErrorCode::InvalidPublicKey:
        case ErrorCode::InvalidPrivateKey:
        case ErrorCode::MissingPublicKey:
        case ErrorCode::KeyNotFound:
        case ErrorCode::UnsupportedKeySize:
            return ExitCode::KeyError;

        case ErrorCode::PlaintextTooLarge:
        case ErrorCode::KeyGenerationFailed:
        case ErrorCode::EncryptionFailed:
        case ErrorCode::DecryptionFailed:
        case ErrorCode::Cancelled:
        case ErrorCode::Timeout:
            return ExitCode::CryptoError;

        case ErrorCode::InvalidReference:
        case ErrorCode::MalformedReference:
        case ErrorCode::RegionNumberOutOfRange:
        case ErrorCode::UnsupportedAlgorithm:
        case ErrorCode::UnrecognizedCode:
        case ErrorCode::TooShort:
        case ErrorCode::InvalidPrefixLength:
        case ErrorCode::CipherLengthMismatch:
        case ErrorCode::IncompleteHeader:
        case ErrorCode::InvalidEncoding:
            return ExitCode::FormatError;

        case ErrorCode::InvalidArgument:
            return ExitCode::InvalidArguments;

        default:
            return ExitCode::InternalError;
    }
}

// ============================================================================
// Argument Parsing
// ============================================================================

ParsedArgs parse_args(std::span<char*> args) {
    ParsedArgs result;

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg.starts_with("--")) {
            std::string_view option = arg.substr(2);

            if (option == "help") {
                result.help = true;
            } else if (option == "verbose") {
                result.verbose = true;
            } else if (option == "base64") {
                result.base64 = true;
            } else if (option.starts_with("output=")) {
                result.output = std::string(option.substr(7));
            } else if (option.starts_with("input=")) {
                result.input = std::string(option.substr(6));
            } else if (option.starts_with("arn=")) {
                result.arn = std::string(option.substr(4));
            } else if (option.starts_with("algorithm=")) {
                result.algorithm = std::string(option.substr(10));
            } else if (option.starts_with("key-spec=")) {
                result.key_spec = std::string(option.substr(9));
            } else if (option.starts_with("public-key=")) {
                result.public_key = std::string(option.substr(11));
            } else if (option.starts_with("private-key=")) {
                result.private_key = std::string(option.substr(12));
            } else if (option.starts_with("bytes=")) {
                std::size_t bytes = 0;
                if (parse_number(option.substr(6), bytes)) {
                    result.bytes = bytes;
                } else {
                    result.invalid.emplace_back(arg);
                }
            } else if (option.starts_with("timeout=")) {
                long timeout = 0;
                if (parse_number(option.substr(8), timeout)) {
                    result.timeout_ms = timeout;
                } else {
                    result.invalid.emplace_back(arg);
                }
            } else {
                result.invalid.emplace_back(arg);
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            // Short options
            for (std::size_t j = 1; j < arg.size(); ++j) {
                switch (arg[j]) {
                    case 'h': result.help = true; break;
                    case 'v': result.verbose = true; break;
                    case 'b': result.base64 = true; break;
                    case 'o':
                        if (i + 1 < args.size()) {
                            result.output = args[++i];
                        }
                        break;
                    case 'i':
                        if (i + 1 < args.size()) {
                            result.input = args[++i];
                        }
                        break;
                    default:
                        result.invalid.emplace_back(arg);
                        break;
                }
            }
        } else {
            if (result.command.empty()) {
                result.command = std::string(arg);
            } else {
                result.positional.emplace_back(arg);
            }
        }
    }

    if (!result.public_key) {
        result.public_key = env_value(PUBLIC_KEY_ENV);
    }
    if (!result.private_key) {
        result.private_key = env_value(PRIVATE_KEY_ENV);
    }

    return result;
}

// ============================================================================
// Help Command
// ============================================================================

ExitCode cmd_help(const ParsedArgs& args) {
    if (args.positional.empty()) {
        std::cout << R"(
kmsheader - Build and read KMS headers for envelope-encrypted data

USAGE:
    kmsheader <command> [options] [arguments]

COMMANDS:
    inspect     Show the fields of a header or of a header prefix
    create      Build a header, optionally wrapping key material
    decrypt     Recover wrapped key material with a local private key
    payload     Extract the data that follows the header
    version     Show version information
    help        Show this help message

EXAMPLES:
    kmsheader inspect blob.bin
    kmsheader inspect blob.bin --bytes=16
    kmsheader create --arn=arn:aws:kms:us-east-1:111122223333:key/... \
                     --public-key=key.pub --input=data.key --output=header.bin
    kmsheader decrypt blob.bin --private-key=key.pem --output=data.key
    kmsheader payload blob.bin --output=data.enc

Use 'kmsheader help <command>' for more information about a command.
)";
    } else if (args.positional[0] == "inspect") {
        std::cout << R"(
kmsheader inspect - Show the fields of a header

USAGE:
    kmsheader inspect <file> [options]

OPTIONS:
    --bytes=<16|32|35|36>   Read only this many leading bytes
    --base64, -b            The file holds base64 text

Reading 16 bytes identifies the key, 32 bytes the account, 35 bytes the
full key ARN, and 36 bytes also the algorithm and key spec.
)";
    } else if (args.positional[0] == "create") {
        std::cout << R"(
kmsheader create - Build a header

USAGE:
    kmsheader create --arn=<arn> [options]

OPTIONS:
    --arn=<arn>             KMS key ARN (required)
    --algorithm=<name>      RSAES_OAEP_SHA_1 or RSAES_OAEP_SHA_256 (default)
    --key-spec=<name>       RSA_2048, RSA_3072 or RSA_4096
    --public-key=<file>     RSA public key (PEM); sets the key spec
    --input=<file>, -i      Key material to wrap (requires --public-key)
    --output=<file>, -o     Output file (default: base64 to stdout with --base64)
    --base64, -b            Write base64 text instead of binary

ENVIRONMENT:
    KMSHEADER_PUBLIC_KEY    Default for --public-key
)";
    } else if (args.positional[0] == "decrypt") {
        std::cout << R"(
kmsheader decrypt - Recover wrapped key material

USAGE:
    kmsheader decrypt <file> --private-key=<file> [options]

OPTIONS:
    --private-key=<file>    RSA private key (PEM) of the header's key
    --output=<file>, -o     Output file (default: base64 to stdout)
    --timeout=<ms>          Deadline for the KMS call (default: 10000)
    --base64, -b            The input file holds base64 text

ENVIRONMENT:
    KMSHEADER_PRIVATE_KEY   Default for --private-key
)";
    } else if (args.positional[0] == "payload") {
        std::cout << R"(
kmsheader payload - Extract the data that follows the header

USAGE:
    kmsheader payload <file> --output=<file>

OPTIONS:
    --output=<file>, -o     Output file (required)
    --base64, -b            The input file holds base64 text
)";
    } else {
        print_error("Unknown help topic: '" + args.positional[0] + "'");
        return ExitCode::InvalidArguments;
    }

    return ExitCode::Success;
}

// ============================================================================
// Version Command
// ============================================================================

ExitCode cmd_version() {
    std::cout << "kmsheader v" << VERSION_STRING << "\n";
    std::cout << "\nAlgorithms: RSAES_OAEP_SHA_1, RSAES_OAEP_SHA_256\n";
    std::cout << "Key specs: RSA_2048, RSA_3072, RSA_4096\n";
    return ExitCode::Success;
}

// ============================================================================
// Inspect Command
// ============================================================================

ExitCode cmd_inspect(const ParsedArgs& args) {
    if (args.positional.empty()) {
        print_error("Missing input file. Use: kmsheader inspect <file>");
        return ExitCode::InvalidArguments;
    }

    const std::string& input_file = args.positional[0];

    if (args.bytes) {
        if (!is_partial_header_length(*args.bytes)) {
            print_error("--bytes must be 16, 32, 35 or 36");
            return ExitCode::InvalidArguments;
        }

        print_verbose("Reading " + std::to_string(*args.bytes) + " bytes of " + input_file);
        auto prefix = read_blob(args, input_file, *args.bytes);
        if (!prefix) {
            print_error("Cannot read " + input_file + ": " + describe(prefix.error()));
            return exit_code_for(prefix.error());
        }
        if (prefix->size() != *args.bytes) {
            print_error("File is shorter than " + std::to_string(*args.bytes) + " bytes");
            return ExitCode::FormatError;
        }

        auto partial = inspect_partial_header(*prefix);
        if (!partial) {
            print_error("Cannot inspect header: " + describe(partial.error()));
            return exit_code_for(partial.error());
        }

        std::cout << "Partial header (" << prefix->size() << " bytes):\n";
        print_field("Key ID:", partial->key_id.to_string());
        if (partial->account) {
            print_field("Account:", format_account(*partial->account));
        }
        if (partial->region) {
            print_field("Region:", partial->region->to_string());
        }
        if (auto arn = partial->arn()) {
            print_field("ARN:", *arn);
        }
        if (prefix->size() == constants::PARTIAL_ALGORITHM) {
            print_field("Algorithm:", partial->algorithm ? to_string(*partial->algorithm) : "-");
            print_field("Key spec:", partial->key_spec ? to_string(*partial->key_spec) : "-");
        }
        return ExitCode::Success;
    }

    auto blob = read_blob(args, input_file);
    if (!blob) {
        print_error("Cannot read " + input_file + ": " + describe(blob.error()));
        return exit_code_for(blob.error());
    }

    auto header = KmsHeader::from_bytes(*blob);
    if (!header) {
        print_error("Cannot parse header: " + describe(header.error()));
        return exit_code_for(header.error());
    }

    std::cout << "KMS header (" << header->length() << " bytes):\n";
    print_field("ARN:", header->arn().value_or("-"));
    print_field("Algorithm:", header->algorithm() ? to_string(*header->algorithm()) : "-");
    print_field("Key spec:", header->key_spec() ? to_string(*header->key_spec()) : "-");
    print_field("Cipher data:", header->cipher_data()
        ? std::to_string(header->cipher_data()->size()) + " bytes"
        : std::string("-"));
    print_field("State:", to_string(header->state()));
    print_field("Payload:", std::to_string(header->payload(*blob).size()) + " bytes");
    return ExitCode::Success;
}

// ============================================================================
// Create Command
// ============================================================================

ExitCode cmd_create(const ParsedArgs& args) {
    if (!args.arn) {
        print_error("Missing --arn option. Use --arn=arn:aws:kms:<region>:<account>:key/<id>");
        return ExitCode::InvalidArguments;
    }

    if (!args.output && !args.base64) {
        print_error("Missing --output option. Use --output=<file> or --base64 for stdout.");
        return ExitCode::InvalidArguments;
    }

    auto header = KmsHeader::from_arn(*args.arn);
    if (!header) {
        print_error("Invalid ARN '" + *args.arn + "': " + describe(header.error()));
        return exit_code_for(header.error());
    }

    if (args.algorithm) {
        auto algorithm = parse_algorithm(*args.algorithm);
        if (!algorithm) {
            print_error("Unknown algorithm: '" + *args.algorithm + "'");
            return ExitCode::InvalidArguments;
        }
        if (auto result = header->set_algorithm(*algorithm); !result) {
            print_error("Cannot set algorithm: " + describe(result.error()));
            return exit_code_for(result.error());
        }
    }

    std::optional<KeySpec> requested_spec;
    if (args.key_spec) {
        auto key_spec = parse_key_spec(*args.key_spec);
        if (!key_spec) {
            print_error("Unknown key spec: '" + *args.key_spec + "'");
            return ExitCode::InvalidArguments;
        }
        requested_spec = *key_spec;
        if (auto result = header->set_key_spec(*key_spec); !result) {
            print_error("Cannot set key spec: " + describe(result.error()));
            return exit_code_for(result.error());
        }
    }

    if (args.public_key) {
        print_verbose("Loading public key " + *args.public_key);
        if (auto result = header->load_public_key(*args.public_key); !result) {
            print_error("Failed to load public key: " + describe(result.error()));
            return exit_code_for(result.error());
        }
        if (requested_spec && header->key_spec() != requested_spec) {
            print_error("Public key is " + std::string(to_string(*header->key_spec())) +
                        " but --key-spec=" + *args.key_spec + " was requested");
            return ExitCode::KeyError;
        }
    }

    if (args.input) {
        if (!args.public_key) {
            print_error("--input requires --public-key");
            return ExitCode::InvalidArguments;
        }

        auto plaintext = read_file(*args.input);
        if (!plaintext) {
            print_error("Cannot read " + *args.input + ": " + describe(plaintext.error()));
            return exit_code_for(plaintext.error());
        }

        print_verbose("Encrypting " + std::to_string(plaintext->size()) + " bytes with " +
                      std::string(to_string(*header->algorithm())));
        if (auto result = header->encrypt(*plaintext); !result) {
            print_error("Encryption failed: " + describe(result.error()));
            return exit_code_for(result.error());
        }
    }

    if (!args.output) {
        std::cout << header->to_base64() << "\n";
        return ExitCode::Success;
    }

    VoidResult written;
    if (args.base64) {
        std::string text = header->to_base64() + "\n";
        written = write_file(*args.output, ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size()));
    } else {
        written = write_file(*args.output, header->to_bytes());
    }
    if (!written) {
        print_error("Cannot write to: " + *args.output);
        return exit_code_for(written.error());
    }

    print_success("Wrote " + std::to_string(header->length()) + "-byte header (" +
                  std::string(to_string(header->state())) + ") -> " + *args.output);
    return ExitCode::Success;
}

// ============================================================================
// Decrypt Command
// ============================================================================

ExitCode cmd_decrypt(const ParsedArgs& args) {
    if (args.positional.empty()) {
        print_error("Missing input file. Use: kmsheader decrypt <file>");
        return ExitCode::InvalidArguments;
    }

    if (!args.private_key) {
        print_error("Missing --private-key option (or KMSHEADER_PRIVATE_KEY).");
        return ExitCode::InvalidArguments;
    }

    const std::string& input_file = args.positional[0];
    auto blob = read_blob(args, input_file);
    if (!blob) {
        print_error("Cannot read " + input_file + ": " + describe(blob.error()));
        return exit_code_for(blob.error());
    }

    auto header = KmsHeader::from_bytes(*blob);
    if (!header) {
        print_error("Cannot parse header: " + describe(header.error()));
        return exit_code_for(header.error());
    }

    if (header->state() != HeaderState::HasCipherData) {
        print_error("Header has no cipher data (" + std::string(to_string(header->state())) + ")");
        return ExitCode::FormatError;
    }

    LocalKeyring keyring;
    if (auto result = keyring.add_key_file(*header->arn(), *args.private_key); !result) {
        print_error("Failed to load private key: " + describe(result.error()));
        return exit_code_for(result.error());
    }

    DecryptOptions options;
    if (args.timeout_ms) {
        options.timeout = std::chrono::milliseconds(*args.timeout_ms);
    }

    print_verbose("Decrypting with " + *header->arn());
    auto plaintext = header->decrypt(keyring, options);
    if (!plaintext) {
        print_error("Decryption failed: " + describe(plaintext.error()));
        return exit_code_for(plaintext.error());
    }

    if (!args.output) {
        std::cout << base64_encode(*plaintext) << "\n";
        return ExitCode::Success;
    }

    if (auto result = write_file(*args.output, *plaintext); !result) {
        print_error("Cannot write to: " + *args.output);
        return exit_code_for(result.error());
    }

    print_success("Decrypted " + std::to_string(plaintext->size()) + " bytes -> " + *args.output);
    return ExitCode::Success;
}

// ============================================================================
// Payload Command
// ============================================================================

ExitCode cmd_payload(const ParsedArgs& args) {
    if (args.positional.empty()) {
        print_error("Missing input file. Use: kmsheader payload <file>");
        return ExitCode::InvalidArguments;
    }

    if (!args.output) {
        print_error("Missing --output option. Use --output=<file> to specify output file.");
        return ExitCode::InvalidArguments;
    }

    const std::string& input_file = args.positional[0];
    auto blob = read_blob(args, input_file);
    if (!blob) {
        print_error("Cannot read " + input_file + ": " + describe(blob.error()));
        return exit_code_for(blob.error());
    }

    auto header = KmsHeader::from_bytes(*blob);
    if (!header) {
        print_error("Cannot parse header: " + describe(header.error()));
        return exit_code_for(header.error());
    }

    if (header->state() != HeaderState::HasCipherData) {
        print_info("Header is incomplete (" + std::string(to_string(header->state())) +
                   "); payload starts at byte " + std::to_string(header->length()));
    }

    ByteSpan payload = header->payload(*blob);
    if (auto result = write_file(*args.output, payload); !result) {
        print_error("Cannot write to: " + *args.output);
        return exit_code_for(result.error());
    }

    print_success("Extracted " + std::to_string(payload.size()) + " bytes -> " + *args.output);
    return ExitCode::Success;
}

// ============================================================================
// Main Entry Point
// ============================================================================

ExitCode run(std::span<char*> args) {
    if (args.size() < 2) {
        static_cast<void>(cmd_help({}));
        return ExitCode::InvalidArguments;
    }

    ParsedArgs parsed = parse_args(args);
    g_verbose = parsed.verbose;

    if (!parsed.invalid.empty()) {
        for (const auto& option : parsed.invalid) {
            print_error("Invalid option: '" + option + "'");
        }
        return ExitCode::InvalidArguments;
    }

    // Handle help flag on any command
    if (parsed.help) {
        ParsedArgs topic;
        if (parsed.command != "help" && !parsed.command.empty()) {
            topic.positional.push_back(parsed.command);
        }
        return cmd_help(topic);
    }

    if (parsed.command == "help") {
        return cmd_help(parsed);
    } else if (parsed.command == "version" || parsed.command == "--version") {
        return cmd_version();
    } else if (parsed.command == "inspect") {
        return cmd_inspect(parsed);
    } else if (parsed.command == "create") {
        return cmd_create(parsed);
    } else if (parsed.command == "decrypt") {
        return cmd_decrypt(parsed);
    } else if (parsed.command == "payload") {
        return cmd_payload(parsed);
    } else {
        print_error("Unknown command: '" + parsed.command + "'. Use 'kmsheader help' for usage.");
        return ExitCode::InvalidArguments;
    }
}

} // namespace kmsheader::cli
