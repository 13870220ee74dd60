// ============================================================================
// KMS Header - Command Line Interface
// ============================================================================
// A command-line tool for building and reading KMS headers.
//
// Usage:
//   kmsheader <command> [options]
//
// Commands:
//   inspect     Show the fields of a header (or of a header prefix)
//   create      Build a header, optionally wrapping key material
//   decrypt     Recover the key material with a local private key
//   payload     Extract the data that follows the header
//   help        Show help information
//   version     Show version information
// ============================================================================

#ifndef KMSHEADER_CLI_HPP
#define KMSHEADER_CLI_HPP

#include "kmsheader/types.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kmsheader::cli {

/// Exit codes for the CLI
enum class ExitCode : int {
    Success = 0,
    InvalidArguments = 1,
    FileError = 2,
    CryptoError = 3,
    KeyError = 4,
    FormatError = 5,
    InternalError = 6
};

/// Environment fallbacks for key options
inline constexpr const char* PUBLIC_KEY_ENV = "KMSHEADER_PUBLIC_KEY";
inline constexpr const char* PRIVATE_KEY_ENV = "KMSHEADER_PRIVATE_KEY";

/// CLI argument parser result
struct ParsedArgs {
    std::string command;
    std::vector<std::string> positional;

    // Flags
    bool help = false;
    bool verbose = false;
    bool base64 = false;                  // Base64 text instead of binary

    // Options with values
    std::optional<std::string> output;
    std::optional<std::string> input;
    std::optional<std::string> arn;
    std::optional<std::string> algorithm;
    std::optional<std::string> key_spec;
    std::optional<std::string> public_key;
    std::optional<std::string> private_key;
    std::optional<std::size_t> bytes;     // Partial inspection length
    std::optional<long> timeout_ms;       // KMS call deadline

    // Values that failed to parse, reported during validation
    std::vector<std::string> invalid;
};

/// Parse command line arguments
/// Key options left unset are filled from the environment.
[[nodiscard]] ParsedArgs parse_args(std::span<char*> args);

/// Main CLI entry point
[[nodiscard]] ExitCode run(std::span<char*> args);

// Command handlers
[[nodiscard]] ExitCode cmd_help(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_version();
[[nodiscard]] ExitCode cmd_inspect(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_create(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_decrypt(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_payload(const ParsedArgs& args);

/// Map a library error to the exit code reported for it
[[nodiscard]] ExitCode exit_code_for(ErrorCode error) noexcept;

// Utility functions
void print_error(std::string_view message);
void print_success(std::string_view message);
void print_info(std::string_view message);

} // namespace kmsheader::cli

#endif // KMSHEADER_CLI_HPP
