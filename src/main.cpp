// ============================================================================
// KMS Header - Main Entry Point
// ============================================================================

#include "kmsheader/cli.hpp"

#include <span>

int main(int argc, char* argv[]) {
    return static_cast<int>(kmsheader::cli::run(std::span<char*>(argv, static_cast<std::size_t>(argc))));
}
