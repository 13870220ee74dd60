// ============================================================================
// KMS Header - Command Line Interface Tests
// ============================================================================

#include <gtest/gtest.h>
#include "kmsheader/cli.hpp"
#include "kmsheader/kmsheader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

namespace kmsheader::tests {

using cli::ExitCode;

namespace {

constexpr std::string_view SAMPLE_ARN =
    "arn:aws:kms:us-east-1:111122223333:key/1234abcd-12ab-34cd-56ef-1234567890ab";

/// Owns argv storage for a command line
class CommandLine {
public:
    CommandLine() : CommandLine(std::initializer_list<std::string>{}) {}

    CommandLine(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "kmsheader");
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
    }

    std::span<char*> span() { return argv_; }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

ByteBuffer read_all(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return ByteBuffer(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_all(const std::filesystem::path& path, ByteSpan data) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

} // anonymous namespace

// ============================================================================
// Argument Parsing Tests
// ============================================================================

TEST(CliParseTest, CommandOptionsAndPositional) {
    CommandLine line{"inspect", "blob.bin", "--bytes=36", "-v", "--base64"};
    auto args = cli::parse_args(line.span());

    EXPECT_EQ(args.command, "inspect");
    ASSERT_EQ(args.positional.size(), 1u);
    EXPECT_EQ(args.positional[0], "blob.bin");
    EXPECT_EQ(args.bytes, 36u);
    EXPECT_TRUE(args.verbose);
    EXPECT_TRUE(args.base64);
    EXPECT_TRUE(args.invalid.empty());
}

TEST(CliParseTest, ValueOptions) {
    CommandLine line{"create", "--arn=" + std::string(SAMPLE_ARN), "--algorithm=RSAES_OAEP_SHA_1",
                      "--key-spec=RSA_4096", "-o", "out.bin", "--timeout=250"};
    auto args = cli::parse_args(line.span());

    EXPECT_EQ(args.arn, std::string(SAMPLE_ARN));
    EXPECT_EQ(args.algorithm, "RSAES_OAEP_SHA_1");
    EXPECT_EQ(args.key_spec, "RSA_4096");
    EXPECT_EQ(args.output, "out.bin");
    EXPECT_EQ(args.timeout_ms, 250);
}

TEST(CliParseTest, InvalidOptions_AreCollected) {
    CommandLine line{"inspect", "--bytes=lots", "--frobnicate", "-z"};
    auto args = cli::parse_args(line.span());

    EXPECT_EQ(args.invalid.size(), 3u);
    EXPECT_FALSE(args.bytes.has_value());
}

TEST(CliParseTest, KeyOptions_FallBackToEnvironment) {
    ::setenv(cli::PRIVATE_KEY_ENV, "/keys/private.pem", 1);
    ::unsetenv(cli::PUBLIC_KEY_ENV);

    CommandLine line{"decrypt", "blob.bin"};
    auto args = cli::parse_args(line.span());
    EXPECT_EQ(args.private_key, "/keys/private.pem");
    EXPECT_FALSE(args.public_key.has_value());

    CommandLine explicit_line{"decrypt", "blob.bin", "--private-key=mine.pem"};
    auto explicit_args = cli::parse_args(explicit_line.span());
    EXPECT_EQ(explicit_args.private_key, "mine.pem");

    ::unsetenv(cli::PRIVATE_KEY_ENV);
}

TEST(CliParseTest, ExitCodeForErrors) {
    EXPECT_EQ(cli::exit_code_for(ErrorCode::FileNotFound), ExitCode::FileError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::KeyNotFound), ExitCode::KeyError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::Timeout), ExitCode::CryptoError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::TooShort), ExitCode::FormatError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::InvalidArgument), ExitCode::InvalidArguments);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::InternalError), ExitCode::InternalError);
}

// ============================================================================
// Command Tests
// ============================================================================

class CliCommandTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        temp_dir = std::filesystem::temp_directory_path() / "kmsheader_cli_test";
        std::filesystem::create_directories(temp_dir);
        ::unsetenv(cli::PUBLIC_KEY_ENV);
        ::unsetenv(cli::PRIVATE_KEY_ENV);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    std::string path(std::string_view name) const {
        return (temp_dir / name).string();
    }
};

TEST_F(CliCommandTest, NoArguments_ShowsHelp) {
    CommandLine line;
    EXPECT_EQ(cli::run(line.span()), ExitCode::InvalidArguments);
}

TEST_F(CliCommandTest, HelpAndVersion) {
    CommandLine help{"help", "create"};
    EXPECT_EQ(cli::run(help.span()), ExitCode::Success);

    CommandLine version{"version"};
    EXPECT_EQ(cli::run(version.span()), ExitCode::Success);

    CommandLine unknown{"frobnicate"};
    EXPECT_EQ(cli::run(unknown.span()), ExitCode::InvalidArguments);
}

TEST_F(CliCommandTest, CreateThenInspect) {
    CommandLine create{"create", "--arn=" + std::string(SAMPLE_ARN),
                        "--key-spec=RSA_2048", "--output=" + path("header.bin")};
    ASSERT_EQ(cli::run(create.span()), ExitCode::Success);

    ByteBuffer data = read_all(path("header.bin"));
    ASSERT_EQ(data.size(), 36u);
    EXPECT_EQ(data.back(), 0x22);

    CommandLine inspect{"inspect", path("header.bin")};
    EXPECT_EQ(cli::run(inspect.span()), ExitCode::Success);

    CommandLine partial{"inspect", path("header.bin"), "--bytes=16"};
    EXPECT_EQ(cli::run(partial.span()), ExitCode::Success);
}

TEST_F(CliCommandTest, Inspect_Errors) {
    CommandLine missing{"inspect", path("missing.bin")};
    EXPECT_EQ(cli::run(missing.span()), ExitCode::FileError);

    write_all(path("short.bin"), ByteBuffer(20, 0x00));
    CommandLine too_short{"inspect", path("short.bin")};
    EXPECT_EQ(cli::run(too_short.span()), ExitCode::FormatError);

    CommandLine short_prefix{"inspect", path("short.bin"), "--bytes=32"};
    EXPECT_EQ(cli::run(short_prefix.span()), ExitCode::FormatError);

    CommandLine bad_length{"inspect", path("short.bin"), "--bytes=20"};
    EXPECT_EQ(cli::run(bad_length.span()), ExitCode::InvalidArguments);
}

TEST_F(CliCommandTest, Create_InvalidArn) {
    CommandLine create{"create", "--arn=arn:aws:kms:moon-east-1:1:key/x", "--output=" + path("h.bin")};
    EXPECT_EQ(cli::run(create.span()), ExitCode::FormatError);
}

TEST_F(CliCommandTest, EncryptDecryptPayload) {
    auto key = RsaKey::generate(2048);
    ASSERT_TRUE(key.has_value());
    ASSERT_TRUE(key->save_public_key(path("public.pem")).has_value());
    ASSERT_TRUE(key->save_private_key(path("private.pem")).has_value());

    ByteBuffer symmetric_key(32, 0x3c);
    write_all(path("data.key"), symmetric_key);

    CommandLine create{"create", "--arn=" + std::string(SAMPLE_ARN),
                        "--public-key=" + path("public.pem"), "--input=" + path("data.key"),
                        "--output=" + path("header.bin")};
    ASSERT_EQ(cli::run(create.span()), ExitCode::Success);

    // Append a symmetric payload to form a stored blob
    ByteBuffer blob = read_all(path("header.bin"));
    ASSERT_EQ(blob.size(), 292u);
    ByteBuffer payload = {1, 2, 3, 4, 5, 6, 7, 8};
    blob.insert(blob.end(), payload.begin(), payload.end());
    write_all(path("blob.bin"), blob);

    CommandLine decrypt{"decrypt", path("blob.bin"), "--private-key=" + path("private.pem"),
                         "--output=" + path("recovered.key")};
    ASSERT_EQ(cli::run(decrypt.span()), ExitCode::Success);
    EXPECT_EQ(read_all(path("recovered.key")), symmetric_key);

    CommandLine extract{"payload", path("blob.bin"), "--output=" + path("payload.bin")};
    ASSERT_EQ(cli::run(extract.span()), ExitCode::Success);
    EXPECT_EQ(read_all(path("payload.bin")), payload);
}

TEST_F(CliCommandTest, Create_KeySpecConflictsWithKey) {
    auto key = RsaKey::generate(2048);
    ASSERT_TRUE(key.has_value());
    ASSERT_TRUE(key->save_public_key(path("public.pem")).has_value());

    CommandLine create{"create", "--arn=" + std::string(SAMPLE_ARN), "--key-spec=RSA_4096",
                        "--public-key=" + path("public.pem"), "--output=" + path("h.bin")};
    EXPECT_EQ(cli::run(create.span()), ExitCode::KeyError);
}

TEST_F(CliCommandTest, Decrypt_WithoutCipherData) {
    auto header = KmsHeader::from_arn(SAMPLE_ARN, Algorithm::RsaesOaepSha256, KeySpec::Rsa2048);
    ASSERT_TRUE(header.has_value());
    write_all(path("header.bin"), header->to_bytes());

    auto key = RsaKey::generate(2048);
    ASSERT_TRUE(key.has_value());
    ASSERT_TRUE(key->save_private_key(path("private.pem")).has_value());

    CommandLine decrypt{"decrypt", path("header.bin"), "--private-key=" + path("private.pem")};
    EXPECT_EQ(cli::run(decrypt.span()), ExitCode::FormatError);

    CommandLine no_key{"decrypt", path("header.bin")};
    EXPECT_EQ(cli::run(no_key.span()), ExitCode::InvalidArguments);
}

TEST_F(CliCommandTest, Base64Input) {
    auto header = KmsHeader::from_arn(SAMPLE_ARN, Algorithm::RsaesOaepSha1, KeySpec::Rsa3072);
    ASSERT_TRUE(header.has_value());

    std::string text = header->to_base64() + "\n";
    write_all(path("header.txt"), ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size()));

    CommandLine inspect{"inspect", path("header.txt"), "--base64"};
    EXPECT_EQ(cli::run(inspect.span()), ExitCode::Success);

    CommandLine partial{"inspect", path("header.txt"), "--base64", "--bytes=35"};
    EXPECT_EQ(cli::run(partial.span()), ExitCode::Success);
}

} // namespace kmsheader::tests
