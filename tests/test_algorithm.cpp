// ============================================================================
// KMS Header - Algorithm Codec Unit Tests
// ============================================================================

#include <gtest/gtest.h>
#include "kmsheader/algorithm.hpp"

namespace kmsheader::tests {

// ============================================================================
// Name Tests
// ============================================================================

TEST(AlgorithmTest, Names_MatchKms) {
    EXPECT_EQ(to_string(Algorithm::RsaesOaepSha1), "RSAES_OAEP_SHA_1");
    EXPECT_EQ(to_string(Algorithm::RsaesOaepSha256), "RSAES_OAEP_SHA_256");
    EXPECT_EQ(to_string(KeySpec::Rsa2048), "RSA_2048");
    EXPECT_EQ(to_string(KeySpec::Rsa3072), "RSA_3072");
    EXPECT_EQ(to_string(KeySpec::Rsa4096), "RSA_4096");
}

TEST(AlgorithmTest, ParseNames_RoundTrip) {
    for (auto algorithm : {Algorithm::RsaesOaepSha1, Algorithm::RsaesOaepSha256}) {
        auto parsed = parse_algorithm(to_string(algorithm));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, algorithm);
    }

    for (auto key_spec : {KeySpec::Rsa2048, KeySpec::Rsa3072, KeySpec::Rsa4096}) {
        auto parsed = parse_key_spec(to_string(key_spec));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, key_spec);
    }
}

TEST(AlgorithmTest, ParseUnknownNames_Fails) {
    auto algorithm = parse_algorithm("RSAES_PKCS1_V1_5");
    ASSERT_FALSE(algorithm.has_value());
    EXPECT_EQ(algorithm.error(), ErrorCode::UnsupportedAlgorithm);

    auto key_spec = parse_key_spec("RSA_1024");
    ASSERT_FALSE(key_spec.has_value());
    EXPECT_EQ(key_spec.error(), ErrorCode::UnsupportedKeySize);
}

// ============================================================================
// Size Tests
// ============================================================================

TEST(AlgorithmTest, KeySpecFromBits) {
    EXPECT_EQ(key_spec_from_bits(2048).value(), KeySpec::Rsa2048);
    EXPECT_EQ(key_spec_from_bits(3072).value(), KeySpec::Rsa3072);
    EXPECT_EQ(key_spec_from_bits(4096).value(), KeySpec::Rsa4096);

    auto unsupported = key_spec_from_bits(1024);
    ASSERT_FALSE(unsupported.has_value());
    EXPECT_EQ(unsupported.error(), ErrorCode::UnsupportedKeySize);
}

TEST(AlgorithmTest, CipherLength) {
    EXPECT_EQ(cipher_length(KeySpec::Rsa2048), 256);
    EXPECT_EQ(cipher_length(KeySpec::Rsa3072), 384);
    EXPECT_EQ(cipher_length(KeySpec::Rsa4096), 512);
    EXPECT_EQ(key_spec_bits(KeySpec::Rsa3072), 3072);
}

TEST(AlgorithmTest, MaxPlaintextLength) {
    // 2 * hash length + 2
    EXPECT_EQ(oaep_overhead(Algorithm::RsaesOaepSha1), 42);
    EXPECT_EQ(oaep_overhead(Algorithm::RsaesOaepSha256), 66);

    EXPECT_EQ(max_plaintext_length(Algorithm::RsaesOaepSha1, KeySpec::Rsa2048), 214);
    EXPECT_EQ(max_plaintext_length(Algorithm::RsaesOaepSha256, KeySpec::Rsa2048), 190);
    EXPECT_EQ(max_plaintext_length(Algorithm::RsaesOaepSha256, KeySpec::Rsa4096), 446);
}

// ============================================================================
// Byte Codec Tests
// ============================================================================

TEST(AlgorithmByteTest, Encode_CombinesNibbles) {
    EXPECT_EQ(encode_algorithm_byte(Algorithm::RsaesOaepSha256, KeySpec::Rsa2048).value(), 0x22);
    EXPECT_EQ(encode_algorithm_byte(Algorithm::RsaesOaepSha1, KeySpec::Rsa4096).value(), 0x13);
    EXPECT_EQ(encode_algorithm_byte(Algorithm::RsaesOaepSha256, std::nullopt).value(), 0x20);
    EXPECT_EQ(encode_algorithm_byte(std::nullopt, KeySpec::Rsa3072).value(), 0x02);
    EXPECT_EQ(encode_algorithm_byte(std::nullopt, std::nullopt).value(), 0x00);
}

TEST(AlgorithmByteTest, Encode_OutOfEnumValues_Fail) {
    auto algorithm = encode_algorithm_byte(static_cast<Algorithm>(0x30), std::nullopt);
    ASSERT_FALSE(algorithm.has_value());
    EXPECT_EQ(algorithm.error(), ErrorCode::UnsupportedAlgorithm);

    auto key_spec = encode_algorithm_byte(std::nullopt, static_cast<KeySpec>(0x04));
    ASSERT_FALSE(key_spec.has_value());
    EXPECT_EQ(key_spec.error(), ErrorCode::UnsupportedKeySize);
}

TEST(AlgorithmByteTest, Decode_AllCombinations) {
    for (auto algorithm : {Algorithm::RsaesOaepSha1, Algorithm::RsaesOaepSha256}) {
        for (auto key_spec : {KeySpec::Rsa2048, KeySpec::Rsa3072, KeySpec::Rsa4096}) {
            auto byte = encode_algorithm_byte(algorithm, key_spec);
            ASSERT_TRUE(byte.has_value());

            auto decoded = decode_algorithm_byte(*byte);
            ASSERT_TRUE(decoded.has_value());
            EXPECT_EQ(decoded->algorithm, algorithm);
            EXPECT_EQ(decoded->key_spec, key_spec);
        }
    }
}

TEST(AlgorithmByteTest, Decode_ZeroNibbleIsAbsent) {
    auto only_algorithm = decode_algorithm_byte(0x10);
    ASSERT_TRUE(only_algorithm.has_value());
    EXPECT_EQ(only_algorithm->algorithm, Algorithm::RsaesOaepSha1);
    EXPECT_FALSE(only_algorithm->key_spec.has_value());

    auto empty = decode_algorithm_byte(0x00);
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(*empty, AlgorithmByte{});
}

TEST(AlgorithmByteTest, Decode_UnknownNibble_Fails) {
    for (Byte value : {Byte{0x30}, Byte{0xF2}, Byte{0x24}, Byte{0x2F}}) {
        auto decoded = decode_algorithm_byte(value);
        ASSERT_FALSE(decoded.has_value()) << static_cast<int>(value);
        EXPECT_EQ(decoded.error(), ErrorCode::UnrecognizedCode);
    }
}

} // namespace kmsheader::tests
