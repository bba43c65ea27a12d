// DADBS - Cryptography Tests
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <gtest/gtest.h>
#include <dadbs/core/hex.h>
#include <dadbs/crypto/base58.h>
#include <dadbs/crypto/ed25519.h>
#include <dadbs/crypto/sha256.h>

#include <string>
#include <vector>

namespace dadbs {
namespace test {

using namespace crypto;

namespace {

std::vector<uint8_t> FromString(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

PrivateKey::Seed SeedFromHex(const std::string& hex) {
    auto bytes = HexToBytes(hex);
    PrivateKey::Seed seed{};
    std::copy(bytes.begin(), bytes.end(), seed.begin());
    return seed;
}

// RFC 8032 section 7.1, TEST 1
const char* RFC_SEED = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
const char* RFC_PUBKEY = "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
const char* RFC_SIGNATURE =
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555"
    "fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b";

} // namespace

// ============================================================================
// SHA256 Tests
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(std::string()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(std::string("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    std::vector<Byte> part1 = FromString("a");
    std::vector<Byte> part2 = FromString("bc");
    hasher.Write(part1).Write(part2);
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(std::string("abc")));
}

TEST(SHA256Test, FinalizeResets) {
    SHA256 hasher;
    hasher.Write(FromString("abc"));
    Hash256 first = hasher.Finalize();
    hasher.Write(FromString("abc"));
    EXPECT_EQ(hasher.Finalize(), first);

    hasher.Write(FromString("junk"));
    hasher.Reset();
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(std::string()));
}

TEST(SHA256Test, ChainingHashes) {
    Hash256 a = SHA256Hash(std::string("a"));
    Hash256 b = SHA256Hash(std::string("b"));

    SHA256 hasher;
    hasher.Write(a).Write(b);

    std::vector<Byte> concat(a.begin(), a.end());
    concat.insert(concat.end(), b.begin(), b.end());
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(concat));
}

// ============================================================================
// Base58 Tests
// ============================================================================

TEST(Base58Test, KnownVectors) {
    EXPECT_EQ(EncodeBase58(FromString("Hello World!")), "2NEpo7TZRRrLZSi2U");
    EXPECT_EQ(EncodeBase58({}), "");
    EXPECT_EQ(EncodeBase58({0x00, 0x00, 0x01}), "112");
}

TEST(Base58Test, Decode) {
    auto decoded = DecodeBase58("2NEpo7TZRRrLZSi2U");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, FromString("Hello World!"));

    auto zeros = DecodeBase58("112");
    ASSERT_TRUE(zeros.has_value());
    EXPECT_EQ(*zeros, (std::vector<uint8_t>{0x00, 0x00, 0x01}));
}

TEST(Base58Test, RejectsInvalidCharacters) {
    // 0, O, I and l are not in the alphabet
    EXPECT_FALSE(DecodeBase58("0abc").has_value());
    EXPECT_FALSE(DecodeBase58("abcO").has_value());
    EXPECT_FALSE(DecodeBase58("ab l").has_value());
    EXPECT_FALSE(IsBase58("I"));
    EXPECT_TRUE(IsBase58("123abcXYZ"));
}

// ============================================================================
// Ed25519 Tests
// ============================================================================

TEST(Ed25519Test, Rfc8032PublicKey) {
    PrivateKey key(SeedFromHex(RFC_SEED));
    const auto& pub = key.GetPublicKey().bytes();
    EXPECT_EQ(BytesToHex(pub.data(), pub.size()), RFC_PUBKEY);
    EXPECT_EQ(key.GetPublicKey().ToBase58(), "FVen3X669xLzsi6N2V91DoiyzHzg1uAgqiT8jZ9nS96Z");
}

TEST(Ed25519Test, Rfc8032Signature) {
    PrivateKey key(SeedFromHex(RFC_SEED));
    Signature sig = key.Sign(std::vector<uint8_t>{});
    EXPECT_EQ(BytesToHex(sig.data(), sig.size()), RFC_SIGNATURE);
    EXPECT_TRUE(key.GetPublicKey().Verify(std::vector<uint8_t>{}, sig));
}

TEST(Ed25519Test, SignAndVerify) {
    PrivateKey key = PrivateKey::Generate();
    std::vector<uint8_t> msg = FromString("stake 10 tokens");

    Signature sig = key.Sign(msg);
    EXPECT_TRUE(key.GetPublicKey().Verify(msg, sig));

    std::vector<uint8_t> tampered = msg;
    tampered[0] ^= 0x01;
    EXPECT_FALSE(key.GetPublicKey().Verify(tampered, sig));

    Signature badSig = sig;
    badSig[10] ^= 0x80;
    EXPECT_FALSE(key.GetPublicKey().Verify(msg, badSig));
}

TEST(Ed25519Test, WrongKeyFails) {
    PrivateKey alice = PrivateKey::Generate();
    PrivateKey bob = PrivateKey::Generate();
    EXPECT_NE(alice.GetPublicKey(), bob.GetPublicKey());

    std::vector<uint8_t> msg = FromString("message");
    EXPECT_FALSE(bob.GetPublicKey().Verify(msg, alice.Sign(msg)));
}

TEST(Ed25519Test, PublicKeyBase58) {
    PrivateKey key = PrivateKey::Generate();
    std::string encoded = key.GetPublicKey().ToBase58();

    auto parsed = PublicKey::FromBase58(encoded);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, key.GetPublicKey());

    EXPECT_FALSE(PublicKey::FromBase58("2NEpo7TZRRrLZSi2U").has_value());
    EXPECT_FALSE(PublicKey::FromBase58("not base58!").has_value());
}

TEST(Ed25519Test, RandomBytesDiffer) {
    uint8_t a[32] = {};
    uint8_t b[32] = {};
    GetRandBytes(a, sizeof(a));
    GetRandBytes(b, sizeof(b));
    EXPECT_NE(BytesToHex(a, sizeof(a)), BytesToHex(b, sizeof(b)));
}

} // namespace test
} // namespace dadbs
