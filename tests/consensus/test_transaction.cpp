// DADBS - Transaction Tests
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <gtest/gtest.h>
#include <dadbs/consensus/transaction.h>
#include <dadbs/core/serialize.h>

namespace dadbs {
namespace test {

using namespace consensus;

namespace {
const int64_t TIMESTAMP = 1700000000000;
}

class TransactionTest : public ::testing::Test {
protected:
    crypto::PrivateKey key_ = crypto::PrivateKey::Generate();
    std::vector<Byte> payload_ = {0xde, 0xad, 0xbe, 0xef};
};

TEST_F(TransactionTest, CreateSignedVerifies) {
    Transaction tx = Transaction::CreateSigned(payload_, key_, TIMESTAMP);
    EXPECT_EQ(tx.signer, key_.GetPublicKey().ToBase58());
    EXPECT_EQ(tx.payload, payload_);
    EXPECT_EQ(tx.timestamp, TIMESTAMP);
    EXPECT_TRUE(tx.VerifySignature());
}

TEST_F(TransactionTest, TamperingBreaksSignature) {
    Transaction tx = Transaction::CreateSigned(payload_, key_, TIMESTAMP);

    Transaction payloadTampered = tx;
    payloadTampered.payload[0] ^= 0x01;
    EXPECT_FALSE(payloadTampered.VerifySignature());

    Transaction timeTampered = tx;
    timeTampered.timestamp += 1;
    EXPECT_FALSE(timeTampered.VerifySignature());

    Transaction sigTampered = tx;
    sigTampered.signature[0] ^= 0x01;
    EXPECT_FALSE(sigTampered.VerifySignature());

    Transaction otherSigner = tx;
    otherSigner.signer = crypto::PrivateKey::Generate().GetPublicKey().ToBase58();
    EXPECT_FALSE(otherSigner.VerifySignature());
}

TEST_F(TransactionTest, MalformedSignerFails) {
    Transaction tx = Transaction::CreateSigned(payload_, key_, TIMESTAMP);
    tx.signer = "not a key";
    EXPECT_FALSE(tx.VerifySignature());

    tx.signer = "";
    EXPECT_FALSE(tx.VerifySignature());
}

TEST_F(TransactionTest, UnsignedFails) {
    Transaction tx;
    tx.payload = payload_;
    tx.signer = key_.GetPublicKey().ToBase58();
    tx.timestamp = TIMESTAMP;
    EXPECT_FALSE(tx.VerifySignature());
}

TEST_F(TransactionTest, SigningMessageLayout) {
    Transaction tx = Transaction::CreateSigned(payload_, key_, TIMESTAMP);
    std::vector<Byte> msg = tx.GetSigningMessage();

    DataStream s(msg);
    EXPECT_EQ(ser_readdata8(s), TRANSACTION_VERSION);

    std::vector<Byte> payload;
    std::string signer;
    int64_t timestamp = 0;
    s >> payload >> signer >> timestamp;
    EXPECT_EQ(payload, payload_);
    EXPECT_EQ(signer, tx.signer);
    EXPECT_EQ(timestamp, TIMESTAMP);
    EXPECT_TRUE(s.empty());
}

TEST_F(TransactionTest, HashCoversSignature) {
    Transaction a = Transaction::CreateSigned(payload_, key_, TIMESTAMP);
    Transaction b = a;
    EXPECT_EQ(a.GetHash(), b.GetHash());

    b.signature[63] ^= 0x01;
    EXPECT_NE(a.GetHash(), b.GetHash());

    Transaction c = Transaction::CreateSigned(payload_, key_, TIMESTAMP + 1);
    EXPECT_NE(a.GetHash(), c.GetHash());
}

TEST_F(TransactionTest, WireRoundTrip) {
    Transaction tx = Transaction::CreateSigned(payload_, key_, TIMESTAMP);
    auto decoded = Transaction::Deserialize(tx.Serialize());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->payload, tx.payload);
    EXPECT_EQ(decoded->signer, tx.signer);
    EXPECT_EQ(decoded->timestamp, tx.timestamp);
    EXPECT_EQ(decoded->signature, tx.signature);
    EXPECT_TRUE(decoded->VerifySignature());
}

TEST_F(TransactionTest, DeserializeRejectsMalformed) {
    std::vector<Byte> wire = Transaction::CreateSigned(payload_, key_, TIMESTAMP).Serialize();

    std::vector<Byte> truncated(wire.begin(), wire.end() - 1);
    EXPECT_FALSE(Transaction::Deserialize(truncated).has_value());

    std::vector<Byte> trailing = wire;
    trailing.push_back(0);
    EXPECT_FALSE(Transaction::Deserialize(trailing).has_value());

    std::vector<Byte> badVersion = wire;
    badVersion[0] = 2;
    EXPECT_FALSE(Transaction::Deserialize(badVersion).has_value());

    EXPECT_FALSE(Transaction::Deserialize({}).has_value());
}

TEST_F(TransactionTest, EmptyPayloadIsSignable) {
    Transaction tx = Transaction::CreateSigned({}, key_, 0);
    EXPECT_TRUE(tx.VerifySignature());
    EXPECT_NE(tx.ToString().find(tx.signer), std::string::npos);
}

} // namespace test
} // namespace dadbs
