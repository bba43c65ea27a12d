// DADBS - Consensus Manager Tests
// Copyright (c) 2024 DADBS Developers
// MIT License

#include <gtest/gtest.h>
#include <dadbs/consensus/consensus.h>
#include <dadbs/crypto/sha256.h>
#include <dadbs/node/config.h>

#include <atomic>
#include <stdexcept>

namespace dadbs {
namespace test {

using namespace consensus;

namespace {

const int64_t NOW = 1700000000000;

/// Answers immediately with a fixed verdict
class FixedClient : public IValidatorClient {
public:
    explicit FixedClient(bool verdict) : verdict_(verdict) {}

    bool ConfirmTransaction(const Transaction&, util::Milliseconds) override {
        calls.fetch_add(1);
        return verdict_;
    }

    std::atomic<int> calls{0};

private:
    bool verdict_;
};

/// Blocks until released or until its timeout runs out, then refuses
class SlowClient : public IValidatorClient {
public:
    bool ConfirmTransaction(const Transaction&, util::Milliseconds timeout) override {
        util::DeadlineTimer deadline(timeout);
        while (!released.load() && !deadline.IsExpired()) {
            util::SleepMillis(2);
        }
        return false;
    }

    std::atomic<bool> released{false};
};

/// Confirms after a fixed delay
class DelayedClient : public IValidatorClient {
public:
    explicit DelayedClient(int64_t delayMs) : delayMs_(delayMs) {}

    bool ConfirmTransaction(const Transaction&, util::Milliseconds) override {
        util::SleepMillis(delayMs_);
        return true;
    }

private:
    int64_t delayMs_;
};

class ThrowingClient : public IValidatorClient {
public:
    bool ConfirmTransaction(const Transaction&, util::Milliseconds) override {
        throw std::runtime_error("connection reset");
    }
};

std::string Identity(int i) {
    return std::string(43, 'V') + static_cast<char>('a' + i);
}

} // namespace

// ============================================================================
// Quorum Arithmetic
// ============================================================================

TEST(QuorumTest, Threshold) {
    EXPECT_EQ(QuorumThreshold(0), 0u);
    EXPECT_EQ(QuorumThreshold(1), 0u);
    EXPECT_EQ(QuorumThreshold(3), 2u);
    EXPECT_EQ(QuorumThreshold(4), 2u);
    EXPECT_EQ(QuorumThreshold(5), 3u);
    EXPECT_EQ(QuorumThreshold(100), 66u);
}

TEST(QuorumTest, StrictlyMoreThanTwoThirds) {
    EXPECT_FALSE(HasQuorum(0, 0));
    EXPECT_TRUE(HasQuorum(1, 1));
    EXPECT_FALSE(HasQuorum(1, 2));
    EXPECT_TRUE(HasQuorum(2, 2));
    EXPECT_FALSE(HasQuorum(2, 3));
    EXPECT_TRUE(HasQuorum(3, 3));
    EXPECT_TRUE(HasQuorum(3, 4));
    EXPECT_FALSE(HasQuorum(3, 5));
    EXPECT_TRUE(HasQuorum(4, 5));
    EXPECT_FALSE(HasQuorum(66, 100));
    EXPECT_TRUE(HasQuorum(67, 100));
}

// ============================================================================
// Consensus Manager Fixture
// ============================================================================

class ConsensusTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<StaticValidatorRegistry>();
        options_.consensusTimeout = util::Milliseconds(2000);
        options_.validatorThreads = 8;
        options_.clock = [this]() { return now_.load(); };
    }

    std::unique_ptr<ConsensusManager> MakeManager() {
        return std::make_unique<ConsensusManager>(registry_, options_);
    }

    void AddValidators(int confirming, int refusing) {
        int i = static_cast<int>(registry_->Size());
        for (int k = 0; k < confirming; ++k, ++i) {
            ASSERT_TRUE(registry_->AddValidator(Identity(i), 10 * BASE_UNITS_PER_TOKEN,
                                                std::make_shared<FixedClient>(true)));
        }
        for (int k = 0; k < refusing; ++k, ++i) {
            ASSERT_TRUE(registry_->AddValidator(Identity(i), 10 * BASE_UNITS_PER_TOKEN,
                                                std::make_shared<FixedClient>(false)));
        }
    }

    Transaction SignedTx(int64_t timestamp = NOW) {
        return Transaction::CreateSigned({1, 2, 3}, key_, timestamp);
    }

    std::shared_ptr<StaticValidatorRegistry> registry_;
    ConsensusOptions options_;
    std::atomic<int64_t> now_{NOW};
    crypto::PrivateKey key_ = crypto::PrivateKey::Generate();
};

TEST_F(ConsensusTest, RequiresRegistry) {
    std::shared_ptr<IValidatorRegistry> none;
    EXPECT_THROW({ ConsensusManager manager(none, options_); }, std::invalid_argument);
}

TEST_F(ConsensusTest, NodeConfigSetsTimeout) {
    node::NodeConfig config;
    config.consensusTimeoutMs = 1234;
    config.validatorThreads = 2;
    ConsensusManager manager(registry_, config);
    EXPECT_EQ(manager.GetConsensusTimeout().count(), 1234);
    EXPECT_EQ(manager.GetState().consensusTimeout.count(), 1234);
}

// ============================================================================
// Quorum Outcomes
// ============================================================================

TEST_F(ConsensusTest, UnanimousThreeAccepts) {
    AddValidators(3, 0);
    auto manager = MakeManager();
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, TwoOfThreeRejects) {
    AddValidators(2, 1);
    auto manager = MakeManager();
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, ThreeOfFourAccepts) {
    AddValidators(3, 1);
    auto manager = MakeManager();
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, ThreeOfFiveRejects) {
    AddValidators(3, 2);
    auto manager = MakeManager();
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, FourOfFiveAccepts) {
    AddValidators(4, 1);
    auto manager = MakeManager();
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, SingleValidator) {
    AddValidators(1, 0);
    auto manager = MakeManager();
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, EmptyValidatorSetRejects) {
    auto manager = MakeManager();
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
    EXPECT_EQ(manager->GetState().roundsRejected, 1u);
}

TEST_F(ConsensusTest, MissingClientCountsAsRefusal) {
    AddValidators(3, 0);
    ASSERT_TRUE(registry_->AddValidator(Identity(3), BASE_UNITS_PER_TOKEN, nullptr));
    auto manager = MakeManager();
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));

    ASSERT_TRUE(registry_->AddValidator(Identity(4), BASE_UNITS_PER_TOKEN, nullptr));
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, ThrowingClientCountsAsRefusal) {
    AddValidators(3, 0);
    ASSERT_TRUE(registry_->AddValidator(Identity(3), BASE_UNITS_PER_TOKEN,
                                        std::make_shared<ThrowingClient>()));
    auto manager = MakeManager();
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));

    ASSERT_TRUE(registry_->AddValidator(Identity(4), BASE_UNITS_PER_TOKEN,
                                        std::make_shared<ThrowingClient>()));
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
}

// ============================================================================
// Pre-checks
// ============================================================================

TEST_F(ConsensusTest, BadSignatureSkipsValidators) {
    auto client = std::make_shared<FixedClient>(true);
    ASSERT_TRUE(registry_->AddValidator(Identity(0), BASE_UNITS_PER_TOKEN, client));
    auto manager = MakeManager();

    Transaction tx = SignedTx();
    tx.payload.push_back(0xff);
    EXPECT_FALSE(manager->VerifySignature(tx));
    EXPECT_FALSE(manager->ValidateTransaction(tx));
    EXPECT_EQ(client->calls.load(), 0);
}

TEST_F(ConsensusTest, StaleTimestampSkipsValidators) {
    auto client = std::make_shared<FixedClient>(true);
    ASSERT_TRUE(registry_->AddValidator(Identity(0), BASE_UNITS_PER_TOKEN, client));
    auto manager = MakeManager();

    Transaction tx = SignedTx(NOW - 2000);
    EXPECT_FALSE(manager->VerifyTimestamp(tx));
    EXPECT_FALSE(manager->ValidateTransaction(tx));
    EXPECT_EQ(client->calls.load(), 0);
}

TEST_F(ConsensusTest, TimestampWindow) {
    auto manager = MakeManager();

    EXPECT_TRUE(manager->VerifyTimestamp(SignedTx(NOW)));
    EXPECT_TRUE(manager->VerifyTimestamp(SignedTx(NOW - 1999)));
    EXPECT_FALSE(manager->VerifyTimestamp(SignedTx(NOW - 2000)));
    EXPECT_FALSE(manager->VerifyTimestamp(SignedTx(0)));

    // Clock skew in the sender's favour is tolerated
    EXPECT_TRUE(manager->VerifyTimestamp(SignedTx(NOW + 60000)));
}

TEST_F(ConsensusTest, ExtremeTimestamps) {
    auto manager = MakeManager();
    EXPECT_FALSE(manager->VerifyTimestamp(SignedTx(INT64_MIN)));
    EXPECT_TRUE(manager->VerifyTimestamp(SignedTx(INT64_MAX)));
}

// ============================================================================
// Deadlines and Early Exit
// ============================================================================

TEST_F(ConsensusTest, SlowValidatorsRunIntoDeadline) {
    options_.consensusTimeout = util::Milliseconds(200);
    std::vector<std::shared_ptr<SlowClient>> slow;
    for (int i = 0; i < 3; ++i) {
        slow.push_back(std::make_shared<SlowClient>());
        ASSERT_TRUE(registry_->AddValidator(Identity(i), BASE_UNITS_PER_TOKEN, slow.back()));
    }
    auto manager = MakeManager();

    util::Timer timer;
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
    EXPECT_GE(timer.ElapsedMillis(), 150);
    EXPECT_LT(timer.ElapsedMillis(), 2000);
}

TEST_F(ConsensusTest, ClosesAsSoonAsQuorumIsReached) {
    AddValidators(3, 0);
    auto slow = std::make_shared<SlowClient>();
    ASSERT_TRUE(registry_->AddValidator(Identity(3), BASE_UNITS_PER_TOKEN, slow));
    auto manager = MakeManager();

    util::Timer timer;
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
    EXPECT_LT(timer.ElapsedMillis(), 1500);
    slow->released.store(true);
}

TEST_F(ConsensusTest, ClosesOnceQuorumIsUnreachable) {
    AddValidators(1, 2);
    auto slow = std::make_shared<SlowClient>();
    ASSERT_TRUE(registry_->AddValidator(Identity(3), BASE_UNITS_PER_TOKEN, slow));
    auto manager = MakeManager();

    // 4 validators, 2 refusals: at most 2 confirmations remain possible
    util::Timer timer;
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
    EXPECT_LT(timer.ElapsedMillis(), 1500);
    slow->released.store(true);
}

TEST_F(ConsensusTest, SingleWorkerStillQueriesAllValidatorsAtOnce) {
    options_.validatorThreads = 1;
    options_.consensusTimeout = util::Milliseconds(250);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(registry_->AddValidator(Identity(i), 10 * BASE_UNITS_PER_TOKEN,
                                            std::make_shared<DelayedClient>(100)));
    }
    auto manager = MakeManager();

    // Queried one after another the three answers would need 300 ms
    util::Timer timer;
    EXPECT_EQ(manager->CollectConfirmations(SignedTx(), registry_->GetValidators()), 3u);
    EXPECT_LT(timer.ElapsedMillis(), 250);

    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
}

TEST_F(ConsensusTest, AbandonedQueriesDoNotStarveNextRound) {
    options_.validatorThreads = 1;
    AddValidators(3, 0);
    auto slow = std::make_shared<SlowClient>();
    ASSERT_TRUE(registry_->AddValidator(Identity(3), BASE_UNITS_PER_TOKEN, slow));
    auto manager = MakeManager();

    // The slow query outlives each round and keeps its worker busy
    util::Timer timer;
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
    EXPECT_TRUE(manager->ValidateTransaction(SignedTx()));
    EXPECT_LT(timer.ElapsedMillis(), 1500);
    slow->released.store(true);
}

TEST_F(ConsensusTest, CollectConfirmationsDirect) {
    AddValidators(2, 3);
    auto manager = MakeManager();
    auto validators = registry_->GetValidators();

    // Quorum is unreachable once the three refusals arrive, so the count
    // seen at close is at most the two confirmations
    EXPECT_LE(manager->CollectConfirmations(SignedTx(), validators), 2u);
    EXPECT_EQ(manager->CollectConfirmations(SignedTx(), {}), 0u);
}

// ============================================================================
// State
// ============================================================================

TEST_F(ConsensusTest, StateTracksRounds) {
    AddValidators(3, 0);
    auto manager = MakeManager();

    ConsensusState initial = manager->GetState();
    EXPECT_TRUE(initial.lastBlockHash.IsNull());
    EXPECT_EQ(initial.lastConsensus, 0);
    EXPECT_EQ(initial.consensusTimeout.count(), 2000);

    Transaction tx = SignedTx();
    now_.store(NOW + 10);
    ASSERT_TRUE(manager->ValidateTransaction(tx));

    ConsensusState state = manager->GetState();
    crypto::SHA256 hasher;
    hasher.Write(initial.lastBlockHash).Write(tx.GetHash());
    EXPECT_EQ(state.lastBlockHash, hasher.Finalize());
    EXPECT_EQ(state.lastConsensus, NOW + 10);
    EXPECT_EQ(state.validators.size(), 3u);
    EXPECT_EQ(state.roundsAccepted, 1u);
    EXPECT_EQ(state.roundsRejected, 0u);

    Transaction stale = SignedTx(0);
    EXPECT_FALSE(manager->ValidateTransaction(stale));
    ConsensusState after = manager->GetState();
    EXPECT_EQ(after.lastBlockHash, state.lastBlockHash);
    EXPECT_EQ(after.lastConsensus, NOW + 10);
    EXPECT_EQ(after.roundsRejected, 1u);
}

TEST_F(ConsensusTest, RejectionLeavesHashChain) {
    AddValidators(1, 2);
    auto manager = MakeManager();
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));

    ConsensusState state = manager->GetState();
    EXPECT_TRUE(state.lastBlockHash.IsNull());
    EXPECT_EQ(state.validators.size(), 3u);
}

TEST_F(ConsensusTest, ValidatorSetIsReadPerRound) {
    AddValidators(3, 0);
    auto manager = MakeManager();
    ASSERT_TRUE(manager->ValidateTransaction(SignedTx()));

    AddValidators(0, 3);
    EXPECT_FALSE(manager->ValidateTransaction(SignedTx()));
    EXPECT_EQ(manager->GetState().validators.size(), 6u);
}

} // namespace test
} // namespace dadbs
