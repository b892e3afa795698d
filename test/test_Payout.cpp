#include <gtest/gtest.h>
#include "AuctionStateMachine.hpp"
#include "AuctionTestDoubles.hpp"
#include <functional>
#include <memory>

class PayoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoUtils::initialize()) << "Failed to initialize libsodium";
        alice = testAccount("alice");
        bob = testAccount("bob");
        owner = testAccount("owner");
    }

    AuctionStateMachine& makeAuction(const AuctionConfig& config = defaultTestConfig()) {
        auction = std::make_unique<AuctionStateMachine>(config, 0, entropy, delegate, funds);
        auction->setVerbose(false);
        return *auction;
    }

    // Alice 100 en apertura y 50 en la muestra 1, Bob 120 en la muestra 2.
    // La muestra 1 gana: Alice con 150.
    AuctionStateMachine& runChangeScenario() {
        AuctionStateMachine& a = makeAuction();
        a.placeBid(alice, 100, 1);
        a.placeBid(alice, 50, 7);
        a.placeBid(bob, 120, 8);
        entropy.values = {1};
        a.finalize(13);
        return a;
    }

    AuctionError errorOf(const std::function<void()>& call) {
        try {
            call();
        } catch (const AuctionException& e) {
            return e.error();
        }
        ADD_FAILURE() << "expected AuctionException";
        return AuctionError::InvalidConfiguration;
    }

    ScriptedEntropy entropy;
    RecordingDelegate delegate;
    RecordingFunds funds;
    std::unique_ptr<AuctionStateMachine> auction;

    AccountId alice;
    AccountId bob;
    AccountId owner;
};

// ------------------- Liquidacion basica -------------------
TEST_F(PayoutTest, WinnerOwnerAndLoserAreSettled) {
    AuctionStateMachine& a = runChangeScenario();
    ASSERT_EQ(a.getWinner(), alice);
    ASSERT_EQ(a.winnerRecord()->winningAmount, 150u);

    PayoutReceipt winner = a.payout(alice, 14);
    EXPECT_TRUE(winner.prizeGranted);
    EXPECT_EQ(winner.refund, 0u);
    EXPECT_EQ(winner.proceeds, 0u);
    EXPECT_EQ(funds.totalTo(alice), 0u);
    ASSERT_EQ(delegate.grants.size(), 1u);
    EXPECT_EQ(delegate.grants[0].first, alice);
    EXPECT_EQ(delegate.grants[0].second, Subject::AssetCollection);

    PayoutReceipt loser = a.payout(bob, 15);
    EXPECT_FALSE(loser.prizeGranted);
    EXPECT_EQ(loser.refund, 120u);
    EXPECT_EQ(funds.totalTo(bob), 120u);

    PayoutReceipt proceeds = a.payout(owner, 16);
    EXPECT_FALSE(proceeds.prizeGranted);
    EXPECT_EQ(proceeds.refund, 0u);
    EXPECT_EQ(proceeds.proceeds, 150u);
    EXPECT_EQ(funds.totalTo(owner), 150u);

    EXPECT_TRUE(a.isClaimed(alice));
    EXPECT_TRUE(a.isClaimed(bob));
    EXPECT_TRUE(a.isClaimed(owner));
    EXPECT_EQ(a.balanceOf(bob), 0u);
    EXPECT_EQ(delegate.grants.size(), 1u);
}

TEST_F(PayoutTest, WinnerGetsChangeAboveWinningBid) {
    AuctionStateMachine& a = makeAuction();
    a.placeBid(alice, 100, 7);  // muestra 1
    a.placeBid(alice, 30, 10);  // muestra 4
    entropy.values = {1};
    a.finalize(13);

    PayoutReceipt receipt = a.payout(alice, 13);
    EXPECT_TRUE(receipt.prizeGranted);
    EXPECT_EQ(receipt.refund, 30u);
    EXPECT_EQ(funds.totalTo(alice), 30u);
    EXPECT_EQ(a.payout(owner, 13).proceeds, 100u);
}

TEST_F(PayoutTest, NoWinnerRefundsEverybody) {
    AuctionStateMachine& a = makeAuction();
    a.placeBid(alice, 100, 2);
    a.placeBid(bob, 70, 3);
    entropy.values = {0};
    a.finalize(13);
    ASSERT_FALSE(a.getWinner().has_value());

    EXPECT_EQ(a.payout(alice, 13).refund, 100u);
    EXPECT_EQ(a.payout(bob, 13).refund, 70u);

    PayoutReceipt nothing = a.payout(owner, 13);
    EXPECT_EQ(nothing.total(), 0u);
    EXPECT_TRUE(delegate.grants.empty());
    EXPECT_EQ(delegate.attempts, 0);
    EXPECT_EQ(funds.totalTo(owner), 0u);
}

TEST_F(PayoutTest, OwnerWhoBidGetsRefundAndProceeds) {
    AuctionStateMachine& a = makeAuction();
    a.placeBid(owner, 40, 2);
    a.placeBid(alice, 150, 7);
    entropy.values = {1};
    a.finalize(13);

    PayoutReceipt receipt = a.payout(owner, 13);
    EXPECT_EQ(receipt.refund, 40u);
    EXPECT_EQ(receipt.proceeds, 150u);
    EXPECT_EQ(funds.totalTo(owner), 190u);
    ASSERT_EQ(funds.transfers.size(), 1u);
}

TEST_F(PayoutTest, OwnerWinningOwnAuctionGetsEverythingBack) {
    AuctionStateMachine& a = makeAuction();
    a.placeBid(owner, 80, 8);
    entropy.values = {3};
    a.finalize(13);

    PayoutReceipt receipt = a.payout(owner, 13);
    EXPECT_TRUE(receipt.prizeGranted);
    EXPECT_EQ(receipt.total(), 80u);
}

TEST_F(PayoutTest, BystanderSettlesWithNothing) {
    AuctionStateMachine& a = runChangeScenario();
    AccountId bystander = testAccount("bystander");

    PayoutReceipt receipt = a.payout(bystander, 13);
    EXPECT_EQ(receipt.total(), 0u);
    EXPECT_TRUE(a.isClaimed(bystander));
    EXPECT_TRUE(funds.transfers.empty());
}

// ------------------- Rechazos -------------------
TEST_F(PayoutTest, PayoutBeforeFinalizeRejected) {
    AuctionStateMachine& a = makeAuction();
    a.placeBid(alice, 100, 2);
    EXPECT_EQ(errorOf([&] { a.payout(alice, 13); }), AuctionError::NotFinalized);
    EXPECT_EQ(a.balanceOf(alice), 100u);
}

TEST_F(PayoutTest, SecondPayoutRejected) {
    AuctionStateMachine& a = runChangeScenario();
    a.payout(bob, 14);
    EXPECT_EQ(errorOf([&] { a.payout(bob, 15); }), AuctionError::AlreadyClaimed);
    EXPECT_EQ(funds.totalTo(bob), 120u);

    a.payout(alice, 15);
    EXPECT_EQ(errorOf([&] { a.payout(alice, 16); }), AuctionError::AlreadyClaimed);
    EXPECT_EQ(delegate.grants.size(), 1u);
}

TEST_F(PayoutTest, MalformedOrLateCallsRejected) {
    AuctionStateMachine& a = runChangeScenario();
    EXPECT_EQ(errorOf([&] { a.payout("bob", 14); }), AuctionError::InvalidAccount);
    EXPECT_EQ(errorOf([&] { a.payout(bob, 12); }), AuctionError::OutOfOrderCall);
    EXPECT_FALSE(a.isClaimed(bob));
}

// ------------------- Fallos reintentables -------------------
TEST_F(PayoutTest, RefusedGrantCanBeRetried) {
    AuctionStateMachine& a = runChangeScenario();
    delegate.accept = false;

    try {
        a.payout(alice, 14);
        FAIL() << "expected delegate failure";
    } catch (const AuctionException& e) {
        EXPECT_EQ(e.error(), AuctionError::DelegateFailure);
        EXPECT_TRUE(e.isRetryable());
    }
    EXPECT_FALSE(a.isClaimed(alice));
    EXPECT_EQ(a.balanceOf(alice), 150u);

    delegate.accept = true;
    PayoutReceipt receipt = a.payout(alice, 15);
    EXPECT_TRUE(receipt.prizeGranted);
    EXPECT_EQ(delegate.attempts, 2);
    EXPECT_EQ(delegate.grants.size(), 1u);
}

TEST_F(PayoutTest, FailedTransferDoesNotGrantTwice) {
    AuctionStateMachine& a = makeAuction();
    a.placeBid(alice, 100, 7);
    a.placeBid(alice, 30, 10);
    entropy.values = {1};
    a.finalize(13);

    funds.accept = false;
    EXPECT_EQ(errorOf([&] { a.payout(alice, 13); }), AuctionError::TransferFailure);
    EXPECT_EQ(delegate.grants.size(), 1u);
    EXPECT_FALSE(a.isClaimed(alice));
    EXPECT_EQ(a.balanceOf(alice), 130u);

    funds.accept = true;
    PayoutReceipt receipt = a.payout(alice, 14);
    EXPECT_TRUE(receipt.prizeGranted);
    EXPECT_EQ(receipt.refund, 30u);
    EXPECT_EQ(delegate.grants.size(), 1u);
    EXPECT_EQ(delegate.attempts, 1);
    EXPECT_EQ(funds.totalTo(alice), 30u);
}

TEST_F(PayoutTest, DomainAuctionGrantsDomain) {
    AuctionConfig config = defaultTestConfig();
    config.subject = Subject::NamedDomain;
    config.domainName = "candle.dot";
    AuctionStateMachine& a = makeAuction(config);
    EXPECT_EQ(a.subject().domainHash, CryptoUtils::sha256Bytes(std::string("candle.dot")));

    a.placeBid(bob, 10, 6);
    entropy.values = {2};
    a.finalize(13);
    a.payout(bob, 13);

    ASSERT_EQ(delegate.grants.size(), 1u);
    EXPECT_EQ(delegate.grants[0].second, Subject::NamedDomain);
}

// ------------------- Escrow real -------------------
TEST_F(PayoutTest, EscrowIsDrainedBySettlement) {
    EscrowAccount escrow;
    AuctionStateMachine a(defaultTestConfig(), 0, entropy, delegate, escrow);
    a.setVerbose(false);

    a.placeBid(alice, 100, 1);
    ASSERT_TRUE(escrow.deposit(100));
    a.placeBid(alice, 50, 7);
    ASSERT_TRUE(escrow.deposit(50));
    a.placeBid(bob, 120, 8);
    ASSERT_TRUE(escrow.deposit(120));

    entropy.values = {1};
    a.finalize(13);
    a.payout(alice, 13);
    a.payout(bob, 13);
    a.payout(owner, 13);

    EXPECT_EQ(escrow.balance(), 0u);
    EXPECT_EQ(escrow.creditedTo(bob), 120u);
    EXPECT_EQ(escrow.creditedTo(owner), 150u);
}

TEST_F(PayoutTest, FrozenEscrowReportsTransferFailure) {
    EscrowAccount escrow;
    AuctionStateMachine a(defaultTestConfig(), 0, entropy, delegate, escrow);
    a.setVerbose(false);
    a.placeBid(bob, 120, 8);
    ASSERT_TRUE(escrow.deposit(120));
    entropy.values = {4};
    a.finalize(13);

    escrow.setFrozen(true);
    EXPECT_EQ(errorOf([&] { a.payout(owner, 13); }), AuctionError::TransferFailure);
    escrow.setFrozen(false);
    EXPECT_EQ(a.payout(owner, 13).proceeds, 120u);
    EXPECT_EQ(escrow.balance(), 0u);
}
