#include <gtest/gtest.h>
#include "BalanceLedger.hpp"
#include "AuctionError.hpp"
#include <limits>

using namespace candle;

class BalanceLedgerTest : public ::testing::Test {
protected:
    BalanceLedger ledger;
    AccountId alice = "a11ce00000000000000000000000000000000001";
    AccountId bob = "b0b0000000000000000000000000000000000002";
};

// ------------------- Incrementos -------------------
TEST_F(BalanceLedgerTest, UnseenAccountHasZeroBalance) {
    EXPECT_EQ(ledger.get(alice), 0u);
    EXPECT_FALSE(ledger.top().has_value());
}

TEST_F(BalanceLedgerTest, IncrementsAddUp) {
    EXPECT_EQ(ledger.increment(alice, 100), 100u);
    EXPECT_EQ(ledger.increment(alice, 25), 125u);
    EXPECT_EQ(ledger.get(alice), 125u);
}

TEST_F(BalanceLedgerTest, ProjectedDoesNotMutate) {
    ledger.increment(alice, 10);
    auto projected = ledger.projected(alice, 5);
    ASSERT_TRUE(projected.has_value());
    EXPECT_EQ(*projected, 15u);
    EXPECT_EQ(ledger.get(alice), 10u);
}

TEST_F(BalanceLedgerTest, OverflowIsRejectedAndLeavesBalance) {
    const Balance max = std::numeric_limits<Balance>::max();
    ledger.increment(alice, max - 10);

    EXPECT_FALSE(ledger.projected(alice, 11).has_value());
    try {
        ledger.increment(alice, 11);
        FAIL() << "expected overflow";
    } catch (const AuctionException& e) {
        EXPECT_EQ(e.error(), AuctionError::Overflow);
    }
    EXPECT_EQ(ledger.get(alice), max - 10);

    // Llegar exactamente al maximo si es valido
    EXPECT_EQ(ledger.increment(alice, 10), max);
}

// ------------------- Top bid -------------------
TEST_F(BalanceLedgerTest, TopTracksHighestBalance) {
    ledger.increment(alice, 100);
    ledger.increment(bob, 120);
    ASSERT_TRUE(ledger.top().has_value());
    EXPECT_EQ(ledger.top()->first, bob);
    EXPECT_EQ(ledger.top()->second, 120u);

    ledger.increment(alice, 50);
    EXPECT_EQ(ledger.top()->first, alice);
    EXPECT_EQ(ledger.top()->second, 150u);
}

TEST_F(BalanceLedgerTest, TopKeepsFirstOnTie) {
    ledger.increment(alice, 100);
    ledger.increment(bob, 100);
    EXPECT_EQ(ledger.top()->first, alice);
}

// ------------------- Liquidacion -------------------
TEST_F(BalanceLedgerTest, SettleTakesBalanceOnce) {
    ledger.increment(alice, 70);
    ledger.increment(bob, 30);

    EXPECT_EQ(ledger.settle(alice), 70u);
    EXPECT_EQ(ledger.get(alice), 0u);
    EXPECT_EQ(ledger.get(bob), 30u);

    EXPECT_THROW(ledger.settle(alice), AuctionException);
    EXPECT_THROW(ledger.increment(alice, 1), AuctionException);
}

TEST_F(BalanceLedgerTest, SettleUnseenAccountYieldsZero) {
    EXPECT_EQ(ledger.settle(bob), 0u);
    EXPECT_THROW(ledger.settle(bob), AuctionException);
}
