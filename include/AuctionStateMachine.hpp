#ifndef CANDLE_AUCTION_STATE_MACHINE_HPP
#define CANDLE_AUCTION_STATE_MACHINE_HPP

#include "AuctionTypes.hpp"
#include "AuctionConfig.hpp"
#include "AuctionError.hpp"
#include "AuctionEvent.hpp"
#include "BalanceLedger.hpp"
#include "SampleHistory.hpp"
#include "EntropySource.hpp"
#include "RewardDelegate.hpp"
#include "FundsTransfer.hpp"
#include <unordered_map>
#include <optional>
#include <vector>
#include <utility>

using namespace std;

namespace candle {

    /**
     * @class AuctionStateMachine
     * @brief Candle auction: bids are collected during the Opening and Ending periods, then a
     * random sample of the Ending period is drawn and whoever led at that sample wins.
     *
     * Calls are applied one at a time, in the order received. Time is never read from a clock:
     * every command receives the current block. A command either commits all its effects or
     * throws AuctionException and commits nothing.
     *
     * The entropy source, reward delegate and funds transfer are borrowed and must outlive the
     * auction.
     */
    class AuctionStateMachine {
    public:

        /**
         * The AuctionStateMachine constructor validates the configuration for an auction created at
         * block `createdAt` and prepares an empty ledger and sample history.
         *
         * @param config Auction parameters; `startTime` defaults to `createdAt + 1`.
         * @param createdAt Block in which the auction is created.
         * @param entropy Randomness oracle used once by finalize().
         * @param reward Delegate that hands the prize to the winner.
         * @param funds Escrow releasing refunds and the owner's proceeds.
         *
         * @throws AuctionException(InvalidConfiguration) if the configuration is rejected.
         */
        AuctionStateMachine(const AuctionConfig& config, Tick createdAt,
                            EntropySource& entropy, RewardDelegate& reward, FundsTransfer& funds);

        // ==== COMANDOS ====

        /**
         * The function `placeBid` adds `amount` to the bidder's balance. During the Ending period the
         * new balance also takes over the current sample (and any later materialized one) when it is
         * strictly higher than the amount leading there.
         *
         * @return The bidder's balance after the bid.
         * @throws AuctionException NotInBiddingPhase, ZeroAmount, InvalidAccount, OutOfOrderCall or
         * Overflow.
         */
        Balance placeBid(const AccountId& bidder, Balance amount, Tick currentTime);

        /**
         * The function `finalize` draws the closing sample and records the winner. It can succeed only
         * once, and only `rfDelay` blocks after the Ending period closed.
         *
         * @return The winner record. A record without winner is a valid outcome.
         * @throws AuctionException AlreadyFinalized, RandomnessNotReady or OutOfOrderCall.
         */
        WinnerRecord finalize(Tick currentTime);

        /**
         * The function `payout` settles `caller` once the winner is known: the winner gets the prize
         * and her change, the owner gets the winning bid, everybody else gets a full refund.
         *
         * @return What was granted and transferred.
         * @throws AuctionException NotFinalized, AlreadyClaimed, InvalidAccount, OutOfOrderCall,
         * Overflow, or the retryable DelegateFailure and TransferFailure.
         */
        PayoutReceipt payout(const AccountId& caller, Tick currentTime);

        // ==== CONSULTAS ====

        Phase getStatus(Tick currentTime) const;

        /** Sample index of `currentTime` while inside the Ending period. */
        optional<Sample> currentSample(Tick currentTime) const;

        /**
         * @brief The recorded winner once finalized, otherwise the running top bid.
         */
        pair<optional<AccountId>, Balance> getWinning(Tick currentTime) const;

        /** Winner, only once the auction has been finalized. */
        optional<AccountId> getWinner() const;

        Balance balanceOf(const AccountId& account) const;
        bool isClaimed(const AccountId& account) const;

        const optional<WinnerRecord>& winnerRecord() const { return winner; }
        const SampleHistory& sampleHistory() const { return history; }
        const vector<AuctionEvent>& events() const { return journal; }
        const AuctionConfig& config() const { return settings; }
        const SubjectDescriptor& subject() const { return descriptor; }

        void setVerbose(bool verbose) { this->verbose = verbose; }

    private:
        AuctionConfig settings;
        SubjectDescriptor descriptor;

        EntropySource& entropy;
        RewardDelegate& reward;
        FundsTransfer& funds;

        BalanceLedger ledger;
        SampleHistory history;
        optional<WinnerRecord> winner;
        unordered_map<AccountId, PayoutRecord> payouts;
        vector<AuctionEvent> journal;

        optional<Tick> lastCallAt;
        bool verbose = true;

        AccountId checkedAccount(const AccountId& account) const;
        void checkCallOrder(Tick currentTime) const;
        void emit(EventType type, Tick block, optional<AccountId> account, Balance amount,
                  optional<Sample> sample = nullopt);

        bool grantPrize(const AccountId& to);
        bool releaseFunds(const AccountId& to, Balance amount);
    };

} // namespace candle

#endif // CANDLE_AUCTION_STATE_MACHINE_HPP
