#ifndef CANDLE_BALANCE_LEDGER_HPP
#define CANDLE_BALANCE_LEDGER_HPP

#include "AuctionTypes.hpp"
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include <utility>

using namespace std;

namespace candle {

    /**
     * @class BalanceLedger
     * @brief Escrowed balance per bidder. A bidder's balance is her top bid: the
     * sum of every amount she has sent. Balances only grow until the single
     * settlement of that bidder.
     */
    class BalanceLedger {
    public:
        BalanceLedger() = default;

        /**
         * The function `increment` adds `amount` to the bidder's balance and returns the new total.
         *
         * @param bidder Account placing the bid.
         * @param amount Amount transferred with the bid.
         *
         * @return The bidder's balance after the increment.
         * @throws AuctionException(Overflow) if the sum does not fit in a Balance; the ledger is left
         * unchanged in that case.
         * @throws AuctionException(AlreadyClaimed) if the bidder was already settled.
         */
        Balance increment(const AccountId& bidder, Balance amount);

        /**
         * The function `projected` returns the balance the bidder would have after adding `amount`,
         * without touching the ledger.
         *
         * @return The projected total, or nullopt if it would overflow.
         */
        optional<Balance> projected(const AccountId& bidder, Balance amount) const;

        /**
         * @return The bidder's balance, 0 for unseen or settled accounts.
         */
        Balance get(const AccountId& bidder) const;

        /**
         * The function `settle` takes the bidder's balance out of the ledger. It can succeed only once
         * per account for the lifetime of the auction.
         *
         * @return The balance held before settlement (may be 0 for accounts that never bid).
         * @throws AuctionException(AlreadyClaimed) on a second settlement.
         */
        Balance settle(const AccountId& bidder);

        /**
         * @brief Highest balance seen so far and its holder. On ties the account that
         * reached the amount first keeps the top spot.
         */
        optional<pair<AccountId, Balance>> top() const;

    private:
        unordered_map<AccountId, Balance> balances;
        unordered_set<AccountId> settled;
        optional<pair<AccountId, Balance>> topBid;
    };

} // namespace candle

#endif // CANDLE_BALANCE_LEDGER_HPP
