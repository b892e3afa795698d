#include "BalanceLedger.hpp"
#include "AuctionError.hpp"
#include <limits>

namespace candle {

    optional<Balance> BalanceLedger::projected(const AccountId& bidder, Balance amount) const {
        Balance current = get(bidder);
        if (amount > numeric_limits<Balance>::max() - current) {
            return nullopt;
        }
        return current + amount;
    }

    Balance BalanceLedger::increment(const AccountId& bidder, Balance amount) {
        if (settled.count(bidder)) {
            throw AuctionException(AuctionError::AlreadyClaimed, "account " + bidder + " was already settled");
        }

        optional<Balance> total = projected(bidder, amount);
        if (!total) {
            throw AuctionException(AuctionError::Overflow,
                "balance of " + bidder + " cannot grow by " + to_string(amount));
        }

        balances[bidder] = *total;

        if (!topBid || *total > topBid->second) {
            topBid = make_pair(bidder, *total);
        }

        return *total;
    }

    Balance BalanceLedger::get(const AccountId& bidder) const {
        auto it = balances.find(bidder);
        return it == balances.end() ? 0 : it->second;
    }

    Balance BalanceLedger::settle(const AccountId& bidder) {
        if (settled.count(bidder)) {
            throw AuctionException(AuctionError::AlreadyClaimed, "account " + bidder + " was already settled");
        }

        Balance held = 0;
        auto it = balances.find(bidder);
        if (it != balances.end()) {
            held = it->second;
            balances.erase(it);
        }
        settled.insert(bidder);
        return held;
    }

    optional<pair<AccountId, Balance>> BalanceLedger::top() const {
        return topBid;
    }

} // namespace candle
