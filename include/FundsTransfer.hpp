#ifndef CANDLE_FUNDS_TRANSFER_HPP
#define CANDLE_FUNDS_TRANSFER_HPP

#include "AuctionTypes.hpp"
#include <unordered_map>

using namespace std;

namespace candle {

    /**
     * @class FundsTransfer
     * @brief Releases escrowed funds held by the auction to an account.
     */
    class FundsTransfer {
    public:
        virtual ~FundsTransfer() = default;

        /**
         * @return false if the transfer could not be made; no funds moved in that case
         */
        virtual bool transfer(const AccountId& to, Balance amount) = 0;
    };

    /**
     * @class EscrowAccount
     * @brief In-memory escrow: bids are deposited into it and payouts credited out of it.
     */
    class EscrowAccount : public FundsTransfer {
    public:
        EscrowAccount() = default;

        /**
         * @brief Adds funds received with a bid.
         * @return false if the escrow balance would overflow
         */
        bool deposit(Balance amount);

        /**
         * @brief Moves `amount` from the escrow to `to`. Fails when the escrow is frozen
         * or does not hold enough funds.
         */
        bool transfer(const AccountId& to, Balance amount) override;

        Balance balance() const { return held; }
        Balance creditedTo(const AccountId& account) const;

        /** A frozen escrow rejects every transfer. */
        void setFrozen(bool frozen) { this->frozen = frozen; }

    private:
        Balance held = 0;
        bool frozen = false;
        unordered_map<AccountId, Balance> credited;
    };

} // namespace candle

#endif // CANDLE_FUNDS_TRANSFER_HPP
