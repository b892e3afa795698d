#include "FundsTransfer.hpp"
#include <iostream>
#include <limits>

namespace candle {

    bool EscrowAccount::deposit(Balance amount) {
        if (amount > numeric_limits<Balance>::max() - held) {
            cerr << "Error: escrow deposit of " << amount << " overflows" << endl;
            return false;
        }
        held += amount;
        return true;
    }

    bool EscrowAccount::transfer(const AccountId& to, Balance amount) {
        if (frozen) {
            cerr << "Error: escrow frozen, cannot release " << amount << " to " << to << endl;
            return false;
        }
        if (amount > held) {
            cerr << "Error: escrow holds " << held << ", cannot release " << amount << endl;
            return false;
        }

        Balance& account = credited[to];
        if (amount > numeric_limits<Balance>::max() - account) {
            cerr << "Error: credit to " << to << " overflows" << endl;
            return false;
        }

        held -= amount;
        account += amount;
        return true;
    }

    Balance EscrowAccount::creditedTo(const AccountId& account) const {
        auto it = credited.find(account);
        return it == credited.end() ? 0 : it->second;
    }

} // namespace candle
