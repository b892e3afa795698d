#include "AuctionEvent.hpp"
#include <sstream>

namespace candle {

    string eventTypeToString(EventType type) {
        switch (type) {
            case EventType::BID_PLACED:        return "BID_PLACED";
            case EventType::AUCTION_FINALIZED: return "AUCTION_FINALIZED";
            case EventType::PRIZE_GRANTED:     return "PRIZE_GRANTED";
            case EventType::FUNDS_RELEASED:    return "FUNDS_RELEASED";
            default: return "UNKNOWN";
        }
    }

    string describeEvent(const AuctionEvent& event) {
        stringstream ss;
        ss << eventTypeToString(event.type) << " block=" << event.block
           << " account=" << event.account.value_or("none")
           << " amount=" << event.amount;
        if (event.sample) {
            ss << " sample=" << *event.sample;
        }
        return ss.str();
    }

} // namespace candle
