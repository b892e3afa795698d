#ifndef CANDLE_AUCTION_EVENT_HPP
#define CANDLE_AUCTION_EVENT_HPP

#include "AuctionTypes.hpp"
#include <optional>
#include <string>

using namespace std;

namespace candle {

    // ============================================================
    //  TIPOS DE EVENTO
    // ============================================================
    enum class EventType : uint8_t {
        BID_PLACED       = 1,
        AUCTION_FINALIZED= 2,
        PRIZE_GRANTED    = 3,
        FUNDS_RELEASED   = 4
    };

    /**
     * @brief Entry of the auction journal. Fields not meaningful for a type keep
     * their defaults.
     */
    struct AuctionEvent {
        EventType type = EventType::BID_PLACED;
        Tick block = 0;
        optional<AccountId> account;   // pujador, ganador o receptor
        Balance amount = 0;            // saldo tras la puja, puja ganadora o fondos liberados
        optional<Sample> sample;       // bloque del Ending period, si aplica
    };

    /** Convierte un EventType en string (util para logs) */
    string eventTypeToString(EventType type);

    /** Linea legible de un evento, p.ej. "BID_PLACED block=7 account=... amount=150 sample=1" */
    string describeEvent(const AuctionEvent& event);

} // namespace candle

#endif // CANDLE_AUCTION_EVENT_HPP
