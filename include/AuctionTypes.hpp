#ifndef CANDLE_AUCTION_TYPES_HPP
#define CANDLE_AUCTION_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <optional>

using namespace std;

namespace candle {

    // ============================================================
    //  TIPOS BASICOS
    // ============================================================
    using Tick      = uint64_t;   // numero de bloque
    using Balance   = uint64_t;   // unidades minimas de la moneda
    using Sample    = uint64_t;   // indice de bloque dentro del Ending period
    using AccountId = string;     // direccion hex de 40 caracteres

    // ============================================================
    //  CONSTANTES DEL PROTOCOLO
    // ============================================================
    inline constexpr Tick     DEFAULT_RF_DELAY = 2;           // bloques tras el Ending antes de pedir aleatoriedad
    inline constexpr Tick     MAX_ENDING_SAMPLES = 1 << 20;   // limite del historial de muestras en memoria
    inline constexpr size_t   ADDRESS_SIZE = 20;              // bytes
    inline constexpr size_t   ADDRESS_HEX_LENGTH = 40;        // caracteres
    inline constexpr size_t   SHA256_HASH_SIZE = 32;
    inline constexpr size_t   ENTROPY_SEED_SIZE = 32;

    // Cross-contract reward calls
    inline constexpr uint32_t REWARD_CALL_MAGIC = 0xCA4D1E01;
    inline constexpr uint8_t  REWARD_CALL_VERSION = 1;
    inline constexpr uint32_t SELECTOR_SET_APPROVAL_FOR_ALL = 0xFEEDBABE;
    inline constexpr uint32_t SELECTOR_TRANSFER_DOMAIN = 0xFEEDDEED;
    inline constexpr size_t   MAX_REWARD_CALL_PAYLOAD = 64 * 1024;

    // ============================================================
    //  FASES Y SUJETOS
    // ============================================================
    enum class Phase : uint8_t {
        NotStarted = 0,
        Opening    = 1,
        Ending     = 2,
        Finalizing = 3,   // ventana cerrada, ganador aun sin resolver
        Ended      = 4
    };

    /**
     * What is being auctioned. Values 2..255 are reserved for further reward
     * methods and are rejected when the auction is configured.
     */
    enum class Subject : uint8_t {
        AssetCollection = 0,
        NamedDomain     = 1
    };

    struct SampleSlot {
        optional<AccountId> leader;
        Balance amount = 0;

        bool operator==(const SampleSlot& other) const {
            return leader == other.leader && amount == other.amount;
        }
    };

    /** Set exactly once, by finalize(). */
    struct WinnerRecord {
        Sample winningSample = 0;
        optional<AccountId> winner;
        Balance winningAmount = 0;
    };

    struct PayoutRecord {
        bool prizeGranted = false;  // el delegate ya entrego el premio
        bool claimed = false;
    };

    struct PayoutReceipt {
        AccountId account;
        bool prizeGranted = false;
        Balance refund = 0;
        Balance proceeds = 0;

        Balance total() const { return refund + proceeds; }
    };

    string phaseToString(Phase phase);
    string subjectToString(Subject subject);

} // namespace candle

#endif // CANDLE_AUCTION_TYPES_HPP
