#ifndef CANDLE_AUCTION_ERROR_HPP
#define CANDLE_AUCTION_ERROR_HPP

#include <stdexcept>
#include <string>
#include <cstdint>

using namespace std;

namespace candle {

    enum class AuctionError : uint8_t {
        NotInBiddingPhase,
        ZeroAmount,
        Overflow,
        RandomnessNotReady,
        AlreadyFinalized,
        AlreadyClaimed,
        DelegateFailure,
        InvalidConfiguration,
        NotFinalized,
        OutOfOrderCall,
        InvalidAccount,
        TransferFailure
    };

    string auctionErrorToString(AuctionError error);

    /**
     * @class AuctionException
     * @brief Error raised by every auction command. The engine state is left
     * exactly as it was before the failing call.
     */
    class AuctionException : public runtime_error {
    public:
        AuctionException(AuctionError error, const string& detail);

        AuctionError error() const noexcept { return error_; }

        /**
         * @brief Only DelegateFailure and TransferFailure are meant to be retried
         * by the caller once the external problem is resolved.
         */
        bool isRetryable() const noexcept;

    private:
        AuctionError error_;
    };

} // namespace candle

#endif // CANDLE_AUCTION_ERROR_HPP
