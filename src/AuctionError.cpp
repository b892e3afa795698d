#include "AuctionError.hpp"
#include "AuctionTypes.hpp"

namespace candle {

    string auctionErrorToString(AuctionError error) {
        switch (error) {
            case AuctionError::NotInBiddingPhase:    return "NotInBiddingPhase";
            case AuctionError::ZeroAmount:           return "ZeroAmount";
            case AuctionError::Overflow:             return "Overflow";
            case AuctionError::RandomnessNotReady:   return "RandomnessNotReady";
            case AuctionError::AlreadyFinalized:     return "AlreadyFinalized";
            case AuctionError::AlreadyClaimed:       return "AlreadyClaimed";
            case AuctionError::DelegateFailure:      return "DelegateFailure";
            case AuctionError::InvalidConfiguration: return "InvalidConfiguration";
            case AuctionError::NotFinalized:         return "NotFinalized";
            case AuctionError::OutOfOrderCall:       return "OutOfOrderCall";
            case AuctionError::InvalidAccount:       return "InvalidAccount";
            case AuctionError::TransferFailure:      return "TransferFailure";
            default: return "UNKNOWN";
        }
    }

    AuctionException::AuctionException(AuctionError error, const string& detail)
        : runtime_error(auctionErrorToString(error) + ": " + detail), error_(error) {}

    bool AuctionException::isRetryable() const noexcept {
        return error_ == AuctionError::DelegateFailure || error_ == AuctionError::TransferFailure;
    }

    string phaseToString(Phase phase) {
        switch (phase) {
            case Phase::NotStarted: return "NotStarted";
            case Phase::Opening:    return "Opening";
            case Phase::Ending:     return "Ending";
            case Phase::Finalizing: return "Finalizing";
            case Phase::Ended:      return "Ended";
            default: return "UNKNOWN";
        }
    }

    string subjectToString(Subject subject) {
        switch (subject) {
            case Subject::AssetCollection: return "AssetCollection";
            case Subject::NamedDomain:     return "NamedDomain";
            default: return "Reserved(" + to_string(static_cast<int>(subject)) + ")";
        }
    }

} // namespace candle
