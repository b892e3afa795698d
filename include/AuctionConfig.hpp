#ifndef CANDLE_AUCTION_CONFIG_HPP
#define CANDLE_AUCTION_CONFIG_HPP

#include "AuctionTypes.hpp"
#include <string>
#include <optional>

using namespace std;

namespace candle {

    /**
     * @brief Parameters of one auction. Immutable once the auction is created.
     *
     * The Opening period covers [startTime, startTime + openingDuration) and the Ending
     * period the following endingDuration blocks. Sample k of the Ending period is block
     * endingStart() + k.
     */
    struct AuctionConfig {
        optional<Tick> startTime;           // por defecto, el bloque siguiente a la creacion
        Tick openingDuration = 0;
        Tick endingDuration = 0;
        Tick rfDelay = DEFAULT_RF_DELAY;
        Subject subject = Subject::AssetCollection;
        string domainName;                  // obligatorio si subject == NamedDomain
        AccountId rewardContract;
        AccountId owner;

        Tick start() const { return startTime.value_or(0); }
        Tick endingStart() const { return start() + openingDuration; }
        Tick endingEnd() const { return endingStart() + endingDuration; }
        Tick randomnessReadyAt() const { return endingEnd() + rfDelay; }
    };

    /**
     * The function `resolveConfig` validates `config` for an auction created at block `createdAt`
     * and fills in the default start block.
     *
     * @return The validated configuration with `startTime` set.
     * @throws AuctionException(InvalidConfiguration) when a duration or the delay is zero, the start
     * block is not in the future, the schedule overflows, an address is malformed, a domain auction
     * has no domain or the subject is one of the reserved values.
     */
    AuctionConfig resolveConfig(const AuctionConfig& config, Tick createdAt);

} // namespace candle

#endif // CANDLE_AUCTION_CONFIG_HPP
