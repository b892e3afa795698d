#include "AuctionConfig.hpp"
#include "AuctionError.hpp"
#include "CryptoUtils.hpp"
#include <limits>

namespace candle {

    namespace {
        void reject(const string& reason) {
            throw AuctionException(AuctionError::InvalidConfiguration, reason);
        }
    }

    AuctionConfig resolveConfig(const AuctionConfig& config, Tick createdAt) {
        AuctionConfig resolved = config;

        if (config.openingDuration == 0) reject("opening duration must be positive");
        if (config.endingDuration == 0) reject("ending duration must be positive");
        if (config.rfDelay == 0) reject("randomness delay must be positive");
        if (config.endingDuration > MAX_ENDING_SAMPLES) {
            reject("ending duration " + to_string(config.endingDuration) + " exceeds the limit of "
                   + to_string(MAX_ENDING_SAMPLES) + " samples");
        }

        if (!resolved.startTime) {
            if (createdAt == numeric_limits<Tick>::max()) reject("no block left to start the auction");
            resolved.startTime = createdAt + 1;
        }

        // Seguridad frente a backdating
        if (*resolved.startTime <= createdAt) {
            reject("auction can only be scheduled to future blocks (start "
                   + to_string(*resolved.startTime) + ", now " + to_string(createdAt) + ")");
        }

        const Tick maxTick = numeric_limits<Tick>::max();
        Tick start = *resolved.startTime;
        if (config.openingDuration > maxTick - start ||
            config.endingDuration > maxTick - start - config.openingDuration ||
            config.rfDelay > maxTick - start - config.openingDuration - config.endingDuration) {
            reject("auction schedule overflows the block counter");
        }

        switch (config.subject) {
            case Subject::AssetCollection:
                break;
            case Subject::NamedDomain:
                if (config.domainName.empty()) reject("domain name put up for auction must be specified");
                break;
            default:
                reject("only subjects [0,1] are supported, got " + subjectToString(config.subject));
        }

        if (!CryptoUtils::isValidAddress(config.owner)) reject("owner address is malformed");
        if (!CryptoUtils::isValidAddress(config.rewardContract)) reject("reward contract address is malformed");

        resolved.owner = CryptoUtils::normalizeAddress(config.owner);
        resolved.rewardContract = CryptoUtils::normalizeAddress(config.rewardContract);
        return resolved;
    }

} // namespace candle
