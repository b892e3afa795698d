#ifndef CANDLE_ENTROPY_SOURCE_HPP
#define CANDLE_ENTROPY_SOURCE_HPP

#include "AuctionTypes.hpp"
#include <vector>
#include <cstdint>

using namespace std;

namespace candle {

    /**
     * @class EntropySource
     * @brief Randomness oracle consumed once per auction, at finalization.
     */
    class EntropySource {
    public:
        virtual ~EntropySource() = default;

        /**
         * @brief Produces a random integer whose seed was fixed strictly after `referenceTime`.
         * @param referenceTime Block after which the randomness must be unpredictable
         * @param out Receives the random value on success
         * @return false if the randomness for `referenceTime` is not available yet
         */
        virtual bool random(Tick referenceTime, uint64_t& out) = 0;
    };

    /**
     * @class SeededEntropySource
     * @brief Hash based source: SHA-256(seed | referenceTime | counter) with libsodium.
     *
     * It only answers for reference blocks strictly older than the last block it has
     * observed, so the result cannot be known while the reference block is still open.
     */
    class SeededEntropySource : public EntropySource {
    public:
        /**
         * @param seed Secret seed, ENTROPY_SEED_SIZE bytes
         * @throws invalid_argument if the seed has the wrong size
         */
        explicit SeededEntropySource(const vector<uint8_t>& seed);
        ~SeededEntropySource() override;

        bool random(Tick referenceTime, uint64_t& out) override;

        /** Advances the chain head seen by the source. Older heads are ignored. */
        void observeBlock(Tick block);

        Tick head() const { return chainHead; }

        /**
         * @brief Draws a fresh seed from the libsodium CSPRNG.
         * @throws runtime_error if libsodium is unavailable
         */
        static vector<uint8_t> generateSeed();

    private:
        vector<uint8_t> seed;
        Tick chainHead = 0;
        uint64_t counter = 0;
    };

} // namespace candle

#endif // CANDLE_ENTROPY_SOURCE_HPP
