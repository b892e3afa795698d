#ifndef CANDLE_SAMPLE_HISTORY_HPP
#define CANDLE_SAMPLE_HISTORY_HPP

#include "AuctionTypes.hpp"
#include <vector>

using namespace std;

namespace candle {

    /**
     * @class SampleHistory
     * @brief Leading bid as of every sample of the Ending period.
     *
     * Slots are materialized in order, one per elapsed sample. A sample that saw no
     * bid carries forward the leader of the previous one, so leading amounts never
     * decrease from one sample to the next.
     */
    class SampleHistory {
    public:
        /**
         * @param capacity Number of samples in the Ending period.
         * @throws invalid_argument if capacity is 0 or above MAX_ENDING_SAMPLES
         */
        explicit SampleHistory(Sample capacity);

        /**
         * The function `extendThrough` materializes every slot up to and including `sample`,
         * copying the last written leader into each new slot.
         *
         * @throws out_of_range if `sample` lies outside the Ending period.
         */
        void extendThrough(Sample sample);

        /**
         * The function `record` applies a bid of `bidder`, whose balance is now `amount`, at
         * `sample`. The slot at `sample` and every later materialized slot whose leading amount
         * is strictly lower is taken over by the bidder. Equal amounts keep the earlier leader.
         *
         * @return true if at least one slot was taken over or raised.
         * @throws out_of_range if `sample` lies outside the Ending period or belongs to an
         * already elapsed sample (a later slot exists).
         */
        bool record(Sample sample, const AccountId& bidder, Balance amount);

        /**
         * @brief Leader as of `sample`. Unwritten samples carry forward the closest earlier slot;
         * an empty slot (no leader, amount 0) is returned when nothing was recorded yet.
         * @throws out_of_range if `sample` lies outside the Ending period.
         */
        SampleSlot leaderAt(Sample sample) const;

        /** Number of materialized slots. */
        Sample materialized() const { return static_cast<Sample>(slots.size()); }

        const vector<SampleSlot>& getSlots() const { return slots; }

    private:
        Sample sampleCapacity;
        vector<SampleSlot> slots;

        void checkInRange(Sample sample) const;
    };

} // namespace candle

#endif // CANDLE_SAMPLE_HISTORY_HPP
