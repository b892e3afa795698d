#include "SampleHistory.hpp"
#include <stdexcept>
#include <string>

namespace candle {

    SampleHistory::SampleHistory(Sample capacity) : sampleCapacity(capacity) {
        if (capacity == 0 || capacity > MAX_ENDING_SAMPLES) {
            throw invalid_argument("Sample history needs between 1 and " + to_string(MAX_ENDING_SAMPLES)
                                   + " samples, got " + to_string(capacity));
        }
    }

    void SampleHistory::checkInRange(Sample sample) const {
        if (sample >= sampleCapacity) {
            throw out_of_range("Sample " + to_string(sample) + " outside of Ending period of "
                               + to_string(sampleCapacity) + " samples");
        }
    }

    void SampleHistory::extendThrough(Sample sample) {
        checkInRange(sample);

        SampleSlot carried = slots.empty() ? SampleSlot{} : slots.back();
        while (slots.size() <= sample) {
            slots.push_back(carried);
        }
    }

    bool SampleHistory::record(Sample sample, const AccountId& bidder, Balance amount) {
        checkInRange(sample);

        // Nunca reescribir un bloque ya transcurrido
        if (sample + 1 < materialized()) {
            throw out_of_range("Sample " + to_string(sample) + " already elapsed, history is at "
                               + to_string(materialized() - 1));
        }

        extendThrough(sample);

        bool changed = false;
        for (size_t i = static_cast<size_t>(sample); i < slots.size(); ++i) {
            if (amount > slots[i].amount) {
                slots[i].leader = bidder;
                slots[i].amount = amount;
                changed = true;
            }
        }
        return changed;
    }

    SampleSlot SampleHistory::leaderAt(Sample sample) const {
        checkInRange(sample);

        if (sample < slots.size()) {
            return slots[static_cast<size_t>(sample)];
        }
        // carry forward desde el ultimo slot escrito
        return slots.empty() ? SampleSlot{} : slots.back();
    }

} // namespace candle
