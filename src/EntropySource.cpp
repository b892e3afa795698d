#include "EntropySource.hpp"
#include "CryptoUtils.hpp"
#include <sodium.h>
#include <stdexcept>
#include <iostream>

namespace candle {

    namespace {
        void appendBigEndian(vector<uint8_t>& buffer, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }
    }

    SeededEntropySource::SeededEntropySource(const vector<uint8_t>& seed) : seed(seed) {
        if (seed.size() != ENTROPY_SEED_SIZE) {
            throw invalid_argument("Entropy seed must be " + to_string(ENTROPY_SEED_SIZE) + " bytes");
        }
    }

    SeededEntropySource::~SeededEntropySource() {
        // Limpiar la semilla de memoria
        if (!seed.empty()) {
            sodium_memzero(seed.data(), seed.size());
        }
    }

    void SeededEntropySource::observeBlock(Tick block) {
        if (block > chainHead) {
            chainHead = block;
        }
    }

    bool SeededEntropySource::random(Tick referenceTime, uint64_t& out) {
        if (chainHead <= referenceTime) {
            cerr << "Entropy for block " << referenceTime << " not ready, head at " << chainHead << endl;
            return false;
        }

        vector<uint8_t> material(seed);
        appendBigEndian(material, referenceTime);
        appendBigEndian(material, counter);

        vector<uint8_t> digest = CryptoUtils::sha256Bytes(material);
        sodium_memzero(material.data(), material.size());

        uint64_t value = 0;
        for (size_t i = 0; i < sizeof(uint64_t); ++i) {
            value = (value << 8) | digest[i];
        }

        ++counter;
        out = value;
        return true;
    }

    vector<uint8_t> SeededEntropySource::generateSeed() {
        vector<uint8_t> fresh(ENTROPY_SEED_SIZE);
        if (!CryptoUtils::randomBytes(fresh)) {
            throw runtime_error("Random generator unavailable");
        }
        return fresh;
    }

} // namespace candle
