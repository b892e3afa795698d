#include "RewardCall.hpp"
#include "CryptoUtils.hpp"
#include <zlib.h>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace candle {

    namespace {
        void putUint32(vector<uint8_t>& buffer, uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        void putUint64(vector<uint8_t>& buffer, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        uint32_t getUint32(const vector<uint8_t>& buffer, size_t position) {
            uint32_t value = 0;
            for (size_t i = 0; i < 4; ++i) {
                value = (value << 8) | buffer[position + i];
            }
            return value;
        }

        uint64_t getUint64(const vector<uint8_t>& buffer, size_t position) {
            uint64_t value = 0;
            for (size_t i = 0; i < 8; ++i) {
                value = (value << 8) | buffer[position + i];
            }
            return value;
        }

        vector<uint8_t> addressBytes(const AccountId& address) {
            if (!CryptoUtils::isValidAddress(address)) {
                throw invalid_argument("Invalid address in reward call: " + address);
            }
            return CryptoUtils::hexDecode(address);
        }

        AccountId addressFromBytes(const vector<uint8_t>& buffer, size_t position) {
            vector<uint8_t> raw(buffer.begin() + position, buffer.begin() + position + ADDRESS_SIZE);
            return CryptoUtils::hexEncode(raw);
        }
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    // ------------------------------------------------------------
    // SERIALIZACIÓN
    // ------------------------------------------------------------
    vector<uint8_t> serializeRewardCall(const RewardCall& call) {
        vector<uint8_t> buffer;
        buffer.reserve(REWARD_CALL_HEADER_SIZE + call.payload.size() + REWARD_CALL_CHECKSUM_SIZE);

        putUint32(buffer, call.magic);
        buffer.push_back(call.version);
        putUint32(buffer, call.selector);

        vector<uint8_t> callee = addressBytes(call.callee);
        buffer.insert(buffer.end(), callee.begin(), callee.end());

        putUint64(buffer, call.payload.size());
        buffer.insert(buffer.end(), call.payload.begin(), call.payload.end());

        // checksum CRC32 sobre TODO lo anterior
        putUint32(buffer, crc32_buf(buffer.data(), buffer.size()));
        return buffer;
    }

    // ------------------------------------------------------------
    // PARSEO COMPLETO (cabecera + payload + checksum)
    // ------------------------------------------------------------
    bool parseRewardCall(const vector<uint8_t>& buffer, RewardCall& outCall) {
        if (buffer.size() < REWARD_CALL_HEADER_SIZE + REWARD_CALL_CHECKSUM_SIZE) return false;

        size_t position = 0;
        RewardCall call;
        call.magic = getUint32(buffer, position);
        position += 4;
        call.version = buffer[position++];
        call.selector = getUint32(buffer, position);
        position += 4;
        call.callee = addressFromBytes(buffer, position);
        position += ADDRESS_SIZE;
        uint64_t payloadLength = getUint64(buffer, position);
        position += 8;

        // Validaciones básicas
        if (call.magic != REWARD_CALL_MAGIC) return false;
        if (call.version != REWARD_CALL_VERSION) return false;
        if (payloadLength > MAX_REWARD_CALL_PAYLOAD) return false;
        if (buffer.size() != REWARD_CALL_HEADER_SIZE + payloadLength + REWARD_CALL_CHECKSUM_SIZE) return false;

        call.payload.assign(buffer.begin() + position, buffer.begin() + position + payloadLength);
        position += payloadLength;

        uint32_t expected = getUint32(buffer, position);
        if (crc32_buf(buffer.data(), position) != expected) return false;

        outCall = move(call);
        return true;
    }

    // ------------------------------------------------------------
    // ARGUMENTOS
    // ------------------------------------------------------------
    vector<uint8_t> encodeApprovalArgs(const AccountId& to, bool approved) {
        vector<uint8_t> payload = addressBytes(to);
        payload.push_back(approved ? 1 : 0);
        return payload;
    }

    bool decodeApprovalArgs(const vector<uint8_t>& payload, AccountId& to, bool& approved) {
        if (payload.size() != ADDRESS_SIZE + 1) return false;
        if (payload[ADDRESS_SIZE] > 1) return false;

        to = addressFromBytes(payload, 0);
        approved = payload[ADDRESS_SIZE] == 1;
        return true;
    }

    vector<uint8_t> encodeDomainTransferArgs(const vector<uint8_t>& domainHash, const AccountId& to) {
        if (domainHash.size() != SHA256_HASH_SIZE) {
            throw invalid_argument("Domain hash must be " + to_string(SHA256_HASH_SIZE) + " bytes");
        }
        vector<uint8_t> payload(domainHash);
        vector<uint8_t> recipient = addressBytes(to);
        payload.insert(payload.end(), recipient.begin(), recipient.end());
        return payload;
    }

    bool decodeDomainTransferArgs(const vector<uint8_t>& payload, vector<uint8_t>& domainHash, AccountId& to) {
        if (payload.size() != SHA256_HASH_SIZE + ADDRESS_SIZE) return false;

        domainHash.assign(payload.begin(), payload.begin() + SHA256_HASH_SIZE);
        to = addressFromBytes(payload, SHA256_HASH_SIZE);
        return true;
    }

    string selectorToString(uint32_t selector) {
        switch (selector) {
            case SELECTOR_SET_APPROVAL_FOR_ALL: return "set_approval_for_all";
            case SELECTOR_TRANSFER_DOMAIN:      return "transfer_domain";
            default: {
                stringstream ss;
                ss << "0x" << hex << uppercase << setw(8) << setfill('0') << selector;
                return ss.str();
            }
        }
    }

} // namespace candle
