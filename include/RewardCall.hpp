#ifndef CANDLE_REWARD_CALL_HPP
#define CANDLE_REWARD_CALL_HPP

#include "AuctionTypes.hpp"
#include <cstdint>
#include <vector>
#include <string>

using namespace std;

namespace candle {

    inline constexpr size_t REWARD_CALL_HEADER_SIZE = 4 + 1 + 4 + ADDRESS_SIZE + 8; // magic + version + selector + callee + payload_len
    inline constexpr size_t REWARD_CALL_CHECKSUM_SIZE = 4; // CRC32

    // ============================================================
    //  LLAMADA A CONTRATO DE RECOMPENSA
    // ============================================================
    struct RewardCall {
        uint32_t magic    = REWARD_CALL_MAGIC;
        uint8_t  version  = REWARD_CALL_VERSION;
        uint32_t selector = SELECTOR_SET_APPROVAL_FOR_ALL;
        AccountId callee;             // contrato de recompensa
        vector<uint8_t> payload;      // argumentos codificados
    };

    /** Serializa una RewardCall en formato de red:
     * [magic(4) big-endian] [version(1)] [selector(4) big-endian] [callee(20)]
     * [payload_len(8) big-endian] [payload] [crc32(4) big-endian]
     * Lanza invalid_argument si el callee no es una direccion valida.
     */
    vector<uint8_t> serializeRewardCall(const RewardCall& call);

    /** Parsea una llamada completa validando magic, version, tamaño y CRC32.
     * Devuelve false si faltan datos o si la llamada es invalida.
     */
    bool parseRewardCall(const vector<uint8_t>& buffer, RewardCall& outCall);

    /** Calcula el CRC32 de un buffer (zlib) */
    uint32_t crc32_buf(const void* data, size_t len);

    // Argumentos de set_approval_for_all(to, approved)
    vector<uint8_t> encodeApprovalArgs(const AccountId& to, bool approved);
    bool decodeApprovalArgs(const vector<uint8_t>& payload, AccountId& to, bool& approved);

    // Argumentos de transfer(domain_hash, to)
    vector<uint8_t> encodeDomainTransferArgs(const vector<uint8_t>& domainHash, const AccountId& to);
    bool decodeDomainTransferArgs(const vector<uint8_t>& payload, vector<uint8_t>& domainHash, AccountId& to);

    /** Convierte un selector en string (util para logs) */
    string selectorToString(uint32_t selector);

} // namespace candle

#endif // CANDLE_REWARD_CALL_HPP
