#ifndef CANDLE_CRYPTO_UTILS_HPP
#define CANDLE_CRYPTO_UTILS_HPP

#include "AuctionTypes.hpp"
#include <vector>
#include <string>
#include <cstdint>

using namespace std;

namespace candle {

    /**
     * @class CryptoUtils
     * @brief Hashing, randomness and address helpers backed by libsodium.
     */
    class CryptoUtils {
    public:
        /**
         * @brief Initializes libsodium. Must be called once before any other helper.
         * @return true if the library is ready, false otherwise
         */
        static bool initialize();

        // Hashing SHA-256
        static vector<uint8_t> sha256Bytes(const vector<uint8_t>& data);
        static vector<uint8_t> sha256Bytes(const string& data);

        // Codificacion
        static string hexEncode(const vector<uint8_t>& data);
        static vector<uint8_t> hexDecode(const string& hexStr);

        /**
         * @brief Fills the buffer with bytes from the libsodium CSPRNG.
         * @return false if libsodium could not be initialized
         */
        static bool randomBytes(vector<uint8_t>& buffer);

        // ==== DIRECCIONES ====

        /**
         * @brief Derives an account address from arbitrary key material: the last
         * 20 bytes of SHA-256(material), hex encoded.
         * @param material Public key bytes or any stable label
         * @return 40 character lowercase address
         */
        static AccountId addressFromMaterial(const string& material);

        /**
         * @brief Checks that the address is exactly 40 hexadecimal characters.
         */
        static bool isValidAddress(const string& address);

        /**
         * @brief Lowercases a valid address.
         * @throws invalid_argument if the address is malformed
         */
        static AccountId normalizeAddress(const string& address);
    };

} // namespace candle

#endif // CANDLE_CRYPTO_UTILS_HPP
