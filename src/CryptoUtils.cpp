#include "CryptoUtils.hpp"
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace candle {

    namespace {
        bool isValidHexChar(char c) {
            return (c >= '0' && c <= '9') ||
                   (c >= 'a' && c <= 'f') ||
                   (c >= 'A' && c <= 'F');
        }
    }

    bool CryptoUtils::initialize() {
        if (sodium_init() < 0) {
            cerr << "ERROR: Failed to initialize libsodium" << endl;
            return false;
        }
        return true;
    }

    vector<uint8_t> CryptoUtils::sha256Bytes(const vector<uint8_t>& data) {
        vector<uint8_t> hash(crypto_hash_sha256_BYTES);

        if (crypto_hash_sha256(hash.data(), data.data(), data.size()) != 0) {
            throw runtime_error("SHA-256 computation failed");
        }

        return hash;
    }

    vector<uint8_t> CryptoUtils::sha256Bytes(const string& data) {
        // los strings se tratan como datos binarios
        return sha256Bytes(vector<uint8_t>(data.begin(), data.end()));
    }

    string CryptoUtils::hexEncode(const vector<uint8_t>& data) {
        stringstream hexStream;
        hexStream << hex << setfill('0');

        for (uint8_t byte : data) {
            hexStream << setw(2) << static_cast<int>(byte);
        }

        return hexStream.str();
    }

    vector<uint8_t> CryptoUtils::hexDecode(const string& hexStr) {
        if (hexStr.empty()) {
            return {};
        }

        if (hexStr.length() % 2 != 0) {
            throw invalid_argument("Hex string must have even length");
        }

        for (char c : hexStr) {
            if (!isValidHexChar(c)) {
                throw invalid_argument("Invalid hex character: " + string(1, c));
            }
        }

        vector<uint8_t> bytes;
        bytes.reserve(hexStr.length() / 2);

        for (size_t i = 0; i < hexStr.length(); i += 2) {
            bytes.push_back(static_cast<uint8_t>(stoul(hexStr.substr(i, 2), nullptr, 16)));
        }

        return bytes;
    }

    bool CryptoUtils::randomBytes(vector<uint8_t>& buffer) {
        if (buffer.empty()) {
            return true; // Nada que generar
        }

        if (sodium_init() < 0) {
            cerr << "Error: libsodium not initialized in randomBytes" << endl;
            return false;
        }

        randombytes_buf(buffer.data(), buffer.size());
        return true;
    }

    AccountId CryptoUtils::addressFromMaterial(const string& material) {
        if (material.empty()) {
            throw invalid_argument("Empty key material provided");
        }

        vector<uint8_t> hash = sha256Bytes(material);

        // Tomar los ultimos 20 bytes para la direccion (estilo Ethereum)
        vector<uint8_t> addressBytes(hash.end() - ADDRESS_SIZE, hash.end());
        return hexEncode(addressBytes);
    }

    bool CryptoUtils::isValidAddress(const string& address) {
        if (address.length() != ADDRESS_HEX_LENGTH) {
            return false;
        }

        return all_of(address.begin(), address.end(),
                      [](char c) { return isxdigit(static_cast<unsigned char>(c)) != 0; });
    }

    AccountId CryptoUtils::normalizeAddress(const string& address) {
        if (!isValidAddress(address)) {
            throw invalid_argument("Cannot normalize invalid address");
        }

        string normalized = address;
        transform(normalized.begin(), normalized.end(), normalized.begin(),
                  [](unsigned char c) { return static_cast<char>(tolower(c)); });
        return normalized;
    }

} // namespace candle
