#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include "stego_error.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace crypto {

    static const size_t KEY_SIZE   = 32; // AES-256
    static const size_t NONCE_SIZE = 12; // GCM standard nonce
    static const size_t TAG_SIZE   = 16;

    struct CipherConfig {
        std::vector<uint8_t> key;
        std::vector<uint8_t> nonce;
    };

    // Built-in key/nonce pair of earlier releases. Every envelope made with it
    // reuses the same GCM nonce, which leaks the XOR of any two plaintexts and
    // allows tag forgery. Kept only for compatibility with existing carriers.
    CipherConfig legacyCipherConfig();

    bool parseHexBytes(const std::string& hex, std::vector<uint8_t>& out);

    // keyHex must decode to KEY_SIZE bytes, nonceHex to a non-empty nonce.
    bool loadCipherConfig(const std::string& keyHex,
                          const std::string& nonceHex,
                          CipherConfig& outConfig);

    // Standard alphabet, padded, single line.
    std::string encodeBase64(const std::vector<uint8_t>& data);

    // Strict: rejects bad alphabet, length, padding and non-canonical input.
    bool decodeBase64(const std::string& text, std::vector<uint8_t>& out);

    // AES-256-GCM with a caller-supplied key and nonce.
    // Envelope = Base64(ciphertext || tag). Immutable after construction.
    class CipherService {
    public:
        explicit CipherService(CipherConfig config);

        bool isValid() const;

        stego::StegoError encrypt(const std::vector<uint8_t>& plaintext,
                                  std::string& outEnvelope) const;

        // MalformedEnvelope if the Base64 layer is invalid or shorter than the tag,
        // AuthenticationError if the tag does not verify.
        stego::StegoError decrypt(const std::string& envelope,
                                  std::vector<uint8_t>& outPlaintext) const;

    private:
        CipherConfig config_;
    };
}

#endif
