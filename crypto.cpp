#include "crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <iostream>
#include <memory>
#include <utility>

namespace crypto {

    using stego::StegoError;

    typedef std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> CipherCtx;

    static CipherCtx newCipherCtx() {
        return CipherCtx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    }

    static bool isBase64Char(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '+' || c == '/';
    }

    CipherConfig legacyCipherConfig()
    {
        static const char KEY[]   = "12345678901234567890123456789012";
        static const char NONCE[] = "123456789012";

        CipherConfig config;
        config.key.assign(KEY, KEY + KEY_SIZE);
        config.nonce.assign(NONCE, NONCE + NONCE_SIZE);
        return config;
    }

    bool parseHexBytes(const std::string& hex, std::vector<uint8_t>& out)
    {
        out.clear();
        if (hex.size() % 2 != 0 || hex.find('\0') != std::string::npos) {
            return false;
        }

        // no separator: "0a:0b" is rejected
        std::vector<uint8_t> bytes(hex.size() / 2);
        size_t len = 0;
        if (OPENSSL_hexstr2buf_ex(bytes.data(), bytes.size(), &len, hex.c_str(), '\0') != 1) {
            return false;
        }
        bytes.resize(len);
        out = std::move(bytes);
        return true;
    }

    bool loadCipherConfig(const std::string& keyHex,
                          const std::string& nonceHex,
                          CipherConfig& outConfig)
    {
        CipherConfig config;
        if (!parseHexBytes(keyHex, config.key) || config.key.size() != KEY_SIZE) {
            std::cerr << "[crypto] key must be " << KEY_SIZE * 2 << " hex characters\n";
            return false;
        }
        if (!parseHexBytes(nonceHex, config.nonce) || config.nonce.empty()) {
            std::cerr << "[crypto] nonce must be non-empty hex\n";
            return false;
        }
        if (config.nonce.size() != NONCE_SIZE) {
            std::cerr << "[crypto] warning: " << config.nonce.size()
                      << "-byte nonce, GCM expects " << NONCE_SIZE << "\n";
        }

        outConfig = std::move(config);
        return true;
    }

    std::string encodeBase64(const std::vector<uint8_t>& data)
    {
        if (data.empty()) {
            return std::string();
        }

        std::string out(4 * ((data.size() + 2) / 3), '\0');
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                      data.data(), static_cast<int>(data.size()));
        out.resize(written < 0 ? 0 : static_cast<size_t>(written));
        return out;
    }

    bool decodeBase64(const std::string& text, std::vector<uint8_t>& out)
    {
        out.clear();
        if (text.empty() || text.size() % 4 != 0) {
            return false;
        }

        size_t padding = 0;
        if (text[text.size() - 1] == '=') ++padding;
        if (text[text.size() - 2] == '=') ++padding;

        for (size_t i = 0; i < text.size() - padding; ++i) {
            if (!isBase64Char(text[i])) {
                return false;
            }
        }

        std::vector<uint8_t> decoded(text.size() / 4 * 3);
        int n = EVP_DecodeBlock(decoded.data(),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
        if (n < 0 || static_cast<size_t>(n) < padding) {
            return false;
        }
        // EVP_DecodeBlock counts padding as zero bytes
        decoded.resize(static_cast<size_t>(n) - padding);

        // Unused trailing bits must be zero, so every byte string has one encoding.
        if (encodeBase64(decoded) != text) {
            return false;
        }

        out = std::move(decoded);
        return true;
    }

    CipherService::CipherService(CipherConfig config)
        : config_(std::move(config))
    {
    }

    bool CipherService::isValid() const
    {
        return config_.key.size() == KEY_SIZE && !config_.nonce.empty();
    }

    StegoError CipherService::encrypt(const std::vector<uint8_t>& plaintext,
                                      std::string& outEnvelope) const
    {
        outEnvelope.clear();

        if (!isValid()) {
            std::cerr << "[crypto] invalid key/nonce configuration\n";
            return StegoError::InvalidCipherConfig;
        }

        CipherCtx ctx = newCipherCtx();
        if (!ctx) {
            std::cerr << "[crypto] EVP_CIPHER_CTX_new failed\n";
            return StegoError::CipherFailure;
        }

        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(config_.nonce.size()), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr,
                               config_.key.data(), config_.nonce.data()) != 1)
        {
            std::cerr << "[crypto] EVP_EncryptInit_ex failed\n";
            return StegoError::CipherFailure;
        }

        // GCM is a stream mode: ciphertext length == plaintext length
        std::vector<uint8_t> sealed(plaintext.size() + TAG_SIZE);

        int outLen1 = 0;
        if (!plaintext.empty() &&
            EVP_EncryptUpdate(ctx.get(),
                              sealed.data(), &outLen1,
                              plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1)
        {
            std::cerr << "[crypto] EVP_EncryptUpdate failed\n";
            return StegoError::CipherFailure;
        }

        int outLen2 = 0;
        if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + outLen1, &outLen2) != 1) {
            std::cerr << "[crypto] EVP_EncryptFinal_ex failed\n";
            return StegoError::CipherFailure;
        }

        size_t cipherLen = static_cast<size_t>(outLen1 + outLen2);
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                static_cast<int>(TAG_SIZE),
                                sealed.data() + cipherLen) != 1)
        {
            std::cerr << "[crypto] EVP_CTRL_GCM_GET_TAG failed\n";
            return StegoError::CipherFailure;
        }
        sealed.resize(cipherLen + TAG_SIZE);

        outEnvelope = encodeBase64(sealed);
        return StegoError::None;
    }

    StegoError CipherService::decrypt(const std::string& envelope,
                                      std::vector<uint8_t>& outPlaintext) const
    {
        outPlaintext.clear();

        if (!isValid()) {
            std::cerr << "[crypto] invalid key/nonce configuration\n";
            return StegoError::InvalidCipherConfig;
        }

        std::vector<uint8_t> sealed;
        if (!decodeBase64(envelope, sealed)) {
            std::cerr << "[crypto] envelope is not valid Base64\n";
            return StegoError::MalformedEnvelope;
        }
        if (sealed.size() < TAG_SIZE) {
            std::cerr << "[crypto] envelope too short for tag\n";
            return StegoError::MalformedEnvelope;
        }

        size_t cipherLen = sealed.size() - TAG_SIZE;
        const uint8_t* tag = sealed.data() + cipherLen;

        CipherCtx ctx = newCipherCtx();
        if (!ctx) {
            std::cerr << "[crypto] EVP_CIPHER_CTX_new failed\n";
            return StegoError::CipherFailure;
        }

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(config_.nonce.size()), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr,
                               config_.key.data(), config_.nonce.data()) != 1)
        {
            std::cerr << "[crypto] EVP_DecryptInit_ex failed\n";
            return StegoError::CipherFailure;
        }

        std::vector<uint8_t> plain(cipherLen + TAG_SIZE);
        int outLen1 = 0;

        if (cipherLen > 0 &&
            EVP_DecryptUpdate(ctx.get(),
                              plain.data(), &outLen1,
                              sealed.data(), static_cast<int>(cipherLen)) != 1)
        {
            std::cerr << "[crypto] EVP_DecryptUpdate failed\n";
            return StegoError::CipherFailure;
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                static_cast<int>(TAG_SIZE),
                                const_cast<uint8_t*>(tag)) != 1)
        {
            std::cerr << "[crypto] EVP_CTRL_GCM_SET_TAG failed\n";
            return StegoError::CipherFailure;
        }

        int outLen2 = 0;
        if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + outLen1, &outLen2) != 1) {
            std::cerr << "[crypto] tag mismatch (wrong key or corrupted envelope)\n";
            return StegoError::AuthenticationError;
        }

        plain.resize(static_cast<size_t>(outLen1 + outLen2));
        outPlaintext = std::move(plain);
        return StegoError::None;
    }

}
