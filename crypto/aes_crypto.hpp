#ifndef AES_CRYPTO_HPP
#define AES_CRYPTO_HPP

#include <vector>
#include <string>
#include <openssl/evp.h>
#include "crypto.hpp"

// AES-256-CTR keyed from a passphrase; the IV of each direction comes from the hello.
class AesCrypto : public Crypto
{
private:
    EVP_CIPHER_CTX *encrypt_ctx;
    EVP_CIPHER_CTX *decrypt_ctx;
    unsigned char key[32];
    bool encrypt_ready = false;
    bool decrypt_ready = false;

public:
    AesCrypto(const std::string &password);
    ~AesCrypto();

    AesCrypto(const AesCrypto &) = delete;
    AesCrypto &operator=(const AesCrypto &) = delete;

    CipherId id() const override { return CipherId::AES; }
    size_t iv_size() const override { return 16; }
    void begin_encrypt(const std::vector<uint8_t> &iv) override;
    void begin_decrypt(const std::vector<uint8_t> &iv) override;
    std::vector<uint8_t> encrypt(const uint8_t *data, size_t len) override;
    std::vector<uint8_t> decrypt(const uint8_t *data, size_t len) override;
};

#endif
