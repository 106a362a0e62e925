#ifndef XOR_CRYPTO_HPP
#define XOR_CRYPTO_HPP

#include <vector>
#include <string>
#include "crypto.hpp"

// Repeating-key obfuscation; the key position carries over between calls.
class XorCrypto : public Crypto
{
private:
    std::string password;
    size_t encrypt_pos = 0;
    size_t decrypt_pos = 0;

    std::vector<uint8_t> apply(const uint8_t *data, size_t len, size_t &pos) const;

public:
    XorCrypto(const std::string &password);
    ~XorCrypto();

    CipherId id() const override { return CipherId::XOR; }
    size_t iv_size() const override { return 0; }
    void begin_encrypt(const std::vector<uint8_t> &iv) override;
    void begin_decrypt(const std::vector<uint8_t> &iv) override;
    std::vector<uint8_t> encrypt(const uint8_t *data, size_t len) override;
    std::vector<uint8_t> decrypt(const uint8_t *data, size_t len) override;
};

#endif
