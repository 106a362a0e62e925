#include "aes_crypto.hpp"
#include <stdexcept>
#include <openssl/evp.h>

AesCrypto::AesCrypto(const std::string &password)
{
    encrypt_ctx = EVP_CIPHER_CTX_new();
    decrypt_ctx = EVP_CIPHER_CTX_new();
    if (!encrypt_ctx || !decrypt_ctx)
    {
        EVP_CIPHER_CTX_free(encrypt_ctx);
        EVP_CIPHER_CTX_free(decrypt_ctx);
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    unsigned char unused_iv[16];
    if (EVP_BytesToKey(EVP_aes_256_ctr(), EVP_sha256(), nullptr,
                       reinterpret_cast<const unsigned char *>(password.c_str()),
                       password.length(), 1, key, unused_iv) != 32)
    {
        EVP_CIPHER_CTX_free(encrypt_ctx);
        EVP_CIPHER_CTX_free(decrypt_ctx);
        throw std::runtime_error("EVP_BytesToKey failed");
    }
}

AesCrypto::~AesCrypto()
{
    EVP_CIPHER_CTX_free(encrypt_ctx);
    EVP_CIPHER_CTX_free(decrypt_ctx);
}

void AesCrypto::begin_encrypt(const std::vector<uint8_t> &iv)
{
    if (iv.size() != iv_size() ||
        EVP_EncryptInit_ex(encrypt_ctx, EVP_aes_256_ctr(), nullptr, key, iv.data()) != 1)
    {
        throw std::runtime_error("AES encrypt init failed");
    }
    encrypt_ready = true;
}

void AesCrypto::begin_decrypt(const std::vector<uint8_t> &iv)
{
    // CTR decryption is the same keystream XOR, so the encrypt direction of EVP is used
    if (iv.size() != iv_size() ||
        EVP_EncryptInit_ex(decrypt_ctx, EVP_aes_256_ctr(), nullptr, key, iv.data()) != 1)
    {
        throw std::runtime_error("AES decrypt init failed");
    }
    decrypt_ready = true;
}

std::vector<uint8_t> AesCrypto::encrypt(const uint8_t *data, size_t len)
{
    if (!encrypt_ready)
        throw std::runtime_error("AES encrypt used before begin_encrypt");

    std::vector<uint8_t> encrypted(len);
    int out_len = 0;
    if (len > 0 && EVP_EncryptUpdate(encrypt_ctx, encrypted.data(), &out_len, data, static_cast<int>(len)) != 1)
        throw std::runtime_error("EVP_EncryptUpdate failed");
    encrypted.resize(out_len);
    return encrypted;
}

std::vector<uint8_t> AesCrypto::decrypt(const uint8_t *data, size_t len)
{
    if (!decrypt_ready)
        throw std::runtime_error("AES decrypt used before begin_decrypt");

    std::vector<uint8_t> decrypted(len);
    int out_len = 0;
    if (len > 0 && EVP_EncryptUpdate(decrypt_ctx, decrypted.data(), &out_len, data, static_cast<int>(len)) != 1)
        throw std::runtime_error("EVP_EncryptUpdate failed");
    decrypted.resize(out_len);
    return decrypted;
}
