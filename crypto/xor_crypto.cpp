#include "xor_crypto.hpp"
#include <stdexcept>

XorCrypto::XorCrypto(const std::string &password) : password(password)
{
    if (this->password.empty())
        throw std::runtime_error("XOR key must not be empty");
}

XorCrypto::~XorCrypto()
{
}

void XorCrypto::begin_encrypt(const std::vector<uint8_t> &)
{
    encrypt_pos = 0;
}

void XorCrypto::begin_decrypt(const std::vector<uint8_t> &)
{
    decrypt_pos = 0;
}

std::vector<uint8_t> XorCrypto::apply(const uint8_t *data, size_t len, size_t &pos) const
{
    std::vector<uint8_t> output(len);

    size_t i, j;
    for (i = 0, j = pos; i < len; i++, j++)
    {
        if (j >= password.length())
            j = 0;

        output[i] = data[i] ^ static_cast<uint8_t>(password[j]);
    }
    pos = j;

    return output;
}

std::vector<uint8_t> XorCrypto::encrypt(const uint8_t *data, size_t len)
{
    return apply(data, len, encrypt_pos);
}

std::vector<uint8_t> XorCrypto::decrypt(const uint8_t *data, size_t len)
{
    return apply(data, len, decrypt_pos);
}
