#include "crypto.hpp"
#include "aes_crypto.hpp"
#include "xor_crypto.hpp"
#include <stdexcept>

std::shared_ptr<Crypto> create_crypto(const std::string &name, const std::string &key)
{
    if (name == "none")
    {
        return nullptr;
    }
    if (key.empty())
    {
        throw std::runtime_error("Crypto '" + name + "' requires a key");
    }
    if (name == "aes")
    {
        return std::make_shared<AesCrypto>(key);
    }
    if (name == "xor")
    {
        return std::make_shared<XorCrypto>(key);
    }
    throw std::runtime_error("Unknown crypto: " + name);
}
