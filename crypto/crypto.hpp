#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

enum class CipherId : uint8_t
{
    NONE = 0,
    XOR = 1,
    AES = 2,
};

// Stream cipher applied to the link byte stream after the hello. Output is
// always the same length as the input, so frame boundaries survive. Each
// direction keeps its own state and is restarted on every new connection.
class Crypto
{
public:
    virtual ~Crypto() = default;
    virtual CipherId id() const = 0;
    virtual size_t iv_size() const = 0;
    virtual void begin_encrypt(const std::vector<uint8_t> &iv) = 0;
    virtual void begin_decrypt(const std::vector<uint8_t> &iv) = 0;
    virtual std::vector<uint8_t> encrypt(const uint8_t *data, size_t len) = 0;
    virtual std::vector<uint8_t> decrypt(const uint8_t *data, size_t len) = 0;
};

// "none" yields nullptr. Throws std::runtime_error on an unknown name or a missing key.
std::shared_ptr<Crypto> create_crypto(const std::string &name, const std::string &key);

#endif
