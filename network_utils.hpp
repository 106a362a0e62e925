#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <vector>
#include <cstring>
#include <cstdint>
#include <stdexcept>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <sys/socket.h>

struct SocketAddress
{
    sockaddr_storage storage;
    socklen_t length = 0;
};

// Detect if an address string is IPv6
inline bool is_ipv6(const std::string &addr)
{
    struct in6_addr result;
    return inet_pton(AF_INET6, addr.c_str(), &result) == 1;
}

// Setup sockaddr_storage for a given numeric address and port
inline bool setup_sockaddr(sockaddr_storage &addr_storage, socklen_t &addr_len,
                           const std::string &addr, int port)
{
    memset(&addr_storage, 0, sizeof(addr_storage));

    if (is_ipv6(addr))
    {
        sockaddr_in6 *addr6 = (sockaddr_in6 *)&addr_storage;
        addr6->sin6_family = AF_INET6;
        addr6->sin6_port = htons(port);
        inet_pton(AF_INET6, addr.c_str(), &addr6->sin6_addr);
        addr_len = sizeof(sockaddr_in6);
        return true;
    }

    sockaddr_in *addr4 = (sockaddr_in *)&addr_storage;
    addr4->sin_family = AF_INET;
    addr4->sin_port = htons(port);
    addr_len = sizeof(sockaddr_in);
    return inet_pton(AF_INET, addr.c_str(), &addr4->sin_addr) == 1;
}

// Split "host:port", "[v6]:port" or a bare port. Returns false on a malformed port.
inline bool parse_host_port(const std::string &value, std::string &host, uint16_t &port)
{
    std::string port_part = value;
    auto bracket = value.find(']');
    if (!value.empty() && value[0] == '[' && bracket != std::string::npos)
    {
        host = value.substr(1, bracket - 1);
        if (bracket + 1 >= value.size() || value[bracket + 1] != ':')
            return false;
        port_part = value.substr(bracket + 2);
    }
    else
    {
        auto pos = value.find_last_of(':');
        if (pos != std::string::npos && value.find(':') == pos)
        {
            host = value.substr(0, pos);
            port_part = value.substr(pos + 1);
        }
    }

    if (port_part.empty() || port_part.size() > 5 ||
        port_part.find_first_not_of("0123456789") != std::string::npos)
        return false;
    unsigned long number = std::stoul(port_part);
    if (number == 0 || number > 65535)
        return false;
    port = static_cast<uint16_t>(number);
    return true;
}

inline void set_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

inline std::string errno_string(int err)
{
    char buffer[128];
    // GNU strerror_r may return a static string instead of filling the buffer
    const char *text = strerror_r(err, buffer, sizeof(buffer));
    return text;
}

// Bind a non-blocking TCP listener. Port 0 picks an ephemeral port.
inline int create_listener(const std::string &host, int port)
{
    sockaddr_storage addr;
    socklen_t addr_len;
    if (!setup_sockaddr(addr, addr_len, host, port))
    {
        throw std::runtime_error("Invalid listen address: " + host);
    }

    int fd = socket(addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        throw std::runtime_error("socket() failed: " + errno_string(errno));
    }
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(fd, (struct sockaddr *)&addr, addr_len) < 0)
    {
        int err = errno;
        close(fd);
        throw std::runtime_error("Bind failed on " + host + ":" + std::to_string(port) + ": " + errno_string(err));
    }
    if (listen(fd, 128) < 0)
    {
        int err = errno;
        close(fd);
        throw std::runtime_error("Listen failed: " + errno_string(err));
    }

    set_nonblocking(fd);
    return fd;
}

inline uint16_t bound_port(int fd)
{
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd, (struct sockaddr *)&addr, &addr_len) < 0)
        return 0;
    if (addr.ss_family == AF_INET6)
        return ntohs(((sockaddr_in6 *)&addr)->sin6_port);
    return ntohs(((sockaddr_in *)&addr)->sin_port);
}

// Blocking getaddrinfo. Returns 0 or the EAI_* code; error_text is filled on failure.
inline int resolve_host(const std::string &host, uint16_t port,
                        std::vector<SocketAddress> &addresses, std::string &error_text)
{
    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string name = host;
    if (name.size() > 2 && name.front() == '[' && name.back() == ']')
        name = name.substr(1, name.size() - 2);

    addrinfo *result = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(name.c_str(), service.c_str(), &hints, &result);
    if (rc != 0)
    {
        error_text = rc == EAI_SYSTEM ? errno_string(errno) : gai_strerror(rc);
        return rc;
    }

    for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next)
    {
        SocketAddress entry;
        memset(&entry.storage, 0, sizeof(entry.storage));
        memcpy(&entry.storage, ai->ai_addr, ai->ai_addrlen);
        entry.length = ai->ai_addrlen;
        addresses.push_back(entry);
    }
    freeaddrinfo(result);

    if (addresses.empty())
    {
        error_text = "no addresses";
        return EAI_NONAME;
    }
    return 0;
}

#endif
