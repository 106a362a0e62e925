#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <cstdint>
#include <sys/types.h>
#include "network_utils.hpp"

// Owns one non-blocking TCP socket: a client, a target or the link.
class Connection
{
private:
    int sockfd = -1;

public:
    Connection() = default;
    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;
    Connection(Connection &&other) noexcept;
    Connection &operator=(Connection &&other) noexcept;

    // Starts a non-blocking connect. Returns 0 when connected or in progress,
    // otherwise the errno of the failed attempt (the socket is closed).
    int start_connect(const SocketAddress &address);
    // SO_ERROR of a pending connect once the socket turns writable;
    // EINPROGRESS while it is still not connected.
    int finish_connect();

    ssize_t send_data(const uint8_t *data, size_t len);
    ssize_t recv_data(uint8_t *buffer, size_t max_len);
    void shutdown_write();
    void reset();
    // Gives up ownership of the socket without closing it.
    int release();

    int get_fd() const { return sockfd; }
    bool is_open() const { return sockfd >= 0; }
};

#endif
