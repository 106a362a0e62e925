#include "connection.hpp"
#include <cerrno>
#include <utility>
#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

Connection::Connection(int fd) : sockfd(fd)
{
    if (sockfd >= 0)
    {
        int flag = 1;
        setsockopt(sockfd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        set_nonblocking(sockfd);
    }
}

Connection::~Connection()
{
    reset();
}

Connection::Connection(Connection &&other) noexcept : sockfd(other.sockfd)
{
    other.sockfd = -1;
}

Connection &Connection::operator=(Connection &&other) noexcept
{
    if (this != &other)
    {
        reset();
        sockfd = std::exchange(other.sockfd, -1);
    }
    return *this;
}

int Connection::start_connect(const SocketAddress &address)
{
    reset();
    sockfd = socket(address.storage.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sockfd < 0)
        return errno;

    int flag = 1;
    setsockopt(sockfd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    setsockopt(sockfd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
    set_nonblocking(sockfd);

    if (connect(sockfd, (const struct sockaddr *)&address.storage, address.length) < 0 && errno != EINPROGRESS)
    {
        int err = errno;
        reset();
        return err;
    }
    return 0;
}

int Connection::finish_connect()
{
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
        return errno;
    if (err != 0)
        return err;

    sockaddr_storage peer;
    socklen_t peer_len = sizeof(peer);
    if (getpeername(sockfd, (struct sockaddr *)&peer, &peer_len) < 0)
        return errno == ENOTCONN ? EINPROGRESS : errno;
    return 0;
}

ssize_t Connection::send_data(const uint8_t *data, size_t len)
{
    return send(sockfd, data, len, MSG_NOSIGNAL);
}

ssize_t Connection::recv_data(uint8_t *buffer, size_t max_len)
{
    return recv(sockfd, buffer, max_len, 0);
}

void Connection::shutdown_write()
{
    if (sockfd >= 0)
        shutdown(sockfd, SHUT_WR);
}

void Connection::reset()
{
    if (sockfd >= 0)
    {
        close(sockfd);
        sockfd = -1;
    }
}

int Connection::release()
{
    return std::exchange(sockfd, -1);
}
