#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <vector>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include "logger.hpp"
#include "network_utils.hpp"
#include "crypto/crypto.hpp"
#include "event_loop.hpp"
#include "link_supervisor.hpp"
#include "protocol/frame.hpp"
#include "tunnels/offshore_demultiplexer.hpp"
#include "tunnels/ship_multiplexer.hpp"
#include "test_support.hpp"

namespace
{
    // Blocking loopback server running one thread per accepted connection.
    class TestServer
    {
    private:
        std::function<void(int)> handler;
        int listen_fd;
        uint16_t listen_port;
        std::atomic<bool> stopping{false};
        std::thread acceptor;
        std::vector<std::thread> workers;

        void accept_loop()
        {
            while (!stopping)
            {
                pollfd pfd = {listen_fd, POLLIN, 0};
                if (poll(&pfd, 1, 50) <= 0)
                    continue;
                int fd = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
                if (fd < 0)
                    continue;
                timeval tv = {5, 0};
                setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                workers.emplace_back([this, fd]()
                                     {
                                         handler(fd);
                                         close(fd);
                                     });
            }
        }

    public:
        explicit TestServer(std::function<void(int)> handler) : handler(std::move(handler))
        {
            listen_fd = create_listener("127.0.0.1", 0);
            listen_port = bound_port(listen_fd);
            acceptor = std::thread([this]()
                                   { accept_loop(); });
        }

        ~TestServer()
        {
            stopping = true;
            acceptor.join();
            for (auto &worker : workers)
                worker.join();
            close(listen_fd);
        }

        uint16_t port() const { return listen_port; }
    };

    void echo_handler(int fd)
    {
        char buffer[16384];
        while (true)
        {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
                break;
            if (!send_all(fd, std::string(buffer, static_cast<size_t>(n))))
                break;
        }
        shutdown(fd, SHUT_WR);
    }

    std::string pattern_body(size_t size)
    {
        std::string body(size, '\0');
        for (size_t i = 0; i < size; ++i)
            body[i] = static_cast<char>('a' + i % 26);
        return body;
    }

    // Serves /small, /slow, /chunked, /large/<bytes> and /upload, then closes.
    void origin_handler(int fd)
    {
        std::string head = recv_until(fd, "\r\n\r\n");
        size_t path_start = head.find(' ');
        if (path_start == std::string::npos)
            return;
        std::string path = head.substr(path_start + 1, head.find(' ', path_start + 1) - path_start - 1);

        std::string response;
        if (path == "/small")
        {
            response = "HTTP/1.1 200 OK\r\nContent-Length: 14\r\n\r\nhello offshore";
        }
        else if (path == "/slow")
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            response = "HTTP/1.1 200 OK\r\nContent-Length: 14\r\n\r\nhello offshore";
        }
        else if (path == "/upload")
        {
            // echoes the request body as it arrived, chunk framing included
            std::string body;
            size_t length_at = head.find("Content-Length: ");
            if (length_at != std::string::npos)
                body = recv_exact(fd, std::stoul(head.substr(length_at + 16)));
            else if (head.find("Transfer-Encoding: chunked") != std::string::npos)
                body = recv_until(fd, "0\r\n\r\n");
            response = "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
        }
        else if (path == "/chunked")
        {
            response = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                       "5\r\nhello\r\n1\r\n \r\n8\r\noffshore\r\n0\r\n\r\n";
        }
        else if (path.compare(0, 7, "/large/") == 0)
        {
            size_t size = std::stoul(path.substr(7));
            response = "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(size) + "\r\n\r\n" + pattern_body(size);
        }
        else
        {
            response = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n";
        }
        send_all(fd, response);
        // the proxy closes the target once the response is framed
        recv_until_close(fd);
    }

    // Sits between ship and offshore so a test can cut the link abruptly.
    class LinkRelay
    {
    private:
        uint16_t target_port;
        int listen_fd;
        uint16_t listen_port;
        std::atomic<bool> cut_requested{false};
        std::thread worker;

        static bool pump(const pollfd &pfd, int from, int to)
        {
            if (!(pfd.revents & (POLLIN | POLLHUP | POLLERR)))
                return true;
            char buffer[16384];
            ssize_t n = recv(from, buffer, sizeof(buffer), 0);
            if (n <= 0)
                return false;
            return send_all(to, std::string(buffer, static_cast<size_t>(n)));
        }

        void run()
        {
            int ship_fd = -1;
            int offshore_fd = -1;
            while (!cut_requested)
            {
                if (ship_fd < 0)
                {
                    pollfd pfd = {listen_fd, POLLIN, 0};
                    if (poll(&pfd, 1, 50) <= 0)
                        continue;
                    ship_fd = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
                    if (ship_fd < 0)
                        continue;
                    offshore_fd = connect_loopback(target_port);
                    if (offshore_fd < 0)
                    {
                        close(ship_fd);
                        ship_fd = -1;
                    }
                    continue;
                }
                pollfd pfds[2] = {{ship_fd, POLLIN, 0}, {offshore_fd, POLLIN, 0}};
                if (poll(pfds, 2, 50) <= 0)
                    continue;
                if (!pump(pfds[0], ship_fd, offshore_fd) || !pump(pfds[1], offshore_fd, ship_fd))
                    break;
            }
            if (ship_fd >= 0)
                close(ship_fd);
            if (offshore_fd >= 0)
                close(offshore_fd);
            close(listen_fd);
        }

    public:
        explicit LinkRelay(uint16_t target_port) : target_port(target_port)
        {
            listen_fd = create_listener("127.0.0.1", 0);
            listen_port = bound_port(listen_fd);
            worker = std::thread([this]()
                                 { run(); });
        }

        ~LinkRelay()
        {
            cut();
            worker.join();
        }

        uint16_t port() const { return listen_port; }
        // Drops both sides of the link and stops accepting new ones.
        void cut() { cut_requested = true; }
    };

    // Session state changes reported by a ship, readable from the test thread.
    class SessionLog
    {
    private:
        std::mutex mutex;
        std::vector<std::tuple<uint32_t, SessionState, ErrorReason>> events;

    public:
        void attach(ShipMultiplexer &ship)
        {
            ship.set_session_observer([this](uint32_t id, SessionState state, ErrorReason reason)
                                      {
                                          std::lock_guard<std::mutex> lock(mutex);
                                          events.emplace_back(id, state, reason);
                                      });
        }

        size_t failures(ErrorReason reason)
        {
            std::lock_guard<std::mutex> lock(mutex);
            size_t count = 0;
            for (const auto &event : events)
            {
                if (std::get<1>(event) == SessionState::FAILED && std::get<2>(event) == reason)
                    count++;
            }
            return count;
        }
    };

    // Offshore end of the link that records every frame and never answers an OPEN.
    class SilentOffshore : public LinkHandler
    {
    private:
        EventLoop loop;
        LinkSupervisor link;
        std::thread thread;

        std::mutex mutex;
        std::vector<Frame> frames;

    public:
        SilentOffshore() : link(loop, *this, nullptr)
        {
            link.listen("127.0.0.1", 0);
            thread = std::thread([this]()
                                 { loop.run(); });
        }

        ~SilentOffshore()
        {
            loop.stop();
            thread.join();
        }

        void on_link_up() override {}
        void on_frame(const Frame &frame) override
        {
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(frame);
        }
        void on_link_down(ErrorReason) override {}
        void on_link_drained() override {}

        uint16_t port() const { return link.listen_port(); }

        bool received(FrameType type)
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto &frame : frames)
            {
                if (frame.type == type)
                    return true;
            }
            return false;
        }

        bool received_error(ErrorReason reason)
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto &frame : frames)
            {
                if (frame.type == FrameType::ERROR && parse_error_payload(frame).reason == reason)
                    return true;
            }
            return false;
        }
    };

    // A plaintext ship dialing straight to the given offshore port.
    class ShipRunner
    {
    public:
        SessionLog log;

    private:
        std::unique_ptr<ShipMultiplexer> ship;
        std::thread thread;

    public:
        ShipRunner(uint16_t offshore_port, int open_timeout_ms)
        {
            ShipOptions options;
            options.listen_host = "127.0.0.1";
            options.listen_port = 0;
            options.offshore_host = "127.0.0.1";
            options.offshore_port = offshore_port;
            options.reconnect_attempts = 1;
            options.link_connect_timeout_ms = 1000;
            options.open_timeout_ms = open_timeout_ms;
            ship = std::make_unique<ShipMultiplexer>(options, nullptr);
            log.attach(*ship);
            thread = std::thread([this]()
                                 { ship->run(); });
        }

        ~ShipRunner() { shutdown(); }

        // Stops the ship and waits until its shutdown pass has finished.
        void shutdown()
        {
            if (!thread.joinable())
                return;
            ship->stop();
            thread.join();
        }

        bool wait_link_up()
        {
            return wait_until([this]()
                              { return ship->link_state() == LinkState::UP; },
                              5000);
        }

        int client() { return connect_loopback(ship->listen_port()); }
        size_t sessions() const { return ship->session_count(); }
    };

    class ProxyHarness
    {
    private:
        std::unique_ptr<OffshoreDemultiplexer> offshore;
        std::unique_ptr<LinkRelay> relay;
        std::unique_ptr<ShipMultiplexer> ship;
        std::thread offshore_thread;
        std::thread ship_thread;
        SessionLog log;

    public:
        explicit ProxyHarness(int reconnect_attempts = 2)
        {
            OffshoreOptions offshore_options;
            offshore_options.listen_host = "127.0.0.1";
            offshore_options.listen_port = 0;
            offshore_options.connect_timeout_ms = 2000;
            offshore_options.response_idle_timeout_ms = 5000;
            offshore_options.resolver_threads = 2;
            offshore = std::make_unique<OffshoreDemultiplexer>(offshore_options, create_crypto("aes", "integration"));

            relay = std::make_unique<LinkRelay>(offshore->listen_port());

            ShipOptions ship_options;
            ship_options.listen_host = "127.0.0.1";
            ship_options.listen_port = 0;
            ship_options.offshore_host = "127.0.0.1";
            ship_options.offshore_port = relay->port();
            ship_options.reconnect_attempts = reconnect_attempts;
            ship_options.reconnect_initial_backoff_ms = 20;
            ship_options.reconnect_max_backoff_ms = 50;
            ship_options.link_connect_timeout_ms = 1000;
            ship = std::make_unique<ShipMultiplexer>(ship_options, create_crypto("aes", "integration"));
            log.attach(*ship);

            offshore_thread = std::thread([this]()
                                          { offshore->run(); });
            ship_thread = std::thread([this]()
                                      { ship->run(); });
        }

        ~ProxyHarness()
        {
            ship->stop();
            offshore->stop();
            ship_thread.join();
            offshore_thread.join();
            ship.reset();
            relay.reset();
            offshore.reset();
        }

        bool wait_link_up()
        {
            return wait_until([this]()
                              { return ship->link_state() == LinkState::UP &&
                                       offshore->link_state() == LinkState::UP; },
                              5000);
        }

        int client(int timeout_ms = 5000) { return connect_loopback(ship->listen_port(), timeout_ms); }

        bool wait_idle()
        {
            return wait_until([this]()
                              { return ship->session_count() == 0 && offshore->session_count() == 0; },
                              5000);
        }

        size_t ship_sessions() const { return ship->session_count(); }
        LinkState ship_link() const { return ship->link_state(); }
        void cut_link() { relay->cut(); }

        size_t failures(ErrorReason reason) { return log.failures(reason); }
    };

    std::string connect_request(uint16_t port)
    {
        return "CONNECT 127.0.0.1:" + std::to_string(port) + " HTTP/1.1\r\nHost: 127.0.0.1:" +
               std::to_string(port) + "\r\n\r\n";
    }

    std::string get_request(uint16_t port, const std::string &path)
    {
        return "GET http://127.0.0.1:" + std::to_string(port) + path + " HTTP/1.1\r\nHost: 127.0.0.1:" +
               std::to_string(port) + "\r\nProxy-Connection: keep-alive\r\n\r\n";
    }

    std::string post_request(uint16_t port, const std::string &framing, const std::string &body)
    {
        return "POST http://127.0.0.1:" + std::to_string(port) + "/upload HTTP/1.1\r\nHost: 127.0.0.1:" +
               std::to_string(port) + "\r\n" + framing + "\r\n\r\n" + body;
    }

    std::string response_body(const std::string &response)
    {
        size_t end = response.find("\r\n\r\n");
        return end == std::string::npos ? std::string() : response.substr(end + 4);
    }

    const std::string ESTABLISHED = "HTTP/1.1 200 Connection Established\r\n\r\n";

    int open_tunnel(ProxyHarness &proxy, uint16_t port)
    {
        int fd = proxy.client();
        if (fd < 0)
            return -1;
        if (!send_all(fd, connect_request(port)) || recv_until(fd, "\r\n\r\n") != ESTABLISHED)
        {
            close(fd);
            return -1;
        }
        return fd;
    }
}

bool test_connect_tunnel_relays_binary()
{
    std::cout << "Testing CONNECT tunnel..." << std::endl;
    TestServer echo(echo_handler);
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    int fd = open_tunnel(proxy, echo.port());
    TEST_ASSERT(fd >= 0, "tunnel established");

    std::string payload;
    for (int i = 0; i < 400000; ++i)
        payload.push_back(static_cast<char>(i % 256));
    bool sent = false;
    std::thread sender([&]()
                       { sent = send_all(fd, payload); });
    std::string echoed = recv_exact(fd, payload.size());
    sender.join();
    TEST_ASSERT(sent, "send payload");
    TEST_ASSERT(echoed == payload, "payload echoed byte for byte");

    shutdown(fd, SHUT_WR);
    bool closed = false;
    std::string rest = recv_until_close(fd, &closed);
    TEST_ASSERT(closed && rest.empty(), "half-close propagates back to the client");
    close(fd);
    TEST_ASSERT(proxy.wait_idle(), "sessions removed on both sides");
    return true;
}

bool test_get_with_content_length()
{
    std::cout << "Testing absolute-form GET..." << std::endl;
    TestServer origin(origin_handler);
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    int fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, get_request(origin.port(), "/small")), "send request");
    bool closed = false;
    std::string response = recv_until_close(fd, &closed);
    close(fd);
    TEST_ASSERT(closed, "proxy closes after the response");
    TEST_ASSERT(response.find("HTTP/1.1 200 OK\r\n") == 0, "status relayed");
    TEST_ASSERT(response.size() >= 14 && response.compare(response.size() - 14, 14, "hello offshore") == 0, "body relayed");
    TEST_ASSERT(proxy.wait_idle(), "sessions removed");
    return true;
}

bool test_get_chunked()
{
    std::cout << "Testing chunked response..." << std::endl;
    TestServer origin(origin_handler);
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    int fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, get_request(origin.port(), "/chunked")), "send request");
    bool closed = false;
    std::string response = recv_until_close(fd, &closed);
    close(fd);
    TEST_ASSERT(closed, "proxy closes after the last chunk");
    TEST_ASSERT(response.find("Transfer-Encoding: chunked") != std::string::npos, "chunked head relayed");
    TEST_ASSERT(response.find("8\r\noffshore\r\n0\r\n\r\n") != std::string::npos, "chunks relayed to the end");
    TEST_ASSERT(proxy.wait_idle(), "sessions removed");
    return true;
}

bool test_concurrent_large_responses()
{
    std::cout << "Testing concurrent large responses..." << std::endl;
    TestServer first_origin(origin_handler);
    TestServer second_origin(origin_handler);
    const uint16_t ports[2] = {first_origin.port(), second_origin.port()};
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    const size_t sizes[2] = {3 * 1000 * 1000, 2 * 1000 * 1000 + 17};
    std::string bodies[2];
    bool ok[2] = {false, false};
    std::vector<std::thread> clients;
    for (int i = 0; i < 2; ++i)
    {
        clients.emplace_back([&, i]()
                             {
                                 int fd = proxy.client();
                                 if (fd < 0)
                                     return;
                                 if (send_all(fd, get_request(ports[i], "/large/" + std::to_string(sizes[i]))))
                                 {
                                     std::string response = recv_until_close(fd, &ok[i]);
                                     size_t body = response.find("\r\n\r\n");
                                     if (body != std::string::npos)
                                         bodies[i] = response.substr(body + 4);
                                 }
                                 close(fd);
                             });
    }
    for (auto &client : clients)
        client.join();

    for (int i = 0; i < 2; ++i)
    {
        TEST_ASSERT(ok[i], "response " << i << " ended with a close");
        TEST_ASSERT(bodies[i].size() == sizes[i], "response " << i << " complete: " << bodies[i].size());
        TEST_ASSERT(bodies[i] == pattern_body(sizes[i]), "response " << i << " intact");
    }
    TEST_ASSERT(proxy.wait_idle(), "sessions removed");
    return true;
}

bool test_sessions_are_isolated()
{
    std::cout << "Testing session isolation..." << std::endl;
    TestServer echo(echo_handler);
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    int a = open_tunnel(proxy, echo.port());
    int b = open_tunnel(proxy, echo.port());
    TEST_ASSERT(a >= 0 && b >= 0, "both tunnels established");

    // abort A with a reset
    linger hard = {1, 0};
    setsockopt(a, SOL_SOCKET, SO_LINGER, &hard, sizeof(hard));
    close(a);
    TEST_ASSERT(wait_until([&]()
                           { return proxy.ship_sessions() == 1; },
                           5000),
                "aborted session removed");

    TEST_ASSERT(send_all(b, "still here"), "send on B");
    TEST_ASSERT(recv_exact(b, 10) == "still here", "B unaffected");
    close(b);
    TEST_ASSERT(proxy.wait_idle(), "sessions removed");
    return true;
}

bool test_bad_request_and_unreachable_targets()
{
    std::cout << "Testing local error responses..." << std::endl;
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    int fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, "nonsense\r\n\r\n"), "send garbage");
    std::string response = recv_until_close(fd);
    close(fd);
    TEST_ASSERT(response.find("HTTP/1.1 400 Bad Request\r\n") == 0, "garbage gets 400");

    uint16_t closed_port;
    {
        int probe = create_listener("127.0.0.1", 0);
        closed_port = bound_port(probe);
        close(probe);
    }
    fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, connect_request(closed_port)), "send CONNECT");
    response = recv_until_close(fd);
    close(fd);
    TEST_ASSERT(response.find("HTTP/1.1 502 Bad Gateway\r\n") == 0, "refused target gets 502");
    TEST_ASSERT(wait_until([&]()
                           { return proxy.failures(ErrorReason::CONNECTION_REFUSED) == 1; },
                           5000),
                "ship saw ConnectionRefused");

    // resolution may wait on an unreachable resolver here
    fd = proxy.client(30000);
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, "GET http://nonexistent.invalid/ HTTP/1.1\r\nHost: nonexistent.invalid\r\n\r\n"),
                "send GET");
    response = recv_until_close(fd);
    close(fd);
    TEST_ASSERT(response.find("HTTP/1.1 502 Bad Gateway\r\n") == 0, "unresolvable host gets 502");
    TEST_ASSERT(proxy.failures(ErrorReason::DNS_FAILURE) == 1, "ship saw DnsFailure");
    TEST_ASSERT(proxy.wait_idle(), "no session leaked");
    return true;
}

bool test_link_loss_fails_every_session()
{
    std::cout << "Testing link loss..." << std::endl;
    TestServer echo(echo_handler);
    ProxyHarness proxy(2);
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    std::vector<int> tunnels;
    for (int i = 0; i < 3; ++i)
    {
        int fd = open_tunnel(proxy, echo.port());
        TEST_ASSERT(fd >= 0, "tunnel " << i << " established");
        tunnels.push_back(fd);
    }

    proxy.cut_link();
    for (int fd : tunnels)
    {
        bool closed = false;
        recv_until_close(fd, &closed);
        close(fd);
        TEST_ASSERT(closed, "client closed after link loss");
    }
    TEST_ASSERT(wait_until([&]()
                           { return proxy.failures(ErrorReason::LINK_LOST) == 3; },
                           5000),
                "every session failed with LinkLost");
    TEST_ASSERT(wait_until([&]()
                           { return proxy.ship_sessions() == 0; },
                           5000),
                "no session left behind");

    TEST_ASSERT(wait_until([&]()
                           { return proxy.ship_link() == LinkState::GAVE_UP; },
                           5000),
                "ship gave up redialing");

    int fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected after give-up");
    TEST_ASSERT(send_all(fd, connect_request(echo.port())), "send CONNECT");
    std::string response = recv_until_close(fd);
    close(fd);
    TEST_ASSERT(response.find("HTTP/1.1 503 Service Unavailable\r\n") == 0, "new clients get 503");
    return true;
}

bool test_half_closed_client_gets_response()
{
    std::cout << "Testing response after client half-close..." << std::endl;
    TestServer origin(origin_handler);
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    int fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, get_request(origin.port(), "/slow")), "send request");
    // done sending; the origin answers only after a delay
    shutdown(fd, SHUT_WR);
    bool closed = false;
    std::string response = recv_until_close(fd, &closed);
    close(fd);
    TEST_ASSERT(closed, "proxy closes after the response");
    TEST_ASSERT(response.find("HTTP/1.1 200 OK\r\n") == 0, "response delivered: " << response);
    TEST_ASSERT(response_body(response) == "hello offshore", "body delivered");
    TEST_ASSERT(proxy.failures(ErrorReason::CLIENT_ABORTED) == 0, "half-close is not an abort");
    TEST_ASSERT(proxy.wait_idle(), "sessions removed");
    return true;
}

bool test_post_bodies_forwarded()
{
    std::cout << "Testing POST request bodies..." << std::endl;
    TestServer origin(origin_handler);
    ProxyHarness proxy;
    TEST_ASSERT(proxy.wait_link_up(), "link up");

    const std::string upload = pattern_body(300000);
    int fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected");
    bool sent = false;
    std::thread sender([&]()
                       { sent = send_all(fd, post_request(origin.port(), "Content-Length: 300000", upload)); });
    bool closed = false;
    std::string response = recv_until_close(fd, &closed);
    sender.join();
    close(fd);
    TEST_ASSERT(sent, "send POST");
    TEST_ASSERT(closed, "proxy closes after the response");
    TEST_ASSERT(response.find("HTTP/1.1 200 OK\r\n") == 0, "status relayed");
    TEST_ASSERT(response_body(response) == upload, "sized body reached the origin intact");

    const std::string chunks = "4\r\nship\r\n6\r\n board\r\n0\r\n\r\n";
    fd = proxy.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, post_request(origin.port(), "Transfer-Encoding: chunked", chunks)), "send chunked POST");
    response = recv_until_close(fd, &closed);
    close(fd);
    TEST_ASSERT(closed, "proxy closes after the response");
    TEST_ASSERT(response_body(response) == chunks, "chunked body reached the origin intact");
    TEST_ASSERT(proxy.wait_idle(), "sessions removed");
    return true;
}

bool test_unacknowledged_open_times_out()
{
    std::cout << "Testing open timeout..." << std::endl;
    SilentOffshore offshore;
    ShipRunner ship(offshore.port(), 300);
    TEST_ASSERT(ship.wait_link_up(), "link up");

    int fd = ship.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, connect_request(9)), "send CONNECT");
    std::string response = recv_until_close(fd);
    close(fd);
    TEST_ASSERT(response.find("HTTP/1.1 504 Gateway Timeout\r\n") == 0, "client gets 504: " << response);
    TEST_ASSERT(offshore.received(FrameType::OPEN), "offshore saw the OPEN");
    TEST_ASSERT(wait_until([&]()
                           { return offshore.received_error(ErrorReason::TIMEOUT); },
                           5000),
                "offshore told the session timed out");
    TEST_ASSERT(ship.log.failures(ErrorReason::TIMEOUT) == 1, "session failed with Timeout");
    TEST_ASSERT(wait_until([&]()
                           { return ship.sessions() == 0; },
                           5000),
                "session removed");
    return true;
}

bool test_shutdown_fails_pending_sessions()
{
    std::cout << "Testing shutdown with a pending session..." << std::endl;
    SilentOffshore offshore;
    ShipRunner ship(offshore.port(), 10000);
    TEST_ASSERT(ship.wait_link_up(), "link up");

    int fd = ship.client();
    TEST_ASSERT(fd >= 0, "client connected");
    TEST_ASSERT(send_all(fd, connect_request(9)), "send CONNECT");
    TEST_ASSERT(wait_until([&]()
                           { return offshore.received(FrameType::OPEN); },
                           5000),
                "OPEN reached the offshore");

    ship.shutdown();
    bool closed = false;
    std::string response = recv_until_close(fd, &closed);
    close(fd);
    TEST_ASSERT(response.find("HTTP/1.1 503 Service Unavailable\r\n") == 0, "client gets 503: " << response);
    TEST_ASSERT(closed, "client connection closed");
    TEST_ASSERT(wait_until([&]()
                           { return offshore.received_error(ErrorReason::SHUTDOWN); },
                           5000),
                "offshore told about the shutdown");
    TEST_ASSERT(ship.log.failures(ErrorReason::SHUTDOWN) == 1, "session failed with Shutdown");
    return true;
}

int main()
{
    std::cout << "Running Proxy Integration Tests..." << std::endl;
    set_log_level(LogLevel::Error);

    test_connect_tunnel_relays_binary();
    test_get_with_content_length();
    test_get_chunked();
    test_half_closed_client_gets_response();
    test_post_bodies_forwarded();
    test_concurrent_large_responses();
    test_sessions_are_isolated();
    test_bad_request_and_unreachable_targets();
    test_link_loss_fails_every_session();
    test_unacknowledged_open_times_out();
    test_shutdown_fails_pending_sessions();

    return finish_tests("PROXY INTEGRATION");
}
