#ifndef SHIP_MULTIPLEXER_HPP
#define SHIP_MULTIPLEXER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "tunnel.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "event_loop.hpp"
#include "http_framing.hpp"
#include "link_supervisor.hpp"
#include "session.hpp"
#include "session_store.hpp"
#include "crypto/crypto.hpp"

// Ship side: local explicit HTTP proxy whose sessions all ride one link.
class ShipMultiplexer : public Tunnel, private LinkHandler
{
private:
    struct ClientConnection
    {
        Connection socket;
        Session session;

        std::string head_buffer;
        bool head_parsed = false;
        RequestHead request;
        BodyFramer body;
        std::vector<uint8_t> held; // read past the head before the session was active

        bool request_complete = false;
        bool response_started = false;
        bool draining = false; // answering locally, then closing
        bool write_shut = false;
        bool read_shut = false; // client half-closed after a complete request
        bool removed = false;

        bool registered = false;
        uint32_t registered_events = 0;
        TimerId open_timer = 0;
        TimerId linger_timer = 0;

        ClientConnection(int fd, uint32_t id) : socket(fd), session(id) {}
    };

    ShipOptions options;
    EventLoop loop;
    LinkSupervisor link;
    SessionStore<ClientConnection> clients;

    int listen_fd = -1;
    bool accepting = false;
    uint32_t next_session_id = 1;
    std::atomic<size_t> live_sessions{0};
    SessionObserver observer;

    void set_accepting(bool enabled);
    void handle_accept();
    uint32_t allocate_session_id();

    void handle_client_events(uint32_t session_id, uint32_t events);
    bool wants_read(const ClientConnection *client) const;
    void update_interest(ClientConnection *client);
    void read_client(ClientConnection *client);
    // True while the head is still incomplete and reading should go on.
    bool process_head(ClientConnection *client);
    void client_eof(ClientConnection *client);
    void flush_client(ClientConnection *client);

    void activate_session(ClientConnection *client);
    void forward_local(ClientConnection *client, const uint8_t *data, size_t len);
    void finish_request(ClientConnection *client);
    void handle_open_timeout(uint32_t session_id);

    void respond_error(ClientConnection *client, int status, const std::string &detail);
    void fail_session(ClientConnection *client, ErrorReason reason, bool notify_peer, const std::string &detail);
    void complete_session(ClientConnection *client);
    void remove_client(ClientConnection *client);
    void notify(const ClientConnection *client);

    void on_link_up() override;
    void on_frame(const Frame &frame) override;
    void on_link_down(ErrorReason reason) override;
    void on_link_drained() override;
    void on_link_gave_up() override;

    void shutdown_sessions();

public:
    ShipMultiplexer(const ShipOptions &options, std::shared_ptr<Crypto> crypto);
    ~ShipMultiplexer();

    void run() override;
    void stop() override;

    uint16_t listen_port() const;
    size_t session_count() const override { return live_sessions; }
    LinkState link_state() const override { return link.state(); }

    // Must be set before run().
    void set_session_observer(SessionObserver callback) { observer = std::move(callback); }
};

#endif
