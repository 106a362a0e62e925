#ifndef LINK_SUPERVISOR_HPP
#define LINK_SUPERVISOR_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "connection.hpp"
#include "event_loop.hpp"
#include "network_utils.hpp"
#include "resolver.hpp"
#include "crypto/crypto.hpp"
#include "protocol/frame.hpp"
#include "protocol/frame_codec.hpp"

enum class LinkState
{
    DOWN,
    CONNECTING,
    UP,
    GAVE_UP,
};

const char *to_string(LinkState state);

// Callbacks into the endpoint that owns the link. All of them run on the
// endpoint's event loop; up/down/drained are delivered as posted tasks so they
// never re-enter the endpoint from inside LinkSupervisor::send().
class LinkHandler
{
public:
    virtual ~LinkHandler() = default;
    virtual void on_link_up() = 0;
    virtual void on_frame(const Frame &frame) = 0;
    virtual void on_link_down(ErrorReason reason) = 0;
    virtual void on_link_drained() = 0;
    virtual void on_link_gave_up() {}
};

struct LinkSettings
{
    int frame_stall_timeout_ms = FRAME_STALL_TIMEOUT_MS;
    int connect_timeout_ms = LINK_CONNECT_TIMEOUT_MS;
    int reconnect_attempts = RECONNECT_ATTEMPTS;
    int initial_backoff_ms = RECONNECT_INITIAL_BACKOFF_MS;
    int max_backoff_ms = RECONNECT_MAX_BACKOFF_MS;
};

// Owns the single ship<->offshore connection. The ship side dials and
// redials with backoff; the offshore side listens and adopts whichever
// connection arrives last.
class LinkSupervisor
{
private:
    EventLoop &loop;
    LinkHandler &handler;
    std::shared_ptr<Crypto> crypto;
    LinkSettings settings;

    Connection link;
    std::atomic<LinkState> link_state{LinkState::DOWN};
    bool stopping = false;

    // hello: magic, version, cipher id, iv
    std::vector<uint8_t> hello_in;
    bool hello_done = false;
    std::chrono::steady_clock::time_point attached_at;

    FrameDecoder decoder;
    std::vector<uint8_t> outbound;
    size_t outbound_offset = 0;
    bool want_write = false;
    bool congested_flag = false;
    bool drain_notify_pending = false;
    TimerId stall_timer = 0;

    // ship role
    bool dialing = false;
    std::string remote_host;
    uint16_t remote_port = 0;
    std::vector<SocketAddress> remote_addresses;
    size_t address_index = 0;
    int failed_attempts = 0;
    TimerId connect_timer = 0;
    TimerId retry_timer = 0;
    std::string last_connect_error;
    uint64_t connect_serial = 0;

    // offshore role
    int listen_fd = -1;

    // declared last: its workers are joined before anything above is destroyed
    std::unique_ptr<Resolver> resolver;

    size_t hello_size() const;
    std::vector<uint8_t> build_hello();
    void process_incoming(const uint8_t *data, size_t len);
    void handle_link_events(uint32_t events);
    void read_link();
    void flush();
    void update_write_interest();
    void fail_link(ErrorReason reason, const std::string &why);
    void check_stall();

    void start_connect_attempt();
    void handle_resolved(uint64_t attempt, ResolveResult result);
    void try_next_address();
    void handle_connect_event();
    void connect_attempt_failed(const std::string &why);
    void schedule_retry(int delay_ms);
    bool dialing_role() const { return dialing; }

    void handle_accept();

public:
    LinkSupervisor(EventLoop &loop, LinkHandler &handler, std::shared_ptr<Crypto> crypto,
                   const LinkSettings &settings = LinkSettings());
    ~LinkSupervisor();

    LinkSupervisor(const LinkSupervisor &) = delete;
    LinkSupervisor &operator=(const LinkSupervisor &) = delete;

    // Ship role: dial host:port now and redial after every failure.
    void connect(const std::string &host, uint16_t port);
    // Offshore role: bind the listener (throws on failure) and accept links.
    void listen(const std::string &host, uint16_t port);
    uint16_t listen_port() const;

    // Adopts a connected socket as the link, replacing any current one.
    void attach(int fd);

    // Queues one whole encoded frame. False when the link is not up.
    bool send(const Frame &frame);

    // Outbound buffer above the high watermark; stays set until it drains below the low one.
    bool congested() const { return congested_flag; }
    size_t queued_bytes() const { return outbound.size() - outbound_offset; }
    LinkState state() const { return link_state; }

    // Tears the link down for good without notifying the handler.
    void stop();
};

#endif
