#ifndef OFFSHORE_DEMULTIPLEXER_HPP
#define OFFSHORE_DEMULTIPLEXER_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "tunnel.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "event_loop.hpp"
#include "http_framing.hpp"
#include "link_supervisor.hpp"
#include "network_utils.hpp"
#include "resolver.hpp"
#include "session.hpp"
#include "session_store.hpp"
#include "crypto/crypto.hpp"

// Offshore side: turns link sessions into real connections to target servers.
class OffshoreDemultiplexer : public Tunnel, private LinkHandler
{
private:
    struct TargetConnection
    {
        Connection socket;
        Session session;
        uint64_t serial;

        std::vector<SocketAddress> addresses;
        size_t address_index = 0;
        ErrorReason connect_failure = ErrorReason::CONNECTION_REFUSED;
        std::string connect_error;
        bool connected = false;

        ResponseFramer response;
        bool method_checked = false;
        bool write_shut = false;
        bool removed = false;

        bool registered = false;
        uint32_t registered_events = 0;
        TimerId connect_timer = 0;
        TimerId idle_timer = 0;

        TargetConnection(uint32_t id, uint64_t serial) : session(id), serial(serial) {}
    };

    OffshoreOptions options;
    EventLoop loop;
    LinkSupervisor link;
    Resolver resolver;
    SessionStore<TargetConnection> targets;

    uint64_t next_serial = 1;
    std::atomic<size_t> live_sessions{0};
    SessionObserver observer;

    void open_session(uint32_t session_id, const OpenRequest &request);
    void handle_resolved(uint32_t session_id, uint64_t serial, ResolveResult result);
    void try_next_address(TargetConnection *target);
    void handle_connect_timeout(uint32_t session_id);
    void target_connected(TargetConnection *target);

    void handle_target_events(uint32_t session_id, uint32_t events);
    bool wants_read(const TargetConnection *target) const;
    void update_interest(TargetConnection *target);
    void read_target(TargetConnection *target);
    void target_eof(TargetConnection *target);
    void flush_target(TargetConnection *target);
    void arm_idle_timer(TargetConnection *target);

    void finish_response(TargetConnection *target);
    void fail_session(TargetConnection *target, ErrorReason reason, bool notify_peer, const std::string &detail);
    void complete_session(TargetConnection *target);
    void remove_target(TargetConnection *target);
    void notify(const TargetConnection *target);

    void on_link_up() override;
    void on_frame(const Frame &frame) override;
    void on_link_down(ErrorReason reason) override;
    void on_link_drained() override;

    void shutdown_sessions();

public:
    OffshoreDemultiplexer(const OffshoreOptions &options, std::shared_ptr<Crypto> crypto);

    void run() override;
    void stop() override;

    uint16_t listen_port() const { return link.listen_port(); }
    size_t session_count() const override { return live_sessions; }
    LinkState link_state() const override { return link.state(); }

    // Must be set before run().
    void set_session_observer(SessionObserver callback) { observer = std::move(callback); }
};

#endif
