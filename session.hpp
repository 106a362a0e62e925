#ifndef SESSION_HPP
#define SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "protocol/frame.hpp"

enum class SessionState
{
    OPENING,
    ACTIVE,
    CLOSING,
    CLOSED,
    FAILED,
};

const char *to_string(SessionState state);

// Observes session transitions; called on the endpoint's event loop thread.
using SessionObserver = std::function<void(uint32_t session_id, SessionState state, ErrorReason reason)>;

// An operation that the session's current state does not allow.
class InvalidState : public std::runtime_error
{
public:
    explicit InvalidState(const std::string &what) : std::runtime_error(what) {}
};

// One proxied transaction as seen by one side of the link. Both directions
// end independently (CLOSE is a half-close); the session is CLOSING once both
// have ended and CLOSED once pending_bytes has drained to the local socket.
class Session
{
private:
    uint32_t session_id;
    SessionMode session_mode = SessionMode::REQUEST_RESPONSE;
    SessionState session_state = SessionState::OPENING;
    Target session_target;
    bool opened = false;
    bool local_closed = false;
    bool remote_closed = false;
    ErrorReason failure = ErrorReason::NONE;

    std::vector<uint8_t> pending;
    size_t pending_offset = 0;
    size_t control_bytes = 0;

    uint32_t window_size;
    size_t send_window;
    size_t consumed_uncredited = 0;

    void settle();

public:
    explicit Session(uint32_t id, uint32_t window = INITIAL_WINDOW);

    uint32_t id() const { return session_id; }
    SessionMode mode() const { return session_mode; }
    SessionState state() const { return session_state; }
    const Target &target() const { return session_target; }
    ErrorReason failure_reason() const { return failure; }
    bool was_opened() const { return opened; }
    bool is_terminal() const { return session_state == SessionState::CLOSED || session_state == SessionState::FAILED; }
    bool local_finished() const { return local_closed; }
    bool remote_finished() const { return remote_closed; }

    void open(const Target &target, SessionMode mode);
    void activate();

    // Peer DATA destined for the local socket. Requires ACTIVE and an open
    // remote direction, and must fit in the window granted to the peer.
    void accept_data(const uint8_t *data, size_t len);

    // Locally generated bytes (status lines) queued ahead of peer data.
    void queue_control(const std::string &bytes);

    const uint8_t *pending_data() const { return pending.data() + pending_offset; }
    size_t pending_size() const { return pending.size() - pending_offset; }

    // Drops n flushed bytes from the front of pending_bytes.
    void consume(size_t n);
    void discard_pending();

    // Credit to announce to the peer, or 0 while below half a window.
    uint32_t take_window_update();

    size_t available_send_window() const { return send_window; }
    void use_send_window(size_t n);
    void grant_send_window(uint32_t credit);

    // Each returns true only on the call that actually ends the direction,
    // so the caller emits at most one CLOSE frame.
    bool close_local();
    void close_remote();
    bool close();

    // Moves to FAILED from any state. Returns false if the session was already terminal.
    bool fail(ErrorReason reason);
};

#endif
