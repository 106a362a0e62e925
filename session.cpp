#include "session.hpp"
#include <algorithm>

const char *to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::OPENING:
        return "OPENING";
    case SessionState::ACTIVE:
        return "ACTIVE";
    case SessionState::CLOSING:
        return "CLOSING";
    case SessionState::CLOSED:
        return "CLOSED";
    case SessionState::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

Session::Session(uint32_t id, uint32_t window)
    : session_id(id), window_size(window), send_window(window)
{
}

void Session::open(const Target &target, SessionMode mode)
{
    if (opened || session_state != SessionState::OPENING)
        throw InvalidState("session " + std::to_string(session_id) + " is already open");
    session_target = target;
    session_mode = mode;
    opened = true;
}

void Session::activate()
{
    if (session_state == SessionState::ACTIVE)
        return;
    if (session_state != SessionState::OPENING || !opened)
        throw InvalidState("session " + std::to_string(session_id) + " cannot activate from " + to_string(session_state));
    session_state = SessionState::ACTIVE;
}

void Session::accept_data(const uint8_t *data, size_t len)
{
    if (session_state != SessionState::ACTIVE || remote_closed)
        throw InvalidState("session " + std::to_string(session_id) + " rejects data in state " + to_string(session_state));

    size_t outstanding = pending_size() - control_bytes + consumed_uncredited;
    if (outstanding + len > window_size)
        throw InvalidState("session " + std::to_string(session_id) + " peer overran its window");

    if (pending_offset > 0 && pending_offset * 2 >= pending.size())
    {
        pending.erase(pending.begin(), pending.begin() + pending_offset);
        pending_offset = 0;
    }
    pending.insert(pending.end(), data, data + len);
}

void Session::queue_control(const std::string &bytes)
{
    // control bytes always sit at the front: they are queued before any peer data
    pending.insert(pending.begin() + pending_offset, bytes.begin(), bytes.end());
    control_bytes += bytes.size();
}

void Session::consume(size_t n)
{
    n = std::min(n, pending_size());
    size_t control = std::min(n, control_bytes);
    control_bytes -= control;
    consumed_uncredited += n - control;

    pending_offset += n;
    if (pending_offset == pending.size())
    {
        pending.clear();
        pending_offset = 0;
    }
    settle();
}

void Session::discard_pending()
{
    pending.clear();
    pending_offset = 0;
    control_bytes = 0;
    settle();
}

uint32_t Session::take_window_update()
{
    if (is_terminal() || remote_closed || consumed_uncredited < window_size / 2)
        return 0;
    uint32_t credit = static_cast<uint32_t>(consumed_uncredited);
    consumed_uncredited = 0;
    return credit;
}

void Session::use_send_window(size_t n)
{
    send_window -= std::min(n, send_window);
}

void Session::grant_send_window(uint32_t credit)
{
    send_window = std::min<size_t>(send_window + credit, window_size);
}

bool Session::close_local()
{
    if (local_closed || is_terminal())
        return false;
    local_closed = true;
    settle();
    return true;
}

void Session::close_remote()
{
    if (remote_closed || is_terminal())
        return;
    remote_closed = true;
    settle();
}

bool Session::close()
{
    if (is_terminal())
        return false;
    bool emit = !local_closed;
    local_closed = true;
    remote_closed = true;
    settle();
    return emit;
}

bool Session::fail(ErrorReason reason)
{
    if (session_state == SessionState::FAILED)
        return false;
    bool was_closed = session_state == SessionState::CLOSED;
    session_state = SessionState::FAILED;
    failure = reason;
    return !was_closed;
}

void Session::settle()
{
    if (is_terminal() || !(local_closed && remote_closed))
        return;
    session_state = pending_size() == 0 ? SessionState::CLOSED : SessionState::CLOSING;
}
