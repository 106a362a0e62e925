#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/socket.h>
#include "offshore_demultiplexer.hpp"
#include "logger.hpp"
#include "protocol/frame.hpp"

namespace
{
    constexpr int READS_PER_EVENT = 16;

    LinkSettings link_settings(const OffshoreOptions &options)
    {
        LinkSettings settings;
        settings.frame_stall_timeout_ms = options.frame_stall_timeout_ms;
        return settings;
    }

    ErrorReason reason_for_errno(int err)
    {
        switch (err)
        {
        case ECONNREFUSED:
            return ErrorReason::CONNECTION_REFUSED;
        case ETIMEDOUT:
            return ErrorReason::TIMEOUT;
        case EHOSTUNREACH:
        case ENETUNREACH:
            return ErrorReason::UNREACHABLE;
        default:
            return ErrorReason::TARGET_RESET;
        }
    }
}

OffshoreDemultiplexer::OffshoreDemultiplexer(const OffshoreOptions &options, std::shared_ptr<Crypto> crypto)
    : options(options), link(loop, *this, std::move(crypto), link_settings(options)),
      resolver(loop, options.resolver_threads)
{
    link.listen(options.listen_host, options.listen_port);
}

void OffshoreDemultiplexer::run()
{
    loop.run();
    shutdown_sessions();
}

void OffshoreDemultiplexer::stop()
{
    running = false;
    loop.stop();
}

void OffshoreDemultiplexer::shutdown_sessions()
{
    LOG_INFO("Shutting down ", targets.size(), " session(s)");
    for (uint32_t id : targets.ids())
    {
        TargetConnection *target = targets.find(id);
        if (target && !target->removed)
        {
            fail_session(target, ErrorReason::SHUTDOWN, true, "offshore shutting down");
            target->socket.reset();
        }
    }
    link.stop();
}

void OffshoreDemultiplexer::open_session(uint32_t session_id, const OpenRequest &request)
{
    TargetConnection *existing = targets.find(session_id);
    if (existing && !existing->removed)
    {
        LOG_WARN("Session ", session_id, " opened twice");
        fail_session(existing, ErrorReason::INVALID_STATE, true, "session id already in use");
        return;
    }

    uint64_t serial = next_serial++;
    TargetConnection *target = targets.insert(session_id, std::make_unique<TargetConnection>(session_id, serial));
    target->session.open(request.target, request.mode);
    live_sessions = targets.size();
    LOG_INFO("Session ", session_id, " opening ", to_string(request.mode), " to ", request.target.to_string());
    notify(target);

    resolver.resolve(request.target.host, request.target.port, [this, session_id, serial](ResolveResult result)
                     { handle_resolved(session_id, serial, std::move(result)); });
}

void OffshoreDemultiplexer::handle_resolved(uint32_t session_id, uint64_t serial, ResolveResult result)
{
    TargetConnection *target = targets.find(session_id);
    if (!target || target->removed || target->serial != serial ||
        target->session.state() != SessionState::OPENING)
        return;

    if (result.error != 0)
    {
        fail_session(target, ErrorReason::DNS_FAILURE, true,
                     "cannot resolve " + target->session.target().host + ": " + result.message);
        return;
    }
    target->addresses = std::move(result.addresses);
    target->address_index = 0;
    try_next_address(target);
}

void OffshoreDemultiplexer::try_next_address(TargetConnection *target)
{
    uint32_t id = target->session.id();
    while (target->address_index < target->addresses.size())
    {
        const SocketAddress &address = target->addresses[target->address_index++];
        int err = target->socket.start_connect(address);
        if (err != 0)
        {
            target->connect_failure = reason_for_errno(err);
            target->connect_error = errno_string(err);
            continue;
        }

        int fd = target->socket.get_fd();
        if (!loop.add(fd, EPOLLOUT, [this, id](uint32_t events)
                      { handle_target_events(id, events); }))
        {
            target->socket.reset();
            target->connect_error = "cannot watch target socket";
            continue;
        }
        target->registered = true;
        target->registered_events = EPOLLOUT;
        targets.bind_fd(fd, id);
        target->connect_timer = loop.run_after(options.connect_timeout_ms, [this, id]()
                                               { handle_connect_timeout(id); });
        return;
    }

    fail_session(target, target->connect_failure,
                 true, target->connect_error.empty() ? "no usable address" : target->connect_error);
}

void OffshoreDemultiplexer::handle_connect_timeout(uint32_t session_id)
{
    TargetConnection *target = targets.find(session_id);
    if (!target || target->removed || target->connected)
        return;
    target->connect_timer = 0;

    int fd = target->socket.get_fd();
    if (target->registered)
    {
        loop.remove(fd);
        target->registered = false;
    }
    targets.unbind_fd(fd);
    target->socket.reset();

    target->connect_failure = ErrorReason::TIMEOUT;
    target->connect_error = "connect timed out after " + std::to_string(options.connect_timeout_ms) + " ms";
    try_next_address(target);
}

void OffshoreDemultiplexer::target_connected(TargetConnection *target)
{
    uint32_t id = target->session.id();
    target->connected = true;
    target->session.activate();
    LOG_INFO("Session ", id, " connected to ", target->session.target().to_string());
    notify(target);

    if (!link.send(make_open_ack_frame(id)))
        return;
    arm_idle_timer(target);
    update_interest(target);
}

void OffshoreDemultiplexer::handle_target_events(uint32_t session_id, uint32_t events)
{
    TargetConnection *target = targets.find(session_id);
    if (!target || target->removed)
        return;

    if (!target->connected)
    {
        int err = target->socket.finish_connect();
        if (err == EINPROGRESS)
            return;
        if (target->connect_timer)
        {
            loop.cancel_timer(target->connect_timer);
            target->connect_timer = 0;
        }
        if (err != 0)
        {
            int fd = target->socket.get_fd();
            loop.remove(fd);
            target->registered = false;
            targets.unbind_fd(fd);
            target->socket.reset();
            target->connect_failure = reason_for_errno(err);
            target->connect_error = errno_string(err);
            try_next_address(target);
            return;
        }
        target_connected(target);
        return;
    }

    if (events & EPOLLERR)
    {
        int err = target->socket.finish_connect();
        if (err == 0 || err == EINPROGRESS)
            err = ECONNRESET;
        fail_session(target, reason_for_errno(err), true, "target connection error: " + errno_string(err));
        return;
    }
    if (events & EPOLLOUT)
    {
        flush_target(target);
        if (target->removed)
            return;
    }
    if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP))
    {
        if (wants_read(target))
            read_target(target);
        else if (events & EPOLLHUP)
            target_eof(target);
    }
}

bool OffshoreDemultiplexer::wants_read(const TargetConnection *target) const
{
    const Session &session = target->session;
    return target->connected && session.state() == SessionState::ACTIVE && !session.local_finished() &&
           !link.congested() && session.available_send_window() > 0;
}

void OffshoreDemultiplexer::update_interest(TargetConnection *target)
{
    if (target->removed || !target->connected)
        return;

    uint32_t events = 0;
    if (wants_read(target))
        events |= EPOLLIN | EPOLLRDHUP;
    if (target->session.pending_size() > 0)
        events |= EPOLLOUT;

    int fd = target->socket.get_fd();
    if (events == 0)
    {
        if (target->registered)
        {
            loop.remove(fd);
            target->registered = false;
        }
        return;
    }
    if (!target->registered)
    {
        uint32_t id = target->session.id();
        if (!loop.add(fd, events, [this, id](uint32_t ev)
                      { handle_target_events(id, ev); }))
        {
            fail_session(target, ErrorReason::TARGET_RESET, true, "cannot watch target socket");
            return;
        }
        target->registered = true;
    }
    else if (events != target->registered_events)
    {
        loop.modify(fd, events);
    }
    target->registered_events = events;
}

void OffshoreDemultiplexer::read_target(TargetConnection *target)
{
    uint8_t buffer[BUFFER_SIZE];
    Session &session = target->session;
    uint32_t id = session.id();

    for (int i = 0; i < READS_PER_EVENT && !target->removed && wants_read(target); ++i)
    {
        size_t room = std::min(sizeof(buffer), session.available_send_window());
        ssize_t n = target->socket.recv_data(buffer, room);
        if (n > 0)
        {
            arm_idle_timer(target);
            size_t used = static_cast<size_t>(n);
            if (session.mode() == SessionMode::REQUEST_RESPONSE)
                used = target->response.feed(buffer, used);

            if (used > 0)
            {
                session.use_send_window(used);
                if (!link.send(make_data_frame(id, buffer, used)))
                    return;
            }
            if (session.mode() == SessionMode::REQUEST_RESPONSE && target->response.complete())
            {
                finish_response(target);
                return;
            }
            continue;
        }
        if (n == 0)
        {
            target_eof(target);
            return;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;

        int err = errno;
        fail_session(target, reason_for_errno(err), true, "target read failed: " + errno_string(err));
        return;
    }
    update_interest(target);
}

void OffshoreDemultiplexer::target_eof(TargetConnection *target)
{
    Session &session = target->session;
    if (session.mode() == SessionMode::REQUEST_RESPONSE)
    {
        if (target->response.close_ends_response())
            finish_response(target);
        else
            fail_session(target, ErrorReason::TARGET_RESET, true, "target closed before the response was complete");
        return;
    }

    LOG_DEBUG("Session ", session.id(), " target finished sending");
    if (session.close_local())
        link.send(make_close_frame(session.id()));
    if (session.state() == SessionState::CLOSED)
    {
        complete_session(target);
        return;
    }
    update_interest(target);
}

void OffshoreDemultiplexer::flush_target(TargetConnection *target)
{
    Session &session = target->session;
    while (session.pending_size() > 0)
    {
        ssize_t n = target->socket.send_data(session.pending_data(), session.pending_size());
        if (n > 0)
        {
            session.consume(static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK)
            break;

        int err = errno;
        fail_session(target, reason_for_errno(err), true, "target write failed: " + errno_string(err));
        return;
    }

    uint32_t credit = session.take_window_update();
    if (credit > 0)
        link.send(make_window_frame(session.id(), credit));

    if (session.state() == SessionState::CLOSED)
    {
        complete_session(target);
        return;
    }
    if (session.mode() == SessionMode::TUNNEL && session.remote_finished() &&
        session.pending_size() == 0 && !target->write_shut)
    {
        target->socket.shutdown_write();
        target->write_shut = true;
    }
    update_interest(target);
}

void OffshoreDemultiplexer::arm_idle_timer(TargetConnection *target)
{
    if (target->session.mode() != SessionMode::REQUEST_RESPONSE)
        return;
    if (target->idle_timer)
        loop.cancel_timer(target->idle_timer);

    uint32_t id = target->session.id();
    uint64_t serial = target->serial;
    target->idle_timer = loop.run_after(options.response_idle_timeout_ms, [this, id, serial]()
                                        {
                                            TargetConnection *idle = targets.find(id);
                                            if (!idle || idle->removed || idle->serial != serial)
                                                return;
                                            idle->idle_timer = 0;
                                            fail_session(idle, ErrorReason::TIMEOUT, true,
                                                         "target silent for " + std::to_string(options.response_idle_timeout_ms) + " ms");
                                        });
}

void OffshoreDemultiplexer::finish_response(TargetConnection *target)
{
    Session &session = target->session;
    LOG_DEBUG("Session ", session.id(), " response complete (status ", target->response.status(), ")");
    if (session.close_local())
        link.send(make_close_frame(session.id()));
    // request bytes the target never read are dropped with the connection
    session.discard_pending();
    session.close();
    complete_session(target);
}

void OffshoreDemultiplexer::fail_session(TargetConnection *target, ErrorReason reason, bool notify_peer,
                                         const std::string &detail)
{
    uint32_t id = target->session.id();
    if (target->session.fail(reason))
    {
        LOG_WARN("Session ", id, " failed (", to_string(reason), "): ", detail);
        notify(target);
        if (notify_peer)
            link.send(make_error_frame(id, reason, detail));
    }
    remove_target(target);
}

void OffshoreDemultiplexer::complete_session(TargetConnection *target)
{
    LOG_INFO("Session ", target->session.id(), " closed");
    notify(target);
    remove_target(target);
}

void OffshoreDemultiplexer::remove_target(TargetConnection *target)
{
    if (target->removed)
        return;
    target->removed = true;
    if (target->connect_timer)
        loop.cancel_timer(target->connect_timer);
    if (target->idle_timer)
        loop.cancel_timer(target->idle_timer);

    int fd = target->socket.get_fd();
    if (target->registered)
        loop.remove(fd);
    if (fd >= 0)
        targets.unbind_fd(fd);

    // the entry can still be on the caller's stack; it dies on the next loop pass
    std::shared_ptr<TargetConnection> doomed(targets.remove(target->session.id()));
    live_sessions = targets.size();
    loop.post([doomed]() {});
}

void OffshoreDemultiplexer::notify(const TargetConnection *target)
{
    if (observer)
        observer(target->session.id(), target->session.state(), target->session.failure_reason());
}

void OffshoreDemultiplexer::on_link_up()
{
    LOG_INFO("Link from ship is up");
}

void OffshoreDemultiplexer::on_link_down(ErrorReason reason)
{
    LOG_WARN("Link from ship lost (", to_string(reason), "), failing ", targets.size(), " session(s)");
    for (uint32_t id : targets.ids())
    {
        TargetConnection *target = targets.find(id);
        if (target && !target->removed)
            fail_session(target, ErrorReason::LINK_LOST, false, "link from ship lost");
    }
}

void OffshoreDemultiplexer::on_link_drained()
{
    for (uint32_t id : targets.ids())
    {
        TargetConnection *target = targets.find(id);
        if (target && !target->removed)
            update_interest(target);
    }
}

void OffshoreDemultiplexer::on_frame(const Frame &frame)
{
    if (frame.type == FrameType::OPEN && !frame.payload.empty())
    {
        open_session(frame.session_id, parse_open_payload(frame));
        return;
    }

    TargetConnection *target = targets.find(frame.session_id);
    if (!target || target->removed || target->session.is_terminal())
    {
        LOG_WARN("Dropping ", to_string(frame.type), " frame for unknown or finished session ", frame.session_id);
        return;
    }

    Session &session = target->session;
    try
    {
        switch (frame.type)
        {
        case FrameType::OPEN:
            throw InvalidState("empty OPEN from ship");
        case FrameType::DATA:
            if (session.mode() == SessionMode::REQUEST_RESPONSE && !target->method_checked)
            {
                target->method_checked = true;
                target->response.set_head_request(frame.payload.size() >= 5 &&
                                                  memcmp(frame.payload.data(), "HEAD ", 5) == 0);
            }
            session.accept_data(frame.payload.data(), frame.payload.size());
            arm_idle_timer(target);
            break;
        case FrameType::CLOSE:
            if (session.state() == SessionState::OPENING)
            {
                LOG_DEBUG("Session ", session.id(), " closed by ship before the target answered");
                session.close();
                complete_session(target);
                return;
            }
            LOG_DEBUG("Session ", session.id(), " ship finished sending");
            session.close_remote();
            break;
        case FrameType::ERROR:
        {
            ErrorInfo info = parse_error_payload(frame);
            fail_session(target, info.reason, false, info.detail.empty() ? to_string(info.reason) : info.detail);
            return;
        }
        case FrameType::WINDOW:
            session.grant_send_window(parse_window_payload(frame));
            break;
        }
    }
    catch (const InvalidState &e)
    {
        LOG_WARN("Session ", session.id(), " protocol violation: ", e.what());
        fail_session(target, ErrorReason::INVALID_STATE, true, e.what());
        return;
    }

    if (session.state() == SessionState::OPENING)
        return;
    flush_target(target);
}
