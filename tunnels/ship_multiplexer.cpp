#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include "ship_multiplexer.hpp"
#include "logger.hpp"
#include "network_utils.hpp"
#include "protocol/frame.hpp"

namespace
{
    constexpr int READS_PER_EVENT = 16;
    const std::string CONNECT_ESTABLISHED = "HTTP/1.1 200 Connection Established\r\n\r\n";

    LinkSettings link_settings(const ShipOptions &options)
    {
        LinkSettings settings;
        settings.frame_stall_timeout_ms = options.frame_stall_timeout_ms;
        settings.connect_timeout_ms = options.link_connect_timeout_ms;
        settings.reconnect_attempts = options.reconnect_attempts;
        settings.initial_backoff_ms = options.reconnect_initial_backoff_ms;
        settings.max_backoff_ms = options.reconnect_max_backoff_ms;
        return settings;
    }
}

ShipMultiplexer::ShipMultiplexer(const ShipOptions &options, std::shared_ptr<Crypto> crypto)
    : options(options), link(loop, *this, std::move(crypto), link_settings(options))
{
    listen_fd = create_listener(options.listen_host, options.listen_port);
    LOG_INFO("Ship proxy listening on ", options.listen_host, ":", listen_port());
}

ShipMultiplexer::~ShipMultiplexer()
{
    running = false;
    if (listen_fd >= 0)
    {
        loop.remove(listen_fd);
        close(listen_fd);
    }
}

uint16_t ShipMultiplexer::listen_port() const
{
    return bound_port(listen_fd);
}

void ShipMultiplexer::run()
{
    link.connect(options.offshore_host, options.offshore_port);
    loop.run();
    shutdown_sessions();
}

void ShipMultiplexer::stop()
{
    running = false;
    loop.stop();
}

void ShipMultiplexer::shutdown_sessions()
{
    LOG_INFO("Shutting down ", clients.size(), " session(s)");
    for (uint32_t id : clients.ids())
    {
        ClientConnection *client = clients.find(id);
        if (!client || client->removed)
            continue;
        if (client->session.was_opened() && !client->session.is_terminal())
        {
            fail_session(client, ErrorReason::SHUTDOWN, true, "proxy shutting down");
        }
        // one best-effort write of whatever was queued for the client
        if (!client->removed && client->session.pending_size() > 0)
        {
            ssize_t n = client->socket.send_data(client->session.pending_data(), client->session.pending_size());
            if (n < 0)
                LOG_DEBUG("Session ", id, " final write failed: ", errno_string(errno));
        }
        remove_client(client);
        client->socket.reset();
    }
    set_accepting(false);
    link.stop();
}

void ShipMultiplexer::set_accepting(bool enabled)
{
    if (enabled == accepting)
        return;
    if (enabled)
    {
        if (!loop.add(listen_fd, EPOLLIN, [this](uint32_t)
                      { handle_accept(); }))
            return;
    }
    else
    {
        loop.remove(listen_fd);
    }
    accepting = enabled;
    LOG_DEBUG(enabled ? "Accepting local clients" : "Pausing local accepts");
}

uint32_t ShipMultiplexer::allocate_session_id()
{
    // never 0, never an id that is still in the table
    while (next_session_id == 0 || clients.contains(next_session_id))
    {
        ++next_session_id;
    }
    return next_session_id++;
}

void ShipMultiplexer::handle_accept()
{
    while (true)
    {
        int fd = accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                LOG_WARN("accept failed: ", errno_string(errno));
            return;
        }

        uint32_t id = allocate_session_id();
        ClientConnection *client = clients.insert(id, std::make_unique<ClientConnection>(fd, id));
        clients.bind_fd(fd, id);
        live_sessions = clients.size();
        LOG_DEBUG("Client accepted as session ", id);

        if (link.state() != LinkState::UP)
        {
            respond_error(client, 503, "link to offshore is unavailable");
            continue;
        }
        update_interest(client);
    }
}

bool ShipMultiplexer::wants_read(const ClientConnection *client) const
{
    if (client->draining || !client->head_parsed)
        return true;
    const Session &session = client->session;
    if (session.state() != SessionState::ACTIVE || session.local_finished())
        return false;
    return !link.congested() && session.available_send_window() > 0;
}

void ShipMultiplexer::update_interest(ClientConnection *client)
{
    if (client->removed)
        return;

    uint32_t events = 0;
    if (wants_read(client))
        events |= EPOLLIN | EPOLLRDHUP;
    else if (client->head_parsed && !client->draining && !client->read_shut && client->session.local_finished() &&
             client->session.mode() == SessionMode::REQUEST_RESPONSE && !client->session.is_terminal())
        events |= EPOLLRDHUP; // a client hanging up while it waits for the response
    if (client->session.pending_size() > 0)
        events |= EPOLLOUT;

    int fd = client->socket.get_fd();
    if (events == 0)
    {
        // parked: nothing to do until a window, drain or frame arrives
        if (client->registered)
        {
            loop.remove(fd);
            client->registered = false;
        }
        return;
    }
    if (!client->registered)
    {
        uint32_t id = client->session.id();
        if (!loop.add(fd, events, [this, id](uint32_t ev)
                      { handle_client_events(id, ev); }))
        {
            fail_session(client, ErrorReason::CLIENT_ABORTED, true, "cannot watch client socket");
            return;
        }
        client->registered = true;
    }
    else if (events != client->registered_events)
    {
        loop.modify(fd, events);
    }
    client->registered_events = events;
}

void ShipMultiplexer::handle_client_events(uint32_t session_id, uint32_t events)
{
    ClientConnection *client = clients.find(session_id);
    if (!client || client->removed)
        return;

    if (events & EPOLLERR)
    {
        if (client->draining)
            remove_client(client);
        else
            fail_session(client, ErrorReason::CLIENT_ABORTED, true, "client connection error");
        return;
    }
    if (events & EPOLLOUT)
    {
        flush_client(client);
        if (client->removed)
            return;
    }
    if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP))
    {
        if (wants_read(client))
            read_client(client);
        else if (events & (EPOLLRDHUP | EPOLLHUP))
            client_eof(client);
    }
}

void ShipMultiplexer::read_client(ClientConnection *client)
{
    uint8_t buffer[BUFFER_SIZE];

    for (int i = 0; i < READS_PER_EVENT && !client->removed && wants_read(client); ++i)
    {
        size_t room = sizeof(buffer);
        if (client->head_parsed && !client->draining)
            room = std::min(room, client->session.available_send_window());

        ssize_t n = client->socket.recv_data(buffer, room);
        if (n > 0)
        {
            if (client->draining)
                continue;
            if (!client->head_parsed)
            {
                client->head_buffer.append(reinterpret_cast<const char *>(buffer), n);
                if (!process_head(client))
                    return;
                continue;
            }
            forward_local(client, buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
        {
            client_eof(client);
            return;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;

        if (client->draining)
            remove_client(client);
        else
            fail_session(client, ErrorReason::CLIENT_ABORTED, true, "client read failed: " + errno_string(errno));
        return;
    }
    update_interest(client);
}

bool ShipMultiplexer::process_head(ClientConnection *client)
{
    size_t end = find_head_end(client->head_buffer);
    if (end == std::string::npos)
    {
        if (client->head_buffer.size() > MAX_REQUEST_HEAD)
        {
            respond_error(client, 400, "request head too large");
            return false;
        }
        return true;
    }

    std::string head = client->head_buffer.substr(0, end);
    client->held.assign(client->head_buffer.begin() + end, client->head_buffer.end());
    client->head_buffer.clear();
    client->head_parsed = true;

    std::string error;
    if (!parse_request_head(head, client->request, error))
    {
        LOG_WARN("Session ", client->session.id(), " bad request: ", error);
        respond_error(client, 400, error);
        return false;
    }
    if (client->request.mode == SessionMode::REQUEST_RESPONSE &&
        !request_body_framer(client->request, client->body, error))
    {
        LOG_WARN("Session ", client->session.id(), " bad request: ", error);
        respond_error(client, 400, error);
        return false;
    }
    if (link.state() != LinkState::UP)
    {
        respond_error(client, 503, "link to offshore is unavailable");
        return false;
    }

    uint32_t id = client->session.id();
    client->session.open(client->request.target, client->request.mode);
    LOG_INFO("Session ", id, " opening ", to_string(client->request.mode), " to ", client->request.target.to_string());
    notify(client);

    if (!link.send(make_open_frame(id, client->request.mode, client->request.target)))
    {
        fail_session(client, ErrorReason::LINK_LOST, false, "link to offshore went down");
        return false;
    }
    client->open_timer = loop.run_after(options.open_timeout_ms, [this, id]()
                                        { handle_open_timeout(id); });
    update_interest(client);
    return false;
}

void ShipMultiplexer::handle_open_timeout(uint32_t session_id)
{
    ClientConnection *client = clients.find(session_id);
    if (!client || client->removed)
        return;
    client->open_timer = 0;
    if (client->session.state() != SessionState::OPENING)
        return;
    LOG_WARN("Session ", session_id, " was not acknowledged within ", options.open_timeout_ms, " ms");
    fail_session(client, ErrorReason::TIMEOUT, true, "offshore did not answer in time");
}

void ShipMultiplexer::activate_session(ClientConnection *client)
{
    client->session.activate();
    if (client->open_timer)
    {
        loop.cancel_timer(client->open_timer);
        client->open_timer = 0;
    }
    LOG_INFO("Session ", client->session.id(), " established to ", client->session.target().to_string());
    notify(client);

    if (client->session.mode() == SessionMode::TUNNEL)
    {
        client->session.queue_control(CONNECT_ESTABLISHED);
        client->response_started = true;
    }
    else
    {
        std::string head = build_forward_head(client->request);
        client->session.use_send_window(head.size());
        if (!link.send(make_data_frame(client->session.id(), reinterpret_cast<const uint8_t *>(head.data()), head.size())))
            return;
        if (client->body.complete())
            finish_request(client);
    }

    if (!client->held.empty())
    {
        std::vector<uint8_t> held;
        held.swap(client->held);
        forward_local(client, held.data(), held.size());
    }
}

void ShipMultiplexer::forward_local(ClientConnection *client, const uint8_t *data, size_t len)
{
    if (client->session.local_finished())
        return;

    size_t used = len;
    if (client->session.mode() == SessionMode::REQUEST_RESPONSE)
    {
        used = client->body.feed(data, len);
        if (used < len)
            LOG_DEBUG("Session ", client->session.id(), " ignoring ", len - used, " byte(s) past the request");
    }

    if (used > 0)
    {
        client->session.use_send_window(used);
        if (!link.send(make_data_frame(client->session.id(), data, used)))
            return;
    }
    if (client->session.mode() == SessionMode::REQUEST_RESPONSE && client->body.complete())
        finish_request(client);
}

void ShipMultiplexer::finish_request(ClientConnection *client)
{
    client->request_complete = true;
    if (client->session.close_local())
        link.send(make_close_frame(client->session.id()));
}

void ShipMultiplexer::client_eof(ClientConnection *client)
{
    uint32_t id = client->session.id();
    if (client->draining || !client->head_parsed)
    {
        LOG_DEBUG("Client of session ", id, " went away");
        remove_client(client);
        return;
    }

    if (client->session.mode() == SessionMode::TUNNEL && client->session.state() == SessionState::ACTIVE)
    {
        LOG_DEBUG("Session ", id, " client finished sending");
        if (client->session.close_local())
            link.send(make_close_frame(id));
        if (client->session.state() == SessionState::CLOSED)
        {
            complete_session(client);
            return;
        }
        update_interest(client);
        return;
    }

    // EOF after a whole request is a half-close; the response is still relayed
    if (client->session.mode() == SessionMode::REQUEST_RESPONSE && client->request_complete && !client->read_shut)
    {
        LOG_DEBUG("Session ", id, " client finished sending, awaiting the response");
        client->read_shut = true;
        update_interest(client);
        return;
    }

    fail_session(client, ErrorReason::CLIENT_ABORTED, true, "client closed the connection");
}

void ShipMultiplexer::flush_client(ClientConnection *client)
{
    Session &session = client->session;
    while (session.pending_size() > 0)
    {
        ssize_t n = client->socket.send_data(session.pending_data(), session.pending_size());
        if (n > 0)
        {
            session.consume(static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK)
            break;

        if (client->draining)
            remove_client(client);
        else
            fail_session(client, ErrorReason::CLIENT_ABORTED, true, "client write failed: " + errno_string(errno));
        return;
    }

    if (client->draining)
    {
        if (session.pending_size() == 0 && !client->write_shut)
        {
            client->socket.shutdown_write();
            client->write_shut = true;
            uint32_t id = session.id();
            client->linger_timer = loop.run_after(CLIENT_LINGER_MS, [this, id]()
                                                  {
                                                      ClientConnection *lingering = clients.find(id);
                                                      if (lingering)
                                                      {
                                                          lingering->linger_timer = 0;
                                                          remove_client(lingering);
                                                      }
                                                  });
        }
        update_interest(client);
        return;
    }

    uint32_t credit = session.take_window_update();
    if (credit > 0)
        link.send(make_window_frame(session.id(), credit));

    // a finished response ends the exchange even if the request body never completed
    if (session.mode() == SessionMode::REQUEST_RESPONSE && session.remote_finished() &&
        session.pending_size() == 0 && !session.local_finished())
        session.close();

    if (session.state() == SessionState::CLOSED)
    {
        complete_session(client);
        return;
    }
    if (session.mode() == SessionMode::TUNNEL && session.remote_finished() &&
        session.pending_size() == 0 && !client->write_shut)
    {
        client->socket.shutdown_write();
        client->write_shut = true;
    }
    update_interest(client);
}

void ShipMultiplexer::respond_error(ClientConnection *client, int status, const std::string &detail)
{
    if (client->open_timer)
    {
        loop.cancel_timer(client->open_timer);
        client->open_timer = 0;
    }
    client->session.discard_pending();
    client->session.queue_control(build_error_response(status, detail));
    client->response_started = true;
    client->draining = true;
    LOG_INFO("Session ", client->session.id(), " answered ", status, " locally: ", detail);
    flush_client(client);
}

void ShipMultiplexer::fail_session(ClientConnection *client, ErrorReason reason, bool notify_peer,
                                   const std::string &detail)
{
    uint32_t id = client->session.id();
    bool opened = client->session.was_opened();
    if (!client->session.fail(reason))
        return;

    LOG_WARN("Session ", id, " failed (", to_string(reason), "): ", detail);
    if (opened)
    {
        notify(client);
        if (notify_peer)
            link.send(make_error_frame(id, reason, detail));
    }

    if (reason == ErrorReason::CLIENT_ABORTED || client->response_started)
    {
        remove_client(client);
        return;
    }
    respond_error(client, status_for_reason(reason), detail);
}

void ShipMultiplexer::complete_session(ClientConnection *client)
{
    LOG_INFO("Session ", client->session.id(), " closed");
    notify(client);
    remove_client(client);
}

void ShipMultiplexer::remove_client(ClientConnection *client)
{
    if (client->removed)
        return;
    client->removed = true;
    if (client->open_timer)
        loop.cancel_timer(client->open_timer);
    if (client->linger_timer)
        loop.cancel_timer(client->linger_timer);

    int fd = client->socket.get_fd();
    if (client->registered)
        loop.remove(fd);
    clients.unbind_fd(fd);

    // the entry can still be on the caller's stack; it dies on the next loop pass
    std::shared_ptr<ClientConnection> doomed(clients.remove(client->session.id()));
    live_sessions = clients.size();
    loop.post([doomed]() {});
}

void ShipMultiplexer::notify(const ClientConnection *client)
{
    if (observer)
        observer(client->session.id(), client->session.state(), client->session.failure_reason());
}

void ShipMultiplexer::on_link_up()
{
    LOG_INFO("Link to offshore is up");
    set_accepting(true);
}

void ShipMultiplexer::on_link_gave_up()
{
    LOG_ERROR("Link to offshore is gone for good, refusing new clients with 503");
    set_accepting(true);
}

void ShipMultiplexer::on_link_down(ErrorReason reason)
{
    LOG_WARN("Link to offshore lost (", to_string(reason), "), failing ", clients.size(), " session(s)");
    set_accepting(false);
    for (uint32_t id : clients.ids())
    {
        ClientConnection *client = clients.find(id);
        if (!client || client->removed || !client->session.was_opened() || client->session.is_terminal())
            continue;
        fail_session(client, ErrorReason::LINK_LOST, false, "link to offshore lost");
    }
}

void ShipMultiplexer::on_link_drained()
{
    for (uint32_t id : clients.ids())
    {
        ClientConnection *client = clients.find(id);
        if (client && !client->removed)
            update_interest(client);
    }
}

void ShipMultiplexer::on_frame(const Frame &frame)
{
    ClientConnection *client = clients.find(frame.session_id);
    if (!client || client->removed || !client->session.was_opened() || client->session.is_terminal())
    {
        LOG_WARN("Dropping ", to_string(frame.type), " frame for unknown or finished session ", frame.session_id);
        return;
    }

    Session &session = client->session;
    try
    {
        switch (frame.type)
        {
        case FrameType::OPEN:
            if (!frame.payload.empty() || session.state() != SessionState::OPENING)
                throw InvalidState("unexpected OPEN from offshore");
            activate_session(client);
            break;
        case FrameType::DATA:
            if (session.state() == SessionState::OPENING)
                activate_session(client);
            if (client->removed)
                return;
            session.accept_data(frame.payload.data(), frame.payload.size());
            client->response_started = true;
            break;
        case FrameType::CLOSE:
            if (session.state() == SessionState::OPENING)
                activate_session(client);
            if (client->removed)
                return;
            LOG_DEBUG("Session ", session.id(), " offshore finished sending");
            session.close_remote();
            break;
        case FrameType::ERROR:
        {
            ErrorInfo info = parse_error_payload(frame);
            fail_session(client, info.reason, false, info.detail.empty() ? to_string(info.reason) : info.detail);
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
        fail_session(client, ErrorReason::INVALID_STATE, true, e.what());
        return;
    }

    if (!client->removed)
        flush_client(client);
}
