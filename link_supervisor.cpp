#include "link_supervisor.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <openssl/rand.h>

namespace
{
    constexpr uint8_t LINK_MAGIC[4] = {'S', 'H', 'P', 'X'};
    constexpr uint8_t LINK_VERSION = 1;
    constexpr size_t HELLO_PREFIX_SIZE = 6;
    constexpr int STALL_CHECK_INTERVAL_MS = 1000;
    constexpr int READS_PER_EVENT = 16;
}

const char *to_string(LinkState state)
{
    switch (state)
    {
    case LinkState::DOWN:
        return "DOWN";
    case LinkState::CONNECTING:
        return "CONNECTING";
    case LinkState::UP:
        return "UP";
    case LinkState::GAVE_UP:
        return "GAVE_UP";
    }
    return "UNKNOWN";
}

LinkSupervisor::LinkSupervisor(EventLoop &loop, LinkHandler &handler, std::shared_ptr<Crypto> crypto,
                               const LinkSettings &settings)
    : loop(loop), handler(handler), crypto(std::move(crypto)), settings(settings)
{
}

LinkSupervisor::~LinkSupervisor()
{
    stop();
}

size_t LinkSupervisor::hello_size() const
{
    return HELLO_PREFIX_SIZE + (crypto ? crypto->iv_size() : 0);
}

std::vector<uint8_t> LinkSupervisor::build_hello()
{
    std::vector<uint8_t> hello(LINK_MAGIC, LINK_MAGIC + 4);
    hello.push_back(LINK_VERSION);
    hello.push_back(static_cast<uint8_t>(crypto ? crypto->id() : CipherId::NONE));

    if (crypto)
    {
        std::vector<uint8_t> iv(crypto->iv_size());
        if (!iv.empty() && RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1)
        {
            throw std::runtime_error("RAND_bytes failed");
        }
        crypto->begin_encrypt(iv);
        hello.insert(hello.end(), iv.begin(), iv.end());
    }
    return hello;
}

void LinkSupervisor::attach(int fd)
{
    if (link_state == LinkState::UP)
    {
        LOG_WARN("Replacing the current link with a new connection");
        fail_link(ErrorReason::LINK_LOST, "replaced by a new connection");
    }
    link = Connection(fd);

    decoder.reset();
    outbound.clear();
    outbound_offset = 0;
    hello_in.clear();
    hello_done = false;
    want_write = false;
    congested_flag = false;

    try
    {
        outbound = build_hello();
    }
    catch (const std::runtime_error &e)
    {
        LOG_ERROR("Link hello failed: ", e.what());
        link.reset();
        link_state = LinkState::DOWN;
        if (dialing_role())
            schedule_retry(settings.initial_backoff_ms);
        return;
    }

    if (!loop.add(link.get_fd(), EPOLLIN | EPOLLRDHUP, [this](uint32_t events)
                  { handle_link_events(events); }))
    {
        link.reset();
        link_state = LinkState::DOWN;
        if (dialing_role())
            schedule_retry(settings.initial_backoff_ms);
        return;
    }

    link_state = LinkState::UP;
    attached_at = std::chrono::steady_clock::now();
    stall_timer = loop.run_every(STALL_CHECK_INTERVAL_MS, [this]()
                                 { check_stall(); });
    loop.post([this]()
              {
                  if (link_state == LinkState::UP)
                      handler.on_link_up();
              });
    flush();
}

bool LinkSupervisor::send(const Frame &frame)
{
    if (link_state != LinkState::UP)
        return false;

    std::vector<uint8_t> bytes = encode_frame(frame);
    if (crypto)
    {
        bytes = crypto->encrypt(bytes.data(), bytes.size());
    }

    if (outbound_offset > 0 && outbound_offset * 2 >= outbound.size())
    {
        outbound.erase(outbound.begin(), outbound.begin() + outbound_offset);
        outbound_offset = 0;
    }
    outbound.insert(outbound.end(), bytes.begin(), bytes.end());
    if (queued_bytes() > LINK_HIGH_WATERMARK)
        congested_flag = true;

    flush();
    return link_state == LinkState::UP;
}

void LinkSupervisor::flush()
{
    while (queued_bytes() > 0)
    {
        ssize_t n = link.send_data(outbound.data() + outbound_offset, queued_bytes());
        if (n > 0)
        {
            outbound_offset += n;
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n == 0 || errno == EAGAIN || errno == EWOULDBLOCK)
            break;
        fail_link(ErrorReason::LINK_LOST, "write failed: " + errno_string(errno));
        return;
    }

    if (queued_bytes() == 0)
    {
        outbound.clear();
        outbound_offset = 0;
    }
    update_write_interest();

    if (congested_flag && queued_bytes() < LINK_LOW_WATERMARK)
    {
        congested_flag = false;
        if (!drain_notify_pending)
        {
            drain_notify_pending = true;
            loop.post([this]()
                      {
                          drain_notify_pending = false;
                          if (link_state == LinkState::UP)
                              handler.on_link_drained();
                      });
        }
    }
}

void LinkSupervisor::update_write_interest()
{
    bool need = queued_bytes() > 0;
    if (need == want_write || !link.is_open())
        return;
    loop.modify(link.get_fd(), EPOLLIN | EPOLLRDHUP | (need ? EPOLLOUT : 0));
    want_write = need;
}

void LinkSupervisor::handle_link_events(uint32_t events)
{
    if (link_state == LinkState::CONNECTING)
    {
        handle_connect_event();
        return;
    }
    if (link_state != LinkState::UP)
        return;

    if (events & EPOLLOUT)
        flush();
    if (link_state == LinkState::UP && (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR)))
        read_link();
}

void LinkSupervisor::read_link()
{
    uint8_t buffer[BUFFER_SIZE];

    for (int i = 0; i < READS_PER_EVENT && link_state == LinkState::UP; ++i)
    {
        ssize_t n = link.recv_data(buffer, sizeof(buffer));
        if (n > 0)
        {
            try
            {
                process_incoming(buffer, static_cast<size_t>(n));
            }
            catch (const MalformedFrame &e)
            {
                LOG_ERROR("Malformed data on link: ", e.what());
                fail_link(ErrorReason::MALFORMED_FRAME, e.what());
                return;
            }
            continue;
        }
        if (n == 0)
        {
            fail_link(ErrorReason::LINK_LOST, "closed by peer");
            return;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return;
        fail_link(ErrorReason::LINK_LOST, "read failed: " + errno_string(errno));
        return;
    }
}

void LinkSupervisor::process_incoming(const uint8_t *data, size_t len)
{
    size_t pos = 0;
    if (!hello_done)
    {
        size_t take = std::min(hello_size() - hello_in.size(), len);
        hello_in.insert(hello_in.end(), data, data + take);
        pos = take;

        if (hello_in.size() >= HELLO_PREFIX_SIZE)
        {
            if (memcmp(hello_in.data(), LINK_MAGIC, sizeof(LINK_MAGIC)) != 0)
                throw MalformedFrame("peer did not send the link magic");
            if (hello_in[4] != LINK_VERSION)
                throw MalformedFrame("unsupported link version " + std::to_string(hello_in[4]));
            uint8_t expected = static_cast<uint8_t>(crypto ? crypto->id() : CipherId::NONE);
            if (hello_in[5] != expected)
                throw MalformedFrame("peer cipher id " + std::to_string(hello_in[5]) +
                                     " does not match local cipher id " + std::to_string(expected));
        }
        if (hello_in.size() < hello_size())
            return;

        if (crypto)
        {
            std::vector<uint8_t> iv(hello_in.begin() + HELLO_PREFIX_SIZE, hello_in.end());
            crypto->begin_decrypt(iv);
        }
        hello_done = true;
        LOG_DEBUG("Link hello accepted");
    }

    if (pos < len)
    {
        if (crypto)
        {
            std::vector<uint8_t> plain = crypto->decrypt(data + pos, len - pos);
            decoder.feed(plain.data(), plain.size());
        }
        else
        {
            decoder.feed(data + pos, len - pos);
        }
    }

    Frame frame;
    while (link_state == LinkState::UP && decoder.next(frame))
    {
        handler.on_frame(frame);
    }
}

void LinkSupervisor::fail_link(ErrorReason reason, const std::string &why)
{
    if (link_state != LinkState::UP)
        return;

    LOG_WARN("Link down (", to_string(reason), "): ", why);
    if (link.is_open())
    {
        loop.remove(link.get_fd());
        link.reset();
    }
    link_state = LinkState::DOWN;
    if (stall_timer)
    {
        loop.cancel_timer(stall_timer);
        stall_timer = 0;
    }
    decoder.reset();
    outbound.clear();
    outbound_offset = 0;
    want_write = false;
    congested_flag = false;

    loop.post([this, reason]()
              { handler.on_link_down(reason); });

    if (dialing_role() && !stopping)
    {
        failed_attempts = 0;
        schedule_retry(settings.initial_backoff_ms);
    }
}

void LinkSupervisor::check_stall()
{
    auto now = std::chrono::steady_clock::now();
    auto max_wait = std::chrono::milliseconds(settings.frame_stall_timeout_ms);
    if (!hello_done && now - attached_at > max_wait)
    {
        fail_link(ErrorReason::MALFORMED_FRAME, "peer hello did not arrive in time");
    }
    else if (decoder.stalled(now, max_wait))
    {
        fail_link(ErrorReason::MALFORMED_FRAME, "partial frame stalled for " +
                                                    std::to_string(settings.frame_stall_timeout_ms) + " ms");
    }
}

void LinkSupervisor::connect(const std::string &host, uint16_t port)
{
    dialing = true;
    remote_host = host;
    remote_port = port;
    failed_attempts = 0;
    if (!resolver)
        resolver = std::make_unique<Resolver>(loop, 1);
    start_connect_attempt();
}

void LinkSupervisor::start_connect_attempt()
{
    retry_timer = 0;
    if (stopping)
        return;

    link_state = LinkState::CONNECTING;
    remote_addresses.clear();
    address_index = 0;
    last_connect_error.clear();

    uint64_t attempt = ++connect_serial;
    resolver->resolve(remote_host, remote_port, [this, attempt](ResolveResult result)
                      { handle_resolved(attempt, std::move(result)); });
}

void LinkSupervisor::handle_resolved(uint64_t attempt, ResolveResult result)
{
    // a stale lookup from an attempt that was stopped or superseded
    if (stopping || attempt != connect_serial || link_state != LinkState::CONNECTING)
        return;

    if (result.error != 0)
    {
        connect_attempt_failed("cannot resolve " + remote_host + ": " + result.message);
        return;
    }
    remote_addresses = std::move(result.addresses);
    try_next_address();
}

void LinkSupervisor::try_next_address()
{
    while (address_index < remote_addresses.size())
    {
        const SocketAddress &address = remote_addresses[address_index++];
        int err = link.start_connect(address);
        if (err != 0)
        {
            last_connect_error = errno_string(err);
            continue;
        }

        if (!loop.add(link.get_fd(), EPOLLOUT, [this](uint32_t events)
                      { handle_link_events(events); }))
        {
            link.reset();
            last_connect_error = "cannot register socket";
            continue;
        }
        connect_timer = loop.run_after(settings.connect_timeout_ms, [this]()
                                       {
                                           connect_timer = 0;
                                           loop.remove(link.get_fd());
                                           link.reset();
                                           last_connect_error = "timed out";
                                           try_next_address();
                                       });
        return;
    }
    connect_attempt_failed(last_connect_error.empty() ? "no usable address" : last_connect_error);
}

void LinkSupervisor::handle_connect_event()
{
    int err = link.finish_connect();
    if (err == EINPROGRESS)
        return;
    loop.remove(link.get_fd());
    if (connect_timer)
    {
        loop.cancel_timer(connect_timer);
        connect_timer = 0;
    }

    if (err != 0)
    {
        last_connect_error = errno_string(err);
        link.reset();
        try_next_address();
        return;
    }

    LOG_INFO("Link connected to ", remote_host, ":", remote_port);
    failed_attempts = 0;
    attach(link.release());
}

void LinkSupervisor::connect_attempt_failed(const std::string &why)
{
    link_state = LinkState::DOWN;
    failed_attempts++;
    LOG_WARN("Link connect attempt ", failed_attempts, " to ", remote_host, ":", remote_port, " failed: ", why);

    if (settings.reconnect_attempts > 0 && failed_attempts >= settings.reconnect_attempts)
    {
        LOG_ERROR("Giving up on the link after ", failed_attempts, " attempts");
        link_state = LinkState::GAVE_UP;
        loop.post([this]()
                  { handler.on_link_gave_up(); });
        return;
    }

    int backoff = settings.initial_backoff_ms;
    for (int i = 1; i < failed_attempts && backoff < settings.max_backoff_ms; ++i)
    {
        backoff *= 2;
    }
    schedule_retry(std::min(backoff, settings.max_backoff_ms));
}

void LinkSupervisor::schedule_retry(int delay_ms)
{
    if (stopping || retry_timer)
        return;
    retry_timer = loop.run_after(delay_ms, [this]()
                                 { start_connect_attempt(); });
}

void LinkSupervisor::listen(const std::string &host, uint16_t port)
{
    listen_fd = create_listener(host, port);
    if (!loop.add(listen_fd, EPOLLIN, [this](uint32_t)
                  { handle_accept(); }))
    {
        close(listen_fd);
        listen_fd = -1;
        throw std::runtime_error("Cannot register the link listener");
    }
    LOG_INFO("Waiting for the ship on ", host, ":", listen_port());
}

uint16_t LinkSupervisor::listen_port() const
{
    return listen_fd >= 0 ? bound_port(listen_fd) : 0;
}

void LinkSupervisor::handle_accept()
{
    while (true)
    {
        int fd = accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                LOG_WARN("accept on link listener failed: ", errno_string(errno));
            return;
        }
        LOG_INFO("Ship connected");
        attach(fd);
    }
}

void LinkSupervisor::stop()
{
    stopping = true;
    if (retry_timer)
    {
        loop.cancel_timer(retry_timer);
        retry_timer = 0;
    }
    if (connect_timer)
    {
        loop.cancel_timer(connect_timer);
        connect_timer = 0;
    }
    if (stall_timer)
    {
        loop.cancel_timer(stall_timer);
        stall_timer = 0;
    }

    if (link_state == LinkState::UP)
        flush();
    if (link.is_open())
    {
        loop.remove(link.get_fd());
        link.reset();
    }
    link_state = LinkState::DOWN;

    if (listen_fd >= 0)
    {
        loop.remove(listen_fd);
        close(listen_fd);
        listen_fd = -1;
    }
}
