#ifndef TUNNEL_HPP
#define TUNNEL_HPP

#include <atomic>
#include <cstddef>
#include "link_supervisor.hpp"

// One proxy endpoint (ship or offshore) driven by its own event loop.
// run() blocks on the calling thread; stop() may be called from any thread
// and from a signal handler.
class Tunnel
{
protected:
    std::atomic<bool> running{true};

public:
    virtual ~Tunnel() = default;
    virtual void run() = 0;
    virtual void stop() { running = false; }

    bool is_running() const { return running; }
    virtual size_t session_count() const = 0;
    virtual LinkState link_state() const = 0;
};

#endif
