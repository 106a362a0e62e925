#ifndef RESOLVER_HPP
#define RESOLVER_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "event_loop.hpp"
#include "network_utils.hpp"

struct ResolveResult
{
    int error = 0; // EAI_* code, 0 on success
    std::string message;
    std::vector<SocketAddress> addresses;
};

using ResolveCallback = std::function<void(ResolveResult)>;

// Runs getaddrinfo on worker threads and hands every result back to the
// event loop through post(), so callbacks run on the loop thread.
class Resolver
{
private:
    struct Job
    {
        std::string host;
        uint16_t port = 0;
        ResolveCallback callback;
    };

    EventLoop &loop;
    std::mutex mutex;
    std::condition_variable jobs_ready;
    std::deque<Job> jobs;
    bool shutting_down = false;
    std::vector<std::thread> workers;

    void worker_loop();

public:
    Resolver(EventLoop &loop, int threads);
    ~Resolver();

    Resolver(const Resolver &) = delete;
    Resolver &operator=(const Resolver &) = delete;

    void resolve(const std::string &host, uint16_t port, ResolveCallback callback);
};

#endif
