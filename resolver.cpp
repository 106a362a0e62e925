#include "resolver.hpp"
#include <algorithm>
#include <memory>
#include <utility>

Resolver::Resolver(EventLoop &loop, int threads) : loop(loop)
{
    threads = std::max(threads, 1);
    for (int i = 0; i < threads; ++i)
    {
        workers.emplace_back([this]()
                             { worker_loop(); });
    }
}

Resolver::~Resolver()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        shutting_down = true;
        jobs.clear();
    }
    jobs_ready.notify_all();
    for (auto &worker : workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

void Resolver::resolve(const std::string &host, uint16_t port, ResolveCallback callback)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        jobs.push_back(Job{host, port, std::move(callback)});
    }
    jobs_ready.notify_one();
}

void Resolver::worker_loop()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            jobs_ready.wait(lock, [this]()
                            { return shutting_down || !jobs.empty(); });
            if (shutting_down)
                return;
            job = std::move(jobs.front());
            jobs.pop_front();
        }

        ResolveResult result;
        result.error = resolve_host(job.host, job.port, result.addresses, result.message);

        auto callback = std::make_shared<ResolveCallback>(std::move(job.callback));
        auto shared_result = std::make_shared<ResolveResult>(std::move(result));
        loop.post([callback, shared_result]()
                  { (*callback)(std::move(*shared_result)); });
    }
}
