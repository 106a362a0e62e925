#ifndef EVENT_LOOP_HPP
#define EVENT_LOOP_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

using EventCallback = std::function<void(uint32_t events)>;
using Task = std::function<void()>;
using TimerId = uint64_t;

// Single-threaded epoll reactor. Every registered callback, timer and posted
// task runs on the thread that called run(); only post() and stop() may be
// called from other threads (stop() also from a signal handler).
class EventLoop
{
private:
    using Clock = std::chrono::steady_clock;

    struct Timer
    {
        int interval_ms;
        Task task;
    };

    int epoll_fd;
    int wake_fd;
    std::atomic<bool> stop_requested{false};
    std::unordered_map<int, EventCallback> callbacks;

    std::mutex task_mutex;
    std::vector<Task> pending_tasks;

    TimerId next_timer_id = 1;
    std::map<std::pair<Clock::time_point, TimerId>, Timer> timers;
    std::unordered_map<TimerId, Clock::time_point> timer_deadlines;

    int next_timeout_ms() const;
    void run_pending_tasks();
    void run_due_timers();
    TimerId schedule(int delay_ms, int interval_ms, Task task);

public:
    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    bool add(int fd, uint32_t events, EventCallback cb);
    bool modify(int fd, uint32_t events);
    void remove(int fd);

    void post(Task task);
    TimerId run_after(int delay_ms, Task task);
    TimerId run_every(int interval_ms, Task task);
    void cancel_timer(TimerId id);

    void run();
    void stop();
};

#endif
