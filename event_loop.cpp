#include "event_loop.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "network_utils.hpp"
#include <cerrno>
#include <stdexcept>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>

EventLoop::EventLoop()
{
    epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd < 0)
    {
        throw std::runtime_error("epoll_create1 failed: " + errno_string(errno));
    }
    wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd < 0)
    {
        int err = errno;
        close(epoll_fd);
        throw std::runtime_error("eventfd failed: " + errno_string(err));
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd;
    epoll_ctl(epoll_fd, EPOLL_CTL_ADD, wake_fd, &ev);
}

EventLoop::~EventLoop()
{
    close(wake_fd);
    close(epoll_fd);
}

bool EventLoop::add(int fd, uint32_t events, EventCallback cb)
{
    epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev) < 0)
    {
        LOG_ERROR("epoll_ctl(ADD, ", fd, ") failed: ", errno_string(errno));
        return false;
    }
    callbacks[fd] = std::move(cb);
    return true;
}

bool EventLoop::modify(int fd, uint32_t events)
{
    epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    return epoll_ctl(epoll_fd, EPOLL_CTL_MOD, fd, &ev) == 0;
}

void EventLoop::remove(int fd)
{
    if (callbacks.erase(fd) > 0)
    {
        epoll_ctl(epoll_fd, EPOLL_CTL_DEL, fd, nullptr);
    }
}

void EventLoop::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(task_mutex);
        pending_tasks.push_back(std::move(task));
    }
    uint64_t one = 1;
    ssize_t rc = write(wake_fd, &one, sizeof(one));
    (void)rc;
}

TimerId EventLoop::schedule(int delay_ms, int interval_ms, Task task)
{
    TimerId id = next_timer_id++;
    auto deadline = Clock::now() + std::chrono::milliseconds(delay_ms);
    timers.emplace(std::make_pair(deadline, id), Timer{interval_ms, std::move(task)});
    timer_deadlines[id] = deadline;
    return id;
}

TimerId EventLoop::run_after(int delay_ms, Task task)
{
    return schedule(delay_ms, 0, std::move(task));
}

TimerId EventLoop::run_every(int interval_ms, Task task)
{
    return schedule(interval_ms, interval_ms, std::move(task));
}

void EventLoop::cancel_timer(TimerId id)
{
    auto it = timer_deadlines.find(id);
    if (it == timer_deadlines.end())
        return;
    timers.erase(std::make_pair(it->second, id));
    timer_deadlines.erase(it);
}

void EventLoop::stop()
{
    stop_requested = true;
    uint64_t one = 1;
    ssize_t rc = write(wake_fd, &one, sizeof(one));
    (void)rc;
}

int EventLoop::next_timeout_ms() const
{
    if (timers.empty())
        return -1;
    auto delta = timers.begin()->first.first - Clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(delta).count();
    if (ms <= 0)
        return 0;
    // round up so a timer is never polled a millisecond early
    return static_cast<int>(ms) + 1;
}

void EventLoop::run_pending_tasks()
{
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(task_mutex);
        tasks.swap(pending_tasks);
    }
    for (auto &task : tasks)
    {
        task();
    }
}

void EventLoop::run_due_timers()
{
    auto now = Clock::now();
    while (!timers.empty() && timers.begin()->first.first <= now)
    {
        auto it = timers.begin();
        TimerId id = it->first.second;
        Timer timer = std::move(it->second);
        timers.erase(it);
        timer_deadlines.erase(id);

        if (timer.interval_ms > 0)
        {
            auto deadline = now + std::chrono::milliseconds(timer.interval_ms);
            timers.emplace(std::make_pair(deadline, id), Timer{timer.interval_ms, timer.task});
            timer_deadlines[id] = deadline;
        }
        timer.task();
    }
}

void EventLoop::run()
{
    epoll_event events[MAX_EVENTS];

    while (!stop_requested)
    {
        int nfds = epoll_wait(epoll_fd, events, MAX_EVENTS, next_timeout_ms());
        if (nfds < 0 && errno != EINTR)
        {
            throw std::runtime_error("epoll_wait failed: " + errno_string(errno));
        }

        for (int i = 0; i < nfds && !stop_requested; ++i)
        {
            int fd = events[i].data.fd;
            if (fd == wake_fd)
            {
                uint64_t value;
                ssize_t rc = read(wake_fd, &value, sizeof(value));
                (void)rc;
                continue;
            }

            // copy: the callback may remove its own registration
            auto it = callbacks.find(fd);
            if (it == callbacks.end())
                continue;
            EventCallback cb = it->second;
            cb(events[i].events);
        }

        run_pending_tasks();
        run_due_timers();
    }
}
