#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

// Single-consumer reactor. Every piece of capture state is touched only from
// the thread that calls poll()/run(); other threads hand work over with post().
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Thread-safe; the task runs on the loop thread in FIFO order
    void post(Task task);

    // Loop thread only. First run happens one interval after `now`.
    TimerId add_periodic(Clock::duration interval, Task task, Clock::time_point now = Clock::now());
    // Safe from inside a timer task (including the timer being cancelled)
    void cancel(TimerId id);
    bool has_timer(TimerId id) const { return _timers.count(id) != 0; }

    // Runs all queued tasks, then every timer due at `now`. Returns tasks executed.
    size_t poll(Clock::time_point now = Clock::now());

    // Blocks, dispatching tasks and timers, until stop() is called
    void run();
    void stop();

private:
    struct Timer {
        Clock::time_point next;
        Clock::duration interval;
        Task task;
    };

    std::mutex _mtx;
    std::condition_variable _cv;
    std::deque<Task> _queue;   // guarded by _mtx
    bool _stop_requested = false;

    std::map<TimerId, Timer> _timers; // loop thread only
    TimerId _next_timer_id = 1;
};
