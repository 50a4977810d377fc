#include "event_loop.hpp"
#include "log.hpp"
#include <exception>

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _queue.push_back(std::move(task));
    }
    _cv.notify_one();
}

EventLoop::TimerId EventLoop::add_periodic(Clock::duration interval, Task task, Clock::time_point now) {
    if (interval <= Clock::duration::zero()) interval = std::chrono::milliseconds(1);
    TimerId id = _next_timer_id++;
    _timers.emplace(id, Timer{now + interval, interval, std::move(task)});
    return id;
}

void EventLoop::cancel(TimerId id) {
    _timers.erase(id);
}

size_t EventLoop::poll(Clock::time_point now) {
    size_t executed = 0;

    std::deque<Task> ready;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        ready.swap(_queue);
    }
    for (auto& task : ready) {
        try { task(); }
        catch (const std::exception& e) { log_warn(std::string("event loop task failed: ") + e.what()); }
        ++executed;
    }

    // Collect ids first: a task may add or cancel timers while we dispatch
    std::vector<TimerId> due;
    for (const auto& kv : _timers) if (kv.second.next <= now) due.push_back(kv.first);
    for (TimerId id : due) {
        auto it = _timers.find(id);
        if (it == _timers.end()) continue; // cancelled by an earlier task
        it->second.next += it->second.interval;
        if (it->second.next <= now) it->second.next = now + it->second.interval; // drift correction
        Task task = it->second.task; // keep alive if the timer cancels itself
        try { task(); }
        catch (const std::exception& e) { log_warn(std::string("timer task failed: ") + e.what()); }
        ++executed;
    }
    return executed;
}

void EventLoop::run() {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _stop_requested = false;
    }
    for (;;) {
        poll(Clock::now());

        std::unique_lock<std::mutex> lk(_mtx);
        if (_stop_requested) break;
        if (!_queue.empty()) continue;
        if (_timers.empty()) {
            _cv.wait(lk, [this]{ return _stop_requested || !_queue.empty(); });
        } else {
            auto next = _timers.begin()->second.next;
            for (const auto& kv : _timers) if (kv.second.next < next) next = kv.second.next;
            _cv.wait_until(lk, next, [this]{ return _stop_requested || !_queue.empty(); });
        }
        if (_stop_requested) break;
    }
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _stop_requested = true;
    }
    _cv.notify_all();
}
