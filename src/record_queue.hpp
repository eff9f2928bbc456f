#pragma once

#include "log_record.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace laralog {

// FIFO hand-off from the watch thread to the presentation layer.
class RecordQueue {
public:
    // Called after every push, outside the lock (e.g. to schedule a redraw).
    using Notify = std::function<void()>;

    void push(RecordPtr record);

    // Takes everything queued, oldest first.
    std::vector<RecordPtr> drain();

    // Returns nullptr on timeout.
    RecordPtr wait_pop(std::chrono::milliseconds timeout);

    std::size_t size() const;
    void clear();
    void set_notify(Notify notify);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RecordPtr> records_;
    Notify notify_;
};

} // namespace laralog
