#include "record_queue.hpp"
#include <iterator>

namespace laralog {

void RecordQueue::push(RecordPtr record) {
    Notify notify;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
        notify = notify_;
    }
    cv_.notify_one();
    if (notify) {
        notify();
    }
}

std::vector<RecordPtr> RecordQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecordPtr> out(std::make_move_iterator(records_.begin()),
                               std::make_move_iterator(records_.end()));
    records_.clear();
    return out;
}

RecordPtr RecordQueue::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !records_.empty(); })) {
        return nullptr;
    }
    RecordPtr record = std::move(records_.front());
    records_.pop_front();
    return record;
}

std::size_t RecordQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void RecordQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

void RecordQueue::set_notify(Notify notify) {
    std::lock_guard<std::mutex> lock(mutex_);
    notify_ = std::move(notify);
}

} // namespace laralog
