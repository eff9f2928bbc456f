#pragma once

#include "log_record.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace laralog {

// Immutable set of enabled severities. Unknown is not part of the set: it
// always passes.
class FilterState {
public:
    FilterState();  // everything enabled

    static FilterState none();
    // Parses "error,warning,info". Unrecognized names are returned in `rejected`.
    static FilterState from_list(const std::string& list, std::vector<std::string>* rejected = nullptr);

    bool enabled(Severity s) const;
    FilterState with(Severity s, bool enabled) const;

    bool operator==(const FilterState& other) const { return enabled_ == other.enabled_; }
    bool operator!=(const FilterState& other) const { return !(*this == other); }

private:
    std::array<bool, kSeverityCount> enabled_;
};

// The delivery predicate.
bool accept(const LogRecord& record, const FilterState& state);

// Live filter shared between the UI thread (writer) and the watch thread
// (reader). Readers load the current snapshot without taking a lock; writers
// publish a new snapshot.
class SeverityFilter {
public:
    SeverityFilter();
    explicit SeverityFilter(const FilterState& initial);

    SeverityFilter(const SeverityFilter&) = delete;
    SeverityFilter& operator=(const SeverityFilter&) = delete;

    std::shared_ptr<const FilterState> snapshot() const;

    void set_enabled(Severity s, bool enabled);
    void set_state(const FilterState& state);
    bool is_enabled(Severity s) const;

    bool accept(const LogRecord& record) const;

private:
    std::shared_ptr<const FilterState> state_;
    std::mutex write_mutex_;
};

} // namespace laralog
