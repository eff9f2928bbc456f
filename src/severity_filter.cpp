#include "severity_filter.hpp"
#include <sstream>

namespace laralog {

FilterState::FilterState() {
    enabled_.fill(true);
}

FilterState FilterState::none() {
    FilterState state;
    state.enabled_.fill(false);
    return state;
}

FilterState FilterState::from_list(const std::string& list, std::vector<std::string>* rejected) {
    FilterState state = none();
    std::istringstream iss(list);
    std::string name;
    while (std::getline(iss, name, ',')) {
        if (name.empty()) continue;
        Severity s = severity_from_string(name);
        if (s == Severity::Unknown) {
            if (rejected) rejected->push_back(name);
            continue;
        }
        state.enabled_[static_cast<std::size_t>(s)] = true;
    }
    return state;
}

bool FilterState::enabled(Severity s) const {
    if (s == Severity::Unknown) return true;
    return enabled_[static_cast<std::size_t>(s)];
}

FilterState FilterState::with(Severity s, bool enabled) const {
    FilterState copy = *this;
    if (s != Severity::Unknown) {
        copy.enabled_[static_cast<std::size_t>(s)] = enabled;
    }
    return copy;
}

bool accept(const LogRecord& record, const FilterState& state) {
    return state.enabled(record.severity);
}

SeverityFilter::SeverityFilter()
    : state_(std::make_shared<const FilterState>())
{
}

SeverityFilter::SeverityFilter(const FilterState& initial)
    : state_(std::make_shared<const FilterState>(initial))
{
}

std::shared_ptr<const FilterState> SeverityFilter::snapshot() const {
    return std::atomic_load(&state_);
}

void SeverityFilter::set_enabled(Severity s, bool enabled) {
    // Serialize writers so two toggles can't lose each other's update.
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = std::atomic_load(&state_);
    std::atomic_store(&state_, std::make_shared<const FilterState>(current->with(s, enabled)));
}

void SeverityFilter::set_state(const FilterState& state) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::atomic_store(&state_, std::make_shared<const FilterState>(state));
}

bool SeverityFilter::is_enabled(Severity s) const {
    return snapshot()->enabled(s);
}

bool SeverityFilter::accept(const LogRecord& record) const {
    return laralog::accept(record, *snapshot());
}

} // namespace laralog
