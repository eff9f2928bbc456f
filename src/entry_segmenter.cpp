#include "entry_segmenter.hpp"
#include "entry_parser.hpp"

namespace laralog {

std::vector<std::string> EntrySegmenter::feed(std::string_view bytes) {
    std::vector<std::string> out;
    partial_line_.append(bytes.data(), bytes.size());

    std::size_t start = 0;
    std::size_t nl;
    while ((nl = partial_line_.find('\n', start)) != std::string::npos) {
        take_line(std::string_view(partial_line_).substr(start, nl + 1 - start), out);
        start = nl + 1;
    }
    partial_line_.erase(0, start);
    return out;
}

std::vector<std::string> EntrySegmenter::flush() {
    std::vector<std::string> out;
    if (!partial_line_.empty()) {
        take_line(partial_line_, out);
        partial_line_.clear();
    }
    if (state_ == State::PendingEntry) {
        out.push_back(std::move(pending_));
        pending_.clear();
        state_ = State::NoPending;
    }
    return out;
}

void EntrySegmenter::reset() {
    pending_.clear();
    partial_line_.clear();
    state_ = State::NoPending;
}

void EntrySegmenter::take_line(std::string_view line, std::vector<std::string>& out) {
    if (is_header_line(line)) {
        if (state_ == State::PendingEntry) {
            out.push_back(std::move(pending_));
        }
        pending_.assign(line.data(), line.size());
        state_ = State::PendingEntry;
        return;
    }

    // Continuation line. Without an open entry it starts a headerless one so
    // that no bytes are dropped.
    pending_.append(line.data(), line.size());
    state_ = State::PendingEntry;
}

} // namespace laralog
