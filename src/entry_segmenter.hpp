#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace laralog {

// Groups physical lines into logical entries. An entry runs from one header
// line (see is_header_line) up to the next; it is only known to be complete
// once the next header arrives, so the newest entry is always held back until
// then or until flush().
//
// Decisions are made on complete lines only, which makes the output
// independent of how the input is chunked. Emitted segments are the input
// bytes verbatim: concatenating them, then the pending text, gives back
// exactly what was fed.
class EntrySegmenter {
public:
    // Returns the entries completed by this chunk, in file order.
    std::vector<std::string> feed(std::string_view bytes);

    // Emits whatever is buffered, including an unterminated last line.
    // Used when watching stops.
    std::vector<std::string> flush();

    // Drops everything buffered. Used on truncation and rotation, where a
    // half-written entry can never be completed.
    void reset();

    bool has_pending() const { return state_ == State::PendingEntry || !partial_line_.empty(); }
    std::size_t pending_bytes() const { return pending_.size() + partial_line_.size(); }

private:
    enum class State { NoPending, PendingEntry };

    void take_line(std::string_view line, std::vector<std::string>& out);

    State state_ = State::NoPending;
    std::string pending_;       // complete lines of the open entry
    std::string partial_line_;  // bytes after the last newline seen
};

} // namespace laralog
