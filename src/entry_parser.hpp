#pragma once

#include "log_record.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace laralog {

// True when the line opens a new entry: "[YYYY-MM-DD HH:MM:SS" (or 'T' as the
// date/time separator) followed by a closing ']' somewhere on the line.
// Continuation lines that happen to look like this are treated as headers;
// there is no way to tell them apart from the text alone.
bool is_header_line(std::string_view line);

// Parses "YYYY-MM-DD HH:MM:SS[.ffffff][Z|+HH:MM|-HH:MM|+HHMM]". Times without
// an offset are taken as UTC. Returns nullopt for anything malformed.
std::optional<TimePoint> parse_timestamp(std::string_view token);

// Replaces invalid UTF-8 sequences with U+FFFD. Valid input comes back unchanged.
std::string sanitize_utf8(std::string_view bytes);

// Turns one raw entry (header line plus continuation lines) into a record.
// Never throws on content: unknown levels become Severity::Unknown and
// unparseable timestamps are left empty. Same input, same output.
LogRecord parse_entry(std::string_view raw_segment);

// Text for a details pane: the exception text or pretty-printed JSON for
// structured payloads, the stack trace lines otherwise. An entry with none of
// those shows its summary.
std::string format_details(const LogRecord& record);

} // namespace laralog
