#pragma once

#include <array>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace laralog {

// PSR-3 levels, most severe first. Unknown is the sentinel for tokens we can't classify.
enum class Severity : int {
    Emergency = 0,
    Alert = 1,
    Critical = 2,
    Error = 3,
    Warning = 4,
    Notice = 5,
    Info = 6,
    Debug = 7,
    Unknown = 8
};

constexpr std::size_t kSeverityCount = 8;  // excludes Unknown

constexpr std::array<Severity, kSeverityCount> kAllSeverities = {
    Severity::Emergency, Severity::Alert, Severity::Critical, Severity::Error,
    Severity::Warning, Severity::Notice, Severity::Info, Severity::Debug
};

inline std::string severity_to_string(Severity s) {
    switch (s) {
        case Severity::Emergency: return "emergency";
        case Severity::Alert: return "alert";
        case Severity::Critical: return "critical";
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Notice: return "notice";
        case Severity::Info: return "info";
        case Severity::Debug: return "debug";
        default: return "unknown";
    }
}

// Case-insensitive; anything unrecognized maps to Unknown.
inline Severity severity_from_string(const std::string& s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (Severity sev : kAllSeverities) {
        if (severity_to_string(sev) == lower) return sev;
    }
    return Severity::Unknown;
}

enum class PayloadKind : int {
    None = 0,        // no continuation body
    Structured = 1,  // brace-delimited JSON block
    StackTrace = 2   // free-form text
};

inline std::string payload_kind_to_string(PayloadKind k) {
    switch (k) {
        case PayloadKind::Structured: return "structured";
        case PayloadKind::StackTrace: return "stacktrace";
        default: return "none";
    }
}

using TimePoint = std::chrono::system_clock::time_point;

// Seconds since the epoch, fractional.
inline double to_unix_seconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

struct LogRecord {
    std::optional<TimePoint> timestamp;       // absent when the header token doesn't parse
    std::string timestamp_text;               // header token verbatim, e.g. "2024-01-01 10:00:00"
    std::string channel;                      // environment token, e.g. "local"
    Severity severity = Severity::Unknown;
    std::string summary;                      // first-line message
    std::vector<std::string> body;            // continuation lines, line endings stripped
    std::string raw_text;                     // the whole entry as it appeared in the file
    PayloadKind payload_kind = PayloadKind::None;
    std::optional<nlohmann::json> context;    // JSON object carried on the message line

    nlohmann::json to_json() const {
        nlohmann::json j;
        if (timestamp) {
            j["timestamp"] = to_unix_seconds(*timestamp);
        } else {
            j["timestamp"] = nullptr;
        }
        j["timestamp_text"] = timestamp_text;
        j["channel"] = channel;
        j["severity"] = severity_to_string(severity);
        j["summary"] = summary;
        j["body"] = body;
        j["payload"] = payload_kind_to_string(payload_kind);
        if (context) j["context"] = *context;
        j["raw"] = raw_text;
        return j;
    }
};

// Records are shared read-only between the watch thread, the hand-off queue and the UI.
using RecordPtr = std::shared_ptr<const LogRecord>;

} // namespace laralog
