#include "entry_parser.hpp"
#include <cctype>
#include <cstdint>

namespace laralog {

namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";
constexpr int kMaxContextAttempts = 16;

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Reads exactly n digits at pos.
bool read_digits(std::string_view s, std::size_t pos, std::size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!is_digit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

std::string_view trim_left(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    return s;
}

std::string_view trim_right(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string_view trim(std::string_view s) {
    return trim_right(trim_left(s));
}

bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return kDays[m - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * static_cast<unsigned>(m > 2 ? m - 3 : m + 9) + 2) / 5 +
                         static_cast<unsigned>(d) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::optional<nlohmann::json> parse_json_object(std::string_view text) {
    auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    return j;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string dump_pretty(const nlohmann::json& j) {
    return j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Monolog prints empty context/extra as "[]".
std::string_view strip_empty_context(std::string_view msg) {
    for (int i = 0; i < 2; ++i) {
        std::string_view t = trim_right(msg);
        if (t.size() >= 3 && t.substr(t.size() - 3) == " []") {
            msg = t.substr(0, t.size() - 3);
        } else {
            break;
        }
    }
    return trim_right(msg);
}

// Sets summary and context from the text after "LEVEL: ".
void parse_message(std::string_view message, LogRecord& record) {
    std::string_view msg = strip_empty_context(message);

    if (!msg.empty() && msg.front() == '{') {
        if (auto obj = parse_json_object(msg)) {
            auto it = obj->find("exception");
            if (it != obj->end() && it->is_string()) {
                const std::string& exception = it->get_ref<const std::string&>();
                record.summary = std::string(trim(exception.substr(0, exception.find('\n'))));
            } else {
                record.summary = std::string(msg);
            }
            record.context = std::move(*obj);
            return;
        }
    } else if (!msg.empty() && msg.back() == '}') {
        // "message {...}": try each " {" from the left until the tail parses.
        std::size_t pos = msg.find(" {");
        for (int attempts = 0; pos != std::string_view::npos && attempts < kMaxContextAttempts; ++attempts) {
            if (auto obj = parse_json_object(msg.substr(pos + 1))) {
                record.summary = std::string(trim_right(msg.substr(0, pos)));
                record.context = std::move(*obj);
                return;
            }
            pos = msg.find(" {", pos + 1);
        }
    }

    record.summary = std::string(msg);
}

PayloadKind classify_body(const std::vector<std::string>& body) {
    std::string joined = join_lines(body);
    std::string_view t = trim(joined);
    if (t.size() >= 2 &&
        ((t.front() == '{' && t.back() == '}') || (t.front() == '[' && t.back() == ']'))) {
        auto j = nlohmann::json::parse(t.begin(), t.end(), nullptr, false);
        if (!j.is_discarded() && (j.is_object() || j.is_array())) {
            return PayloadKind::Structured;
        }
    }
    return PayloadKind::StackTrace;
}

} // namespace

bool is_header_line(std::string_view line) {
    // [YYYY-MM-DD HH:MM:SS ... ]
    if (line.size() < 21 || line[0] != '[') return false;
    static const char kPattern[] = "dddd-dd-dd?dd:dd:dd";
    for (std::size_t i = 0; i < sizeof(kPattern) - 1; ++i) {
        char p = kPattern[i];
        char c = line[i + 1];
        if (p == 'd') {
            if (!is_digit(c)) return false;
        } else if (p == '?') {
            if (c != ' ' && c != 'T') return false;
        } else if (c != p) {
            return false;
        }
    }
    return line.find(']', 20) != std::string_view::npos;
}

std::optional<TimePoint> parse_timestamp(std::string_view token) {
    std::string_view t = trim(token);
    int year, month, day, hour, minute, second;
    if (!read_digits(t, 0, 4, year) || t.size() < 19 || t[4] != '-' ||
        !read_digits(t, 5, 2, month) || t[7] != '-' ||
        !read_digits(t, 8, 2, day) || (t[10] != ' ' && t[10] != 'T') ||
        !read_digits(t, 11, 2, hour) || t[13] != ':' ||
        !read_digits(t, 14, 2, minute) || t[16] != ':' ||
        !read_digits(t, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t micros = 0;
    if (pos < t.size() && (t[pos] == '.' || t[pos] == ',')) {
        ++pos;
        std::size_t start = pos;
        int scale = 100000;
        while (pos < t.size() && is_digit(t[pos])) {
            if (scale > 0) {
                micros += (t[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
        }
        if (pos == start) return std::nullopt;
    }

    std::int64_t offset_seconds = 0;
    if (pos < t.size()) {
        char c = t[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (!read_digits(t, pos + 1, 2, oh)) return std::nullopt;
            pos += 3;
            if (pos < t.size() && t[pos] == ':') ++pos;
            if (read_digits(t, pos, 2, om)) pos += 2;
            if (oh > 14 || om > 59) return std::nullopt;
            offset_seconds = (c == '-' ? -1 : 1) * (oh * 3600 + om * 60);
        }
    }
    if (pos != t.size()) return std::nullopt;

    std::int64_t seconds = days_from_civil(year, month, day) * 86400 +
                           hour * 3600 + minute * 60 + second - offset_seconds;
    auto since_epoch = std::chrono::seconds(seconds) + std::chrono::microseconds(micros);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;  // valid range of the second byte
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        }

        if (len == 0) {
            out += kReplacementChar;
            ++i;
            continue;
        }

        std::size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            unsigned char cc = s[i + j];
            unsigned char min = (j == 1) ? lo : 0x80;
            unsigned char max = (j == 1) ? hi : 0xBF;
            if (cc < min || cc > max) break;
        }
        if (j == len) {
            out.append(bytes.data() + i, len);
            i += len;
        } else {
            // Replace the maximal invalid prefix once.
            out += kReplacementChar;
            i += j;
        }
    }
    return out;
}

LogRecord parse_entry(std::string_view raw_segment) {
    LogRecord record;
    record.raw_text = sanitize_utf8(raw_segment);

    std::vector<std::string> lines;
    std::string_view text = record.raw_text;
    while (!text.empty()) {
        std::size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
    if (lines.empty()) {
        return record;
    }

    std::string_view first = lines.front();
    if (is_header_line(first)) {
        std::size_t close = first.find(']', 20);
        record.timestamp_text = std::string(first.substr(1, close - 1));
        record.timestamp = parse_timestamp(record.timestamp_text);

        std::string_view rest = trim_left(first.substr(close + 1));
        std::string_view message = rest;

        // "channel.LEVEL: message"
        std::size_t colon = rest.find(':');
        if (colon != std::string_view::npos) {
            std::string_view token = rest.substr(0, colon);
            std::size_t dot = token.rfind('.');
            bool well_formed = dot != std::string_view::npos && dot > 0 && dot + 1 < token.size();
            for (std::size_t i = 0; well_formed && i < token.size(); ++i) {
                if (i != dot && !is_word_char(token[i]) && token[i] != '.') well_formed = false;
            }
            if (well_formed) {
                record.channel = std::string(token.substr(0, dot));
                record.severity = severity_from_string(std::string(token.substr(dot + 1)));
                message = rest.substr(colon + 1);
                if (!message.empty() && message.front() == ' ') message.remove_prefix(1);
            }
        }
        parse_message(message, record);
    } else {
        // Text with no header, e.g. the tail of an entry we started reading mid-way.
        record.summary = std::string(trim_right(first));
    }

    record.body.assign(lines.begin() + 1, lines.end());
    while (!record.body.empty() && trim(record.body.back()).empty()) {
        record.body.pop_back();
    }

    if (!record.body.empty()) {
        record.payload_kind = classify_body(record.body);
    } else if (record.context) {
        record.payload_kind = PayloadKind::Structured;
    }
    return record;
}

std::string format_details(const LogRecord& record) {
    std::string details;
    if (record.context) {
        auto it = record.context->find("exception");
        if (it != record.context->end() && it->is_string()) {
            details = it->get<std::string>();
        } else {
            details = dump_pretty(*record.context);
        }
    }

    if (!record.body.empty()) {
        std::string body_text = join_lines(record.body);
        if (record.payload_kind == PayloadKind::Structured) {
            auto j = nlohmann::json::parse(body_text, nullptr, false);
            if (!j.is_discarded()) body_text = dump_pretty(j);
        }
        if (!details.empty()) details += '\n';
        details += body_text;
    }

    if (details.empty()) {
        // A plain one-line entry shows its own message.
        if (!record.summary.empty()) return record.summary;
        return "No additional details available";
    }
    return details;
}

} // namespace laralog
