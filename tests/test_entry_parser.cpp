#include <catch2/catch_test_macros.hpp>
#include "entry_parser.hpp"

using namespace laralog;

namespace {

long long epoch_micros(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

} // namespace

TEST_CASE("Header detection", "[parser]") {
    REQUIRE(is_header_line("[2024-01-01 10:00:00] local.ERROR: boom"));
    REQUIRE(is_header_line("[2024-01-01T10:00:00.123456+00:00] production.INFO: ok\n"));
    REQUIRE(is_header_line("[2024-01-01 10:00:00]"));

    REQUIRE_FALSE(is_header_line(""));
    REQUIRE_FALSE(is_header_line("[stacktrace...]"));
    REQUIRE_FALSE(is_header_line("#0 /var/www/app/Http/Kernel.php(12): handle()"));
    REQUIRE_FALSE(is_header_line(" [2024-01-01 10:00:00] local.INFO: indented"));
    REQUIRE_FALSE(is_header_line("[2024-01-01 10:00:00 no closing bracket"));
    REQUIRE_FALSE(is_header_line("[2024/01/01 10:00:00] local.INFO: wrong separators"));
}

TEST_CASE("Timestamp parsing", "[parser]") {
    SECTION("Naive timestamps are UTC") {
        auto t = parse_timestamp("2024-01-01 10:00:00");
        REQUIRE(t.has_value());
        REQUIRE(epoch_micros(*t) == 1704103200000000LL);
    }

    SECTION("Fraction and offset") {
        auto t = parse_timestamp("2024-01-01T10:00:00.500000+02:00");
        REQUIRE(t.has_value());
        REQUIRE(epoch_micros(*t) == 1704096000500000LL);

        auto z = parse_timestamp("2024-01-01T10:00:00Z");
        REQUIRE(z.has_value());
        REQUIRE(epoch_micros(*z) == 1704103200000000LL);
    }

    SECTION("Malformed values") {
        REQUIRE_FALSE(parse_timestamp("").has_value());
        REQUIRE_FALSE(parse_timestamp("2024-13-01 10:00:00").has_value());
        REQUIRE_FALSE(parse_timestamp("2023-02-29 10:00:00").has_value());
        REQUIRE_FALSE(parse_timestamp("2024-01-01 24:00:00").has_value());
        REQUIRE_FALSE(parse_timestamp("2024-01-01 10:00:00 garbage").has_value());
        REQUIRE(parse_timestamp("2024-02-29 10:00:00").has_value());
    }
}

TEST_CASE("Parse a plain entry", "[parser]") {
    LogRecord r = parse_entry("[2024-01-01 10:00:00] local.ERROR: boom\n[stacktrace...]\n");

    REQUIRE(r.timestamp.has_value());
    REQUIRE(epoch_micros(*r.timestamp) == 1704103200000000LL);
    REQUIRE(r.timestamp_text == "2024-01-01 10:00:00");
    REQUIRE(r.channel == "local");
    REQUIRE(r.severity == Severity::Error);
    REQUIRE(r.summary == "boom");
    REQUIRE(r.body == std::vector<std::string>{"[stacktrace...]"});
    REQUIRE(r.payload_kind == PayloadKind::StackTrace);
    REQUIRE(r.raw_text == "[2024-01-01 10:00:00] local.ERROR: boom\n[stacktrace...]\n");
}

TEST_CASE("Severity names", "[parser]") {
    struct Case { const char* level; Severity expected; };
    const Case cases[] = {
        {"EMERGENCY", Severity::Emergency},
        {"ALERT", Severity::Alert},
        {"CRITICAL", Severity::Critical},
        {"ERROR", Severity::Error},
        {"WARNING", Severity::Warning},
        {"NOTICE", Severity::Notice},
        {"INFO", Severity::Info},
        {"DEBUG", Severity::Debug},
        {"debug", Severity::Debug},
        {"Warning", Severity::Warning},
        {"VERBOSE", Severity::Unknown},
    };

    for (const auto& c : cases) {
        LogRecord r = parse_entry(std::string("[2024-01-01 10:00:00] app.") + c.level + ": text\n");
        CAPTURE(c.level);
        REQUIRE(r.severity == c.expected);
        REQUIRE(r.channel == "app");
        REQUIRE(r.summary == "text");
    }
}

TEST_CASE("Degraded input still yields a record", "[parser]") {
    SECTION("Unparseable timestamp") {
        LogRecord r = parse_entry("[2024-13-45 99:00:00] local.INFO: odd clock\n");
        REQUIRE_FALSE(r.timestamp.has_value());
        REQUIRE(r.timestamp_text == "2024-13-45 99:00:00");
        REQUIRE(r.severity == Severity::Info);
        REQUIRE(r.summary == "odd clock");
    }

    SECTION("No channel.LEVEL token") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] something happened\n");
        REQUIRE(r.severity == Severity::Unknown);
        REQUIRE(r.channel.empty());
        REQUIRE(r.summary == "something happened");
    }

    SECTION("No header at all") {
        LogRecord r = parse_entry("tail of an earlier entry\nmore\n");
        REQUIRE_FALSE(r.timestamp.has_value());
        REQUIRE(r.timestamp_text.empty());
        REQUIRE(r.severity == Severity::Unknown);
        REQUIRE(r.summary == "tail of an earlier entry");
        REQUIRE(r.body == std::vector<std::string>{"more"});
    }

    SECTION("Empty segment") {
        LogRecord r = parse_entry("");
        REQUIRE(r.severity == Severity::Unknown);
        REQUIRE(r.summary.empty());
        REQUIRE(r.body.empty());
        REQUIRE(r.payload_kind == PayloadKind::None);
    }
}

TEST_CASE("Messages with context", "[parser]") {
    SECTION("Trailing context object") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] local.INFO: User logged in {\"id\":5} \n");
        REQUIRE(r.summary == "User logged in");
        REQUIRE(r.context.has_value());
        REQUIRE((*r.context)["id"] == 5);
        REQUIRE(r.payload_kind == PayloadKind::Structured);
    }

    SECTION("Empty Monolog context markers are dropped") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] local.INFO: ok [] []\n");
        REQUIRE(r.summary == "ok");
        REQUIRE_FALSE(r.context.has_value());
        REQUIRE(r.payload_kind == PayloadKind::None);
    }

    SECTION("Braces that are not JSON stay in the summary") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] local.INFO: template {name}\n");
        REQUIRE(r.summary == "template {name}");
        REQUIRE_FALSE(r.context.has_value());
    }

    SECTION("Exception object as the message") {
        LogRecord r = parse_entry(
            "[2024-01-01 10:00:00] production.CRITICAL: "
            "{\"exception\":\"RuntimeException: disk full\\n#0 main.php(3)\"}\n");
        REQUIRE(r.severity == Severity::Critical);
        REQUIRE(r.summary == "RuntimeException: disk full");
        REQUIRE(r.context.has_value());
        REQUIRE(r.payload_kind == PayloadKind::Structured);
        REQUIRE(format_details(r) == "RuntimeException: disk full\n#0 main.php(3)");
    }
}

TEST_CASE("Payload classification", "[parser]") {
    SECTION("JSON body is structured") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] local.DEBUG: payload\n{\"a\": 1,\n \"b\": [1, 2]}\n");
        REQUIRE(r.payload_kind == PayloadKind::Structured);
        REQUIRE(r.body.size() == 2);

        std::string details = format_details(r);
        REQUIRE(details.find("\"a\": 1") != std::string::npos);
        REQUIRE(details.find("\n    \"b\"") != std::string::npos);
    }

    SECTION("Anything else is a stack trace") {
        LogRecord r = parse_entry(
            "[2024-01-01 10:00:00] local.ERROR: failed\n"
            "#0 /app/Http/Kernel.php(12): handle()\n"
            "#1 {main}\n");
        REQUIRE(r.payload_kind == PayloadKind::StackTrace);
        REQUIRE(format_details(r) == "#0 /app/Http/Kernel.php(12): handle()\n#1 {main}");
    }

    SECTION("Trailing blank lines and CRLF") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] local.ERROR: crlf\r\nline one\r\n\r\n");
        REQUIRE(r.summary == "crlf");
        REQUIRE(r.body == std::vector<std::string>{"line one"});
    }

    SECTION("Plain entry shows its message") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] local.INFO: User 42 logged in\n");
        REQUIRE(r.payload_kind == PayloadKind::None);
        REQUIRE(r.body.empty());
        REQUIRE(format_details(r) == "User 42 logged in");
    }

    SECTION("Nothing to show") {
        LogRecord r = parse_entry("[2024-01-01 10:00:00] local.INFO:\n");
        REQUIRE(r.summary.empty());
        REQUIRE(format_details(r) == "No additional details available");
    }
}

TEST_CASE("Invalid UTF-8 is replaced", "[parser]") {
    REQUIRE(sanitize_utf8("plain ascii") == "plain ascii");
    REQUIRE(sanitize_utf8("caf\xC3\xA9") == "caf\xC3\xA9");
    REQUIRE(sanitize_utf8("bad \xFF byte") == "bad \xEF\xBF\xBD byte");
    REQUIRE(sanitize_utf8("cut \xE2\x82") == "cut \xEF\xBF\xBD");

    LogRecord r = parse_entry("[2024-01-01 10:00:00] local.WARNING: bad \xC0 byte\n");
    REQUIRE(r.severity == Severity::Warning);
    REQUIRE(r.summary == "bad \xEF\xBF\xBD byte");
    REQUIRE(r.raw_text.find("\xEF\xBF\xBD") != std::string::npos);
}

TEST_CASE("Parsing is deterministic", "[parser]") {
    const std::string raw =
        "[2024-01-01T10:00:00+01:00] local.ERROR: boom {\"user\":1}\n"
        "#0 trace\n";
    LogRecord a = parse_entry(raw);
    LogRecord b = parse_entry(raw);
    REQUIRE(a.to_json() == b.to_json());
}
