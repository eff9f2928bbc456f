#include <catch2/catch_test_macros.hpp>
#include "severity_filter.hpp"
#include <atomic>
#include <thread>

using namespace laralog;

namespace {

LogRecord record_with(Severity s) {
    LogRecord r;
    r.severity = s;
    r.summary = severity_to_string(s);
    return r;
}

} // namespace

TEST_CASE("FilterState basics", "[filter]") {
    SECTION("Everything is enabled by default") {
        FilterState state;
        for (Severity s : kAllSeverities) {
            REQUIRE(state.enabled(s));
        }
    }

    SECTION("Unknown always passes") {
        FilterState none = FilterState::none();
        for (Severity s : kAllSeverities) {
            REQUIRE_FALSE(accept(record_with(s), none));
        }
        REQUIRE(accept(record_with(Severity::Unknown), none));

        // Disabling Unknown is a no-op.
        REQUIRE(none.with(Severity::Unknown, false).enabled(Severity::Unknown));
    }

    SECTION("with() leaves the original untouched") {
        FilterState all;
        FilterState no_info = all.with(Severity::Info, false);
        REQUIRE(all.enabled(Severity::Info));
        REQUIRE_FALSE(no_info.enabled(Severity::Info));
        REQUIRE(no_info.enabled(Severity::Error));
    }
}

TEST_CASE("FilterState from a level list", "[filter]") {
    std::vector<std::string> rejected;
    FilterState state = FilterState::from_list("error,WARNING,,verbose,critical", &rejected);

    REQUIRE(state.enabled(Severity::Error));
    REQUIRE(state.enabled(Severity::Warning));
    REQUIRE(state.enabled(Severity::Critical));
    REQUIRE_FALSE(state.enabled(Severity::Info));
    REQUIRE_FALSE(state.enabled(Severity::Debug));
    REQUIRE(rejected == std::vector<std::string>{"verbose"});

    REQUIRE(FilterState::from_list("") == FilterState::none());
}

TEST_CASE("Toggles commute when no record is evaluated in between", "[filter]") {
    SeverityFilter filter;
    const FilterState before = *filter.snapshot();

    filter.set_enabled(Severity::Info, false);
    filter.set_enabled(Severity::Debug, false);
    filter.set_enabled(Severity::Debug, true);
    filter.set_enabled(Severity::Info, true);

    REQUIRE(*filter.snapshot() == before);

    SeverityFilter other;
    other.set_enabled(Severity::Debug, false);
    other.set_enabled(Severity::Info, false);
    filter.set_enabled(Severity::Info, false);
    filter.set_enabled(Severity::Debug, false);
    REQUIRE(*filter.snapshot() == *other.snapshot());
}

TEST_CASE("SeverityFilter snapshots", "[filter]") {
    SeverityFilter filter(FilterState::from_list("error"));
    REQUIRE(filter.accept(record_with(Severity::Error)));
    REQUIRE_FALSE(filter.accept(record_with(Severity::Info)));
    REQUIRE(filter.accept(record_with(Severity::Unknown)));

    auto held = filter.snapshot();
    filter.set_enabled(Severity::Info, true);

    // A snapshot already taken keeps its view; new ones see the change.
    REQUIRE_FALSE(held->enabled(Severity::Info));
    REQUIRE(filter.is_enabled(Severity::Info));
    REQUIRE(filter.accept(record_with(Severity::Info)));

    filter.set_state(FilterState::none());
    REQUIRE_FALSE(filter.is_enabled(Severity::Error));
}

TEST_CASE("SeverityFilter under concurrent toggling", "[filter]") {
    SeverityFilter filter;
    std::atomic<bool> done{false};
    std::atomic<long> unknown_rejected{0};

    std::thread reader([&]() {
        LogRecord error = record_with(Severity::Error);
        LogRecord unknown = record_with(Severity::Unknown);
        while (!done) {
            filter.accept(error);
            if (!filter.accept(unknown)) ++unknown_rejected;
        }
    });

    for (int i = 0; i < 2000; ++i) {
        filter.set_enabled(Severity::Error, i % 2 == 0);
    }
    filter.set_enabled(Severity::Error, true);
    done = true;
    reader.join();

    REQUIRE(filter.is_enabled(Severity::Error));
    REQUIRE(unknown_rejected == 0);
}
