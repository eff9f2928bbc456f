#include <catch2/catch_test_macros.hpp>
#include "change_detector.hpp"
#include "incremental_reader.hpp"
#include "watch_errors.hpp"
#include "test_support.hpp"

using namespace laralog;
using laralog::test::TempDir;
using laralog::test::append_file;
using laralog::test::write_file;

namespace {

WatchCursor cursor_at_start(const std::string& path) {
    WatchCursor cursor;
    cursor.file_path = path;
    cursor.file_identity = ChangeDetector(path).snapshot().identity;
    return cursor;
}

} // namespace

TEST_CASE("Classify a snapshot against the cursor", "[detector]") {
    WatchCursor cursor;
    cursor.file_path = "/var/log/app.log";
    cursor.file_identity = FileIdentity{1, 42};
    cursor.offset = 500;

    FileSnapshot snapshot;
    snapshot.identity = cursor.file_identity;

    SECTION("Unchanged") {
        snapshot.size = 500;
        REQUIRE(ChangeDetector::classify(cursor, snapshot).kind == ChangeKind::Unchanged);
    }

    SECTION("Grown") {
        snapshot.size = 620;
        ChangeEvent event = ChangeDetector::classify(cursor, snapshot);
        REQUIRE(event.kind == ChangeKind::Grown);
        REQUIRE(event.grown_by == 120);
    }

    SECTION("Truncated to zero") {
        snapshot.size = 0;
        ChangeEvent event = ChangeDetector::classify(cursor, snapshot);
        REQUIRE(event.kind == ChangeKind::Truncated);

        cursor.reset(event.snapshot.identity);
        REQUIRE(cursor.offset == 0);
        REQUIRE(ChangeDetector::classify(cursor, snapshot).kind == ChangeKind::Unchanged);
    }

    SECTION("Replaced wins over size") {
        snapshot.identity = FileIdentity{1, 43};
        snapshot.size = 500;
        REQUIRE(ChangeDetector::classify(cursor, snapshot).kind == ChangeKind::Replaced);

        snapshot.size = 10;
        REQUIRE(ChangeDetector::classify(cursor, snapshot).kind == ChangeKind::Replaced);
    }
}

TEST_CASE("Snapshot a real file", "[detector]") {
    TempDir dir;
    std::string path = dir.file("laravel.log");

    SECTION("Missing file") {
        ChangeDetector detector(path);
        REQUIRE_THROWS_AS(detector.snapshot(), FileNotFoundError);

        try {
            detector.snapshot();
        } catch (const FileNotFoundError& e) {
            REQUIRE(e.path() == path);
        }
    }

    SECTION("Directory is not a log file") {
        ChangeDetector detector(dir.path().string());
        REQUIRE_THROWS_AS(detector.snapshot(), TransientIOError);
    }

    SECTION("Growth, truncation and rotation") {
        write_file(path, std::string(500, 'x'));
        ChangeDetector detector(path);

        FileSnapshot first = detector.snapshot();
        REQUIRE(first.size == 500);

        WatchCursor cursor;
        cursor.file_path = path;
        cursor.file_identity = first.identity;
        cursor.offset = 500;
        REQUIRE(detector.poll(cursor).kind == ChangeKind::Unchanged);

        append_file(path, "more");
        ChangeEvent grown = detector.poll(cursor);
        REQUIRE(grown.kind == ChangeKind::Grown);
        REQUIRE(grown.grown_by == 4);
        cursor.offset = 504;

        std::filesystem::resize_file(path, 0);
        ChangeEvent truncated = detector.poll(cursor);
        REQUIRE(truncated.kind == ChangeKind::Truncated);
        REQUIRE(truncated.snapshot.identity == first.identity);
        cursor.reset(truncated.snapshot.identity);

        // Create the replacement while the old file still exists so the inode differs.
        std::string rotated = dir.file("laravel.log.new");
        write_file(rotated, "fresh");
        std::filesystem::rename(rotated, path);
        ChangeEvent replaced = detector.poll(cursor);
        REQUIRE(replaced.kind == ChangeKind::Replaced);
        REQUIRE(replaced.snapshot.size == 5);
    }
}

TEST_CASE("Incremental reads", "[reader]") {
    TempDir dir;
    std::string path = dir.file("laravel.log");

    SECTION("Only new bytes, cursor advances") {
        write_file(path, "first line\n");

        WatchCursor cursor = cursor_at_start(path);
        IncrementalReader reader;

        REQUIRE(reader.read_new_bytes(cursor) == "first line\n");
        REQUIRE(cursor.offset == 11);
        REQUIRE(reader.read_new_bytes(cursor).empty());
        REQUIRE(cursor.offset == 11);

        append_file(path, "second");
        REQUIRE(reader.read_new_bytes(cursor) == "second");
        REQUIRE(cursor.offset == 17);
        REQUIRE_FALSE(reader.last_read_capped());
    }

    SECTION("Reads are capped") {
        write_file(path, std::string(25, 'a'));

        WatchCursor cursor = cursor_at_start(path);
        IncrementalReader reader(10);

        REQUIRE(reader.read_new_bytes(cursor).size() == 10);
        REQUIRE(reader.last_read_capped());
        REQUIRE(reader.read_new_bytes(cursor).size() == 10);
        REQUIRE(reader.last_read_capped());
        REQUIRE(reader.read_new_bytes(cursor).size() == 5);
        REQUIRE_FALSE(reader.last_read_capped());
        REQUIRE(cursor.offset == 25);
    }

    SECTION("Bytes are returned undecoded") {
        std::string bytes = "caf\xC3\xA9 \xFF\r\n";
        write_file(path, bytes);

        WatchCursor cursor = cursor_at_start(path);
        IncrementalReader reader;
        REQUIRE(reader.read_new_bytes(cursor) == bytes);
    }

    SECTION("Missing file leaves the cursor alone") {
        WatchCursor cursor;
        cursor.file_path = path;
        cursor.offset = 7;
        IncrementalReader reader;

        REQUIRE_THROWS_AS(reader.read_new_bytes(cursor), FileNotFoundError);
        REQUIRE(cursor.offset == 7);
    }

    SECTION("A file renamed over the path is not read at the old offset") {
        write_file(path, "[2024-02-02 11:11:11] local.INFO: old file entry\n");
        WatchCursor cursor = cursor_at_start(path);
        IncrementalReader reader;
        REQUIRE(reader.read_new_bytes(cursor).size() == 49);
        REQUIRE_FALSE(reader.last_read_replaced());

        std::string rotated = dir.file("laravel.log.1");
        write_file(rotated,
                   "[2024-02-02 11:11:11] local.INFO: a brand new file, first entry\n"
                   "[2024-02-02 11:11:12] local.INFO: second\n");
        std::filesystem::rename(rotated, path);

        REQUIRE(reader.read_new_bytes(cursor).empty());
        REQUIRE(reader.last_read_replaced());
        REQUIRE(cursor.offset == 49);

        // Once the cursor follows the new file, it is read from the start.
        cursor.reset(ChangeDetector(path).snapshot().identity);
        std::string bytes = reader.read_new_bytes(cursor);
        REQUIRE_FALSE(reader.last_read_replaced());
        REQUIRE(bytes.rfind("[2024-02-02 11:11:11] local.INFO: a brand new file", 0) == 0);
        REQUIRE(cursor.offset == bytes.size());
    }
}
