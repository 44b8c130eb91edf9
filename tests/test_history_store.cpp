#include "history_store.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

fs::path scratchDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / std::format("sitemover-test-{}-{}", name,
        std::chrono::steady_clock::now().time_since_epoch().count());
    fs::remove_all(dir);
    return dir;
}

HistoryEntry entryAt(const std::string& id, int minutesAgo) {
    HistoryEntry entry;
    entry.id = id;
    entry.type = JobType::Transfer;
    entry.method = "streaming-copy";
    entry.status = JobStatus::Completed;
    auto base = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    entry.startedAt = base - std::chrono::minutes(minutesAgo);
    entry.finishedAt = entry.startedAt + std::chrono::seconds(42);
    entry.durationSeconds = 42;
    entry.totalFiles = 12;
    entry.totalBytes = 4096;
    entry.sourceHost = "old.example";
    entry.destHost = "new.example";
    return entry;
}

void testMissingFileIsEmpty() {
    auto dir = scratchDir("missing");
    JsonHistoryStore store((dir / "history.json").string(), 10, Logger::quiet());
    auto entries = store.load();
    assert(entries && entries->empty());
    std::cout << "✓ Missing history file loads as empty\n";
}

void testAppendKeepsNewest() {
    auto dir = scratchDir("limit");
    JsonHistoryStore store((dir / "nested" / "history.json").string(), 2, Logger::quiet());
    assert(store.append(entryAt("first", 30)));
    assert(store.append(entryAt("second", 20)));
    assert(store.append(entryAt("third", 10)));

    auto entries = store.load();
    assert(entries);
    assert(entries->size() == 2);
    assert((*entries)[0].id == "third");
    assert((*entries)[1].id == "second");
    assert((*entries)[0].totalBytes == 4096);
    assert((*entries)[0].destHost == "new.example");
    assert(!fs::exists(dir / "nested" / "history.json.tmp"));
    fs::remove_all(dir);
    std::cout << "✓ History keeps the newest entries, newest first\n";
}

void testFindAndClear() {
    auto dir = scratchDir("find");
    JsonHistoryStore store((dir / "history.json").string(), 10, Logger::quiet());
    assert(store.append(entryAt("abc", 5)));
    auto found = store.find("abc");
    assert(found && *found && (*found)->sourceHost == "old.example");
    auto missing = store.find("nope");
    assert(missing && !*missing);

    assert(store.clear());
    auto entries = store.load();
    assert(entries && entries->empty());
    fs::remove_all(dir);
    std::cout << "✓ Entries found by id and cleared\n";
}

void testCorruptFile() {
    auto dir = scratchDir("corrupt");
    fs::create_directories(dir);
    {
        std::ofstream file(dir / "history.json");
        file << "{ not json";
    }
    JsonHistoryStore store((dir / "history.json").string(), 10, Logger::quiet());
    auto entries = store.load();
    assert(!entries);
    assert(entries.error().kind == ErrorKind::IoError);
    assert(!store.append(entryAt("x", 1)));
    fs::remove_all(dir);
    std::cout << "✓ Corrupt history reported as an I/O error\n";
}

void testMalformedEntriesSkipped() {
    auto dir = scratchDir("malformed");
    fs::create_directories(dir);
    {
        std::ofstream file(dir / "history.json");
        file << R"([{"id": "", "type": "scan"},
                   {"id": "ok", "type": "scan", "status": "failed", "start_time": "2024-05-01T12:00:00Z",
                    "end_time": "2024-05-01T12:01:00Z", "error_message": "boom"}])";
    }
    JsonHistoryStore store((dir / "history.json").string(), 10, Logger::quiet());
    auto entries = store.load();
    assert(entries && entries->size() == 1);
    assert(entries->front().status == JobStatus::Failed);
    assert(entries->front().errorMessage == "boom");
    fs::remove_all(dir);
    std::cout << "✓ Malformed entries skipped\n";
}

void testWronglyTypedEntriesSkipped() {
    auto dir = scratchDir("typed");
    fs::create_directories(dir);
    {
        std::ofstream file(dir / "history.json");
        file << R"([{"id": "a", "type": "scan", "status": "completed", "start_time": "2024-05-01T12:00:00Z",
                    "end_time": "2024-05-01T12:01:00Z", "total_files": "abc"},
                   {"id": "b", "type": "scan", "status": "completed", "start_time": "2024-05-01T12:00:00Z",
                    "end_time": "2024-05-01T12:01:00Z", "total_bytes": -1},
                   {"id": {}, "type": "scan"},
                   {"id": "c", "type": ["scan"], "status": "completed"},
                   {"id": "d", "type": "scan", "status": "completed", "start_time": 17,
                    "end_time": "2024-05-01T12:01:00Z"},
                   {"id": "e", "type": "scan", "status": "completed", "start_time": "2024-05-01T12:00:00Z",
                    "end_time": "2024-05-01T12:01:00Z", "source_host": 5},
                   "stray",
                   {"id": "ok", "type": "scan", "status": "completed", "start_time": "2024-05-01T12:00:00Z",
                    "end_time": "2024-05-01T12:01:00Z", "total_files": 7}])";
    }
    JsonHistoryStore store((dir / "history.json").string(), 10, Logger::quiet());
    auto entries = store.load();
    assert(entries && entries->size() == 1);
    assert(entries->front().id == "ok");
    assert(entries->front().totalFiles == 7);

    assert(store.append(entryAt("fresh", 1)));
    entries = store.load();
    assert(entries && entries->size() == 2);
    assert(entries->front().id == "fresh");
    fs::remove_all(dir);
    std::cout << "✓ Wrongly typed entries skipped without failing appends\n";
}

} // namespace

int main() {
    testMissingFileIsEmpty();
    testAppendKeepsNewest();
    testFindAndClear();
    testCorruptFile();
    testMalformedEntriesSkipped();
    testWronglyTypedEntriesSkipped();
    return 0;
}
