#include "history_store.hpp"
#include "json_codec.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <json/json.h>

namespace fs = std::filesystem;

JsonHistoryStore::JsonHistoryStore(std::string historyFile, int limit, const Logger& logger)
    : historyFile_(std::move(historyFile)), limit_(static_cast<std::size_t>(std::max(limit, 1))), logger_(logger) {}

std::expected<void, ErrorInfo> JsonHistoryStore::append(const HistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = read();
    if (!entries) {
        return std::unexpected(entries.error());
    }
    entries->push_back(entry);
    if (entries->size() > limit_) {
        entries->erase(entries->begin(), entries->end() - static_cast<std::ptrdiff_t>(limit_));
    }
    return write(*entries);
}

std::expected<std::vector<HistoryEntry>, ErrorInfo> JsonHistoryStore::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = read();
    if (!entries) {
        return entries;
    }
    std::ranges::stable_sort(*entries, std::greater<>{}, &HistoryEntry::startedAt);
    return entries;
}

std::expected<std::optional<HistoryEntry>, ErrorInfo> JsonHistoryStore::find(const std::string& id) const {
    auto entries = load();
    if (!entries) {
        return std::unexpected(entries.error());
    }
    auto it = std::ranges::find(*entries, id, &HistoryEntry::id);
    if (it == entries->end()) {
        return std::optional<HistoryEntry>{};
    }
    return std::optional<HistoryEntry>{*it};
}

std::expected<void, ErrorInfo> JsonHistoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    return write({});
}

std::expected<std::vector<HistoryEntry>, ErrorInfo> JsonHistoryStore::read() const {
    std::vector<HistoryEntry> entries;
    if (!fs::exists(historyFile_)) {
        return entries;
    }
    std::ifstream file(historyFile_);
    if (!file.is_open()) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Cannot open history file: {}", historyFile_)});
    }
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(file, root) || !root.isArray()) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Failed to parse history file: {}", historyFile_)});
    }
    for (const auto& item : root) {
        auto entry = historyEntryFromJson(item);
        if (!entry) {
            logger_.logError(std::format("Skipping malformed history entry: {}", entry.error().message));
            continue;
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}

std::expected<void, ErrorInfo> JsonHistoryStore::write(const std::vector<HistoryEntry>& entries) const {
    fs::path path(historyFile_);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError,
                std::format("Cannot create history directory {}: {}", path.parent_path().string(), ec.message())});
        }
    }

    Json::Value root(Json::arrayValue);
    for (const auto& entry : entries) {
        root.append(toJson(entry));
    }

    // Written beside the history file, then renamed over it.
    std::string tmpFile = historyFile_ + ".tmp";
    {
        std::ofstream outFile(tmpFile, std::ios::trunc);
        if (!outFile.is_open()) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Cannot write history file: {}", tmpFile)});
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(root, &outFile);
        outFile << '\n';
        if (!outFile) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Failed writing history file: {}", tmpFile)});
        }
    }
    std::error_code ec;
    fs::rename(tmpFile, historyFile_, ec);
    if (ec) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Cannot replace history file {}: {}", historyFile_, ec.message())});
    }
    return {};
}
