#include "json_codec.hpp"
#include <ctime>
#include <format>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

constexpr const char* kMask = "******";

Json::Value uint64Value(std::uint64_t value) {
    return Json::Value(static_cast<Json::UInt64>(value));
}

Json::Value stringArray(const std::vector<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) {
        array.append(item);
    }
    return array;
}

Json::Value secret(const std::string& value) {
    return value.empty() ? Json::Value("") : Json::Value(kMask);
}

Json::Value capabilitiesJson(const Capabilities& capabilities) {
    Json::Value json;
    json["can_read"] = capabilities.canRead;
    json["can_write"] = capabilities.canWrite;
    json["can_list"] = capabilities.canList;
    json["shell_available"] = capabilities.shellAvailable;
    json["passive_listing"] = capabilities.passiveListing;
    json["mlsd_supported"] = capabilities.mlsdSupported;
    json["protocol_extensions"] = stringArray(capabilities.protocolExtensions);
    json["protocol_version"] = capabilities.protocolVersion;
    json["compression_types"] = stringArray(capabilities.compressionTypes);
    return json;
}

Json::Value performanceJson(const Performance& performance) {
    Json::Value json;
    json["latency_ms"] = performance.latencyMs;
    json["connection_setup_ms"] = performance.connectionSetupMs;
    json["upload_bytes_per_second"] = performance.uploadBytesPerSecond;
    json["download_bytes_per_second"] = performance.downloadBytesPerSecond;
    return json;
}

Json::Value statisticsJson(const FileStatistics& stats) {
    Json::Value json;
    json["total_files"] = uint64Value(stats.totalFiles);
    json["total_dirs"] = uint64Value(stats.totalDirs);
    json["total_size"] = uint64Value(stats.totalSize);
    json["total_size_human"] = formatBytes(stats.totalSize);
    json["max_depth"] = stats.maxDepth;
    Json::Value counts(Json::objectValue);
    for (const auto& [extension, count] : stats.extensionCounts) {
        counts[extension] = uint64Value(count);
    }
    json["extension_counts"] = counts;
    Json::Value sizes(Json::objectValue);
    for (const auto& [extension, size] : stats.extensionSizes) {
        sizes[extension] = uint64Value(size);
    }
    json["extension_sizes"] = sizes;
    Json::Value largest(Json::arrayValue);
    for (const auto& entry : stats.largestFiles) {
        largest.append(toJson(entry));
    }
    json["largest_files"] = largest;
    json["excluded_count"] = uint64Value(stats.excludedCount);
    json["excluded_size"] = uint64Value(stats.excludedSize);
    json["symlinks_count"] = uint64Value(stats.symlinksCount);
    json["skipped_count"] = uint64Value(stats.skippedCount);
    json["truncated"] = stats.truncated;
    return json;
}

Json::Value verificationJson(const Verification& verification) {
    Json::Value json;
    json["success"] = verification.success;
    json["source_files"] = uint64Value(verification.sourceFiles);
    json["dest_files"] = uint64Value(verification.destFiles);
    json["source_size"] = uint64Value(verification.sourceSize);
    json["dest_size"] = uint64Value(verification.destSize);
    json["missing_files"] = stringArray(verification.missingFiles);
    json["message"] = verification.message;
    return json;
}

template <typename Result>
Json::Value tagged(const char* kind, const std::shared_ptr<const Result>& result) {
    Json::Value json = result ? toJson(*result) : Json::Value(Json::nullValue);
    if (json.isObject()) {
        json["kind"] = kind;
    }
    return json;
}

} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
    return timeBuf;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    std::tm tmUtc{};
    std::istringstream input(text);
    input >> std::get_time(&tmUtc, "%Y-%m-%dT%H:%M:%SZ");
    if (input.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tmUtc));
}

Json::Value toJson(const ErrorInfo& error) {
    Json::Value json;
    json["kind"] = std::string(errorKindName(error.kind));
    json["message"] = error.message;
    return json;
}

Json::Value toJson(const ConnectionConfig& config) {
    Json::Value json;
    json["protocol"] = std::string(protocolName(config.protocol));
    json["host"] = config.host;
    json["port"] = config.port;
    json["username"] = config.username;
    json["password"] = secret(config.password);
    json["ssh_key"] = secret(config.sshKey);
    json["root_path"] = config.rootPath;
    return json;
}

Json::Value toJson(const ProbeResult& result) {
    Json::Value json;
    json["success"] = result.success;
    json["protocol"] = std::string(protocolName(result.endpoint.protocol));
    json["endpoint"] = toJson(result.endpoint);
    json["tested_at"] = formatTimestamp(result.testedAt);
    if (!result.success) {
        json["error"] = toJson(ErrorInfo{result.errorKind, result.errorMessage});
        return json;
    }
    json["capabilities"] = capabilitiesJson(result.capabilities);
    json["performance"] = performanceJson(result.performance);
    json["badges"] = stringArray(result.badges);
    return json;
}

Json::Value toJson(const ExclusionPattern& pattern) {
    Json::Value json;
    json["pattern"] = pattern.pattern;
    json["reason"] = pattern.reason;
    json["is_automatic"] = pattern.isAutomatic;
    json["enabled"] = pattern.enabled;
    return json;
}

Json::Value toJson(const FileEntry& entry) {
    Json::Value json;
    json["path"] = entry.path;
    json["name"] = entry.name;
    json["size"] = uint64Value(entry.size);
    json["is_dir"] = entry.isDir;
    json["is_symlink"] = entry.isSymlink;
    json["mtime"] = static_cast<Json::Int64>(entry.mtime);
    json["permissions"] = entry.permissions;
    json["extension"] = entry.extension;
    json["excluded"] = entry.excluded;
    if (entry.excluded) {
        json["exclude_reason"] = entry.excludeReason;
    }
    return json;
}

Json::Value toJson(const CmsDetection& detection) {
    Json::Value json;
    json["detected"] = detection.detected;
    json["type"] = std::string(cmsTypeName(detection.type));
    json["confidence"] = detection.confidence;
    json["indicators"] = stringArray(detection.indicators);
    if (detection.databaseConfig) {
        const DatabaseConfig& db = *detection.databaseConfig;
        Json::Value dbJson;
        dbJson["host"] = db.host;
        dbJson["port"] = db.port;
        dbJson["database"] = db.database;
        dbJson["username"] = db.username;
        dbJson["password"] = secret(db.password);
        dbJson["prefix"] = db.prefix;
        json["database_config"] = dbJson;
    }
    json["root_path"] = detection.rootPath;
    json["config_file"] = detection.configFile;
    json["version"] = detection.version;
    return json;
}

Json::Value toJson(const ScanProgress& progress) {
    Json::Value json;
    json["status"] = std::string(scanStatusName(progress.status));
    json["current_path"] = progress.currentPath;
    json["files_scanned"] = uint64Value(progress.filesScanned);
    json["dirs_scanned"] = uint64Value(progress.dirsScanned);
    json["total_size"] = uint64Value(progress.totalSize);
    json["percent_complete"] = progress.percentComplete;
    json["errors_encountered"] = uint64Value(progress.errorsEncountered);
    json["message"] = progress.message;
    return json;
}

Json::Value toJson(const ScanResult& result) {
    Json::Value json;
    json["success"] = result.success;
    if (!result.success) {
        json["error"] = toJson(ErrorInfo{result.errorKind, result.errorMessage});
    }
    json["config"] = toJson(result.config);
    json["statistics"] = statisticsJson(result.stats);
    json["cms_detection"] = toJson(result.cms);
    Json::Value exclusions(Json::arrayValue);
    for (const auto& pattern : result.exclusions) {
        exclusions.append(toJson(pattern));
    }
    json["exclusions"] = exclusions;
    json["entry_count"] = uint64Value(result.files ? result.files->size() : 0);
    json["started_at"] = formatTimestamp(result.startedAt);
    json["finished_at"] = formatTimestamp(result.finishedAt);
    json["duration_seconds"] = result.durationSeconds();
    return json;
}

Json::Value toJson(const TransferStrategy& strategy) {
    Json::Value json;
    json["method"] = std::string(transferMethodName(strategy.method));
    json["score"] = strategy.score;
    json["estimated_time_seconds"] = static_cast<Json::Int64>(strategy.estimatedTime.count());
    json["pros"] = stringArray(strategy.pros);
    json["cons"] = stringArray(strategy.cons);
    json["requirements"] = stringArray(strategy.requirements);
    json["command"] = strategy.command;
    json["command_explanation"] = strategy.commandExplanation;
    json["can_resume"] = strategy.canResume;
    json["supports_progress"] = strategy.supportsProgress;
    return json;
}

Json::Value toJson(const PlanResult& result) {
    Json::Value json;
    json["success"] = result.success;
    if (!result.success) {
        json["error_message"] = result.errorMessage;
    }
    Json::Value strategies(Json::arrayValue);
    for (const auto& strategy : result.strategies) {
        strategies.append(toJson(strategy));
    }
    json["strategies"] = strategies;
    json["recommended_strategy"] = result.recommended ? toJson(*result.recommended) : Json::Value(Json::nullValue);
    json["warnings"] = stringArray(result.warnings);
    json["requires_database"] = result.requiresDatabase;
    json["estimated_total_time_seconds"] = static_cast<Json::Int64>(result.estimatedTotalTime.count());
    return json;
}

Json::Value toJson(const TransferProgress& progress) {
    Json::Value json;
    json["status"] = std::string(transferStatusName(progress.status));
    json["files_transferred"] = uint64Value(progress.filesTransferred);
    json["total_files"] = uint64Value(progress.totalFiles);
    json["bytes_transferred"] = uint64Value(progress.bytesTransferred);
    json["total_bytes"] = uint64Value(progress.totalBytes);
    json["current_file"] = progress.currentFile;
    json["speed_bytes_per_second"] = progress.speedBytesPerSecond;
    json["eta_seconds"] = progress.etaSeconds;
    json["percent_complete"] = progress.percentComplete;
    json["errors_count"] = uint64Value(progress.errorsCount);
    json["last_error"] = progress.lastError;
    json["elapsed_seconds"] = progress.elapsedSeconds;
    return json;
}

Json::Value toJson(const TransferResult& result) {
    Json::Value json;
    json["success"] = result.success;
    if (!result.success) {
        json["error"] = toJson(ErrorInfo{result.errorKind, result.errorMessage});
    }
    json["files_transferred"] = uint64Value(result.filesTransferred);
    json["bytes_transferred"] = uint64Value(result.bytesTransferred);
    json["duration_seconds"] = result.durationSeconds;
    json["average_speed_bytes_per_second"] = result.averageSpeedBytesPerSecond;
    json["errors_count"] = uint64Value(result.errorsCount);
    json["skipped_files"] = stringArray(result.skippedFiles);
    json["failed_files"] = stringArray(result.failedFiles);
    if (result.verification) {
        json["verification"] = verificationJson(*result.verification);
    }
    return json;
}

Json::Value toJson(const JobProgress& progress) {
    if (auto* scan = std::get_if<ScanProgress>(&progress)) {
        Json::Value json = toJson(*scan);
        json["kind"] = "scan";
        return json;
    }
    if (auto* transfer = std::get_if<TransferProgress>(&progress)) {
        Json::Value json = toJson(*transfer);
        json["kind"] = "transfer";
        return json;
    }
    return Json::Value(Json::nullValue);
}

Json::Value toJson(const JobResult& result) {
    if (auto* scan = std::get_if<std::shared_ptr<const ScanResult>>(&result)) {
        return tagged("scan", *scan);
    }
    if (auto* plan = std::get_if<std::shared_ptr<const PlanResult>>(&result)) {
        return tagged("plan", *plan);
    }
    if (auto* transfer = std::get_if<std::shared_ptr<const TransferResult>>(&result)) {
        return tagged("transfer", *transfer);
    }
    return Json::Value(Json::nullValue);
}

Json::Value toJson(const Job& job) {
    Json::Value json;
    json["id"] = job.id;
    json["type"] = std::string(jobTypeName(job.type));
    json["status"] = std::string(jobStatusName(job.status));
    if (!job.method.empty()) {
        json["method"] = job.method;
    }
    json["created_at"] = formatTimestamp(job.createdAt);
    json["updated_at"] = formatTimestamp(job.updatedAt);
    json["completed_at"] = job.completedAt ? Json::Value(formatTimestamp(*job.completedAt)) : Json::Value(Json::nullValue);
    json["source"] = toJson(job.source);
    json["dest"] = job.dest ? toJson(*job.dest) : Json::Value(Json::nullValue);
    json["progress"] = toJson(job.progress);
    json["result"] = toJson(job.result);
    json["error_message"] = job.errorMessage ? Json::Value(*job.errorMessage) : Json::Value(Json::nullValue);
    return json;
}

Json::Value toJson(const JobEvent& event) {
    Json::Value json;
    json["type"] = std::string(jobEventTypeName(event.type));
    json["job_id"] = event.jobId;
    json["at"] = formatTimestamp(event.at);
    switch (event.type) {
    case JobEventType::Output:
        json["line"] = event.line;
        break;
    case JobEventType::Progress:
        json["progress"] = toJson(event.progress);
        break;
    case JobEventType::Complete:
        json["status"] = std::string(jobStatusName(event.status));
        json["result"] = toJson(event.result);
        if (event.errorMessage) {
            json["error_message"] = *event.errorMessage;
        }
        break;
    }
    return json;
}

Json::Value toJson(const HistoryEntry& entry) {
    Json::Value json;
    json["id"] = entry.id;
    json["type"] = std::string(jobTypeName(entry.type));
    json["method"] = entry.method;
    json["status"] = std::string(jobStatusName(entry.status));
    json["start_time"] = formatTimestamp(entry.startedAt);
    json["end_time"] = formatTimestamp(entry.finishedAt);
    json["duration_seconds"] = entry.durationSeconds;
    json["total_files"] = uint64Value(entry.totalFiles);
    json["total_bytes"] = uint64Value(entry.totalBytes);
    json["source_host"] = entry.sourceHost;
    json["dest_host"] = entry.destHost;
    json["error_message"] = entry.errorMessage;
    return json;
}

std::expected<HistoryEntry, ErrorInfo> historyEntryFromJson(const Json::Value& json) {
    auto invalid = [](std::string message) {
        return std::unexpected(ErrorInfo{ErrorKind::ValidationError, std::move(message)});
    };
    if (!json.isObject()) {
        return invalid("history entry is not an object");
    }
    // Absent and null fields take their defaults; any other type mismatch rejects the entry.
    auto text = [&json](const char* key, std::string& out) {
        const Json::Value& value = json[key];
        if (value.isNull()) {
            return true;
        }
        if (!value.isString()) {
            return false;
        }
        out = value.asString();
        return true;
    };
    auto count = [&json](const char* key, std::uint64_t& out) {
        const Json::Value& value = json[key];
        if (value.isNull()) {
            return true;
        }
        if (!value.isUInt64()) {
            return false;
        }
        out = value.asUInt64();
        return true;
    };

    HistoryEntry entry;
    if (!text("id", entry.id) || entry.id.empty()) {
        return invalid("history entry has no id");
    }
    std::string typeName;
    std::string statusName;
    if (!text("type", typeName) || !text("status", statusName)) {
        return invalid(std::format("history entry {} has a malformed type or status", entry.id));
    }
    auto type = parseJobType(typeName);
    auto status = parseJobStatus(statusName);
    if (!type || !status) {
        return invalid(std::format("history entry {} has an unknown type or status", entry.id));
    }
    entry.type = *type;
    entry.status = *status;

    std::string startText;
    std::string endText;
    if (!text("start_time", startText) || !text("end_time", endText)) {
        return invalid(std::format("history entry {} has malformed timestamps", entry.id));
    }
    auto startedAt = parseTimestamp(startText);
    auto finishedAt = parseTimestamp(endText);
    if (!startedAt || !finishedAt) {
        return invalid(std::format("history entry {} has malformed timestamps", entry.id));
    }
    entry.startedAt = *startedAt;
    entry.finishedAt = *finishedAt;

    const Json::Value& duration = json["duration_seconds"];
    if (!duration.isNull() && !duration.isNumeric()) {
        return invalid(std::format("history entry {} has a malformed duration", entry.id));
    }
    entry.durationSeconds = duration.isNull() ? 0.0 : duration.asDouble();
    if (!count("total_files", entry.totalFiles) || !count("total_bytes", entry.totalBytes)) {
        return invalid(std::format("history entry {} has malformed totals", entry.id));
    }
    if (!text("method", entry.method) || !text("source_host", entry.sourceHost) || !text("dest_host", entry.destHost) ||
        !text("error_message", entry.errorMessage)) {
        return invalid(std::format("history entry {} has a malformed text field", entry.id));
    }
    return entry;
}

std::string writeJson(const Json::Value& value, bool compact) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = compact ? "" : "  ";
    return Json::writeString(builder, value);
}
