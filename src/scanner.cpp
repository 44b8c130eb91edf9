#include "scanner.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>

namespace {

struct PendingDir {
    std::string path;
    std::string relative;
    int depth;
    int symlinkHops;
};

std::string extensionOf(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return {};
    }
    std::string extension = name.substr(dot);
    std::ranges::transform(extension, extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

double estimatePercent(std::uint64_t visitedDirs, std::size_t pendingDirs) {
    double total = static_cast<double>(visitedDirs + pendingDirs);
    if (total == 0) {
        return 0;
    }
    return std::min(99.0, static_cast<double>(visitedDirs) / total * 100.0);
}

} // namespace

std::string_view scanStatusName(ScanStatus status) {
    switch (status) {
    case ScanStatus::Initializing: return "initializing";
    case ScanStatus::Scanning: return "scanning";
    case ScanStatus::Analyzing: return "analyzing";
    case ScanStatus::Complete: return "complete";
    }
    return "unknown";
}

std::expected<void, ErrorInfo> validateScanRequest(const ConnectionConfig& config, const ScanLimits& limits, const ScanOptions& options) {
    if (auto valid = validateConnectionConfig(config); !valid) {
        return valid;
    }
    if (limits.maxDepth < 0 || limits.maxDepth > ScanLimits::kMaxDepth) {
        return std::unexpected(ErrorInfo{ErrorKind::ValidationError,
            std::format("max_depth must be between 0 and {}", ScanLimits::kMaxDepth)});
    }
    if (limits.maxFiles < 0 || limits.maxFiles > ScanLimits::kMaxFiles) {
        return std::unexpected(ErrorInfo{ErrorKind::ValidationError,
            std::format("max_files must be between 0 and {}", ScanLimits::kMaxFiles)});
    }
    return validateExclusionPatterns(options.customExclusions);
}

double ScanResult::durationSeconds() const {
    return std::chrono::duration<double>(finishedAt - startedAt).count();
}

LargestFiles::LargestFiles(std::size_t capacity) : capacity_(capacity) {}

void LargestFiles::offer(const FileEntry& entry) {
    if (capacity_ == 0) {
        return;
    }
    if (entries_.size() == capacity_ && entry.size <= entries_.back().size) {
        return;
    }
    auto position = std::ranges::upper_bound(entries_, entry.size, std::greater<>{}, &FileEntry::size);
    entries_.insert(position, entry);
    if (entries_.size() > capacity_) {
        entries_.pop_back();
    }
}

std::string formatBytes(std::uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return std::format("{} B", bytes);
    }
    return std::format("{:.1f} {}", value, units[unit]);
}

TreeScanner::TreeScanner(const AppConfig& config, const Logger& logger, SessionFactory factory)
    : config_(config), logger_(logger), factory_(std::move(factory)) {}

ScanResult TreeScanner::scan(const ConnectionConfig& config,
                             const ScanLimits& limits,
                             const ScanOptions& options,
                             const ScanProgressCallback& onProgress,
                             std::stop_token stopToken) const {
    ScanResult result;
    result.config = config;
    result.startedAt = std::chrono::system_clock::now();

    auto fail = [&](const ErrorInfo& error) {
        result.success = false;
        result.errorKind = error.kind;
        result.errorMessage = error.message;
        result.finishedAt = std::chrono::system_clock::now();
        logger_.logError(std::format("Scan of {} failed: {}", describeEndpoint(config), error.message));
        return result;
    };

    if (auto valid = validateScanRequest(config, limits, options); !valid) {
        return fail(valid.error());
    }
    if (onProgress) {
        onProgress(ScanProgress{ScanStatus::Initializing, config.rootPath, 0, 0, 0, 0, 0,
                                std::format("Connecting to {}", describeEndpoint(config))});
    }

    try {
        auto session = factory_(config);
        if (!session) {
            return fail(ErrorInfo{ErrorKind::UnsupportedCapability, "No session available for protocol"});
        }
        if (auto opened = session->open(config_.loginTimeout); !opened) {
            return fail(opened.error());
        }
        ScanResult scanned = scanSession(*session, config, limits, options, onProgress, stopToken);
        session->close();
        scanned.startedAt = result.startedAt;
        return scanned;
    } catch (const std::exception& e) {
        return fail(ErrorInfo{ErrorKind::ConnectionFailed, std::format("Unexpected scan failure: {}", e.what())});
    }
}

ScanResult TreeScanner::scanSession(RemoteSession& session,
                                    const ConnectionConfig& config,
                                    const ScanLimits& limits,
                                    const ScanOptions& options,
                                    const ScanProgressCallback& onProgress,
                                    std::stop_token stopToken) const {
    ScanResult result;
    result.config = config;
    result.startedAt = std::chrono::system_clock::now();

    ExclusionRules rules = ExclusionRules::withDefaults(options.customExclusions);
    CmsDetector detector(config.rootPath);
    LargestFiles largest;
    FileStatistics& stats = result.stats;
    auto files = std::make_shared<std::vector<FileEntry>>();

    ScanProgress progress;
    progress.status = ScanStatus::Scanning;
    auto lastEmit = std::chrono::steady_clock::now();
    const int progressEvery = std::max(1, config_.progressEveryDirs);
    const int depthBound = limits.maxDepth > 0 ? limits.maxDepth : ScanLimits::kMaxDepth;

    std::vector<PendingDir> pending{{config.rootPath, {}, 0, 0}};
    bool stopped = false;

    while (!pending.empty() && !stopped) {
        if (stopToken.stop_requested()) {
            logger_.logMessage(std::format("Scan of {} cancelled", describeEndpoint(config)));
            stats.truncated = true;
            break;
        }
        PendingDir dir = std::move(pending.back());
        pending.pop_back();

        auto listed = session.list(dir.path);
        ++progress.dirsScanned;
        progress.currentPath = dir.path;
        if (!listed) {
            ++stats.skippedCount;
            ++progress.errorsEncountered;
            logger_.logError(std::format("Skipping {}: {}", dir.path, listed.error().message));
            continue;
        }

        auto entries = std::move(*listed);
        std::ranges::sort(entries, {}, &RemoteEntry::name);
        std::vector<PendingDir> children;

        for (auto& remote : entries) {
            if (!options.includeHidden && remote.name.starts_with('.')) {
                continue;
            }

            FileEntry entry;
            entry.name = remote.name;
            entry.path = joinRemotePath(dir.path, remote.name);
            entry.isDir = remote.isDir;
            entry.isSymlink = remote.isSymlink;
            entry.size = remote.size;
            entry.mtime = remote.mtime;
            entry.permissions = remote.permissions;
            std::string relative = dir.relative.empty() ? remote.name : dir.relative + "/" + remote.name;
            int depth = dir.depth + 1;

            bool followLink = false;
            if (remote.isSymlink) {
                ++stats.symlinksCount;
                entry.isDir = false;
                if (options.followSymlinks) {
                    if (auto target = session.stat(entry.path)) {
                        entry.isDir = target->isDir;
                        entry.size = target->isDir ? 0 : target->size;
                        followLink = target->isDir;
                    } else {
                        ++progress.errorsEncountered;
                        logger_.logMessage(std::format("Dangling symlink {}: {}", entry.path, target.error().message));
                    }
                }
            }

            if (!entry.isDir) {
                if (limits.maxFiles > 0 && stats.totalFiles >= static_cast<std::uint64_t>(limits.maxFiles)) {
                    stats.truncated = true;
                    stopped = true;
                    break;
                }
                entry.extension = extensionOf(entry.name);
            }

            if (auto reason = rules.match(relative)) {
                entry.excluded = true;
                entry.excludeReason = *reason;
            }

            if (entry.isDir) {
                ++stats.totalDirs;
                if (depth > depthBound || (followLink && dir.symlinkHops >= kMaxSymlinkHops)) {
                    stats.truncated = true;
                } else {
                    children.push_back({entry.path, relative, depth, dir.symlinkHops + (followLink ? 1 : 0)});
                }
            } else {
                ++stats.totalFiles;
                stats.totalSize += entry.size;
                std::string key = entry.extension.empty() ? "no-extension" : entry.extension;
                ++stats.extensionCounts[key];
                stats.extensionSizes[key] += entry.size;
                largest.offer(entry);
                if (entry.excluded) {
                    ++stats.excludedCount;
                    stats.excludedSize += entry.size;
                }
                ++progress.filesScanned;
                progress.totalSize += entry.size;
            }
            stats.maxDepth = std::max(stats.maxDepth, depth);
            if (options.detectCms) {
                detector.observe(relative, entry.isDir);
            }
            files->push_back(std::move(entry));
        }

        // Reverse so the alphabetically first child is walked next.
        for (auto& child : children | std::views::reverse) {
            pending.push_back(std::move(child));
        }

        auto now = std::chrono::steady_clock::now();
        if (onProgress && (progress.dirsScanned % progressEvery == 0 || now - lastEmit >= std::chrono::milliseconds(250))) {
            progress.percentComplete = estimatePercent(progress.dirsScanned, pending.size());
            progress.message = std::format("Scanning: {}", dir.path);
            onProgress(progress);
            lastEmit = now;
        }
    }

    if (!pending.empty()) {
        stats.truncated = true;
    }
    stats.largestFiles = largest.entries();

    if (options.detectCms) {
        progress.status = ScanStatus::Analyzing;
        progress.message = "Detecting CMS...";
        if (onProgress) {
            onProgress(progress);
        }
        result.cms = detector.result([&session](const std::string& path) -> std::optional<std::string> {
            auto content = session.readFile(path);
            if (!content) {
                return std::nullopt;
            }
            return std::move(*content);
        });
    }

    result.success = true;
    result.exclusions = rules.patterns();
    result.files = std::move(files);
    result.finishedAt = std::chrono::system_clock::now();

    progress.status = ScanStatus::Complete;
    progress.percentComplete = 100;
    progress.message = std::format("Scanned {} files in {} directories ({})", stats.totalFiles, progress.dirsScanned,
                                   formatBytes(stats.totalSize));
    if (onProgress) {
        onProgress(progress);
    }
    logger_.logMessage(std::format("Scan of {} complete: {}{}", describeEndpoint(config), progress.message,
                                   stats.truncated ? " (truncated)" : ""));
    return result;
}
