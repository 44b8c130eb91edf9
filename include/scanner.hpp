/**
 * @file scanner.hpp
 * @brief Remote tree scanner: statistics, exclusions and CMS detection over one session.
 *
 * The scanner walks a remote tree depth-first through a RemoteSession, reports
 * progress at a bounded cadence and returns a ScanResult describing everything
 * it visited. Unreadable subtrees are counted and skipped; only a failed
 * connection makes the scan fail.
 */

#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <expected>
#include <chrono>
#include <stop_token>
#include <cstdint>
#include "app_config.hpp"
#include "cms_detector.hpp"
#include "connection_config.hpp"
#include "errors.hpp"
#include "exclusions.hpp"
#include "logger.hpp"
#include "remote_session.hpp"

/**
 * @brief Bounds of a scan. Zero means unlimited.
 */
struct ScanLimits {
    int maxDepth = 0;
    int maxFiles = 0;

    static constexpr int kMaxDepth = 1000;
    static constexpr int kMaxFiles = 10'000'000;
};

/**
 * @brief Scan switches and custom exclusion patterns.
 */
struct ScanOptions {
    bool detectCms = true;
    bool includeHidden = false;
    bool followSymlinks = false;
    std::vector<std::string> customExclusions;
};

/**
 * @brief Validates the endpoint, the limits and the custom exclusions before any network I/O.
 */
std::expected<void, ErrorInfo> validateScanRequest(const ConnectionConfig& config, const ScanLimits& limits, const ScanOptions& options);

/**
 * @brief One visited entry.
 */
struct FileEntry {
    std::string path;           ///< Absolute remote path.
    std::string name;
    std::uint64_t size = 0;
    bool isDir = false;
    bool isSymlink = false;
    std::int64_t mtime = 0;
    std::uint32_t permissions = 0;
    std::string extension;      ///< Lower-case, with the leading dot; empty for directories.
    bool excluded = false;
    std::string excludeReason;
};

enum class ScanStatus {
    Initializing,
    Scanning,
    Analyzing,
    Complete
};

std::string_view scanStatusName(ScanStatus status);

/**
 * @brief Snapshot published while a scan runs.
 *
 * percentComplete is an estimate and may move backwards when new directories are discovered.
 */
struct ScanProgress {
    ScanStatus status = ScanStatus::Initializing;
    std::string currentPath;
    std::uint64_t filesScanned = 0;
    std::uint64_t dirsScanned = 0;
    std::uint64_t totalSize = 0;
    double percentComplete = 0;
    std::uint64_t errorsEncountered = 0;
    std::string message;
};

/**
 * @brief Aggregate statistics of a scan.
 *
 * Excluded files still count in totalFiles and totalSize, so excludedCount <= totalFiles
 * and excludedSize <= totalSize always hold.
 */
struct FileStatistics {
    std::uint64_t totalFiles = 0;
    std::uint64_t totalDirs = 0;
    std::uint64_t totalSize = 0;
    int maxDepth = 0;
    std::map<std::string, std::uint64_t> extensionCounts;  ///< "no-extension" for files without one.
    std::map<std::string, std::uint64_t> extensionSizes;
    std::vector<FileEntry> largestFiles;                   ///< Descending by size.
    std::uint64_t excludedCount = 0;
    std::uint64_t excludedSize = 0;
    std::uint64_t symlinksCount = 0;
    std::uint64_t skippedCount = 0;                        ///< Directories that could not be listed.
    bool truncated = false;                                ///< A depth or file bound stopped the walk.
};

/**
 * @brief Final outcome of a scan.
 */
struct ScanResult {
    bool success = false;
    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;
    FileStatistics stats;
    CmsDetection cms;
    std::vector<ExclusionPattern> exclusions;
    std::shared_ptr<const std::vector<FileEntry>> files;  ///< Every visited entry, in walk order.
    ConnectionConfig config;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;

    double durationSeconds() const;
};

/**
 * @brief Bounded list of the largest files, kept sorted descending by size.
 */
class LargestFiles {
public:
    explicit LargestFiles(std::size_t capacity = 10);

    void offer(const FileEntry& entry);

    const std::vector<FileEntry>& entries() const { return entries_; }

private:
    std::size_t capacity_;
    std::vector<FileEntry> entries_;
};

/**
 * @brief Formats a byte count as "12.3 MB".
 */
std::string formatBytes(std::uint64_t bytes);

using ScanProgressCallback = std::function<void(const ScanProgress&)>;

/**
 * @brief Walks remote trees.
 */
class TreeScanner {
public:
    /// Followed directory symlinks allowed along one path.
    static constexpr int kMaxSymlinkHops = 8;

    TreeScanner(const AppConfig& config, const Logger& logger, SessionFactory factory);

    /**
     * @brief Connects to the endpoint and scans its root path.
     *
     * @param config Endpoint to scan.
     * @param limits Depth and file bounds.
     * @param options Scan switches and custom exclusions.
     * @param onProgress Receives progress snapshots. May be empty.
     * @param stopToken Checked once per directory; a stopped scan returns what it visited.
     * @return The result. Never throws for network or permission conditions.
     */
    ScanResult scan(const ConnectionConfig& config,
                    const ScanLimits& limits,
                    const ScanOptions& options,
                    const ScanProgressCallback& onProgress = {},
                    std::stop_token stopToken = {}) const;

    /**
     * @brief Scans through an already opened session.
     */
    ScanResult scanSession(RemoteSession& session,
                           const ConnectionConfig& config,
                           const ScanLimits& limits,
                           const ScanOptions& options,
                           const ScanProgressCallback& onProgress = {},
                           std::stop_token stopToken = {}) const;

private:
    const AppConfig& config_;
    const Logger& logger_;
    SessionFactory factory_;
};

#endif // SCANNER_HPP
