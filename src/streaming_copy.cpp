#include "streaming_copy.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

namespace {

constexpr double kMiB = 1024.0 * 1024.0;

struct CopyItem {
    std::string relative;
    std::uint64_t size;
};

/**
 * @brief Shared byte-rate limiter. Callers sleep until the bytes they consumed are due.
 */
class Throttle {
public:
    explicit Throttle(double bytesPerSecond) : rate_(bytesPerSecond), start_(std::chrono::steady_clock::now()) {}

    void consume(std::size_t bytes) {
        if (rate_ <= 0) {
            return;
        }
        std::chrono::duration<double> due;
        {
            std::lock_guard lock(mutex_);
            consumed_ += static_cast<double>(bytes);
            due = std::chrono::duration<double>(consumed_ / rate_);
        }
        std::this_thread::sleep_until(start_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(due));
    }

private:
    double rate_;
    double consumed_ = 0;
    std::chrono::steady_clock::time_point start_;
    std::mutex mutex_;
};

/**
 * @brief Progress and outcome shared by the copy workers.
 */
class CopyState {
public:
    CopyState(const TransferControl& control, std::uint64_t totalFiles, std::uint64_t totalBytes)
        : control_(control), start_(std::chrono::steady_clock::now()), lastEmit_(start_) {
        progress_.status = TransferStatus::Transferring;
        progress_.totalFiles = totalFiles;
        progress_.totalBytes = totalBytes;
    }

    void addBytes(std::size_t bytes, const std::string& file) {
        std::lock_guard lock(mutex_);
        progress_.bytesTransferred += bytes;
        progress_.currentFile = file;
        emitLocked(false);
    }

    void fileDone(const std::string& file) {
        std::lock_guard lock(mutex_);
        ++progress_.filesTransferred;
        progress_.currentFile = file;
        emitLocked(true);
    }

    void fileFailed(const std::string& file, const std::string& error) {
        std::lock_guard lock(mutex_);
        ++progress_.errorsCount;
        progress_.lastError = std::format("{}: {}", file, error);
        failed_.push_back(file);
        emitLocked(true);
    }

    void setStatus(TransferStatus status) {
        std::lock_guard lock(mutex_);
        progress_.status = status;
        emitLocked(true);
    }

    TransferProgress snapshot() const {
        std::lock_guard lock(mutex_);
        return progress_;
    }

    std::vector<std::string> failedFiles() const {
        std::lock_guard lock(mutex_);
        return failed_;
    }

private:
    void emitLocked(bool force) {
        auto now = std::chrono::steady_clock::now();
        if (!force && now - lastEmit_ < std::chrono::milliseconds(250)) {
            return;
        }
        lastEmit_ = now;
        progress_.elapsedSeconds = std::chrono::duration<double>(now - start_).count();
        if (progress_.elapsedSeconds > 0) {
            progress_.speedBytesPerSecond = static_cast<double>(progress_.bytesTransferred) / progress_.elapsedSeconds;
        }
        if (progress_.totalBytes > 0) {
            progress_.percentComplete = std::min(100.0, 100.0 * static_cast<double>(progress_.bytesTransferred) /
                                                            static_cast<double>(progress_.totalBytes));
        } else if (progress_.totalFiles > 0) {
            progress_.percentComplete = 100.0 * static_cast<double>(progress_.filesTransferred) / static_cast<double>(progress_.totalFiles);
        }
        if (progress_.speedBytesPerSecond > 0 && progress_.totalBytes > progress_.bytesTransferred) {
            progress_.etaSeconds = static_cast<double>(progress_.totalBytes - progress_.bytesTransferred) / progress_.speedBytesPerSecond;
        } else {
            progress_.etaSeconds = 0;
        }
        control_.progress(progress_);
    }

    const TransferControl& control_;
    mutable std::mutex mutex_;
    TransferProgress progress_;
    std::vector<std::string> failed_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point lastEmit_;
};

struct FileCloser {
    void operator()(std::FILE* file) const { std::fclose(file); }
};

/**
 * @brief Copies one file through a spool file.
 *
 * @return Bytes uploaded in this call, or an error.
 */
std::expected<std::uint64_t, ErrorInfo> copyFile(RemoteSession& source,
                                                 RemoteSession& dest,
                                                 const std::string& sourcePath,
                                                 const std::string& destPath,
                                                 const CopyItem& item,
                                                 bool resume,
                                                 Throttle& throttle,
                                                 CopyState& state,
                                                 const TransferControl& control,
                                                 std::size_t bufferSize) {
    std::uint64_t offset = 0;
    if (resume) {
        if (auto existing = dest.stat(destPath); existing && !existing->isDir) {
            if (existing->size == item.size) {
                state.addBytes(item.size, item.relative);
                return 0;
            }
            if (existing->size < item.size) {
                offset = existing->size;
                state.addBytes(offset, item.relative);
            }
        }
    }

    std::unique_ptr<std::FILE, FileCloser> spool(std::tmpfile());
    if (!spool) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Failed to create spool file: {}", std::strerror(errno))});
    }

    bool spoolFailed = false;
    auto downloaded = source.download(sourcePath, offset, [&](const char* data, std::size_t size) {
        if (control.stopToken.stop_requested()) {
            return false;
        }
        if (std::fwrite(data, 1, size, spool.get()) != size) {
            spoolFailed = true;
            return false;
        }
        throttle.consume(size);
        return true;
    });
    if (control.stopToken.stop_requested()) {
        return std::unexpected(ErrorInfo{ErrorKind::TransferFailed, "Transfer cancelled"});
    }
    if (spoolFailed) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Failed to write spool file: {}", std::strerror(errno))});
    }
    if (!downloaded) {
        return std::unexpected(downloaded.error());
    }

    std::rewind(spool.get());
    auto uploaded = dest.upload(destPath, [&](char* out, std::size_t capacity) -> std::size_t {
        if (control.stopToken.stop_requested()) {
            return 0;
        }
        std::size_t n = std::fread(out, 1, std::min(capacity, bufferSize), spool.get());
        if (n > 0) {
            state.addBytes(n, item.relative);
        }
        return n;
    }, offset > 0);
    if (control.stopToken.stop_requested()) {
        return std::unexpected(ErrorInfo{ErrorKind::TransferFailed, "Transfer cancelled"});
    }
    return uploaded;
}

} // namespace

StreamingCopyExecutor::StreamingCopyExecutor(const AppConfig& config, const Logger& logger, SessionFactory factory, int connections)
    : config_(config), logger_(logger), factory_(std::move(factory)), scanner_(config, logger, factory_), connections_(std::max(1, connections)) {}

std::unique_ptr<RemoteSession> StreamingCopyExecutor::connect(const ConnectionConfig& config, ErrorInfo& error) const {
    auto session = factory_(config);
    if (!session) {
        error = ErrorInfo{ErrorKind::UnsupportedCapability, std::format("No session available for {}", describeEndpoint(config))};
        return nullptr;
    }
    if (auto opened = session->open(config_.loginTimeout); !opened) {
        error = opened.error();
        return nullptr;
    }
    return session;
}

TransferResult StreamingCopyExecutor::execute(const TransferStrategy& strategy,
                                              const ConnectionConfig& source,
                                              const ConnectionConfig& dest,
                                              const TransferOptions& options,
                                              const TransferControl& control) {
    TransferResult result;
    auto started = std::chrono::steady_clock::now();
    auto finish = [&](TransferResult& r) -> TransferResult {
        r.durationSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        if (r.durationSeconds > 0) {
            r.averageSpeedBytesPerSecond = static_cast<double>(r.bytesTransferred) / r.durationSeconds;
        }
        return r;
    };

    ErrorInfo error;
    auto sourceSession = connect(source, error);
    auto destSession = sourceSession ? connect(dest, error) : nullptr;
    if (!sourceSession || !destSession) {
        result.errorKind = error.kind;
        result.errorMessage = error.message;
        logger_.logError(std::format("{} could not connect: {}", transferMethodName(strategy.method), error.message));
        return finish(result);
    }

    // Work list: directories first in walk order, then files.
    std::shared_ptr<const std::vector<FileEntry>> entries = options.files;
    std::uint64_t unlisted = 0;
    if (!entries) {
        control.output(std::format("Listing {}", describeEndpoint(source)));
        ScanOptions scanOptions;
        scanOptions.detectCms = false;
        scanOptions.includeHidden = true;
        ScanResult listing = scanner_.scanSession(*sourceSession, source, ScanLimits{}, scanOptions, {}, control.stopToken);
        entries = listing.files ? listing.files : std::make_shared<const std::vector<FileEntry>>();
        unlisted = listing.stats.skippedCount;
        if (!listing.success || (unlisted > 0 && entries->empty())) {
            result.errorKind = listing.success ? ErrorKind::TransferFailed : listing.errorKind;
            result.errorMessage = listing.success ? std::format("Cannot list source root {}", source.rootPath) : listing.errorMessage;
            result.errorsCount = std::max<std::uint64_t>(unlisted, 1);
            logger_.logError(std::format("{} failed: {}", transferMethodName(strategy.method), result.errorMessage));
            return finish(result);
        }
        if (unlisted > 0) {
            control.output(std::format("Warning: {} source directories could not be listed and will not be copied", unlisted));
        }
    }

    ExclusionRules rules = transferExclusions(options.exclusions);
    std::vector<std::string> directories;
    std::vector<CopyItem> items;
    std::uint64_t totalBytes = 0;
    for (const auto& entry : *entries) {
        std::string relative = relativeTo(source.rootPath, entry.path);
        if (relative.empty() || rules.match(relative)) {
            continue;
        }
        if (entry.isDir) {
            directories.push_back(relative);
        } else if (entry.isSymlink) {
            result.skippedFiles.push_back(relative);
        } else if (options.skipLargeFilesMiB > 0 && static_cast<double>(entry.size) > options.skipLargeFilesMiB * kMiB) {
            result.skippedFiles.push_back(relative);
        } else {
            items.push_back({relative, entry.size});
            totalBytes += entry.size;
        }
    }

    CopyState state(control, items.size(), totalBytes);
    if (options.dryRun) {
        for (const auto& item : items) {
            control.output(std::format("[dry-run] would copy {} ({})", item.relative, formatBytes(item.size)));
        }
        control.output(std::format("[dry-run] {} files, {}, {} skipped", items.size(), formatBytes(totalBytes), result.skippedFiles.size()));
        if (unlisted > 0) {
            result.errorsCount = unlisted;
            result.errorKind = ErrorKind::TransferFailed;
            result.errorMessage = std::format("{} source directories could not be listed", unlisted);
        } else {
            result.success = true;
        }
        return finish(result);
    }

    if (auto made = destSession->makeDirectories(dest.rootPath); !made) {
        result.errorKind = made.error().kind;
        result.errorMessage = std::format("Cannot create destination root {}: {}", dest.rootPath, made.error().message);
        logger_.logError(result.errorMessage);
        return finish(result);
    }
    for (const auto& directory : directories) {
        if (control.stopToken.stop_requested()) {
            break;
        }
        if (auto made = destSession->makeDirectory(joinRemotePath(dest.rootPath, directory)); !made) {
            state.fileFailed(directory, made.error().message);
        }
    }

    // Extra connection pairs; a pair that cannot log in is simply not used.
    std::vector<std::pair<std::unique_ptr<RemoteSession>, std::unique_ptr<RemoteSession>>> pairs;
    pairs.emplace_back(std::move(sourceSession), std::move(destSession));
    std::size_t wanted = std::min<std::size_t>(static_cast<std::size_t>(connections_), std::max<std::size_t>(1, items.size()));
    while (pairs.size() < wanted && !control.stopToken.stop_requested()) {
        ErrorInfo pairError;
        auto extraSource = connect(source, pairError);
        auto extraDest = extraSource ? connect(dest, pairError) : nullptr;
        if (!extraSource || !extraDest) {
            logger_.logMessage(std::format("Using {} connection pairs: {}", pairs.size(), pairError.message));
            break;
        }
        pairs.emplace_back(std::move(extraSource), std::move(extraDest));
    }

    Throttle throttle(options.bandwidthLimitMiB * kMiB);
    std::atomic<std::size_t> next{0};
    auto worker = [&](RemoteSession& from, RemoteSession& to) {
        while (control.waitWhilePaused()) {
            std::size_t index = next.fetch_add(1);
            if (index >= items.size()) {
                break;
            }
            const CopyItem& item = items[index];
            auto copied = copyFile(from, to, joinRemotePath(source.rootPath, item.relative), joinRemotePath(dest.rootPath, item.relative),
                                   item, options.enableResume, throttle, state, control, config_.bufferSize);
            if (control.stopToken.stop_requested()) {
                break;
            }
            if (copied) {
                state.fileDone(item.relative);
            } else {
                logger_.logError(std::format("Failed to copy {}: {}", item.relative, copied.error().message));
                state.fileFailed(item.relative, copied.error().message);
            }
        }
    };

    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 1; i < pairs.size(); ++i) {
            threads.emplace_back(worker, std::ref(*pairs[i].first), std::ref(*pairs[i].second));
        }
        worker(*pairs[0].first, *pairs[0].second);
    }

    TransferProgress totals = state.snapshot();
    result.filesTransferred = totals.filesTransferred;
    result.bytesTransferred = totals.bytesTransferred;
    result.errorsCount = totals.errorsCount + unlisted;
    result.failedFiles = state.failedFiles();

    if (control.stopToken.stop_requested()) {
        result.errorKind = ErrorKind::TransferFailed;
        result.errorMessage = "Transfer cancelled";
        state.setStatus(TransferStatus::Cancelled);
        return finish(result);
    }

    if (options.verifyAfterTransfer) {
        state.setStatus(TransferStatus::Verifying);
        std::vector<std::pair<std::string, std::uint64_t>> expected;
        for (const auto& item : items) {
            expected.emplace_back(item.relative, item.size);
        }
        result.verification = verifyDestination(*pairs[0].second, dest, expected, scanner_);
        control.output(result.verification->message);
    }
    for (auto& [from, to] : pairs) {
        from->close();
        to->close();
    }

    if (totals.errorsCount > 0) {
        result.errorKind = ErrorKind::TransferFailed;
        result.errorMessage = std::format("{} of {} files failed; last error: {}", totals.errorsCount, items.size(), totals.lastError);
    } else if (unlisted > 0) {
        result.errorKind = ErrorKind::TransferFailed;
        result.errorMessage = std::format("{} source directories could not be listed", unlisted);
    } else if (result.verification && !result.verification->success) {
        result.errorKind = ErrorKind::TransferFailed;
        result.errorMessage = std::format("Verification failed: {}", result.verification->message);
    } else {
        result.success = true;
    }
    state.setStatus(result.success ? TransferStatus::Completed : TransferStatus::Failed);
    logger_.logMessage(std::format("{} finished: {} files, {}", transferMethodName(strategy.method), result.filesTransferred,
                                   formatBytes(result.bytesTransferred)));
    return finish(result);
}
