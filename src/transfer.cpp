#include "transfer.hpp"
#include "archive_stream.hpp"
#include "remote_shell_transfer.hpp"
#include "streaming_copy.hpp"
#include <format>
#include <thread>
#include <unordered_map>

std::expected<void, ErrorInfo> validateTransferOptions(const TransferOptions& options) {
    if (options.bandwidthLimitMiB < 0 || options.bandwidthLimitMiB > TransferOptions::kMaxBandwidthMiB) {
        return std::unexpected(ErrorInfo{ErrorKind::ValidationError,
            std::format("bandwidth_limit must be between 0 and {} MiB/s", TransferOptions::kMaxBandwidthMiB)});
    }
    if (options.skipLargeFilesMiB < 0) {
        return std::unexpected(ErrorInfo{ErrorKind::ValidationError, "skip_large_files cannot be negative"});
    }
    return validateExclusionPatterns(options.exclusions);
}

std::string_view transferStatusName(TransferStatus status) {
    switch (status) {
    case TransferStatus::Preparing: return "preparing";
    case TransferStatus::Transferring: return "transferring";
    case TransferStatus::Verifying: return "verifying";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed: return "failed";
    case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

void TransferControl::progress(const TransferProgress& snapshot) const {
    if (onProgress) {
        onProgress(snapshot);
    }
}

void TransferControl::output(const std::string& line) const {
    if (onOutput) {
        onOutput(line);
    }
}

bool TransferControl::waitWhilePaused() const {
    while (isPaused && isPaused() && !stopToken.stop_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    return !stopToken.stop_requested();
}

std::string relativeTo(const std::string& root, const std::string& path) {
    std::string prefix = root.ends_with('/') ? root : root + "/";
    if (path.starts_with(prefix)) {
        return path.substr(prefix.size());
    }
    if (path == root) {
        return {};
    }
    std::size_t start = path.find_first_not_of('/');
    return start == std::string::npos ? std::string() : path.substr(start);
}

ExclusionRules transferExclusions(const std::vector<std::string>& patterns) {
    std::vector<ExclusionPattern> rules;
    for (const auto& pattern : patterns) {
        rules.push_back({pattern, "Excluded from transfer", false, true});
    }
    return ExclusionRules(std::move(rules));
}

Verification verifyDestination(RemoteSession& dest,
                               const ConnectionConfig& destConfig,
                               const std::vector<std::pair<std::string, std::uint64_t>>& expected,
                               const TreeScanner& scanner) {
    Verification verification;
    ScanOptions options;
    options.detectCms = false;
    options.includeHidden = true;
    ScanResult scanned = scanner.scanSession(dest, destConfig, ScanLimits{}, options);

    std::unordered_map<std::string, std::uint64_t> present;
    if (scanned.files) {
        for (const auto& entry : *scanned.files) {
            if (!entry.isDir) {
                present.emplace(relativeTo(destConfig.rootPath, entry.path), entry.size);
                ++verification.destFiles;
                verification.destSize += entry.size;
            }
        }
    }

    for (const auto& [path, size] : expected) {
        ++verification.sourceFiles;
        verification.sourceSize += size;
        auto it = present.find(path);
        if (it == present.end() || it->second != size) {
            verification.missingFiles.push_back(path);
        }
    }
    verification.success = verification.missingFiles.empty() && scanned.stats.skippedCount == 0;
    if (verification.success) {
        verification.message = std::format("All {} files present on the destination ({})", verification.sourceFiles,
                                           formatBytes(verification.sourceSize));
    } else if (!verification.missingFiles.empty()) {
        verification.message = std::format("{} of {} files missing or incomplete on the destination",
                                           verification.missingFiles.size(), verification.sourceFiles);
    } else {
        verification.message = std::format("{} destination directories could not be listed", scanned.stats.skippedCount);
    }
    return verification;
}

std::unique_ptr<TransferExecutor> makeTransferExecutor(TransferMethod method, const AppConfig& config, const Logger& logger, SessionFactory factory) {
    switch (method) {
    case TransferMethod::StreamingCopy:
        return std::make_unique<StreamingCopyExecutor>(config, logger, std::move(factory), 1);
    case TransferMethod::MultiConnectionClient:
        return std::make_unique<StreamingCopyExecutor>(config, logger, std::move(factory), config.parallelConnections);
    case TransferMethod::ArchiveStream:
        return std::make_unique<ArchiveStreamExecutor>(config, logger, std::move(factory));
    case TransferMethod::RsyncOverSsh:
    case TransferMethod::PeerToPeerCopy:
        return std::make_unique<RemoteShellExecutor>(config, logger, std::move(factory));
    }
    return nullptr;
}
