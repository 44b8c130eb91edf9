#include "planner.hpp"
#include "transfer_commands.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace {

constexpr std::array kAllMethods = {
    TransferMethod::PeerToPeerCopy,
    TransferMethod::RsyncOverSsh,
    TransferMethod::MultiConnectionClient,
    TransferMethod::StreamingCopy,
    TransferMethod::ArchiveStream,
};

constexpr std::uint64_t kGiB = 1024ULL * 1024 * 1024;

double clamp01(double value) {
    return std::clamp(value, 0.0, 1.0);
}

double orFallback(double bytesPerSecond) {
    return bytesPerSecond > 0 ? bytesPerSecond : StrategyPlanner::kFallbackBytesPerSecond;
}

std::uint64_t transferableBytes(const FileStatistics& stats) {
    return stats.totalSize > stats.excludedSize ? stats.totalSize - stats.excludedSize : 0;
}

std::chrono::seconds secondsFor(double bytes, double bytesPerSecond) {
    if (bytes <= 0 || bytesPerSecond <= 0) {
        return std::chrono::seconds(0);
    }
    return std::chrono::seconds(static_cast<std::int64_t>(std::ceil(bytes / bytesPerSecond)));
}

std::vector<std::string> enabledPatterns(const ScanResult& scan) {
    std::vector<std::string> patterns;
    for (const auto& exclusion : scan.exclusions) {
        if (exclusion.enabled) {
            patterns.push_back(exclusion.pattern);
        }
    }
    return patterns;
}

} // namespace

std::string_view transferMethodName(TransferMethod method) {
    switch (method) {
    case TransferMethod::PeerToPeerCopy: return "peer-to-peer-copy";
    case TransferMethod::RsyncOverSsh: return "rsync-over-ssh";
    case TransferMethod::MultiConnectionClient: return "multi-connection-client";
    case TransferMethod::StreamingCopy: return "streaming-copy";
    case TransferMethod::ArchiveStream: return "archive-stream";
    }
    return "unknown";
}

std::optional<TransferMethod> parseTransferMethod(std::string_view name) {
    for (auto method : kAllMethods) {
        if (transferMethodName(method) == name) {
            return method;
        }
    }
    return std::nullopt;
}

StrategyPlanner::StrategyPlanner(int parallelConnections) : parallelConnections_(std::max(1, parallelConnections)) {}

bool StrategyPlanner::isFeasible(TransferMethod method, const ProbeResult& source, const ProbeResult& dest) {
    const Capabilities& s = source.capabilities;
    const Capabilities& d = dest.capabilities;
    bool sshBoth = isSshFamily(source.endpoint.protocol) && isSshFamily(dest.endpoint.protocol);
    switch (method) {
    case TransferMethod::PeerToPeerCopy:
        return s.passiveListing && d.passiveListing && s.shellAvailable && d.shellAvailable;
    case TransferMethod::RsyncOverSsh:
    case TransferMethod::ArchiveStream:
        return sshBoth && s.shellAvailable && d.shellAvailable;
    case TransferMethod::MultiConnectionClient:
        return s.canList && d.canList;
    case TransferMethod::StreamingCopy:
        return true;
    }
    return false;
}

void StrategyPlanner::rank(std::vector<TransferStrategy>& strategies) {
    std::ranges::stable_sort(strategies, [](const TransferStrategy& a, const TransferStrategy& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.canResume != b.canResume) {
            return a.canResume;
        }
        if (a.estimatedTime != b.estimatedTime) {
            return a.estimatedTime < b.estimatedTime;
        }
        return a.method < b.method;
    });
}

TransferStrategy StrategyPlanner::describe(TransferMethod method, const ScanResult& scan, const ProbeResult& source, const ProbeResult& dest) const {
    const FileStatistics& stats = scan.stats;
    const ConnectionConfig& src = source.endpoint;
    const ConnectionConfig& dst = dest.endpoint;
    CommandOptions commandOptions;
    commandOptions.exclusions = enabledPatterns(scan);

    TransferStrategy strategy;
    strategy.method = method;
    double efficiency = 1.0;
    double parallelism = 0;
    double robustness = 1.0;

    switch (method) {
    case TransferMethod::StreamingCopy:
        efficiency = 0.6;
        parallelism = 0.3;
        robustness = stats.totalFiles > 10'000 ? 0.8 : 1.0;
        strategy.canResume = true;
        strategy.supportsProgress = true;
        strategy.command = std::format("sitemover migrate --method {} {} {}", transferMethodName(method), endpointUrl(src), endpointUrl(dst));
        strategy.commandExplanation = "File-by-file copy through this machine over one connection per side";
        strategy.pros = {"Works with every protocol combination", "Resumes interrupted files", "Per-file progress"};
        strategy.cons = {"Slowest method", "All data passes through this machine", "Per-file overhead on many small files"};
        strategy.requirements = {"Read access on the source", "Write access on the destination"};
        break;
    case TransferMethod::MultiConnectionClient:
        efficiency = 1.2;
        parallelism = 1.0;
        robustness = stats.totalFiles > 1'000 ? 0.9 : 0.8;
        strategy.canResume = true;
        strategy.supportsProgress = true;
        strategy.command = std::format("sitemover migrate --method {} {} {}", transferMethodName(method), endpointUrl(src), endpointUrl(dst));
        strategy.commandExplanation = std::format("{} parallel connection pairs through this machine", parallelConnections_);
        strategy.pros = {"Parallel transfers", "Good for many small files", "Resumes interrupted files"};
        strategy.cons = {"All data passes through this machine", "Servers may limit concurrent logins"};
        strategy.requirements = {"Directory listing on both sides", std::format("{} concurrent logins per server", parallelConnections_)};
        break;
    case TransferMethod::RsyncOverSsh:
        efficiency = 0.95;
        parallelism = 0.7;
        robustness = 1.0;
        strategy.canResume = true;
        strategy.supportsProgress = true;
        strategy.command = sshWrap(src, rsyncCommand(src, dst, commandOptions));
        strategy.commandExplanation = "Incremental sync from the source server straight to the destination";
        strategy.pros = {"Only transfers changes", "Compression on the wire", "Preserves permissions and timestamps", "Excellent resume"};
        strategy.cons = {"Requires rsync on both servers", "Source must be able to reach the destination over SSH"};
        strategy.requirements = {"SSH shell access on both servers", "rsync on both servers"};
        break;
    case TransferMethod::PeerToPeerCopy:
        efficiency = 1.3;
        parallelism = 0.8;
        robustness = 0.6;
        strategy.canResume = src.protocol == Protocol::Sftp;
        strategy.supportsProgress = false;
        strategy.command = sshWrap(dst, peerToPeerCommand(src, dst, commandOptions));
        strategy.commandExplanation = "The destination server pulls the files directly from the source";
        strategy.pros = {"Fastest method (server-to-server)", "No bandwidth consumed on this machine"};
        strategy.cons = {"Exclusions are not applied", "May be blocked by firewalls", "No progress reporting"};
        strategy.requirements = {"Shell access on the destination", "Destination can reach the source"};
        break;
    case TransferMethod::ArchiveStream:
        efficiency = 0.9;
        parallelism = 0.6;
        robustness = 0.7;
        if (stats.totalFiles > 0 && stats.totalSize / stats.totalFiles < 64 * 1024) {
            robustness += 0.2;
        }
        if (stats.totalSize > 50 * kGiB) {
            robustness -= 0.4;
        }
        strategy.canResume = false;
        strategy.supportsProgress = true;
        strategy.command = sshWrap(src, archiveCreateCommand(src.rootPath)) + " | " + sshWrap(dst, archiveExtractCommand(dst.rootPath));
        strategy.commandExplanation = "Streaming tar archive over SSH";
        strategy.pros = {"Very fast for many small files", "Compressed single stream", "Preserves all attributes"};
        strategy.cons = {"No resume support", "All-or-nothing transfer"};
        strategy.requirements = {"SSH shell access on both servers", "tar and gzip"};
        break;
    }

    double raw = std::min(orFallback(source.performance.downloadBytesPerSecond), orFallback(dest.performance.uploadBytesPerSecond));
    double effective = raw * efficiency;
    double throughputScore = clamp01(effective / kSaturationBytesPerSecond);
    double resumeScore = strategy.canResume ? 1.0 : 0.0;
    double weighted = kThroughputWeight * throughputScore + kResumeWeight * resumeScore +
                      kParallelismWeight * clamp01(parallelism) + kRobustnessWeight * clamp01(robustness);
    strategy.score = std::round(weighted * 1000.0) / 10.0;
    strategy.estimatedTime = secondsFor(static_cast<double>(transferableBytes(stats)), effective);
    return strategy;
}

PlanResult StrategyPlanner::plan(const ScanResult& scan, const ProbeResult& source, const ProbeResult& dest) const {
    PlanResult result;
    if (!source.success) {
        result.errorMessage = std::format("Source probe failed: {}", source.errorMessage);
        return result;
    }
    if (!dest.success) {
        result.errorMessage = std::format("Destination probe failed: {}", dest.errorMessage);
        return result;
    }
    if (!scan.success) {
        result.errorMessage = std::format("Source scan failed: {}", scan.errorMessage);
        return result;
    }

    for (auto method : kAllMethods) {
        if (isFeasible(method, source, dest)) {
            result.strategies.push_back(describe(method, scan, source, dest));
        }
    }
    rank(result.strategies);
    result.recommended = result.strategies.front();
    result.success = true;

    const FileStatistics& stats = scan.stats;
    const CmsDetection& cms = scan.cms;
    result.requiresDatabase = cms.detected && cms.type != CmsType::Unknown;
    auto& warnings = result.warnings;

    if (result.requiresDatabase) {
        if (cms.databaseConfig) {
            warnings.push_back(std::format("{} database '{}' must be migrated separately (export on the source, import on the destination)",
                                           cmsTypeName(cms.type), cms.databaseConfig->database));
        } else {
            warnings.emplace_back("Database credentials not found - manual migration may be required");
        }
    }
    if (stats.totalSize > 0 && static_cast<double>(stats.excludedSize) > 0.25 * static_cast<double>(stats.totalSize)) {
        warnings.push_back(std::format("Exclusions skip {} of {} ({:.0f}%)", formatBytes(stats.excludedSize), formatBytes(stats.totalSize),
                                       100.0 * static_cast<double>(stats.excludedSize) / static_cast<double>(stats.totalSize)));
    }
    if (transferableBytes(stats) > 10 * kGiB && !result.recommended->canResume) {
        warnings.push_back(std::format("The recommended method cannot resume a {} transfer; an interruption restarts it from scratch",
                                       formatBytes(transferableBytes(stats))));
    }
    if (stats.totalFiles > 50'000) {
        warnings.push_back(std::format("Large number of files ({}) may slow down transfer", stats.totalFiles));
    }
    if (stats.totalSize > 100 * kGiB) {
        warnings.push_back(std::format("Large total size ({}) will take significant time", formatBytes(stats.totalSize)));
    }
    if (stats.totalSize > 10 * kGiB) {
        warnings.emplace_back("Ensure destination has sufficient disk space");
    }
    if (!dest.capabilities.canWrite) {
        warnings.emplace_back("Destination server may not have write permissions");
    }
    double averageLatency = (source.performance.latencyMs + dest.performance.latencyMs) / 2;
    if (averageLatency > 200) {
        warnings.push_back(std::format("High latency ({:.0f} ms) may slow down transfer", averageLatency));
    }
    if (stats.truncated) {
        warnings.emplace_back("The scan was truncated; statistics cover only part of the tree");
    }

    result.estimatedTotalTime = result.recommended->estimatedTime;
    if (result.requiresDatabase) {
        result.estimatedTotalTime += secondsFor(static_cast<double>(stats.totalSize) * 0.07, 2.0 * 1024 * 1024);
    }
    return result;
}
