#include "remote_shell_transfer.hpp"
#include "transfer_commands.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <regex>

namespace {

std::uint64_t parseGrouped(const std::string& digits) {
    std::uint64_t value = 0;
    for (char c : digits) {
        if (c >= '0' && c <= '9') {
            value = value * 10 + static_cast<std::uint64_t>(c - '0');
        }
    }
    return value;
}

double unitScale(const std::string& unit) {
    switch (unit.empty() ? 'B' : unit.front()) {
    case 'k':
    case 'K': return 1024.0;
    case 'M': return 1024.0 * 1024;
    case 'G': return 1024.0 * 1024 * 1024;
    case 'T': return 1024.0 * 1024 * 1024 * 1024;
    default: return 1.0;
    }
}

std::string lastLine(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    auto newline = text.find_last_of("\r\n");
    return newline == std::string::npos ? text : text.substr(newline + 1);
}

} // namespace

std::optional<RsyncProgress> parseRsyncProgress(const std::string& line) {
    static const std::regex pattern(
        R"re(^\s*([\d,]+)\s+(\d+)%\s+([\d.]+)([kKMGT]?B)/s\s+\d+:\d{2}:\d{2}(?:\s+\(xfr#(\d+),\s*(?:ir|to)-chk=(\d+)/(\d+)\))?)re");
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return std::nullopt;
    }
    RsyncProgress progress;
    progress.bytes = parseGrouped(match[1].str());
    progress.percent = static_cast<int>(std::min<std::uint64_t>(parseGrouped(match[2].str()), 100));
    std::string rate = match[3].str();
    double speed = 0;
    if (std::from_chars(rate.data(), rate.data() + rate.size(), speed).ec != std::errc{}) {
        return std::nullopt;
    }
    progress.bytesPerSecond = speed * unitScale(match[4].str());
    if (match[5].matched) {
        progress.filesTransferred = parseGrouped(match[5].str());
        progress.filesRemaining = parseGrouped(match[6].str());
        progress.filesTotal = parseGrouped(match[7].str());
    }
    return progress;
}

RemoteShellExecutor::RemoteShellExecutor(const AppConfig& config, const Logger& logger, SessionFactory factory)
    : config_(config), logger_(logger), factory_(std::move(factory)), scanner_(config, logger, factory_) {}

TransferResult RemoteShellExecutor::execute(const TransferStrategy& strategy,
                                            const ConnectionConfig& source,
                                            const ConnectionConfig& dest,
                                            const TransferOptions& options,
                                            const TransferControl& control) {
    TransferResult result;
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] { return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count(); };
    auto fail = [&](const ErrorInfo& error) {
        result.success = false;
        result.errorKind = error.kind;
        result.errorMessage = error.message;
        result.durationSeconds = elapsed();
        logger_.logError(std::format("{} failed: {}", transferMethodName(strategy.method), error.message));
        return result;
    };

    CommandOptions commandOptions;
    commandOptions.exclusions = options.exclusions;
    commandOptions.bandwidthLimitMiB = options.bandwidthLimitMiB;
    commandOptions.dryRun = options.dryRun;

    const bool rsync = strategy.method == TransferMethod::RsyncOverSsh;
    if (!rsync && strategy.method != TransferMethod::PeerToPeerCopy) {
        return fail(ErrorInfo{ErrorKind::UnsupportedCapability,
            std::format("{} is not a remote shell method", transferMethodName(strategy.method))});
    }
    const ConnectionConfig& runner = rsync ? source : dest;
    auto buildCommand = [&](bool reveal) {
        commandOptions.revealSecrets = reveal;
        return rsync ? rsyncCommand(source, dest, commandOptions) : peerToPeerCommand(source, dest, commandOptions);
    };

    auto session = factory_(runner);
    if (!session) {
        return fail(ErrorInfo{ErrorKind::UnsupportedCapability, std::format("No session available for {}", describeEndpoint(runner))});
    }
    if (auto opened = session->open(config_.loginTimeout); !opened) {
        return fail(opened.error());
    }
    control.output(std::format("Running on {}: {}", describeEndpoint(runner), buildCommand(false)));
    auto command = session->openCommand(buildCommand(true));
    if (!command) {
        return fail(command.error());
    }

    TransferProgress progress;
    progress.status = TransferStatus::Transferring;
    if (options.files) {
        ExclusionRules rules = transferExclusions(options.exclusions);
        for (const auto& entry : *options.files) {
            std::string relative = relativeTo(source.rootPath, entry.path);
            if (!entry.isDir && !relative.empty() && !rules.match(relative)) {
                ++progress.totalFiles;
                progress.totalBytes += entry.size;
            }
        }
    }

    std::vector<char> buffer(config_.bufferSize);
    std::string pending;
    auto lastEmit = std::chrono::steady_clock::now();
    auto handleLine = [&](const std::string& line) {
        if (line.empty()) {
            return;
        }
        auto parsed = rsync ? parseRsyncProgress(line) : std::nullopt;
        if (!parsed) {
            control.output(line);
            return;
        }
        progress.bytesTransferred = parsed->bytes;
        progress.speedBytesPerSecond = parsed->bytesPerSecond;
        progress.percentComplete = parsed->percent;
        if (parsed->filesTotal > 0) {
            progress.filesTransferred = parsed->filesTransferred;
            progress.totalFiles = std::max(progress.totalFiles, parsed->filesTotal);
        }
        if (progress.speedBytesPerSecond > 0 && progress.totalBytes > progress.bytesTransferred) {
            progress.etaSeconds = static_cast<double>(progress.totalBytes - progress.bytesTransferred) / progress.speedBytesPerSecond;
        }
        auto now = std::chrono::steady_clock::now();
        if (now - lastEmit >= std::chrono::milliseconds(250)) {
            lastEmit = now;
            progress.elapsedSeconds = elapsed();
            control.progress(progress);
        }
    };

    bool cancelled = false;
    std::optional<ErrorInfo> readError;
    while (true) {
        if (!control.waitWhilePaused()) {
            cancelled = true;
            break;
        }
        auto n = (*command)->read(buffer.data(), buffer.size());
        if (!n) {
            readError = n.error();
            break;
        }
        if (*n == 0) {
            break;
        }
        pending.append(buffer.data(), *n);
        std::size_t start = 0;
        for (std::size_t i = 0; i < pending.size(); ++i) {
            if (pending[i] == '\n' || pending[i] == '\r') {
                handleLine(pending.substr(start, i - start));
                start = i + 1;
            }
        }
        pending.erase(0, start);
    }
    handleLine(pending);

    if (cancelled) {
        command->reset();
        session->close();
        progress.status = TransferStatus::Cancelled;
        control.progress(progress);
        return fail(ErrorInfo{ErrorKind::TransferFailed, "Transfer cancelled"});
    }
    if (readError) {
        return fail(*readError);
    }

    int status = (*command)->wait();
    std::string errorOutput = (*command)->errorOutput();
    command->reset();
    session->close();

    result.filesTransferred = progress.filesTransferred;
    result.bytesTransferred = progress.bytesTransferred;
    result.durationSeconds = elapsed();
    if (result.durationSeconds > 0) {
        result.averageSpeedBytesPerSecond = static_cast<double>(result.bytesTransferred) / result.durationSeconds;
    }

    // rsync 24: some source files vanished during the transfer.
    if (status != 0 && !(rsync && status == 24)) {
        std::string tail = lastLine(errorOutput);
        result.errorsCount = 1;
        progress.status = TransferStatus::Failed;
        progress.lastError = tail;
        control.progress(progress);
        return fail(ErrorInfo{ErrorKind::TransferFailed,
            std::format("{} exited with status {}: {}", rsync ? "rsync" : "copy command", status, tail)});
    }
    if (status == 24) {
        control.output("Some source files vanished during the transfer");
    }

    if (options.verifyAfterTransfer && !options.dryRun) {
        progress.status = TransferStatus::Verifying;
        control.progress(progress);
        result.verification = verify(source, dest, options, control);
        if (result.verification && !result.verification->success) {
            return fail(ErrorInfo{ErrorKind::TransferFailed, std::format("Verification failed: {}", result.verification->message)});
        }
    }

    result.success = true;
    progress.status = TransferStatus::Completed;
    progress.percentComplete = 100;
    progress.elapsedSeconds = elapsed();
    control.progress(progress);
    logger_.logMessage(std::format("{} finished on {}", transferMethodName(strategy.method), describeEndpoint(runner)));
    return result;
}

std::optional<Verification> RemoteShellExecutor::verify(const ConnectionConfig& source,
                                                        const ConnectionConfig& dest,
                                                        const TransferOptions& options,
                                                        const TransferControl& control) const {
    auto connect = [this](const ConnectionConfig& config) -> std::unique_ptr<RemoteSession> {
        auto session = factory_(config);
        if (!session || !session->open(config_.loginTimeout)) {
            return nullptr;
        }
        return session;
    };

    std::shared_ptr<const std::vector<FileEntry>> files = options.files;
    if (!files) {
        auto sourceSession = connect(source);
        if (!sourceSession) {
            control.output("Verification skipped: cannot reconnect to the source");
            return std::nullopt;
        }
        ScanOptions scanOptions;
        scanOptions.detectCms = false;
        scanOptions.includeHidden = true;
        files = scanner_.scanSession(*sourceSession, source, ScanLimits{}, scanOptions).files;
        sourceSession->close();
    }
    auto destSession = connect(dest);
    if (!destSession || !files) {
        control.output("Verification skipped: cannot reconnect to the destination");
        return std::nullopt;
    }

    ExclusionRules rules = transferExclusions(options.exclusions);
    std::vector<std::pair<std::string, std::uint64_t>> expected;
    for (const auto& entry : *files) {
        std::string relative = relativeTo(source.rootPath, entry.path);
        if (!entry.isDir && !entry.isSymlink && !relative.empty() && !rules.match(relative)) {
            expected.emplace_back(relative, entry.size);
        }
    }
    Verification verification = verifyDestination(*destSession, dest, expected, scanner_);
    destSession->close();
    control.output(verification.message);
    return verification;
}
