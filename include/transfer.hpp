/**
 * @file transfer.hpp
 * @brief Transfer executor interface and the types it exchanges with the orchestrator.
 *
 * An executor moves the files of one strategy from the source to the destination.
 * The orchestrator treats it as an opaque long-running call: it feeds progress and
 * output through TransferControl and observes the stop token at chunk or file
 * granularity.
 */

#ifndef TRANSFER_HPP
#define TRANSFER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <expected>
#include <stop_token>
#include <cstdint>
#include "app_config.hpp"
#include "connection_config.hpp"
#include "errors.hpp"
#include "exclusions.hpp"
#include "logger.hpp"
#include "planner.hpp"
#include "remote_session.hpp"
#include "scanner.hpp"

/**
 * @brief Per-transfer switches.
 */
struct TransferOptions {
    std::vector<std::string> exclusions;                  ///< Enabled exclusion patterns.
    double bandwidthLimitMiB = 0;                         ///< MiB/s, 0 = unlimited.
    bool enableResume = true;
    bool verifyAfterTransfer = false;
    double skipLargeFilesMiB = 0;                         ///< Skip files above this size, 0 = never.
    bool dryRun = false;
    std::shared_ptr<const std::vector<FileEntry>> files;  ///< Entries of an earlier scan, reused instead of a rescan.

    static constexpr double kMaxBandwidthMiB = 10'000;
};

/**
 * @brief Validates limits and exclusion patterns.
 */
std::expected<void, ErrorInfo> validateTransferOptions(const TransferOptions& options);

enum class TransferStatus {
    Preparing,
    Transferring,
    Verifying,
    Completed,
    Failed,
    Cancelled
};

std::string_view transferStatusName(TransferStatus status);

struct TransferProgress {
    TransferStatus status = TransferStatus::Preparing;
    std::uint64_t filesTransferred = 0;
    std::uint64_t totalFiles = 0;
    std::uint64_t bytesTransferred = 0;
    std::uint64_t totalBytes = 0;
    std::string currentFile;
    double speedBytesPerSecond = 0;
    double etaSeconds = 0;
    double percentComplete = 0;
    std::uint64_t errorsCount = 0;
    std::string lastError;
    double elapsedSeconds = 0;
};

/**
 * @brief Comparison of the destination tree with what was expected there.
 */
struct Verification {
    bool success = false;
    std::uint64_t sourceFiles = 0;
    std::uint64_t destFiles = 0;
    std::uint64_t sourceSize = 0;
    std::uint64_t destSize = 0;
    std::vector<std::string> missingFiles;  ///< Relative paths absent or with a different size.
    std::string message;
};

struct TransferResult {
    bool success = false;
    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;
    std::uint64_t filesTransferred = 0;
    std::uint64_t bytesTransferred = 0;
    double durationSeconds = 0;
    double averageSpeedBytesPerSecond = 0;
    std::uint64_t errorsCount = 0;
    std::vector<std::string> skippedFiles;
    std::vector<std::string> failedFiles;
    std::optional<Verification> verification;
};

/**
 * @brief Channel between a running executor and its owner.
 */
struct TransferControl {
    std::stop_token stopToken;
    std::function<void(const TransferProgress&)> onProgress;
    std::function<void(const std::string&)> onOutput;
    std::function<bool()> isPaused;

    void progress(const TransferProgress& snapshot) const;
    void output(const std::string& line) const;

    /**
     * @brief Blocks while the transfer is paused.
     *
     * @return false if a stop was requested.
     */
    bool waitWhilePaused() const;
};

/**
 * @brief Interface for transfer methods.
 */
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    /**
     * @brief Runs the transfer to completion, failure or cancellation.
     *
     * @param strategy Strategy picked from the plan.
     * @param source Source endpoint, with credentials.
     * @param dest Destination endpoint, with credentials.
     * @param options Transfer switches.
     * @param control Progress sink and stop token.
     * @return The outcome. Expected network failures are reported in the result, not thrown.
     */
    virtual TransferResult execute(const TransferStrategy& strategy,
                                   const ConnectionConfig& source,
                                   const ConnectionConfig& dest,
                                   const TransferOptions& options,
                                   const TransferControl& control) = 0;
};

/**
 * @brief Creates the reference executor for a method.
 */
std::unique_ptr<TransferExecutor> makeTransferExecutor(TransferMethod method, const AppConfig& config, const Logger& logger, SessionFactory factory);

/**
 * @brief Path of an absolute remote path relative to root, without leading '/'.
 */
std::string relativeTo(const std::string& root, const std::string& path);

/**
 * @brief Builds exclusion rules from a list of enabled patterns.
 */
ExclusionRules transferExclusions(const std::vector<std::string>& patterns);

/**
 * @brief Scans the destination and checks that every expected file exists with the expected size.
 *
 * @param dest Open destination session.
 * @param destConfig Destination endpoint; its root path is walked.
 * @param expected Relative path and size of every file that should be there.
 * @param scanner Scanner used to walk the destination.
 */
Verification verifyDestination(RemoteSession& dest,
                               const ConnectionConfig& destConfig,
                               const std::vector<std::pair<std::string, std::uint64_t>>& expected,
                               const TreeScanner& scanner);

#endif // TRANSFER_HPP
