/**
 * @file migration_api.hpp
 * @brief High-level API for probing, scanning, planning and running migrations.
 *
 * Entry point for front ends (the CLI, or any UI). Synchronous calls (probe,
 * plan) return their result directly; scans and transfers run as orchestrator
 * jobs and return a job id whose progress can be followed through subscribe().
 *
 * @note Invalid configs, limits and options are rejected with ValidationError
 * before any network I/O.
 */

#ifndef MIGRATION_API_HPP
#define MIGRATION_API_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <expected>
#include "app_config.hpp"
#include "connection_config.hpp"
#include "errors.hpp"
#include "job_orchestrator.hpp"
#include "logger.hpp"
#include "planner.hpp"
#include "probe.hpp"
#include "remote_session.hpp"
#include "scanner.hpp"
#include "transfer.hpp"

/**
 * @brief Creates the executor for a transfer method; nullptr when the method has none.
 */
using ExecutorFactory = std::function<std::unique_ptr<TransferExecutor>(TransferMethod)>;

class MigrationAPI {
public:
    /**
     * @brief Constructs the API.
     *
     * @param config Application configuration.
     * @param logger Shared logger.
     * @param orchestrator Job owner; must outlive the API.
     * @param factory Session factory used by probes, scans and the reference executors.
     * @param executors Executor factory; the reference executors are used when empty.
     */
    MigrationAPI(const AppConfig& config,
                 const Logger& logger,
                 JobOrchestrator& orchestrator,
                 SessionFactory factory,
                 ExecutorFactory executors = {});

    /**
     * @brief Probes one endpoint synchronously.
     *
     * @return The probe result (which may report success=false), or a validation error.
     */
    std::expected<ProbeResult, ErrorInfo> probe(const ConnectionConfig& config) const;

    /**
     * @brief Starts a background scan.
     *
     * @return std::expected<std::string, ErrorInfo> The scan job id.
     */
    std::expected<std::string, ErrorInfo> scan(const ConnectionConfig& config, const ScanLimits& limits, const ScanOptions& options);

    /**
     * @brief Plans a migration synchronously and records it as a plan job.
     */
    std::expected<PlanResult, ErrorInfo> plan(const ScanResult& scan, const ProbeResult& source, const ProbeResult& dest);

    /**
     * @brief Starts a background transfer with the executor of the strategy's method.
     *
     * @return std::expected<std::string, ErrorInfo> The transfer job id.
     */
    std::expected<std::string, ErrorInfo> startTransfer(const TransferStrategy& strategy,
                                                        const ConnectionConfig& source,
                                                        const ConnectionConfig& dest,
                                                        const TransferOptions& options);

    std::expected<Job, ErrorInfo> getJob(const std::string& id) const;
    std::vector<Job> listJobs(std::optional<JobStatus> status = std::nullopt) const;
    std::expected<void, ErrorInfo> cancelJob(const std::string& id);
    std::expected<void, ErrorInfo> deleteJob(const std::string& id);
    std::expected<void, ErrorInfo> pauseJob(const std::string& id);
    std::expected<void, ErrorInfo> resumeJob(const std::string& id);
    std::expected<std::shared_ptr<EventChannel>, ErrorInfo> subscribe(const std::string& id);

private:
    const AppConfig& config_;
    const Logger& logger_;
    JobOrchestrator& orchestrator_;
    SessionFactory factory_;
    ExecutorFactory executors_;
    ProbeEngine prober_;
    TreeScanner scanner_;
    StrategyPlanner planner_;
};

#endif // MIGRATION_API_HPP
