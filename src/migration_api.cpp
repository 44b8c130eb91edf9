#include "migration_api.hpp"
#include <format>

namespace {

void publishProgress(JobOrchestrator& orchestrator, const Logger& logger, const std::string& id, JobProgress progress) {
    auto updated = orchestrator.updateProgress(id, std::move(progress));
    // A job cancelled while its worker drains rejects late snapshots.
    if (!updated && updated.error().kind != ErrorKind::InvalidJobTransition) {
        logger.logError(std::format("Dropping progress of job {}: {}", id, updated.error().message));
    }
}

} // namespace

MigrationAPI::MigrationAPI(const AppConfig& config,
                           const Logger& logger,
                           JobOrchestrator& orchestrator,
                           SessionFactory factory,
                           ExecutorFactory executors)
    : config_(config),
      logger_(logger),
      orchestrator_(orchestrator),
      factory_(std::move(factory)),
      executors_(std::move(executors)),
      prober_(config, logger, factory_),
      scanner_(config, logger, factory_),
      planner_(config.parallelConnections) {
    if (!executors_) {
        executors_ = [this](TransferMethod method) {
            return makeTransferExecutor(method, config_, logger_, factory_);
        };
    }
}

std::expected<ProbeResult, ErrorInfo> MigrationAPI::probe(const ConnectionConfig& config) const {
    if (auto valid = validateConnectionConfig(config); !valid) {
        return std::unexpected(valid.error());
    }
    return prober_.probe(config);
}

std::expected<std::string, ErrorInfo> MigrationAPI::scan(const ConnectionConfig& config, const ScanLimits& limits, const ScanOptions& options) {
    if (auto valid = validateScanRequest(config, limits, options); !valid) {
        return std::unexpected(valid.error());
    }
    auto created = orchestrator_.create(JobType::Scan, config);
    if (!created) {
        return std::unexpected(created.error());
    }
    std::string id = *created;

    JobWork work = [&orchestrator = orchestrator_, &logger = logger_, scanner = scanner_, id, config, limits, options](std::stop_token stop)
        -> std::expected<JobResult, std::string> {
        auto onProgress = [&](const ScanProgress& progress) { publishProgress(orchestrator, logger, id, progress); };
        ScanResult result = scanner.scan(config, limits, options, onProgress, stop);
        if (!result.success) {
            return std::unexpected(result.errorMessage);
        }
        return JobResult{std::make_shared<const ScanResult>(std::move(result))};
    };
    if (auto started = orchestrator_.runInBackground(id, std::move(work)); !started) {
        return std::unexpected(started.error());
    }
    return id;
}

std::expected<PlanResult, ErrorInfo> MigrationAPI::plan(const ScanResult& scan, const ProbeResult& source, const ProbeResult& dest) {
    auto created = orchestrator_.create(JobType::Plan, scan.config, dest.endpoint);
    if (!created) {
        return std::unexpected(created.error());
    }
    std::string id = *created;
    if (auto running = orchestrator_.updateStatus(id, JobStatus::Running); !running) {
        return std::unexpected(running.error());
    }

    PlanResult result = planner_.plan(scan, source, dest);
    auto recorded = result.success
        ? orchestrator_.setResult(id, std::make_shared<const PlanResult>(result))
        : orchestrator_.setError(id, result.errorMessage);
    if (!recorded) {
        return std::unexpected(recorded.error());
    }
    if (auto finished = orchestrator_.updateStatus(id, result.success ? JobStatus::Completed : JobStatus::Failed); !finished) {
        return std::unexpected(finished.error());
    }
    return result;
}

std::expected<std::string, ErrorInfo> MigrationAPI::startTransfer(const TransferStrategy& strategy,
                                                                const ConnectionConfig& source,
                                                                const ConnectionConfig& dest,
                                                                const TransferOptions& options) {
    if (auto valid = validateConnectionConfig(source); !valid) {
        return std::unexpected(ErrorInfo{valid.error().kind, std::format("source {}", valid.error().message)});
    }
    if (auto valid = validateConnectionConfig(dest); !valid) {
        return std::unexpected(ErrorInfo{valid.error().kind, std::format("destination {}", valid.error().message)});
    }
    if (auto valid = validateTransferOptions(options); !valid) {
        return std::unexpected(valid.error());
    }
    std::shared_ptr<TransferExecutor> executor = executors_(strategy.method);
    if (!executor) {
        return std::unexpected(ErrorInfo{ErrorKind::UnsupportedCapability,
            std::format("No executor available for {}", transferMethodName(strategy.method))});
    }

    auto created = orchestrator_.create(JobType::Transfer, source, dest, std::string(transferMethodName(strategy.method)));
    if (!created) {
        return std::unexpected(created.error());
    }
    std::string id = *created;
    JobWork work = [&orchestrator = orchestrator_, &logger = logger_, executor, strategy, source, dest, options, id](std::stop_token stop)
        -> std::expected<JobResult, std::string> {
        TransferControl control;
        control.stopToken = stop;
        control.onProgress = [&](const TransferProgress& progress) { publishProgress(orchestrator, logger, id, progress); };
        control.onOutput = [&](const std::string& line) { orchestrator.appendOutput(id, line); };
        control.isPaused = [&] { return orchestrator.isPaused(id); };

        TransferResult result = executor->execute(strategy, source, dest, options, control);
        if (!result.success) {
            return std::unexpected(result.errorMessage.empty() ? std::string("Transfer failed") : result.errorMessage);
        }
        return JobResult{std::make_shared<const TransferResult>(std::move(result))};
    };
    if (auto started = orchestrator_.runInBackground(id, std::move(work)); !started) {
        return std::unexpected(started.error());
    }
    logger_.logMessage(std::format("Started {} transfer {} from {} to {}", transferMethodName(strategy.method), id,
        describeEndpoint(source), describeEndpoint(dest)));
    return id;
}

std::expected<Job, ErrorInfo> MigrationAPI::getJob(const std::string& id) const {
    return orchestrator_.get(id);
}

std::vector<Job> MigrationAPI::listJobs(std::optional<JobStatus> status) const {
    return orchestrator_.list(status);
}

std::expected<void, ErrorInfo> MigrationAPI::cancelJob(const std::string& id) {
    return orchestrator_.cancel(id);
}

std::expected<void, ErrorInfo> MigrationAPI::deleteJob(const std::string& id) {
    return orchestrator_.deleteJob(id);
}

std::expected<void, ErrorInfo> MigrationAPI::pauseJob(const std::string& id) {
    return orchestrator_.pause(id);
}

std::expected<void, ErrorInfo> MigrationAPI::resumeJob(const std::string& id) {
    return orchestrator_.resume(id);
}

std::expected<std::shared_ptr<EventChannel>, ErrorInfo> MigrationAPI::subscribe(const std::string& id) {
    return orchestrator_.subscribe(id);
}
