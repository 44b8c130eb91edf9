#include "app_config.hpp"
#include "history_store.hpp"
#include "job_orchestrator.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "migration_api.hpp"
#include <algorithm>
#include <charconv>
#include <csignal>
#include <format>
#include <print>
#include <string>
#include <vector>

namespace {

volatile std::sig_atomic_t interrupted = 0;

void onSignal(int) {
    interrupted = 1;
}

enum ExitCode {
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2,
    kExitInterrupted = 130
};

struct CliOptions {
    std::string configFile;
    bool verbose = false;
    std::string command;
    std::vector<std::string> positional;
    ScanLimits limits;
    bool depthGiven = false;
    bool filesGiven = false;
    ScanOptions scanOptions;
    std::optional<TransferMethod> method;
    TransferOptions transfer;
};

void printUsage(const char* program) {
    std::println("SiteMover: plan and run file migrations between remote servers\n");
    std::println("Usage: {} [--config <app.json>] [--verbose] <command> [options]\n", program);
    std::println("Commands:");
    std::println("  probe <conn.json>                    Probe an endpoint and print its capabilities");
    std::println("  scan <conn.json>                     Scan a remote tree, streaming progress events");
    std::println("  plan <source.json> <dest.json>       Probe both sides, scan the source and rank strategies");
    std::println("  migrate <source.json> <dest.json>    Plan, then run the chosen transfer");
    std::println("  history                              Print finished jobs, newest first\n");
    std::println("Scan options:");
    std::println("  --max-depth N  --max-files N  --no-cms  --include-hidden  --follow-symlinks  --exclude PATTERN\n");
    std::println("Migrate options:");
    std::println("  --method M  --dry-run  --no-resume  --verify  --bwlimit MiB  --skip-larger MiB");
}

template <typename Number>
std::expected<Number, std::string> parseNumber(std::string_view flag, std::string_view text) {
    Number value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::unexpected(std::format("{} expects a number, got '{}'", flag, text));
    }
    return value;
}

std::expected<CliOptions, std::string> parseArgs(int argc, char** argv) {
    CliOptions options;
    std::vector<std::string> args(argv + 1, argv + argc);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("{} requires a value", arg));
            }
            return args[++i];
        };
        auto assign = [&]<typename Number>(Number& target) -> std::expected<void, std::string> {
            auto text = value();
            if (!text) {
                return std::unexpected(text.error());
            }
            auto number = parseNumber<Number>(arg, *text);
            if (!number) {
                return std::unexpected(number.error());
            }
            target = *number;
            return {};
        };

        std::expected<void, std::string> parsed;
        if (arg == "--config") {
            auto file = value();
            if (!file) {
                return std::unexpected(file.error());
            }
            options.configFile = *file;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--max-depth") {
            parsed = assign(options.limits.maxDepth);
            options.depthGiven = true;
        } else if (arg == "--max-files") {
            parsed = assign(options.limits.maxFiles);
            options.filesGiven = true;
        } else if (arg == "--no-cms") {
            options.scanOptions.detectCms = false;
        } else if (arg == "--include-hidden") {
            options.scanOptions.includeHidden = true;
        } else if (arg == "--follow-symlinks") {
            options.scanOptions.followSymlinks = true;
        } else if (arg == "--exclude") {
            auto pattern = value();
            if (!pattern) {
                return std::unexpected(pattern.error());
            }
            options.scanOptions.customExclusions.push_back(*pattern);
        } else if (arg == "--method") {
            auto name = value();
            if (!name) {
                return std::unexpected(name.error());
            }
            options.method = parseTransferMethod(*name);
            if (!options.method) {
                return std::unexpected(std::format("Unknown transfer method: {}", *name));
            }
        } else if (arg == "--dry-run") {
            options.transfer.dryRun = true;
        } else if (arg == "--no-resume") {
            options.transfer.enableResume = false;
        } else if (arg == "--verify") {
            options.transfer.verifyAfterTransfer = true;
        } else if (arg == "--bwlimit") {
            parsed = assign(options.transfer.bandwidthLimitMiB);
        } else if (arg == "--skip-larger") {
            parsed = assign(options.transfer.skipLargeFilesMiB);
        } else if (arg.starts_with("--")) {
            return std::unexpected(std::format("Unknown option: {}", arg));
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
    }
    if (options.command.empty()) {
        return std::unexpected("No command given");
    }
    return options;
}

void printJson(const Json::Value& value) {
    std::println("{}", writeJson(value));
}

void printError(const ErrorInfo& error) {
    std::println(stderr, "Error ({}): {}", errorKindName(error.kind), error.message);
}

void cancelActiveJobs(MigrationAPI& api) {
    for (const auto& job : api.listJobs()) {
        if (isTerminal(job.status)) {
            continue;
        }
        if (auto cancelled = api.cancelJob(job.id); !cancelled && cancelled.error().kind != ErrorKind::InvalidJobTransition) {
            printError(cancelled.error());
        }
    }
}

/**
 * @brief Prints a job's events as JSON lines until it completes. Cancels active jobs on SIGINT/SIGTERM.
 */
std::expected<Job, ErrorInfo> follow(MigrationAPI& api, const std::string& id) {
    auto channel = api.subscribe(id);
    if (!channel) {
        return std::unexpected(channel.error());
    }
    bool cancelling = false;
    while (true) {
        if (interrupted && !cancelling) {
            cancelling = true;
            std::println(stderr, "Interrupted, cancelling active jobs");
            cancelActiveJobs(api);
        }
        auto event = (*channel)->pop(std::chrono::milliseconds(200));
        if (event) {
            std::println("{}", writeJson(toJson(*event), true));
            if (event->type == JobEventType::Complete) {
                break;
            }
        } else if ((*channel)->closed()) {
            break;
        }
    }
    return api.getJob(id);
}

template <typename Result>
std::shared_ptr<const Result> resultOf(const Job& job) {
    auto* result = std::get_if<std::shared_ptr<const Result>>(&job.result);
    return result ? *result : nullptr;
}

int exitCodeFor(const Job& job) {
    if (job.status == JobStatus::Completed) {
        return kExitOk;
    }
    if (job.errorMessage) {
        std::println(stderr, "Job {} {}: {}", job.id, jobStatusName(job.status), *job.errorMessage);
    }
    return interrupted ? kExitInterrupted : kExitFailure;
}

std::expected<ConnectionConfig, int> loadEndpoint(const std::string& file) {
    auto config = loadConnectionConfig(file);
    if (!config) {
        printError(config.error());
        return std::unexpected(kExitUsage);
    }
    return *config;
}

/**
 * @brief Scans a source as a job and returns the finished scan, printing events along the way.
 */
std::expected<std::shared_ptr<const ScanResult>, int> runScan(MigrationAPI& api, const ConnectionConfig& source, const CliOptions& options) {
    auto id = api.scan(source, options.limits, options.scanOptions);
    if (!id) {
        printError(id.error());
        return std::unexpected(id.error().kind == ErrorKind::ValidationError ? kExitUsage : kExitFailure);
    }
    auto job = follow(api, *id);
    if (!job) {
        printError(job.error());
        return std::unexpected(kExitFailure);
    }
    auto result = resultOf<ScanResult>(*job);
    if (!result) {
        return std::unexpected(exitCodeFor(*job));
    }
    return result;
}

struct PlannedMigration {
    ConnectionConfig source;
    ConnectionConfig dest;
    std::shared_ptr<const ScanResult> scan;
    PlanResult plan;
};

std::expected<PlannedMigration, int> planMigration(MigrationAPI& api, const CliOptions& options) {
    if (options.positional.size() < 2) {
        std::println(stderr, "{} requires <source.json> and <dest.json>", options.command);
        return std::unexpected(kExitUsage);
    }
    PlannedMigration migration;
    auto source = loadEndpoint(options.positional[0]);
    if (!source) {
        return std::unexpected(source.error());
    }
    auto dest = loadEndpoint(options.positional[1]);
    if (!dest) {
        return std::unexpected(dest.error());
    }
    migration.source = *source;
    migration.dest = *dest;

    auto sourceProbe = api.probe(migration.source);
    auto destProbe = api.probe(migration.dest);
    if (!sourceProbe || !destProbe) {
        printError(sourceProbe ? destProbe.error() : sourceProbe.error());
        return std::unexpected(kExitUsage);
    }

    auto scan = runScan(api, migration.source, options);
    if (!scan) {
        return std::unexpected(scan.error());
    }
    migration.scan = *scan;

    auto plan = api.plan(*migration.scan, *sourceProbe, *destProbe);
    if (!plan) {
        printError(plan.error());
        return std::unexpected(kExitFailure);
    }
    migration.plan = std::move(*plan);
    return migration;
}

int cmdProbe(MigrationAPI& api, const CliOptions& options) {
    if (options.positional.empty()) {
        std::println(stderr, "probe requires <conn.json>");
        return kExitUsage;
    }
    auto config = loadEndpoint(options.positional[0]);
    if (!config) {
        return config.error();
    }
    auto result = api.probe(*config);
    if (!result) {
        printError(result.error());
        return kExitUsage;
    }
    printJson(toJson(*result));
    return result->success ? kExitOk : kExitFailure;
}

int cmdScan(MigrationAPI& api, const CliOptions& options) {
    if (options.positional.empty()) {
        std::println(stderr, "scan requires <conn.json>");
        return kExitUsage;
    }
    auto config = loadEndpoint(options.positional[0]);
    if (!config) {
        return config.error();
    }
    auto scan = runScan(api, *config, options);
    if (!scan) {
        return scan.error();
    }
    printJson(toJson(**scan));
    return kExitOk;
}

int cmdPlan(MigrationAPI& api, const CliOptions& options) {
    auto migration = planMigration(api, options);
    if (!migration) {
        return migration.error();
    }
    printJson(toJson(migration->plan));
    return migration->plan.success ? kExitOk : kExitFailure;
}

int cmdMigrate(MigrationAPI& api, CliOptions options) {
    // The migrated tree includes dot files such as .htaccess.
    options.scanOptions.includeHidden = true;
    auto migration = planMigration(api, options);
    if (!migration) {
        return migration.error();
    }
    const PlanResult& plan = migration->plan;
    printJson(toJson(plan));
    if (!plan.success || !plan.recommended) {
        std::println(stderr, "No feasible transfer strategy: {}", plan.errorMessage);
        return kExitFailure;
    }

    const TransferStrategy* strategy = &*plan.recommended;
    if (options.method) {
        auto it = std::ranges::find(plan.strategies, *options.method, &TransferStrategy::method);
        if (it == plan.strategies.end()) {
            std::println(stderr, "{} is not feasible between these endpoints", transferMethodName(*options.method));
            return kExitFailure;
        }
        strategy = &*it;
    }

    TransferOptions transfer = options.transfer;
    for (const auto& pattern : migration->scan->exclusions) {
        if (pattern.enabled) {
            transfer.exclusions.push_back(pattern.pattern);
        }
    }
    transfer.files = migration->scan->files;

    auto id = api.startTransfer(*strategy, migration->source, migration->dest, transfer);
    if (!id) {
        printError(id.error());
        return id.error().kind == ErrorKind::ValidationError ? kExitUsage : kExitFailure;
    }
    auto job = follow(api, *id);
    if (!job) {
        printError(job.error());
        return kExitFailure;
    }
    if (auto result = resultOf<TransferResult>(*job)) {
        printJson(toJson(*result));
    }
    return exitCodeFor(*job);
}

int cmdHistory(const JsonHistoryStore& history) {
    auto entries = history.load();
    if (!entries) {
        printError(entries.error());
        return kExitFailure;
    }
    Json::Value array(Json::arrayValue);
    for (const auto& entry : *entries) {
        array.append(toJson(entry));
    }
    printJson(array);
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parseArgs(argc, argv);
    if (!options) {
        std::println(stderr, "Error: {}\n", options.error());
        printUsage(argv[0]);
        return kExitUsage;
    }

    try {
        AppConfig config = options->configFile.empty() ? AppConfig() : AppConfig(options->configFile);
        if (!options->depthGiven) {
            options->limits.maxDepth = config.scanMaxDepth;
        }
        if (!options->filesGiven) {
            options->limits.maxFiles = config.scanMaxFiles;
        }
        Logger logger(config.logFile, config.errorLogFile, options->verbose);
        JsonHistoryStore history(config.historyFile, config.historyLimit, logger);

        if (options->command == "history") {
            return cmdHistory(history);
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        JobOrchestrator orchestrator(config, logger, &history);
        MigrationAPI api(config, logger, orchestrator, defaultSessionFactory(logger));

        int code = kExitUsage;
        if (options->command == "probe") {
            code = cmdProbe(api, *options);
        } else if (options->command == "scan") {
            code = cmdScan(api, *options);
        } else if (options->command == "plan") {
            code = cmdPlan(api, *options);
        } else if (options->command == "migrate") {
            code = cmdMigrate(api, *options);
        } else {
            std::println(stderr, "Unknown command: {}\n", options->command);
            printUsage(argv[0]);
        }
        orchestrator.shutdown();
        return code;
    } catch (const std::exception& e) {
        std::println(stderr, "Fatal error: {}", e.what());
        return kExitFailure;
    }
}
