/**
 * @file job.hpp
 * @brief Job records owned by the job orchestrator.
 */

#ifndef JOB_HPP
#define JOB_HPP

#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <variant>
#include <chrono>
#include "connection_config.hpp"
#include "planner.hpp"
#include "scanner.hpp"
#include "transfer.hpp"

enum class JobType {
    Scan,
    Plan,
    Transfer
};

std::string_view jobTypeName(JobType type);

std::optional<JobType> parseJobType(std::string_view name);

/**
 * @brief Job lifecycle: pending -> running -> {completed, failed, cancelled}; transfers also running <-> paused.
 */
enum class JobStatus {
    Pending,
    Running,
    Paused,
    Completed,
    Failed,
    Cancelled
};

std::string_view jobStatusName(JobStatus status);

std::optional<JobStatus> parseJobStatus(std::string_view name);

bool isTerminal(JobStatus status);

/**
 * @brief Progress snapshot; the alternative follows the job type (plan jobs have none).
 */
using JobProgress = std::variant<std::monostate, ScanProgress, TransferProgress>;

/**
 * @brief Final result; the alternative follows the job type.
 */
using JobResult = std::variant<std::monostate,
                               std::shared_ptr<const ScanResult>,
                               std::shared_ptr<const PlanResult>,
                               std::shared_ptr<const TransferResult>>;

/**
 * @brief A snapshot of one job.
 *
 * Once the job is terminal, exactly one of result and errorMessage is set.
 */
struct Job {
    std::string id;
    JobType type = JobType::Scan;
    JobStatus status = JobStatus::Pending;
    std::string method;                       ///< Transfer method name, empty for other jobs.
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    ConnectionConfig source;                  ///< Credentials stripped.
    std::optional<ConnectionConfig> dest;     ///< Credentials stripped.
    JobProgress progress;
    JobResult result;
    std::optional<std::string> errorMessage;
};

/**
 * @brief Whether a progress payload has the shape expected for a job type.
 */
bool progressMatches(JobType type, const JobProgress& progress);

/**
 * @brief Whether a result payload has the shape expected for a job type.
 */
bool resultMatches(JobType type, const JobResult& result);

#endif // JOB_HPP
