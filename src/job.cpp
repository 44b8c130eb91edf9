#include "job.hpp"
#include <array>

std::string_view jobTypeName(JobType type) {
    switch (type) {
    case JobType::Scan: return "scan";
    case JobType::Plan: return "plan";
    case JobType::Transfer: return "transfer";
    }
    return "unknown";
}

std::optional<JobType> parseJobType(std::string_view name) {
    for (auto type : {JobType::Scan, JobType::Plan, JobType::Transfer}) {
        if (jobTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string_view jobStatusName(JobStatus status) {
    switch (status) {
    case JobStatus::Pending: return "pending";
    case JobStatus::Running: return "running";
    case JobStatus::Paused: return "paused";
    case JobStatus::Completed: return "completed";
    case JobStatus::Failed: return "failed";
    case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<JobStatus> parseJobStatus(std::string_view name) {
    constexpr std::array statuses = {JobStatus::Pending, JobStatus::Running, JobStatus::Paused,
                                     JobStatus::Completed, JobStatus::Failed, JobStatus::Cancelled};
    for (auto status : statuses) {
        if (jobStatusName(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

bool progressMatches(JobType type, const JobProgress& progress) {
    switch (type) {
    case JobType::Scan: return std::holds_alternative<ScanProgress>(progress);
    case JobType::Transfer: return std::holds_alternative<TransferProgress>(progress);
    case JobType::Plan: return std::holds_alternative<std::monostate>(progress);
    }
    return false;
}

bool resultMatches(JobType type, const JobResult& result) {
    switch (type) {
    case JobType::Scan: {
        auto* scan = std::get_if<std::shared_ptr<const ScanResult>>(&result);
        return scan && *scan;
    }
    case JobType::Plan: {
        auto* plan = std::get_if<std::shared_ptr<const PlanResult>>(&result);
        return plan && *plan;
    }
    case JobType::Transfer: {
        auto* transfer = std::get_if<std::shared_ptr<const TransferResult>>(&result);
        return transfer && *transfer;
    }
    }
    return false;
}
