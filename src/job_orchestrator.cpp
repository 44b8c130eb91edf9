#include "job_orchestrator.hpp"
#include "probe.hpp"
#include <algorithm>
#include <format>
#include <iterator>
#include <random>
#include <ranges>

namespace {

std::unexpected<ErrorInfo> invalidTransition(std::string message) {
    return std::unexpected(ErrorInfo{ErrorKind::InvalidJobTransition, std::move(message)});
}

HistoryEntry summarize(const Job& job, std::optional<std::chrono::system_clock::time_point> startedAt) {
    HistoryEntry entry;
    entry.id = job.id;
    entry.type = job.type;
    entry.method = job.method;
    entry.status = job.status;
    entry.startedAt = startedAt.value_or(job.createdAt);
    entry.finishedAt = job.completedAt.value_or(job.updatedAt);
    entry.durationSeconds = std::chrono::duration<double>(entry.finishedAt - entry.startedAt).count();
    entry.sourceHost = job.source.host;
    entry.destHost = job.dest ? job.dest->host : std::string{};
    entry.errorMessage = job.errorMessage.value_or("");

    if (auto* scan = std::get_if<std::shared_ptr<const ScanResult>>(&job.result); scan && *scan) {
        entry.totalFiles = (*scan)->stats.totalFiles;
        entry.totalBytes = (*scan)->stats.totalSize;
    } else if (auto* transfer = std::get_if<std::shared_ptr<const TransferResult>>(&job.result); transfer && *transfer) {
        entry.totalFiles = (*transfer)->filesTransferred;
        entry.totalBytes = (*transfer)->bytesTransferred;
    } else if (auto* progress = std::get_if<TransferProgress>(&job.progress)) {
        entry.totalFiles = progress->filesTransferred;
        entry.totalBytes = progress->bytesTransferred;
    }
    return entry;
}

} // namespace

JobOrchestrator::JobOrchestrator(const AppConfig& config, const Logger& logger, HistoryStore* history)
    : config_(config), logger_(logger), history_(history) {
    cleanupThread_ = std::jthread([this](std::stop_token stop) { cleanupLoop(stop); });
}

JobOrchestrator::~JobOrchestrator() {
    shutdown();
}

std::expected<std::string, ErrorInfo> JobOrchestrator::create(JobType type,
                                    const ConnectionConfig& source,
                                    const std::optional<ConnectionConfig>& dest,
                                    std::string method) {
    auto now = std::chrono::system_clock::now();
    std::string id;
    {
        std::unique_lock lock(mutex_);
        if (stopping_) {
            return invalidTransition("Job orchestrator is shutting down");
        }
        do {
            id = newId();
        } while (jobs_.contains(id));

        Entry& entry = jobs_[id];
        entry.sequence = nextSequence_++;
        entry.job.id = id;
        entry.job.type = type;
        entry.job.status = JobStatus::Pending;
        entry.job.method = std::move(method);
        entry.job.createdAt = now;
        entry.job.updatedAt = now;
        entry.job.source = withoutCredentials(source);
        if (dest) {
            entry.job.dest = withoutCredentials(*dest);
        }
    }
    logger_.logMessage(std::format("Created {} job {} for {}", jobTypeName(type), id, describeEndpoint(source)));
    return id;
}

std::expected<Job, ErrorInfo> JobOrchestrator::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = find(id);
    if (!it) {
        return std::unexpected(it.error());
    }
    return (*it)->second.job;
}

std::expected<void, ErrorInfo> JobOrchestrator::updateStatus(const std::string& id, JobStatus status) {
    HistoryEntry summary;
    JobEvent event;
    std::vector<std::shared_ptr<EventChannel>> closing;
    bool finished = false;
    {
        std::unique_lock lock(mutex_);
        auto it = find(id);
        if (!it) {
            return std::unexpected(it.error());
        }
        Entry& entry = (*it)->second;
        if (!canTransition(entry.job, status)) {
            if (status == JobStatus::Paused && entry.job.type != JobType::Transfer) {
                return invalidTransition(std::format("Only transfer jobs can be paused, job {} is a {} job", id, jobTypeName(entry.job.type)));
            }
            return invalidTransition(std::format("Job {} cannot move from {} to {}", id,
                jobStatusName(entry.job.status), jobStatusName(status)));
        }
        if (isTerminal(status)) {
            summary = finishLocked(entry, status, closing);
            event = completionEvent(entry.job);
            finished = true;
        } else {
            auto now = std::chrono::system_clock::now();
            entry.job.status = status;
            entry.job.updatedAt = now;
            if (status == JobStatus::Running && !entry.startedAt) {
                entry.startedAt = now;
            }
        }
    }
    changed_.notify_all();
    if (finished) {
        publishCompletion(summary, event, closing);
    }
    return {};
}

std::expected<void, ErrorInfo> JobOrchestrator::updateProgress(const std::string& id, JobProgress progress) {
    std::vector<std::shared_ptr<EventChannel>> subscribers;
    JobEvent event;
    {
        std::unique_lock lock(mutex_);
        auto it = find(id);
        if (!it) {
            return std::unexpected(it.error());
        }
        Entry& entry = (*it)->second;
        if (isTerminal(entry.job.status)) {
            return invalidTransition(std::format("Job {} is already {}", id, jobStatusName(entry.job.status)));
        }
        if (!progressMatches(entry.job.type, progress)) {
            return std::unexpected(ErrorInfo{ErrorKind::ValidationError,
                std::format("Progress payload does not match {} job {}", jobTypeName(entry.job.type), id)});
        }
        entry.job.progress = progress;
        entry.job.updatedAt = std::chrono::system_clock::now();
        subscribers = entry.subscribers;
        event.type = JobEventType::Progress;
        event.jobId = id;
        event.progress = std::move(progress);
        event.at = entry.job.updatedAt;
    }
    for (const auto& channel : subscribers) {
        channel->push(event);
    }
    return {};
}

std::expected<void, ErrorInfo> JobOrchestrator::setResult(const std::string& id, JobResult result) {
    std::unique_lock lock(mutex_);
    auto it = find(id);
    if (!it) {
        return std::unexpected(it.error());
    }
    Job& job = (*it)->second.job;
    if (isTerminal(job.status)) {
        return invalidTransition(std::format("Job {} is already {}", id, jobStatusName(job.status)));
    }
    if (!resultMatches(job.type, result)) {
        return std::unexpected(ErrorInfo{ErrorKind::ValidationError,
            std::format("Result does not match {} job {}", jobTypeName(job.type), id)});
    }
    job.result = std::move(result);
    job.errorMessage.reset();
    job.updatedAt = std::chrono::system_clock::now();
    return {};
}

std::expected<void, ErrorInfo> JobOrchestrator::setError(const std::string& id, std::string message) {
    std::unique_lock lock(mutex_);
    auto it = find(id);
    if (!it) {
        return std::unexpected(it.error());
    }
    Job& job = (*it)->second.job;
    if (isTerminal(job.status)) {
        return invalidTransition(std::format("Job {} is already {}", id, jobStatusName(job.status)));
    }
    job.errorMessage = std::move(message);
    job.result = std::monostate{};
    job.updatedAt = std::chrono::system_clock::now();
    return {};
}

std::expected<void, ErrorInfo> JobOrchestrator::cancel(const std::string& id) {
    HistoryEntry summary;
    JobEvent event;
    std::vector<std::shared_ptr<EventChannel>> closing;
    {
        std::unique_lock lock(mutex_);
        auto it = find(id);
        if (!it) {
            return std::unexpected(it.error());
        }
        Entry& entry = (*it)->second;
        if (isTerminal(entry.job.status)) {
            return invalidTransition(std::format("Job {} is already {} and cannot be cancelled", id, jobStatusName(entry.job.status)));
        }
        entry.job.errorMessage = "Job cancelled by user";
        entry.job.result = std::monostate{};
        summary = finishLocked(entry, JobStatus::Cancelled, closing);
        event = completionEvent(entry.job);
    }
    changed_.notify_all();
    publishCompletion(summary, event, closing);
    return {};
}

std::expected<void, ErrorInfo> JobOrchestrator::deleteJob(const std::string& id) {
    std::jthread worker;
    std::vector<std::shared_ptr<EventChannel>> closing;
    {
        std::unique_lock lock(mutex_);
        auto it = find(id);
        if (!it) {
            return std::unexpected(it.error());
        }
        Entry& entry = (*it)->second;
        if (!isTerminal(entry.job.status)) {
            return invalidTransition(std::format("Job {} is {}; cancel it before deleting", id, jobStatusName(entry.job.status)));
        }
        worker = std::move(entry.worker);
        closing = std::move(entry.subscribers);
        jobs_.erase(*it);
    }
    changed_.notify_all();
    for (const auto& channel : closing) {
        channel->close();
    }
    if (worker.joinable() && worker.get_id() == std::this_thread::get_id()) {
        worker.detach();
    }
    logger_.logMessage(std::format("Deleted job {}", id));
    return {};
}

std::expected<void, ErrorInfo> JobOrchestrator::pause(const std::string& id) {
    return updateStatus(id, JobStatus::Paused);
}

std::expected<void, ErrorInfo> JobOrchestrator::resume(const std::string& id) {
    {
        std::shared_lock lock(mutex_);
        auto it = find(id);
        if (!it) {
            return std::unexpected(it.error());
        }
        const Job& job = (*it)->second.job;
        if (job.status != JobStatus::Paused) {
            return invalidTransition(std::format("Job {} is {}, not paused", id, jobStatusName(job.status)));
        }
    }
    return updateStatus(id, JobStatus::Running);
}

std::vector<Job> JobOrchestrator::list(std::optional<JobStatus> status) const {
    std::vector<std::pair<std::uint64_t, Job>> selected;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, entry] : jobs_) {
            if (!status || entry.job.status == *status) {
                selected.emplace_back(entry.sequence, entry.job);
            }
        }
    }
    std::ranges::sort(selected, [](const auto& a, const auto& b) {
        if (a.second.createdAt != b.second.createdAt) {
            return a.second.createdAt < b.second.createdAt;
        }
        return a.first < b.first;
    });
    std::vector<Job> jobs;
    jobs.reserve(selected.size());
    for (auto& item : selected) {
        jobs.push_back(std::move(item.second));
    }
    return jobs;
}

std::vector<Job> JobOrchestrator::listActive() const {
    auto jobs = list();
    std::erase_if(jobs, [](const Job& job) { return isTerminal(job.status); });
    return jobs;
}

std::size_t JobOrchestrator::cleanup(std::chrono::system_clock::time_point now) {
    std::vector<std::jthread> workers;
    std::vector<std::shared_ptr<EventChannel>> closing;
    std::size_t removed = 0;
    {
        std::unique_lock lock(mutex_);
        auto cutoff = now - config_.jobRetention;
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            Entry& entry = it->second;
            bool expired = isTerminal(entry.job.status) && entry.job.completedAt && *entry.job.completedAt < cutoff;
            if (!expired || entry.workerActive) {
                ++it;
                continue;
            }
            if (entry.worker.joinable()) {
                workers.push_back(std::move(entry.worker));
            }
            std::ranges::move(entry.subscribers, std::back_inserter(closing));
            it = jobs_.erase(it);
            ++removed;
        }
    }
    if (removed > 0) {
        changed_.notify_all();
        for (const auto& channel : closing) {
            channel->close();
        }
        logger_.logMessage(std::format("Cleanup removed {} expired job(s)", removed));
    }
    return removed;
}

std::expected<std::shared_ptr<EventChannel>, ErrorInfo> JobOrchestrator::subscribe(const std::string& id, std::size_t capacity) {
    auto channel = std::make_shared<EventChannel>(capacity);
    std::unique_lock lock(mutex_);
    auto it = find(id);
    if (!it) {
        return std::unexpected(it.error());
    }
    Entry& entry = (*it)->second;
    if (isTerminal(entry.job.status)) {
        channel->push(completionEvent(entry.job));
        channel->close();
        return channel;
    }
    entry.subscribers.push_back(channel);
    return channel;
}

void JobOrchestrator::appendOutput(const std::string& id, const std::string& line) {
    std::vector<std::shared_ptr<EventChannel>> subscribers;
    {
        std::shared_lock lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return;
        }
        subscribers = it->second.subscribers;
    }
    JobEvent event;
    event.type = JobEventType::Output;
    event.jobId = id;
    event.line = line;
    event.at = std::chrono::system_clock::now();
    for (const auto& channel : subscribers) {
        channel->push(event);
    }
}

std::expected<void, ErrorInfo> JobOrchestrator::runInBackground(const std::string& id, JobWork work) {
    std::unique_lock lock(mutex_);
    if (stopping_) {
        return invalidTransition("Job orchestrator is shutting down");
    }
    auto it = find(id);
    if (!it) {
        return std::unexpected(it.error());
    }
    Entry& entry = (*it)->second;
    if (entry.job.status != JobStatus::Pending) {
        return invalidTransition(std::format("Job {} is {} and cannot be started", id, jobStatusName(entry.job.status)));
    }
    auto now = std::chrono::system_clock::now();
    entry.job.status = JobStatus::Running;
    entry.job.updatedAt = now;
    entry.startedAt = now;
    entry.workerActive = true;
    entry.worker = std::jthread([this, id, work = std::move(work), token = entry.stop.get_token()]() mutable {
        runWorker(id, std::move(work), token);
    });
    return {};
}

bool JobOrchestrator::waitFor(const std::string& id, std::chrono::milliseconds timeout) const {
    std::shared_lock lock(mutex_);
    if (!jobs_.contains(id)) {
        return false;
    }
    return changed_.wait_for(lock, timeout, [&] {
        auto it = jobs_.find(id);
        return it == jobs_.end() || (isTerminal(it->second.job.status) && !it->second.workerActive);
    });
}

bool JobOrchestrator::isPaused(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = jobs_.find(id);
    return it != jobs_.end() && it->second.job.status == JobStatus::Paused;
}

void JobOrchestrator::shutdown() {
    std::vector<std::jthread> workers;
    {
        std::unique_lock lock(mutex_);
        stopping_ = true;
        for (auto& [id, entry] : jobs_) {
            entry.stop.request_stop();
            if (entry.worker.joinable()) {
                workers.push_back(std::move(entry.worker));
            }
        }
    }
    if (!workers.empty()) {
        logger_.logMessage(std::format("Waiting for {} job worker(s) to stop", workers.size()));
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (cleanupThread_.joinable()) {
        cleanupThread_.request_stop();
        cleanupThread_.join();
    }
}

bool JobOrchestrator::canTransition(const Job& job, JobStatus next) {
    switch (job.status) {
    case JobStatus::Pending:
        return next == JobStatus::Running || next == JobStatus::Failed || next == JobStatus::Cancelled;
    case JobStatus::Running:
        return next == JobStatus::Completed || next == JobStatus::Failed || next == JobStatus::Cancelled
            || (next == JobStatus::Paused && job.type == JobType::Transfer);
    case JobStatus::Paused:
        return next == JobStatus::Running || next == JobStatus::Failed || next == JobStatus::Cancelled;
    case JobStatus::Completed:
    case JobStatus::Failed:
    case JobStatus::Cancelled:
        return false;
    }
    return false;
}

std::expected<JobOrchestrator::Table::iterator, ErrorInfo> JobOrchestrator::find(const std::string& id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::unexpected(ErrorInfo{ErrorKind::JobNotFound, std::format("Job not found: {}", id)});
    }
    return it;
}

std::expected<JobOrchestrator::Table::const_iterator, ErrorInfo> JobOrchestrator::find(const std::string& id) const {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::unexpected(ErrorInfo{ErrorKind::JobNotFound, std::format("Job not found: {}", id)});
    }
    return it;
}

std::string JobOrchestrator::newId() const {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return std::format("{:016x}", engine());
}

HistoryEntry JobOrchestrator::finishLocked(Entry& entry, JobStatus status, std::vector<std::shared_ptr<EventChannel>>& closing) {
    auto now = std::chrono::system_clock::now();
    entry.job.status = status;
    entry.job.updatedAt = now;
    entry.job.completedAt = now;
    entry.stop.request_stop();
    closing = std::move(entry.subscribers);
    entry.subscribers.clear();
    return summarize(entry.job, entry.startedAt);
}

void JobOrchestrator::publishCompletion(const HistoryEntry& summary, const JobEvent& event, const std::vector<std::shared_ptr<EventChannel>>& closing) {
    for (const auto& channel : closing) {
        channel->push(event);
        channel->close();
    }
    if (summary.status == JobStatus::Completed) {
        logger_.logMessage(std::format("Job {} ({}) completed in {:.1f}s", summary.id, jobTypeName(summary.type), summary.durationSeconds));
    } else {
        logger_.logError(std::format("Job {} ({}) {}: {}", summary.id, jobTypeName(summary.type),
            jobStatusName(summary.status), summary.errorMessage));
    }
    if (!history_) {
        return;
    }
    // Runs on worker threads; nothing may escape.
    try {
        if (auto appended = history_->append(summary); !appended) {
            logger_.logError(std::format("Failed to record job {} in history: {}", summary.id, appended.error().message));
        }
    } catch (const std::exception& e) {
        logger_.logError(std::format("Failed to record job {} in history: {}", summary.id, e.what()));
    }
}

JobEvent JobOrchestrator::completionEvent(const Job& job) const {
    JobEvent event;
    event.type = JobEventType::Complete;
    event.jobId = job.id;
    event.status = job.status;
    event.result = job.result;
    event.errorMessage = job.errorMessage;
    event.at = job.completedAt.value_or(job.updatedAt);
    return event;
}

void JobOrchestrator::runWorker(const std::string& id, JobWork work, std::stop_token stop) {
    std::expected<JobResult, std::string> outcome;
    try {
        outcome = work(stop);
    } catch (const std::exception& e) {
        outcome = std::unexpected(std::format("Unexpected error: {}", e.what()));
    }

    HistoryEntry summary;
    JobEvent event;
    std::vector<std::shared_ptr<EventChannel>> closing;
    bool finished = false;
    {
        std::unique_lock lock(mutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return;
        }
        Entry& entry = it->second;
        entry.workerActive = false;
        if (!isTerminal(entry.job.status)) {
            JobStatus status = JobStatus::Failed;
            if (stop.stop_requested()) {
                entry.job.errorMessage = "Job cancelled during shutdown";
                entry.job.result = std::monostate{};
                status = JobStatus::Cancelled;
            } else if (!outcome) {
                entry.job.errorMessage = outcome.error();
                entry.job.result = std::monostate{};
            } else if (!resultMatches(entry.job.type, *outcome)) {
                entry.job.errorMessage = "Job finished without a result";
                entry.job.result = std::monostate{};
            } else {
                entry.job.result = std::move(*outcome);
                entry.job.errorMessage.reset();
                status = JobStatus::Completed;
            }
            summary = finishLocked(entry, status, closing);
            event = completionEvent(entry.job);
            finished = true;
        }
    }
    changed_.notify_all();
    if (finished) {
        publishCompletion(summary, event, closing);
    }
}

void JobOrchestrator::cleanupLoop(std::stop_token stop) {
    auto interval = std::max<std::chrono::minutes>(config_.cleanupInterval, std::chrono::minutes(1));
    while (!stop.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(cleanupMutex_);
            cleanupWake_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) {
            break;
        }
        cleanup();
    }
}
