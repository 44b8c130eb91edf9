/**
 * @file job_events.hpp
 * @brief Tagged job events and the bounded channel that delivers them to subscribers.
 *
 * Delivery is best-effort: a full channel drops its oldest event so a slow
 * subscriber never blocks the worker publishing into it.
 */

#ifndef JOB_EVENTS_HPP
#define JOB_EVENTS_HPP

#include <string>
#include <string_view>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstddef>
#include "job.hpp"

enum class JobEventType {
    Output,    ///< A raw log line.
    Progress,  ///< Structured counters.
    Complete   ///< Terminal status plus the final result or error.
};

std::string_view jobEventTypeName(JobEventType type);

struct JobEvent {
    JobEventType type = JobEventType::Output;
    std::string jobId;
    std::string line;                          ///< Output events.
    JobProgress progress;                      ///< Progress events.
    JobStatus status = JobStatus::Pending;     ///< Complete events.
    JobResult result;                          ///< Complete events.
    std::optional<std::string> errorMessage;   ///< Complete events.
    std::chrono::system_clock::time_point at;
};

/**
 * @brief Bounded multi-producer queue of job events.
 */
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = 256);

    /**
     * @brief Enqueues an event, dropping the oldest one when full. Ignored once closed.
     */
    void push(JobEvent event);

    /**
     * @brief Waits up to timeout for the next event.
     *
     * @return The event, or std::nullopt on timeout or when closed and drained.
     */
    std::optional<JobEvent> pop(std::chrono::milliseconds timeout);

    std::optional<JobEvent> tryPop();

    /**
     * @brief Stops accepting events; queued ones can still be popped.
     */
    void close();

    bool closed() const;

    /**
     * @brief Number of events discarded because the channel was full.
     */
    std::size_t dropped() const;

private:
    const std::size_t capacity_;
    std::deque<JobEvent> events_;
    bool closed_ = false;
    std::size_t dropped_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
};

#endif // JOB_EVENTS_HPP
