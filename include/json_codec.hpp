/**
 * @file json_codec.hpp
 * @brief JSON encoding of probe, scan, plan, transfer, job and history values.
 *
 * Credentials never leave the process through this codec: passwords and key
 * material are replaced with a mask.
 */

#ifndef JSON_CODEC_HPP
#define JSON_CODEC_HPP

#include <string>
#include <optional>
#include <expected>
#include <chrono>
#include <json/json.h>
#include "errors.hpp"
#include "history_store.hpp"
#include "job.hpp"
#include "job_events.hpp"
#include "planner.hpp"
#include "probe.hpp"
#include "scanner.hpp"
#include "transfer.hpp"

/**
 * @brief Formats a time point as UTC ISO-8601 ("2024-05-01T12:30:00Z").
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Parses the output of formatTimestamp.
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

Json::Value toJson(const ErrorInfo& error);
Json::Value toJson(const ConnectionConfig& config);
Json::Value toJson(const ProbeResult& result);
Json::Value toJson(const ExclusionPattern& pattern);
Json::Value toJson(const FileEntry& entry);
Json::Value toJson(const CmsDetection& detection);
Json::Value toJson(const ScanProgress& progress);

/**
 * @brief Encodes a scan result. The visited entry list is summarized by its size only.
 */
Json::Value toJson(const ScanResult& result);

Json::Value toJson(const TransferStrategy& strategy);
Json::Value toJson(const PlanResult& result);
Json::Value toJson(const TransferProgress& progress);
Json::Value toJson(const TransferResult& result);

/**
 * @brief Encodes a progress payload as {"kind": ..., ...}; null for plan jobs.
 */
Json::Value toJson(const JobProgress& progress);

/**
 * @brief Encodes a job result as {"kind": ..., ...}; null while unset.
 */
Json::Value toJson(const JobResult& result);

Json::Value toJson(const Job& job);

/**
 * @brief Encodes an event as {"type": "output"|"progress"|"complete", "job_id": ..., ...}.
 */
Json::Value toJson(const JobEvent& event);

Json::Value toJson(const HistoryEntry& entry);

std::expected<HistoryEntry, ErrorInfo> historyEntryFromJson(const Json::Value& json);

/**
 * @brief Serializes a value, indented or on a single line.
 */
std::string writeJson(const Json::Value& value, bool compact = false);

#endif // JSON_CODEC_HPP
