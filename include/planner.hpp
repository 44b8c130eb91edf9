/**
 * @file planner.hpp
 * @brief Ranks the feasible transfer methods for a scanned site and two probed endpoints.
 *
 * Planning is pure: the same scan and probes always yield the same plan.
 */

#ifndef PLANNER_HPP
#define PLANNER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include "probe.hpp"
#include "scanner.hpp"

/**
 * @brief Known transfer methods. The declaration order is the final tie-break.
 */
enum class TransferMethod {
    PeerToPeerCopy,
    RsyncOverSsh,
    MultiConnectionClient,
    StreamingCopy,
    ArchiveStream
};

std::string_view transferMethodName(TransferMethod method);

std::optional<TransferMethod> parseTransferMethod(std::string_view name);

/**
 * @brief One scored, feasible way to move the site.
 */
struct TransferStrategy {
    TransferMethod method = TransferMethod::StreamingCopy;
    double score = 0;                            ///< In [0, 100].
    std::chrono::seconds estimatedTime{0};
    std::vector<std::string> pros;
    std::vector<std::string> cons;
    std::vector<std::string> requirements;
    std::string command;                         ///< Display form, without secrets.
    std::string commandExplanation;
    bool canResume = false;
    bool supportsProgress = false;
};

/**
 * @brief Ranked strategies plus advisories.
 */
struct PlanResult {
    bool success = false;
    std::string errorMessage;
    std::vector<TransferStrategy> strategies;    ///< Best first.
    std::optional<TransferStrategy> recommended;
    std::vector<std::string> warnings;
    bool requiresDatabase = false;
    std::chrono::seconds estimatedTotalTime{0};
};

/**
 * @brief Scores transfer methods against probe and scan results.
 *
 * Each strategy's score is 100 times a weighted sum of four sub-scores in [0, 1]:
 * throughput (saturating at 50 MiB/s), resumability, parallelism and robustness.
 */
class StrategyPlanner {
public:
    static constexpr double kThroughputWeight = 0.35;
    static constexpr double kResumeWeight = 0.25;
    static constexpr double kParallelismWeight = 0.15;
    static constexpr double kRobustnessWeight = 0.25;
    static constexpr double kSaturationBytesPerSecond = 50.0 * 1024 * 1024;
    static constexpr double kFallbackBytesPerSecond = 10.0 * 1024 * 1024;

    /**
     * @param parallelConnections Connection pairs used by the multi-connection client.
     */
    explicit StrategyPlanner(int parallelConnections = 4);

    /**
     * @brief Builds the plan.
     *
     * @param scan Result of scanning the source.
     * @param source Probe of the source endpoint.
     * @param dest Probe of the destination endpoint.
     * @return A plan; success is false when the scan or a probe failed.
     */
    PlanResult plan(const ScanResult& scan, const ProbeResult& source, const ProbeResult& dest) const;

    /**
     * @brief Feasibility predicate of a method over two probes.
     */
    static bool isFeasible(TransferMethod method, const ProbeResult& source, const ProbeResult& dest);

    /**
     * @brief Sorts strategies best first: score, then resumability, then estimated time, then method order.
     */
    static void rank(std::vector<TransferStrategy>& strategies);

private:
    TransferStrategy describe(TransferMethod method, const ScanResult& scan, const ProbeResult& source, const ProbeResult& dest) const;

    int parallelConnections_;
};

#endif // PLANNER_HPP
