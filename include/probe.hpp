/**
 * @file probe.hpp
 * @brief Server capability and performance probing.
 *
 * A probe connects to one endpoint and measures what it can do: reachability,
 * login, directory access, writability, shell access, protocol extensions and
 * upload/download throughput. Every temporary artifact written during the probe
 * is removed before the probe returns.
 */

#ifndef PROBE_HPP
#define PROBE_HPP

#include <string>
#include <vector>
#include <chrono>
#include <expected>
#include "app_config.hpp"
#include "connection_config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "remote_session.hpp"

/**
 * @brief Capability flags discovered by a probe.
 */
struct Capabilities {
    bool canRead = false;
    bool canWrite = false;
    bool canList = false;
    bool shellAvailable = false;
    /// Directory operations work without an inbound data connection
    /// (FTP PASV/EPSV; SSH-family listings run over the session channel).
    bool passiveListing = false;
    bool mlsdSupported = false;
    std::vector<std::string> protocolExtensions;  ///< FEAT lines or SFTP extension names.
    std::string protocolVersion;                  ///< e.g. "SFTP v3", server greeting for FTP.
    std::vector<std::string> compressionTypes;
};

/**
 * @brief Measured performance. Throughput is 0 when it could not be measured.
 */
struct Performance {
    double latencyMs = 0;              ///< TCP connect time.
    double connectionSetupMs = 0;      ///< Handshake + login time.
    double uploadBytesPerSecond = 0;
    double downloadBytesPerSecond = 0;
};

/**
 * @brief Outcome of probing one endpoint.
 *
 * When success is false, errorKind and errorMessage name the failing step and the
 * remaining fields hold whatever was learned before it.
 */
struct ProbeResult {
    bool success = false;
    ConnectionConfig endpoint;         ///< The probed endpoint, credentials stripped.
    Capabilities capabilities;
    Performance performance;
    std::vector<std::string> badges;
    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;
    std::chrono::system_clock::time_point testedAt;
};

/**
 * @brief Opens a TCP connection and closes it again.
 *
 * @param host Host name or address.
 * @param port TCP port.
 * @param timeout Connect timeout.
 * @return Elapsed connect time, or connection_failed.
 */
std::expected<std::chrono::microseconds, ErrorInfo> tcpDial(const std::string& host, int port, std::chrono::milliseconds timeout);

/**
 * @brief Runs probes against endpoints.
 */
class ProbeEngine {
public:
    /**
     * @brief Constructs a probe engine.
     *
     * @param config Timeouts and speed test size.
     * @param logger Logger for probe steps.
     * @param factory Session factory.
     */
    ProbeEngine(const AppConfig& config, const Logger& logger, SessionFactory factory);

    /**
     * @brief Probes one endpoint. Never throws; failures are carried in the result.
     *
     * @param config Endpoint to probe.
     * @return ProbeResult The probe outcome.
     */
    ProbeResult probe(const ConnectionConfig& config) const;

private:
    void measureThroughput(RemoteSession& session, const std::string& rootPath, ProbeResult& result) const;
    std::string temporaryName(const std::string& prefix) const;

    const AppConfig& config_;
    const Logger& logger_;
    SessionFactory factory_;
};

/**
 * @brief Returns a copy of config without password and key material.
 */
ConnectionConfig withoutCredentials(const ConnectionConfig& config);

#endif // PROBE_HPP
