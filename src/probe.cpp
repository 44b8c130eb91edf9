#include "probe.hpp"
#include <sys/socket.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <random>
#include <utility>

namespace {

std::atomic<std::uint64_t> probeCounter{0};

/**
 * @brief Runs a callable when the scope ends.
 */
template <typename F>
class ScopeExit {
public:
    explicit ScopeExit(F fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    F fn_;
};

class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) ::close(fd_); }
    int get() const { return fd_; }

private:
    int fd_;
};

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

void fail(ProbeResult& result, const ErrorInfo& error, const Logger& logger) {
    result.success = false;
    result.errorKind = error.kind;
    result.errorMessage = error.message;
    logger.logError(std::format("Probe of {} failed: {}", describeEndpoint(result.endpoint), error.message));
}

std::string protocolBadge(Protocol protocol) {
    switch (protocol) {
    case Protocol::Sftp: return "SFTP OK";
    case Protocol::Scp: return "SCP OK";
    case Protocol::Ftp:
    case Protocol::Ftps: return "FTP";
    }
    return "OK";
}

} // namespace

std::expected<std::chrono::microseconds, ErrorInfo> tcpDial(const std::string& host, int port, std::chrono::milliseconds timeout) {
    addrinfo hints{}, *resolved = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    auto start = std::chrono::steady_clock::now();
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &resolved);
    if (rc != 0) {
        return std::unexpected(ErrorInfo{ErrorKind::ConnectionFailed,
            std::format("Failed to resolve host {}: {}", host, gai_strerror(rc))});
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(resolved, freeaddrinfo);

    std::string lastError = "no usable address";
    for (addrinfo* address = addresses.get(); address; address = address->ai_next) {
        SocketGuard sock(socket(address->ai_family, address->ai_socktype, address->ai_protocol));
        if (sock.get() < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        fcntl(sock.get(), F_SETFL, fcntl(sock.get(), F_GETFL, 0) | O_NONBLOCK);

        if (::connect(sock.get(), address->ai_addr, address->ai_addrlen) == 0) {
            return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        }
        if (errno != EINPROGRESS) {
            lastError = std::strerror(errno);
            continue;
        }

        auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        if (remaining.count() <= 0) {
            lastError = "connection timed out";
            break;
        }
        pollfd pfd{sock.get(), POLLOUT, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready == 0) {
            lastError = "connection timed out";
            break;
        }
        if (ready < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        int soError = 0;
        socklen_t length = sizeof(soError);
        getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &length);
        if (soError == 0) {
            return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
        }
        lastError = std::strerror(soError);
    }
    return std::unexpected(ErrorInfo{ErrorKind::ConnectionFailed,
        std::format("Failed to connect to {}:{}: {}", host, port, lastError)});
}

ConnectionConfig withoutCredentials(const ConnectionConfig& config) {
    ConnectionConfig copy = config;
    copy.password.clear();
    copy.sshKey.clear();
    return copy;
}

ProbeEngine::ProbeEngine(const AppConfig& config, const Logger& logger, SessionFactory factory)
    : config_(config), logger_(logger), factory_(std::move(factory)) {}

std::string ProbeEngine::temporaryName(const std::string& prefix) const {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
    return std::format("{}-{}-{}", prefix, now.count(), probeCounter.fetch_add(1));
}

ProbeResult ProbeEngine::probe(const ConnectionConfig& config) const {
    ProbeResult result;
    result.endpoint = withoutCredentials(config);
    result.testedAt = std::chrono::system_clock::now();

    try {
        if (auto valid = validateConnectionConfig(config); !valid) {
            fail(result, valid.error(), logger_);
            return result;
        }

        auto dialed = tcpDial(config.host, config.port, config_.dialTimeout);
        if (!dialed) {
            fail(result, dialed.error(), logger_);
            return result;
        }
        result.performance.latencyMs = static_cast<double>(dialed->count()) / 1000.0;

        auto session = factory_(config);
        if (!session) {
            fail(result, ErrorInfo{ErrorKind::UnsupportedCapability, "No session available for protocol"}, logger_);
            return result;
        }
        auto setupStart = std::chrono::steady_clock::now();
        if (auto opened = session->open(config_.loginTimeout); !opened) {
            fail(result, opened.error(), logger_);
            return result;
        }
        result.performance.connectionSetupMs = elapsedMs(setupStart);
        result.success = true;
        result.badges.push_back(protocolBadge(config.protocol));
        if (!isSshFamily(config.protocol)) {
            result.badges.emplace_back("Login OK");
        }

        Capabilities& caps = result.capabilities;
        if (auto listed = session->list(config.rootPath)) {
            caps.canRead = true;
            caps.canList = true;
            result.badges.emplace_back("Read OK");
        } else {
            logger_.logMessage(std::format("Cannot list {}: {}", config.rootPath, listed.error().message));
        }

        {
            std::string marker = joinRemotePath(config.rootPath, temporaryName(".sitemover-probe"));
            auto written = session->writeFile(marker, "sitemover write probe\n");
            ScopeExit removeMarker([&] {
                if (auto removed = session->remove(marker); !removed && written) {
                    logger_.logError(std::format("Failed to remove probe marker {}: {}", marker, removed.error().message));
                }
            });
            if (written) {
                caps.canWrite = true;
                result.badges.emplace_back("Write OK");
                measureThroughput(*session, config.rootPath, result);
            } else {
                logger_.logMessage(std::format("Cannot write to {}: {}", config.rootPath, written.error().message));
            }
            session->describeCapabilities(config.rootPath, caps, result.badges);
        }
        session->close();
        logger_.logMessage(std::format("Probed {}: latency {:.1f} ms, setup {:.1f} ms", describeEndpoint(config),
            result.performance.latencyMs, result.performance.connectionSetupMs));
    } catch (const std::exception& e) {
        fail(result, ErrorInfo{ErrorKind::ConnectionFailed, std::format("Unexpected probe failure: {}", e.what())}, logger_);
    }
    return result;
}

void ProbeEngine::measureThroughput(RemoteSession& session, const std::string& rootPath, ProbeResult& result) const {
    std::string payload(config_.speedTestBytes, '\0');
    std::mt19937 generator(std::random_device{}());
    std::uniform_int_distribution<int> byte(0, 255);
    for (auto& c : payload) {
        c = static_cast<char>(byte(generator));
    }

    std::string speedFile = joinRemotePath(rootPath, temporaryName(".sitemover-speed") + ".bin");
    ScopeExit removeSpeedFile([&] {
        if (auto removed = session.remove(speedFile); !removed) {
            logger_.logError(std::format("Failed to remove speed test file {}: {}", speedFile, removed.error().message));
        }
    });

    auto uploadStart = std::chrono::steady_clock::now();
    if (auto written = session.writeFile(speedFile, payload); !written) {
        logger_.logMessage(std::format("Upload speed test failed: {}", written.error().message));
        return;
    }
    double uploadSeconds = std::max(elapsedMs(uploadStart) / 1000.0, 1e-6);
    result.performance.uploadBytesPerSecond = static_cast<double>(payload.size()) / uploadSeconds;

    auto downloadStart = std::chrono::steady_clock::now();
    auto readBack = session.readFile(speedFile, payload.size() + 1);
    if (!readBack || readBack->size() != payload.size()) {
        logger_.logMessage(std::format("Download speed test failed for {}", speedFile));
        return;
    }
    double downloadSeconds = std::max(elapsedMs(downloadStart) / 1000.0, 1e-6);
    result.performance.downloadBytesPerSecond = static_cast<double>(payload.size()) / downloadSeconds;
}
