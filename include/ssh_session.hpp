/**
 * @file ssh_session.hpp
 * @brief SFTP and SCP sessions built on libssh.
 */

#ifndef SSH_SESSION_HPP
#define SSH_SESSION_HPP

#include <string>
#include <vector>
#include <memory>
#include <expected>
#include <chrono>
#include <optional>
#include "remote_session.hpp"
#include "logger.hpp"

struct ssh_session_struct;
struct sftp_session_struct;

/**
 * @brief Owns one authenticated SSH connection.
 *
 * Host keys are trusted on first use: the SHA-256 fingerprint seen for a host:port
 * is remembered for the lifetime of the process, and a different key on a later
 * connection is rejected as a handshake failure.
 */
class SshConnection {
public:
    SshConnection(const ConnectionConfig& config, const Logger& logger);
    ~SshConnection();

    SshConnection(const SshConnection&) = delete;
    SshConnection& operator=(const SshConnection&) = delete;

    /**
     * @brief Connects, verifies the host key and authenticates.
     *
     * Authentication uses the configured key if any, then the password, and
     * finally the agent/default keys when neither is set.
     */
    std::expected<void, ErrorInfo> connect(std::chrono::milliseconds timeout);

    /**
     * @brief Disconnects and frees the session.
     */
    void disconnect();

    /**
     * @brief Starts a command on an exec channel.
     */
    std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> exec(const std::string& command);

    /**
     * @brief Compression methods offered during key exchange.
     */
    std::vector<std::string> compressionTypes() const;

    ssh_session_struct* handle() const { return session_; }

private:
    std::expected<void, ErrorInfo> verifyHostKey();
    std::expected<void, ErrorInfo> authenticate();
    std::string lastError() const;

    ConnectionConfig config_;
    const Logger& logger_;
    ssh_session_struct* session_ = nullptr;
    bool connected_ = false;
    bool compressionOffered_ = false;
};

/**
 * @brief Session speaking SFTP on an SSH connection.
 */
class SftpSession : public RemoteSession {
public:
    SftpSession(const ConnectionConfig& config, const Logger& logger);
    ~SftpSession() override;

    Protocol protocol() const override { return Protocol::Sftp; }
    std::expected<void, ErrorInfo> open(std::chrono::milliseconds timeout) override;
    void close() override;
    std::expected<std::vector<RemoteEntry>, ErrorInfo> list(const std::string& path) override;
    std::expected<RemoteEntry, ErrorInfo> stat(const std::string& path) override;
    std::expected<std::uint64_t, ErrorInfo> download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) override;
    std::expected<std::uint64_t, ErrorInfo> upload(const std::string& path, const ChunkSource& source, bool append) override;
    std::expected<void, ErrorInfo> remove(const std::string& path) override;
    std::expected<void, ErrorInfo> makeDirectory(const std::string& path) override;
    std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> openCommand(const std::string& command) override;
    void describeCapabilities(const std::string& rootPath, Capabilities& capabilities, std::vector<std::string>& badges) override;

private:
    ErrorInfo sftpError(const std::string& operation, const std::string& path) const;

    SshConnection connection_;
    sftp_session_struct* sftp_ = nullptr;
};

/**
 * @brief Session using SCP for downloads and the remote shell for everything else.
 */
class ScpSession : public RemoteSession {
public:
    ScpSession(const ConnectionConfig& config, const Logger& logger);
    ~ScpSession() override;

    Protocol protocol() const override { return Protocol::Scp; }
    std::expected<void, ErrorInfo> open(std::chrono::milliseconds timeout) override;
    void close() override;
    std::expected<std::vector<RemoteEntry>, ErrorInfo> list(const std::string& path) override;
    std::expected<RemoteEntry, ErrorInfo> stat(const std::string& path) override;
    std::expected<std::uint64_t, ErrorInfo> download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) override;
    std::expected<std::uint64_t, ErrorInfo> upload(const std::string& path, const ChunkSource& source, bool append) override;
    std::expected<void, ErrorInfo> remove(const std::string& path) override;
    std::expected<void, ErrorInfo> makeDirectory(const std::string& path) override;
    std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> openCommand(const std::string& command) override;
    void describeCapabilities(const std::string& rootPath, Capabilities& capabilities, std::vector<std::string>& badges) override;

private:
    std::expected<void, ErrorInfo> runChecked(const std::string& command, const std::string& action);

    SshConnection connection_;
};

/**
 * @brief Parses one line of `find -printf '%y\t%s\t%T@\t%m\t%f\n'` output.
 *
 * @return The entry, or std::nullopt for a malformed line.
 */
std::optional<RemoteEntry> parseFindLine(const std::string& line);

#endif // SSH_SESSION_HPP
