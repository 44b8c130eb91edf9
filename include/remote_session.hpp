/**
 * @file remote_session.hpp
 * @brief Protocol-neutral interface to one remote endpoint.
 *
 * The probe, the scanner and the transfer executors talk to servers only through
 * RemoteSession. There is one implementation per protocol (SFTP, SCP, FTP, FTPS);
 * callers never branch on the concrete type.
 */

#ifndef REMOTE_SESSION_HPP
#define REMOTE_SESSION_HPP

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <expected>
#include <chrono>
#include <cstdint>
#include "connection_config.hpp"
#include "errors.hpp"

struct Capabilities;
class Logger;

/**
 * @brief One directory entry as reported by a server.
 */
struct RemoteEntry {
    std::string name;             ///< Base name.
    bool isDir = false;
    bool isSymlink = false;
    std::uint64_t size = 0;       ///< Bytes; 0 for directories on most servers.
    std::int64_t mtime = 0;       ///< Seconds since the epoch, 0 if unknown.
    std::uint32_t permissions = 0; ///< POSIX mode bits, 0 if unknown.
};

/**
 * @brief Receives downloaded bytes. Returning false aborts the download.
 */
using ChunkSink = std::function<bool(const char* data, std::size_t size)>;

/**
 * @brief Supplies bytes to upload. Returns the number of bytes written to buffer, 0 at end of data.
 */
using ChunkSource = std::function<std::size_t(char* buffer, std::size_t capacity)>;

/**
 * @brief A command running in a remote shell, with its stdin and stdout exposed as streams.
 */
class RemoteCommand {
public:
    virtual ~RemoteCommand() = default;

    /**
     * @brief Reads from the command's stdout.
     *
     * @return Bytes read, 0 at end of output, or an error.
     */
    virtual std::expected<std::size_t, ErrorInfo> read(char* buffer, std::size_t capacity) = 0;

    /**
     * @brief Writes to the command's stdin.
     */
    virtual std::expected<void, ErrorInfo> write(const char* data, std::size_t size) = 0;

    /**
     * @brief Signals end of input to the command.
     */
    virtual void closeInput() = 0;

    /**
     * @brief Waits for the command to exit and returns its exit status (-1 if unknown).
     */
    virtual int wait() = 0;

    /**
     * @brief Returns whatever the command wrote to stderr so far.
     */
    virtual std::string errorOutput() = 0;
};

/**
 * @brief Output of a command run to completion.
 */
struct CommandOutput {
    int exitStatus = -1;
    std::string output;
    std::string errorOutput;
};

/**
 * @brief Interface for a session with one remote endpoint.
 *
 * A session is opened once, used from a single thread, and closed on destruction.
 */
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    /**
     * @brief Returns the protocol this session speaks.
     */
    virtual Protocol protocol() const = 0;

    /**
     * @brief Performs the protocol handshake and login.
     *
     * @param timeout Upper bound for connect + handshake + authentication.
     * @return Success, or connection_failed / handshake_failed / auth_failed.
     */
    virtual std::expected<void, ErrorInfo> open(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Closes the session. Safe to call more than once.
     */
    virtual void close() = 0;

    /**
     * @brief Lists a directory. "." and ".." are never returned.
     */
    virtual std::expected<std::vector<RemoteEntry>, ErrorInfo> list(const std::string& path) = 0;

    /**
     * @brief Returns metadata for a path, following symbolic links.
     */
    virtual std::expected<RemoteEntry, ErrorInfo> stat(const std::string& path) = 0;

    /**
     * @brief Streams a remote file into sink, starting at offset.
     *
     * @return Number of bytes delivered.
     */
    virtual std::expected<std::uint64_t, ErrorInfo> download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) = 0;

    /**
     * @brief Streams source into a remote file.
     *
     * @param append If true, bytes are appended to the existing file (resume); otherwise it is truncated.
     * @return Number of bytes written.
     */
    virtual std::expected<std::uint64_t, ErrorInfo> upload(const std::string& path, const ChunkSource& source, bool append) = 0;

    /**
     * @brief Deletes a remote file.
     */
    virtual std::expected<void, ErrorInfo> remove(const std::string& path) = 0;

    /**
     * @brief Creates one directory. An existing directory is not an error.
     */
    virtual std::expected<void, ErrorInfo> makeDirectory(const std::string& path) = 0;

    /**
     * @brief Starts a command in the remote shell.
     *
     * @return The running command, or unsupported_capability when the protocol has no shell.
     */
    virtual std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> openCommand(const std::string& command);

    /**
     * @brief Fills protocol-specific capability flags and badges.
     *
     * Absence of a feature only leaves a flag unset; this never fails.
     *
     * @param rootPath Root path being probed.
     * @param capabilities Capabilities to update.
     * @param badges Badges to append to.
     */
    virtual void describeCapabilities(const std::string& rootPath, Capabilities& capabilities, std::vector<std::string>& badges) = 0;

    /**
     * @brief Runs a command to completion and collects its output.
     */
    std::expected<CommandOutput, ErrorInfo> runCommand(const std::string& command);

    /**
     * @brief Reads a whole remote file, up to maxBytes.
     */
    std::expected<std::string, ErrorInfo> readFile(const std::string& path, std::size_t maxBytes = 1024 * 1024);

    /**
     * @brief Writes a whole remote file, replacing any previous content.
     */
    std::expected<void, ErrorInfo> writeFile(const std::string& path, const std::string& content);

    /**
     * @brief Creates a directory and all missing parents.
     */
    std::expected<void, ErrorInfo> makeDirectories(const std::string& path);
};

/**
 * @brief Creates sessions for connection configurations. Injected so tests can supply fakes.
 */
using SessionFactory = std::function<std::unique_ptr<RemoteSession>(const ConnectionConfig&)>;

/**
 * @brief Creates the session implementation matching config.protocol.
 *
 * @param config Endpoint to connect to.
 * @param logger Logger used for connection diagnostics.
 */
std::unique_ptr<RemoteSession> makeRemoteSession(const ConnectionConfig& config, const Logger& logger);

/**
 * @brief Returns a factory that binds makeRemoteSession to a logger.
 */
SessionFactory defaultSessionFactory(const Logger& logger);

/**
 * @brief Joins a directory and a child name with a single '/'.
 */
std::string joinRemotePath(const std::string& dir, const std::string& name);

/**
 * @brief Quotes a string for a POSIX shell using single quotes.
 */
std::string shellQuote(const std::string& text);

#endif // REMOTE_SESSION_HPP
