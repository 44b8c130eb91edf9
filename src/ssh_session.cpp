#include "ssh_session.hpp"
#include "probe.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <algorithm>
#include <format>
#include <map>
#include <mutex>
#include <sstream>

namespace {

constexpr const char* kCompressionMethods = "zlib@openssh.com,zlib,none";
constexpr std::size_t kChunkSize = 32 * 1024;
constexpr std::uint32_t kMaxChannelRead = 64 * 1024;

// Host key fingerprints accepted so far, keyed by "host:port".
std::mutex knownHostsMutex;
std::map<std::string, std::string> knownHosts;

bool contains(const std::string& text, std::string_view needle) {
    return text.find(needle) != std::string::npos;
}

ErrorInfo classifyShellError(const std::string& stderrText, const std::string& action) {
    std::string message = stderrText;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    if (message.empty()) {
        message = "command failed";
    }
    if (contains(stderrText, "Permission denied")) {
        return ErrorInfo{ErrorKind::PermissionDenied, std::format("{}: {}", action, message)};
    }
    return ErrorInfo{ErrorKind::IoError, std::format("{}: {}", action, message)};
}

/**
 * @brief Command running on an SSH exec channel.
 */
class SshCommand : public RemoteCommand {
public:
    explicit SshCommand(ssh_channel channel) : channel_(channel) {}

    ~SshCommand() override {
        if (ssh_channel_is_open(channel_)) {
            ssh_channel_close(channel_);
        }
        ssh_channel_free(channel_);
    }

    std::expected<std::size_t, ErrorInfo> read(char* buffer, std::size_t capacity) override {
        auto count = static_cast<std::uint32_t>(std::min<std::size_t>(capacity, kMaxChannelRead));
        int n = ssh_channel_read(channel_, buffer, count, 0);
        collectErrorOutput();
        if (n == SSH_ERROR) {
            return std::unexpected(ErrorInfo{ErrorKind::TransferFailed, "Failed to read from remote command"});
        }
        return static_cast<std::size_t>(n);
    }

    std::expected<void, ErrorInfo> write(const char* data, std::size_t size) override {
        std::size_t written = 0;
        while (written < size) {
            auto count = static_cast<std::uint32_t>(std::min<std::size_t>(size - written, kMaxChannelRead));
            int n = ssh_channel_write(channel_, data + written, count);
            if (n == SSH_ERROR) {
                return std::unexpected(ErrorInfo{ErrorKind::TransferFailed, "Failed to write to remote command"});
            }
            written += static_cast<std::size_t>(n);
        }
        return {};
    }

    void closeInput() override {
        if (!inputClosed_) {
            ssh_channel_send_eof(channel_);
            inputClosed_ = true;
        }
    }

    int wait() override {
        closeInput();
        char discard[4096];
        while (ssh_channel_read(channel_, discard, sizeof(discard), 0) > 0) {
        }
        collectErrorOutput();
        return ssh_channel_get_exit_status(channel_);
    }

    std::string errorOutput() override {
        collectErrorOutput();
        return stderr_;
    }

private:
    void collectErrorOutput() {
        char buf[4096];
        int n = 0;
        while ((n = ssh_channel_read_nonblocking(channel_, buf, sizeof(buf), 1)) > 0) {
            stderr_.append(buf, static_cast<std::size_t>(n));
        }
    }

    ssh_channel channel_;
    bool inputClosed_ = false;
    std::string stderr_;
};

RemoteEntry entryFromAttributes(sftp_attributes attrs) {
    RemoteEntry entry;
    entry.name = attrs->name ? attrs->name : "";
    entry.isDir = attrs->type == SSH_FILEXFER_TYPE_DIRECTORY;
    entry.isSymlink = attrs->type == SSH_FILEXFER_TYPE_SYMLINK;
    entry.size = attrs->size;
    entry.mtime = attrs->mtime;
    entry.permissions = attrs->permissions & 07777;
    return entry;
}

} // namespace

SshConnection::SshConnection(const ConnectionConfig& config, const Logger& logger)
    : config_(config), logger_(logger) {}

SshConnection::~SshConnection() {
    disconnect();
}

std::string SshConnection::lastError() const {
    return session_ ? ssh_get_error(session_) : "no session";
}

std::expected<void, ErrorInfo> SshConnection::connect(std::chrono::milliseconds timeout) {
    disconnect();
    session_ = ssh_new();
    if (!session_) {
        return std::unexpected(ErrorInfo{ErrorKind::ConnectionFailed, "Failed to create SSH session"});
    }

    unsigned int port = static_cast<unsigned int>(config_.port);
    long seconds = static_cast<long>(timeout.count() / 1000);
    long micros = static_cast<long>((timeout.count() % 1000) * 1000);
    ssh_options_set(session_, SSH_OPTIONS_HOST, config_.host.c_str());
    ssh_options_set(session_, SSH_OPTIONS_PORT, &port);
    ssh_options_set(session_, SSH_OPTIONS_USER, config_.username.c_str());
    ssh_options_set(session_, SSH_OPTIONS_TIMEOUT, &seconds);
    ssh_options_set(session_, SSH_OPTIONS_TIMEOUT_USEC, &micros);
    if (ssh_options_set(session_, SSH_OPTIONS_COMPRESSION_C_S, kCompressionMethods) < 0 ||
        ssh_options_set(session_, SSH_OPTIONS_COMPRESSION_S_C, kCompressionMethods) < 0) {
        logger_.logMessage(std::format("Compression unavailable for {}: {}", config_.host, lastError()));
        compressionOffered_ = false;
    } else {
        compressionOffered_ = true;
    }

    if (ssh_connect(session_) != SSH_OK) {
        std::string error = lastError();
        ssh_free(session_);
        session_ = nullptr;
        bool network = contains(error, "refused") || contains(error, "resolve") ||
                       contains(error, "Timeout") || contains(error, "timed out") || contains(error, "unreachable");
        return std::unexpected(ErrorInfo{network ? ErrorKind::ConnectionFailed : ErrorKind::HandshakeFailed,
            std::format("SSH connection to {}:{} failed: {}", config_.host, config_.port, error)});
    }
    connected_ = true;

    if (auto verified = verifyHostKey(); !verified) {
        disconnect();
        return verified;
    }
    if (auto authenticated = authenticate(); !authenticated) {
        disconnect();
        return authenticated;
    }
    return {};
}

std::expected<void, ErrorInfo> SshConnection::verifyHostKey() {
    ssh_key serverKey = nullptr;
    if (ssh_get_server_publickey(session_, &serverKey) != SSH_OK) {
        return std::unexpected(ErrorInfo{ErrorKind::HandshakeFailed, "Failed to read server host key"});
    }
    unsigned char* hash = nullptr;
    std::size_t hashLength = 0;
    int rc = ssh_get_publickey_hash(serverKey, SSH_PUBLICKEY_HASH_SHA256, &hash, &hashLength);
    ssh_key_free(serverKey);
    if (rc != SSH_OK) {
        return std::unexpected(ErrorInfo{ErrorKind::HandshakeFailed, "Failed to hash server host key"});
    }
    char* text = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hashLength);
    ssh_clean_pubkey_hash(&hash);
    if (!text) {
        return std::unexpected(ErrorInfo{ErrorKind::HandshakeFailed, "Failed to format host key fingerprint"});
    }
    std::string fingerprint(text);
    ssh_string_free_char(text);

    std::string hostKey = std::format("{}:{}", config_.host, config_.port);
    std::lock_guard<std::mutex> lock(knownHostsMutex);
    auto [it, inserted] = knownHosts.emplace(hostKey, fingerprint);
    if (inserted) {
        logger_.logMessage(std::format("Accepted host key for {}: {}", hostKey, fingerprint));
    } else if (it->second != fingerprint) {
        return std::unexpected(ErrorInfo{ErrorKind::HandshakeFailed,
            std::format("Host key for {} changed (expected {}, got {})", hostKey, it->second, fingerprint)});
    }
    return {};
}

std::expected<void, ErrorInfo> SshConnection::authenticate() {
    if (!config_.sshKey.empty()) {
        ssh_key key = nullptr;
        int rc = config_.sshKey.starts_with("-----BEGIN")
            ? ssh_pki_import_privkey_base64(config_.sshKey.c_str(), nullptr, nullptr, nullptr, &key)
            : ssh_pki_import_privkey_file(config_.sshKey.c_str(), nullptr, nullptr, nullptr, &key);
        if (rc != SSH_OK) {
            return std::unexpected(ErrorInfo{ErrorKind::AuthFailed, "Failed to load SSH private key"});
        }
        rc = ssh_userauth_publickey(session_, nullptr, key);
        ssh_key_free(key);
        if (rc != SSH_AUTH_SUCCESS) {
            return std::unexpected(ErrorInfo{ErrorKind::AuthFailed, std::format("SSH key authentication failed for {}", config_.username)});
        }
        return {};
    }

    if (config_.password.empty()) {
        if (ssh_userauth_publickey_auto(session_, nullptr, nullptr) != SSH_AUTH_SUCCESS) {
            return std::unexpected(ErrorInfo{ErrorKind::AuthFailed, std::format("SSH authentication failed for {}", config_.username)});
        }
        return {};
    }

    if (ssh_userauth_password(session_, nullptr, config_.password.c_str()) != SSH_AUTH_SUCCESS) {
        return std::unexpected(ErrorInfo{ErrorKind::AuthFailed, std::format("SSH password authentication failed for {}", config_.username)});
    }
    return {};
}

void SshConnection::disconnect() {
    if (session_) {
        if (connected_) {
            ssh_disconnect(session_);
        }
        ssh_free(session_);
        session_ = nullptr;
    }
    connected_ = false;
}

std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> SshConnection::exec(const std::string& command) {
    if (!connected_) {
        return std::unexpected(ErrorInfo{ErrorKind::ConnectionFailed, "SSH session is not connected"});
    }
    ssh_channel channel = ssh_channel_new(session_);
    if (!channel) {
        return std::unexpected(ErrorInfo{ErrorKind::UnsupportedCapability, "Failed to create SSH channel"});
    }
    if (ssh_channel_open_session(channel) != SSH_OK) {
        ssh_channel_free(channel);
        return std::unexpected(ErrorInfo{ErrorKind::UnsupportedCapability, std::format("Failed to open SSH channel: {}", lastError())});
    }
    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        return std::unexpected(ErrorInfo{ErrorKind::UnsupportedCapability, std::format("Remote command execution refused: {}", lastError())});
    }
    return std::make_unique<SshCommand>(channel);
}

std::vector<std::string> SshConnection::compressionTypes() const {
    if (!compressionOffered_) {
        return {"none"};
    }
    std::vector<std::string> types;
    std::stringstream stream(kCompressionMethods);
    std::string method;
    while (std::getline(stream, method, ',')) {
        types.push_back(method);
    }
    return types;
}

SftpSession::SftpSession(const ConnectionConfig& config, const Logger& logger)
    : connection_(config, logger) {}

SftpSession::~SftpSession() {
    close();
}

std::expected<void, ErrorInfo> SftpSession::open(std::chrono::milliseconds timeout) {
    if (auto connected = connection_.connect(timeout); !connected) {
        return connected;
    }
    sftp_ = sftp_new(connection_.handle());
    if (!sftp_ || sftp_init(sftp_) != SSH_OK) {
        if (sftp_) {
            sftp_free(sftp_);
            sftp_ = nullptr;
        }
        connection_.disconnect();
        return std::unexpected(ErrorInfo{ErrorKind::HandshakeFailed, "SFTP initialization failed"});
    }
    return {};
}

void SftpSession::close() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    connection_.disconnect();
}

ErrorInfo SftpSession::sftpError(const std::string& operation, const std::string& path) const {
    int code = sftp_ ? sftp_get_error(sftp_) : SSH_FX_CONNECTION_LOST;
    switch (code) {
    case SSH_FX_PERMISSION_DENIED:
        return ErrorInfo{ErrorKind::PermissionDenied, std::format("{} {}: permission denied", operation, path)};
    case SSH_FX_NO_SUCH_FILE:
    case SSH_FX_NO_SUCH_PATH:
        return ErrorInfo{ErrorKind::IoError, std::format("{} {}: no such file or directory", operation, path)};
    case SSH_FX_CONNECTION_LOST:
    case SSH_FX_NO_CONNECTION:
        return ErrorInfo{ErrorKind::ConnectionFailed, std::format("{} {}: connection lost", operation, path)};
    default:
        return ErrorInfo{ErrorKind::IoError, std::format("{} {}: {}", operation, path, ssh_get_error(connection_.handle()))};
    }
}

std::expected<std::vector<RemoteEntry>, ErrorInfo> SftpSession::list(const std::string& path) {
    sftp_dir dir = sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        return std::unexpected(sftpError("list", path));
    }
    std::vector<RemoteEntry> entries;
    sftp_attributes attrs = nullptr;
    while ((attrs = sftp_readdir(sftp_, dir)) != nullptr) {
        RemoteEntry entry = entryFromAttributes(attrs);
        sftp_attributes_free(attrs);
        if (entry.name == "." || entry.name == "..") {
            continue;
        }
        entries.push_back(std::move(entry));
    }
    bool complete = sftp_dir_eof(dir) != 0;
    sftp_closedir(dir);
    if (!complete) {
        return std::unexpected(sftpError("list", path));
    }
    return entries;
}

std::expected<RemoteEntry, ErrorInfo> SftpSession::stat(const std::string& path) {
    sftp_attributes attrs = sftp_stat(sftp_, path.c_str());
    if (!attrs) {
        return std::unexpected(sftpError("stat", path));
    }
    RemoteEntry entry = entryFromAttributes(attrs);
    sftp_attributes_free(attrs);
    if (entry.name.empty()) {
        auto slash = path.find_last_of('/');
        entry.name = slash == std::string::npos ? path : path.substr(slash + 1);
    }
    return entry;
}

std::expected<std::uint64_t, ErrorInfo> SftpSession::download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) {
    sftp_file file = sftp_open(sftp_, path.c_str(), O_RDONLY, 0);
    if (!file) {
        return std::unexpected(sftpError("open", path));
    }
    if (offset > 0 && sftp_seek64(file, offset) < 0) {
        sftp_close(file);
        return std::unexpected(sftpError("seek", path));
    }

    std::vector<char> buf(kChunkSize);
    std::uint64_t total = 0;
    while (true) {
        ssize_t n = sftp_read(file, buf.data(), buf.size());
        if (n < 0) {
            sftp_close(file);
            return std::unexpected(sftpError("read", path));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::uint64_t>(n);
        if (!sink(buf.data(), static_cast<std::size_t>(n))) {
            sftp_close(file);
            return std::unexpected(ErrorInfo{ErrorKind::TransferFailed, std::format("Download of {} aborted", path)});
        }
    }
    sftp_close(file);
    return total;
}

std::expected<std::uint64_t, ErrorInfo> SftpSession::upload(const std::string& path, const ChunkSource& source, bool append) {
    int flags = O_WRONLY | O_CREAT | (append ? 0 : O_TRUNC);
    sftp_file file = sftp_open(sftp_, path.c_str(), flags, 0644);
    if (!file) {
        return std::unexpected(sftpError("create", path));
    }
    if (append) {
        sftp_attributes attrs = sftp_fstat(file);
        if (!attrs) {
            sftp_close(file);
            return std::unexpected(sftpError("stat", path));
        }
        std::uint64_t size = attrs->size;
        sftp_attributes_free(attrs);
        if (sftp_seek64(file, size) < 0) {
            sftp_close(file);
            return std::unexpected(sftpError("seek", path));
        }
    }

    std::vector<char> buf(kChunkSize);
    std::uint64_t total = 0;
    while (true) {
        std::size_t n = source(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        ssize_t written = sftp_write(file, buf.data(), n);
        if (written < 0 || static_cast<std::size_t>(written) != n) {
            sftp_close(file);
            return std::unexpected(sftpError("write", path));
        }
        total += n;
    }
    if (sftp_close(file) != SSH_OK) {
        return std::unexpected(sftpError("close", path));
    }
    return total;
}

std::expected<void, ErrorInfo> SftpSession::remove(const std::string& path) {
    if (sftp_unlink(sftp_, path.c_str()) != SSH_OK) {
        return std::unexpected(sftpError("remove", path));
    }
    return {};
}

std::expected<void, ErrorInfo> SftpSession::makeDirectory(const std::string& path) {
    if (sftp_mkdir(sftp_, path.c_str(), 0755) == SSH_OK) {
        return {};
    }
    ErrorInfo error = sftpError("mkdir", path);
    // Many servers answer SSH_FX_FAILURE for an existing directory.
    auto existing = stat(path);
    if (existing && existing->isDir) {
        return {};
    }
    return std::unexpected(error);
}

std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> SftpSession::openCommand(const std::string& command) {
    return connection_.exec(command);
}

void SftpSession::describeCapabilities(const std::string& /*rootPath*/, Capabilities& capabilities, std::vector<std::string>& badges) {
    int version = sftp_server_version(sftp_);
    capabilities.protocolVersion = std::format("SFTP v{}", version);
    badges.push_back(capabilities.protocolVersion);

    unsigned int extensionCount = sftp_extensions_get_count(sftp_);
    for (unsigned int i = 0; i < extensionCount; ++i) {
        if (const char* name = sftp_extensions_get_name(sftp_, i)) {
            capabilities.protocolExtensions.emplace_back(name);
        }
    }

    auto echo = runCommand("echo test");
    if (echo && echo->exitStatus == 0 && echo->output.starts_with("test")) {
        capabilities.shellAvailable = true;
        badges.emplace_back("Shell Available");
    }

    capabilities.compressionTypes = connection_.compressionTypes();
    if (capabilities.compressionTypes.size() > 1) {
        badges.emplace_back("Compression");
    }
    capabilities.passiveListing = capabilities.canList;
}

std::optional<RemoteEntry> parseFindLine(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        std::size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            return std::nullopt;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    fields.push_back(line.substr(start));
    if (fields[0].empty() || fields[4].empty()) {
        return std::nullopt;
    }

    RemoteEntry entry;
    entry.isDir = fields[0] == "d";
    entry.isSymlink = fields[0] == "l";
    try {
        entry.size = std::stoull(fields[1]);
        entry.mtime = static_cast<std::int64_t>(std::stod(fields[2]));
        entry.permissions = static_cast<std::uint32_t>(std::stoul(fields[3], nullptr, 8));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    entry.name = fields[4];
    return entry;
}

ScpSession::ScpSession(const ConnectionConfig& config, const Logger& logger)
    : connection_(config, logger) {}

ScpSession::~ScpSession() {
    close();
}

std::expected<void, ErrorInfo> ScpSession::open(std::chrono::milliseconds timeout) {
    return connection_.connect(timeout);
}

void ScpSession::close() {
    connection_.disconnect();
}

std::expected<void, ErrorInfo> ScpSession::runChecked(const std::string& command, const std::string& action) {
    auto output = runCommand(command);
    if (!output) {
        return std::unexpected(output.error());
    }
    if (output->exitStatus != 0) {
        return std::unexpected(classifyShellError(output->errorOutput, action));
    }
    return {};
}

std::expected<std::vector<RemoteEntry>, ErrorInfo> ScpSession::list(const std::string& path) {
    auto output = runCommand(std::format("find {} -mindepth 1 -maxdepth 1 -printf '%y\\t%s\\t%T@\\t%m\\t%f\\n'", shellQuote(path)));
    if (!output) {
        return std::unexpected(output.error());
    }
    if (output->exitStatus != 0) {
        return std::unexpected(classifyShellError(output->errorOutput, std::format("list {}", path)));
    }
    std::vector<RemoteEntry> entries;
    std::istringstream lines(output->output);
    std::string line;
    while (std::getline(lines, line)) {
        if (auto entry = parseFindLine(line)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

std::expected<RemoteEntry, ErrorInfo> ScpSession::stat(const std::string& path) {
    auto output = runCommand(std::format("find -L {} -maxdepth 0 -printf '%y\\t%s\\t%T@\\t%m\\t%f\\n'", shellQuote(path)));
    if (!output) {
        return std::unexpected(output.error());
    }
    if (output->exitStatus != 0) {
        return std::unexpected(classifyShellError(output->errorOutput, std::format("stat {}", path)));
    }
    std::string line = output->output.substr(0, output->output.find('\n'));
    auto entry = parseFindLine(line);
    if (!entry) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("stat {}: unexpected output", path)});
    }
    return *entry;
}

std::expected<std::uint64_t, ErrorInfo> ScpSession::download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) {
    ssh_session session = connection_.handle();
    ssh_scp scp = ssh_scp_new(session, SSH_SCP_READ, path.c_str());
    if (!scp) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Failed to create SCP session: {}", ssh_get_error(session))});
    }
    auto fail = [&](ErrorKind kind, const std::string& what) {
        std::string error = std::format("{} {}: {}", what, path, ssh_get_error(session));
        ssh_scp_close(scp);
        ssh_scp_free(scp);
        if (contains(error, "Permission denied")) {
            kind = ErrorKind::PermissionDenied;
        }
        return std::unexpected(ErrorInfo{kind, error});
    };

    if (ssh_scp_init(scp) != SSH_OK) {
        return fail(ErrorKind::IoError, "SCP init for");
    }
    if (ssh_scp_pull_request(scp) != SSH_SCP_REQUEST_NEWFILE) {
        return fail(ErrorKind::IoError, "SCP request for");
    }
    std::uint64_t size = ssh_scp_request_get_size64(scp);
    if (ssh_scp_accept_request(scp) != SSH_OK) {
        return fail(ErrorKind::IoError, "SCP accept for");
    }

    std::vector<char> buf(kChunkSize);
    std::uint64_t received = 0;
    std::uint64_t delivered = 0;
    while (received < size) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), size - received));
        int n = ssh_scp_read(scp, buf.data(), want);
        if (n == SSH_ERROR || n == 0) {
            return fail(ErrorKind::TransferFailed, "SCP read of");
        }
        std::uint64_t chunkStart = received;
        received += static_cast<std::uint64_t>(n);
        if (received <= offset) {
            continue;
        }
        std::size_t skip = chunkStart < offset ? static_cast<std::size_t>(offset - chunkStart) : 0;
        std::size_t count = static_cast<std::size_t>(n) - skip;
        delivered += count;
        if (!sink(buf.data() + skip, count)) {
            ssh_scp_close(scp);
            ssh_scp_free(scp);
            return std::unexpected(ErrorInfo{ErrorKind::TransferFailed, std::format("Download of {} aborted", path)});
        }
    }
    ssh_scp_close(scp);
    ssh_scp_free(scp);
    return delivered;
}

std::expected<std::uint64_t, ErrorInfo> ScpSession::upload(const std::string& path, const ChunkSource& source, bool append) {
    auto command = connection_.exec(std::format("cat {} {}", append ? ">>" : ">", shellQuote(path)));
    if (!command) {
        return std::unexpected(command.error());
    }
    std::vector<char> buf(kChunkSize);
    std::uint64_t total = 0;
    while (true) {
        std::size_t n = source(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        if (auto written = (*command)->write(buf.data(), n); !written) {
            return std::unexpected(written.error());
        }
        total += n;
    }
    (*command)->closeInput();
    if ((*command)->wait() != 0) {
        return std::unexpected(classifyShellError((*command)->errorOutput(), std::format("write {}", path)));
    }
    return total;
}

std::expected<void, ErrorInfo> ScpSession::remove(const std::string& path) {
    return runChecked(std::format("rm -f -- {}", shellQuote(path)), std::format("remove {}", path));
}

std::expected<void, ErrorInfo> ScpSession::makeDirectory(const std::string& path) {
    return runChecked(std::format("mkdir -p -- {}", shellQuote(path)), std::format("mkdir {}", path));
}

std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> ScpSession::openCommand(const std::string& command) {
    return connection_.exec(command);
}

void ScpSession::describeCapabilities(const std::string& /*rootPath*/, Capabilities& capabilities, std::vector<std::string>& badges) {
    capabilities.protocolVersion = "SCP";
    auto echo = runCommand("echo test");
    if (echo && echo->exitStatus == 0 && echo->output.starts_with("test")) {
        capabilities.shellAvailable = true;
        badges.emplace_back("Shell Available");
    }
    capabilities.compressionTypes = connection_.compressionTypes();
    if (capabilities.compressionTypes.size() > 1) {
        badges.emplace_back("Compression");
    }
    capabilities.passiveListing = capabilities.canList;
}
