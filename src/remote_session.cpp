#include "remote_session.hpp"
#include "ssh_session.hpp"
#include "ftp_session.hpp"
#include <cstring>
#include <format>

std::expected<std::unique_ptr<RemoteCommand>, ErrorInfo> RemoteSession::openCommand(const std::string& /*command*/) {
    return std::unexpected(ErrorInfo{ErrorKind::UnsupportedCapability,
        std::format("{} does not provide a remote shell", protocolName(protocol()))});
}

std::expected<CommandOutput, ErrorInfo> RemoteSession::runCommand(const std::string& command) {
    auto opened = openCommand(command);
    if (!opened) {
        return std::unexpected(opened.error());
    }
    auto& running = *opened;
    running->closeInput();

    CommandOutput result;
    char buf[8192];
    while (true) {
        auto count = running->read(buf, sizeof(buf));
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            break;
        }
        result.output.append(buf, *count);
    }
    result.exitStatus = running->wait();
    result.errorOutput = running->errorOutput();
    return result;
}

std::expected<std::string, ErrorInfo> RemoteSession::readFile(const std::string& path, std::size_t maxBytes) {
    std::string content;
    auto downloaded = download(path, 0, [&content, maxBytes](const char* data, std::size_t size) {
        std::size_t room = maxBytes - content.size();
        content.append(data, std::min(size, room));
        return content.size() < maxBytes;
    });
    if (!downloaded && content.size() < maxBytes) {
        return std::unexpected(downloaded.error());
    }
    return content;
}

std::expected<void, ErrorInfo> RemoteSession::writeFile(const std::string& path, const std::string& content) {
    std::size_t position = 0;
    auto uploaded = upload(path, [&content, &position](char* buffer, std::size_t capacity) {
        std::size_t count = std::min(capacity, content.size() - position);
        std::memcpy(buffer, content.data() + position, count);
        position += count;
        return count;
    }, false);
    if (!uploaded) {
        return std::unexpected(uploaded.error());
    }
    return {};
}

std::expected<void, ErrorInfo> RemoteSession::makeDirectories(const std::string& path) {
    std::string current;
    std::size_t start = 0;
    while (start < path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            current += "/" + path.substr(start, end - start);
            if (auto made = makeDirectory(current); !made) {
                return made;
            }
        }
        start = end + 1;
    }
    return {};
}

std::unique_ptr<RemoteSession> makeRemoteSession(const ConnectionConfig& config, const Logger& logger) {
    switch (config.protocol) {
    case Protocol::Sftp: return std::make_unique<SftpSession>(config, logger);
    case Protocol::Scp: return std::make_unique<ScpSession>(config, logger);
    case Protocol::Ftp: return std::make_unique<FtpSession>(config, logger);
    case Protocol::Ftps: return std::make_unique<FtpsSession>(config, logger);
    }
    return nullptr;
}

SessionFactory defaultSessionFactory(const Logger& logger) {
    return [&logger](const ConnectionConfig& config) {
        return makeRemoteSession(config, logger);
    };
}

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return "/" + name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

std::string shellQuote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
