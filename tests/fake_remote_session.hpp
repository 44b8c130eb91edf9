/**
 * @file fake_remote_session.hpp
 * @brief In-memory RemoteSession used by the tests.
 *
 * A FakeFileSystem holds one server's tree and is shared by every session the
 * factory opens against that host, so multi-connection copies see the same data.
 */

#ifndef FAKE_REMOTE_SESSION_HPP
#define FAKE_REMOTE_SESSION_HPP

#include <algorithm>
#include <cstring>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "probe.hpp"
#include "remote_session.hpp"

struct FakeNode {
    enum class Kind { Dir, File, Symlink };
    Kind kind = Kind::Dir;
    std::string content;
    std::string target;
};

class FakeFileSystem {
public:
    FakeFileSystem() { nodes_["/"] = FakeNode{}; }

    void addDir(const std::string& path) {
        std::lock_guard lock(mutex_);
        addDirLocked(path);
    }

    void addFile(const std::string& path, const std::string& content) {
        std::lock_guard lock(mutex_);
        addDirLocked(parentOf(path));
        nodes_[path] = FakeNode{FakeNode::Kind::File, content, {}};
    }

    void addSymlink(const std::string& path, const std::string& target) {
        std::lock_guard lock(mutex_);
        addDirLocked(parentOf(path));
        nodes_[path] = FakeNode{FakeNode::Kind::Symlink, {}, target};
    }

    bool exists(const std::string& path) const {
        std::lock_guard lock(mutex_);
        return nodes_.contains(path);
    }

    std::optional<std::string> content(const std::string& path) const {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end() || it->second.kind != FakeNode::Kind::File) {
            return std::nullopt;
        }
        return it->second.content;
    }

    /// Paths of every node whose base name starts with prefix.
    std::vector<std::string> findByPrefix(const std::string& prefix) const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> found;
        for (const auto& [path, node] : nodes_) {
            if (baseName(path).starts_with(prefix)) {
                found.push_back(path);
            }
        }
        return found;
    }

    static std::string parentOf(const std::string& path) {
        auto slash = path.find_last_of('/');
        if (slash == std::string::npos || slash == 0) {
            return "/";
        }
        return path.substr(0, slash);
    }

    static std::string baseName(const std::string& path) {
        auto slash = path.find_last_of('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    static std::string normalize(const std::string& path) {
        std::string normalized = path;
        while (normalized.size() > 1 && normalized.back() == '/') {
            normalized.pop_back();
        }
        return normalized;
    }

    // Failure injection.
    std::set<std::string> unlistable;
    std::optional<ErrorInfo> openError;
    bool readOnly = false;
    bool shellAvailable = false;

    int created = 0;
    int opened = 0;
    int closed = 0;

private:
    friend class FakeRemoteSession;

    void addDirLocked(const std::string& path) {
        std::string normalized = normalize(path);
        if (normalized == "/" || nodes_.contains(normalized)) {
            return;
        }
        addDirLocked(parentOf(normalized));
        nodes_[normalized] = FakeNode{};
    }

    // Follows symlinks; returns the resolved path or nullopt when dangling.
    std::optional<std::string> resolveLocked(const std::string& path) const {
        std::string current = normalize(path);
        for (int hop = 0; hop < 8; ++hop) {
            auto it = nodes_.find(current);
            if (it == nodes_.end()) {
                return std::nullopt;
            }
            if (it->second.kind != FakeNode::Kind::Symlink) {
                return current;
            }
            current = normalize(it->second.target);
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::map<std::string, FakeNode> nodes_;
};

class FakeRemoteSession : public RemoteSession {
public:
    FakeRemoteSession(Protocol protocol, std::shared_ptr<FakeFileSystem> fs)
        : protocol_(protocol), fs_(std::move(fs)) {}

    ~FakeRemoteSession() override { close(); }

    Protocol protocol() const override { return protocol_; }

    std::expected<void, ErrorInfo> open(std::chrono::milliseconds /*timeout*/) override {
        std::lock_guard lock(fs_->mutex_);
        if (fs_->openError) {
            return std::unexpected(*fs_->openError);
        }
        ++fs_->opened;
        open_ = true;
        return {};
    }

    void close() override {
        std::lock_guard lock(fs_->mutex_);
        if (open_) {
            ++fs_->closed;
            open_ = false;
        }
    }

    std::expected<std::vector<RemoteEntry>, ErrorInfo> list(const std::string& path) override {
        std::lock_guard lock(fs_->mutex_);
        std::string normalized = FakeFileSystem::normalize(path);
        if (fs_->unlistable.contains(normalized)) {
            return std::unexpected(ErrorInfo{ErrorKind::PermissionDenied, std::format("list {}: permission denied", path)});
        }
        auto resolved = fs_->resolveLocked(normalized);
        if (!resolved || fs_->nodes_.at(*resolved).kind != FakeNode::Kind::Dir) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("list {}: not a directory", path)});
        }
        std::vector<RemoteEntry> entries;
        for (const auto& [child, node] : fs_->nodes_) {
            if (child == *resolved || FakeFileSystem::parentOf(child) != *resolved) {
                continue;
            }
            RemoteEntry entry;
            entry.name = FakeFileSystem::baseName(child);
            entry.isDir = node.kind == FakeNode::Kind::Dir;
            entry.isSymlink = node.kind == FakeNode::Kind::Symlink;
            entry.size = node.kind == FakeNode::Kind::File ? node.content.size() : 0;
            entry.permissions = entry.isDir ? 0755 : 0644;
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::expected<RemoteEntry, ErrorInfo> stat(const std::string& path) override {
        std::lock_guard lock(fs_->mutex_);
        auto resolved = fs_->resolveLocked(path);
        if (!resolved) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("stat {}: no such file or directory", path)});
        }
        const FakeNode& node = fs_->nodes_.at(*resolved);
        RemoteEntry entry;
        entry.name = FakeFileSystem::baseName(path);
        entry.isDir = node.kind == FakeNode::Kind::Dir;
        entry.size = node.content.size();
        return entry;
    }

    std::expected<std::uint64_t, ErrorInfo> download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) override {
        std::string data;
        {
            std::lock_guard lock(fs_->mutex_);
            auto resolved = fs_->resolveLocked(path);
            if (!resolved || fs_->nodes_.at(*resolved).kind != FakeNode::Kind::File) {
                return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("download {}: no such file", path)});
            }
            const std::string& content = fs_->nodes_.at(*resolved).content;
            data = offset < content.size() ? content.substr(offset) : std::string();
        }
        std::uint64_t delivered = 0;
        constexpr std::size_t chunk = 4096;
        for (std::size_t position = 0; position < data.size(); position += chunk) {
            std::size_t size = std::min(chunk, data.size() - position);
            if (!sink(data.data() + position, size)) {
                return std::unexpected(ErrorInfo{ErrorKind::TransferFailed, std::format("download {}: aborted", path)});
            }
            delivered += size;
        }
        return delivered;
    }

    std::expected<std::uint64_t, ErrorInfo> upload(const std::string& path, const ChunkSource& source, bool append) override {
        std::string data;
        char buffer[4096];
        while (std::size_t count = source(buffer, sizeof(buffer))) {
            data.append(buffer, count);
        }
        std::lock_guard lock(fs_->mutex_);
        if (fs_->readOnly) {
            return std::unexpected(ErrorInfo{ErrorKind::PermissionDenied, std::format("upload {}: permission denied", path)});
        }
        auto parent = fs_->nodes_.find(FakeFileSystem::parentOf(path));
        if (parent == fs_->nodes_.end() || parent->second.kind != FakeNode::Kind::Dir) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("upload {}: parent directory missing", path)});
        }
        FakeNode& node = fs_->nodes_[path];
        node.kind = FakeNode::Kind::File;
        if (append) {
            node.content += data;
        } else {
            node.content = data;
        }
        return data.size();
    }

    std::expected<void, ErrorInfo> remove(const std::string& path) override {
        std::lock_guard lock(fs_->mutex_);
        if (fs_->readOnly) {
            return std::unexpected(ErrorInfo{ErrorKind::PermissionDenied, std::format("remove {}: permission denied", path)});
        }
        if (fs_->nodes_.erase(path) == 0) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("remove {}: no such file", path)});
        }
        return {};
    }

    std::expected<void, ErrorInfo> makeDirectory(const std::string& path) override {
        std::lock_guard lock(fs_->mutex_);
        std::string normalized = FakeFileSystem::normalize(path);
        auto existing = fs_->nodes_.find(normalized);
        if (existing != fs_->nodes_.end() && existing->second.kind == FakeNode::Kind::Dir) {
            return {};
        }
        if (fs_->readOnly) {
            return std::unexpected(ErrorInfo{ErrorKind::PermissionDenied, std::format("mkdir {}: permission denied", path)});
        }
        if (!fs_->nodes_.contains(FakeFileSystem::parentOf(normalized))) {
            return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("mkdir {}: parent directory missing", path)});
        }
        fs_->nodes_[normalized] = FakeNode{};
        return {};
    }

    void describeCapabilities(const std::string& /*rootPath*/, Capabilities& capabilities, std::vector<std::string>& badges) override {
        capabilities.shellAvailable = fs_->shellAvailable;
        capabilities.passiveListing = capabilities.canList;
        capabilities.protocolVersion = "fake";
        if (fs_->shellAvailable) {
            badges.emplace_back("Shell OK");
        }
    }

private:
    Protocol protocol_;
    std::shared_ptr<FakeFileSystem> fs_;
    bool open_ = false;
};

/**
 * @brief Factory serving one fake filesystem per host; unknown hosts get no session.
 */
inline SessionFactory fakeFactory(std::map<std::string, std::shared_ptr<FakeFileSystem>> hosts) {
    return [hosts = std::move(hosts)](const ConnectionConfig& config) -> std::unique_ptr<RemoteSession> {
        auto it = hosts.find(config.host);
        if (it == hosts.end()) {
            return nullptr;
        }
        ++it->second->created;
        return std::make_unique<FakeRemoteSession>(config.protocol, it->second);
    };
}

inline SessionFactory fakeFactory(const std::shared_ptr<FakeFileSystem>& fs) {
    return [fs](const ConnectionConfig& config) -> std::unique_ptr<RemoteSession> {
        ++fs->created;
        return std::make_unique<FakeRemoteSession>(config.protocol, fs);
    };
}

inline ConnectionConfig fakeEndpoint(const std::string& host, const std::string& rootPath, Protocol protocol = Protocol::Sftp) {
    ConnectionConfig config;
    config.protocol = protocol;
    config.host = host;
    config.port = defaultPort(protocol);
    config.username = "deploy";
    config.password = "secret";
    config.rootPath = rootPath;
    return config;
}

#endif // FAKE_REMOTE_SESSION_HPP
