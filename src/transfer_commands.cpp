#include "transfer_commands.hpp"
#include "remote_session.hpp"
#include <cmath>
#include <format>

namespace {

std::string trailingSlash(const std::string& path) {
    return path.ends_with('/') ? path : path + "/";
}

std::string sshOptions(const ConnectionConfig& remote) {
    return std::format("ssh -p {} -o StrictHostKeyChecking=accept-new", remote.port);
}

// sshpass reads the password from SSHPASS so it never shows in the process list.
std::string passwordPrefix(const ConnectionConfig& remote, const CommandOptions& options) {
    if (remote.password.empty()) {
        return {};
    }
    return std::format("SSHPASS={} sshpass -e ", options.revealSecrets ? shellQuote(remote.password) : std::string("'******'"));
}

std::string remoteSpec(const ConnectionConfig& remote, const std::string& path) {
    return shellQuote(std::format("{}@{}:{}", remote.username, remote.host, path));
}

} // namespace

std::string rsyncCommand(const ConnectionConfig& source, const ConnectionConfig& dest, const CommandOptions& options) {
    std::string command = passwordPrefix(dest, options);
    command += std::format("rsync -az --partial --info=progress2 -e {}", shellQuote(sshOptions(dest)));
    if (options.bandwidthLimitMiB > 0) {
        command += std::format(" --bwlimit={}", static_cast<long long>(std::llround(options.bandwidthLimitMiB * 1024)));
    }
    if (options.dryRun) {
        command += " --dry-run";
    }
    for (const auto& pattern : options.exclusions) {
        command += " --exclude=" + shellQuote(pattern);
    }
    command += " " + shellQuote(trailingSlash(source.rootPath));
    command += " " + remoteSpec(dest, trailingSlash(dest.rootPath));
    return command;
}

std::string peerToPeerCommand(const ConnectionConfig& source, const ConnectionConfig& dest, const CommandOptions& options) {
    std::string command = std::format("mkdir -p {} && ", shellQuote(dest.rootPath));
    if (options.dryRun) {
        return command + std::format("echo {}", shellQuote(std::format("would copy {} to {}", endpointUrl(source), dest.rootPath)));
    }
    command += passwordPrefix(source, options);
    std::string limit;
    if (options.bandwidthLimitMiB > 0) {
        limit = std::format(" -l {}", static_cast<long long>(std::llround(options.bandwidthLimitMiB * 8192)));
    }
    if (source.protocol == Protocol::Sftp) {
        command += std::format("sftp -r -a -P {} -o StrictHostKeyChecking=accept-new{} {} {}", source.port, limit,
                               remoteSpec(source, trailingSlash(source.rootPath) + "."), shellQuote(trailingSlash(dest.rootPath)));
    } else {
        command += std::format("scp -r -p -P {} -o StrictHostKeyChecking=accept-new{} {} {}", source.port, limit,
                               remoteSpec(source, trailingSlash(source.rootPath) + "."), shellQuote(trailingSlash(dest.rootPath)));
    }
    return command;
}

std::string archiveCreateCommand(const std::string& rootPath) {
    return std::format("tar czf - -C {} .", shellQuote(rootPath));
}

std::string archiveExtractCommand(const std::string& rootPath) {
    return std::format("mkdir -p {0} && tar xzf - -C {0}", shellQuote(rootPath));
}

std::string sshWrap(const ConnectionConfig& config, const std::string& command) {
    return std::format("ssh -p {} {}@{} {}", config.port, config.username, config.host, shellQuote(command));
}

std::string endpointUrl(const ConnectionConfig& config) {
    return std::format("{}://{}@{}:{}{}", protocolName(config.protocol), config.username, config.host, config.port, config.rootPath);
}
