#include "connection_config.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

namespace {

bool hasControlCharacter(std::string_view text) {
    return std::ranges::any_of(text, [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 0x20 || uc == 0x7F;
    });
}

bool isBlank(std::string_view text) {
    return std::ranges::all_of(text, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::unexpected<ErrorInfo> invalid(std::string_view field, std::string message) {
    return std::unexpected(ErrorInfo{ErrorKind::ValidationError, std::format("{}: {}", field, message)});
}

} // namespace

std::string_view protocolName(Protocol protocol) {
    switch (protocol) {
    case Protocol::Sftp: return "sftp";
    case Protocol::Ftp: return "ftp";
    case Protocol::Ftps: return "ftps";
    case Protocol::Scp: return "scp";
    }
    return "unknown";
}

std::optional<Protocol> parseProtocol(std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sftp") return Protocol::Sftp;
    if (lower == "ftp") return Protocol::Ftp;
    if (lower == "ftps") return Protocol::Ftps;
    if (lower == "scp") return Protocol::Scp;
    return std::nullopt;
}

int defaultPort(Protocol protocol) {
    return isSshFamily(protocol) ? 22 : 21;
}

bool isSshFamily(Protocol protocol) {
    return protocol == Protocol::Sftp || protocol == Protocol::Scp;
}

std::expected<void, ErrorInfo> validateRemotePath(const std::string& path, std::string_view field) {
    if (path.empty() || isBlank(path)) {
        return invalid(field, "path is required");
    }
    if (path.find('\0') != std::string::npos) {
        return invalid(field, "path contains invalid null byte");
    }
    if (path.find("..") != std::string::npos) {
        return invalid(field, "path cannot contain '..' (path traversal)");
    }
    if (path.front() != '/') {
        return invalid(field, "path must be absolute (start with /)");
    }
    if (path.size() > 4096) {
        return invalid(field, "path exceeds maximum length of 4096 characters");
    }
    if (hasControlCharacter(path)) {
        return invalid(field, "path contains invalid control characters");
    }
    return {};
}

std::expected<void, ErrorInfo> validateConnectionConfig(const ConnectionConfig& config) {
    if (config.host.empty() || isBlank(config.host)) {
        return invalid("host", "host is required");
    }
    if (config.host.size() > 255) {
        return invalid("host", "host exceeds maximum length of 255 characters");
    }
    if (hasControlCharacter(config.host) || config.host.find('\0') != std::string::npos) {
        return invalid("host", "host contains invalid control characters");
    }
    if (config.host.find_first_of(" /@") != std::string::npos) {
        return invalid("host", std::format("invalid host '{}'", config.host));
    }
    if (config.port < 1 || config.port > 65535) {
        return invalid("port", std::format("port must be between 1 and 65535, got {}", config.port));
    }
    if (config.username.empty() || isBlank(config.username)) {
        return invalid("username", "username is required");
    }
    if (hasControlCharacter(config.username)) {
        return invalid("username", "username contains invalid control characters");
    }
    return validateRemotePath(config.rootPath, "root_path");
}

std::expected<ConnectionConfig, ErrorInfo> connectionConfigFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        return invalid("config", "configuration must be a JSON object");
    }
    // Absent and null fields read as empty; any other non-string is rejected.
    std::string badField;
    auto text = [&json, &badField](const char* key) {
        const Json::Value& value = json[key];
        if (value.isNull()) {
            return std::string();
        }
        if (!value.isString()) {
            if (badField.empty()) {
                badField = key;
            }
            return std::string();
        }
        return value.asString();
    };

    std::string protocolText = text("protocol");
    if (!badField.empty()) {
        return invalid("protocol", "protocol must be a string");
    }
    auto protocol = parseProtocol(protocolText);
    if (!protocol) {
        return invalid("protocol", std::format("invalid protocol '{}'", protocolText));
    }

    ConnectionConfig config;
    config.protocol = *protocol;
    config.host = text("host");
    config.username = text("username");
    config.password = text("password");
    config.sshKey = text("ssh_key");
    config.rootPath = text("root_path");
    if (!badField.empty()) {
        return invalid(badField, std::format("{} must be a string", badField));
    }

    const Json::Value& port = json["port"];
    if (port.isNull()) {
        config.port = defaultPort(*protocol);
    } else if (!port.isInt()) {
        return invalid("port", "port must be an integer between 1 and 65535");
    } else {
        config.port = port.asInt();
    }

    if (auto valid = validateConnectionConfig(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<ConnectionConfig, ErrorInfo> loadConnectionConfig(const std::string& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("Failed to open connection file: {}", file)});
    }
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(input, json)) {
        return std::unexpected(ErrorInfo{ErrorKind::ValidationError, std::format("Failed to parse connection file: {}", file)});
    }
    return connectionConfigFromJson(json);
}

std::string describeEndpoint(const ConnectionConfig& config) {
    return std::format("{}://{}@{}:{}{}", protocolName(config.protocol), config.username, config.host, config.port, config.rootPath);
}
