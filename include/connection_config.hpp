/**
 * @file connection_config.hpp
 * @brief Remote endpoint description and its validation rules.
 *
 * A ConnectionConfig names one side of a migration: protocol, address,
 * credentials and the root path of the tree to move. It is validated before any
 * network I/O takes place.
 */

#ifndef CONNECTION_CONFIG_HPP
#define CONNECTION_CONFIG_HPP

#include <string>
#include <string_view>
#include <optional>
#include <expected>
#include <json/json.h>
#include "errors.hpp"

/**
 * @brief File-transfer protocols SiteMover can talk to.
 */
enum class Protocol {
    Sftp,
    Ftp,
    Ftps,
    Scp
};

/**
 * @brief Returns the lower-case protocol name ("sftp", "ftp", "ftps", "scp").
 */
std::string_view protocolName(Protocol protocol);

/**
 * @brief Parses a protocol name. Matching is case-insensitive.
 *
 * @return The protocol, or std::nullopt for an unknown name.
 */
std::optional<Protocol> parseProtocol(std::string_view name);

/**
 * @brief Returns the IANA default port of a protocol (22 or 21).
 */
int defaultPort(Protocol protocol);

/**
 * @brief True for protocols carried over SSH (SFTP and SCP).
 */
bool isSshFamily(Protocol protocol);

/**
 * @brief Connection settings for one remote endpoint.
 *
 * Either password or sshKey may be set. sshKey holds a private key file path or
 * inline PEM text. With neither set, SSH sessions fall back to agent/default keys.
 */
struct ConnectionConfig {
    Protocol protocol = Protocol::Sftp;
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
    std::string sshKey;
    std::string rootPath;
};

/**
 * @brief Validates a connection configuration.
 *
 * Checks host (non-empty, at most 255 characters, no control characters), port
 * range, username and root path (absolute, no "..", no control characters, at
 * most 4096 characters).
 *
 * @param config Configuration to check.
 * @return std::expected<void, ErrorInfo> Success or a validation_error naming the field.
 */
std::expected<void, ErrorInfo> validateConnectionConfig(const ConnectionConfig& config);

/**
 * @brief Validates a remote path (absolute, no traversal, no control characters).
 *
 * @param path Path to check.
 * @param field Field name used in the error message.
 */
std::expected<void, ErrorInfo> validateRemotePath(const std::string& path, std::string_view field = "root_path");

/**
 * @brief Builds a configuration from JSON and validates it.
 *
 * Recognized keys: protocol, host, port, username, password, ssh_key, root_path.
 * The port defaults to the protocol's default port.
 */
std::expected<ConnectionConfig, ErrorInfo> connectionConfigFromJson(const Json::Value& json);

/**
 * @brief Loads and validates a configuration from a JSON file.
 */
std::expected<ConnectionConfig, ErrorInfo> loadConnectionConfig(const std::string& file);

/**
 * @brief Returns "proto://user@host:port/root" for log lines. Never includes credentials.
 */
std::string describeEndpoint(const ConnectionConfig& config);

#endif // CONNECTION_CONFIG_HPP
