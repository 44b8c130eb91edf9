/**
 * @file transfer_commands.hpp
 * @brief Shell command lines for the shell-based transfer methods.
 *
 * The planner shows these commands to the user; the executors run the inner
 * forms on the remote shells. Secrets never appear in a display form.
 */

#ifndef TRANSFER_COMMANDS_HPP
#define TRANSFER_COMMANDS_HPP

#include <string>
#include <vector>
#include "connection_config.hpp"

/**
 * @brief Knobs shared by the generated commands.
 */
struct CommandOptions {
    std::vector<std::string> exclusions;  ///< Enabled exclusion patterns.
    double bandwidthLimitMiB = 0;         ///< 0 = unlimited.
    bool dryRun = false;
    bool revealSecrets = false;           ///< Embed passwords (execution form only).
};

/**
 * @brief rsync push run on the source shell towards the destination.
 */
std::string rsyncCommand(const ConnectionConfig& source, const ConnectionConfig& dest, const CommandOptions& options);

/**
 * @brief Pull run on the destination shell from the source (sftp -a for SFTP, scp otherwise).
 */
std::string peerToPeerCommand(const ConnectionConfig& source, const ConnectionConfig& dest, const CommandOptions& options);

/**
 * @brief Produces a gzip-compressed tar stream of rootPath on stdout.
 */
std::string archiveCreateCommand(const std::string& rootPath);

/**
 * @brief Extracts a gzip-compressed tar stream from stdin into rootPath.
 */
std::string archiveExtractCommand(const std::string& rootPath);

/**
 * @brief Wraps a command in an ssh invocation for display.
 */
std::string sshWrap(const ConnectionConfig& config, const std::string& command);

/**
 * @brief Returns "proto://user@host:port/root".
 */
std::string endpointUrl(const ConnectionConfig& config);

#endif // TRANSFER_COMMANDS_HPP
