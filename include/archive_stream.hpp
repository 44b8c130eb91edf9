/**
 * @file archive_stream.hpp
 * @brief tar.gz streaming between two remote shells, re-packed through libarchive.
 *
 * The source shell runs tar and writes a gzip-compressed archive to its stdout.
 * Each entry is read with libarchive, dropped if an exclusion matches it, and
 * written into a new tar.gz stream piped into tar on the destination shell.
 *
 * @note Requires libarchive and shell access on both servers.
 */

#ifndef ARCHIVE_STREAM_HPP
#define ARCHIVE_STREAM_HPP

#include "transfer.hpp"

/**
 * @brief Executor for archive-stream.
 */
class ArchiveStreamExecutor : public TransferExecutor {
public:
    ArchiveStreamExecutor(const AppConfig& config, const Logger& logger, SessionFactory factory);

    /**
     * @brief Streams the source tree into the destination.
     *
     * Not resumable: an interrupted stream leaves a partially extracted tree.
     */
    TransferResult execute(const TransferStrategy& strategy,
                           const ConnectionConfig& source,
                           const ConnectionConfig& dest,
                           const TransferOptions& options,
                           const TransferControl& control) override;

private:
    const AppConfig& config_;
    const Logger& logger_;
    SessionFactory factory_;
    TreeScanner scanner_;
};

#endif // ARCHIVE_STREAM_HPP
