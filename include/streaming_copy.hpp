/**
 * @file streaming_copy.hpp
 * @brief Client-side file-by-file copy, over one or several connection pairs.
 *
 * Each file is downloaded into a temporary spool file and uploaded from it.
 * With resume enabled, a destination file shorter than the source is completed
 * from its current size instead of being copied again.
 */

#ifndef STREAMING_COPY_HPP
#define STREAMING_COPY_HPP

#include "transfer.hpp"

/**
 * @brief Executor for streaming-copy (one pair) and multi-connection-client (N pairs).
 */
class StreamingCopyExecutor : public TransferExecutor {
public:
    /**
     * @param connections Number of source/destination session pairs working in parallel.
     */
    StreamingCopyExecutor(const AppConfig& config, const Logger& logger, SessionFactory factory, int connections);

    TransferResult execute(const TransferStrategy& strategy,
                           const ConnectionConfig& source,
                           const ConnectionConfig& dest,
                           const TransferOptions& options,
                           const TransferControl& control) override;

private:
    std::unique_ptr<RemoteSession> connect(const ConnectionConfig& config, ErrorInfo& error) const;

    const AppConfig& config_;
    const Logger& logger_;
    SessionFactory factory_;
    TreeScanner scanner_;
    int connections_;
};

#endif // STREAMING_COPY_HPP
