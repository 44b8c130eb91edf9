/**
 * @file remote_shell_transfer.hpp
 * @brief Transfers run entirely by one of the servers (rsync push, peer-to-peer pull).
 */

#ifndef REMOTE_SHELL_TRANSFER_HPP
#define REMOTE_SHELL_TRANSFER_HPP

#include <optional>
#include <string>
#include "transfer.hpp"

/**
 * @brief One rsync --info=progress2 status line.
 */
struct RsyncProgress {
    std::uint64_t bytes = 0;
    int percent = 0;
    double bytesPerSecond = 0;
    std::uint64_t filesTransferred = 0;  ///< xfr#, 0 when absent.
    std::uint64_t filesRemaining = 0;    ///< to-chk numerator.
    std::uint64_t filesTotal = 0;        ///< to-chk denominator.
};

/**
 * @brief Parses a progress2 line such as "1,234,567  45%  1.23MB/s  0:00:12 (xfr#3, to-chk=7/20)".
 */
std::optional<RsyncProgress> parseRsyncProgress(const std::string& line);

/**
 * @brief Executor for rsync-over-ssh (run on the source shell) and peer-to-peer-copy (run on the destination shell).
 */
class RemoteShellExecutor : public TransferExecutor {
public:
    RemoteShellExecutor(const AppConfig& config, const Logger& logger, SessionFactory factory);

    TransferResult execute(const TransferStrategy& strategy,
                           const ConnectionConfig& source,
                           const ConnectionConfig& dest,
                           const TransferOptions& options,
                           const TransferControl& control) override;

private:
    std::optional<Verification> verify(const ConnectionConfig& source,
                                       const ConnectionConfig& dest,
                                       const TransferOptions& options,
                                       const TransferControl& control) const;

    const AppConfig& config_;
    const Logger& logger_;
    SessionFactory factory_;
    TreeScanner scanner_;
};

#endif // REMOTE_SHELL_TRANSFER_HPP
