#include "fake_remote_session.hpp"
#include "remote_shell_transfer.hpp"
#include "streaming_copy.hpp"
#include "transfer_commands.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

const AppConfig& testConfig() {
    static AppConfig config;
    return config;
}

struct Servers {
    std::shared_ptr<FakeFileSystem> source = std::make_shared<FakeFileSystem>();
    std::shared_ptr<FakeFileSystem> dest = std::make_shared<FakeFileSystem>();

    Servers() {
        source->addFile("/site/a.txt", "0123456789");
        source->addFile("/site/dir1/b.php", std::string(20, 'b'));
        source->addFile("/site/dir1/dir2/c.js", std::string(30, 'c'));
        source->addFile("/site/logs/app.log", "GET /");
    }

    SessionFactory factory() const {
        return fakeFactory({{"src.example", source}, {"dst.example", dest}});
    }
};

TransferStrategy strategyFor(TransferMethod method) {
    TransferStrategy strategy;
    strategy.method = method;
    return strategy;
}

TransferOptions copyOptions() {
    TransferOptions options;
    options.exclusions = {"*.log"};
    return options;
}

TransferResult runCopy(const Servers& servers, const TransferOptions& options, std::vector<std::string>* output = nullptr) {
    StreamingCopyExecutor executor(testConfig(), Logger::quiet(), servers.factory(), 1);
    TransferControl control;
    if (output) {
        control.onOutput = [output](const std::string& line) { output->push_back(line); };
    }
    return executor.execute(strategyFor(TransferMethod::StreamingCopy), fakeEndpoint("src.example", "/site"),
                            fakeEndpoint("dst.example", "/www"), options, control);
}

void testRsyncCommand() {
    auto source = fakeEndpoint("src.example", "/site");
    auto dest = fakeEndpoint("dst.example", "/www");
    CommandOptions options;
    options.exclusions = {"*.log"};
    options.bandwidthLimitMiB = 1;
    options.dryRun = true;

    std::string shown = rsyncCommand(source, dest, options);
    assert(shown.find("SSHPASS='******' sshpass -e ") == 0);
    assert(shown.find("secret") == std::string::npos);
    assert(shown.find("--bwlimit=1024") != std::string::npos);
    assert(shown.find("--dry-run") != std::string::npos);
    assert(shown.find("--exclude='*.log'") != std::string::npos);
    assert(shown.find("'/site/'") != std::string::npos);

    options.revealSecrets = true;
    assert(rsyncCommand(source, dest, options).find("SSHPASS='secret'") == 0);
    assert(archiveCreateCommand("/site") == "tar czf - -C '/site' .");
    std::cout << "✓ rsync command masks secrets and carries options\n";
}

void testRsyncProgress() {
    auto progress = parseRsyncProgress("  1,234,567  45%   12.34MB/s    0:01:02 (xfr#12, to-chk=88/100)");
    assert(progress);
    assert(progress->bytes == 1234567);
    assert(progress->percent == 45);
    assert(progress->bytesPerSecond > 12.0 * 1024 * 1024);
    assert(progress->filesTransferred == 12);
    assert(progress->filesRemaining == 88);
    assert(progress->filesTotal == 100);

    auto bare = parseRsyncProgress("        32,768   3%    1.00kB/s    0:00:05");
    assert(bare && bare->bytes == 32768 && bare->filesTotal == 0);
    assert(!parseRsyncProgress("sending incremental file list"));
    assert(!parseRsyncProgress("  100  5%  .MB/s 0:00:01"));
    std::cout << "✓ rsync progress lines parsed\n";
}

void testRelativeTo() {
    assert(relativeTo("/site", "/site/dir1/b.php") == "dir1/b.php");
    assert(relativeTo("/site/", "/site/a.txt") == "a.txt");
    assert(relativeTo("/site", "/site").empty());
    std::cout << "✓ Paths made relative to the root\n";
}

void testStreamingCopy() {
    Servers servers;
    auto options = copyOptions();
    options.verifyAfterTransfer = true;
    std::vector<TransferProgress> snapshots;
    StreamingCopyExecutor executor(testConfig(), Logger::quiet(), servers.factory(), 1);
    TransferControl control;
    control.onProgress = [&](const TransferProgress& progress) { snapshots.push_back(progress); };
    auto result = executor.execute(strategyFor(TransferMethod::StreamingCopy), fakeEndpoint("src.example", "/site"),
                                   fakeEndpoint("dst.example", "/www"), options, control);

    assert(result.success);
    assert(result.errorKind == ErrorKind::None);
    assert(result.filesTransferred == 3);
    assert(result.bytesTransferred == 60);
    assert(result.failedFiles.empty());
    assert(servers.dest->content("/www/a.txt") == "0123456789");
    assert(servers.dest->content("/www/dir1/dir2/c.js") == std::string(30, 'c'));
    assert(!servers.dest->exists("/www/logs/app.log"));
    assert(result.verification && result.verification->success);
    assert(result.verification->sourceFiles == 3);
    assert(!snapshots.empty() && snapshots.back().status == TransferStatus::Completed);
    assert(servers.source->opened == servers.source->closed);
    std::cout << "✓ Streaming copy moves the tree and verifies it\n";
}

void testResumePartialFile() {
    Servers servers;
    servers.dest->addFile("/www/a.txt", "ABCD");
    servers.dest->addFile("/www/dir1/b.php", std::string(20, 'x'));
    auto result = runCopy(servers, copyOptions());
    assert(result.success);
    assert(servers.dest->content("/www/a.txt") == "ABCD456789");
    assert(servers.dest->content("/www/dir1/b.php") == std::string(20, 'x'));
    assert(result.bytesTransferred == 60);

    Servers fresh;
    fresh.dest->addFile("/www/a.txt", "ABCD");
    auto options = copyOptions();
    options.enableResume = false;
    assert(runCopy(fresh, options).success);
    assert(fresh.dest->content("/www/a.txt") == "0123456789");
    std::cout << "✓ Partial destination files resumed, complete ones kept\n";
}

void testDryRun() {
    Servers servers;
    auto options = copyOptions();
    options.dryRun = true;
    std::vector<std::string> output;
    auto result = runCopy(servers, options, &output);
    assert(result.success);
    assert(result.filesTransferred == 0);
    assert(!servers.dest->exists("/www"));
    assert(std::ranges::any_of(output, [](const std::string& line) { return line.starts_with("[dry-run] would copy a.txt"); }));
    std::cout << "✓ Dry run reports without writing\n";
}

void testSkipLargeFiles() {
    Servers servers;
    auto options = copyOptions();
    options.skipLargeFilesMiB = 0.00001;
    auto result = runCopy(servers, options);
    assert(result.success);
    assert(result.filesTransferred == 1);
    assert(result.skippedFiles.size() == 2);
    assert(!servers.dest->exists("/www/dir1/dir2/c.js"));
    std::cout << "✓ Files above the size limit skipped\n";
}

void testDestinationFailure() {
    Servers servers;
    servers.dest->readOnly = true;
    auto result = runCopy(servers, copyOptions());
    assert(!result.success);
    assert(result.errorKind != ErrorKind::None);
    assert(!result.errorMessage.empty());
    std::cout << "✓ Read-only destination fails the transfer\n";
}

void testUnlistableSourceDirectory() {
    Servers servers;
    servers.source->unlistable.insert("/site/dir1");
    std::vector<std::string> output;
    auto result = runCopy(servers, copyOptions(), &output);
    assert(!result.success);
    assert(result.errorKind == ErrorKind::TransferFailed);
    assert(result.errorsCount == 1);
    assert(result.errorMessage.find("could not be listed") != std::string::npos);
    assert(result.filesTransferred == 1);
    assert(servers.dest->content("/www/a.txt") == "0123456789");
    assert(std::ranges::any_of(output, [](const std::string& line) { return line.starts_with("Warning: 1 source directories"); }));

    auto options = copyOptions();
    options.dryRun = true;
    assert(!runCopy(servers, options).success);

    Servers rootless;
    rootless.source->unlistable.insert("/site");
    auto empty = runCopy(rootless, copyOptions());
    assert(!empty.success);
    assert(empty.errorKind == ErrorKind::TransferFailed);
    assert(empty.errorMessage == "Cannot list source root /site");
    assert(!rootless.dest->exists("/www"));
    std::cout << "✓ Unlistable source directories fail the transfer\n";
}

void testMultiConnection() {
    Servers servers;
    AppConfig config;
    config.parallelConnections = 3;
    auto executor = makeTransferExecutor(TransferMethod::MultiConnectionClient, config, Logger::quiet(), servers.factory());
    assert(executor);
    auto result = executor->execute(strategyFor(TransferMethod::MultiConnectionClient), fakeEndpoint("src.example", "/site"),
                                    fakeEndpoint("dst.example", "/www"), copyOptions(), TransferControl{});
    assert(result.success);
    assert(result.filesTransferred == 3);
    assert(servers.source->opened == 3);
    assert(servers.dest->opened == 3);
    assert(servers.dest->closed == 3);
    assert(servers.dest->content("/www/dir1/b.php") == std::string(20, 'b'));
    std::cout << "✓ Multi-connection copy spreads files over several pairs\n";
}

void testRemoteShellUnsupported() {
    Servers servers;
    RemoteShellExecutor executor(testConfig(), Logger::quiet(), servers.factory());
    std::vector<std::string> output;
    TransferControl control;
    control.onOutput = [&](const std::string& line) { output.push_back(line); };
    auto result = executor.execute(strategyFor(TransferMethod::RsyncOverSsh), fakeEndpoint("src.example", "/site"),
                                   fakeEndpoint("dst.example", "/www"), copyOptions(), control);
    assert(!result.success);
    assert(result.errorKind == ErrorKind::UnsupportedCapability);
    assert(!output.empty());
    assert(output.front().find("rsync") != std::string::npos);
    assert(output.front().find("secret") == std::string::npos);

    auto wrong = executor.execute(strategyFor(TransferMethod::StreamingCopy), fakeEndpoint("src.example", "/site"),
                                  fakeEndpoint("dst.example", "/www"), copyOptions(), TransferControl{});
    assert(!wrong.success && wrong.errorKind == ErrorKind::UnsupportedCapability);
    std::cout << "✓ Remote shell transfer needs command execution\n";
}

void testArchiveStreamNeedsShell() {
    Servers servers;
    auto executor = makeTransferExecutor(TransferMethod::ArchiveStream, testConfig(), Logger::quiet(), servers.factory());
    auto result = executor->execute(strategyFor(TransferMethod::ArchiveStream), fakeEndpoint("src.example", "/site"),
                                    fakeEndpoint("dst.example", "/www"), copyOptions(), TransferControl{});
    assert(!result.success);
    assert(result.errorKind == ErrorKind::UnsupportedCapability);
    assert(!servers.dest->exists("/www"));
    std::cout << "✓ Archive stream needs command execution on both sides\n";
}

void testOptionsValidation() {
    TransferOptions options;
    assert(validateTransferOptions(options));
    options.bandwidthLimitMiB = TransferOptions::kMaxBandwidthMiB + 1;
    assert(!validateTransferOptions(options));
    options.bandwidthLimitMiB = 0;
    options.skipLargeFilesMiB = -1;
    auto invalid = validateTransferOptions(options);
    assert(!invalid && invalid.error().kind == ErrorKind::ValidationError);
    std::cout << "✓ Transfer options validated\n";
}

} // namespace

int main() {
    testRsyncCommand();
    testRsyncProgress();
    testRelativeTo();
    testStreamingCopy();
    testResumePartialFile();
    testDryRun();
    testSkipLargeFiles();
    testDestinationFailure();
    testUnlistableSourceDirectory();
    testMultiConnection();
    testRemoteShellUnsupported();
    testArchiveStreamNeedsShell();
    testOptionsValidation();
    return 0;
}
