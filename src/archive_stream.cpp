#include "archive_stream.hpp"
#include "transfer_commands.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <format>

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

/**
 * @brief Source side of the pipe: libarchive pulls blocks from the remote tar.
 */
struct ReadContext {
    RemoteCommand* command;
    std::vector<char> buffer;
    const TransferControl* control;
    std::optional<ErrorInfo> error;
    std::uint64_t compressedBytes = 0;
};

/**
 * @brief Destination side of the pipe: libarchive pushes blocks to the remote tar.
 */
struct WriteContext {
    RemoteCommand* command;
    std::optional<ErrorInfo> error;
};

la_ssize_t readBlock(struct archive* a, void* clientData, const void** block) {
    auto* context = static_cast<ReadContext*>(clientData);
    if (context->control->stopToken.stop_requested()) {
        archive_set_error(a, ECANCELED, "Transfer cancelled");
        return -1;
    }
    auto n = context->command->read(context->buffer.data(), context->buffer.size());
    if (!n) {
        context->error = n.error();
        archive_set_error(a, EIO, "%s", n.error().message.c_str());
        return -1;
    }
    context->compressedBytes += *n;
    *block = context->buffer.data();
    return static_cast<la_ssize_t>(*n);
}

la_ssize_t writeBlock(struct archive* a, void* clientData, const void* buffer, size_t length) {
    auto* context = static_cast<WriteContext*>(clientData);
    if (auto written = context->command->write(static_cast<const char*>(buffer), length); !written) {
        context->error = written.error();
        archive_set_error(a, EIO, "%s", written.error().message.c_str());
        return -1;
    }
    return static_cast<la_ssize_t>(length);
}

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown archive error";
}

std::string entryPath(const char* pathname) {
    std::string path = pathname ? pathname : "";
    while (path.starts_with("./")) {
        path.erase(0, 2);
    }
    if (path == ".") {
        path.clear();
    }
    while (path.ends_with('/')) {
        path.pop_back();
    }
    return path;
}

} // namespace

ArchiveStreamExecutor::ArchiveStreamExecutor(const AppConfig& config, const Logger& logger, SessionFactory factory)
    : config_(config), logger_(logger), factory_(std::move(factory)), scanner_(config, logger, factory_) {}

TransferResult ArchiveStreamExecutor::execute(const TransferStrategy& strategy,
                                              const ConnectionConfig& source,
                                              const ConnectionConfig& dest,
                                              const TransferOptions& options,
                                              const TransferControl& control) {
    TransferResult result;
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] { return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count(); };
    auto fail = [&](const ErrorInfo& error) {
        result.success = false;
        result.errorKind = error.kind;
        result.errorMessage = error.message;
        result.durationSeconds = elapsed();
        logger_.logError(std::format("{} failed: {}", transferMethodName(strategy.method), error.message));
        return result;
    };

    auto open = [&](const ConnectionConfig& config) -> std::expected<std::unique_ptr<RemoteSession>, ErrorInfo> {
        auto session = factory_(config);
        if (!session) {
            return std::unexpected(ErrorInfo{ErrorKind::UnsupportedCapability, std::format("No session available for {}", describeEndpoint(config))});
        }
        if (auto opened = session->open(config_.loginTimeout); !opened) {
            return std::unexpected(opened.error());
        }
        return session;
    };

    auto sourceSession = open(source);
    if (!sourceSession) {
        return fail(sourceSession.error());
    }
    std::unique_ptr<RemoteSession> destSession;
    if (!options.dryRun) {
        auto opened = open(dest);
        if (!opened) {
            return fail(opened.error());
        }
        destSession = std::move(*opened);
    }

    ExclusionRules rules = transferExclusions(options.exclusions);
    TransferProgress progress;
    progress.status = TransferStatus::Transferring;
    if (options.files) {
        for (const auto& entry : *options.files) {
            std::string relative = relativeTo(source.rootPath, entry.path);
            if (!entry.isDir && !relative.empty() && !rules.match(relative)) {
                ++progress.totalFiles;
                progress.totalBytes += entry.size;
            }
        }
    }

    auto tarSource = (*sourceSession)->openCommand(archiveCreateCommand(source.rootPath));
    if (!tarSource) {
        return fail(tarSource.error());
    }
    std::unique_ptr<RemoteCommand> tarDest;
    if (destSession) {
        auto opened = destSession->openCommand(archiveExtractCommand(dest.rootPath));
        if (!opened) {
            return fail(opened.error());
        }
        tarDest = std::move(*opened);
    }
    control.output(std::format("Streaming {} -> {}", endpointUrl(source), endpointUrl(dest)));

    ReadContext readContext{tarSource->get(), std::vector<char>(config_.bufferSize), &control, std::nullopt};
    std::unique_ptr<struct archive, ArchiveReadDeleter> reader(archive_read_new());
    archive_read_support_filter_gzip(reader.get());
    archive_read_support_format_tar(reader.get());
    if (archive_read_open(reader.get(), &readContext, nullptr, readBlock, nullptr) != ARCHIVE_OK) {
        return fail(ErrorInfo{ErrorKind::TransferFailed,
            std::format("Failed to read archive stream from source: {}", archiveError(reader.get()))});
    }

    WriteContext writeContext{tarDest.get(), std::nullopt};
    std::unique_ptr<struct archive, ArchiveWriteDeleter> writer;
    if (tarDest) {
        writer.reset(archive_write_new());
        archive_write_add_filter_gzip(writer.get());
        archive_write_set_format_pax_restricted(writer.get());
        if (archive_write_open(writer.get(), &writeContext, nullptr, writeBlock, nullptr) != ARCHIVE_OK) {
            return fail(ErrorInfo{ErrorKind::TransferFailed,
                std::format("Failed to open archive stream to destination: {}", archiveError(writer.get()))});
        }
    }

    std::vector<std::pair<std::string, std::uint64_t>> written;
    auto lastEmit = std::chrono::steady_clock::now();
    auto emit = [&](bool force) {
        auto now = std::chrono::steady_clock::now();
        if (!force && now - lastEmit < std::chrono::milliseconds(250)) {
            return;
        }
        lastEmit = now;
        progress.elapsedSeconds = elapsed();
        if (progress.elapsedSeconds > 0) {
            progress.speedBytesPerSecond = static_cast<double>(progress.bytesTransferred) / progress.elapsedSeconds;
        }
        if (progress.totalBytes > 0) {
            progress.percentComplete = std::min(100.0, 100.0 * static_cast<double>(progress.bytesTransferred) / static_cast<double>(progress.totalBytes));
            if (progress.speedBytesPerSecond > 0 && progress.totalBytes > progress.bytesTransferred) {
                progress.etaSeconds = static_cast<double>(progress.totalBytes - progress.bytesTransferred) / progress.speedBytesPerSecond;
            }
        }
        control.progress(progress);
    };

    struct archive_entry* entry = nullptr;
    std::optional<ErrorInfo> streamError;
    while (true) {
        if (!control.waitWhilePaused()) {
            break;
        }
        int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc < ARCHIVE_WARN) {
            streamError = readContext.error.value_or(ErrorInfo{ErrorKind::TransferFailed,
                std::format("Corrupt archive stream: {}", archiveError(reader.get()))});
            break;
        }

        std::string relative = entryPath(archive_entry_pathname(entry));
        bool regular = archive_entry_filetype(entry) == AE_IFREG;
        auto size = static_cast<std::uint64_t>(std::max<la_int64_t>(0, archive_entry_size(entry)));
        if (!relative.empty() && rules.match(relative)) {
            archive_read_data_skip(reader.get());
            continue;
        }
        if (regular && options.skipLargeFilesMiB > 0 && static_cast<double>(size) > options.skipLargeFilesMiB * 1024 * 1024) {
            result.skippedFiles.push_back(relative);
            archive_read_data_skip(reader.get());
            continue;
        }
        progress.currentFile = relative;

        if (!writer) {
            if (regular) {
                control.output(std::format("[dry-run] would copy {} ({})", relative, formatBytes(size)));
            }
            archive_read_data_skip(reader.get());
            continue;
        }

        if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN) {
            streamError = writeContext.error.value_or(ErrorInfo{ErrorKind::TransferFailed,
                std::format("Failed to write {}: {}", relative, archiveError(writer.get()))});
            break;
        }
        const void* block = nullptr;
        size_t length = 0;
        la_int64_t offset = 0;
        while ((rc = archive_read_data_block(reader.get(), &block, &length, &offset)) == ARCHIVE_OK) {
            if (archive_write_data(writer.get(), block, length) < 0) {
                rc = ARCHIVE_FATAL;
                streamError = writeContext.error.value_or(ErrorInfo{ErrorKind::TransferFailed,
                    std::format("Failed to write {}: {}", relative, archiveError(writer.get()))});
                break;
            }
            progress.bytesTransferred += length;
            emit(false);
        }
        if (streamError) {
            break;
        }
        if (rc != ARCHIVE_EOF) {
            streamError = readContext.error.value_or(ErrorInfo{ErrorKind::TransferFailed,
                std::format("Failed to read {}: {}", relative, archiveError(reader.get()))});
            break;
        }
        if (regular) {
            ++progress.filesTransferred;
            written.emplace_back(relative, size);
            emit(false);
        }
    }

    bool cancelled = control.stopToken.stop_requested();
    if (writer && !streamError && !cancelled && archive_write_close(writer.get()) != ARCHIVE_OK) {
        streamError = writeContext.error.value_or(ErrorInfo{ErrorKind::TransferFailed,
            std::format("Failed to finish archive stream: {}", archiveError(writer.get()))});
    }
    writer.reset();
    reader.reset();

    if (tarDest) {
        tarDest->closeInput();
    }
    if (!cancelled && !streamError) {
        if (int status = (*tarSource)->wait(); status != 0) {
            streamError = ErrorInfo{ErrorKind::TransferFailed,
                std::format("tar on the source exited with status {}: {}", status, (*tarSource)->errorOutput())};
        } else if (tarDest) {
            if (int destStatus = tarDest->wait(); destStatus != 0) {
                streamError = ErrorInfo{ErrorKind::TransferFailed,
                    std::format("tar on the destination exited with status {}: {}", destStatus, tarDest->errorOutput())};
            }
        }
    }
    tarSource->reset();
    tarDest.reset();

    result.filesTransferred = progress.filesTransferred;
    result.bytesTransferred = progress.bytesTransferred;
    result.durationSeconds = elapsed();
    if (result.durationSeconds > 0) {
        result.averageSpeedBytesPerSecond = static_cast<double>(result.bytesTransferred) / result.durationSeconds;
    }

    if (cancelled) {
        progress.status = TransferStatus::Cancelled;
        emit(true);
        return fail(ErrorInfo{ErrorKind::TransferFailed, "Transfer cancelled"});
    }
    if (streamError) {
        result.errorsCount = 1;
        progress.status = TransferStatus::Failed;
        progress.errorsCount = 1;
        progress.lastError = streamError->message;
        emit(true);
        return fail(*streamError);
    }

    if (options.verifyAfterTransfer && destSession) {
        progress.status = TransferStatus::Verifying;
        emit(true);
        result.verification = verifyDestination(*destSession, dest, written, scanner_);
        control.output(result.verification->message);
        if (!result.verification->success) {
            return fail(ErrorInfo{ErrorKind::TransferFailed, std::format("Verification failed: {}", result.verification->message)});
        }
    }

    (*sourceSession)->close();
    if (destSession) {
        destSession->close();
    }
    result.success = true;
    progress.status = TransferStatus::Completed;
    emit(true);
    logger_.logMessage(std::format("{} finished: {} files, {} ({} compressed from source)", transferMethodName(strategy.method),
                                   result.filesTransferred, formatBytes(result.bytesTransferred), formatBytes(readContext.compressedBytes)));
    return result;
}
