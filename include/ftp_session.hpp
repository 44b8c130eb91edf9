/**
 * @file ftp_session.hpp
 * @brief FTP and FTPS sessions built on libcurl.
 *
 * Directory listings prefer MLSD and fall back to LIST when the server rejects it.
 * All data connections use passive mode (EPSV, then PASV).
 */

#ifndef FTP_SESSION_HPP
#define FTP_SESSION_HPP

#include <string>
#include <vector>
#include <optional>
#include <expected>
#include <chrono>
#include <curl/curl.h>
#include "remote_session.hpp"
#include "logger.hpp"

/**
 * @brief Session speaking plain FTP.
 */
class FtpSession : public RemoteSession {
public:
    FtpSession(const ConnectionConfig& config, const Logger& logger);
    ~FtpSession() override;

    FtpSession(const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    Protocol protocol() const override { return Protocol::Ftp; }
    std::expected<void, ErrorInfo> open(std::chrono::milliseconds timeout) override;
    void close() override;
    std::expected<std::vector<RemoteEntry>, ErrorInfo> list(const std::string& path) override;
    std::expected<RemoteEntry, ErrorInfo> stat(const std::string& path) override;
    std::expected<std::uint64_t, ErrorInfo> download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) override;
    std::expected<std::uint64_t, ErrorInfo> upload(const std::string& path, const ChunkSource& source, bool append) override;
    std::expected<void, ErrorInfo> remove(const std::string& path) override;
    std::expected<void, ErrorInfo> makeDirectory(const std::string& path) override;
    void describeCapabilities(const std::string& rootPath, Capabilities& capabilities, std::vector<std::string>& badges) override;

protected:
    /**
     * @brief Sets transport security options on a prepared handle. Plain FTP sets none.
     */
    virtual void configureTransport(CURL* curl) const;

    /**
     * @brief Adds security-related badges and version text.
     */
    virtual void describeTransport(Capabilities& capabilities, std::vector<std::string>& badges) const;

    const ConnectionConfig& config() const { return config_; }

private:
    void prepare(const std::string& url);
    std::string urlFor(const std::string& path, bool directory) const;
    ErrorInfo curlError(CURLcode code, const std::string& action) const;
    std::expected<std::vector<RemoteEntry>, ErrorInfo> listWith(const std::string& path, bool mlsd);
    std::expected<std::string, ErrorInfo> sendCommands(const std::vector<std::string>& commands);

    ConnectionConfig config_;
    const Logger& logger_;
    CURL* curl_ = nullptr;
    std::chrono::milliseconds timeout_{10000};
    std::optional<bool> mlsd_;
    std::string greeting_;
    std::string responses_;  ///< Server replies seen during the last request.
    char errorBuffer_[CURL_ERROR_SIZE] = {};
};

/**
 * @brief FTP with explicit TLS (AUTH TLS), TLS 1.2 or newer required for control and data.
 */
class FtpsSession : public FtpSession {
public:
    using FtpSession::FtpSession;

    Protocol protocol() const override { return Protocol::Ftps; }

protected:
    void configureTransport(CURL* curl) const override;
    void describeTransport(Capabilities& capabilities, std::vector<std::string>& badges) const override;
};

/**
 * @brief Parses one MLSD line ("fact=value;fact=value; name").
 *
 * @return The entry, or std::nullopt for "." / ".." and malformed lines.
 */
std::optional<RemoteEntry> parseMlsdLine(const std::string& line);

/**
 * @brief Parses one Unix-style LIST line ("drwxr-xr-x 2 owner group 4096 Jan 1 12:00 name").
 *
 * @return The entry, or std::nullopt for "total" lines, "." / ".." and malformed lines.
 */
std::optional<RemoteEntry> parseListLine(const std::string& line);

/**
 * @brief Extracts feature names from a FEAT reply.
 */
std::vector<std::string> parseFeatReply(const std::string& reply);

#endif // FTP_SESSION_HPP
