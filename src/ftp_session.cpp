#include "ftp_session.hpp"
#include "probe.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>
#include <mutex>
#include <sstream>

namespace {

std::once_flag curlInitFlag;

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* text = static_cast<std::string*>(userdata);
    text->append(ptr, size * nmemb);
    return size * nmemb;
}

struct DownloadContext {
    const ChunkSink* sink = nullptr;
    std::uint64_t total = 0;
};

size_t writeToSink(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* context = static_cast<DownloadContext*>(userdata);
    size_t count = size * nmemb;
    if (!(*context->sink)(ptr, count)) {
        return 0;
    }
    context->total += count;
    return count;
}

struct UploadContext {
    const ChunkSource* source = nullptr;
    std::uint64_t total = 0;
};

size_t readFromSource(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* context = static_cast<UploadContext*>(userdata);
    size_t count = (*context->source)(buffer, size * nitems);
    context->total += count;
    return count;
}

std::string trimLine(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' ')) {
        line.pop_back();
    }
    std::size_t start = line.find_first_not_of(' ');
    return start == std::string::npos ? std::string() : line.substr(start);
}

std::string toLower(std::string text) {
    std::ranges::transform(text, text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::int64_t parseMlsdTime(const std::string& value) {
    if (value.size() < 14) {
        return 0;
    }
    std::tm tm{};
    try {
        tm.tm_year = std::stoi(value.substr(0, 4)) - 1900;
        tm.tm_mon = std::stoi(value.substr(4, 2)) - 1;
        tm.tm_mday = std::stoi(value.substr(6, 2));
        tm.tm_hour = std::stoi(value.substr(8, 2));
        tm.tm_min = std::stoi(value.substr(10, 2));
        tm.tm_sec = std::stoi(value.substr(12, 2));
    } catch (const std::exception&) {
        return 0;
    }
    return static_cast<std::int64_t>(timegm(&tm));
}

std::uint32_t parseModeString(const std::string& mode) {
    static constexpr std::uint32_t bits[9] = {0400, 0200, 0100, 040, 020, 010, 04, 02, 01};
    std::uint32_t permissions = 0;
    for (std::size_t i = 0; i < 9 && i + 1 < mode.size(); ++i) {
        char c = mode[i + 1];
        if (c != '-') {
            permissions |= bits[i];
        }
    }
    return permissions;
}

} // namespace

std::optional<RemoteEntry> parseMlsdLine(const std::string& rawLine) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    std::size_t space = line.find(' ');
    if (space == std::string::npos || space + 1 >= line.size()) {
        return std::nullopt;
    }

    RemoteEntry entry;
    entry.name = line.substr(space + 1);
    if (entry.name == "." || entry.name == "..") {
        return std::nullopt;
    }

    std::stringstream facts(line.substr(0, space));
    std::string fact;
    bool typed = false;
    while (std::getline(facts, fact, ';')) {
        std::size_t eq = fact.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = toLower(fact.substr(0, eq));
        std::string value = fact.substr(eq + 1);
        if (key == "type") {
            std::string type = toLower(value);
            if (type == "cdir" || type == "pdir") {
                return std::nullopt;
            }
            entry.isDir = type == "dir";
            entry.isSymlink = type.starts_with("os.unix=slink") || type.starts_with("os.unix=symlink");
            typed = true;
        } else if (key == "size" || key == "sizd") {
            try {
                entry.size = std::stoull(value);
            } catch (const std::exception&) {
                entry.size = 0;
            }
        } else if (key == "modify") {
            entry.mtime = parseMlsdTime(value);
        } else if (key == "unix.mode") {
            try {
                entry.permissions = static_cast<std::uint32_t>(std::stoul(value, nullptr, 8));
            } catch (const std::exception&) {
                entry.permissions = 0;
            }
        }
    }
    if (!typed) {
        return std::nullopt;
    }
    return entry;
}

std::optional<RemoteEntry> parseListLine(const std::string& rawLine) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.size() < 10 || line.starts_with("total")) {
        return std::nullopt;
    }

    // Eight whitespace-separated fields precede the name, which may itself contain spaces.
    std::vector<std::string> fields;
    std::size_t pos = 0;
    while (fields.size() < 8) {
        std::size_t start = line.find_first_not_of(' ', pos);
        if (start == std::string::npos) {
            return std::nullopt;
        }
        std::size_t end = line.find(' ', start);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        fields.push_back(line.substr(start, end - start));
        pos = end;
    }
    std::size_t nameStart = line.find_first_not_of(' ', pos);
    if (nameStart == std::string::npos) {
        return std::nullopt;
    }

    const std::string& mode = fields[0];
    if (mode.size() != 10 || std::string("-dlbcps").find(mode[0]) == std::string::npos) {
        return std::nullopt;
    }

    RemoteEntry entry;
    entry.isDir = mode[0] == 'd';
    entry.isSymlink = mode[0] == 'l';
    entry.permissions = parseModeString(mode);
    try {
        entry.size = std::stoull(fields[4]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    entry.name = line.substr(nameStart);
    if (entry.isSymlink) {
        if (auto arrow = entry.name.find(" -> "); arrow != std::string::npos) {
            entry.name.resize(arrow);
        }
    }
    if (entry.name == "." || entry.name == "..") {
        return std::nullopt;
    }
    return entry;
}

std::vector<std::string> parseFeatReply(const std::string& reply) {
    std::vector<std::string> features;
    std::istringstream lines(reply);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.starts_with(" ")) {
            std::string feature = trimLine(line);
            if (!feature.empty()) {
                features.push_back(feature);
            }
        }
    }
    return features;
}

FtpSession::FtpSession(const ConnectionConfig& config, const Logger& logger)
    : config_(config), logger_(logger) {
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

FtpSession::~FtpSession() {
    close();
}

void FtpSession::close() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void FtpSession::configureTransport(CURL* /*curl*/) const {}

void FtpSession::describeTransport(Capabilities& capabilities, std::vector<std::string>& /*badges*/) const {
    capabilities.protocolVersion = greeting_.empty() ? "FTP" : std::format("FTP ({})", greeting_);
}

std::string FtpSession::urlFor(const std::string& path, bool directory) const {
    // "%2F" makes the path absolute instead of relative to the login directory.
    std::string url = std::format("ftp://{}:{}/%2F", config_.host, config_.port);
    std::stringstream segments(path);
    std::string segment;
    bool first = true;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        char* escaped = curl_easy_escape(curl_, segment.c_str(), static_cast<int>(segment.size()));
        if (!first) {
            url += '/';
        }
        url += escaped ? escaped : segment.c_str();
        curl_free(escaped);
        first = false;
    }
    if (directory && !first) {
        url += '/';
    }
    return url;
}

void FtpSession::prepare(const std::string& url) {
    curl_easy_reset(curl_);
    errorBuffer_[0] = '\0';
    responses_.clear();
    long responseTimeout = std::max<long>(1, static_cast<long>(timeout_.count() / 1000));
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERNAME, config_.username.c_str());
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, config_.password.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl_, CURLOPT_SERVER_RESPONSE_TIMEOUT, responseTimeout);
    curl_easy_setopt(curl_, CURLOPT_FTP_USE_EPSV, 1L);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errorBuffer_);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, appendToString);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &responses_);
    configureTransport(curl_);
}

ErrorInfo FtpSession::curlError(CURLcode code, const std::string& action) const {
    std::string detail = errorBuffer_[0] != '\0' ? std::string(errorBuffer_) : std::string(curl_easy_strerror(code));
    ErrorKind kind = ErrorKind::IoError;
    switch (code) {
    case CURLE_LOGIN_DENIED:
        kind = ErrorKind::AuthFailed;
        break;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_FTP_WEIRD_PASV_REPLY:
    case CURLE_FTP_CANT_GET_HOST:
    case CURLE_FTP_ACCEPT_FAILED:
        kind = ErrorKind::ConnectionFailed;
        break;
    case CURLE_WEIRD_SERVER_REPLY:
    case CURLE_USE_SSL_FAILED:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
        kind = ErrorKind::HandshakeFailed;
        break;
    case CURLE_REMOTE_ACCESS_DENIED:
        kind = ErrorKind::PermissionDenied;
        break;
    case CURLE_WRITE_ERROR:
    case CURLE_ABORTED_BY_CALLBACK:
        kind = ErrorKind::TransferFailed;
        break;
    default:
        break;
    }
    std::string replies = toLower(responses_);
    if ((kind == ErrorKind::IoError || kind == ErrorKind::TransferFailed) &&
        (replies.find("permission denied") != std::string::npos || replies.find("\n553") != std::string::npos ||
         replies.starts_with("553"))) {
        kind = ErrorKind::PermissionDenied;
    }
    return ErrorInfo{kind, std::format("{}: {}", action, detail)};
}

std::expected<void, ErrorInfo> FtpSession::open(std::chrono::milliseconds timeout) {
    close();
    timeout_ = timeout;
    curl_ = curl_easy_init();
    if (!curl_) {
        return std::unexpected(ErrorInfo{ErrorKind::ConnectionFailed, "Failed to initialize libcurl"});
    }

    // Login directory, no transfer: connect, greeting, optional AUTH TLS, USER/PASS.
    prepare(std::format("ftp://{}:{}/", config_.host, config_.port));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        ErrorInfo error = curlError(res, std::format("FTP login to {}:{}", config_.host, config_.port));
        close();
        return std::unexpected(error);
    }

    std::istringstream lines(responses_);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.starts_with("220")) {
            greeting_ = trimLine(line.substr(3));
            if (greeting_.starts_with("-")) {
                greeting_ = trimLine(greeting_.substr(1));
            }
            break;
        }
    }
    return {};
}

std::expected<std::vector<RemoteEntry>, ErrorInfo> FtpSession::listWith(const std::string& path, bool mlsd) {
    std::string body;
    prepare(urlFor(path, true));
    if (mlsd) {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "MLSD");
    }
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        return std::unexpected(curlError(res, std::format("list {}", path)));
    }

    std::vector<RemoteEntry> entries;
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        auto entry = mlsd ? parseMlsdLine(line) : parseListLine(line);
        if (entry) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

std::expected<std::vector<RemoteEntry>, ErrorInfo> FtpSession::list(const std::string& path) {
    if (mlsd_.value_or(true)) {
        auto entries = listWith(path, true);
        if (entries) {
            mlsd_ = true;
            return entries;
        }
        if (mlsd_.has_value() || entries.error().kind == ErrorKind::PermissionDenied ||
            entries.error().kind == ErrorKind::ConnectionFailed) {
            return entries;
        }
        logger_.logMessage(std::format("MLSD rejected by {}, falling back to LIST", config_.host));
    }
    auto entries = listWith(path, false);
    if (entries && !mlsd_.has_value()) {
        mlsd_ = false;
    }
    return entries;
}

std::expected<RemoteEntry, ErrorInfo> FtpSession::stat(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    if (trimmed == "/") {
        RemoteEntry root;
        root.name = "/";
        root.isDir = true;
        return root;
    }
    auto slash = trimmed.find_last_of('/');
    std::string parent = slash == 0 ? "/" : trimmed.substr(0, slash);
    std::string name = trimmed.substr(slash + 1);

    auto entries = list(parent);
    if (!entries) {
        return std::unexpected(entries.error());
    }
    for (auto& entry : *entries) {
        if (entry.name != name) {
            continue;
        }
        if (entry.isSymlink) {
            entry.isDir = listWith(trimmed, mlsd_.value_or(false)).has_value();
        }
        return entry;
    }
    return std::unexpected(ErrorInfo{ErrorKind::IoError, std::format("stat {}: no such file or directory", path)});
}

std::expected<std::uint64_t, ErrorInfo> FtpSession::download(const std::string& path, std::uint64_t offset, const ChunkSink& sink) {
    DownloadContext context{&sink, 0};
    prepare(urlFor(path, false));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToSink);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &context);
    if (offset > 0) {
        curl_easy_setopt(curl_, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
    }
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        return std::unexpected(curlError(res, std::format("download {}", path)));
    }
    return context.total;
}

std::expected<std::uint64_t, ErrorInfo> FtpSession::upload(const std::string& path, const ChunkSource& source, bool append) {
    UploadContext context{&source, 0};
    prepare(urlFor(path, false));
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, readFromSource);
    curl_easy_setopt(curl_, CURLOPT_READDATA, &context);
    curl_easy_setopt(curl_, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    if (append) {
        curl_easy_setopt(curl_, CURLOPT_APPEND, 1L);
    }
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        return std::unexpected(curlError(res, std::format("upload {}", path)));
    }
    return context.total;
}

std::expected<std::string, ErrorInfo> FtpSession::sendCommands(const std::vector<std::string>& commands) {
    curl_slist* quote = nullptr;
    for (const auto& command : commands) {
        curl_slist* appended = curl_slist_append(quote, command.c_str());
        if (!appended) {
            curl_slist_free_all(quote);
            return std::unexpected(ErrorInfo{ErrorKind::IoError, "Out of memory building FTP command list"});
        }
        quote = appended;
    }
    prepare(std::format("ftp://{}:{}/", config_.host, config_.port));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl_, CURLOPT_QUOTE, quote);
    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(quote);
    if (res != CURLE_OK) {
        return std::unexpected(curlError(res, commands.empty() ? std::string("FTP command") : commands.front()));
    }
    return responses_;
}

std::expected<void, ErrorInfo> FtpSession::remove(const std::string& path) {
    auto reply = sendCommands({"DELE " + path});
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return {};
}

std::expected<void, ErrorInfo> FtpSession::makeDirectory(const std::string& path) {
    auto reply = sendCommands({"MKD " + path});
    if (reply) {
        return {};
    }
    auto existing = stat(path);
    if (existing && existing->isDir) {
        return {};
    }
    return std::unexpected(reply.error());
}

void FtpSession::describeCapabilities(const std::string& /*rootPath*/, Capabilities& capabilities, std::vector<std::string>& badges) {
    if (auto reply = sendCommands({"FEAT"})) {
        capabilities.protocolExtensions = parseFeatReply(*reply);
    } else {
        logger_.logMessage(std::format("FEAT not supported by {}: {}", config_.host, reply.error().message));
    }

    bool mlst = std::ranges::any_of(capabilities.protocolExtensions, [](const std::string& feature) {
        return toLower(feature).starts_with("mlst") || toLower(feature).starts_with("mlsd");
    });
    capabilities.mlsdSupported = mlst || mlsd_.value_or(false);
    if (capabilities.mlsdSupported) {
        badges.emplace_back("MLSD");
    }

    capabilities.passiveListing = capabilities.canList;
    if (capabilities.passiveListing) {
        badges.emplace_back("Passive");
    }

    bool modeZ = std::ranges::any_of(capabilities.protocolExtensions, [](const std::string& feature) {
        return toLower(feature) == "mode z";
    });
    capabilities.compressionTypes = modeZ ? std::vector<std::string>{"deflate", "none"} : std::vector<std::string>{"none"};
    if (modeZ) {
        badges.emplace_back("Compression");
    }
    describeTransport(capabilities, badges);
}

void FtpsSession::configureTransport(CURL* curl) const {
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
    curl_easy_setopt(curl, CURLOPT_SSLVERSION, static_cast<long>(CURL_SSLVERSION_TLSv1_2));
    // Hosting control panels usually serve self-signed certificates.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
}

void FtpsSession::describeTransport(Capabilities& capabilities, std::vector<std::string>& badges) const {
    FtpSession::describeTransport(capabilities, badges);
    capabilities.protocolVersion = "FTPS" + capabilities.protocolVersion.substr(3);
    badges.emplace_back("FTPS");
}
