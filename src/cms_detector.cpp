#include "cms_detector.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

namespace {

std::string toLower(std::string_view text) {
    std::string lower(text);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string capture(const std::string& content, const std::string& pattern) {
    std::smatch match;
    if (std::regex_search(content, match, std::regex(pattern)) && match.size() > 1) {
        return match[1].str();
    }
    return {};
}

std::string joinPath(const std::string& root, const std::string& relative) {
    if (relative.empty()) {
        return root;
    }
    if (!root.empty() && root.back() == '/') {
        return root + relative;
    }
    return root + "/" + relative;
}

// Keeps the current port unless portText is a whole number in 1..65535.
void applyPort(DatabaseConfig& config, const std::string& portText) {
    int port = 0;
    const char* end = portText.data() + portText.size();
    auto [ptr, ec] = std::from_chars(portText.data(), end, port);
    if (ec == std::errc{} && ptr == end && port >= 1 && port <= 65535) {
        config.port = port;
    }
}

// Splits "host:port"; a socket path or garbage after ':' leaves the default port.
void splitHostPort(DatabaseConfig& config) {
    auto colon = config.host.find(':');
    if (colon == std::string::npos) {
        return;
    }
    std::string portText = config.host.substr(colon + 1);
    config.host.resize(colon);
    applyPort(config, portText);
}

DatabaseConfig parseWordPress(const std::string& content) {
    DatabaseConfig config;
    auto constant = [&content](const std::string& name) {
        return capture(content, R"re(define\s*\(\s*['"])re" + name + R"re(['"]\s*,\s*['"]([^'"]*)['"])re");
    };
    config.database = constant("DB_NAME");
    config.username = constant("DB_USER");
    config.password = constant("DB_PASSWORD");
    config.host = constant("DB_HOST");
    config.prefix = capture(content, R"re(\$table_prefix\s*=\s*['"]([^'"]*)['"])re");
    splitHostPort(config);
    return config;
}

DatabaseConfig parsePrestaShop(const std::string& content) {
    DatabaseConfig config;
    auto constant = [&content](const std::string& name) {
        return capture(content, R"re(define\s*\(\s*')re" + name + R"re('\s*,\s*'([^']*)'\s*\))re");
    };
    config.host = constant("_DB_SERVER_");
    config.database = constant("_DB_NAME_");
    config.username = constant("_DB_USER_");
    config.password = constant("_DB_PASSWD_");
    config.prefix = constant("_DB_PREFIX_");
    if (config.database.empty()) {
        // PrestaShop 1.7+ app/config/parameters.php
        auto parameter = [&content](const std::string& name) {
            return capture(content, R"re(['"])re" + name + R"re(['"]\s*=>\s*['"]([^'"]*)['"])re");
        };
        config.host = parameter("database_host");
        config.database = parameter("database_name");
        config.username = parameter("database_user");
        config.password = parameter("database_password");
        config.prefix = parameter("database_prefix");
        applyPort(config, parameter("database_port"));
    }
    splitHostPort(config);
    return config;
}

DatabaseConfig parseDrupal(const std::string& content) {
    // The last assignment wins; earlier ones are usually documentation examples.
    std::string block = content;
    std::regex assignment(R"re(\$databases\s*\[\s*['"]default['"]\s*\]\s*\[\s*['"]default['"]\s*\]\s*=)re");
    std::size_t start = std::string::npos;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), assignment); it != std::sregex_iterator(); ++it) {
        start = static_cast<std::size_t>(it->position(0) + it->length(0));
    }
    if (start != std::string::npos) {
        std::size_t end = content.find(';', start);
        block = content.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }

    DatabaseConfig config;
    auto key = [&block](const std::string& name) {
        return capture(block, R"re(['"])re" + name + R"re(['"]\s*=>\s*['"]([^'"]*)['"])re");
    };
    config.database = key("database");
    config.username = key("username");
    config.password = key("password");
    config.host = key("host");
    config.prefix = key("prefix");
    applyPort(config, key("port"));
    return config;
}

DatabaseConfig parseJoomla(const std::string& content) {
    DatabaseConfig config;
    auto field = [&content](const std::string& name) {
        return capture(content, R"re(public\s+\$)re" + name + R"re(\s*=\s*['"]([^'"]*)['"])re");
    };
    config.host = field("host");
    config.database = field("db");
    config.username = field("user");
    config.password = field("password");
    config.prefix = field("dbprefix");
    splitHostPort(config);
    return config;
}

DatabaseConfig parseMagento(const std::string& content) {
    DatabaseConfig config;
    if (content.find("<config>") != std::string::npos || content.find("<?xml") != std::string::npos) {
        // Magento 1 app/etc/local.xml
        auto element = [&content](const std::string& name) {
            return capture(content, "<" + name + R"re(>\s*<!\[CDATA\[([^\]]*)\]\]>\s*</)re" + name + ">");
        };
        config.host = element("host");
        config.database = element("dbname");
        config.username = element("username");
        config.password = element("password");
        config.prefix = element("table_prefix");
    } else {
        // Magento 2 app/etc/env.php
        auto key = [&content](const std::string& name) {
            return capture(content, R"re(['"])re" + name + R"re(['"]\s*=>\s*['"]([^'"]*)['"])re");
        };
        config.host = key("host");
        config.database = key("dbname");
        config.username = key("username");
        config.password = key("password");
        config.prefix = key("table_prefix");
    }
    splitHostPort(config);
    return config;
}

} // namespace

std::string_view cmsTypeName(CmsType type) {
    switch (type) {
    case CmsType::WordPress: return "wordpress";
    case CmsType::PrestaShop: return "prestashop";
    case CmsType::Drupal: return "drupal";
    case CmsType::Joomla: return "joomla";
    case CmsType::Magento: return "magento";
    case CmsType::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<DatabaseConfig> parseDatabaseConfig(CmsType type, const std::string& content) {
    DatabaseConfig config;
    switch (type) {
    case CmsType::WordPress: config = parseWordPress(content); break;
    case CmsType::PrestaShop: config = parsePrestaShop(content); break;
    case CmsType::Drupal: config = parseDrupal(content); break;
    case CmsType::Joomla: config = parseJoomla(content); break;
    case CmsType::Magento: config = parseMagento(content); break;
    case CmsType::Unknown: return std::nullopt;
    }
    if (config.database.empty() || config.username.empty()) {
        return std::nullopt;
    }
    return config;
}

CmsDetector::CmsDetector(std::string scanRoot)
    : scanRoot_(std::move(scanRoot)),
      signatures_{
          {CmsType::WordPress, {
              {"wp-config.php", {"wp-config.php"}, false},
              {"wp-content/", {"wp-content"}, true},
              {"wp-includes/", {"wp-includes"}, true},
              {"wp-admin/", {"wp-admin"}, true},
              {"wp-load.php", {"wp-load.php"}, false},
              {"wp-settings.php", {"wp-settings.php"}, false},
          }},
          {CmsType::PrestaShop, {
              {"config/settings.inc.php", {"config/settings.inc.php", "app/config/parameters.php"}, false},
              {"config/defines.inc.php", {"config/defines.inc.php"}, false},
              {"classes/", {"classes"}, true},
              {"controllers/", {"controllers"}, true},
              {"override/", {"override"}, true},
          }},
          {CmsType::Drupal, {
              {"sites/default/settings.php", {"sites/default/settings.php"}, false},
              {"sites/default/", {"sites/default"}, true},
              {"core/lib/Drupal.php", {"core/lib/drupal.php", "includes/bootstrap.inc"}, false},
              {"misc/drupal.js", {"core/misc/drupal.js", "misc/drupal.js"}, false},
          }},
          {CmsType::Joomla, {
              {"configuration.php", {"configuration.php"}, false},
              {"administrator/", {"administrator"}, true},
              {"components/", {"components"}, true},
              {"libraries/", {"libraries"}, true},
              {"plugins/", {"plugins"}, true},
          }},
          {CmsType::Magento, {
              {"app/etc/env.php", {"app/etc/env.php", "app/etc/local.xml"}, false},
              {"app/etc/", {"app/etc"}, true},
              {"app/code/", {"app/code"}, true},
              {"bin/magento", {"bin/magento", "mage"}, false},
          }},
      } {
    for (const auto& signature : signatures_) {
        matched_.emplace_back(signature.indicators.size(), false);
    }
    configPaths_.resize(signatures_.size());
    installRoots_.resize(signatures_.size());
}

void CmsDetector::observe(std::string_view relativePath, bool isDir) {
    std::string lower = toLower(relativePath);
    for (std::size_t s = 0; s < signatures_.size(); ++s) {
        const auto& indicators = signatures_[s].indicators;
        for (std::size_t i = 0; i < indicators.size(); ++i) {
            if (matched_[s][i] || indicators[i].isDir != isDir) {
                continue;
            }
            for (const auto& candidate : indicators[i].paths) {
                bool exact = lower == candidate;
                bool nested = lower.size() > candidate.size() && lower.ends_with(candidate) &&
                              lower[lower.size() - candidate.size() - 1] == '/';
                if (!exact && !nested) {
                    continue;
                }
                matched_[s][i] = true;
                if (i == 0) {
                    configPaths_[s] = std::string(relativePath);
                    installRoots_[s] = exact ? std::string() : std::string(relativePath.substr(0, lower.size() - candidate.size() - 1));
                }
                break;
            }
        }
    }
}

CmsDetection CmsDetector::result(const RemoteFileReader& readFile) const {
    CmsDetection detection;
    std::optional<std::size_t> best;
    double bestConfidence = 0.0;
    for (std::size_t s = 0; s < signatures_.size(); ++s) {
        auto hits = std::ranges::count(matched_[s], true);
        double confidence = std::min(1.0, static_cast<double>(hits) / static_cast<double>(matched_[s].size()));
        if (confidence > bestConfidence) {
            bestConfidence = confidence;
            best = s;
        }
    }
    if (!best || bestConfidence < kThreshold) {
        return detection;
    }

    const Signature& signature = signatures_[*best];
    detection.detected = true;
    detection.type = signature.type;
    detection.confidence = bestConfidence;
    for (std::size_t i = 0; i < signature.indicators.size(); ++i) {
        if (matched_[*best][i]) {
            detection.indicators.push_back(signature.indicators[i].label);
        }
    }
    detection.rootPath = joinPath(scanRoot_, installRoots_[*best]);
    if (!configPaths_[*best].empty()) {
        detection.configFile = joinPath(scanRoot_, configPaths_[*best]);
    }
    if (!readFile) {
        return detection;
    }

    std::optional<std::string> config;
    if (!detection.configFile.empty()) {
        config = readFile(detection.configFile);
        if (config) {
            detection.databaseConfig = parseDatabaseConfig(signature.type, *config);
        }
    }
    if (signature.type == CmsType::WordPress) {
        if (auto versionFile = readFile(joinPath(detection.rootPath, "wp-includes/version.php"))) {
            detection.version = capture(*versionFile, R"re(\$wp_version\s*=\s*['"]([^'"]+)['"])re");
        }
    } else if (signature.type == CmsType::PrestaShop && config) {
        detection.version = capture(*config, R"re(define\s*\(\s*'_PS_VERSION_'\s*,\s*'([^']+)')re");
    }
    return detection;
}
