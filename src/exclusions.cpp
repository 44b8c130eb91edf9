#include "exclusions.hpp"
#include <fnmatch.h>
#include <algorithm>
#include <format>

namespace {

bool globMatch(const std::string& pattern, const std::string& text, int flags = 0) {
    return fnmatch(pattern.c_str(), text.c_str(), flags) == 0;
}

} // namespace

std::vector<ExclusionPattern> defaultExclusions() {
    return {
        {".git", "Version control", true, true},
        {".svn", "Version control", true, true},
        {".hg", "Version control", true, true},
        {"node_modules", "Dependencies (reinstall with npm)", true, true},
        {"vendor", "Dependencies (reinstall with composer)", true, false},
        {"*.log", "Log files", true, true},
        {"error_log", "PHP error log", true, true},
        {"*.tmp", "Temporary files", true, true},
        {"tmp", "Temporary directory", true, true},
        {"cache", "Cache directory", true, true},
        {"wp-content/cache", "WordPress page cache", true, true},
        {".DS_Store", "macOS metadata", true, true},
        {"Thumbs.db", "Windows metadata", true, true},
        {"*.wpress", "Backup archive", true, true},
        {"wp-content/ai1wm-backups", "Backup archive", true, true},
        {"wp-content/updraft", "Backup archive", true, true},
        {"backup-*.zip", "Backup archive", true, true},
        {"*.sql.gz", "Database dump", true, false},
    };
}

std::expected<void, ErrorInfo> validateExclusionPatterns(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (pattern.empty() || std::ranges::all_of(pattern, [](char c) { return c == ' '; })) {
            return std::unexpected(ErrorInfo{ErrorKind::ValidationError, "custom_exclusions: pattern cannot be empty"});
        }
        if (std::ranges::any_of(pattern, [](char c) { return static_cast<unsigned char>(c) < 0x20; })) {
            return std::unexpected(ErrorInfo{ErrorKind::ValidationError,
                std::format("custom_exclusions: pattern '{}' contains control characters", pattern)});
        }
        if (std::ranges::count(pattern, '[') != std::ranges::count(pattern, ']')) {
            return std::unexpected(ErrorInfo{ErrorKind::ValidationError,
                std::format("custom_exclusions: pattern '{}' has unbalanced brackets", pattern)});
        }
    }
    return {};
}

ExclusionRules::ExclusionRules(std::vector<ExclusionPattern> patterns) : patterns_(std::move(patterns)) {}

ExclusionRules ExclusionRules::withDefaults(const std::vector<std::string>& customPatterns) {
    std::vector<ExclusionPattern> patterns = defaultExclusions();
    for (const auto& custom : customPatterns) {
        patterns.push_back({custom, "User defined", false, true});
    }
    return ExclusionRules(std::move(patterns));
}

std::optional<std::string> ExclusionRules::match(std::string_view relativePath) const {
    std::string path(relativePath);
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }

    std::vector<std::string> components;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        if (slash > start) {
            components.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }

    for (const auto& rule : patterns_) {
        if (!rule.enabled) {
            continue;
        }
        if (rule.pattern.find('/') == std::string::npos) {
            for (const auto& component : components) {
                if (globMatch(rule.pattern, component)) {
                    return rule.reason;
                }
            }
            continue;
        }
        std::string prefix;
        for (const auto& component : components) {
            prefix = prefix.empty() ? component : prefix + "/" + component;
            if (globMatch(rule.pattern, prefix, FNM_PATHNAME)) {
                return rule.reason;
            }
        }
    }
    return std::nullopt;
}
