/**
 * @file exclusions.hpp
 * @brief Glob-based exclusion rules applied while scanning and transferring.
 */

#ifndef EXCLUSIONS_HPP
#define EXCLUSIONS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include "errors.hpp"

/**
 * @brief One exclusion rule.
 *
 * A pattern without '/' is matched against every component of the path relative
 * to the scan root, so "cache" also excludes everything below a cache directory.
 * A pattern with '/' is matched against the relative path and each of its
 * directory prefixes.
 */
struct ExclusionPattern {
    std::string pattern;
    std::string reason;
    bool isAutomatic = false;
    bool enabled = true;
};

/**
 * @brief Returns the built-in catalog: VCS metadata, dependency folders, caches,
 * logs, temporary files, OS metadata and common backup archives.
 */
std::vector<ExclusionPattern> defaultExclusions();

/**
 * @brief Validates user-supplied patterns (non-empty, no control characters, well-formed brackets).
 */
std::expected<void, ErrorInfo> validateExclusionPatterns(const std::vector<std::string>& patterns);

/**
 * @brief An ordered set of exclusion patterns.
 */
class ExclusionRules {
public:
    ExclusionRules() = default;
    explicit ExclusionRules(std::vector<ExclusionPattern> patterns);

    /**
     * @brief Builds the default catalog merged with custom patterns (custom ones are not automatic).
     */
    static ExclusionRules withDefaults(const std::vector<std::string>& customPatterns);

    /**
     * @brief Tests an entry against all enabled patterns.
     *
     * @param relativePath Path relative to the scan root, without leading '/'.
     * @return The reason of the first matching pattern, or std::nullopt.
     */
    std::optional<std::string> match(std::string_view relativePath) const;

    const std::vector<ExclusionPattern>& patterns() const { return patterns_; }

private:
    std::vector<ExclusionPattern> patterns_;
};

#endif // EXCLUSIONS_HPP
