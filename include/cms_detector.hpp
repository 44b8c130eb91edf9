/**
 * @file cms_detector.hpp
 * @brief Content-management-system detection from a stream of scanned paths.
 *
 * Each supported CMS has a signature: a set of indicator files and directories.
 * Confidence is the share of distinct indicators seen. The best CMS at or above
 * the 0.5 threshold wins, and its configuration file is parsed for database
 * connection parameters.
 */

#ifndef CMS_DETECTOR_HPP
#define CMS_DETECTOR_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>

/**
 * @brief Supported content management systems.
 */
enum class CmsType {
    Unknown,
    WordPress,
    PrestaShop,
    Drupal,
    Joomla,
    Magento
};

/**
 * @brief Returns the lower-case CMS name ("wordpress", ..., "unknown").
 */
std::string_view cmsTypeName(CmsType type);

/**
 * @brief Database connection parameters found in a CMS configuration file.
 */
struct DatabaseConfig {
    std::string host;
    int port = 3306;
    std::string database;
    std::string username;
    std::string password;
    std::string prefix;
};

/**
 * @brief Outcome of CMS detection.
 */
struct CmsDetection {
    bool detected = false;
    CmsType type = CmsType::Unknown;
    double confidence = 0.0;                      ///< In [0, 1].
    std::vector<std::string> indicators;          ///< Matched indicator labels.
    std::optional<DatabaseConfig> databaseConfig;
    std::string rootPath;                         ///< Absolute install directory.
    std::string configFile;                       ///< Absolute config file path, empty if not seen.
    std::string version;                          ///< Empty when unknown.
};

/**
 * @brief Reads a remote file by absolute path; std::nullopt when unreadable.
 */
using RemoteFileReader = std::function<std::optional<std::string>(const std::string& path)>;

/**
 * @brief Incremental CMS detector fed by the tree scanner.
 */
class CmsDetector {
public:
    /**
     * @brief Minimum confidence for a detection.
     */
    static constexpr double kThreshold = 0.5;

    /**
     * @param scanRoot Absolute root of the scanned tree.
     */
    explicit CmsDetector(std::string scanRoot);

    /**
     * @brief Records one visited entry.
     *
     * @param relativePath Path relative to the scan root, without leading '/'.
     * @param isDir Whether the entry is a directory.
     */
    void observe(std::string_view relativePath, bool isDir);

    /**
     * @brief Picks the winning CMS and reads its configuration.
     *
     * @param readFile Reader for configuration and version files. May be empty to skip parsing.
     */
    CmsDetection result(const RemoteFileReader& readFile) const;

private:
    struct Indicator {
        std::string label;
        std::vector<std::string> paths;  ///< Alternatives, relative to the install root.
        bool isDir;
    };

    struct Signature {
        CmsType type;
        std::vector<Indicator> indicators;  ///< The first indicator is the configuration file.
    };

    std::string scanRoot_;
    std::vector<Signature> signatures_;
    std::vector<std::vector<bool>> matched_;
    std::vector<std::string> configPaths_;   ///< Relative path of the matched config file per signature.
    std::vector<std::string> installRoots_;  ///< Relative install root per signature.
};

/**
 * @brief Parses database parameters out of a CMS configuration file.
 *
 * @param type CMS that owns the file.
 * @param content File content.
 * @return The parameters, or std::nullopt when database name or user is missing.
 */
std::optional<DatabaseConfig> parseDatabaseConfig(CmsType type, const std::string& content);

#endif // CMS_DETECTOR_HPP
