#include "cms_detector.hpp"
#include <cassert>
#include <iostream>
#include <map>
#include <string>

namespace {

const char* kWordPressConfig = R"(<?php
define( 'DB_NAME', 'shop_wp' );
define( 'DB_USER', 'wp_user' );
define( 'DB_PASSWORD', 's3cr3t' );
define( 'DB_HOST', 'db.internal:3307' );
$table_prefix = 'wpx_';
)";

RemoteFileReader readerFor(std::map<std::string, std::string> files) {
    return [files = std::move(files)](const std::string& path) -> std::optional<std::string> {
        auto it = files.find(path);
        if (it == files.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

void testWordPressConfig() {
    auto config = parseDatabaseConfig(CmsType::WordPress, kWordPressConfig);
    assert(config);
    assert(config->database == "shop_wp");
    assert(config->username == "wp_user");
    assert(config->password == "s3cr3t");
    assert(config->host == "db.internal");
    assert(config->port == 3307);
    assert(config->prefix == "wpx_");

    assert(!parseDatabaseConfig(CmsType::WordPress, "<?php // nothing here"));
    assert(!parseDatabaseConfig(CmsType::Unknown, kWordPressConfig));
    std::cout << "✓ WordPress database config parsed\n";
}

void testUnusablePortKeepsDefault() {
    auto overflow = parseDatabaseConfig(CmsType::WordPress,
        "define('DB_NAME','blog');define('DB_USER','u');define('DB_HOST','db:99999999999');");
    assert(overflow);
    assert(overflow->host == "db");
    assert(overflow->port == 3306);

    auto outOfRange = parseDatabaseConfig(CmsType::WordPress,
        "define('DB_NAME','blog');define('DB_USER','u');define('DB_HOST','db:70000');");
    assert(outOfRange && outOfRange->port == 3306);

    auto socket = parseDatabaseConfig(CmsType::WordPress,
        "define('DB_NAME','blog');define('DB_USER','u');define('DB_HOST','localhost:/run/mysqld/mysqld.sock');");
    assert(socket && socket->host == "localhost" && socket->port == 3306);

    CmsDetector detector("/var/www");
    for (const char* dir : {"wp-content", "wp-includes", "wp-admin"}) {
        detector.observe(dir, true);
    }
    for (const char* file : {"wp-config.php", "wp-load.php", "wp-settings.php"}) {
        detector.observe(file, false);
    }
    auto detection = detector.result(readerFor({
        {"/var/www/wp-config.php", "<?php\ndefine('DB_NAME','blog');\ndefine('DB_USER','u');\ndefine('DB_HOST','db:99999999999');\n"},
    }));
    assert(detection.detected);
    assert(detection.databaseConfig && detection.databaseConfig->port == 3306);
    std::cout << "✓ Unusable database ports fall back to 3306\n";
}

void testOtherConfigs() {
    auto presta = parseDatabaseConfig(CmsType::PrestaShop,
        "define('_DB_SERVER_', 'localhost');\ndefine('_DB_NAME_', 'presta');\ndefine('_DB_USER_', 'ps');\n"
        "define('_DB_PASSWD_', 'pw');\ndefine('_DB_PREFIX_', 'ps_');\n");
    assert(presta && presta->database == "presta" && presta->prefix == "ps_");

    auto presta17 = parseDatabaseConfig(CmsType::PrestaShop,
        "'parameters' => array(\n'database_host' => '127.0.0.1',\n'database_port' => '3310',\n"
        "'database_name' => 'ps17',\n'database_user' => 'ps',\n'database_password' => 'pw',\n");
    assert(presta17 && presta17->database == "ps17" && presta17->port == 3310);

    auto drupal = parseDatabaseConfig(CmsType::Drupal,
        "$databases['default']['default'] = array (\n'database' => 'drupal',\n'username' => 'dru',\n"
        "'password' => 'pw',\n'host' => 'localhost',\n'port' => '3306',\n'prefix' => '',\n);\n");
    assert(drupal && drupal->database == "drupal" && drupal->username == "dru");

    auto joomla = parseDatabaseConfig(CmsType::Joomla,
        "class JConfig {\npublic $host = 'localhost';\npublic $user = 'joom';\npublic $password = 'pw';\n"
        "public $db = 'joomla';\npublic $dbprefix = 'jos_';\n}");
    assert(joomla && joomla->database == "joomla" && joomla->prefix == "jos_");

    auto magento = parseDatabaseConfig(CmsType::Magento,
        "'db' => ['table_prefix' => 'mg_', 'connection' => ['default' => ['host' => 'localhost',"
        " 'dbname' => 'magento', 'username' => 'mage', 'password' => 'pw']]]");
    assert(magento && magento->database == "magento" && magento->prefix == "mg_");
    std::cout << "✓ PrestaShop, Drupal, Joomla and Magento configs parsed\n";
}

void testDetectsWordPress() {
    CmsDetector detector("/var/www");
    for (const char* dir : {"wp-content", "wp-includes", "wp-admin"}) {
        detector.observe(dir, true);
    }
    for (const char* file : {"wp-config.php", "wp-load.php", "wp-settings.php", "index.php"}) {
        detector.observe(file, false);
    }
    auto detection = detector.result(readerFor({
        {"/var/www/wp-config.php", kWordPressConfig},
        {"/var/www/wp-includes/version.php", "<?php\n$wp_version = '6.4.2';\n"},
    }));
    assert(detection.detected);
    assert(detection.type == CmsType::WordPress);
    assert(detection.confidence == 1.0);
    assert(detection.indicators.size() == 6);
    assert(detection.rootPath == "/var/www");
    assert(detection.configFile == "/var/www/wp-config.php");
    assert(detection.databaseConfig && detection.databaseConfig->database == "shop_wp");
    assert(detection.version == "6.4.2");
    std::cout << "✓ WordPress detected with database config and version\n";
}

void testNestedInstall() {
    CmsDetector detector("/home/site");
    detector.observe("public_html/configuration.php", false);
    detector.observe("public_html/administrator", true);
    detector.observe("public_html/components", true);
    detector.observe("public_html/libraries", true);
    auto detection = detector.result({});
    assert(detection.detected);
    assert(detection.type == CmsType::Joomla);
    assert(detection.confidence == 0.8);
    assert(detection.rootPath == "/home/site/public_html");
    assert(detection.configFile == "/home/site/public_html/configuration.php");
    assert(!detection.databaseConfig);
    std::cout << "✓ Install root found below the scan root\n";
}

void testBelowThreshold() {
    CmsDetector detector("/srv");
    detector.observe("wp-content", true);
    detector.observe("wp-admin", true);
    auto detection = detector.result({});
    assert(!detection.detected);
    assert(detection.type == CmsType::Unknown);
    assert(detection.confidence >= 0.0 && detection.confidence <= 1.0);
    assert(cmsTypeName(detection.type) == "unknown");
    std::cout << "✓ Weak evidence is not a detection\n";
}

void testDirectoryIndicatorsNeedDirectories() {
    CmsDetector detector("/srv");
    detector.observe("app/etc/env.php", false);
    detector.observe("app/etc", false);
    detector.observe("app/code", false);
    auto detection = detector.result({});
    assert(!detection.detected);
    std::cout << "✓ Directory indicators ignore files\n";
}

} // namespace

int main() {
    testWordPressConfig();
    testUnusablePortKeepsDefault();
    testOtherConfigs();
    testDetectsWordPress();
    testNestedInstall();
    testBelowThreshold();
    testDirectoryIndicatorsNeedDirectories();
    return 0;
}
