#include "app_config.hpp"
#include "connection_config.hpp"
#include "scanner.hpp"
#include "transfer.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

ConnectionConfig validConfig() {
    ConnectionConfig config;
    config.protocol = Protocol::Sftp;
    config.host = "example.com";
    config.port = 22;
    config.username = "deploy";
    config.rootPath = "/var/www";
    return config;
}

void testAcceptsValidConfig() {
    assert(validateConnectionConfig(validConfig()));
    std::cout << "✓ Valid connection config accepted\n";
}

void testRejectsMalformedConfigs() {
    auto config = validConfig();
    config.host = "";
    assert(!validateConnectionConfig(config));
    assert(validateConnectionConfig(config).error().kind == ErrorKind::ValidationError);

    config = validConfig();
    config.host = "bad host";
    assert(!validateConnectionConfig(config));

    config = validConfig();
    config.port = 0;
    assert(!validateConnectionConfig(config));
    config.port = 65536;
    assert(!validateConnectionConfig(config));

    config = validConfig();
    config.username = "   ";
    assert(!validateConnectionConfig(config));
    std::cout << "✓ Malformed host, port and username rejected\n";
}

void testRootPathRules() {
    auto config = validConfig();
    config.rootPath = "var/www";
    auto relative = validateConnectionConfig(config);
    assert(!relative);
    assert(relative.error().message.find("absolute") != std::string::npos);

    config.rootPath = "/var/www/../etc";
    auto traversal = validateConnectionConfig(config);
    assert(!traversal);
    assert(traversal.error().message.find("traversal") != std::string::npos);

    config.rootPath = std::string("/var/\x01www");
    assert(!validateConnectionConfig(config));

    config.rootPath = "/" + std::string(5000, 'a');
    assert(!validateConnectionConfig(config));
    std::cout << "✓ Root path must be absolute, bounded and traversal free\n";
}

void testConfigFromJson() {
    Json::Value json;
    json["protocol"] = "FTP";
    json["host"] = "ftp.example.com";
    json["username"] = "site";
    json["root_path"] = "/public_html";
    auto config = connectionConfigFromJson(json);
    assert(config);
    assert(config->protocol == Protocol::Ftp);
    assert(config->port == 21);

    json["protocol"] = "gopher";
    auto unknown = connectionConfigFromJson(json);
    assert(!unknown);
    assert(unknown.error().kind == ErrorKind::ValidationError);

    json["protocol"] = "sftp";
    json["port"] = "twenty-two";
    assert(!connectionConfigFromJson(json));
    std::cout << "✓ Connection config parsed from JSON with protocol default ports\n";
}

void testConfigFieldTypes() {
    Json::Value json;
    json["protocol"] = "sftp";
    json["host"] = "example.com";
    json["username"] = "deploy";
    json["root_path"] = "/var/www";
    assert(connectionConfigFromJson(json));

    Json::Value hugePort = json;
    hugePort["port"] = Json::Value(static_cast<Json::Int64>(99999999999LL));
    auto overflow = connectionConfigFromJson(hugePort);
    assert(!overflow && overflow.error().kind == ErrorKind::ValidationError);

    Json::Value outOfRange = json;
    outOfRange["port"] = 70000;
    assert(!connectionConfigFromJson(outOfRange));

    Json::Value objectHost = json;
    objectHost["host"] = Json::Value(Json::objectValue);
    auto host = connectionConfigFromJson(objectHost);
    assert(!host && host.error().kind == ErrorKind::ValidationError);
    assert(host.error().message.starts_with("host"));

    Json::Value arrayRoot = json;
    arrayRoot["root_path"] = Json::Value(Json::arrayValue);
    auto root = connectionConfigFromJson(arrayRoot);
    assert(!root && root.error().message.starts_with("root_path"));

    Json::Value numericPassword = json;
    numericPassword["password"] = 1234;
    assert(!connectionConfigFromJson(numericPassword));

    Json::Value listProtocol = json;
    listProtocol["protocol"] = Json::Value(Json::arrayValue);
    assert(!connectionConfigFromJson(listProtocol));

    Json::Value nullKey = json;
    nullKey["ssh_key"] = Json::Value();
    auto defaults = connectionConfigFromJson(nullKey);
    assert(defaults && defaults->sshKey.empty() && defaults->port == 22);
    std::cout << "✓ Wrongly typed connection fields rejected\n";
}

bool rejected(const Json::Value& json) {
    AppConfig config;
    try {
        config.apply(json);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void testAppConfigRanges() {
    Json::Value tuned;
    tuned["job_retention_hours"] = 48;
    tuned["probe"]["speed_test_bytes"] = 1024;
    tuned["scan"]["max_depth"] = 5;
    tuned["transfer"]["parallel_connections"] = 8;
    AppConfig config;
    config.apply(tuned);
    assert(config.jobRetention == std::chrono::hours(48));
    assert(config.speedTestBytes == 1024);
    assert(config.scanMaxDepth == 5);
    assert(config.parallelConnections == 8);
    assert(config.bufferSize == 32 * 1024);

    Json::Value negativeRetention;
    negativeRetention["job_retention_hours"] = -5;
    assert(rejected(negativeRetention));

    Json::Value hugeSample;
    hugeSample["probe"]["speed_test_bytes"] = Json::Value(static_cast<Json::UInt64>(1) << 40);
    assert(rejected(hugeSample));

    Json::Value negativeBuffer;
    negativeBuffer["transfer"]["buffer_size"] = -1;
    assert(rejected(negativeBuffer));

    Json::Value textInterval;
    textInterval["cleanup_interval_minutes"] = "hourly";
    assert(rejected(textInterval));

    Json::Value deepScan;
    deepScan["scan"]["max_depth"] = ScanLimits::kMaxDepth + 1;
    assert(rejected(deepScan));

    Json::Value badSection;
    badSection["transfer"] = 4;
    assert(rejected(badSection));
    std::cout << "✓ Out-of-range settings rejected\n";
}

void testScanLimits() {
    ScanOptions options;
    assert(validateScanRequest(validConfig(), ScanLimits{}, options));
    assert(!validateScanRequest(validConfig(), ScanLimits{-1, 0}, options));
    assert(!validateScanRequest(validConfig(), ScanLimits{ScanLimits::kMaxDepth + 1, 0}, options));
    assert(!validateScanRequest(validConfig(), ScanLimits{0, ScanLimits::kMaxFiles + 1}, options));
    assert(validateScanRequest(validConfig(), ScanLimits{ScanLimits::kMaxDepth, ScanLimits::kMaxFiles}, options));

    options.customExclusions = {""};
    assert(!validateScanRequest(validConfig(), ScanLimits{}, options));
    std::cout << "✓ Scan limits bounded\n";
}

void testTransferOptions() {
    TransferOptions options;
    assert(validateTransferOptions(options));
    options.bandwidthLimitMiB = -1;
    assert(!validateTransferOptions(options));
    options.bandwidthLimitMiB = TransferOptions::kMaxBandwidthMiB + 1;
    assert(!validateTransferOptions(options));
    options.bandwidthLimitMiB = 5;
    options.skipLargeFilesMiB = -3;
    assert(!validateTransferOptions(options));
    std::cout << "✓ Transfer options validated\n";
}

} // namespace

int main() {
    testAcceptsValidConfig();
    testRejectsMalformedConfigs();
    testRootPathRules();
    testConfigFromJson();
    testConfigFieldTypes();
    testAppConfigRanges();
    testScanLimits();
    testTransferOptions();
    return 0;
}
