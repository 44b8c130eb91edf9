#include "fake_remote_session.hpp"
#include "scanner.hpp"
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

std::shared_ptr<FakeFileSystem> smallSite() {
    auto fs = std::make_shared<FakeFileSystem>();
    fs->addFile("/site/a.txt", std::string(10, 'a'));
    fs->addFile("/site/dir1/b.php", std::string(20, 'b'));
    fs->addFile("/site/dir1/dir2/c.js", std::string(30, 'c'));
    return fs;
}

ScanResult scanWith(const std::shared_ptr<FakeFileSystem>& fs, ScanLimits limits = {}, ScanOptions options = {},
                    const ScanProgressCallback& onProgress = {}) {
    TreeScanner scanner(testConfig(), Logger::quiet(), fakeFactory(fs));
    return scanner.scan(fakeEndpoint("source.example", "/site"), limits, options, onProgress);
}

void testTotals() {
    auto fs = smallSite();
    std::vector<ScanProgress> snapshots;
    auto result = scanWith(fs, {}, {}, [&](const ScanProgress& progress) { snapshots.push_back(progress); });
    assert(result.success);
    assert(result.stats.totalFiles == 3);
    assert(result.stats.totalDirs == 2);
    assert(result.stats.totalSize == 60);
    assert(result.stats.maxDepth == 3);
    assert(result.stats.excludedCount == 0);
    assert(!result.stats.truncated);
    assert(result.stats.extensionCounts.at(".php") == 1);
    assert(result.stats.extensionSizes.at(".js") == 30);
    assert(result.stats.largestFiles.front().name == "c.js");
    assert(result.files && result.files->size() == 5);
    assert(!snapshots.empty());
    assert(snapshots.back().status == ScanStatus::Complete);
    assert(snapshots.back().percentComplete == 100);
    assert(fs->opened == 1 && fs->closed == 1);
    std::cout << "✓ Scan totals, extensions and largest files\n";
}

void testDepthBound() {
    auto result = scanWith(smallSite(), ScanLimits{1, 0});
    assert(result.success);
    assert(result.stats.truncated);
    assert(result.stats.totalFiles == 2);
    assert(std::ranges::none_of(*result.files, [](const FileEntry& entry) { return entry.name == "c.js"; }));
    std::cout << "✓ Depth bound truncates the walk\n";
}

void testFileBound() {
    auto result = scanWith(smallSite(), ScanLimits{0, 2});
    assert(result.success);
    assert(result.stats.truncated);
    assert(result.stats.totalFiles == 2);
    std::cout << "✓ File bound truncates the walk\n";
}

void testHiddenEntries() {
    auto fs = smallSite();
    fs->addFile("/site/.env", "APP_KEY=1");
    auto hidden = scanWith(fs);
    assert(hidden.stats.totalFiles == 3);

    ScanOptions options;
    options.includeHidden = true;
    auto shown = scanWith(fs, {}, options);
    assert(shown.stats.totalFiles == 4);
    std::cout << "✓ Hidden entries skipped unless requested\n";
}

void testUnlistableDirectory() {
    auto fs = smallSite();
    fs->unlistable.insert("/site/dir1");
    auto result = scanWith(fs);
    assert(result.success);
    assert(result.stats.skippedCount == 1);
    assert(result.stats.totalFiles == 1);
    assert(result.stats.totalDirs == 1);
    std::cout << "✓ Unlistable directory skipped and counted\n";
}

void testExcludedFilesStillCounted() {
    auto fs = smallSite();
    fs->addFile("/site/error_log", std::string(5, 'e'));
    fs->addFile("/site/node_modules/pkg/index.js", std::string(7, 'n'));
    ScanOptions options;
    options.customExclusions = {"dir1/dir2"};
    auto result = scanWith(fs, {}, options);
    assert(result.success);
    assert(result.stats.totalFiles == 5);
    assert(result.stats.excludedCount == 3);
    assert(result.stats.excludedSize == 42);
    assert(result.stats.excludedCount <= result.stats.totalFiles);
    assert(result.stats.excludedSize <= result.stats.totalSize);

    auto errorLog = std::ranges::find(*result.files, std::string("/site/error_log"), &FileEntry::path);
    assert(errorLog != result.files->end() && errorLog->excluded && errorLog->excludeReason == "PHP error log");
    assert(std::ranges::any_of(result.exclusions, [](const ExclusionPattern& p) { return p.pattern == "dir1/dir2" && !p.isAutomatic; }));
    std::cout << "✓ Excluded files counted in totals and exclusion stats\n";
}

void testSymlinks() {
    auto fs = smallSite();
    fs->addSymlink("/site/shared", "/site/dir1/dir2");
    auto plain = scanWith(fs);
    assert(plain.stats.symlinksCount == 1);
    assert(plain.stats.totalFiles == 4);
    assert(plain.stats.totalDirs == 2);

    ScanOptions options;
    options.followSymlinks = true;
    auto followed = scanWith(fs, {}, options);
    assert(followed.stats.symlinksCount == 1);
    assert(followed.stats.totalDirs == 3);
    assert(followed.stats.totalFiles == 4);
    assert(std::ranges::any_of(*followed.files, [](const FileEntry& entry) { return entry.path == "/site/shared/c.js"; }));
    std::cout << "✓ Symlinks counted and followed on request\n";
}

void testCmsDetection() {
    auto fs = std::make_shared<FakeFileSystem>();
    fs->addFile("/site/wp-config.php",
        "<?php\ndefine('DB_NAME', 'blog');\ndefine('DB_USER', 'blogger');\ndefine('DB_PASSWORD', 'pw');\ndefine('DB_HOST', 'localhost');\n");
    fs->addFile("/site/wp-load.php", "<?php");
    fs->addFile("/site/wp-settings.php", "<?php");
    fs->addFile("/site/wp-includes/version.php", "<?php\n$wp_version = '6.5';\n");
    fs->addDir("/site/wp-content/uploads");
    fs->addDir("/site/wp-admin");
    auto result = scanWith(fs);
    assert(result.cms.detected);
    assert(result.cms.type == CmsType::WordPress);
    assert(result.cms.databaseConfig && result.cms.databaseConfig->database == "blog");
    assert(result.cms.version == "6.5");

    ScanOptions options;
    options.detectCms = false;
    assert(!scanWith(fs, {}, options).cms.detected);
    std::cout << "✓ CMS detected during the scan\n";
}

void testConnectionFailure() {
    auto fs = smallSite();
    fs->openError = ErrorInfo{ErrorKind::AuthFailed, "Authentication failed"};
    auto result = scanWith(fs);
    assert(!result.success);
    assert(result.errorKind == ErrorKind::AuthFailed);

    auto invalid = scanWith(smallSite(), ScanLimits{-5, 0});
    assert(!invalid.success);
    assert(invalid.errorKind == ErrorKind::ValidationError);
    std::cout << "✓ Login and validation failures reported\n";
}

void testFormatBytes() {
    assert(formatBytes(512) == "512 B");
    assert(formatBytes(1536) == "1.5 KB");
    assert(formatBytes(1024ULL * 1024 * 1024) == "1.0 GB");
    std::cout << "✓ Byte counts formatted\n";
}

} // namespace

int main() {
    testTotals();
    testDepthBound();
    testFileBound();
    testHiddenEntries();
    testUnlistableDirectory();
    testExcludedFilesStillCounted();
    testSymlinks();
    testCmsDetection();
    testConnectionFailure();
    testFormatBytes();
    return 0;
}
