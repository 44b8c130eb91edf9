#include "fake_remote_session.hpp"
#include "migration_api.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace std::chrono_literals;

namespace {

const AppConfig& testConfig() {
    static AppConfig config;
    return config;
}

struct Fixture {
    std::shared_ptr<FakeFileSystem> source = std::make_shared<FakeFileSystem>();
    std::shared_ptr<FakeFileSystem> dest = std::make_shared<FakeFileSystem>();
    JobOrchestrator jobs{testConfig(), Logger::quiet()};

    Fixture() {
        source->addFile("/site/index.php", "<?php echo 1;");
        source->addFile("/site/css/app.css", "body{}");
        source->addFile("/site/img/logo.png", std::string(64, 'p'));
    }

    SessionFactory factory() const {
        return fakeFactory({{"src.example", source}, {"dst.example", dest}});
    }
};

ProbeResult probedSftp(const std::string& host, const std::string& root) {
    ProbeResult probe;
    probe.success = true;
    probe.endpoint = fakeEndpoint(host, root);
    probe.endpoint.password.clear();
    probe.capabilities.canRead = true;
    probe.capabilities.canList = true;
    probe.capabilities.canWrite = true;
    probe.performance.latencyMs = 15;
    return probe;
}

void testScanJob() {
    Fixture fixture;
    MigrationAPI api(testConfig(), Logger::quiet(), fixture.jobs, fixture.factory());
    auto id = api.scan(fakeEndpoint("src.example", "/site"), ScanLimits{}, ScanOptions{});
    assert(id);
    assert(fixture.jobs.waitFor(*id, 5s));
    auto job = api.getJob(*id);
    assert(job && job->type == JobType::Scan);
    assert(job->status == JobStatus::Completed);
    auto result = std::get<std::shared_ptr<const ScanResult>>(job->result);
    assert(result->stats.totalFiles == 3);
    assert(result->stats.totalDirs == 2);
    assert(job->source.password.empty());
    std::cout << "✓ Scan runs as a background job\n";
}

void testScanFailure() {
    Fixture fixture;
    fixture.source->openError = ErrorInfo{ErrorKind::AuthFailed, "Authentication failed for deploy"};
    MigrationAPI api(testConfig(), Logger::quiet(), fixture.jobs, fixture.factory());
    auto id = api.scan(fakeEndpoint("src.example", "/site"), ScanLimits{}, ScanOptions{});
    assert(id);
    assert(fixture.jobs.waitFor(*id, 5s));
    auto job = api.getJob(*id);
    assert(job->status == JobStatus::Failed);
    assert(job->errorMessage && job->errorMessage->find("Authentication failed") != std::string::npos);
    assert(api.deleteJob(*id));
    assert(!api.getJob(*id));
    std::cout << "✓ Failed scan ends as a failed job\n";
}

void testValidationCreatesNoJob() {
    Fixture fixture;
    MigrationAPI api(testConfig(), Logger::quiet(), fixture.jobs, fixture.factory());
    auto scan = api.scan(fakeEndpoint("src.example", "../etc"), ScanLimits{}, ScanOptions{});
    assert(!scan && scan.error().kind == ErrorKind::ValidationError);

    TransferOptions options;
    options.bandwidthLimitMiB = -1;
    TransferStrategy strategy;
    strategy.method = TransferMethod::StreamingCopy;
    auto transfer = api.startTransfer(strategy, fakeEndpoint("src.example", "/site"), fakeEndpoint("dst.example", "/www"), options);
    assert(!transfer && transfer.error().kind == ErrorKind::ValidationError);

    auto probe = api.probe(fakeEndpoint("", "/site"));
    assert(!probe && probe.error().kind == ErrorKind::ValidationError);
    assert(api.listJobs().empty());
    assert(fixture.source->created == 0);
    std::cout << "✓ Invalid requests rejected without creating jobs\n";
}

void testPlanJob() {
    Fixture fixture;
    MigrationAPI api(testConfig(), Logger::quiet(), fixture.jobs, fixture.factory());
    ScanResult scan;
    scan.success = true;
    scan.config = fakeEndpoint("src.example", "/site");
    scan.stats.totalFiles = 3;
    scan.stats.totalSize = 83;

    auto plan = api.plan(scan, probedSftp("src.example", "/site"), probedSftp("dst.example", "/www"));
    assert(plan && plan->success);
    assert(plan->recommended);
    auto plans = api.listJobs(JobStatus::Completed);
    assert(plans.size() == 1);
    assert(plans.front().type == JobType::Plan);
    assert(std::get<std::shared_ptr<const PlanResult>>(plans.front().result)->strategies.size() == plan->strategies.size());

    auto source = probedSftp("src.example", "/site");
    source.success = false;
    auto failed = api.plan(scan, source, probedSftp("dst.example", "/www"));
    assert(failed && !failed->success);
    assert(api.listJobs(JobStatus::Failed).size() == 1);
    std::cout << "✓ Plans recorded as plan jobs\n";
}

void testStreamingTransfer() {
    Fixture fixture;
    MigrationAPI api(testConfig(), Logger::quiet(), fixture.jobs, fixture.factory());
    TransferStrategy strategy;
    strategy.method = TransferMethod::StreamingCopy;
    auto id = api.startTransfer(strategy, fakeEndpoint("src.example", "/site"), fakeEndpoint("dst.example", "/www"), TransferOptions{});
    assert(id);
    assert(fixture.jobs.waitFor(*id, 5s));
    auto job = api.getJob(*id);
    assert(job->status == JobStatus::Completed);
    assert(job->method == "streaming-copy");
    auto result = std::get<std::shared_ptr<const TransferResult>>(job->result);
    assert(result->filesTransferred == 3);
    assert(fixture.dest->content("/www/img/logo.png") == std::string(64, 'p'));
    assert(!api.pauseJob(*id));
    std::cout << "✓ Streaming transfer runs as a background job\n";
}

void testMissingExecutor() {
    Fixture fixture;
    MigrationAPI api(testConfig(), Logger::quiet(), fixture.jobs, fixture.factory(),
                     [](TransferMethod) { return std::unique_ptr<TransferExecutor>(); });
    TransferStrategy strategy;
    strategy.method = TransferMethod::ArchiveStream;
    auto id = api.startTransfer(strategy, fakeEndpoint("src.example", "/site"), fakeEndpoint("dst.example", "/www"), TransferOptions{});
    assert(!id && id.error().kind == ErrorKind::UnsupportedCapability);
    assert(api.listJobs().empty());
    std::cout << "✓ Methods without an executor rejected\n";
}

void testUnknownJob() {
    Fixture fixture;
    MigrationAPI api(testConfig(), Logger::quiet(), fixture.jobs, fixture.factory());
    assert(api.getJob("ffffffffffffffff").error().kind == ErrorKind::JobNotFound);
    assert(api.cancelJob("ffffffffffffffff").error().kind == ErrorKind::JobNotFound);
    assert(!api.subscribe("ffffffffffffffff"));
    std::cout << "✓ Unknown job ids reported as not found\n";
}

} // namespace

int main() {
    testScanJob();
    testScanFailure();
    testValidationCreatesNoJob();
    testPlanJob();
    testStreamingTransfer();
    testMissingExecutor();
    testUnknownJob();
    return 0;
}
