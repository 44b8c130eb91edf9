#include "json_codec.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

ConnectionConfig endpoint() {
    ConnectionConfig config;
    config.protocol = Protocol::Sftp;
    config.host = "old.example";
    config.port = 2222;
    config.username = "deploy";
    config.password = "hunter2";
    config.rootPath = "/var/www";
    return config;
}

void testSecretsMasked() {
    Json::Value json = toJson(endpoint());
    assert(json["password"].asString() == "******");
    assert(json["ssh_key"].asString().empty());
    assert(json["port"].asInt() == 2222);
    assert(json["root_path"].asString() == "/var/www");
    assert(writeJson(json).find("hunter2") == std::string::npos);
    std::cout << "✓ Secrets masked in serialized endpoints\n";
}

void testTimestamps() {
    std::chrono::system_clock::time_point epoch{};
    assert(formatTimestamp(epoch) == "1970-01-01T00:00:00Z");
    auto parsed = parseTimestamp("2024-05-01T12:30:00Z");
    assert(parsed);
    assert(std::chrono::system_clock::to_time_t(*parsed) == 1714566600);
    assert(formatTimestamp(*parsed) == "2024-05-01T12:30:00Z");
    assert(!parseTimestamp("yesterday"));
    std::cout << "✓ Timestamps formatted and parsed as UTC\n";
}

void testEvents() {
    JobEvent output;
    output.type = JobEventType::Output;
    output.jobId = "0123456789abcdef";
    output.line = "Listing /var/www";
    Json::Value json = toJson(output);
    assert(json["type"].asString() == "output");
    assert(json["job_id"].asString() == "0123456789abcdef");
    assert(json["line"].asString() == "Listing /var/www");
    assert(!json.isMember("progress"));

    JobEvent progress;
    progress.type = JobEventType::Progress;
    TransferProgress transfer;
    transfer.bytesTransferred = 512;
    progress.progress = transfer;
    json = toJson(progress);
    assert(json["progress"]["kind"].asString() == "transfer");

    JobEvent complete;
    complete.type = JobEventType::Complete;
    complete.status = JobStatus::Failed;
    complete.errorMessage = "boom";
    json = toJson(complete);
    assert(json["status"].asString() == "failed");
    assert(json["error_message"].asString() == "boom");
    std::cout << "✓ Events tagged by type\n";
}

void testJob() {
    Job job;
    job.id = "0123456789abcdef";
    job.type = JobType::Transfer;
    job.status = JobStatus::Running;
    job.method = "rsync-over-ssh";
    job.source = endpoint();
    job.source.password.clear();
    Json::Value json = toJson(job);
    assert(json["type"].asString() == "transfer");
    assert(json["status"].asString() == "running");
    assert(json["method"].asString() == "rsync-over-ssh");
    assert(json["source"]["password"].asString().empty());
    assert(json["completed_at"].isNull());
    assert(json["dest"].isNull());
    assert(json["error_message"].isNull());
    std::cout << "✓ Jobs serialized with nullable fields\n";
}

void testHistoryEntries() {
    Json::Value json;
    json["id"] = "abc";
    json["type"] = "transfer";
    json["status"] = "completed";
    json["start_time"] = "2024-05-01T12:00:00Z";
    json["end_time"] = "2024-05-01T12:01:00Z";
    json["total_files"] = 12;
    auto entry = historyEntryFromJson(json);
    assert(entry);
    assert(entry->type == JobType::Transfer);
    assert(entry->totalFiles == 12);
    assert(entry->finishedAt - entry->startedAt == std::chrono::minutes(1));

    Json::Value anonymous = json;
    anonymous.removeMember("id");
    auto missingId = historyEntryFromJson(anonymous);
    assert(!missingId && missingId.error().kind == ErrorKind::ValidationError);

    Json::Value badStatus = json;
    badStatus["status"] = "exploded";
    assert(!historyEntryFromJson(badStatus));

    Json::Value badTime = json;
    badTime["end_time"] = "soon";
    assert(!historyEntryFromJson(badTime));

    Json::Value textCount = json;
    textCount["total_files"] = "abc";
    auto wrongType = historyEntryFromJson(textCount);
    assert(!wrongType && wrongType.error().kind == ErrorKind::ValidationError);

    Json::Value negative = json;
    negative["total_bytes"] = -1;
    assert(!historyEntryFromJson(negative));

    Json::Value objectId = json;
    objectId["id"] = Json::Value(Json::objectValue);
    assert(!historyEntryFromJson(objectId));
    assert(!historyEntryFromJson(Json::Value("stray")));
    std::cout << "✓ History entries validated on load\n";
}

} // namespace

int main() {
    testSecretsMasked();
    testTimestamps();
    testEvents();
    testJob();
    testHistoryEntries();
    return 0;
}
