#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace streamgate {
namespace upstream {

// Immutable once fetched.
struct FileMeta {
    std::string fileRef;
    uint64_t sizeBytes{0};
    std::string mimeType;   // may be empty; callers fall back to the file name
    std::string fileName;
    int dcId{0};            // data center holding the file
    std::string uniqueId;   // stable id of the stored file; links carry a prefix of it
};

enum class UpstreamStatus {
    kOk,
    kFloodWait,    // this credential is throttled for retryAfterSec
    kTransient,    // network blip or timeout, worth retrying
    kAuthRevoked,  // credential permanently unusable
    kNotFound,     // file reference does not exist (any more)
    kFatal,        // anything else; not retried
    kNoClient,     // no pool handle could be leased; raised by the gateway, never by a client
};

const char* UpstreamStatusName(UpstreamStatus status);

struct UpstreamError {
    UpstreamStatus status{UpstreamStatus::kOk};
    double retryAfterSec{0.0};
    std::string message;

    bool ok() const { return status == UpstreamStatus::kOk; }

    static UpstreamError FloodWait(double seconds) { return {UpstreamStatus::kFloodWait, seconds, "flood wait"}; }
    static UpstreamError Transient(std::string msg) { return {UpstreamStatus::kTransient, 0.0, std::move(msg)}; }
    static UpstreamError AuthRevoked(std::string msg) { return {UpstreamStatus::kAuthRevoked, 0.0, std::move(msg)}; }
    static UpstreamError NotFound(std::string msg) { return {UpstreamStatus::kNotFound, 0.0, std::move(msg)}; }
    static UpstreamError Fatal(std::string msg) { return {UpstreamStatus::kFatal, 0.0, std::move(msg)}; }
    static UpstreamError NoClient(double retryAfter, std::string msg) {
        return {UpstreamStatus::kNoClient, retryAfter, std::move(msg)};
    }
};

struct ChunkResult {
    UpstreamError error;
    std::string bytes;
};

struct MetaResult {
    UpstreamError error;
    FileMeta meta;
};

// One authenticated connection to the messaging network. Calls block and
// may be issued from several worker threads at once.
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // Up to length bytes starting at offset. Fewer bytes only at end of file.
    virtual ChunkResult FetchChunk(const std::string& fileRef, uint64_t offset, uint32_t length) = 0;
    virtual MetaResult GetFileMeta(const std::string& fileRef) = 0;
};

using UpstreamClientPtr = std::shared_ptr<UpstreamClient>;

} // namespace upstream
} // namespace streamgate
