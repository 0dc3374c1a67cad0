#pragma once

#include "streamgate/common/CancelToken.h"
#include "streamgate/common/noncopyable.h"
#include "streamgate/upstream/ClientPool.h"
#include "streamgate/upstream/UpstreamClient.h"

#include <cstdint>
#include <string>

namespace streamgate {
namespace upstream {

struct FetchPolicy {
    uint32_t chunkSize{1024 * 1024};
    uint32_t requestAlignment{4096};   // upstream wants request lengths in these units; 0 disables
    int retryAttempts{4};              // total tries per part for transient failures
    int retryBaseMs{250};
    double retryMultiplier{2.0};
    int retryMaxMs{4000};

    // Throws std::invalid_argument.
    void Validate() const;
    // Sleep before retry number `retry` (1 based).
    int BackoffMs(int retry) const;
};

// Splits the inclusive byte range [first, last] into chunk-aligned upstream
// requests. Part i starts at firstOffset + i * chunkSize; only the bytes in
// [CutBegin(i), CutEnd(i)) of its payload belong to the range.
struct RangePlan {
    uint64_t first{0};
    uint64_t last{0};
    uint32_t chunkSize{0};
    uint64_t firstOffset{0};
    uint64_t partCount{0};
    uint32_t firstCut{0};
    uint32_t lastCut{0};

    static RangePlan Make(uint64_t first, uint64_t last, uint32_t chunkSize);

    uint64_t PartOffset(uint64_t part) const { return firstOffset + part * chunkSize; }
    uint32_t CutBegin(uint64_t part) const { return part == 0 ? firstCut : 0; }
    uint32_t CutEnd(uint64_t part) const { return part + 1 == partCount ? lastCut : chunkSize; }
    // Bytes to ask upstream for: whole chunks, except the final part which is
    // rounded up to the alignment only.
    uint32_t RequestLength(uint64_t part, uint32_t alignment) const;
    uint64_t TotalBytes() const { return last - first + 1; }
};

// Lazy, finite sequence of the bytes in [first, last] read through one
// leased client. Next() blocks on upstream I/O and must run on a worker
// thread. Not restartable; make a new stream to resume elsewhere.
class RangeStream : streamgate::common::noncopyable {
public:
    enum class Status {
        kOk,                  // *chunk holds the next bytes
        kDone,                // range fully produced
        kCancelled,
        kFloodWaited,         // handle marked; retry with another handle
        kClientLost,          // credential revoked and handle disabled
        kTransientExhausted,  // retry budget spent
        kClientUnavailable,   // pool shut down under us
        kNotFound,
        kFailed,
    };

    RangeStream(ClientPool* pool,
                ClientHandleWeak handle,
                UpstreamClientPtr client,
                std::string fileRef,
                uint64_t first,
                uint64_t last,
                const FetchPolicy& policy,
                streamgate::common::CancelTokenPtr cancel);

    Status Next(std::string* chunk);

    // Absolute offset of the next byte Next() would produce.
    uint64_t NextOffset() const { return nextOffset_; }
    uint64_t BytesProduced() const { return nextOffset_ - plan_.first; }
    uint64_t FetchCount() const { return fetches_; }
    const UpstreamError& lastError() const { return lastError_; }
    const RangePlan& plan() const { return plan_; }

    static const char* StatusName(Status status);

private:
    ClientPool* pool_;
    ClientHandleWeak handle_;
    UpstreamClientPtr client_;
    const std::string fileRef_;
    const FetchPolicy policy_;
    const RangePlan plan_;
    streamgate::common::CancelTokenPtr cancel_;

    uint64_t part_{0};
    uint64_t nextOffset_;
    uint64_t fetches_{0};
    UpstreamError lastError_;
};

// getFileMeta through a leased client, with the same retry, flood-wait and
// revocation handling as chunk fetches. Blocks; run on a worker thread.
MetaResult FetchFileMeta(ClientPool* pool,
                         const ClientHandleWeak& handle,
                         const UpstreamClientPtr& client,
                         const std::string& fileRef,
                         const FetchPolicy& policy,
                         const streamgate::common::CancelTokenPtr& cancel);

} // namespace upstream
} // namespace streamgate
