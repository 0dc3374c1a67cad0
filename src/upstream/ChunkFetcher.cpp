#include "streamgate/upstream/ChunkFetcher.h"
#include "streamgate/common/Logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace streamgate {
namespace upstream {

void FetchPolicy::Validate() const {
    if (chunkSize == 0) {
        throw std::invalid_argument("fetch: chunk_size must be > 0");
    }
    if (requestAlignment != 0 && chunkSize % requestAlignment != 0) {
        throw std::invalid_argument("fetch: chunk_size must be a multiple of request_alignment");
    }
    if (retryAttempts < 1) {
        throw std::invalid_argument("fetch: retry_attempts must be >= 1");
    }
    if (retryBaseMs < 0 || retryMaxMs < 0 || retryMultiplier < 1.0) {
        throw std::invalid_argument("fetch: invalid backoff schedule");
    }
}

int FetchPolicy::BackoffMs(int retry) const {
    double ms = retryBaseMs * std::pow(retryMultiplier, std::max(0, retry - 1));
    if (ms > retryMaxMs) ms = retryMaxMs;
    return static_cast<int>(ms);
}

RangePlan RangePlan::Make(uint64_t first, uint64_t last, uint32_t chunkSize) {
    if (chunkSize == 0 || first > last) {
        throw std::invalid_argument("RangePlan: empty range or zero chunk size");
    }
    RangePlan p;
    p.first = first;
    p.last = last;
    p.chunkSize = chunkSize;
    p.firstOffset = first - first % chunkSize;
    p.partCount = (last - p.firstOffset) / chunkSize + 1;
    p.firstCut = static_cast<uint32_t>(first % chunkSize);
    p.lastCut = static_cast<uint32_t>(last % chunkSize) + 1;
    return p;
}

uint32_t RangePlan::RequestLength(uint64_t part, uint32_t alignment) const {
    if (part + 1 < partCount) return chunkSize;
    uint64_t len = lastCut;
    if (alignment > 0) {
        len = (len + alignment - 1) / alignment * alignment;
    }
    return static_cast<uint32_t>(std::min<uint64_t>(len, chunkSize));
}

RangeStream::RangeStream(ClientPool* pool,
                         ClientHandleWeak handle,
                         UpstreamClientPtr client,
                         std::string fileRef,
                         uint64_t first,
                         uint64_t last,
                         const FetchPolicy& policy,
                         streamgate::common::CancelTokenPtr cancel)
    : pool_(pool),
      handle_(std::move(handle)),
      client_(std::move(client)),
      fileRef_(std::move(fileRef)),
      policy_(policy),
      plan_(RangePlan::Make(first, last, policy.chunkSize)),
      cancel_(std::move(cancel)),
      nextOffset_(first) {}

RangeStream::Status RangeStream::Next(std::string* chunk) {
    chunk->clear();
    if (part_ >= plan_.partCount) return Status::kDone;
    if (cancel_ && cancel_->IsCancelled()) return Status::kCancelled;
    if (!client_ || handle_.expired()) {
        lastError_ = UpstreamError::Fatal("client handle gone");
        return Status::kClientUnavailable;
    }

    const uint64_t offset = plan_.PartOffset(part_);
    const uint32_t length = plan_.RequestLength(part_, policy_.requestAlignment);
    const uint32_t cutBegin = plan_.CutBegin(part_);
    const uint32_t cutEnd = plan_.CutEnd(part_);

    for (int attempt = 1; attempt <= policy_.retryAttempts; ++attempt) {
        if (cancel_ && cancel_->IsCancelled()) return Status::kCancelled;

        ++fetches_;
        ChunkResult result = client_->FetchChunk(fileRef_, offset, length);
        lastError_ = result.error;

        switch (result.error.status) {
            case UpstreamStatus::kOk:
                if (result.bytes.size() < cutEnd) {
                    lastError_ = UpstreamError::Transient("short read at offset " + std::to_string(offset));
                    break;
                }
                if (pool_) pool_->ReportSuccess(handle_);
                chunk->assign(result.bytes, cutBegin, cutEnd - cutBegin);
                nextOffset_ += chunk->size();
                ++part_;
                return Status::kOk;
            case UpstreamStatus::kFloodWait:
                if (pool_) pool_->MarkFloodWait(handle_, result.error.retryAfterSec);
                return Status::kFloodWaited;
            case UpstreamStatus::kAuthRevoked:
                if (pool_) pool_->MarkDisabled(handle_, result.error.message);
                return Status::kClientLost;
            case UpstreamStatus::kNotFound:
                return Status::kNotFound;
            case UpstreamStatus::kFatal:
            case UpstreamStatus::kNoClient:
                return Status::kFailed;
            case UpstreamStatus::kTransient:
                break;
        }

        // Transient failure or short read.
        if (pool_) pool_->ReportFailure(handle_);
        if (attempt == policy_.retryAttempts) break;
        const int delay = policy_.BackoffMs(attempt);
        LOG_WARN << "RangeStream: " << fileRef_ << " offset " << offset << " attempt " << attempt
                 << " failed (" << lastError_.message << "), retrying in " << delay << "ms";
        if (cancel_) {
            if (cancel_->WaitFor(std::chrono::milliseconds(delay))) return Status::kCancelled;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }

    LOG_ERROR << "RangeStream: " << fileRef_ << " offset " << offset << " gave up after "
              << policy_.retryAttempts << " attempts: " << lastError_.message;
    return Status::kTransientExhausted;
}

MetaResult FetchFileMeta(ClientPool* pool,
                         const ClientHandleWeak& handle,
                         const UpstreamClientPtr& client,
                         const std::string& fileRef,
                         const FetchPolicy& policy,
                         const streamgate::common::CancelTokenPtr& cancel) {
    MetaResult result;
    if (!client || handle.expired()) {
        result.error = UpstreamError::Fatal("client handle gone");
        return result;
    }
    for (int attempt = 1; attempt <= policy.retryAttempts; ++attempt) {
        if (cancel && cancel->IsCancelled()) {
            result.error = UpstreamError::Fatal("cancelled");
            return result;
        }
        result = client->GetFileMeta(fileRef);
        switch (result.error.status) {
            case UpstreamStatus::kOk:
                if (pool) pool->ReportSuccess(handle);
                return result;
            case UpstreamStatus::kFloodWait:
                if (pool) pool->MarkFloodWait(handle, result.error.retryAfterSec);
                return result;
            case UpstreamStatus::kAuthRevoked:
                if (pool) pool->MarkDisabled(handle, result.error.message);
                return result;
            case UpstreamStatus::kNotFound:
            case UpstreamStatus::kFatal:
            case UpstreamStatus::kNoClient:
                return result;
            case UpstreamStatus::kTransient:
                break;
        }
        if (pool) pool->ReportFailure(handle);
        if (attempt == policy.retryAttempts) break;
        const int delay = policy.BackoffMs(attempt);
        LOG_WARN << "FetchFileMeta: " << fileRef << " attempt " << attempt << " failed ("
                 << result.error.message << "), retrying in " << delay << "ms";
        if (cancel) {
            if (cancel->WaitFor(std::chrono::milliseconds(delay))) {
                result.error = UpstreamError::Fatal("cancelled");
                return result;
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
    }
    return result;
}

const char* RangeStream::StatusName(Status status) {
    switch (status) {
        case Status::kOk: return "ok";
        case Status::kDone: return "done";
        case Status::kCancelled: return "cancelled";
        case Status::kFloodWaited: return "flood_waited";
        case Status::kClientLost: return "client_lost";
        case Status::kTransientExhausted: return "transient_exhausted";
        case Status::kClientUnavailable: return "client_unavailable";
        case Status::kNotFound: return "not_found";
        case Status::kFailed: return "failed";
    }
    return "unknown";
}

} // namespace upstream
} // namespace streamgate
