#include "streamgate/stream/MetadataLoad.h"
#include "streamgate/common/Logger.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/stream/StreamSession.h"
#include "streamgate/upstream/ChunkFetcher.h"

#include <algorithm>

namespace streamgate {
namespace stream {

using upstream::ClientPool;
using upstream::MetaResult;
using upstream::UpstreamError;
using upstream::UpstreamStatus;

void MetadataLoad::Start(const SessionDeps& deps,
                         network::EventLoop* loop,
                         const std::string& fileRef,
                         MetadataCache::Completion complete,
                         const streamgate::common::CancelTokenPtr& cancel) {
    auto load = std::make_shared<MetadataLoad>(deps, loop, fileRef, std::move(complete), cancel);
    loop->RunInLoop([load] { load->Begin(); });
}

MetadataLoad::MetadataLoad(const SessionDeps& deps,
                           network::EventLoop* loop,
                           std::string fileRef,
                           MetadataCache::Completion complete,
                           streamgate::common::CancelTokenPtr cancel)
    : deps_(deps),
      loop_(loop),
      fileRef_(std::move(fileRef)),
      complete_(std::move(complete)),
      cancel_(std::move(cancel)) {}

void MetadataLoad::ResetAcquireDeadline() {
    acquireDeadline_ = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(deps_.options.acquireTimeoutSec));
}

void MetadataLoad::Begin() {
    std::weak_ptr<MetadataLoad> weak(shared_from_this());
    network::EventLoop* loop = loop_;
    cancel_->OnCancel([weak, loop] {
        loop->RunInLoop([weak] {
            if (auto self = weak.lock()) self->Abort();
        });
    });
    if (done_) return;
    if (deps_.options.metaTimeoutSec > 0.0) {
        deadlineTimer_ = loop_->RunAfter(deps_.options.metaTimeoutSec, [weak] {
            if (auto self = weak.lock()) self->OnDeadline();
        });
    }
    ResetAcquireDeadline();
    Attempt();
}

void MetadataLoad::Attempt() {
    if (done_) return;
    ClientPool::AcquireResult result = deps_.pool->Acquire(std::nullopt);
    switch (result.status) {
        case ClientPool::AcquireStatus::kOk:
            Load(std::move(result.lease));
            return;
        case ClientPool::AcquireStatus::kUnavailable:
            Finish(MetaResult{UpstreamError::NoClient(0.0, "no usable client"), {}});
            return;
        case ClientPool::AcquireStatus::kBlocked:
            break;
    }

    const auto now = std::chrono::steady_clock::now();
    const double retryAfterSec = std::chrono::duration<double>(result.retryAfter).count();
    if (now >= acquireDeadline_) {
        LOG_WARN << "MetadataLoad: no client for " << fileRef_ << " within " << deps_.options.acquireTimeoutSec
                 << "s";
        Finish(MetaResult{UpstreamError::NoClient(retryAfterSec, "no client became available"), {}});
        return;
    }
    const double remaining = std::chrono::duration<double>(acquireDeadline_ - now).count();
    double delay = deps_.options.acquireRetrySec;
    if (retryAfterSec > 0.0) delay = std::max(delay, std::min(retryAfterSec, remaining));
    delay = std::min(delay, remaining);

    auto self = shared_from_this();
    retryTimer_ = loop_->RunAfter(delay, [self] {
        self->retryTimer_ = 0;
        self->Attempt();
    });
}

void MetadataLoad::Load(ClientPool::LeasePtr lease) {
    lease_ = std::move(lease);
    upstream::UpstreamClientPtr client = lease_->client();
    if (!client) {
        Finish(MetaResult{UpstreamError::NoClient(0.0, "client pool shut down"), {}});
        return;
    }

    const uint64_t attempt = ++attempt_;
    auto self = shared_from_this();
    ClientPool* pool = deps_.pool;
    const upstream::ClientHandleWeak handle = lease_->handle();
    const upstream::FetchPolicy policy = deps_.options.fetch;
    const std::string fileRef = fileRef_;
    const streamgate::common::CancelTokenPtr cancel = cancel_;
    const bool submitted = deps_.workers->Submit([self, pool, handle, client, policy, fileRef, cancel, attempt] {
        MetaResult result = upstream::FetchFileMeta(pool, handle, client, fileRef, policy, cancel);
        self->loop_->RunInLoop([self, attempt, result] { self->OnResult(attempt, result); });
    });
    if (!submitted) Finish(MetaResult{UpstreamError::NoClient(0.0, "worker pool stopped"), {}});
}

void MetadataLoad::OnResult(uint64_t attempt, const MetaResult& result) {
    if (done_ || attempt != attempt_) return;
    if (lease_) lease_->Release();
    lease_.reset();

    const UpstreamStatus status = result.error.status;
    const bool handleProblem = status == UpstreamStatus::kFloodWait || status == UpstreamStatus::kAuthRevoked;
    if (handleProblem && reacquires_ < deps_.options.maxReacquire) {
        ++reacquires_;
        LOG_INFO << "MetadataLoad: " << fileRef_ << " hit " << upstream::UpstreamStatusName(status)
                 << ", trying another client";
        ResetAcquireDeadline();
        Attempt();
        return;
    }
    Finish(result);
}

void MetadataLoad::OnDeadline() {
    deadlineTimer_ = 0;
    if (done_) return;
    LOG_WARN << "MetadataLoad: " << fileRef_ << " not loaded within " << deps_.options.metaTimeoutSec << "s";
    Finish(MetaResult{UpstreamError::Transient("metadata load timed out"), {}});
    // Wakes a backoff sleep in the worker.
    cancel_->Cancel();
}

void MetadataLoad::Abort() {
    if (done_) return;
    done_ = true;
    LOG_DEBUG << "MetadataLoad: " << fileRef_ << " abandoned, releasing its client";
    Stop();
}

void MetadataLoad::Finish(const MetaResult& result) {
    if (done_) return;
    done_ = true;
    Stop();
    complete_(result);
}

void MetadataLoad::Stop() {
    if (retryTimer_) {
        loop_->CancelTimer(retryTimer_);
        retryTimer_ = 0;
    }
    if (deadlineTimer_) {
        loop_->CancelTimer(deadlineTimer_);
        deadlineTimer_ = 0;
    }
    if (lease_) lease_->Release();
    lease_.reset();
}

} // namespace stream
} // namespace streamgate
