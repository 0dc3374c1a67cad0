#include "streamgate/stream/StreamSession.h"
#include "streamgate/common/Logger.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/network/TcpConnection.h"
#include "streamgate/protocol/ContentHeaders.h"
#include "streamgate/protocol/HttpResponse.h"
#include "streamgate/stream/MetadataLoad.h"

#include <algorithm>
#include <cmath>

namespace streamgate {
namespace stream {

using protocol::HttpResponse;
using upstream::ClientPool;
using upstream::RangeStream;

namespace {

std::string RetryAfterValue(double sec) {
    return std::to_string(static_cast<long long>(std::max(1.0, std::ceil(sec))));
}

} // namespace

StreamSession::StreamSession(const SessionDeps& deps,
                             const network::TcpConnectionPtr& conn,
                             uint64_t requestId,
                             LinkPath link,
                             bool headOnly,
                             bool keepAlive,
                             std::string rangeHeader,
                             protocol::HttpServer::CompletionCallback done)
    : deps_(deps),
      loop_(conn->getLoop()),
      conn_(conn),
      requestId_(requestId),
      linkId_(std::move(link.linkId)),
      nameHint_(std::move(link.name)),
      secureHash_(std::move(link.secureHash)),
      hashGiven_(link.hashGiven),
      headOnly_(headOnly),
      keepAlive_(keepAlive),
      rangeHeader_(std::move(rangeHeader)),
      done_(std::move(done)),
      cancel_(std::make_shared<streamgate::common::CancelToken>()) {
    deps_.stats->SessionStarted();
}

StreamSession::~StreamSession() {
    if (!finished_) {
        cancel_->Cancel();
        if (queued_) deps_.admission->Cancel(requestId_);
        if (metaTicket_) deps_.cache->Leave(link_.fileRef, metaTicket_);
        deps_.stats->SessionEnded();
    }
}

const char* StreamSession::StateName(State state) {
    switch (state) {
        case State::kReceived: return "RECEIVED";
        case State::kMetaResolved: return "META_RESOLVED";
        case State::kAdmitted: return "ADMITTED";
        case State::kStreaming: return "STREAMING";
        case State::kCompleted: return "COMPLETED";
        case State::kFailed: return "FAILED";
        case State::kCancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

network::TcpConnectionPtr StreamSession::LiveConnection() {
    network::TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) return nullptr;
    return conn;
}

void StreamSession::Start() {
    deps_.stats->IncRequests();
    // Syntax is checked now; the 416 waits for the size so Content-Range can carry it.
    rangeSyntaxOk_ = protocol::ParseRangeHeader(rangeHeader_, &rangeSpec_);

    auto self = shared_from_this();
    LinkStore* links = deps_.links;
    const PriorityClassifier* classifier = deps_.classifier;
    const std::string linkId = linkId_;
    const bool submitted = deps_.workers->Submit([self, links, classifier, linkId] {
        std::optional<LinkRecord> link;
        limiter::PriorityClass cls = limiter::PriorityClass::kRegular;
        bool lookupFailed = false;
        try {
            link = links->Lookup(linkId);
            if (link) cls = classifier->Classify(link->ownerUserId);
        } catch (const std::exception& e) {
            LOG_ERROR << "StreamSession: link lookup for " << linkId << " failed: " << e.what();
            lookupFailed = true;
        }
        self->loop_->RunInLoop([self, link, cls, lookupFailed] {
            if (lookupFailed) {
                self->Fail(GatewayError::kUpstreamFailure);
                return;
            }
            self->OnLinkResolved(link, cls);
        });
    });
    if (!submitted) Fail(GatewayError::kClientUnavailable);
}

void StreamSession::OnLinkResolved(std::optional<LinkRecord> link, limiter::PriorityClass cls) {
    if (finished_) return;
    if (!link) {
        LOG_DEBUG << "StreamSession " << requestId_ << ": unknown link " << linkId_;
        Fail(GatewayError::kNotFound);
        return;
    }
    link_ = std::move(*link);
    cls_ = cls;
    ResolveMetadata();
}

void StreamSession::ResolveMetadata() {
    // Misses share one MetadataLoad; this session holds no client while it waits.
    std::weak_ptr<StreamSession> weak(shared_from_this());
    network::EventLoop* loop = loop_;
    const SessionDeps* deps = &deps_;
    metaPending_ = true;
    const uint64_t ticket = deps_.cache->Fetch(
        link_.fileRef,
        [weak, loop](const upstream::MetaResult& result) {
            loop->RunInLoop([weak, result] {
                if (auto self = weak.lock()) self->OnMetadata(result);
            });
        },
        [deps, loop](const std::string& fileRef, MetadataCache::Completion complete,
                     const streamgate::common::CancelTokenPtr& cancel) {
            MetadataLoad::Start(*deps, loop, fileRef, std::move(complete), cancel);
        });
    if (metaPending_) metaTicket_ = ticket;
}

void StreamSession::OnMetadata(const upstream::MetaResult& result) {
    metaPending_ = false;
    metaTicket_ = 0;
    if (finished_) return;
    if (!result.error.ok()) {
        const upstream::UpstreamStatus status = result.error.status;
        if (status == upstream::UpstreamStatus::kNotFound) {
            deps_.cache->Invalidate(link_.fileRef);
        }
        GatewayError error = FromUpstreamStatus(status);
        if (deps_.pool->UsableCount() == 0) error = GatewayError::kClientUnavailable;
        LOG_WARN << "StreamSession " << requestId_ << ": metadata for " << link_.fileRef << " failed: "
                 << result.error.message;
        Fail(error, result.error.retryAfterSec);
        return;
    }

    meta_ = result.meta;
    state_ = State::kMetaResolved;

    if ((hashGiven_ || deps_.options.requireSecureHash) && !SecureHashMatches(secureHash_, meta_)) {
        LOG_WARN << "StreamSession " << requestId_ << ": secure hash mismatch for link " << linkId_;
        Fail(GatewayError::kForbidden);
        return;
    }

    if (!rangeSyntaxOk_) {
        Fail(GatewayError::kInvalidRange);
        return;
    }
    if (meta_.sizeBytes == 0 && rangeSpec_.kind == protocol::RangeSpec::kWholeFile) {
        emptyEntity_ = true;
    } else {
        std::optional<protocol::ByteRange> range = protocol::ResolveRange(rangeSpec_, meta_.sizeBytes);
        if (!range) {
            Fail(GatewayError::kInvalidRange);
            return;
        }
        range_ = *range;
    }
    RequestAdmission();
}

void StreamSession::RequestAdmission() {
    std::weak_ptr<StreamSession> weak(shared_from_this());
    network::EventLoop* loop = loop_;
    limiter::AdmissionDecision decision = deps_.admission->Admit(
        requestId_, link_.ownerUserId, cls_,
        [weak, loop](const limiter::AdmissionDecision& d) {
            loop->RunInLoop([weak, d] {
                if (auto self = weak.lock()) self->OnAdmissionResolved(d);
            });
        });

    switch (decision.outcome) {
        case limiter::AdmissionOutcome::kAdmitted:
            OnAdmitted();
            break;
        case limiter::AdmissionOutcome::kQueued:
            queued_ = true;
            LOG_DEBUG << "StreamSession " << requestId_ << ": queued at " << decision.position << " ("
                      << limiter::PriorityClassName(cls_) << ")";
            break;
        case limiter::AdmissionOutcome::kRejected:
            LOG_INFO << "StreamSession " << requestId_ << ": rejected, "
                     << limiter::RejectReasonName(decision.reason);
            Fail(GatewayError::kThrottled, decision.retryAfterSec);
            break;
    }
}

void StreamSession::OnAdmissionResolved(const limiter::AdmissionDecision& decision) {
    if (finished_ || !queued_) return;
    queued_ = false;
    if (decision.admitted()) {
        OnAdmitted();
    } else {
        LOG_INFO << "StreamSession " << requestId_ << ": left queue, "
                 << limiter::RejectReasonName(decision.reason);
        Fail(GatewayError::kThrottled, decision.retryAfterSec);
    }
}

void StreamSession::OnAdmitted() {
    state_ = State::kAdmitted;
    if (headOnly_ || emptyEntity_) {
        SendHeaders();
        Complete();
        return;
    }
    acquireDeadline_ = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(deps_.options.acquireTimeoutSec));
    Acquire();
}

void StreamSession::Acquire() {
    if (finished_) return;
    ClientPool::AcquireResult result = deps_.pool->Acquire(meta_.dcId);
    switch (result.status) {
        case ClientPool::AcquireStatus::kOk:
            StartStreaming(std::move(result.lease));
            return;
        case ClientPool::AcquireStatus::kUnavailable:
            Fail(GatewayError::kClientUnavailable);
            return;
        case ClientPool::AcquireStatus::kBlocked:
            break;
    }

    const auto now = std::chrono::steady_clock::now();
    const double retryAfterSec = std::chrono::duration<double>(result.retryAfter).count();
    if (now >= acquireDeadline_) {
        LOG_WARN << "StreamSession " << requestId_ << ": no client became available in "
                 << deps_.options.acquireTimeoutSec << "s";
        Fail(GatewayError::kClientUnavailable, retryAfterSec);
        return;
    }
    const double remaining = std::chrono::duration<double>(acquireDeadline_ - now).count();
    double delay = deps_.options.acquireRetrySec;
    if (retryAfterSec > 0.0) delay = std::max(delay, std::min(retryAfterSec, remaining));
    delay = std::min(delay, remaining);

    std::weak_ptr<StreamSession> weak(shared_from_this());
    retryTimer_ = loop_->RunAfter(delay, [weak] {
        if (auto self = weak.lock()) {
            self->retryTimer_ = 0;
            self->Acquire();
        }
    });
}

void StreamSession::StartStreaming(ClientPool::LeasePtr lease) {
    if (finished_) return;
    lease_ = std::move(lease);
    upstream::UpstreamClientPtr client = lease_->client();
    if (!client) {
        Fail(GatewayError::kClientUnavailable);
        return;
    }
    state_ = State::kStreaming;
    stream_ = std::make_shared<RangeStream>(deps_.pool, lease_->handle(), client, link_.fileRef,
                                            range_.first + bytesServed_, range_.last,
                                            deps_.options.fetch, cancel_);
    LOG_DEBUG << "StreamSession " << requestId_ << ": streaming " << link_.fileRef << " ["
              << range_.first + bytesServed_ << ", " << range_.last << "] via client " << lease_->handleId();
    if (!headersSent_) SendHeaders();
    FetchNext();
}

void StreamSession::SendHeaders() {
    network::TcpConnectionPtr conn = LiveConnection();
    if (!conn) return;

    const bool partial = rangeSpec_.kind != protocol::RangeSpec::kWholeFile && !emptyEntity_;
    std::string fileName = meta_.fileName;
    if (fileName.empty()) fileName = nameHint_;
    if (fileName.empty()) fileName = "file_" + linkId_;
    const std::string mime = meta_.mimeType.empty() ? protocol::GuessMimeType(fileName) : meta_.mimeType;

    HttpResponse resp(!keepAlive_);
    resp.setStatus(partial ? HttpResponse::k206PartialContent : HttpResponse::k200Ok);
    resp.setContentType(mime);
    if (partial) resp.addHeader("Content-Range", protocol::ContentRangeValue(range_, meta_.sizeBytes));
    resp.addHeader("Content-Disposition", protocol::ContentDispositionValue(fileName, mime));
    resp.addHeader("Accept-Ranges", "bytes");
    resp.addHeader("Cache-Control", "public, max-age=31536000, immutable");
    resp.setContentLength(emptyEntity_ ? 0 : range_.length());
    resp.setOmitBody(headOnly_);
    protocol::HttpServer::SendResponse(conn, resp);
    headersSent_ = true;
}

void StreamSession::FetchNext() {
    if (finished_ || fetchInFlight_) return;
    network::TcpConnectionPtr conn = LiveConnection();
    if (!conn) {
        Finish(State::kCancelled);
        return;
    }
    if (bytesServed_ >= range_.length()) {
        Complete();
        return;
    }
    if (conn->PendingOutputBytes() > deps_.options.sendHighWater) {
        awaitingWritable_ = true;
        return;
    }

    fetchInFlight_ = true;
    const uint64_t seq = ++fetchSeq_;
    std::weak_ptr<StreamSession> weak(shared_from_this());
    if (deps_.options.fetchTimeoutSec > 0.0) {
        fetchTimer_ = loop_->RunAfter(deps_.options.fetchTimeoutSec, [weak, seq] {
            if (auto self = weak.lock()) self->OnFetchTimeout(seq);
        });
    }

    auto self = shared_from_this();
    std::shared_ptr<RangeStream> stream = stream_;
    const bool submitted = deps_.workers->Submit([self, stream, seq] {
        auto chunk = std::make_shared<std::string>();
        const RangeStream::Status status = stream->Next(chunk.get());
        self->loop_->RunInLoop([self, seq, status, chunk] { self->OnChunk(seq, status, chunk); });
    });
    if (!submitted) {
        fetchInFlight_ = false;
        Fail(GatewayError::kClientUnavailable);
    }
}

void StreamSession::OnChunk(uint64_t seq, RangeStream::Status status, std::shared_ptr<std::string> chunk) {
    if (seq != fetchSeq_ || !fetchInFlight_) return;
    fetchInFlight_ = false;
    if (fetchTimer_) {
        loop_->CancelTimer(fetchTimer_);
        fetchTimer_ = 0;
    }
    if (finished_) return;

    switch (status) {
        case RangeStream::Status::kOk: {
            network::TcpConnectionPtr conn = LiveConnection();
            if (!conn) {
                Finish(State::kCancelled);
                return;
            }
            conn->Send(chunk->data(), chunk->size());
            bytesServed_ += chunk->size();
            deps_.stats->AddBytesServed(chunk->size());
            FetchNext();
            return;
        }
        case RangeStream::Status::kDone:
            Complete();
            return;
        case RangeStream::Status::kCancelled:
            Finish(State::kCancelled);
            return;
        case RangeStream::Status::kFloodWaited:
        case RangeStream::Status::kClientLost:
        case RangeStream::Status::kClientUnavailable:
            if (TryReacquire(status)) return;
            Fail(FromStreamStatus(status), stream_ ? stream_->lastError().retryAfterSec : 0.0);
            return;
        case RangeStream::Status::kNotFound:
            deps_.cache->Invalidate(link_.fileRef);
            Fail(GatewayError::kNotFound);
            return;
        case RangeStream::Status::kTransientExhausted:
        case RangeStream::Status::kFailed:
            Fail(FromStreamStatus(status));
            return;
    }
}

void StreamSession::OnFetchTimeout(uint64_t seq) {
    fetchTimer_ = 0;
    if (finished_ || !fetchInFlight_ || seq != fetchSeq_) return;
    LOG_WARN << "StreamSession " << requestId_ << ": chunk fetch at offset " << range_.first + bytesServed_
             << " timed out after " << deps_.options.fetchTimeoutSec << "s";
    fetchInFlight_ = false;
    Fail(GatewayError::kUpstreamTransient);
}

bool StreamSession::TryReacquire(RangeStream::Status status) {
    if (reacquires_ >= deps_.options.maxReacquire) return false;
    ++reacquires_;
    deps_.stats->IncReacquired();
    LOG_INFO << "StreamSession " << requestId_ << ": client " << (lease_ ? lease_->handleId() : 0) << " "
             << RangeStream::StatusName(status) << " after " << bytesServed_ << " bytes, re-acquiring";
    if (lease_) lease_->Release();
    lease_.reset();
    stream_.reset();
    acquireDeadline_ = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(deps_.options.acquireTimeoutSec));
    Acquire();
    return true;
}

void StreamSession::Complete() {
    if (finished_) return;
    Finish(State::kCompleted);
}

void StreamSession::Fail(GatewayError error, double retryAfterSec) {
    if (finished_) return;
    if (error == GatewayError::kDisconnected) {
        Finish(State::kCancelled);
        return;
    }
    if (error == GatewayError::kThrottled) deps_.stats->IncThrottled();

    network::TcpConnectionPtr conn = LiveConnection();
    if (headersSent_) {
        // The status line is gone; a short body is the only signal left.
        LOG_WARN << "StreamSession " << requestId_ << ": " << GatewayErrorName(error) << " after "
                 << bytesServed_ << " of " << range_.length() << " bytes, closing connection";
        if (conn) conn->ForceClose();
        Finish(State::kFailed);
        return;
    }

    if (conn) {
        HttpResponse resp(!keepAlive_);
        resp.setStatus(HttpStatusFor(error));
        switch (error) {
            case GatewayError::kNotFound:
                resp.setContentType("text/html; charset=utf-8");
                resp.setBody("<html><body><h1>404: Invalid link</h1></body></html>\n");
                break;
            case GatewayError::kForbidden:
                resp.setContentType("text/plain");
                resp.setBody("Invalid security credentials\n");
                break;
            case GatewayError::kInvalidRange:
                resp.addHeader("Content-Range", protocol::UnsatisfiedContentRange(meta_.sizeBytes));
                resp.setContentType("text/plain");
                resp.setBody("Range Not Satisfiable\n");
                break;
            case GatewayError::kThrottled:
                resp.addHeader("Retry-After", RetryAfterValue(retryAfterSec));
                resp.setContentType("text/plain");
                resp.setBody("Too Many Requests\n");
                break;
            case GatewayError::kClientUnavailable:
            case GatewayError::kFloodWaited:
                if (retryAfterSec > 0.0) resp.addHeader("Retry-After", RetryAfterValue(retryAfterSec));
                resp.setContentType("text/plain");
                resp.setBody("Service Unavailable\n");
                break;
            default:
                resp.setContentType("text/plain");
                resp.setBody("Bad Gateway\n");
                break;
        }
        resp.setOmitBody(headOnly_);
        protocol::HttpServer::SendResponse(conn, resp);
    }
    LOG_DEBUG << "StreamSession " << requestId_ << ": " << GatewayErrorName(error) << " in "
              << StateName(state_);
    Finish(State::kFailed);
}

void StreamSession::OnWritable() {
    if (finished_ || !awaitingWritable_) return;
    awaitingWritable_ = false;
    FetchNext();
}

void StreamSession::OnPeerClosed() {
    if (finished_) return;
    LOG_DEBUG << "StreamSession " << requestId_ << ": peer closed in " << StateName(state_);
    Finish(State::kCancelled);
}

void StreamSession::CancelTimers() {
    if (retryTimer_) {
        loop_->CancelTimer(retryTimer_);
        retryTimer_ = 0;
    }
    if (fetchTimer_) {
        loop_->CancelTimer(fetchTimer_);
        fetchTimer_ = 0;
    }
}

void StreamSession::Finish(State terminal) {
    if (finished_) return;
    finished_ = true;
    const State from = state_;
    state_ = terminal;

    cancel_->Cancel();
    CancelTimers();
    if (queued_) {
        deps_.admission->Cancel(requestId_);
        queued_ = false;
    }
    if (metaTicket_) {
        deps_.cache->Leave(link_.fileRef, metaTicket_);
        metaTicket_ = 0;
    }
    if (lease_) lease_->Release();
    lease_.reset();
    stream_.reset();

    switch (terminal) {
        case State::kCompleted: deps_.stats->IncCompleted(); break;
        case State::kCancelled: deps_.stats->IncCancelled(); break;
        default: deps_.stats->IncFailed(); break;
    }
    deps_.stats->SessionEnded();
    LOG_INFO << "StreamSession " << requestId_ << " link " << linkId_ << ": " << StateName(from) << " -> "
             << StateName(terminal) << ", " << bytesServed_ << " bytes served";

    protocol::HttpServer::CompletionCallback done;
    done.swap(done_);
    if (done) {
        done(!keepAlive_ || (terminal == State::kFailed && headersSent_) || terminal == State::kCancelled);
    }
}

} // namespace stream
} // namespace streamgate
