#include "streamgate/stream/GatewayError.h"

namespace streamgate {
namespace stream {

using protocol::HttpResponse;
using upstream::RangeStream;
using upstream::UpstreamStatus;

const char* GatewayErrorName(GatewayError error) {
    switch (error) {
        case GatewayError::kNone: return "none";
        case GatewayError::kClientUnavailable: return "client_unavailable";
        case GatewayError::kFloodWaited: return "flood_waited";
        case GatewayError::kUpstreamTransient: return "upstream_transient";
        case GatewayError::kInvalidRange: return "invalid_range";
        case GatewayError::kNotFound: return "not_found";
        case GatewayError::kForbidden: return "forbidden";
        case GatewayError::kThrottled: return "throttled";
        case GatewayError::kDisconnected: return "disconnected";
        case GatewayError::kUpstreamFailure: return "upstream_failure";
    }
    return "unknown";
}

HttpResponse::HttpStatusCode HttpStatusFor(GatewayError error) {
    switch (error) {
        case GatewayError::kNone: return HttpResponse::k200Ok;
        case GatewayError::kInvalidRange: return HttpResponse::k416RangeNotSatisfiable;
        case GatewayError::kNotFound: return HttpResponse::k404NotFound;
        case GatewayError::kForbidden: return HttpResponse::k403Forbidden;
        case GatewayError::kThrottled: return HttpResponse::k429TooManyRequests;
        case GatewayError::kClientUnavailable:
        case GatewayError::kFloodWaited:
            return HttpResponse::k503ServiceUnavailable;
        case GatewayError::kUpstreamTransient:
        case GatewayError::kUpstreamFailure:
        case GatewayError::kDisconnected:
            return HttpResponse::k502BadGateway;
    }
    return HttpResponse::k500InternalServerError;
}

GatewayError FromStreamStatus(RangeStream::Status status) {
    switch (status) {
        case RangeStream::Status::kOk:
        case RangeStream::Status::kDone:
            return GatewayError::kNone;
        case RangeStream::Status::kCancelled: return GatewayError::kDisconnected;
        case RangeStream::Status::kFloodWaited: return GatewayError::kFloodWaited;
        case RangeStream::Status::kClientLost:
        case RangeStream::Status::kClientUnavailable:
            return GatewayError::kClientUnavailable;
        case RangeStream::Status::kTransientExhausted: return GatewayError::kUpstreamTransient;
        case RangeStream::Status::kNotFound: return GatewayError::kNotFound;
        case RangeStream::Status::kFailed: return GatewayError::kUpstreamFailure;
    }
    return GatewayError::kUpstreamFailure;
}

GatewayError FromUpstreamStatus(UpstreamStatus status) {
    switch (status) {
        case UpstreamStatus::kOk: return GatewayError::kNone;
        case UpstreamStatus::kFloodWait: return GatewayError::kFloodWaited;
        case UpstreamStatus::kTransient: return GatewayError::kUpstreamTransient;
        case UpstreamStatus::kAuthRevoked: return GatewayError::kClientUnavailable;
        case UpstreamStatus::kNotFound: return GatewayError::kNotFound;
        case UpstreamStatus::kFatal: return GatewayError::kUpstreamFailure;
        case UpstreamStatus::kNoClient: return GatewayError::kClientUnavailable;
    }
    return GatewayError::kUpstreamFailure;
}

} // namespace stream
} // namespace streamgate
