#pragma once

#include "streamgate/protocol/HttpResponse.h"
#include "streamgate/upstream/ChunkFetcher.h"
#include "streamgate/upstream/UpstreamClient.h"

namespace streamgate {
namespace stream {

// Why a session ended without serving its range.
enum class GatewayError {
    kNone,
    kClientUnavailable,   // pool exhausted, or every handle flood-waited past the acquire timeout
    kFloodWaited,         // still throttled after the automatic re-acquire
    kUpstreamTransient,   // retry budget spent, or a fetch timed out
    kInvalidRange,
    kNotFound,            // link or file unknown
    kForbidden,           // secure hash missing or not matching the file
    kThrottled,           // admission rejected
    kDisconnected,        // peer went away; nothing is written
    kUpstreamFailure,     // anything else the upstream reported
};

const char* GatewayErrorName(GatewayError error);

protocol::HttpResponse::HttpStatusCode HttpStatusFor(GatewayError error);

GatewayError FromStreamStatus(upstream::RangeStream::Status status);
GatewayError FromUpstreamStatus(upstream::UpstreamStatus status);

} // namespace stream
} // namespace streamgate
