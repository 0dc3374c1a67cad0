#pragma once

#include "streamgate/network/Buffer.h"
#include "streamgate/network/Callbacks.h"
#include "streamgate/protocol/HttpRequest.h"

#include <cstddef>

namespace streamgate {
namespace protocol {

// Incremental HTTP/1.x request parser. One per connection; reset() between requests.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static constexpr size_t kMaxHeaderBytes = 16 * 1024;
    static constexpr size_t kMaxBodyBytes = 64 * 1024;

    HttpContext() : state_(kExpectRequestLine) {}

    // Returns false on a malformed or oversized request.
    bool parseRequest(streamgate::network::Buffer* buf, streamgate::network::Timestamp receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        headerBytes_ = 0;
        bodyRemaining_ = 0;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }
    streamgate::network::Timestamp receiveTime() const { return receiveTime_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool finishHeaders();

    HttpRequestParseState state_;
    HttpRequest request_;
    streamgate::network::Timestamp receiveTime_{};
    size_t headerBytes_{0};
    size_t bodyRemaining_{0};
};

} // namespace protocol
} // namespace streamgate
