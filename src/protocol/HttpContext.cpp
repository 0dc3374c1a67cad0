#include "streamgate/protocol/HttpContext.h"

#include <algorithm>
#include <cstdlib>

namespace streamgate {
namespace protocol {

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space == end || !request_.setMethod(start, space)) return false;

    start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end || start == space) return false;

    const char* question = std::find(start, space, '?');
    request_.setPath(start, question);
    if (question != space) {
        request_.setQuery(question + 1, space);
    }

    start = space + 1;
    if (end - start != 8 || !std::equal(start, end - 1, "HTTP/1.")) return false;
    if (*(end - 1) == '1') {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (*(end - 1) == '0') {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::finishHeaders() {
    if (request_.hasHeader("Transfer-Encoding")) {
        // Only bodiless methods are served.
        return false;
    }
    const std::string cl = request_.getHeader("Content-Length");
    if (!cl.empty()) {
        char* endp = nullptr;
        long long v = std::strtoll(cl.c_str(), &endp, 10);
        if (endp == cl.c_str() || *endp != '\0' || v < 0 || static_cast<size_t>(v) > kMaxBodyBytes) {
            return false;
        }
        bodyRemaining_ = static_cast<size_t>(v);
    }
    state_ = bodyRemaining_ > 0 ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::parseRequest(streamgate::network::Buffer* buf, streamgate::network::Timestamp receiveTime) {
    while (state_ != kGotAll) {
        if (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (!crlf) {
                return headerBytes_ + buf->ReadableBytes() <= kMaxHeaderBytes;
            }
            const size_t lineLen = static_cast<size_t>(crlf - buf->Peek()) + 2;
            headerBytes_ += lineLen;
            if (headerBytes_ > kMaxHeaderBytes) return false;

            if (state_ == kExpectRequestLine) {
                // Tolerate stray CRLFs between pipelined requests.
                if (crlf != buf->Peek()) {
                    if (!processRequestLine(buf->Peek(), crlf)) return false;
                    receiveTime_ = receiveTime;
                    state_ = kExpectHeaders;
                }
                buf->Retrieve(lineLen);
            } else {
                const char* colon = std::find(buf->Peek(), crlf, ':');
                if (crlf == buf->Peek()) {
                    buf->Retrieve(lineLen);
                    if (!finishHeaders()) return false;
                } else if (colon == crlf) {
                    return false;
                } else {
                    request_.addHeader(buf->Peek(), colon, crlf);
                    buf->Retrieve(lineLen);
                }
            }
        } else {
            const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
            if (n == 0) return true;
            request_.appendBody(buf->Peek(), n);
            buf->Retrieve(n);
            bodyRemaining_ -= n;
            if (bodyRemaining_ == 0) state_ = kGotAll;
        }
    }
    return true;
}

} // namespace protocol
} // namespace streamgate
