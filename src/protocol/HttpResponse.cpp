#include "streamgate/protocol/HttpResponse.h"
#include "streamgate/protocol/HttpRequest.h"

namespace streamgate {
namespace protocol {

const char* HttpResponse::ReasonPhrase(HttpStatusCode code) {
    switch (code) {
        case k200Ok: return "OK";
        case k206PartialContent: return "Partial Content";
        case k400BadRequest: return "Bad Request";
        case k403Forbidden: return "Forbidden";
        case k404NotFound: return "Not Found";
        case k405MethodNotAllowed: return "Method Not Allowed";
        case k416RangeNotSatisfiable: return "Range Not Satisfiable";
        case k429TooManyRequests: return "Too Many Requests";
        case k500InternalServerError: return "Internal Server Error";
        case k502BadGateway: return "Bad Gateway";
        case k503ServiceUnavailable: return "Service Unavailable";
        default: return "Unknown";
    }
}

void HttpResponse::addHeader(const std::string& key, const std::string& value) {
    const std::string lower = HttpRequest::ToLower(key);
    for (auto& h : headers_) {
        if (HttpRequest::ToLower(h.first) == lower) {
            h.second = value;
            return;
        }
    }
    headers_.emplace_back(key, value);
}

std::string HttpResponse::getHeader(const std::string& key) const {
    const std::string lower = HttpRequest::ToLower(key);
    for (const auto& h : headers_) {
        if (HttpRequest::ToLower(h.first) == lower) return h.second;
    }
    return std::string();
}

void HttpResponse::appendToBuffer(streamgate::network::Buffer* output) const {
    output->Append("HTTP/1.1 " + std::to_string(static_cast<int>(statusCode_)) + " ");
    output->Append(statusMessage_);
    output->Append("\r\n");

    const uint64_t length = contentLength_ ? *contentLength_ : body_.size();
    output->Append("Content-Length: " + std::to_string(length) + "\r\n");
    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");

    for (const auto& header : headers_) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }
    output->Append("\r\n");

    if (!omitBody_ && !contentLength_) {
        output->Append(body_);
    }
}

std::string HttpResponse::toString() const {
    streamgate::network::Buffer buf;
    appendToBuffer(&buf);
    return buf.RetrieveAllAsString();
}

} // namespace protocol
} // namespace streamgate
