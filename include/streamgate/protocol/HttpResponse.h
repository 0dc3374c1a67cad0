#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "streamgate/network/Buffer.h"

namespace streamgate {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k206PartialContent = 206,
        k400BadRequest = 400,
        k403Forbidden = 403,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k416RangeNotSatisfiable = 416,
        k429TooManyRequests = 429,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k503ServiceUnavailable = 503,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    // Sets the code and its standard reason phrase.
    void setStatus(HttpStatusCode code) {
        statusCode_ = code;
        statusMessage_ = ReasonPhrase(code);
    }
    void setStatusCode(HttpStatusCode code) { statusCode_ = code; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    HttpStatusCode statusCode() const { return statusCode_; }

    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    // Headers keep insertion order; adding an existing name replaces it.
    void addHeader(const std::string& key, const std::string& value);
    std::string getHeader(const std::string& key) const;

    void setBody(std::string body) { body_ = std::move(body); }
    const std::string& body() const { return body_; }

    // For streamed bodies: advertised length independent of body().
    void setContentLength(uint64_t length) { contentLength_ = length; }
    // HEAD: headers describe the entity but no body bytes follow.
    void setOmitBody(bool on) { omitBody_ = on; }

    // Status line, headers and (unless streamed or omitted) the body.
    void appendToBuffer(streamgate::network::Buffer* output) const;
    std::string toString() const;

    static const char* ReasonPhrase(HttpStatusCode code);

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
    std::optional<uint64_t> contentLength_;
    bool omitBody_{false};
};

} // namespace protocol
} // namespace streamgate
