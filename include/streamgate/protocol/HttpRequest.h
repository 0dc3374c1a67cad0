#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <string>

namespace streamgate {
namespace protocol {

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOptions
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    bool setMethod(const char* start, const char* end) {
        const std::string m(start, end);
        if (m == "GET") method_ = kGet;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "POST") method_ = kPost;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else if (m == "OPTIONS") method_ = kOptions;
        else method_ = kInvalid;
        return method_ != kInvalid;
    }

    Method getMethod() const { return method_; }
    const char* methodString() const {
        switch (method_) {
            case kGet: return "GET";
            case kHead: return "HEAD";
            case kPost: return "POST";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            case kOptions: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    const std::string& path() const { return path_; }

    // Without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    // Field names are stored lower-cased; lookups are case-insensitive.
    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field = ToLower(std::string(start, colon));
        ++colon;
        while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
            value.pop_back();
        }
        auto it = headers_.find(field);
        if (it != headers_.end()) {
            it->second += ", " + value;
        } else {
            headers_.emplace(std::move(field), std::move(value));
        }
    }

    void setHeader(const std::string& field, const std::string& value) { headers_[ToLower(field)] = value; }

    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(ToLower(field));
        return it == headers_.end() ? std::string() : it->second;
    }

    bool hasHeader(const std::string& field) const { return headers_.count(ToLower(field)) > 0; }

    const std::map<std::string, std::string>& headers() const { return headers_; }

    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    // Whether the response to this request must close the connection.
    bool wantsClose() const {
        const std::string connection = ToLower(getHeader("Connection"));
        if (connection == "close") return true;
        return version_ == kHttp10 && connection != "keep-alive";
    }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

    static std::string ToLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

private:
    Method method_;
    Version version_;
    std::string path_;
    std::string query_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace streamgate
