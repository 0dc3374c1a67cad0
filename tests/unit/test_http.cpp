#include "streamgate/protocol/HttpContext.h"
#include "streamgate/protocol/HttpResponse.h"
#include "streamgate/network/Buffer.h"
#include "streamgate/common/Logger.h"
#include <cassert>
#include <string>

using namespace streamgate::protocol;
using namespace streamgate::network;
using namespace streamgate::common;

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    buf.Append("GET /dl/abc123/movie.mp4?hash=xy HTTP/1.1\r\nHost: ");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());

    buf.Append("localhost\r\nRange: bytes=0-99\r\nUser-Agent: mpv\r\n\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());

    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kGet);
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.path() == "/dl/abc123/movie.mp4");
    assert(req.query() == "hash=xy");
    assert(req.getHeader("host") == "localhost");
    assert(req.getHeader("RANGE") == "bytes=0-99");
    assert(!req.wantsClose());
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Request PASS";
}

void testPipelinedRequests() {
    HttpContext context;
    Buffer buf;
    buf.Append("HEAD /a HTTP/1.1\r\n\r\nGET /b HTTP/1.0\r\n\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().getMethod() == HttpRequest::kHead);
    assert(context.request().path() == "/a");
    context.reset();

    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().path() == "/b");
    // HTTP/1.0 without keep-alive closes.
    assert(context.request().wantsClose());
    LOG_INFO << "Pipelined PASS";
}

void testParseContentLengthBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /submit HTTP/1.1\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhel");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());
    buf.Append("lo");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kPost);
    assert(req.body() == "hello");
    assert(req.wantsClose());
    LOG_INFO << "Parse Content-Length Body PASS";
}

void testRejectsMalformed() {
    const char* bad[] = {
        "BREW /pot HTTP/1.1\r\n\r\n",
        "GET /x HTTP/2.0\r\n\r\n",
        "GET /x\r\n\r\n",
        "GET /x HTTP/1.1\r\nNoColonHere\r\n\r\n",
        "POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n",
        "POST /x HTTP/1.1\r\nContent-Length: -1\r\n\r\n",
    };
    for (const char* input : bad) {
        HttpContext context;
        Buffer buf;
        buf.Append(input);
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }

    HttpContext context;
    Buffer buf;
    buf.Append("GET /x HTTP/1.1\r\nX-Long: " + std::string(HttpContext::kMaxHeaderBytes, 'a'));
    assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    LOG_INFO << "Malformed PASS";
}

void testResponseGen() {
    HttpResponse resp(false);
    resp.setStatus(HttpResponse::k206PartialContent);
    resp.setContentType("video/mp4");
    resp.addHeader("Content-Range", "bytes 0-99/1000");
    resp.addHeader("content-range", "bytes 0-9/1000");   // replaces
    resp.setBody("0123456789");

    std::string output = resp.toString();
    assert(output.find("HTTP/1.1 206 Partial Content\r\n") == 0);
    assert(output.find("Content-Length: 10\r\n") != std::string::npos);
    assert(output.find("Connection: keep-alive\r\n") != std::string::npos);
    assert(output.find("Content-Range: bytes 0-9/1000\r\n") != std::string::npos);
    assert(output.find("0-99") == std::string::npos);
    assert(output.size() >= 14 && output.compare(output.size() - 14, 14, "\r\n\r\n0123456789") == 0);
    LOG_INFO << "Response Gen PASS";
}

void testStreamedAndHeadResponses() {
    HttpResponse streamed(true);
    streamed.setStatus(HttpResponse::k200Ok);
    streamed.setContentLength(10000000);
    std::string head = streamed.toString();
    assert(head.find("Content-Length: 10000000\r\n") != std::string::npos);
    assert(head.find("Connection: close\r\n") != std::string::npos);
    assert(head.compare(head.size() - 4, 4, "\r\n\r\n") == 0);

    HttpResponse omitted(false);
    omitted.setStatus(HttpResponse::k404NotFound);
    omitted.setBody("404: Invalid link");
    omitted.setOmitBody(true);
    std::string out = omitted.toString();
    assert(out.find("Content-Length: 17\r\n") != std::string::npos);
    assert(out.find("Invalid link") == std::string::npos);
    LOG_INFO << "Streamed/HEAD PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testPipelinedRequests();
    testParseContentLengthBody();
    testRejectsMalformed();
    testResponseGen();
    testStreamedAndHeadResponses();
    return 0;
}
