#include "streamgate/stream/StreamGateway.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/network/InetAddress.h"
#include "streamgate/common/Logger.h"
#include "support/GatewayHarness.h"
#include "support/TestSocket.h"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

using namespace streamgate::stream;
using namespace streamgate::network;
using namespace streamgate::common;
using namespace streamgate::testing;
using streamgate::upstream::UpstreamError;

static const uint64_t kSize = 10000000;

static ParsedResponse get(int fd, const std::string& path, const std::string& extraHeaders = "",
                          const std::string& method = "GET") {
    sendAll(fd, method + " " + path + " HTTP/1.1\r\nHost: test\r\n" + extraHeaders + "\r\n");
    return readResponse(fd, method == "HEAD");
}

static void testRangeAndWholeFile(uint16_t port) {
    int fd = connectTo(port);

    ParsedResponse r = get(fd, "/abc/movie.mp4", "Range: bytes=5000000-5999999\r\n");
    assert(r.status == 206);
    assert(r.headers["content-range"] == "bytes 5000000-5999999/10000000");
    assert(r.headers["content-length"] == "1000000");
    assert(r.headers["content-type"] == "video/mp4");
    assert(r.headers["accept-ranges"] == "bytes");
    assert(r.headers["content-disposition"].find("inline;") == 0);
    assert(r.body == FakeUpstream::Expected(5000000, 5999999));

    // Same connection: open-ended and suffix forms.
    r = get(fd, "/abc", "Range: bytes=9999000-\r\n");
    assert(r.status == 206 && r.body == FakeUpstream::Expected(9999000, kSize - 1));
    r = get(fd, "/abc", "Range: bytes=-10\r\n");
    assert(r.status == 206 && r.headers["content-range"] == "bytes 9999990-9999999/10000000");

    r = get(fd, "/abc");
    assert(r.status == 200);
    assert(r.headers.count("content-range") == 0);
    assert(r.headers["content-length"] == "10000000");
    assert(r.body.size() == kSize);
    assert(r.body == FakeUpstream::Expected(0, kSize - 1));
    ::close(fd);
    LOG_INFO << "Range and whole file PASS";
}

static void testHeadAndEmptyFile(uint16_t port, StreamGateway* gateway) {
    int fd = connectTo(port);
    const uint64_t fetchesBefore = gateway->components().pool->Snapshot()[0].totalLeases +
                                   gateway->components().pool->Snapshot()[1].totalLeases;
    ParsedResponse r = get(fd, "/abc", "", "HEAD");
    assert(r.status == 200);
    assert(r.headers["content-length"] == "10000000");
    assert(r.body.empty());
    r = get(fd, "/abc", "Range: bytes=0-99\r\n", "HEAD");
    assert(r.status == 206 && r.headers["content-length"] == "100");
    // Metadata was cached, so HEAD took no client at all.
    const uint64_t fetchesAfter = gateway->components().pool->Snapshot()[0].totalLeases +
                                  gateway->components().pool->Snapshot()[1].totalLeases;
    assert(fetchesAfter == fetchesBefore);

    r = get(fd, "/empty");
    assert(r.status == 200 && r.headers["content-length"] == "0" && r.body.empty());
    r = get(fd, "/empty", "Range: bytes=0-\r\n");
    assert(r.status == 416 && r.headers["content-range"] == "bytes */0");
    ::close(fd);
    LOG_INFO << "HEAD and empty PASS";
}

static void testClientErrors(uint16_t port) {
    int fd = connectTo(port);
    ParsedResponse r = get(fd, "/abc", "Range: bytes=20000000-\r\n");
    assert(r.status == 416);
    assert(r.headers["content-range"] == "bytes */10000000");

    r = get(fd, "/abc", "Range: bytes=abc\r\n");
    assert(r.status == 416);

    r = get(fd, "/nope");
    assert(r.status == 404 && r.body.find("404: Invalid link") != std::string::npos);
    r = get(fd, "/");
    assert(r.status == 404);
    r = get(fd, "/gone");   // link exists, file does not
    assert(r.status == 404);

    r = get(fd, "/abc", "", "DELETE");
    assert(r.status == 405 && r.headers["allow"] == "GET, HEAD");
    ::close(fd);
    LOG_INFO << "Client errors PASS";
}

static void testUpstreamFailures(uint16_t port, GatewayHarness* h) {
    // Metadata failure before any header: a clean 502.
    h->fake->ScriptMetaErrors({UpstreamError::Fatal("rpc error")});
    int fd = connectTo(port);
    ParsedResponse r = get(fd, "/other");
    assert(r.status == 502);
    ::close(fd);

    // Failure after headers: the body is cut short and the connection dropped.
    h->fake->ScriptFetchErrors({UpstreamError::Fatal("rpc error")});
    fd = connectTo(port);
    sendAll(fd, "GET /abc HTTP/1.1\r\nRange: bytes=0-999\r\n\r\n");
    std::string raw = recvUntilClose(fd);
    ::close(fd);
    assert(raw.find("HTTP/1.1 206") == 0);
    const size_t headerEnd = raw.find("\r\n\r\n");
    assert(headerEnd != std::string::npos && raw.size() - headerEnd - 4 < 1000);
    LOG_INFO << "Upstream failures PASS";
}

static void testFloodWaitSwitchesClient(uint16_t port, StreamGateway* gateway, GatewayHarness* h) {
    const uint64_t before = gateway->stats().reacquired();
    h->fake->ScriptFetchErrors({UpstreamError::FloodWait(30.0)});
    int fd = connectTo(port);
    ParsedResponse r = get(fd, "/abc", "Range: bytes=100-200099\r\n");
    assert(r.status == 206);
    assert(r.body == FakeUpstream::Expected(100, 200099));
    assert(gateway->stats().reacquired() == before + 1);

    r = get(fd, "/status");
    assert(r.status == 200);
    assert(r.headers["content-type"] == "application/json");
    assert(r.body.find("\"status\":\"operational\"") != std::string::npos);
    assert(r.body.find("\"active_clients\":2") != std::string::npos);
    assert(r.body.find("\"state\":\"flood_waited\"") != std::string::npos);
    assert(r.body.find("\"workload_distribution\":[") != std::string::npos);
    ::close(fd);
    LOG_INFO << "Flood wait switch PASS";
}

static void testSecureHash(uint16_t port) {
    int fd = connectTo(port);
    ParsedResponse r = get(fd, "/abc/movie.mp4?hash=AbC123", "Range: bytes=0-99\r\n");
    assert(r.status == 206 && r.body == FakeUpstream::Expected(0, 99));

    // Hash first, numeric link id.
    r = get(fd, "/AbC123777/movie.mp4", "Range: bytes=10-19\r\n");
    assert(r.status == 206 && r.body == FakeUpstream::Expected(10, 19));

    r = get(fd, "/abc?hash=zzzzzz");
    assert(r.status == 403);
    assert(r.body.find("Invalid security credentials") != std::string::npos);
    r = get(fd, "/zzzzzz777");
    assert(r.status == 403);
    // A file without a unique id cannot be unlocked by any hash.
    r = get(fd, "/other?hash=AbC123");
    assert(r.status == 403);
    // Unknown links stay 404 whatever the hash.
    r = get(fd, "/nope?hash=AbC123");
    assert(r.status == 404);
    ::close(fd);
    LOG_INFO << "Secure hash PASS";
}

// With hashes required, a bare link is refused too.
static void testHashRequired(uint16_t port) {
    int fd = connectTo(port);
    ParsedResponse r = get(fd, "/abc");
    assert(r.status == 403);
    r = get(fd, "/abc?hash=AbC123", "Range: bytes=0-9\r\n");
    assert(r.status == 206 && r.body == FakeUpstream::Expected(0, 9));
    ::close(fd);
    LOG_INFO << "Hash required PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    const uint16_t port = pickFreePort();

    GatewayHarness h;
    h.fake->AddFile("ref/movie", kSize, "video/mp4", "movie.mp4", 1);
    h.fake->AddFile("ref/empty", 0, "", "empty.txt", 1);
    h.fake->AddFile("ref/other", 4096, "", "other.bin", 2);
    h.AddLink("abc", "ref/movie", "100");
    h.AddLink("empty", "ref/empty", "100");
    h.AddLink("other", "ref/other", "100");
    h.AddLink("gone", "ref/missing", "100");
    h.AddLink("777", "ref/movie", "100");
    h.fake->SetUniqueId("ref/movie", "AbC123xyz");

    GatewayHarness strict;
    strict.fake->AddFile("ref/movie", kSize, "video/mp4", "movie.mp4", 1);
    strict.fake->SetUniqueId("ref/movie", "AbC123xyz");
    strict.AddLink("abc", "ref/movie", "100");
    StreamGateway::Options strictOpts = GatewayHarness::Options();
    strictOpts.session.requireSecureHash = true;

    EventLoop loop;
    StreamGateway gateway(&loop, InetAddress(port, true), GatewayHarness::Options(), h.parts);
    gateway.Start();
    const uint16_t strictPort = pickFreePort();
    StreamGateway strictGateway(&loop, InetAddress(strictPort, true), strictOpts, strict.parts);
    strictGateway.Start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        testRangeAndWholeFile(port);
        testHeadAndEmptyFile(port, &gateway);
        testClientErrors(port);
        testUpstreamFailures(port, &h);
        testFloodWaitSwitchesClient(port, &gateway, &h);
        testSecureHash(port);
        testHashRequired(strictPort);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    gateway.Stop();
    strictGateway.Stop();
    assert(gateway.stats().bytesServed() > kSize);
    return 0;
}
