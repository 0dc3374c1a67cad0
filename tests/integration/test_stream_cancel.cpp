#include "streamgate/stream/MetadataCache.h"
#include "streamgate/stream/StreamGateway.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/network/InetAddress.h"
#include "streamgate/common/Logger.h"
#include "support/GatewayHarness.h"
#include "support/TestSocket.h"

#include <cassert>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

using namespace streamgate::stream;
using namespace streamgate::network;
using namespace streamgate::common;
using namespace streamgate::testing;

static int totalActiveStreams(StreamGateway* gateway) {
    int n = 0;
    for (const auto& c : gateway->components().pool->Snapshot()) n += c.activeStreams;
    return n;
}

static bool waitFor(const std::function<bool()>& pred, int timeoutMs = 3000) {
    for (int waited = 0; waited < timeoutMs; waited += 10) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Client reads part of a long body and hangs up: the lease comes back and
// the fetch loop stops.
static void testMidStreamDisconnect(uint16_t port, StreamGateway* gateway, GatewayHarness* h) {
    const int activeBefore = totalActiveStreams(gateway);
    int fd = connectTo(port);
    sendAll(fd, "GET /big HTTP/1.1\r\nHost: test\r\n\r\n");

    // Headers plus at least a few chunks.
    std::string got;
    char buf[16384];
    while (got.size() < 40000) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        assert(n > 0);
        got.append(buf, buf + n);
    }
    assert(got.find("HTTP/1.1 200 OK") == 0);
    assert(totalActiveStreams(gateway) == activeBefore + 1);
    ::close(fd);

    assert(waitFor([&] { return totalActiveStreams(gateway) == activeBefore; }));
    assert(waitFor([&] { return gateway->stats().cancelled() == 1; }));
    assert(waitFor([&] { return gateway->stats().activeSessions() == 0; }));

    // At most the fetch already in flight finishes; nothing new starts.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const uint64_t fetches = h->fake->FetchCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    assert(h->fake->FetchCount() == fetches);
    assert(fetches < 200);
    LOG_INFO << "Mid-stream disconnect PASS";
}

// Clients that vanish while their shared metadata load is still running:
// only the load holds a client, and it lets go as soon as the last waiter
// has left.
static void testDisconnectBeforeHeaders(uint16_t port, StreamGateway* gateway) {
    const int activeBefore = totalActiveStreams(gateway);
    const uint64_t cancelledBefore = gateway->stats().cancelled();
    MetadataCache* cache = gateway->components().cache.get();
    const uint64_t abandonedBefore = cache->GetStats().abandonedLoads;

    int first = connectTo(port);
    int second = connectTo(port);
    sendAll(first, "GET /slowmeta HTTP/1.1\r\nHost: test\r\n\r\n");
    sendAll(second, "GET /slowmeta HTTP/1.1\r\nHost: test\r\n\r\n");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(totalActiveStreams(gateway) == activeBefore + 1);
    assert(cache->GetStats().sharedLoads >= 1);

    ::close(first);
    ::close(second);
    const auto closedAt = std::chrono::steady_clock::now();
    assert(waitFor([&] { return totalActiveStreams(gateway) == activeBefore; }, 500));
    assert(std::chrono::steady_clock::now() - closedAt < std::chrono::milliseconds(600));
    assert(waitFor([&] { return gateway->stats().cancelled() == cancelledBefore + 2; }));
    assert(cache->GetStats().abandonedLoads == abandonedBefore + 1);
    assert(!cache->Get("ref/slowmeta").has_value());

    // The handles are free for other requests long before the upstream
    // call behind the abandoned load returns.
    const auto start = std::chrono::steady_clock::now();
    int fd = connectTo(port);
    sendAll(fd, "GET /fast HTTP/1.1\r\nHost: test\r\n\r\n");
    ParsedResponse r = readResponse(fd, false, 2000);
    ::close(fd);
    assert(r.status == 200);
    assert(r.body == FakeUpstream::Expected(0, 999));
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
    LOG_INFO << "Disconnect before headers PASS";
}

// A metadata load that never answers is given up at its deadline.
static void testMetadataDeadline(uint16_t port, StreamGateway* gateway) {
    const int activeBefore = totalActiveStreams(gateway);
    const auto start = std::chrono::steady_clock::now();
    int fd = connectTo(port);
    sendAll(fd, "GET /stuck HTTP/1.1\r\nHost: test\r\n\r\n");
    ParsedResponse r = readResponse(fd, false, 5000);
    ::close(fd);
    assert(r.status == 502);
    assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1800));
    assert(waitFor([&] { return totalActiveStreams(gateway) == activeBefore; }, 500));
    assert(!gateway->components().cache->Get("ref/stuck").has_value());
    LOG_INFO << "Metadata deadline PASS";
}

// Output beyond the high-water mark pauses fetching until the socket drains.
static void testBackpressure(uint16_t port, StreamGateway* gateway, GatewayHarness* h) {
    h->fake->SetFetchDelay(std::chrono::milliseconds(0));
    const int activeBefore = totalActiveStreams(gateway);
    const uint64_t before = h->fake->FetchCount();
    int fd = connectTo(port);
    int small = 4096;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &small, sizeof(small));
    sendAll(fd, "GET /big HTTP/1.1\r\nHost: test\r\nRange: bytes=0-39999999\r\n\r\n");

    // Nobody reads for a while: only socket buffers plus the high-water
    // mark worth of chunks may be fetched, far from the whole 40 MB.
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    const uint64_t stalled = h->fake->FetchCount() - before;
    assert(stalled > 0);
    assert(stalled * 4096 < 16000000);
    ::close(fd);
    assert(waitFor([&] { return totalActiveStreams(gateway) == activeBefore; }));

    // A reader that keeps up gets every byte of a few MB.
    const uint64_t kFirst = 1000;
    const uint64_t kLast = 4 * 1024 * 1024 + 999;
    fd = connectTo(port);
    sendAll(fd, "GET /big HTTP/1.1\r\nHost: test\r\nRange: bytes=" + std::to_string(kFirst) + "-" +
                    std::to_string(kLast) + "\r\n\r\n");
    ParsedResponse r = readResponse(fd, false, 20000);
    ::close(fd);
    assert(r.status == 206);
    assert(r.body.size() == kLast - kFirst + 1);
    for (uint64_t i = 0; i < r.body.size(); i += 997) {
        assert(r.body[i] == FakeUpstream::ByteAt(kFirst + i));
    }
    assert(r.body.back() == FakeUpstream::ByteAt(kLast));
    LOG_INFO << "Backpressure PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    const uint16_t port = pickFreePort();

    GatewayHarness h;
    h.fake->AddFile("ref/big", 50000000, "video/mp4", "big.mp4", 1);
    h.fake->AddFile("ref/slowmeta", 1000, "video/mp4", "slow.mp4", 1);
    h.fake->AddFile("ref/stuck", 1000, "video/mp4", "stuck.mp4", 1);
    h.fake->AddFile("ref/fast", 1000, "video/mp4", "fast.mp4", 1);
    h.fake->SetMetaDelay("ref/slowmeta", std::chrono::milliseconds(3000));
    h.fake->SetMetaDelay("ref/stuck", std::chrono::milliseconds(3000));
    h.AddLink("big", "ref/big", "100");
    h.AddLink("slowmeta", "ref/slowmeta", "100");
    h.AddLink("stuck", "ref/stuck", "100");
    h.AddLink("fast", "ref/fast", "100");

    StreamGateway::Options opts = GatewayHarness::Options();
    opts.session.fetch.chunkSize = 4096;
    opts.session.fetch.requestAlignment = 1024;
    opts.session.sendHighWater = 256 * 1024;
    opts.session.metaTimeoutSec = 1.0;
    h.fake->SetFetchDelay(std::chrono::milliseconds(2));

    EventLoop loop;
    StreamGateway gateway(&loop, InetAddress(port, true), opts, h.parts);
    gateway.Start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        testMidStreamDisconnect(port, &gateway, &h);
        testDisconnectBeforeHeaders(port, &gateway);
        testMetadataDeadline(port, &gateway);
        testBackpressure(port, &gateway, &h);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    gateway.Stop();
    return 0;
}
