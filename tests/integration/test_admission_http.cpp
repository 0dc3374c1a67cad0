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
using streamgate::limiter::AdmissionController;

static void request(int fd, const std::string& path) {
    sendAll(fd, "GET " + path + " HTTP/1.1\r\nHost: test\r\n\r\n");
}

static std::string status(uint16_t port) {
    int fd = connectTo(port);
    request(fd, "/status");
    ParsedResponse r = readResponse(fd);
    ::close(fd);
    assert(r.status == 200);
    return r.body;
}

static bool waitForStatus(uint16_t port, const std::string& needle) {
    for (int i = 0; i < 100; ++i) {
        if (status(port).find(needle) != std::string::npos) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

static void testQueueThenAdmit(uint16_t port) {
    // First request uses the whole per-period quota of user 300.
    int first = connectTo(port);
    request(first, "/reg");
    ParsedResponse r = readResponse(first);
    assert(r.status == 200 && r.body == FakeUpstream::Expected(0, 999));
    ::close(first);

    // Second one parks in the regular queue.
    int queued = connectTo(port);
    request(queued, "/reg");
    assert(waitForStatus(port, "\"queue_regular\":1"));

    // The queue holds one: the third is turned away with a hint.
    int rejected = connectTo(port);
    request(rejected, "/reg");
    r = readResponse(rejected);
    ::close(rejected);
    assert(r.status == 429);
    assert(r.headers.count("retry-after") == 1);
    assert(std::atoi(r.headers["retry-after"].c_str()) >= 1);

    // Owners are never held back, even while the queue is full.
    int owner = connectTo(port);
    request(owner, "/own");
    r = readResponse(owner);
    ::close(owner);
    assert(r.status == 200);

    // Once the period rolls over the queued request is served.
    const auto start = std::chrono::steady_clock::now();
    r = readResponse(queued, false, 5000);
    ::close(queued);
    assert(r.status == 200 && r.body.size() == 1000);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));
    LOG_INFO << "Queue then admit PASS";
}

static void testQueuedClientLeaves(uint16_t port, StreamGateway* gateway) {
    const uint64_t cancelledBefore = gateway->stats().cancelled();
    int fd = connectTo(port);
    request(fd, "/reg");
    assert(waitForStatus(port, "\"queue_regular\":1"));
    ::close(fd);
    assert(waitForStatus(port, "\"queue_regular\":0"));
    assert(gateway->stats().cancelled() == cancelledBefore + 1);
    LOG_INFO << "Queued client leaves PASS";
}

static void testAuthorizedLimit(uint16_t port) {
    // Twice the regular allowance.
    for (int i = 0; i < 2; ++i) {
        int fd = connectTo(port);
        request(fd, "/auth");
        ParsedResponse r = readResponse(fd);
        ::close(fd);
        assert(r.status == 200);
    }
    int fd = connectTo(port);
    request(fd, "/auth");
    assert(waitForStatus(port, "\"queue_authorized\":1"));
    ::close(fd);
    LOG_INFO << "Authorized limit PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    const uint16_t port = pickFreePort();

    AdmissionController::Config limits;
    limits.maxFilesPerPeriod = 1;
    limits.periodMinutes = 0.02;   // 1.2 s
    limits.maxQueueSize = 1;
    limits.queueTimeoutSec = 10.0;
    GatewayHarness h(limits);
    h.fake->AddFile("ref/small", 1000, "audio/mpeg", "small.mp3", 1);
    h.AddLink("reg", "ref/small", "300");
    h.AddLink("own", "ref/small", "100");
    h.AddLink("auth", "ref/small", "200");

    EventLoop loop;
    StreamGateway gateway(&loop, InetAddress(port, true), GatewayHarness::Options(), h.parts);
    gateway.Start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        testQueueThenAdmit(port);
        testQueuedClientLeaves(port, &gateway);
        testAuthorizedLimit(port);
        assert(gateway.stats().throttled() == 1);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    gateway.Stop();
    return 0;
}
