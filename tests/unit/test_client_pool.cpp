#include "streamgate/upstream/ClientPool.h"
#include "streamgate/common/Logger.h"
#include "support/FakeUpstream.h"

#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace streamgate::upstream;
using namespace streamgate::common;
using streamgate::testing::FakeUpstream;
using std::chrono::seconds;

static ClientPool::ClientSpec spec(const std::string& name, int dc) {
    ClientPool::ClientSpec s;
    s.name = name;
    s.credential = "cred-" + name;
    s.dcId = dc;
    s.client = std::make_shared<FakeUpstream>();
    return s;
}

static const ClientSnapshot& find(const std::vector<ClientSnapshot>& snaps, int id) {
    for (const auto& s : snaps) {
        if (s.id == id) return s;
    }
    throw std::runtime_error("no snapshot");
}

static void testLeastLoadedThenOldest() {
    ClientPool pool(ClientPool::Config{});
    const int a = pool.AddClient(spec("a", 1));
    const int b = pool.AddClient(spec("b", 1));
    const auto t0 = Clock::now();

    auto r1 = pool.AcquireAt(t0);
    assert(r1.status == ClientPool::AcquireStatus::kOk);
    assert(r1.lease->handleId() == a);   // tie on everything: lowest id
    auto r2 = pool.AcquireAt(t0 + seconds(1));
    assert(r2.lease->handleId() == b);   // a has one stream, b none

    r1.lease->Release();
    r2.lease->Release();
    // Both idle again; b was used more recently so a goes first.
    auto r3 = pool.AcquireAt(t0 + seconds(2));
    assert(r3.lease->handleId() == a);
    LOG_INFO << "Least loaded PASS";
}

static void testPreferredDataCenter() {
    ClientPool pool(ClientPool::Config{});
    pool.AddClient(spec("dc1", 1));
    const int dc4 = pool.AddClient(spec("dc4", 4));
    auto r = pool.Acquire(4);
    assert(r.lease->handleId() == dc4);
    // Still chosen while under the cap even though dc1 is idle.
    auto r2 = pool.Acquire(4);
    assert(r2.lease->handleId() == dc4);
    // Unknown data center falls back to the general choice.
    auto r3 = pool.Acquire(9);
    assert(r3.status == ClientPool::AcquireStatus::kOk && r3.lease->handleId() != dc4);
    LOG_INFO << "Data center preference PASS";
}

static void testCapBlocksAndReleaseIsIdempotent() {
    ClientPool::Config cfg;
    cfg.maxStreamsPerClient = 2;
    ClientPool pool(cfg);
    const int id = pool.AddClient(spec("only", 1));

    auto r1 = pool.Acquire();
    auto r2 = pool.Acquire();
    auto r3 = pool.Acquire();
    assert(r3.status == ClientPool::AcquireStatus::kBlocked);
    assert(r3.retryAfter == Clock::duration::zero());
    assert(find(pool.Snapshot(), id).activeStreams == 2);

    r1.lease->Release();
    r1.lease->Release();
    assert(r1.lease->released());
    assert(find(pool.Snapshot(), id).activeStreams == 1);

    r2.lease.reset();   // destructor releases
    assert(find(pool.Snapshot(), id).activeStreams == 0);
    assert(pool.Acquire().status == ClientPool::AcquireStatus::kOk);
    LOG_INFO << "Cap and release PASS";
}

static void testFloodWaitExpiresOnItsOwn() {
    ClientPool pool(ClientPool::Config{});
    pool.AddClient(spec("only", 1));
    std::vector<CapacityEvent> events;
    pool.SetCapacityCallback([&events](const CapacityEvent& e) { events.push_back(e); });

    const auto t0 = Clock::now();
    auto r = pool.AcquireAt(t0);
    const ClientHandleWeak handle = r.lease->handle();
    pool.MarkFloodWaitAt(t0, handle, 30.0);
    r.lease->Release();
    assert(events.size() == 1 && events[0].kind == CapacityEvent::kFloodWait);

    auto blocked = pool.AcquireAt(t0 + seconds(10));
    assert(blocked.status == ClientPool::AcquireStatus::kBlocked);
    assert(blocked.retryAfter == seconds(20));
    assert(find(pool.SnapshotAt(t0 + seconds(10)), 1).state == "flood_waited");

    // A shorter flood wait never cuts an existing one.
    pool.MarkFloodWaitAt(t0 + seconds(10), handle, 1.0);
    assert(pool.AcquireAt(t0 + seconds(12)).status == ClientPool::AcquireStatus::kBlocked);
    assert(events.size() == 1);

    // No explicit call needed: the next acquire after expiry succeeds.
    assert(find(pool.SnapshotAt(t0 + seconds(30)), 1).state == "available");
    assert(pool.AcquireAt(t0 + seconds(30)).status == ClientPool::AcquireStatus::kOk);
    LOG_INFO << "Flood wait expiry PASS";
}

static void testDisabledAndExhausted() {
    ClientPool pool(ClientPool::Config{});
    pool.AddClient(spec("a", 1));
    pool.AddClient(spec("b", 1));
    std::vector<CapacityEvent> events;
    pool.SetCapacityCallback([&events](const CapacityEvent& e) { events.push_back(e); });

    auto ra = pool.Acquire();
    auto rb = pool.Acquire();
    pool.MarkDisabled(ra.lease->handle(), "auth key revoked");
    assert(pool.UsableCount() == 1);
    assert(events.size() == 1 && events[0].kind == CapacityEvent::kDisabled && events[0].usableHandles == 1);

    pool.MarkDisabled(rb.lease->handle(), "auth key revoked");
    assert(pool.UsableCount() == 0);
    assert(events.size() == 3 && events[2].kind == CapacityEvent::kExhausted);
    // Disabled is terminal: a flood wait does not revive it.
    pool.MarkFloodWait(rb.lease->handle(), 1.0);
    assert(events.size() == 3);

    assert(pool.Acquire().status == ClientPool::AcquireStatus::kUnavailable);
    LOG_INFO << "Disabled/exhausted PASS";
}

static void testCircuitBreaker() {
    ClientPool::Config cfg;
    cfg.breakerThreshold = 3;
    cfg.breakerCooldownSec = 5.0;
    ClientPool pool(cfg);
    pool.AddClient(spec("flaky", 1));
    std::vector<CapacityEvent> events;
    pool.SetCapacityCallback([&events](const CapacityEvent& e) { events.push_back(e); });

    const auto t0 = Clock::now();
    auto r = pool.AcquireAt(t0);
    const ClientHandleWeak handle = r.lease->handle();
    pool.ReportFailureAt(t0, handle);
    pool.ReportFailureAt(t0, handle);
    pool.ReportSuccess(handle);   // resets the streak
    pool.ReportFailureAt(t0, handle);
    pool.ReportFailureAt(t0, handle);
    assert(events.empty());
    pool.ReportFailureAt(t0, handle);
    assert(events.size() == 1 && events[0].kind == CapacityEvent::kCircuitOpen);

    r.lease->Release();
    assert(pool.AcquireAt(t0 + seconds(4)).status == ClientPool::AcquireStatus::kBlocked);
    assert(pool.AcquireAt(t0 + seconds(5)).status == ClientPool::AcquireStatus::kOk);
    LOG_INFO << "Circuit breaker PASS";
}

static void testShutdownDetachesLeases() {
    ClientPool pool(ClientPool::Config{});
    pool.AddClient(spec("a", 1));
    auto r = pool.Acquire();
    assert(r.lease->client() != nullptr);
    pool.Shutdown();
    assert(pool.Size() == 0);
    assert(r.lease->client() == nullptr);
    r.lease->Release();
    assert(pool.Acquire().status == ClientPool::AcquireStatus::kUnavailable);
    LOG_INFO << "Shutdown PASS";
}

static void testRejectsBadConfig() {
    ClientPool::Config cfg;
    cfg.maxStreamsPerClient = 0;
    bool threw = false;
    try {
        ClientPool pool(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    ClientPool pool(ClientPool::Config{});
    ClientPool::ClientSpec empty;
    empty.name = "broken";
    try {
        pool.AddClient(empty);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Bad config PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testLeastLoadedThenOldest();
    testPreferredDataCenter();
    testCapBlocksAndReleaseIsIdempotent();
    testFloodWaitExpiresOnItsOwn();
    testDisabledAndExhausted();
    testCircuitBreaker();
    testShutdownDetachesLeases();
    testRejectsBadConfig();
    return 0;
}
