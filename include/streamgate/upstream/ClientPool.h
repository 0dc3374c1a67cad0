#pragma once

#include "streamgate/common/noncopyable.h"
#include "streamgate/upstream/UpstreamClient.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace streamgate {
namespace upstream {

using Clock = std::chrono::steady_clock;

struct Available {};
struct FloodWaited {
    Clock::time_point until;
};
struct Disabled {
    std::string reason;
};
using HandleState = std::variant<Available, FloodWaited, Disabled>;

const char* HandleStateName(const HandleState& state);

// One configured credential. Mutated only by ClientPool, under its mutex.
struct ClientHandle {
    int id{0};
    std::string name;
    std::string credential;
    int dcId{0};
    UpstreamClientPtr client;

    HandleState state{Available{}};
    Clock::time_point lastUsedAt{};
    int activeStreams{0};
    int consecutiveFailures{0};
    uint64_t totalLeases{0};
};

using ClientHandleWeak = std::weak_ptr<ClientHandle>;

// Point-in-time copy for /status and tests.
struct ClientSnapshot {
    int id{0};
    std::string name;
    int dcId{0};
    std::string state;
    int activeStreams{0};
    double floodWaitRemainingSec{0.0};
    uint64_t totalLeases{0};
};

struct CapacityEvent {
    enum Kind {
        kFloodWait,     // handle cooling down after upstream throttling
        kCircuitOpen,   // handle cooling down after repeated transient failures
        kDisabled,      // handle permanently excluded
        kExhausted,     // every handle disabled: gateway cannot serve
    };
    Kind kind;
    int handleId{0};
    std::string handleName;
    size_t usableHandles{0};
};

// Owns the upstream credentials and hands out one per stream, least loaded
// first. Thread safe.
class ClientPool : streamgate::common::noncopyable {
public:
    struct Config {
        int maxStreamsPerClient{4};
        int breakerThreshold{5};         // consecutive transient failures; 0 disables
        double breakerCooldownSec{30.0};
    };

    struct ClientSpec {
        std::string name;
        std::string credential;
        int dcId{0};
        UpstreamClientPtr client;
    };

    // Holds one active-stream slot on a handle. Releasing twice is a no-op;
    // the destructor releases too.
    class Lease : streamgate::common::noncopyable {
    public:
        Lease(ClientPool* pool, ClientHandleWeak handle, int handleId);
        ~Lease();

        // nullptr once the pool has been shut down.
        UpstreamClientPtr client() const;
        const ClientHandleWeak& handle() const { return handle_; }
        int handleId() const { return handleId_; }
        bool released() const { return released_; }

        void Release();

    private:
        ClientPool* pool_;
        ClientHandleWeak handle_;
        int handleId_;
        bool released_{false};
    };
    using LeasePtr = std::unique_ptr<Lease>;

    enum class AcquireStatus {
        kOk,
        kBlocked,      // every usable handle is flood-waited or at its cap
        kUnavailable,  // no usable handle at all
    };

    struct AcquireResult {
        AcquireStatus status{AcquireStatus::kUnavailable};
        LeasePtr lease;
        // Earliest flood-wait expiry when blocked by cooldowns; zero when blocked by caps.
        Clock::duration retryAfter{Clock::duration::zero()};
    };

    using CapacityCallback = std::function<void(const CapacityEvent&)>;

    explicit ClientPool(Config cfg);
    ~ClientPool();

    int AddClient(ClientSpec spec);
    void SetCapacityCallback(CapacityCallback cb);

    AcquireResult Acquire(std::optional<int> preferredDcId = std::nullopt);
    AcquireResult AcquireAt(Clock::time_point now, std::optional<int> preferredDcId = std::nullopt);

    void MarkFloodWait(const ClientHandleWeak& handle, double seconds);
    void MarkFloodWaitAt(Clock::time_point now, const ClientHandleWeak& handle, double seconds);
    void MarkDisabled(const ClientHandleWeak& handle, const std::string& reason);

    // Circuit breaker bookkeeping for transient upstream failures.
    void ReportSuccess(const ClientHandleWeak& handle);
    void ReportFailure(const ClientHandleWeak& handle);
    void ReportFailureAt(Clock::time_point now, const ClientHandleWeak& handle);

    // Drops every handle. Outstanding leases see client() == nullptr.
    void Shutdown();

    size_t Size() const;
    size_t UsableCount() const;
    std::vector<ClientSnapshot> Snapshot() const;
    std::vector<ClientSnapshot> SnapshotAt(Clock::time_point now) const;

    const Config& config() const { return cfg_; }

private:
    void ReleaseHandle(const ClientHandleWeak& handle);
    size_t UsableCountLocked() const;
    void Notify(const std::vector<CapacityEvent>& events);

    const Config cfg_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ClientHandle>> handles_;
    int nextId_{1};
    CapacityCallback capacityCallback_;
};

} // namespace upstream
} // namespace streamgate
