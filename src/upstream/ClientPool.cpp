#include "streamgate/upstream/ClientPool.h"
#include "streamgate/common/Logger.h"

#include <stdexcept>

namespace streamgate {
namespace upstream {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

Clock::duration Seconds(double sec) {
    if (sec < 0.0) sec = 0.0;
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(sec));
}

} // namespace

const char* UpstreamStatusName(UpstreamStatus status) {
    switch (status) {
        case UpstreamStatus::kOk: return "ok";
        case UpstreamStatus::kFloodWait: return "flood_wait";
        case UpstreamStatus::kTransient: return "transient";
        case UpstreamStatus::kAuthRevoked: return "auth_revoked";
        case UpstreamStatus::kNotFound: return "not_found";
        case UpstreamStatus::kFatal: return "fatal";
        case UpstreamStatus::kNoClient: return "no_client";
    }
    return "unknown";
}

const char* HandleStateName(const HandleState& state) {
    return std::visit(Overloaded{
        [](const Available&) { return "available"; },
        [](const FloodWaited&) { return "flood_waited"; },
        [](const Disabled&) { return "disabled"; },
    }, state);
}

ClientPool::Lease::Lease(ClientPool* pool, ClientHandleWeak handle, int handleId)
    : pool_(pool), handle_(std::move(handle)), handleId_(handleId) {}

ClientPool::Lease::~Lease() {
    Release();
}

UpstreamClientPtr ClientPool::Lease::client() const {
    if (released_) return nullptr;
    auto h = handle_.lock();
    return h ? h->client : nullptr;
}

void ClientPool::Lease::Release() {
    if (released_) return;
    released_ = true;
    if (pool_) pool_->ReleaseHandle(handle_);
}

ClientPool::ClientPool(Config cfg) : cfg_(cfg) {
    if (cfg_.maxStreamsPerClient < 1) {
        throw std::invalid_argument("ClientPool: max_streams_per_client must be >= 1");
    }
    if (cfg_.breakerThreshold < 0 || cfg_.breakerCooldownSec < 0.0) {
        throw std::invalid_argument("ClientPool: breaker settings must be non-negative");
    }
}

ClientPool::~ClientPool() = default;

int ClientPool::AddClient(ClientSpec spec) {
    if (!spec.client) {
        throw std::invalid_argument("ClientPool: client '" + spec.name + "' has no upstream connection");
    }
    auto handle = std::make_shared<ClientHandle>();
    handle->name = std::move(spec.name);
    handle->credential = std::move(spec.credential);
    handle->dcId = spec.dcId;
    handle->client = std::move(spec.client);

    std::lock_guard<std::mutex> lock(mutex_);
    handle->id = nextId_++;
    LOG_INFO << "ClientPool: added client " << handle->id << " (" << handle->name << ") dc=" << handle->dcId;
    handles_.push_back(handle);
    return handle->id;
}

void ClientPool::SetCapacityCallback(CapacityCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacityCallback_ = std::move(cb);
}

ClientPool::AcquireResult ClientPool::Acquire(std::optional<int> preferredDcId) {
    return AcquireAt(Clock::now(), preferredDcId);
}

ClientPool::AcquireResult ClientPool::AcquireAt(Clock::time_point now, std::optional<int> preferredDcId) {
    AcquireResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ClientHandle*> candidates;
    bool anyUsable = false;
    std::optional<Clock::time_point> earliestExpiry;

    for (auto& h : handles_) {
        if (std::holds_alternative<Disabled>(h->state)) continue;
        anyUsable = true;
        if (auto* fw = std::get_if<FloodWaited>(&h->state)) {
            if (fw->until > now) {
                if (!earliestExpiry || fw->until < *earliestExpiry) earliestExpiry = fw->until;
                continue;
            }
            LOG_INFO << "ClientPool: client " << h->id << " (" << h->name << ") cooldown expired";
            h->state = Available{};
        }
        if (h->activeStreams >= cfg_.maxStreamsPerClient) continue;
        candidates.push_back(h.get());
    }

    if (!anyUsable) {
        result.status = AcquireStatus::kUnavailable;
        return result;
    }
    if (candidates.empty()) {
        result.status = AcquireStatus::kBlocked;
        // Only cooldowns give a known wake-up time; caps free up on release.
        if (earliestExpiry) result.retryAfter = *earliestExpiry - now;
        return result;
    }

    if (preferredDcId) {
        std::vector<ClientHandle*> local;
        for (auto* h : candidates) {
            if (h->dcId == *preferredDcId) local.push_back(h);
        }
        if (!local.empty()) candidates.swap(local);
    }

    ClientHandle* best = candidates.front();
    for (auto* h : candidates) {
        if (h->activeStreams < best->activeStreams ||
            (h->activeStreams == best->activeStreams && h->lastUsedAt < best->lastUsedAt)) {
            best = h;
        }
    }

    best->activeStreams++;
    best->totalLeases++;
    best->lastUsedAt = now;

    std::shared_ptr<ClientHandle> owner;
    for (auto& h : handles_) {
        if (h.get() == best) owner = h;
    }
    result.status = AcquireStatus::kOk;
    result.lease = std::make_unique<Lease>(this, owner, best->id);
    LOG_DEBUG << "ClientPool: leased client " << best->id << " active=" << best->activeStreams;
    return result;
}

void ClientPool::ReleaseHandle(const ClientHandleWeak& handle) {
    auto h = handle.lock();
    if (!h) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (h->activeStreams > 0) h->activeStreams--;
}

void ClientPool::MarkFloodWait(const ClientHandleWeak& handle, double seconds) {
    MarkFloodWaitAt(Clock::now(), handle, seconds);
}

void ClientPool::MarkFloodWaitAt(Clock::time_point now, const ClientHandleWeak& handle, double seconds) {
    auto h = handle.lock();
    if (!h) return;
    std::vector<CapacityEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<Disabled>(h->state)) return;
        const Clock::time_point until = now + Seconds(seconds);
        // Never shorten an existing cooldown.
        if (auto* fw = std::get_if<FloodWaited>(&h->state)) {
            if (fw->until >= until) return;
        }
        h->state = FloodWaited{until};
        events.push_back({CapacityEvent::kFloodWait, h->id, h->name, UsableCountLocked()});
    }
    LOG_WARN << "ClientPool: client " << h->id << " (" << h->name << ") flood-waited for " << seconds << "s";
    Notify(events);
}

void ClientPool::MarkDisabled(const ClientHandleWeak& handle, const std::string& reason) {
    auto h = handle.lock();
    if (!h) return;
    std::vector<CapacityEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<Disabled>(h->state)) return;
        h->state = Disabled{reason};
        const size_t usable = UsableCountLocked();
        events.push_back({CapacityEvent::kDisabled, h->id, h->name, usable});
        if (usable == 0) {
            events.push_back({CapacityEvent::kExhausted, 0, std::string(), 0});
        }
    }
    LOG_ERROR << "ClientPool: client " << h->id << " (" << h->name << ") disabled: " << reason;
    Notify(events);
}

void ClientPool::ReportSuccess(const ClientHandleWeak& handle) {
    auto h = handle.lock();
    if (!h) return;
    std::lock_guard<std::mutex> lock(mutex_);
    h->consecutiveFailures = 0;
}

void ClientPool::ReportFailure(const ClientHandleWeak& handle) {
    ReportFailureAt(Clock::now(), handle);
}

void ClientPool::ReportFailureAt(Clock::time_point now, const ClientHandleWeak& handle) {
    auto h = handle.lock();
    if (!h) return;
    std::vector<CapacityEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        h->consecutiveFailures++;
        if (cfg_.breakerThreshold == 0 || h->consecutiveFailures < cfg_.breakerThreshold) return;
        h->consecutiveFailures = 0;
        if (!std::holds_alternative<Available>(h->state)) return;
        h->state = FloodWaited{now + Seconds(cfg_.breakerCooldownSec)};
        events.push_back({CapacityEvent::kCircuitOpen, h->id, h->name, UsableCountLocked()});
    }
    LOG_WARN << "ClientPool: client " << h->id << " (" << h->name << ") circuit open for "
             << cfg_.breakerCooldownSec << "s after " << cfg_.breakerThreshold << " failures";
    Notify(events);
}

void ClientPool::Shutdown() {
    std::vector<std::shared_ptr<ClientHandle>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(handles_);
    }
    LOG_INFO << "ClientPool: shut down, dropped " << dropped.size() << " clients";
}

size_t ClientPool::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

size_t ClientPool::UsableCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return UsableCountLocked();
}

size_t ClientPool::UsableCountLocked() const {
    size_t n = 0;
    for (const auto& h : handles_) {
        if (!std::holds_alternative<Disabled>(h->state)) ++n;
    }
    return n;
}

std::vector<ClientSnapshot> ClientPool::Snapshot() const {
    return SnapshotAt(Clock::now());
}

std::vector<ClientSnapshot> ClientPool::SnapshotAt(Clock::time_point now) const {
    std::vector<ClientSnapshot> out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(handles_.size());
    for (const auto& h : handles_) {
        ClientSnapshot s;
        s.id = h->id;
        s.name = h->name;
        s.dcId = h->dcId;
        s.activeStreams = h->activeStreams;
        s.totalLeases = h->totalLeases;
        s.state = HandleStateName(h->state);
        if (auto* fw = std::get_if<FloodWaited>(&h->state)) {
            if (fw->until > now) {
                s.floodWaitRemainingSec = std::chrono::duration<double>(fw->until - now).count();
            } else {
                s.state = "available";
            }
        }
        out.push_back(std::move(s));
    }
    return out;
}

void ClientPool::Notify(const std::vector<CapacityEvent>& events) {
    CapacityCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = capacityCallback_;
    }
    if (!cb) return;
    for (const auto& e : events) cb(e);
}

} // namespace upstream
} // namespace streamgate
