#include "streamgate/stream/StreamGateway.h"
#include "streamgate/common/Logger.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/network/TcpConnection.h"
#include "streamgate/protocol/ContentHeaders.h"
#include "streamgate/protocol/HttpRequest.h"
#include "streamgate/protocol/HttpResponse.h"

#include <cstdio>
#include <stdexcept>

namespace streamgate {
namespace stream {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::HttpServer;

namespace {

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string FormatDouble(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

const char* CapacityEventName(upstream::CapacityEvent::Kind kind) {
    switch (kind) {
        case upstream::CapacityEvent::kFloodWait: return "flood_wait";
        case upstream::CapacityEvent::kCircuitOpen: return "circuit_open";
        case upstream::CapacityEvent::kDisabled: return "disabled";
        case upstream::CapacityEvent::kExhausted: return "exhausted";
    }
    return "unknown";
}

} // namespace

StreamGateway::StreamGateway(network::EventLoop* loop,
                             const network::InetAddress& listenAddr,
                             Options options,
                             Components components)
    : loop_(loop),
      opts_(std::move(options)),
      parts_(std::move(components)),
      workers_(static_cast<size_t>(opts_.workerThreads > 0 ? opts_.workerThreads : 1), "fetch"),
      server_(loop, listenAddr, opts_.name) {
    if (!parts_.pool || !parts_.admission || !parts_.cache || !parts_.links || !parts_.classifier) {
        throw std::invalid_argument("StreamGateway: missing component");
    }
    opts_.session.fetch.Validate();
    if (opts_.drainIntervalSec <= 0.0) {
        throw std::invalid_argument("limits: drain_interval_ms must be > 0");
    }

    deps_.pool = parts_.pool.get();
    deps_.admission = parts_.admission.get();
    deps_.cache = parts_.cache.get();
    deps_.links = parts_.links.get();
    deps_.classifier = parts_.classifier.get();
    deps_.workers = &workers_;
    deps_.stats = &stats_;
    deps_.options = opts_.session;

    parts_.pool->SetCapacityCallback([](const upstream::CapacityEvent& e) {
        if (e.kind == upstream::CapacityEvent::kExhausted) {
            LOG_ERROR << "StreamGateway: every upstream client is disabled, answering 503 until restart";
            return;
        }
        LOG_WARN << "StreamGateway: degraded capacity, client " << e.handleId << " (" << e.handleName << ") "
                 << CapacityEventName(e.kind) << ", " << e.usableHandles << " usable";
    });

    server_.setThreadNum(opts_.ioThreads);
    server_.tcpServer().SetMaxConnections(opts_.maxConnections);
    server_.tcpServer().SetIdleTimeout(opts_.idleTimeoutSec);
    server_.setRequestHandler([this](const network::TcpConnectionPtr& conn, const HttpRequest& req,
                                     const HttpServer::CompletionCallback& done) {
        return OnRequest(conn, req, done);
    });
}

StreamGateway::~StreamGateway() {
    Stop();
}

bool StreamGateway::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    return server_.tcpServer().EnableTls(certPemPath, keyPemPath);
}

void StreamGateway::Start() {
    LOG_INFO << "StreamGateway: " << parts_.pool->Size() << " upstream clients, " << opts_.workerThreads
             << " fetch workers, " << opts_.ioThreads << " I/O threads";
    server_.start();
    limiter::AdmissionController* admission = parts_.admission.get();
    drainTimer_ = loop_->RunEvery(opts_.drainIntervalSec, [admission] { admission->Drain(); });
}

void StreamGateway::Stop() {
    if (stopped_) return;
    stopped_ = true;
    if (drainTimer_) {
        loop_->CancelTimer(drainTimer_);
        drainTimer_ = 0;
    }
    parts_.admission->Shutdown();
    workers_.Stop();
    LOG_INFO << "StreamGateway: stopped after " << stats_.requests() << " requests, " << stats_.bytesServed()
             << " bytes served";
}

protocol::HttpExchangePtr StreamGateway::OnRequest(const network::TcpConnectionPtr& conn,
                                                   const HttpRequest& req,
                                                   const HttpServer::CompletionCallback& done) {
    const bool keepAlive = !req.wantsClose();
    const bool head = req.getMethod() == HttpRequest::kHead;

    if (req.getMethod() != HttpRequest::kGet && !head) {
        HttpResponse resp(!keepAlive);
        resp.setStatus(HttpResponse::k405MethodNotAllowed);
        resp.addHeader("Allow", "GET, HEAD");
        resp.setContentType("text/plain");
        resp.setBody("Method Not Allowed\n");
        HttpServer::SendResponse(conn, resp);
        done(resp.closeConnection());
        return nullptr;
    }

    if (req.path() == "/status") {
        HttpResponse resp(!keepAlive);
        resp.setStatus(HttpResponse::k200Ok);
        resp.setContentType("application/json");
        resp.addHeader("Cache-Control", "no-store");
        resp.setBody(StatusJson());
        resp.setOmitBody(head);
        HttpServer::SendResponse(conn, resp);
        done(resp.closeConnection());
        return nullptr;
    }

    LinkPath link;
    if (!ParseLinkPath(req.path(), req.query(), &link)) {
        HttpResponse resp(!keepAlive);
        resp.setStatus(HttpResponse::k404NotFound);
        resp.setContentType("text/html; charset=utf-8");
        resp.setBody("<html><body><h1>404: Invalid link</h1></body></html>\n");
        resp.setOmitBody(head);
        HttpServer::SendResponse(conn, resp);
        done(resp.closeConnection());
        return nullptr;
    }

    auto session = std::make_shared<StreamSession>(deps_, conn, nextRequestId_.fetch_add(1), std::move(link),
                                                   head, keepAlive, req.getHeader("Range"), done);
    session->Start();
    return session;
}

std::string StreamGateway::StatusJson() const {
    const std::vector<upstream::ClientSnapshot> clients = parts_.pool->Snapshot();
    const limiter::AdmissionController::Stats adm = parts_.admission->GetStats();
    const MetadataCache::Stats cache = parts_.cache->GetStats();

    size_t active = 0;
    for (const auto& c : clients) {
        if (c.state != "disabled") ++active;
    }

    std::string json = "{";
    json += "\"status\":\"" + std::string(active > 0 ? "operational" : "unavailable") + "\",";
    json += "\"version\":\"" + JsonEscape(opts_.version) + "\",";
    json += "\"uptime_sec\":" + FormatDouble(stats_.UptimeSec()) + ",";
    json += "\"active_clients\":" + std::to_string(active) + ",";
    json += "\"workload_distribution\":[";
    for (size_t i = 0; i < clients.size(); ++i) {
        const auto& c = clients[i];
        if (i) json += ",";
        json += "{";
        json += "\"id\":" + std::to_string(c.id) + ",";
        json += "\"name\":\"" + JsonEscape(c.name) + "\",";
        json += "\"dc_id\":" + std::to_string(c.dcId) + ",";
        json += "\"state\":\"" + c.state + "\",";
        json += "\"active_streams\":" + std::to_string(c.activeStreams) + ",";
        json += "\"flood_wait_remaining_sec\":" + FormatDouble(c.floodWaitRemainingSec) + ",";
        json += "\"total_leases\":" + std::to_string(c.totalLeases);
        json += "}";
    }
    json += "],";
    json += "\"admission\":{";
    json += "\"enabled\":" + std::string(parts_.admission->config().enabled ? "true" : "false") + ",";
    json += "\"queue_owner\":" + std::to_string(adm.queueDepth[0]) + ",";
    json += "\"queue_authorized\":" + std::to_string(adm.queueDepth[1]) + ",";
    json += "\"queue_regular\":" + std::to_string(adm.queueDepth[2]) + ",";
    json += "\"admitted\":" + std::to_string(adm.admitted) + ",";
    json += "\"queued\":" + std::to_string(adm.queued) + ",";
    json += "\"rejected_queue_full\":" + std::to_string(adm.rejectedQueueFull) + ",";
    json += "\"rejected_timeout\":" + std::to_string(adm.rejectedTimeout) + ",";
    json += "\"tracked_users\":" + std::to_string(adm.trackedUsers);
    json += "},";
    json += "\"cache\":{";
    json += "\"entries\":" + std::to_string(cache.entries) + ",";
    json += "\"capacity\":" + std::to_string(cache.capacity) + ",";
    json += "\"hits\":" + std::to_string(cache.hits) + ",";
    json += "\"misses\":" + std::to_string(cache.misses) + ",";
    json += "\"loads\":" + std::to_string(cache.loads) + ",";
    json += "\"shared_loads\":" + std::to_string(cache.sharedLoads) + ",";
    json += "\"abandoned_loads\":" + std::to_string(cache.abandonedLoads);
    json += "},";
    json += "\"counters\":{";
    json += "\"requests\":" + std::to_string(stats_.requests()) + ",";
    json += "\"bytes_served\":" + std::to_string(stats_.bytesServed()) + ",";
    json += "\"active_sessions\":" + std::to_string(stats_.activeSessions()) + ",";
    json += "\"completed\":" + std::to_string(stats_.completed()) + ",";
    json += "\"failed\":" + std::to_string(stats_.failed()) + ",";
    json += "\"cancelled\":" + std::to_string(stats_.cancelled()) + ",";
    json += "\"throttled\":" + std::to_string(stats_.throttled()) + ",";
    json += "\"reacquired\":" + std::to_string(stats_.reacquired());
    json += "}";
    json += "}";
    return json;
}

} // namespace stream
} // namespace streamgate
