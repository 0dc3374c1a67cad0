#include "streamgate/common/Config.h"
#include "streamgate/common/Logger.h"
#include "streamgate/limiter/AdmissionController.h"
#include "streamgate/network/EventLoop.h"
#include "streamgate/network/InetAddress.h"
#include "streamgate/stream/Directory.h"
#include "streamgate/stream/MetadataCache.h"
#include "streamgate/stream/StreamGateway.h"
#include "streamgate/upstream/ClientPool.h"
#include "streamgate/upstream/DirectoryUpstream.h"

#include <csignal>
#include <cstdio>
#include <getopt.h>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace {

streamgate::network::EventLoop* g_loop = nullptr;

void HandleStopSignal(int) {
    if (g_loop) g_loop->Quit();
}

std::set<std::string> ToSet(const std::vector<std::string>& items) {
    return std::set<std::string>(items.begin(), items.end());
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace streamgate;

    std::string configFile = "../config/streamgate.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }

    auto& logger = common::Logger::Instance();
    logger.SetLevel(logger.ParseLevel(conf.GetString("global", "log_level", "INFO")));
    const std::string logFile = conf.GetString("global", "log_file", "");
    if (!logFile.empty() &&
        !logger.SetLogFile(logFile, conf.GetInt64("global", "log_max_bytes", 10 * 1024 * 1024),
                           conf.GetInt("global", "log_backups", 5))) {
        LOG_WARN << "Cannot open log file " << logFile << ", logging to stdout only";
    }

    const uint16_t port = static_cast<uint16_t>(conf.GetInt("global", "listen_port", 8080));
    const std::string upstreamRoot = conf.GetString("upstream", "root", ".");

    stream::StreamGateway::Options opts;
    opts.ioThreads = conf.GetInt("global", "threads", 4);
    opts.idleTimeoutSec = conf.GetDouble("global", "idle_timeout_sec", 300.0);
    opts.maxConnections = conf.GetInt("global", "max_connections", 0);
    opts.workerThreads = conf.GetInt("fetch", "workers", 16);
    opts.drainIntervalSec = conf.GetInt("limits", "drain_interval_ms", 500) / 1000.0;

    stream::StreamGateway::Components parts;
    try {
        stream::SessionOptions& session = opts.session;
        session.fetch.chunkSize = static_cast<uint32_t>(conf.GetSize("fetch", "chunk_size", 1024 * 1024));
        session.fetch.requestAlignment = static_cast<uint32_t>(conf.GetSize("fetch", "request_alignment", 4096));
        session.fetch.retryAttempts = conf.GetInt("fetch", "retry_attempts", 4);
        session.fetch.retryBaseMs = conf.GetInt("fetch", "retry_base_ms", 250);
        session.fetch.retryMultiplier = conf.GetDouble("fetch", "retry_multiplier", 2.0);
        session.fetch.retryMaxMs = conf.GetInt("fetch", "retry_max_ms", 4000);
        session.fetchTimeoutSec = conf.GetDouble("fetch", "timeout_sec", 60.0);
        session.metaTimeoutSec = conf.GetDouble("fetch", "meta_timeout_sec", 30.0);
        session.sendHighWater = static_cast<size_t>(conf.GetSize("fetch", "send_high_water", 4 * 1024 * 1024));
        session.acquireTimeoutSec = conf.GetInt("pool", "acquire_timeout_ms", 10000) / 1000.0;
        session.acquireRetrySec = conf.GetInt("pool", "acquire_retry_ms", 250) / 1000.0;
        session.requireSecureHash = conf.GetInt("security", "require_hash", 1) != 0;

        upstream::ClientPool::Config poolCfg;
        poolCfg.maxStreamsPerClient = conf.GetInt("pool", "max_streams_per_client", 4);
        poolCfg.breakerThreshold = conf.GetInt("pool", "breaker_threshold", 5);
        poolCfg.breakerCooldownSec = conf.GetDouble("pool", "breaker_cooldown_sec", 30.0);

        limiter::AdmissionController::Config limitCfg;
        limitCfg.enabled = conf.GetInt("limits", "enabled", 1) != 0;
        limitCfg.maxFilesPerPeriod = conf.GetInt("limits", "max_files_per_period", 5);
        limitCfg.periodMinutes = conf.GetDouble("limits", "period_minutes", 1.0);
        limitCfg.maxGlobalRequestsPerMinute = conf.GetInt("limits", "max_global_requests_per_minute", 0);
        limitCfg.maxQueueSize = static_cast<size_t>(conf.GetSize("limits", "max_queue_size", 100));
        limitCfg.authorizedMultiplier = conf.GetDouble("limits", "authorized_multiplier", 2.0);
        limitCfg.queueTimeoutSec = conf.GetDouble("limits", "queue_timeout_sec", 120.0);

        stream::MetadataCache::Config cacheCfg;
        cacheCfg.maxEntries = static_cast<size_t>(conf.GetSize("cache", "max_entries", 1024));
        cacheCfg.ttlSec = conf.GetDouble("cache", "ttl_sec", 3600.0);

        parts.pool = std::make_shared<upstream::ClientPool>(poolCfg);
        auto clients = conf.GetSectionsWithPrefix("client:");
        for (const auto& section : clients) {
            const auto& kv = section.second;
            auto get = [&kv](const std::string& key, const std::string& def) {
                auto it = kv.find(key);
                return it == kv.end() ? def : it->second;
            };
            const int dcId = std::stoi(get("dc_id", "0"));
            upstream::ClientPool::ClientSpec spec;
            spec.name = section.first.substr(std::string("client:").size());
            spec.credential = get("credential", "");
            spec.dcId = dcId;
            spec.client = std::make_shared<upstream::DirectoryUpstream>(get("root", upstreamRoot), dcId);
            parts.pool->AddClient(std::move(spec));
        }
        if (clients.empty()) {
            upstream::ClientPool::ClientSpec spec;
            spec.name = "default";
            spec.client = std::make_shared<upstream::DirectoryUpstream>(upstreamRoot);
            parts.pool->AddClient(std::move(spec));
        }

        parts.admission = std::make_shared<limiter::AdmissionController>(limitCfg);
        parts.cache = std::make_shared<stream::MetadataCache>(cacheCfg);

        auto links = std::make_shared<stream::StaticLinkStore>();
        const size_t linkCount = links->LoadFromSection(conf.GetSection("links"));
        LOG_INFO << "Loaded " << linkCount << " links";
        parts.links = links;

        auto users = std::make_shared<stream::StaticUserDirectory>(ToSet(conf.GetList("users", "authorized_ids")));
        parts.classifier = std::make_shared<stream::PriorityClassifier>(ToSet(conf.GetList("users", "owner_ids")), users);
        session.fetch.Validate();
    } catch (const std::exception& e) {
        LOG_ERROR << "Invalid configuration: " << e.what();
        return 1;
    }

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    network::EventLoop loop;
    std::unique_ptr<stream::StreamGateway> gateway;
    try {
        gateway = std::make_unique<stream::StreamGateway>(&loop, network::InetAddress(port), opts, parts);
    } catch (const std::exception& e) {
        LOG_ERROR << "Cannot start gateway: " << e.what();
        return 1;
    }

    if (conf.GetInt("tls", "enable", 0)) {
        const std::string cert = conf.GetString("tls", "cert_file", "");
        const std::string key = conf.GetString("tls", "key_file", "");
        if (!gateway->EnableTls(cert, key)) {
            LOG_ERROR << "TLS setup failed (cert=" << cert << ", key=" << key << ")";
            return 1;
        }
        LOG_INFO << "TLS enabled on port " << port;
    }

    g_loop = &loop;
    ::signal(SIGINT, HandleStopSignal);
    ::signal(SIGTERM, HandleStopSignal);

    gateway->Start();
    LOG_INFO << "StreamGate listening on port " << port;
    loop.Loop();

    gateway->Stop();
    parts.pool->Shutdown();
    g_loop = nullptr;
    LOG_INFO << "StreamGate exited";
    logger.CloseLogFile();
    return 0;
}
