#pragma once

#include "streamgate/limiter/AdmissionController.h"
#include "streamgate/stream/Directory.h"
#include "streamgate/stream/MetadataCache.h"
#include "streamgate/stream/StreamGateway.h"
#include "streamgate/upstream/ClientPool.h"
#include "support/FakeUpstream.h"

#include <memory>
#include <set>
#include <string>

namespace streamgate {
namespace testing {

// Components for a gateway in front of one FakeUpstream reached through
// two pool handles (dc 1 and dc 2). Owner "100", authorized "200",
// everybody else regular.
struct GatewayHarness {
    std::shared_ptr<FakeUpstream> fake = std::make_shared<FakeUpstream>();
    std::shared_ptr<stream::StaticLinkStore> links = std::make_shared<stream::StaticLinkStore>();
    stream::StreamGateway::Components parts;

    explicit GatewayHarness(const limiter::AdmissionController::Config& limits = limiter::AdmissionController::Config(),
                            const upstream::ClientPool::Config& poolCfg = upstream::ClientPool::Config()) {
        parts.pool = std::make_shared<upstream::ClientPool>(poolCfg);
        for (int dc = 1; dc <= 2; ++dc) {
            upstream::ClientPool::ClientSpec spec;
            spec.name = "fake-dc" + std::to_string(dc);
            spec.dcId = dc;
            spec.client = fake;
            parts.pool->AddClient(spec);
        }
        parts.admission = std::make_shared<limiter::AdmissionController>(limits);
        parts.cache = std::make_shared<stream::MetadataCache>(stream::MetadataCache::Config{});
        parts.links = links;
        auto users = std::make_shared<stream::StaticUserDirectory>(std::set<std::string>{"200"});
        parts.classifier = std::make_shared<stream::PriorityClassifier>(std::set<std::string>{"100"}, users);
    }

    void AddLink(const std::string& linkId, const std::string& fileRef, const std::string& owner) {
        links->Add(stream::LinkRecord{linkId, fileRef, owner});
    }

    static stream::StreamGateway::Options Options() {
        stream::StreamGateway::Options opts;
        opts.name = "TestGateway";
        opts.ioThreads = 2;
        opts.workerThreads = 4;
        opts.drainIntervalSec = 0.05;
        opts.session.fetch.retryBaseMs = 1;
        opts.session.fetch.retryMaxMs = 4;
        opts.session.acquireTimeoutSec = 2.0;
        opts.session.acquireRetrySec = 0.05;
        return opts;
    }
};

} // namespace testing
} // namespace streamgate
