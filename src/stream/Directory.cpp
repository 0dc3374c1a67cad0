#include "streamgate/stream/Directory.h"
#include "streamgate/common/Logger.h"

#include <vector>

namespace streamgate {
namespace stream {

size_t StaticLinkStore::LoadFromSection(const streamgate::common::Config::Section& section) {
    size_t loaded = 0;
    for (const auto& kv : section) {
        std::vector<std::string> parts = streamgate::common::Config::SplitCsv(kv.second);
        if (parts.empty()) {
            LOG_WARN << "StaticLinkStore: link " << kv.first << " has no file reference, skipped";
            continue;
        }
        LinkRecord record;
        record.linkId = kv.first;
        record.fileRef = parts[0];
        if (parts.size() > 1) record.ownerUserId = parts[1];
        Add(std::move(record));
        ++loaded;
    }
    return loaded;
}

void StaticLinkStore::Add(LinkRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = record.linkId;
    links_[key] = std::move(record);
}

std::optional<LinkRecord> StaticLinkStore::Lookup(const std::string& linkId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(linkId);
    if (it == links_.end()) return std::nullopt;
    return it->second;
}

size_t StaticLinkStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_.size();
}

limiter::PriorityClass PriorityClassifier::Classify(const std::string& userId) const {
    if (!userId.empty() && ownerIds_.count(userId)) return limiter::PriorityClass::kOwner;
    if (!userId.empty() && users_ && users_->IsAuthorized(userId)) return limiter::PriorityClass::kAuthorized;
    return limiter::PriorityClass::kRegular;
}

} // namespace stream
} // namespace streamgate
