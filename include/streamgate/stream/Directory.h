#pragma once

#include "streamgate/common/Config.h"
#include "streamgate/limiter/AdmissionController.h"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace streamgate {
namespace stream {

struct LinkRecord {
    std::string linkId;
    std::string fileRef;
    std::string ownerUserId;   // the user that generated the link; quota is charged to them
};

// linkId -> file reference. Implementations may block; called from workers.
class LinkStore {
public:
    virtual ~LinkStore() = default;
    virtual std::optional<LinkRecord> Lookup(const std::string& linkId) = 0;
};

// Links listed in the [links] section: "<linkId> = <fileRef>, <userId>".
class StaticLinkStore : public LinkStore {
public:
    StaticLinkStore() = default;

    // Returns the number of links loaded; malformed lines are skipped.
    size_t LoadFromSection(const streamgate::common::Config::Section& section);
    void Add(LinkRecord record);

    std::optional<LinkRecord> Lookup(const std::string& linkId) override;
    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LinkRecord> links_;
};

class UserDirectory {
public:
    virtual ~UserDirectory() = default;
    virtual bool IsAuthorized(const std::string& userId) = 0;
};

// Authorization list from the [users] section.
class StaticUserDirectory : public UserDirectory {
public:
    explicit StaticUserDirectory(std::set<std::string> authorized) : authorized_(std::move(authorized)) {}
    bool IsAuthorized(const std::string& userId) override { return authorized_.count(userId) != 0; }

private:
    const std::set<std::string> authorized_;
};

// Owners first, then whoever the directory authorizes, everyone else regular.
class PriorityClassifier {
public:
    PriorityClassifier(std::set<std::string> ownerIds, std::shared_ptr<UserDirectory> users)
        : ownerIds_(std::move(ownerIds)), users_(std::move(users)) {}

    limiter::PriorityClass Classify(const std::string& userId) const;

private:
    const std::set<std::string> ownerIds_;
    std::shared_ptr<UserDirectory> users_;
};

} // namespace stream
} // namespace streamgate
