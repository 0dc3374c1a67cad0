#pragma once

#include "streamgate/upstream/UpstreamClient.h"

#include <string>

namespace streamgate {
namespace upstream {

// Serves regular files below a root directory; the fileRef is the path
// relative to the root. Stands in for the messaging network client.
class DirectoryUpstream : public UpstreamClient {
public:
    explicit DirectoryUpstream(std::string root, int dcId = 0);

    ChunkResult FetchChunk(const std::string& fileRef, uint64_t offset, uint32_t length) override;
    MetaResult GetFileMeta(const std::string& fileRef) override;

    const std::string& root() const { return root_; }

private:
    // Empty when fileRef escapes the root.
    std::string Resolve(const std::string& fileRef) const;

    std::string root_;
    int dcId_;
};

} // namespace upstream
} // namespace streamgate
