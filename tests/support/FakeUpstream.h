#pragma once

#include "streamgate/upstream/UpstreamClient.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace streamgate {
namespace testing {

// In-memory upstream with deterministic content and scripted failures.
class FakeUpstream : public upstream::UpstreamClient {
public:
    struct File {
        uint64_t size{0};
        std::string mimeType;
        std::string fileName;
        int dcId{0};
        std::string uniqueId;
        long long metaDelayMs{0};
    };

    static char ByteAt(uint64_t offset) { return static_cast<char>((offset * 131 + 7) & 0xff); }

    static std::string Expected(uint64_t first, uint64_t last) {
        std::string out;
        out.reserve(static_cast<size_t>(last - first + 1));
        for (uint64_t i = first; i <= last; ++i) out.push_back(ByteAt(i));
        return out;
    }

    void AddFile(const std::string& ref, uint64_t size, const std::string& mime = "video/mp4",
                 const std::string& name = "movie.mp4", int dcId = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        File file;
        file.size = size;
        file.mimeType = mime;
        file.fileName = name;
        file.dcId = dcId;
        files_[ref] = file;
    }
    void SetUniqueId(const std::string& ref, const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[ref].uniqueId = id;
    }
    // Metadata for ref only; adds to SetMetaDelay.
    void SetMetaDelay(const std::string& ref, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[ref].metaDelayMs = delay.count();
    }

    // Consumed one per FetchChunk call before any data is served.
    void ScriptFetchErrors(std::vector<upstream::UpstreamError> errors) {
        std::lock_guard<std::mutex> lock(mutex_);
        fetchErrors_.assign(errors.begin(), errors.end());
    }
    void ScriptMetaErrors(std::vector<upstream::UpstreamError> errors) {
        std::lock_guard<std::mutex> lock(mutex_);
        metaErrors_.assign(errors.begin(), errors.end());
    }
    void SetFetchDelay(std::chrono::milliseconds delay) { fetchDelayMs_ = delay.count(); }
    void SetMetaDelay(std::chrono::milliseconds delay) { metaDelayMs_ = delay.count(); }

    upstream::ChunkResult FetchChunk(const std::string& fileRef, uint64_t offset, uint32_t length) override {
        upstream::ChunkResult result;
        File file;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fetches_++;
            requests_.emplace_back(offset, length);
            if (!fetchErrors_.empty()) {
                result.error = fetchErrors_.front();
                fetchErrors_.pop_front();
                return result;
            }
            auto it = files_.find(fileRef);
            if (it == files_.end()) {
                result.error = upstream::UpstreamError::NotFound("no such file " + fileRef);
                return result;
            }
            file = it->second;
        }
        if (fetchDelayMs_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(fetchDelayMs_.load()));
        if (offset >= file.size) return result;
        const uint64_t end = std::min<uint64_t>(file.size, offset + length);
        result.bytes.reserve(static_cast<size_t>(end - offset));
        for (uint64_t i = offset; i < end; ++i) result.bytes.push_back(ByteAt(i));
        return result;
    }

    upstream::MetaResult GetFileMeta(const std::string& fileRef) override {
        upstream::MetaResult result;
        long long delayMs = metaDelayMs_.load();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = files_.find(fileRef);
            if (it != files_.end()) delayMs += it->second.metaDelayMs;
        }
        if (delayMs > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        std::lock_guard<std::mutex> lock(mutex_);
        metaCalls_++;
        if (!metaErrors_.empty()) {
            result.error = metaErrors_.front();
            metaErrors_.pop_front();
            return result;
        }
        auto it = files_.find(fileRef);
        if (it == files_.end()) {
            result.error = upstream::UpstreamError::NotFound("no such file " + fileRef);
            return result;
        }
        result.meta.fileRef = fileRef;
        result.meta.sizeBytes = it->second.size;
        result.meta.mimeType = it->second.mimeType;
        result.meta.fileName = it->second.fileName;
        result.meta.dcId = it->second.dcId;
        result.meta.uniqueId = it->second.uniqueId;
        return result;
    }

    uint64_t FetchCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetches_;
    }
    uint64_t MetaCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metaCalls_;
    }
    std::vector<std::pair<uint64_t, uint32_t>> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, File> files_;
    std::deque<upstream::UpstreamError> fetchErrors_;
    std::deque<upstream::UpstreamError> metaErrors_;
    std::vector<std::pair<uint64_t, uint32_t>> requests_;
    uint64_t fetches_{0};
    uint64_t metaCalls_{0};
    std::atomic<long long> fetchDelayMs_{0};
    std::atomic<long long> metaDelayMs_{0};
};

} // namespace testing
} // namespace streamgate
