#include "streamgate/stream/LinkPath.h"
#include "streamgate/protocol/ContentHeaders.h"

#include <algorithm>
#include <cctype>

namespace streamgate {
namespace stream {

namespace {

bool AllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool IsHashFirst(const std::string& segment) {
    if (segment.size() <= kSecureHashLength) return false;
    for (size_t i = 0; i < kSecureHashLength; ++i) {
        if (!std::isalnum(static_cast<unsigned char>(segment[i]))) return false;
    }
    return AllDigits(segment.substr(kSecureHashLength));
}

} // namespace

bool QueryValue(const std::string& query, const std::string& key, std::string* value) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string pair = query.substr(pos, amp - pos);
        const size_t eq = pair.find('=');
        if (protocol::PercentDecode(pair.substr(0, eq)) == key) {
            *value = eq == std::string::npos ? std::string() : protocol::PercentDecode(pair.substr(eq + 1));
            return true;
        }
        pos = amp + 1;
    }
    return false;
}

bool ParseLinkPath(const std::string& path, const std::string& query, LinkPath* out) {
    if (path.size() < 2 || path[0] != '/') return false;
    std::string rest = path.substr(1);
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    const size_t slash = rest.find('/');
    const std::string segment = protocol::PercentDecode(rest.substr(0, slash));
    if (segment.empty()) return false;

    *out = LinkPath();
    if (slash != std::string::npos) {
        const std::string tail = rest.substr(slash + 1);
        const size_t lastSlash = tail.rfind('/');
        out->name = protocol::PercentDecode(lastSlash == std::string::npos ? tail : tail.substr(lastSlash + 1));
    }

    if (!AllDigits(segment) && IsHashFirst(segment)) {
        out->secureHash = segment.substr(0, kSecureHashLength);
        out->linkId = segment.substr(kSecureHashLength);
        out->hashGiven = true;
        return true;
    }
    out->linkId = segment;
    out->hashGiven = QueryValue(query, "hash", &out->secureHash);
    return true;
}

bool SecureHashMatches(const std::string& hash, const upstream::FileMeta& meta) {
    if (hash.size() != kSecureHashLength || meta.uniqueId.size() < kSecureHashLength) return false;
    return meta.uniqueId.compare(0, kSecureHashLength, hash) == 0;
}

} // namespace stream
} // namespace streamgate
