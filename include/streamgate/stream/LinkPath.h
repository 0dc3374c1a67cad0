#pragma once

#include "streamgate/upstream/UpstreamClient.h"

#include <cstddef>
#include <string>

namespace streamgate {
namespace stream {

// Links prove knowledge of the file with this many leading characters of
// its unique id.
constexpr size_t kSecureHashLength = 6;

struct LinkPath {
    std::string linkId;
    std::string name;        // trailing file name, cosmetic
    std::string secureHash;
    bool hashGiven{false};
};

// Accepted forms, percent-decoded:
//   /<linkId>[/<name>][?hash=<hash>]
//   /<hash><digits>[/<name>]     hash first, numeric link id
// A first segment of kSecureHashLength alphanumerics followed only by digits
// is always read as the hash-first form.
bool ParseLinkPath(const std::string& path, const std::string& query, LinkPath* out);

// Value of key in an application/x-www-form-urlencoded query, decoded.
bool QueryValue(const std::string& query, const std::string& key, std::string* value);

// True when hash is the prefix of meta's unique id. A file without a unique
// id matches nothing.
bool SecureHashMatches(const std::string& hash, const upstream::FileMeta& meta);

} // namespace stream
} // namespace streamgate
