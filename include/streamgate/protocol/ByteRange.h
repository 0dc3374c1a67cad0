#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace streamgate {
namespace protocol {

// Inclusive byte interval [first, last].
struct ByteRange {
    uint64_t first{0};
    uint64_t last{0};

    uint64_t length() const { return last - first + 1; }
    bool operator==(const ByteRange& o) const { return first == o.first && last == o.last; }
};

// Syntactic form of a single "Range: bytes=..." value.
struct RangeSpec {
    enum Kind {
        kWholeFile,   // no Range header
        kFromTo,      // bytes=first-[last]
        kSuffix,      // bytes=-suffixLength
    };

    Kind kind{kWholeFile};
    uint64_t first{0};
    std::optional<uint64_t> last;
    uint64_t suffixLength{0};
};

// Parses a Range header value. An empty value yields kWholeFile.
// Returns false for anything malformed, including multiple ranges.
bool ParseRangeHeader(const std::string& value, RangeSpec* out);

// Resolves spec against the entity size. nullopt means not satisfiable.
// A first or last position at or past the end is not satisfiable; a suffix
// longer than the entity selects the whole entity.
std::optional<ByteRange> ResolveRange(const RangeSpec& spec, uint64_t size);

// "bytes first-last/size"
std::string ContentRangeValue(const ByteRange& range, uint64_t size);
// "bytes */size", sent with 416.
std::string UnsatisfiedContentRange(uint64_t size);

} // namespace protocol
} // namespace streamgate
