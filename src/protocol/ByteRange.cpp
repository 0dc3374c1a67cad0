#include "streamgate/protocol/ByteRange.h"

#include <cctype>

namespace streamgate {
namespace protocol {

namespace {

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool ParseDecimal(const std::string& s, uint64_t* out) {
    if (s.empty() || s.size() > 19) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    *out = v;
    return true;
}

} // namespace

bool ParseRangeHeader(const std::string& value, RangeSpec* out) {
    RangeSpec spec;
    const std::string v = Trim(value);
    if (v.empty()) {
        *out = spec;
        return true;
    }

    const std::string kUnit = "bytes=";
    if (v.size() <= kUnit.size()) return false;
    for (size_t i = 0; i < kUnit.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(v[i])) != kUnit[i]) return false;
    }
    const std::string set = Trim(v.substr(kUnit.size()));
    if (set.find(',') != std::string::npos) return false;

    const size_t dash = set.find('-');
    if (dash == std::string::npos) return false;
    const std::string lhs = Trim(set.substr(0, dash));
    const std::string rhs = Trim(set.substr(dash + 1));

    if (lhs.empty()) {
        uint64_t suffix = 0;
        if (!ParseDecimal(rhs, &suffix) || suffix == 0) return false;
        spec.kind = RangeSpec::kSuffix;
        spec.suffixLength = suffix;
    } else {
        uint64_t first = 0;
        if (!ParseDecimal(lhs, &first)) return false;
        spec.kind = RangeSpec::kFromTo;
        spec.first = first;
        if (!rhs.empty()) {
            uint64_t last = 0;
            if (!ParseDecimal(rhs, &last) || last < first) return false;
            spec.last = last;
        }
    }
    *out = spec;
    return true;
}

std::optional<ByteRange> ResolveRange(const RangeSpec& spec, uint64_t size) {
    if (size == 0) return std::nullopt;
    switch (spec.kind) {
        case RangeSpec::kWholeFile:
            return ByteRange{0, size - 1};
        case RangeSpec::kSuffix: {
            const uint64_t n = spec.suffixLength < size ? spec.suffixLength : size;
            return ByteRange{size - n, size - 1};
        }
        case RangeSpec::kFromTo: {
            if (spec.first >= size) return std::nullopt;
            const uint64_t last = spec.last ? *spec.last : size - 1;
            if (last >= size || last < spec.first) return std::nullopt;
            return ByteRange{spec.first, last};
        }
    }
    return std::nullopt;
}

std::string ContentRangeValue(const ByteRange& range, uint64_t size) {
    return "bytes " + std::to_string(range.first) + "-" + std::to_string(range.last) + "/" + std::to_string(size);
}

std::string UnsatisfiedContentRange(uint64_t size) {
    return "bytes */" + std::to_string(size);
}

} // namespace protocol
} // namespace streamgate
