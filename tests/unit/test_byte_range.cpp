#include "streamgate/protocol/ByteRange.h"
#include "streamgate/common/Logger.h"

#include <cassert>

using namespace streamgate::protocol;
using namespace streamgate::common;

static std::optional<ByteRange> resolve(const std::string& header, uint64_t size) {
    RangeSpec spec;
    assert(ParseRangeHeader(header, &spec));
    return ResolveRange(spec, size);
}

static void testParseForms() {
    RangeSpec spec;
    assert(ParseRangeHeader("", &spec) && spec.kind == RangeSpec::kWholeFile);

    assert(ParseRangeHeader("bytes=100-199", &spec));
    assert(spec.kind == RangeSpec::kFromTo && spec.first == 100 && spec.last && *spec.last == 199);

    assert(ParseRangeHeader("bytes=100-", &spec));
    assert(spec.kind == RangeSpec::kFromTo && !spec.last);

    assert(ParseRangeHeader("Bytes= -500 ", &spec));
    assert(spec.kind == RangeSpec::kSuffix && spec.suffixLength == 500);
    LOG_INFO << "Parse forms PASS";
}

static void testParseRejectsMalformed() {
    RangeSpec spec;
    assert(!ParseRangeHeader("bytes=", &spec));
    assert(!ParseRangeHeader("items=0-1", &spec));
    assert(!ParseRangeHeader("bytes=abc-", &spec));
    assert(!ParseRangeHeader("bytes=5-1", &spec));
    assert(!ParseRangeHeader("bytes=-0", &spec));
    assert(!ParseRangeHeader("bytes=0-1,5-9", &spec));
    assert(!ParseRangeHeader("bytes=12", &spec));
    assert(!ParseRangeHeader("bytes=99999999999999999999-", &spec));
    LOG_INFO << "Parse malformed PASS";
}

static void testResolve() {
    const uint64_t size = 10000000;
    auto r = resolve("bytes=5000000-5999999", size);
    assert(r && r->first == 5000000 && r->last == 5999999 && r->length() == 1000000);

    r = resolve("", size);
    assert(r && r->first == 0 && r->last == size - 1);

    r = resolve("bytes=9999999-", size);
    assert(r && r->length() == 1);

    r = resolve("bytes=-100", size);
    assert(r && r->first == size - 100 && r->last == size - 1);

    // Suffix longer than the file selects all of it.
    r = resolve("bytes=-500", 100);
    assert(r && r->first == 0 && r->last == 99);

    assert(!resolve("bytes=10000000-", size));
    assert(!resolve("bytes=0-10000000", size));
    assert(!resolve("", 0));
    assert(!resolve("bytes=0-", 0));
    LOG_INFO << "Resolve PASS";
}

static void testHeaderValues() {
    assert(ContentRangeValue(ByteRange{5000000, 5999999}, 10000000) == "bytes 5000000-5999999/10000000");
    assert(UnsatisfiedContentRange(42) == "bytes */42");
    LOG_INFO << "Header values PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testParseForms();
    testParseRejectsMalformed();
    testResolve();
    testHeaderValues();
    return 0;
}
