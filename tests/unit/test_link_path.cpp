#include "streamgate/stream/LinkPath.h"
#include "streamgate/common/Logger.h"

#include <cassert>

using namespace streamgate::stream;
using namespace streamgate::upstream;
using namespace streamgate::common;

static void testPlainLink() {
    LinkPath link;
    assert(ParseLinkPath("/abc", "", &link));
    assert(link.linkId == "abc" && link.name.empty());
    assert(!link.hashGiven && link.secureHash.empty());

    assert(ParseLinkPath("/abc/sub/movie%20one.mp4/", "", &link));
    assert(link.linkId == "abc" && link.name == "movie one.mp4");

    assert(ParseLinkPath("/l%2Dx", "", &link));
    assert(link.linkId == "l-x");

    // All digits is a link id even when long enough to hold a hash.
    assert(ParseLinkPath("/123456789", "", &link));
    assert(link.linkId == "123456789" && !link.hashGiven);

    assert(!ParseLinkPath("/", "", &link));
    assert(!ParseLinkPath("", "", &link));
    assert(!ParseLinkPath("//movie.mp4", "", &link));
    LOG_INFO << "Plain link PASS";
}

static void testHashForms() {
    LinkPath link;
    assert(ParseLinkPath("/abc/movie.mp4", "dl=1&hash=AbC123", &link));
    assert(link.linkId == "abc" && link.name == "movie.mp4");
    assert(link.hashGiven && link.secureHash == "AbC123");

    // An empty hash still counts as given, and fails the check later.
    assert(ParseLinkPath("/abc", "hash=", &link));
    assert(link.hashGiven && link.secureHash.empty());

    assert(ParseLinkPath("/AbC123456/movie.mp4", "", &link));
    assert(link.linkId == "456" && link.secureHash == "AbC123" && link.hashGiven);
    assert(link.name == "movie.mp4");

    // Six alphanumerics alone, or followed by letters, are a link id.
    assert(ParseLinkPath("/AbC123", "", &link));
    assert(link.linkId == "AbC123" && !link.hashGiven);
    assert(ParseLinkPath("/AbC123x45", "", &link));
    assert(link.linkId == "AbC123x45" && !link.hashGiven);
    LOG_INFO << "Hash forms PASS";
}

static void testQueryValue() {
    std::string v;
    assert(QueryValue("a=1&b=two%20words", "b", &v) && v == "two words");
    assert(QueryValue("flag&x=1", "flag", &v) && v.empty());
    assert(!QueryValue("", "hash", &v));
    assert(!QueryValue("hashx=1", "hash", &v));
    LOG_INFO << "QueryValue PASS";
}

static void testSecureHashMatches() {
    FileMeta meta;
    meta.uniqueId = "AbC123xyz";
    assert(SecureHashMatches("AbC123", meta));
    assert(!SecureHashMatches("abc123", meta));
    assert(!SecureHashMatches("AbC12", meta));
    assert(!SecureHashMatches("AbC123x", meta));
    assert(!SecureHashMatches("", meta));

    meta.uniqueId.clear();
    assert(!SecureHashMatches("AbC123", meta));
    meta.uniqueId = "AbC";
    assert(!SecureHashMatches("AbC123", meta));
    LOG_INFO << "Secure hash PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testPlainLink();
    testHashForms();
    testQueryValue();
    testSecureHashMatches();
    return 0;
}
