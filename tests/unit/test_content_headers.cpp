#include "streamgate/protocol/ContentHeaders.h"
#include "streamgate/common/Logger.h"

#include <cassert>

using namespace streamgate::protocol;
using namespace streamgate::common;

static void testMimeGuess() {
    assert(GuessMimeType("movie.MP4") == "video/mp4");
    assert(GuessMimeType("song.mp3") == "audio/mpeg");
    assert(GuessMimeType("archive.tar.zip") == "application/zip");
    assert(GuessMimeType("README") == "application/octet-stream");
    assert(GuessMimeType("trailing.") == "application/octet-stream");
    assert(IsInlineMimeType("video/webm"));
    assert(IsInlineMimeType("audio/ogg"));
    assert(!IsInlineMimeType("application/pdf"));
    LOG_INFO << "Mime PASS";
}

static void testSanitize() {
    assert(SanitizeFileName("../../etc/passwd") == "passwd");
    assert(SanitizeFileName("C:\\temp\\a.txt") == "a.txt");
    assert(SanitizeFileName("evil\"\r\nSet-Cookie: x;.mp4") == "evilSet-Cookie: x.mp4");
    LOG_INFO << "Sanitize PASS";
}

static void testPercentCoding() {
    assert(PercentEncode("a b/c.txt") == "a%20b%2Fc.txt");
    assert(PercentEncode("\xC3\xA9") == "%C3%A9");
    assert(PercentDecode("a%20b%2fc") == "a b/c");
    assert(PercentDecode("100%") == "100%");
    assert(PercentDecode("%zz") == "%zz");
    LOG_INFO << "Percent coding PASS";
}

static void testDisposition() {
    assert(ContentDispositionValue("clip.mp4", "video/mp4") ==
           "inline; filename=\"clip.mp4\"; filename*=UTF-8''clip.mp4");
    assert(ContentDispositionValue("report final.pdf", "application/pdf") ==
           "attachment; filename=\"report final.pdf\"; filename*=UTF-8''report%20final.pdf");
    // Non-ASCII is replaced in the quoted form and kept in filename*.
    assert(ContentDispositionValue("caf\xC3\xA9.mp3", "audio/mpeg") ==
           "inline; filename=\"caf__.mp3\"; filename*=UTF-8''caf%C3%A9.mp3");
    assert(ContentDispositionValue("", "application/octet-stream") ==
           "attachment; filename=\"file\"; filename*=UTF-8''file");
    LOG_INFO << "Content-Disposition PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testMimeGuess();
    testSanitize();
    testPercentCoding();
    testDisposition();
    return 0;
}
