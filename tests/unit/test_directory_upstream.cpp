#include "streamgate/upstream/DirectoryUpstream.h"
#include "streamgate/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace streamgate::upstream;
using namespace streamgate::common;

static std::string makeTree() {
    char tmpl[] = "/tmp/streamgate-upstream-XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    assert(dir != nullptr);
    std::string root(dir);
    assert(::mkdir((root + "/media").c_str(), 0755) == 0);
    std::ofstream out(root + "/media/clip.mp4", std::ios::binary);
    for (int i = 0; i < 10000; ++i) out.put(static_cast<char>(i % 251));
    out.close();
    return root;
}

static void removeTree(const std::string& root) {
    ::unlink((root + "/media/clip.mp4").c_str());
    ::rmdir((root + "/media").c_str());
    ::rmdir(root.c_str());
}

static void testMetaAndReads(const std::string& root) {
    DirectoryUpstream up(root + "/", 3);
    MetaResult meta = up.GetFileMeta("media/clip.mp4");
    assert(meta.error.ok());
    assert(meta.meta.sizeBytes == 10000);
    assert(meta.meta.fileName == "clip.mp4");
    assert(meta.meta.dcId == 3);
    assert(meta.meta.mimeType.empty());
    // Stable hex digest, so links can carry a prefix of it.
    assert(meta.meta.uniqueId.size() == 64);
    assert(meta.meta.uniqueId.find_first_not_of("0123456789abcdef") == std::string::npos);
    assert(up.GetFileMeta("media/clip.mp4").meta.uniqueId == meta.meta.uniqueId);

    ChunkResult chunk = up.FetchChunk("media/clip.mp4", 4096, 4096);
    assert(chunk.error.ok() && chunk.bytes.size() == 4096);
    assert(chunk.bytes[0] == static_cast<char>(4096 % 251));

    // Short only at end of file.
    chunk = up.FetchChunk("media/clip.mp4", 8192, 4096);
    assert(chunk.error.ok() && chunk.bytes.size() == 10000 - 8192);
    chunk = up.FetchChunk("media/clip.mp4", 20000, 4096);
    assert(chunk.error.ok() && chunk.bytes.empty());
    LOG_INFO << "Meta and reads PASS";
}

static void testRejectsEscapes(const std::string& root) {
    DirectoryUpstream up(root);
    const char* refs[] = {"", "/etc/passwd", "../x", "media/../media/clip.mp4", "media//clip.mp4", "./media"};
    for (const char* ref : refs) {
        assert(up.GetFileMeta(ref).error.status == UpstreamStatus::kNotFound);
        assert(up.FetchChunk(ref, 0, 10).error.status == UpstreamStatus::kNotFound);
    }
    assert(up.GetFileMeta("media/missing.mp4").error.status == UpstreamStatus::kNotFound);
    // Directories are not files.
    assert(up.GetFileMeta("media").error.status == UpstreamStatus::kNotFound);
    LOG_INFO << "Escapes PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    const std::string root = makeTree();
    testMetaAndReads(root);
    testRejectsEscapes(root);
    removeTree(root);
    return 0;
}
