#include "streamgate/upstream/DirectoryUpstream.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <unistd.h>

namespace streamgate {
namespace upstream {

namespace {

// Closes the descriptor on every return path.
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

// Hex SHA-256 of what identifies this version of the file.
std::string UniqueIdFor(const std::string& fileRef, const struct stat& st) {
    const std::string material = fileRef + ":" + std::to_string(st.st_size) + ":" +
                                 std::to_string(static_cast<long long>(st.st_mtime)) + ":" +
                                 std::to_string(static_cast<unsigned long long>(st.st_ino));
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(material.data(), material.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        return std::string();
    }
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0f]);
    }
    return out;
}

UpstreamError FromErrno(int err, const std::string& what) {
    std::string msg = what + ": " + std::strerror(err);
    if (err == ENOENT || err == ENOTDIR) return UpstreamError::NotFound(msg);
    if (err == EINTR || err == EAGAIN || err == EIO) return UpstreamError::Transient(msg);
    return UpstreamError::Fatal(msg);
}

} // namespace

DirectoryUpstream::DirectoryUpstream(std::string root, int dcId)
    : root_(std::move(root)), dcId_(dcId) {
    while (root_.size() > 1 && root_.back() == '/') root_.pop_back();
}

std::string DirectoryUpstream::Resolve(const std::string& fileRef) const {
    if (fileRef.empty() || fileRef.front() == '/') return std::string();
    size_t pos = 0;
    while (pos <= fileRef.size()) {
        size_t slash = fileRef.find('/', pos);
        if (slash == std::string::npos) slash = fileRef.size();
        const std::string part = fileRef.substr(pos, slash - pos);
        if (part.empty() || part == "." || part == "..") return std::string();
        pos = slash + 1;
    }
    return root_ + "/" + fileRef;
}

ChunkResult DirectoryUpstream::FetchChunk(const std::string& fileRef, uint64_t offset, uint32_t length) {
    ChunkResult result;
    const std::string path = Resolve(fileRef);
    if (path.empty()) {
        result.error = UpstreamError::NotFound("bad file reference " + fileRef);
        return result;
    }
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        result.error = FromErrno(errno, "open " + fileRef);
        return result;
    }

    result.bytes.resize(length);
    size_t got = 0;
    while (got < length) {
        ssize_t n = ::pread(fd.get(), &result.bytes[got], length - got, static_cast<off_t>(offset + got));
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = FromErrno(errno, "read " + fileRef);
            result.bytes.clear();
            return result;
        }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    result.bytes.resize(got);
    return result;
}

MetaResult DirectoryUpstream::GetFileMeta(const std::string& fileRef) {
    MetaResult result;
    const std::string path = Resolve(fileRef);
    if (path.empty()) {
        result.error = UpstreamError::NotFound("bad file reference " + fileRef);
        return result;
    }
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        result.error = FromErrno(errno, "stat " + fileRef);
        return result;
    }
    if (!S_ISREG(st.st_mode)) {
        result.error = UpstreamError::NotFound(fileRef + " is not a regular file");
        return result;
    }
    result.meta.fileRef = fileRef;
    result.meta.sizeBytes = static_cast<uint64_t>(st.st_size);
    size_t slash = fileRef.rfind('/');
    result.meta.fileName = slash == std::string::npos ? fileRef : fileRef.substr(slash + 1);
    result.meta.dcId = dcId_;
    result.meta.uniqueId = UniqueIdFor(fileRef, st);
    return result;
}

} // namespace upstream
} // namespace streamgate
