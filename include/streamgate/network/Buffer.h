#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>
#include <sys/types.h>

namespace streamgate {
namespace network {

// Contiguous byte buffer with a read index and a write index.
// +-------------------+------------------+------------------+
// | prependable bytes |  readable bytes  |  writable bytes  |
// +-------------------+------------------+------------------+
class Buffer {
public:
    static constexpr size_t kCheapPrepend = 8;
    static constexpr size_t kInitialSize = 1024;

    explicit Buffer(size_t initialSize = kInitialSize)
        : buffer_(kCheapPrepend + initialSize),
          readerIndex_(kCheapPrepend),
          writerIndex_(kCheapPrepend) {}

    size_t ReadableBytes() const { return writerIndex_ - readerIndex_; }
    size_t WritableBytes() const { return buffer_.size() - writerIndex_; }
    size_t PrependableBytes() const { return readerIndex_; }

    const char* Peek() const { return Begin() + readerIndex_; }

    // Position of the first "\r\n" at or after start, or nullptr.
    const char* FindCRLF(const char* start) const {
        static const char kCRLF[] = "\r\n";
        const char* crlf = std::search(start, BeginWrite(), kCRLF, kCRLF + 2);
        return crlf == BeginWrite() ? nullptr : crlf;
    }
    const char* FindCRLF() const { return FindCRLF(Peek()); }

    void Retrieve(size_t len) {
        if (len < ReadableBytes()) {
            readerIndex_ += len;
        } else {
            RetrieveAll();
        }
    }

    void RetrieveUntil(const char* end) { Retrieve(static_cast<size_t>(end - Peek())); }

    void RetrieveAll() {
        readerIndex_ = kCheapPrepend;
        writerIndex_ = kCheapPrepend;
    }

    std::string RetrieveAllAsString() { return RetrieveAsString(ReadableBytes()); }

    std::string RetrieveAsString(size_t len) {
        std::string result(Peek(), len);
        Retrieve(len);
        return result;
    }

    void Append(const std::string& str) { Append(str.data(), str.size()); }

    void Append(const char* data, size_t len) {
        EnsureWritableBytes(len);
        std::copy(data, data + len, BeginWrite());
        HasWritten(len);
    }

    char* BeginWrite() { return Begin() + writerIndex_; }
    const char* BeginWrite() const { return Begin() + writerIndex_; }

    void HasWritten(size_t len) { writerIndex_ += len; }

    void EnsureWritableBytes(size_t len) {
        if (WritableBytes() < len) {
            MakeSpace(len);
        }
    }

    // Reads as much as is available on fd, growing the buffer as needed.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    char* Begin() { return buffer_.data(); }
    const char* Begin() const { return buffer_.data(); }

    void MakeSpace(size_t len) {
        if (WritableBytes() + PrependableBytes() < len + kCheapPrepend) {
            buffer_.resize(std::max(buffer_.size() * 2, writerIndex_ + len));
        } else {
            size_t readable = ReadableBytes();
            std::copy(Begin() + readerIndex_, Begin() + writerIndex_, Begin() + kCheapPrepend);
            readerIndex_ = kCheapPrepend;
            writerIndex_ = readerIndex_ + readable;
        }
    }

    std::vector<char> buffer_;
    size_t readerIndex_;
    size_t writerIndex_;
};

} // namespace network
} // namespace streamgate
