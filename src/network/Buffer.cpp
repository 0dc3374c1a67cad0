#include "streamgate/network/Buffer.h"

#include <errno.h>
#include <sys/uio.h>
#include <unistd.h>

namespace streamgate {
namespace network {

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char extrabuf[65536];
    struct iovec vec[2];
    const size_t writable = WritableBytes();
    vec[0].iov_base = BeginWrite();
    vec[0].iov_len = writable;
    vec[1].iov_base = extrabuf;
    vec[1].iov_len = sizeof extrabuf;
    // Skip the stack buffer when the heap buffer is already large.
    const int iovcnt = (writable < sizeof extrabuf) ? 2 : 1;
    const ssize_t n = ::readv(fd, vec, iovcnt);
    if (n < 0) {
        *savedErrno = errno;
    } else if (static_cast<size_t>(n) <= writable) {
        writerIndex_ += static_cast<size_t>(n);
    } else {
        writerIndex_ = buffer_.size();
        Append(extrabuf, static_cast<size_t>(n) - writable);
    }
    return n;
}

} // namespace network
} // namespace streamgate
