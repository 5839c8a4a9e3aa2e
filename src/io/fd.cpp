#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace swi {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ > STDERR_FILENO) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result WriteAll(int fd, std::span<const char> data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            return Result::Fail(ErrorKind::Io, "write failed: " + std::string(std::strerror(err)), err);
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result SyncFd(int fd) {
    if (::fsync(fd) != 0 && errno != EINVAL && errno != EROFS) {
        const int err = errno;
        return Result::Fail(ErrorKind::Io, "fsync failed: " + std::string(std::strerror(err)), err);
    }
    return Result::Ok();
}

} // namespace swi
