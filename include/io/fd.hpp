#pragma once

#include "util/result.hpp"

#include <span>

namespace swi {

// Owns a descriptor; standard streams are never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    void Close();

  private:
    int fd_{-1};
};

// Writes all of `data`, retrying short writes and EINTR.
Result WriteAll(int fd, std::span<const char> data);

// fsync(), tolerating descriptors that cannot be synced (pipes, ttys).
Result SyncFd(int fd);

} // namespace swi
