#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace swi {

Result TempFile::Create(std::string_view dir,
                        std::string_view prefix,
                        std::string_view suffix,
                        TempFile& out) {
    out.Cleanup();

    std::string tmpl = std::string(dir.empty() ? "/tmp" : dir);
    if (tmpl.back() != '/') tmpl.push_back('/');
    tmpl.append(prefix);
    tmpl.append("XXXXXX");
    tmpl.append(suffix);
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(ErrorKind::Io, "mkstemps " + tmpl + " failed: " + std::strerror(err), err);
    }
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

std::string TempFile::Keep() {
    Close();
    std::string kept = std::move(path_);
    path_.clear();
    return kept;
}

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace swi
