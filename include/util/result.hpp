#pragma once
#include <string>
#include <utility>

namespace swi {

enum class ErrorKind : int {
    None = 0,
    InvalidSpecifier,
    NotFound,
    TransportFailure,
    MissingArchive,
    Io,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m, int e = -1) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace swi
