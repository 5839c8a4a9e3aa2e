#include "util/result.hpp"

namespace swi {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "ok";
        case ErrorKind::InvalidSpecifier: return "invalid specifier";
        case ErrorKind::NotFound:         return "not found";
        case ErrorKind::TransportFailure: return "transport failure";
        case ErrorKind::MissingArchive:   return "missing SWI";
        case ErrorKind::Io:               return "I/O error";
    }
    return "error";
}

} // namespace swi
