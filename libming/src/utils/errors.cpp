#include "../../include/errors.hpp"

namespace ming {

std::string_view error_kind_to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Decode:     return "decode";
        case ErrorKind::Archive:    return "archive";
        case ErrorKind::Write:      return "write";
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Input:      return "input";
    }
    return "unknown";
}

} // namespace ming
