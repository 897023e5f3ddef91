#include "common/status.hpp"

namespace trustnet {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "ok";
        case ErrorKind::NotFound:         return "not_found";
        case ErrorKind::InvalidArgument:  return "invalid_argument";
        case ErrorKind::DispatchMismatch: return "dispatch_mismatch";
        case ErrorKind::ExecutorFailure:  return "executor_failure";
        case ErrorKind::Timeout:          return "timeout";
    }
    return "unknown";
}

std::string Status::toString() const {
    if (ok()) return "ok";
    return std::string(errorKindName(kind)) + ": " + message;
}

} // namespace trustnet
