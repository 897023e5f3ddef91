#pragma once

#include <string>
#include <utility>

namespace trustnet {

// ─── Error Kinds ───────────────────────────────────────────────
// Failure categories surfaced to callers. None of them is fatal:
// the orchestration layer decides whether to retry or alert.

enum class ErrorKind {
    None,
    NotFound,
    InvalidArgument,
    DispatchMismatch,
    ExecutorFailure,
    Timeout,
};

const char* errorKindName(ErrorKind kind);

// ─── Status ────────────────────────────────────────────────────

struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return Status{}; }

    static Status error(ErrorKind kind, std::string message) {
        return Status{kind, std::move(message)};
    }

    static Status notFound(std::string message) {
        return error(ErrorKind::NotFound, std::move(message));
    }

    static Status invalidArgument(std::string message) {
        return error(ErrorKind::InvalidArgument, std::move(message));
    }

    /// "<kind>: <message>", or "ok".
    std::string toString() const;
};

// ─── Result ────────────────────────────────────────────────────
// A value or the Status explaining why there is none.

template <typename T>
struct Result {
    Status status;
    T value{};

    bool ok() const { return status.ok(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(Status s) {
        Result r;
        r.status = std::move(s);
        return r;
    }
};

} // namespace trustnet
