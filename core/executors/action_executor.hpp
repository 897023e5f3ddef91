#pragma once

#include "common/clock.hpp"
#include "common/status.hpp"
#include "response/response_policy.hpp"

#include <string>
#include <unordered_map>

namespace trustnet {

/// What an executor reports back for one action.
struct ActionResult {
    bool success = true;
    std::string message;
    std::unordered_map<std::string, double> metrics;
    Timestamp timestamp{};
};

/// Base class for all remediation handlers.
/// An executor performs one kind of action and holds no reference to the
/// trust graph, so the dispatcher may run several executors at once.
/// A failure is reported through the returned Status; an exception that
/// escapes execute() is caught at the dispatch boundary and recorded as
/// an executor failure.
class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;

    /// Registry name of this executor.
    virtual std::string name() const = 0;

    virtual Result<ActionResult> execute(const ResponseAction& action) const = 0;

    /// Unhealthy executors are skipped by the dispatcher.
    virtual bool isHealthy() const { return true; }
};

} // namespace trustnet
