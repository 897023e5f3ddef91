#pragma once

#include <cstddef>

namespace trustnet {

struct DispatchConfig {
    /// Unmapped action types use the first registered executor.
    bool fallback_to_any_executor = false;
    bool enforce_timeouts = true;
    /// Used when an action's own timeout is zero.
    long default_timeout_ms = 30000;
    /// How long an attempt may wait for a free worker before it is
    /// recorded as a Timeout. Queue time never counts against the
    /// action's own timeout. 0 waits without limit.
    long queue_wait_limit_ms = 60000;
    bool enforce_retries = true;
    size_t worker_threads = 4;
};

} // namespace trustnet
