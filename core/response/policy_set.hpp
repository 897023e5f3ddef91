#pragma once

#include "common/status.hpp"
#include "response/response_policy.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace trustnet {

/// Ordered collection of response policies.
/// Kept sorted by ascending priority; equal priorities keep insertion
/// order. Adding a policy with an existing id replaces it.
class PolicySet {
public:
    void addPolicy(ResponsePolicy policy);
    bool removePolicy(const std::string& policy_id);
    Status setEnabled(const std::string& policy_id, bool enabled);

    std::optional<ResponsePolicy> getPolicy(const std::string& policy_id) const;

    /// Snapshot in evaluation order.
    std::vector<ResponsePolicy> policies() const;

    /// Snapshot of enabled policies, in evaluation order.
    std::vector<ResponsePolicy> enabledPolicies() const;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<ResponsePolicy> policies_;
};

} // namespace trustnet
