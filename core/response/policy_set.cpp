#include "response/policy_set.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <mutex>

namespace trustnet {

void PolicySet::addPolicy(ResponsePolicy policy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    logInfo("Registered response policy: " + policy.policy_id +
            " (priority " + std::to_string(policy.priority) + ")");

    auto it = std::find_if(policies_.begin(), policies_.end(), [&](const ResponsePolicy& p) {
        return p.policy_id == policy.policy_id;
    });
    if (it != policies_.end()) {
        *it = std::move(policy);
    } else {
        policies_.push_back(std::move(policy));
    }
    std::stable_sort(policies_.begin(), policies_.end(),
                     [](const ResponsePolicy& a, const ResponsePolicy& b) {
                         return a.priority < b.priority;
                     });
}

bool PolicySet::removePolicy(const std::string& policy_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(policies_.begin(), policies_.end(), [&](const ResponsePolicy& p) {
        return p.policy_id == policy_id;
    });
    if (it == policies_.end()) return false;
    policies_.erase(it);
    return true;
}

Status PolicySet::setEnabled(const std::string& policy_id, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& p : policies_) {
        if (p.policy_id == policy_id) {
            p.enabled = enabled;
            return Status::success();
        }
    }
    return Status::notFound("Response policy " + policy_id + " not found");
}

std::optional<ResponsePolicy> PolicySet::getPolicy(const std::string& policy_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& p : policies_) {
        if (p.policy_id == policy_id) return p;
    }
    return std::nullopt;
}

std::vector<ResponsePolicy> PolicySet::policies() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return policies_;
}

std::vector<ResponsePolicy> PolicySet::enabledPolicies() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ResponsePolicy> result;
    for (const auto& p : policies_) {
        if (p.enabled) result.push_back(p);
    }
    return result;
}

size_t PolicySet::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return policies_.size();
}

} // namespace trustnet
