#pragma once

#include "propagation/propagation_model.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace trustnet {

/// Registry for propagation models, keyed by name().
/// Keeps registration order. Callers get shared ownership, so a model
/// stays alive for a propagation in flight even if it is removed.
class ModelRegistry {
public:
    /// Register a model (takes ownership). Replaces a model of the same
    /// name in place. Throws std::invalid_argument on null.
    void registerModel(std::unique_ptr<PropagationModel> model);

    /// Remove a model by name. Returns true if found.
    bool remove(const std::string& name);

    /// All registered models, in registration order.
    std::vector<std::shared_ptr<const PropagationModel>> getAll() const;

    /// Look up a model by name.
    std::shared_ptr<const PropagationModel> getByName(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t count() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<const PropagationModel>> models_;
    std::unordered_map<std::string, size_t> name_index_;

    void rebuildIndex();
};

} // namespace trustnet
