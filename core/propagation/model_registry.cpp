#include "propagation/model_registry.hpp"
#include "common/logging.hpp"

#include <mutex>
#include <stdexcept>

namespace trustnet {

void ModelRegistry::registerModel(std::unique_ptr<PropagationModel> model) {
    if (!model) {
        throw std::invalid_argument("Cannot register a null propagation model");
    }
    std::string n = model->name();
    std::shared_ptr<const PropagationModel> shared(std::move(model));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = name_index_.find(n);
    if (it != name_index_.end()) {
        models_[it->second] = std::move(shared);
        logInfo("Replaced propagation model: " + n);
        return;
    }
    name_index_[n] = models_.size();
    models_.push_back(std::move(shared));
    logInfo("Registered propagation model: " + n);
}

bool ModelRegistry::remove(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = name_index_.find(name);
    if (it == name_index_.end()) return false;

    models_.erase(models_.begin() + it->second);
    rebuildIndex();
    return true;
}

std::vector<std::shared_ptr<const PropagationModel>> ModelRegistry::getAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return models_;
}

std::shared_ptr<const PropagationModel> ModelRegistry::getByName(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = name_index_.find(name);
    if (it != name_index_.end()) {
        return models_[it->second];
    }
    return nullptr;
}

std::vector<std::string> ModelRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(models_.size());
    for (const auto& m : models_) {
        result.push_back(m->name());
    }
    return result;
}

size_t ModelRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return models_.size();
}

void ModelRegistry::rebuildIndex() {
    name_index_.clear();
    for (size_t i = 0; i < models_.size(); i++) {
        name_index_[models_[i]->name()] = i;
    }
}

} // namespace trustnet
