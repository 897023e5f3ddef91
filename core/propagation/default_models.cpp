#include "propagation/default_models.hpp"
#include "propagation/propagation_models.hpp"

namespace trustnet {

void registerDefaultModels(ModelRegistry& registry) {
    registry.registerModel(std::make_unique<WeightedAverageModel>());
    registry.registerModel(std::make_unique<MinimumTrustModel>());
}

} // namespace trustnet
