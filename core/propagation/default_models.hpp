#pragma once

#include "propagation/model_registry.hpp"

namespace trustnet {

/// Register the standard model set: weighted average and minimum trust.
void registerDefaultModels(ModelRegistry& registry);

} // namespace trustnet
