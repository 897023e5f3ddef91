#pragma once

#include "graph/graph.hpp"

#include <string>
#include <unordered_map>

namespace trustnet {

/// Derived trust per component id.
using TrustMap = std::unordered_map<std::string, double>;

/// Base class for all trust propagation models.
/// P : (G, s) → {node → derived trust}
/// The source is seeded at 1.0. Every node reachable from the source
/// gets a derived value; unreachable nodes are absent from the result.
/// Implementations must terminate on cyclic graphs and must not mutate
/// shared state, since several threads may propagate concurrently.
class PropagationModel {
public:
    virtual ~PropagationModel() = default;

    /// Registry name of this model.
    virtual std::string name() const = 0;

    /// Propagate trust from source across the graph.
    virtual TrustMap propagate(const TrustGraph& graph, const std::string& source) const = 0;
};

} // namespace trustnet
