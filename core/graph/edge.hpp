#pragma once

#include <string>
#include <utility>

namespace trustnet {

enum class RelationshipType {
    DataFlow,
    Dependency,
    Communication,
    Control,
    Monitoring,
    Backup,
    LoadBalancing,
};

const char* relationshipTypeName(RelationshipType type);

/// Identity of the edge from → to. One edge per ordered pair.
using EdgeId = std::pair<std::string, std::string>;

/// "from->to" label, as used for per-edge probability tables. Not unique
/// when ids themselves contain "->"; the graph keys edges by EdgeId.
inline std::string edgeKey(const std::string& from, const std::string& to) {
    return from + "->" + to;
}

/// A directed relationship between two components.
/// trust_weight is the attenuation applied when trust crosses this edge.
struct TrustEdge {
    std::string from;
    std::string to;
    RelationshipType relationship_type = RelationshipType::Dependency;
    double trust_weight = 1.0;
    double data_flow_volume = 0.0;
    double criticality = 0.0;

    TrustEdge() = default;
    TrustEdge(std::string from, std::string to, double trust_weight,
              RelationshipType type = RelationshipType::Dependency)
        : from(std::move(from)), to(std::move(to)),
          relationship_type(type), trust_weight(trust_weight) {}

    EdgeId id() const { return {from, to}; }
    std::string key() const { return edgeKey(from, to); }
};

} // namespace trustnet
