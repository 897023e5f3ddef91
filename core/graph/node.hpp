#pragma once

#include "common/clock.hpp"

#include <string>
#include <unordered_map>

namespace trustnet {

enum class ComponentType {
    Microservice,
    Database,
    API,
    LoadBalancer,
    MessageQueue,
    Cache,
    ExternalService,
    LegacySystem,
    EdgeDevice,
    Container,
};

const char* componentTypeName(ComponentType type);

/// Security sub-scores of a component. Vulnerability is "higher is worse";
/// the remaining scores are "higher is better".
struct SecurityPosture {
    double vulnerability_score  = 0.0;
    double patch_status         = 1.0;
    double compliance_score     = 1.0;
    double encryption_status    = 1.0;
    double access_control_score = 1.0;
};

/// A component in the trust graph.
/// trust_score is conventionally in [0, 1]; the graph does not clamp it.
struct TrustNode {
    std::string id;
    double trust_score = 1.0;
    ComponentType component_type = ComponentType::Microservice;
    SecurityPosture security_posture;
    Timestamp last_updated{};
    std::unordered_map<std::string, std::string> metadata;

    TrustNode() = default;
    TrustNode(std::string id, double trust_score,
              ComponentType type = ComponentType::Microservice)
        : id(std::move(id)), trust_score(trust_score), component_type(type),
          last_updated(now()) {}

    void setMetadata(const std::string& key, const std::string& value) {
        metadata[key] = value;
    }

    std::string getMetadata(const std::string& key, const std::string& default_val = "") const {
        auto it = metadata.find(key);
        return it != metadata.end() ? it->second : default_val;
    }
};

} // namespace trustnet
