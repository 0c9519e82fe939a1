#include "../include/agent_catalog.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"

using json = nlohmann::json;

std::vector<AgentDefinition> default_agent_catalog() {
    return {
        {"velocity-01", AgentTier::fast, {"fast-compress", "compress"}},
        {"velocity-02", AgentTier::fast, {"fast-compress", "compress"}},
        {"apex-01", AgentTier::balanced, {"compress", "decompress", "verify"}},
        {"apex-02", AgentTier::balanced, {"compress", "decompress"}},
        {"cipher-01", AgentTier::balanced, {"decompress", "verify"}},
        {"axiom-01", AgentTier::deep, {"deep-compress", "compress", "verify"}},
    };
}

std::vector<AgentDefinition> agent_catalog_from_json(const json& j) {
    if (!j.is_array()) throw ValidationError("agents must be an array");
    std::vector<AgentDefinition> out;
    for (const auto& item : j) {
        if (!item.is_object()) throw ValidationError("agent entry must be an object");
        AgentDefinition def;
        def.id = item.value("id", std::string());
        auto tier_name = item.value("tier", std::string("balanced"));
        auto tier = agent_tier_from_name(tier_name);
        if (!tier) throw ValidationError("unknown agent tier: " + tier_name);
        def.tier = *tier;
        if (item.contains("capability")) {
            def.capabilities.push_back(item.at("capability").get<std::string>());
        }
        if (item.contains("capabilities")) {
            for (const auto& c : item.at("capabilities")) def.capabilities.push_back(c.get<std::string>());
        }
        if (def.capabilities.empty()) {
            throw ValidationError("agent " + (def.id.empty() ? std::string("(unnamed)") : def.id) +
                                  " has no capability");
        }
        out.push_back(std::move(def));
    }
    return out;
}
