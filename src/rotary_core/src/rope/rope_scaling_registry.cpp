#include "rope/rope_scaling_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace rotary_core::rope {

    std::unordered_map<RopeScalingType, RopeScalingCreatorFunc>& RopeScalingRegistry::get_registry() {
        static std::unordered_map<RopeScalingType, RopeScalingCreatorFunc> registry_instance;
        return registry_instance;
    }

    bool RopeScalingRegistry::register_scaling(RopeScalingType type, RopeScalingCreatorFunc creator) {
        auto& registry = get_registry();
        if (registry.count(type)) {
            spdlog::error("RoPE scaling type '{}' already registered.", to_string(type));
            throw std::runtime_error("RoPE scaling type already registered: " + to_string(type));
        }
        registry[type] = std::move(creator);
        spdlog::debug("Registered RoPE scaling type '{}'.", to_string(type));
        return true;
    }

    std::unique_ptr<IRopeScaling> RopeScalingRegistry::create_scaling(RopeScalingType type) {
        auto& registry = get_registry();
        auto it = registry.find(type);
        if (it == registry.end()) {
            spdlog::error("Unsupported RoPE scaling type requested: '{}'.", to_string(type));
            throw RopeConfigError("Unsupported RoPE scaling type: " + to_string(type));
        }
        return it->second();
    }

    bool RopeScalingRegistry::is_registered(RopeScalingType type) {
        return get_registry().count(type) > 0;
    }

    std::vector<RopeScalingType> RopeScalingRegistry::registered_types() {
        std::vector<RopeScalingType> types;
        for (const auto& [type, creator] : get_registry()) {
            types.push_back(type);
        }
        std::sort(types.begin(), types.end());
        return types;
    }

} // namespace rotary_core::rope
