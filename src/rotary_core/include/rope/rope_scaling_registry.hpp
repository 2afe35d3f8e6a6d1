#pragma once

#include "rope/irope_scaling.hpp"
#include "rope/rope_config.hpp"
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace rotary_core::rope {

    using RopeScalingCreatorFunc = std::function<std::unique_ptr<IRopeScaling>()>;

    /**
     * @brief Registry of RoPE scaling policies keyed by RopeScalingType.
     *
     * Concrete policies register themselves from their own translation unit through
     * RopeScalingRegistrar, so a new variant can be added without touching RotaryEmbedding.
     */
    class RopeScalingRegistry {
    public:
        /**
         * @brief Registers a scaling policy.
         * @throws std::runtime_error if the type is already registered.
         */
        static bool register_scaling(RopeScalingType type, RopeScalingCreatorFunc creator);

        /**
         * @brief Creates an instance of the policy registered for a type.
         * @throws RopeConfigError if no policy is registered for the type.
         */
        static std::unique_ptr<IRopeScaling> create_scaling(RopeScalingType type);

        static bool is_registered(RopeScalingType type);

        static std::vector<RopeScalingType> registered_types();

        RopeScalingRegistry(const RopeScalingRegistry&) = delete;
        RopeScalingRegistry& operator=(const RopeScalingRegistry&) = delete;
        RopeScalingRegistry(RopeScalingRegistry&&) = delete;
        RopeScalingRegistry& operator=(RopeScalingRegistry&&) = delete;

    private:
        RopeScalingRegistry() = default;

        static std::unordered_map<RopeScalingType, RopeScalingCreatorFunc>& get_registry();
    };

    /**
     * @brief Registers T for a scaling type on construction.
     *
     * Usage, in the policy's .cpp file:
     * namespace {
     *     RopeScalingRegistrar<LinearRopeScaling> registrar(RopeScalingType::LINEAR);
     * }
     */
    template <typename T>
    class RopeScalingRegistrar {
    public:
        explicit RopeScalingRegistrar(RopeScalingType type) {
            RopeScalingRegistry::register_scaling(type, []() {
                return std::make_unique<T>();
            });
        }
    };

} // namespace rotary_core::rope
