#pragma once

/// @file system.hpp
/// @brief ISystem interface and the execution stages the host runs in order.

#include <cstdint>
#include <string_view>

namespace msim::ecs {

/// Stages run in declaration order once per world tick.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Inbound events, input
    Update,      ///< Simulation logic
    PostUpdate   ///< Replication and cleanup
};

/// A unit of per-tick work registered with the host.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Advance the system by @p deltaTime seconds.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

} // namespace msim::ecs
