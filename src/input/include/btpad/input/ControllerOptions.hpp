// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerOptions.hpp
/// @brief Controller configuration (Builder pattern).
///
/// Immutable set of parameters handed to Controller::create(). A custom
/// mapping, when present, replaces the family's built-in one.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <btpad/mapping/ControllerFamily.hpp>
#include <btpad/mapping/MappingConfig.hpp>

#include <optional>
#include <string>

namespace btpad::input {

/// @brief Immutable controller configuration.
class ControllerOptions
{
public:
    /// @brief Fluent builder for ControllerOptions.
    class Builder
    {
    public:
        Builder& family(mapping::ControllerFamily family) noexcept;
        Builder& mapping(mapping::MappingConfig config);
        Builder& logTag(std::string tag);

        [[nodiscard]] ControllerOptions build() const;

    private:
        mapping::ControllerFamily             family_{mapping::ControllerFamily::kGenericGamepad};
        std::optional<mapping::MappingConfig> mapping_;
        std::string                           logTag_{"controller"};
    };

    ControllerOptions() = default;

    [[nodiscard]] mapping::ControllerFamily family() const noexcept { return family_; }
    [[nodiscard]] const std::optional<mapping::MappingConfig>& mapping() const noexcept { return mapping_; }
    [[nodiscard]] const std::string& logTag() const noexcept { return logTag_; }

private:
    friend class Builder;

    mapping::ControllerFamily             family_{mapping::ControllerFamily::kGenericGamepad};
    std::optional<mapping::MappingConfig> mapping_;
    std::string                           logTag_{"controller"};
};

} // namespace btpad::input
