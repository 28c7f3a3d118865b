// /////////////////////////////////////////////////////////////////////////////
/// @file MappingEntry.hpp
/// @brief Validated, immutable mapping of one raw code.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/MappingConfig.hpp>
#include <btpad/core/Types.hpp>

#include <string>

namespace btpad::mapping {

/// @brief Normalization parameters compiled from a list of steps.
///
/// Steps are applied in a fixed order whatever order they were listed in:
/// clamp, deadzone, scale, invert. Every axis of a loaded table is scaled.
struct Normalization
{
    bool      scaled{false};
    core::i32 rawMin{0};
    core::i32 rawMax{0};
    core::i32 deadzone{0};
    bool      inverted{false};

    /// @brief Rest value in raw units.
    [[nodiscard]] core::f64 center() const noexcept
    {
        return scaled ? (static_cast<core::f64>(rawMin) + static_cast<core::f64>(rawMax)) / 2.0
                      : 0.0;
    }

    /// @brief Raw units per normalized unit.
    [[nodiscard]] core::f64 halfSpan() const noexcept
    {
        return scaled ? (static_cast<core::f64>(rawMax) - static_cast<core::f64>(rawMin)) / 2.0
                      : 1.0;
    }
};

/// @brief A single entry of a MappingTable.
struct MappingEntry
{
    core::u32     code{0};
    std::string   name;
    ControlKind   kind{ControlKind::kButton};
    Normalization normalization{};
    core::u32     slot{0};   ///< dense index of @c name in the table
};

} // namespace btpad::mapping
