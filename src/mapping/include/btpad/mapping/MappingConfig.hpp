// /////////////////////////////////////////////////////////////////////////////
/// @file MappingConfig.hpp
/// @brief Typed mapping configuration, as supplied by a caller or a file.
///
/// A MappingConfig is unvalidated input. MappingTable::load() turns it into
/// an immutable table or rejects it with ErrorCode::kConfigError.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/core/Types.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace btpad::mapping {

/// @brief What a raw code drives.
enum class ControlKind : core::u8
{
    kButton,
    kAxis
};

/// @brief One normalization transform.
enum class NormalizationKind : core::u8
{
    kPassThrough,
    kScaleToUnit,   ///< first = raw min, second = raw max
    kInvert,
    kDeadzone       ///< first = threshold in raw units around the center
};

/// @brief A normalization transform with its parameters.
struct NormalizationStep
{
    NormalizationKind kind{NormalizationKind::kPassThrough};
    core::i32         first{0};
    core::i32         second{0};

    [[nodiscard]] static NormalizationStep passThrough() noexcept
    {
        return {NormalizationKind::kPassThrough, 0, 0};
    }
    [[nodiscard]] static NormalizationStep scale(core::i32 min, core::i32 max) noexcept
    {
        return {NormalizationKind::kScaleToUnit, min, max};
    }
    [[nodiscard]] static NormalizationStep invert() noexcept
    {
        return {NormalizationKind::kInvert, 0, 0};
    }
    [[nodiscard]] static NormalizationStep deadzone(core::i32 threshold) noexcept
    {
        return {NormalizationKind::kDeadzone, threshold, 0};
    }
};

/// @brief Mapping of one raw code to one logical control.
struct MappingRecord
{
    core::u32                      code{0};
    std::string                    name;
    ControlKind                    kind{ControlKind::kButton};
    std::vector<NormalizationStep> normalization;
};

/// @brief A complete mapping description.
struct MappingConfig
{
    std::vector<MappingRecord> records;

    /// @brief Appends a button record.
    MappingConfig& button(core::u32 code, std::string name,
                          std::vector<NormalizationStep> steps = {})
    {
        records.push_back({code, std::move(name), ControlKind::kButton, std::move(steps)});
        return *this;
    }

    /// @brief Appends an axis record.
    MappingConfig& axis(core::u32 code, std::string name,
                        std::vector<NormalizationStep> steps)
    {
        records.push_back({code, std::move(name), ControlKind::kAxis, std::move(steps)});
        return *this;
    }
};

[[nodiscard]] std::string_view controlKindName(ControlKind kind) noexcept;
[[nodiscard]] std::string_view normalizationKindName(NormalizationKind kind) noexcept;

} // namespace btpad::mapping
