// /////////////////////////////////////////////////////////////////////////////
/// @file MappingConfig.cpp
/// @brief Names of the configuration enumerations.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/mapping/MappingConfig.hpp>

namespace btpad::mapping {

std::string_view controlKindName(ControlKind kind) noexcept
{
    switch (kind)
    {
        case ControlKind::kButton: return "button";
        case ControlKind::kAxis:   return "axis";
    }
    return "unknown";
}

std::string_view normalizationKindName(NormalizationKind kind) noexcept
{
    switch (kind)
    {
        case NormalizationKind::kPassThrough: return "passthrough";
        case NormalizationKind::kScaleToUnit: return "scale";
        case NormalizationKind::kInvert:      return "invert";
        case NormalizationKind::kDeadzone:    return "deadzone";
    }
    return "unknown";
}

} // namespace btpad::mapping
