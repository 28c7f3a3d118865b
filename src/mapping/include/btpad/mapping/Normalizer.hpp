// /////////////////////////////////////////////////////////////////////////////
/// @file Normalizer.hpp
/// @brief Pure conversion of raw events into normalized control values.
///
/// Buttons collapse to exactly 0 (raw 0) or 1 (any other raw value,
/// including the evdev auto-repeat value 2). Scaled axes map [min, max]
/// linearly onto [-1, 1] and clamp outside it; a deadzone forces raw values
/// strictly closer than the threshold to the center to exactly 0.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/mapping/Event.hpp>
#include <btpad/mapping/MappingEntry.hpp>
#include <btpad/mapping/MappingTable.hpp>
#include <btpad/core/Types.hpp>

#include <optional>

namespace btpad::mapping {

/// @brief Normalizes one raw value according to @p normalization.
[[nodiscard]] core::f64 normalizeValue(ControlKind kind,
                                       const Normalization& normalization,
                                       core::i32 raw) noexcept;

/// @brief Normalizes @p event with the entry it maps to.
[[nodiscard]] NormalizedEvent normalize(const RawEvent& event,
                                        const MappingEntry& entry) noexcept;

/// @brief Looks @p event up in @p table and normalizes it.
/// @return std::nullopt for unmapped codes.
[[nodiscard]] std::optional<NormalizedEvent> normalize(const RawEvent& event,
                                                       const MappingTable& table) noexcept;

} // namespace btpad::mapping
