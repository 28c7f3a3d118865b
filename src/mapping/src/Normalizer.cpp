// /////////////////////////////////////////////////////////////////////////////
/// @file Normalizer.cpp
/// @brief Button collapse and axis scaling.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/mapping/Normalizer.hpp>

#include <algorithm>
#include <cmath>

namespace btpad::mapping {

namespace {

core::f64 normalizeButton(const Normalization& n, core::i32 raw) noexcept
{
    const core::f64 pressed = (raw != 0) ? 1.0 : 0.0;
    return n.inverted ? 1.0 - pressed : pressed;
}

core::f64 normalizeAxis(const Normalization& n, core::i32 raw) noexcept
{
    core::f64 value = std::clamp(static_cast<core::f64>(raw),
                                 static_cast<core::f64>(n.rawMin), static_cast<core::f64>(n.rawMax));

    const core::f64 offset = value - n.center();
    if (std::abs(offset) < static_cast<core::f64>(n.deadzone))
        return 0.0;

    value = std::clamp(offset / n.halfSpan(), -1.0, 1.0);

    if (n.inverted)
        value = -value;
    return value == 0.0 ? 0.0 : value;
}

} // namespace

core::f64 normalizeValue(ControlKind kind, const Normalization& normalization, core::i32 raw) noexcept
{
    return kind == ControlKind::kButton ? normalizeButton(normalization, raw)
                                        : normalizeAxis(normalization, raw);
}

NormalizedEvent normalize(const RawEvent& event, const MappingEntry& entry) noexcept
{
    NormalizedEvent out;
    out.slot     = entry.slot;
    out.name     = entry.name;
    out.value    = normalizeValue(entry.kind, entry.normalization, event.value);
    out.code     = event.code;
    out.sequence = event.sequence;
    return out;
}

std::optional<NormalizedEvent> normalize(const RawEvent& event, const MappingTable& table) noexcept
{
    const MappingEntry* entry = table.lookup(event.code);
    if (entry == nullptr)
        return std::nullopt;
    return normalize(event, *entry);
}

} // namespace btpad::mapping
