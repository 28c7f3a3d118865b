// /////////////////////////////////////////////////////////////////////////////
/// @file Event.hpp
/// @brief Raw and normalized event vocabulary types.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/core/Types.hpp>

#include <string_view>

namespace btpad::mapping {

// /////////////////////////////////////////////////////////////////////////////
/// @struct RawEvent
/// @brief One (code, value) pair emitted by the controller's driver stack.
///
/// The code is opaque to everything but the mapping table. @c sequence is
/// the arrival index assigned by the event reader and is the only notion of
/// time the pipeline relies on.
// /////////////////////////////////////////////////////////////////////////////
struct RawEvent
{
    core::u32 code{0};
    core::i32 value{0};
    core::u64 sequence{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct NormalizedEvent
/// @brief Output of the normalizer: a logical control and its new value.
///
/// @c name views the mapping table's storage and is valid as long as the
/// table that produced the event.
// /////////////////////////////////////////////////////////////////////////////
struct NormalizedEvent
{
    core::u32        slot{0};
    std::string_view name;
    core::f64        value{0.0};
    core::u32        code{0};
    core::u64        sequence{0};
};

} // namespace btpad::mapping
