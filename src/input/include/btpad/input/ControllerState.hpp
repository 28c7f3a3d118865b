// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerState.hpp
/// @brief Last known value of every logical control, shared between one
///        writer and any number of readers.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/ControllerSnapshot.hpp>
#include <btpad/mapping/MappingTable.hpp>
#include <btpad/core/NonCopyable.hpp>
#include <btpad/core/Types.hpp>

#include <atomic>
#include <memory>
#include <string_view>

namespace btpad::input {

// /////////////////////////////////////////////////////////////////////////////
/// @class ControllerState
/// @brief Copy-on-write holder of the current ControllerSnapshot.
///
/// apply() copies the published values, overwrites one slot and publishes
/// the new snapshot with a single atomic store. snapshot() is an atomic
/// load: readers never wait for the writer and can never observe a
/// partially written value. Only one thread may call apply().
// /////////////////////////////////////////////////////////////////////////////
class ControllerState final : public core::NonMovable<ControllerState>
{
public:
    explicit ControllerState(std::shared_ptr<const mapping::MappingTable> table);

    /// @brief Overwrites the value of @p slot.
    /// @return false if nothing was published (unknown slot, or the value
    ///         is already current).
    bool apply(core::u32 slot, core::f64 value);

    /// @brief Overwrites the value of a control by name.
    bool apply(std::string_view name, core::f64 value);

    /// @brief The latest published snapshot. Callable from any thread.
    [[nodiscard]] std::shared_ptr<const ControllerSnapshot> snapshot() const noexcept;

private:
    std::shared_ptr<const mapping::MappingTable>               table_;
    std::atomic<std::shared_ptr<const ControllerSnapshot>>     current_;
};

} // namespace btpad::input
