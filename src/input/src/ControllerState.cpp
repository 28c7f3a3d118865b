// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerState.cpp
/// @brief ControllerState implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/ControllerState.hpp>

namespace btpad::input {

ControllerState::ControllerState(std::shared_ptr<const mapping::MappingTable> table)
    : table_{std::move(table)}
    , current_{ControllerSnapshot::neutral(table_)}
{}

bool ControllerState::apply(core::u32 slot, core::f64 value)
{
    const auto current = current_.load(std::memory_order_acquire);
    if (slot >= current->size() || current->at(slot) == value)
        return false;

    std::vector<core::f64> values = current->values();
    values[slot] = value;

    current_.store(std::make_shared<const ControllerSnapshot>(
                       table_, std::move(values), current->sequence() + 1),
                   std::memory_order_release);
    return true;
}

bool ControllerState::apply(std::string_view name, core::f64 value)
{
    const auto slot = table_->slotOf(name);
    if (!slot)
        return false;
    return apply(*slot, value);
}

std::shared_ptr<const ControllerSnapshot> ControllerState::snapshot() const noexcept
{
    return current_.load(std::memory_order_acquire);
}

} // namespace btpad::input
