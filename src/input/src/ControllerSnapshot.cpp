// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerSnapshot.cpp
/// @brief ControllerSnapshot implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/ControllerSnapshot.hpp>
#include <btpad/core/Assert.hpp>

namespace btpad::input {

ControllerSnapshot::ControllerSnapshot(std::shared_ptr<const mapping::MappingTable> table,
                                       std::vector<core::f64> values,
                                       core::u64 sequence)
    : table_{std::move(table)}
    , values_{std::move(values)}
    , sequence_{sequence}
{
    BTPAD_ASSERT(table_ != nullptr);
    BTPAD_ASSERT(values_.size() == table_->controlCount());
}

std::shared_ptr<const ControllerSnapshot> ControllerSnapshot::neutral(
    std::shared_ptr<const mapping::MappingTable> table)
{
    const auto count = table->controlCount();
    return std::make_shared<const ControllerSnapshot>(
        std::move(table), std::vector<core::f64>(count, 0.0), 0);
}

std::optional<core::f64> ControllerSnapshot::value(std::string_view name) const noexcept
{
    const auto slot = table_->slotOf(name);
    if (!slot)
        return std::nullopt;
    return values_[*slot];
}

core::f64 ControllerSnapshot::valueOr(std::string_view name, core::f64 fallback) const noexcept
{
    return value(name).value_or(fallback);
}

bool ControllerSnapshot::pressed(std::string_view name) const noexcept
{
    return valueOr(name) >= 0.5;
}

core::f64 ControllerSnapshot::at(core::u32 slot) const noexcept
{
    BTPAD_ASSERT(slot < values_.size());
    return values_[slot];
}

const std::vector<std::string>& ControllerSnapshot::names() const noexcept
{
    return table_->controlNames();
}

} // namespace btpad::input
