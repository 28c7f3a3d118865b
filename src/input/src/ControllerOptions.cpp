// /////////////////////////////////////////////////////////////////////////////
/// @file ControllerOptions.cpp
/// @brief ControllerOptions::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/input/ControllerOptions.hpp>

#include <utility>

namespace btpad::input {

ControllerOptions::Builder& ControllerOptions::Builder::family(mapping::ControllerFamily family) noexcept
{
    family_ = family;
    return *this;
}

ControllerOptions::Builder& ControllerOptions::Builder::mapping(mapping::MappingConfig config)
{
    mapping_ = std::move(config);
    return *this;
}

ControllerOptions::Builder& ControllerOptions::Builder::logTag(std::string tag)
{
    logTag_ = std::move(tag);
    return *this;
}

ControllerOptions ControllerOptions::Builder::build() const
{
    ControllerOptions options;
    options.family_  = family_;
    options.mapping_ = mapping_;
    options.logTag_  = logTag_;
    return options;
}

} // namespace btpad::input
