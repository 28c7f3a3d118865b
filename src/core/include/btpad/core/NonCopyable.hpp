/**
 * @file NonCopyable.hpp
 * @brief CRTP base classes that delete copy (and optionally move) operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef BTPAD_CORE_NON_COPYABLE_HPP
    #define BTPAD_CORE_NON_COPYABLE_HPP

namespace btpad::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

/**
 * @brief Inherit to pin an object in place: threads and observers keep
 *        raw pointers to it, so it can be neither copied nor moved.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    NonMovable()  = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &)  = delete;
    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)       = delete;
};

} // namespace btpad::core

#endif // BTPAD_CORE_NON_COPYABLE_HPP
