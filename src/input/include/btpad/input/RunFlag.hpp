// /////////////////////////////////////////////////////////////////////////////
/// @file RunFlag.hpp
/// @brief Liveness flag of a controller's producer.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <atomic>

namespace btpad::input {

/// @brief Set while the reader loop is alive; cleared on source failure or
///        stop. Owned by one controller, never process-wide.
class RunFlag
{
public:
    void set() noexcept { running_.store(true, std::memory_order_release); }
    void clear() noexcept { running_.store(false, std::memory_order_release); }

    [[nodiscard]] bool isRunning() const noexcept
    {
        return running_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> running_{false};
};

} // namespace btpad::input
