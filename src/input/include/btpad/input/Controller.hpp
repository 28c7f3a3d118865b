// /////////////////////////////////////////////////////////////////////////////
/// @file Controller.hpp
/// @brief Polling façade over one wireless controller.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <btpad/input/ControllerOptions.hpp>
#include <btpad/input/ControllerSnapshot.hpp>
#include <btpad/input/IEventObserver.hpp>
#include <btpad/input/IEventSource.hpp>
#include <btpad/mapping/MappingTable.hpp>
#include <btpad/core/Expected.hpp>
#include <btpad/core/NonCopyable.hpp>
#include <btpad/core/Types.hpp>

#include <memory>
#include <optional>
#include <string_view>

namespace btpad::input {

enum class ControllerLifecycle : core::u8
{
    kConstructed,
    kRunning,
    kStopped
};

[[nodiscard]] std::string_view lifecycleName(ControllerLifecycle lifecycle) noexcept;

/// @brief Result of Controller::poll().
struct PollResult
{
    std::shared_ptr<const ControllerSnapshot> state;
    bool                                      running{false};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class Controller
/// @brief Owns a source, its reader thread and the shared controller state.
///
/// A producer thread (std::jthread) reads raw events, normalizes them and
/// publishes each change to the ControllerState. Any thread may call
/// poll() to get the latest snapshot without blocking. When the source
/// fails or disconnects the producer exits, poll() keeps returning the
/// last known values and reports running == false.
///
/// Lifecycle: kConstructed --start()--> kRunning --stop()/failure--> kStopped.
// /////////////////////////////////////////////////////////////////////////////
class Controller final : public core::NonCopyable<Controller>
{
public:
    /// @brief Builds the mapping and the state. Nothing is opened yet.
    /// @return kInvalidArgument for a null source, kConfigError for an
    ///         invalid mapping.
    [[nodiscard]] static core::Expected<std::unique_ptr<Controller>> create(
        std::unique_ptr<IEventSource> source,
        const ControllerOptions& options = {});

    ~Controller();

    /// @brief Attaches an observer; it must outlive the controller.
    [[nodiscard]] core::ExpectedVoid addObserver(IEventObserver* observer);

    /// @brief Opens the source and launches the producer thread.
    [[nodiscard]] core::ExpectedVoid start();

    /// @brief Stops and joins the producer. Idempotent.
    ///
    /// Called from an observer, on the producer thread, it only ends the
    /// loop; the join and the source close are left to the next stop()
    /// from another thread or to the destructor.
    void stop() noexcept;

    /// @brief Latest snapshot and liveness. Never blocks.
    [[nodiscard]] PollResult poll() const noexcept;

    [[nodiscard]] ControllerLifecycle lifecycle() const noexcept;

    /// @brief The error that ended the stream, if any.
    [[nodiscard]] std::optional<core::Error> lastError() const;

    [[nodiscard]] const mapping::MappingTable& mapping() const noexcept;
    [[nodiscard]] core::u64 eventsRead() const noexcept;

private:
    struct Impl;

    explicit Controller(std::shared_ptr<Impl> impl);

    std::shared_ptr<Impl> impl_;
};

} // namespace btpad::input
