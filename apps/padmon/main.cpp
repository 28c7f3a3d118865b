// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief padmon entry-point: watch a wireless controller from the terminal.
///
/// Modes:
///   log     print every normalized event (default)
///   profile measure raw events per second over ten windows of 1000 events
///   poll    print the whole controller state at 20 Hz
// /////////////////////////////////////////////////////////////////////////////

#include <btpad/diag/EventLogger.hpp>
#include <btpad/diag/RateMeter.hpp>
#include <btpad/input/Controller.hpp>
#include <btpad/input/ControllerOptions.hpp>
#include <btpad/input/EvdevSource.hpp>
#include <btpad/input/ReplaySource.hpp>
#include <btpad/mapping/ConfigLoader.hpp>
#include <btpad/mapping/ControllerFamily.hpp>
#include <btpad/core/Log.hpp>
#include <btpad/core/Types.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

using namespace btpad;

namespace {

constexpr std::string_view kTag = "padmon";
constexpr std::string_view kProfilePrompt =
    "Measuring events per second. Move both joysticks around as fast as you can.";

std::atomic<bool> gInterrupted{false};

extern "C" void onSignal(int /*signal*/)
{
    gInterrupted.store(true);
}

enum class Mode : core::u8
{
    kLog,
    kProfile,
    kPoll
};

struct Arguments
{
    std::string                 target;
    Mode                        mode{Mode::kLog};
    mapping::ControllerFamily   family{mapping::ControllerFamily::kGenericGamepad};
    std::optional<std::string>  mappingFile;
    std::optional<core::f64>    replayRate;
    bool                        verbose{false};
};

void printUsage()
{
    std::cerr << "usage: padmon <event-device> [log|profile|poll] [--family generic|wiiu-pro|dualshock4]\n"
                 "              [--mapping FILE] [--replay EVENTS_PER_SECOND] [--verbose]\n"
                 "  --replay  treat <event-device> as a recording of \"code, value\" lines\n";
}

core::Expected<Arguments> parseArguments(int argc, char* argv[])
{
    Arguments args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};

        auto valueOf = [&](std::string_view flag) -> core::Expected<std::string> {
            if (i + 1 >= argc)
                return core::makeError(core::ErrorCode::kInvalidArgument, std::string{flag} + " needs a value");
            return std::string{argv[++i]};
        };

        if (arg == "log")
            args.mode = Mode::kLog;
        else if (arg == "profile")
            args.mode = Mode::kProfile;
        else if (arg == "poll")
            args.mode = Mode::kPoll;
        else if (arg == "--verbose" || arg == "-v")
            args.verbose = true;
        else if (arg == "--family")
        {
            auto name = BTPAD_TRY(valueOf(arg));
            args.family = BTPAD_TRY(mapping::parseFamily(name));
        }
        else if (arg == "--mapping")
            args.mappingFile = BTPAD_TRY(valueOf(arg));
        else if (arg == "--replay")
        {
            auto rate = BTPAD_TRY(valueOf(arg));
            try
            {
                args.replayRate = std::stod(rate);
            }
            catch (const std::exception&)
            {
                return core::makeError(core::ErrorCode::kInvalidArgument, "invalid replay rate: " + rate);
            }
        }
        else if (!arg.empty() && arg.front() == '-')
            return core::makeError(core::ErrorCode::kInvalidArgument, "unknown option " + std::string{arg});
        else if (args.target.empty())
            args.target = std::string{arg};
        else
            return core::makeError(core::ErrorCode::kInvalidArgument, "unexpected argument " + std::string{arg});
    }

    if (args.target.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "no event device given");
    return args;
}

core::Expected<std::unique_ptr<input::Controller>> buildController(const Arguments& args)
{
    std::unique_ptr<input::IEventSource> source;
    if (args.replayRate)
        source = std::make_unique<input::ReplaySource>(input::ReplayConfig{args.target, *args.replayRate});
    else
        source = std::make_unique<input::EvdevSource>(args.target);

    input::ControllerOptions::Builder builder;
    builder.family(args.family).logTag(std::string{kTag});
    if (args.mappingFile)
        builder.mapping(BTPAD_TRY(mapping::ConfigLoader::fromFile(*args.mappingFile)));

    return input::Controller::create(std::move(source), builder.build());
}

bool keepWaiting(const input::Controller& controller)
{
    return !gInterrupted.load() && controller.poll().running;
}

std::string describe(const input::ControllerSnapshot& snapshot)
{
    std::ostringstream os;
    os << '#' << snapshot.sequence();
    snapshot.forEach([&](std::string_view name, core::f64 value) {
        os << ' ' << name << '=' << value;
    });
    return os.str();
}

int runLog(input::Controller& controller)
{
    while (keepWaiting(controller))
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return 0;
}

int runProfile(input::Controller& controller, diag::RateMeter& meter)
{
    while (keepWaiting(controller) && !meter.complete())
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

    controller.stop();

    const auto report = meter.report();
    if (report.samples.empty())
    {
        core::Log::warn(kTag, "no complete measurement window");
        return 1;
    }

    std::cout << "RESULTS:\n"
              << "Events per second. MAX: " << report.max << ", AVERAGE: " << report.average << '\n';
    return meter.complete() ? 0 : 1;
}

int runPoll(input::Controller& controller)
{
    while (keepWaiting(controller))
    {
        std::cout << describe(*controller.poll().state) << '\n';
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    std::cout << describe(*controller.poll().state) << '\n';
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    auto args = parseArguments(argc, argv);
    if (!args)
    {
        core::Log::error(kTag, args.error().message());
        printUsage();
        return 2;
    }

    if (args->verbose)
        core::Log::setMinLevel(core::LogLevel::kDebug);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    diag::EventLogger logger{{}, args->verbose};
    diag::RateMeter meter;
    meter.setWindowCallback([](core::usize /*window*/, core::f64 rate) {
        std::cout << "events per second: " << rate << std::endl;
    });

    auto controller = buildController(*args);
    if (!controller)
    {
        core::Log::error(kTag, controller.error().format());
        return 1;
    }

    auto attached = args->mode == Mode::kProfile
        ? (*controller)->addObserver(&meter)
        : (*controller)->addObserver(&logger);
    if (!attached)
    {
        core::Log::error(kTag, attached.error().format());
        return 1;
    }

    if (args->mode == Mode::kProfile)
        std::cout << kProfilePrompt << std::endl;

    if (auto started = (*controller)->start(); !started)
        return 1;

    int status = 0;
    switch (args->mode)
    {
        case Mode::kLog:     status = runLog(**controller); break;
        case Mode::kProfile: status = runProfile(**controller, meter); break;
        case Mode::kPoll:    status = runPoll(**controller); break;
    }

    (*controller)->stop();
    if (auto error = (*controller)->lastError(); error && !gInterrupted.load())
        core::Log::warn(kTag, "controller went away: " + error->message());

    return status;
}
