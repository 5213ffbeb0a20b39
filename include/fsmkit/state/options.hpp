#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <string>

namespace fsmkit::state {

    // What an active machine does with queued events when it is stopped
    enum class ShutdownPolicy {
        Drain,  // process everything queued before the stop request
        Discard // drop queued events, finish only the step in flight
    };

    // Receives failures raised on the worker thread. Called without the model lock held.
    using ErrorHook = std::function<void(std::exception_ptr)>;

    struct ActiveOptions {
        std::string name = "machine"; // prefix for log lines
        ShutdownPolicy shutdown = ShutdownPolicy::Drain;
        std::chrono::milliseconds idleInterval{1}; // idle tick period, unused without a tick
        ErrorHook onError;
    };

} // namespace fsmkit::state
