/**
 * Types.hpp - Shared clock and listener state types
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace hark {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;

/**
 * WakeLoop states. Stopped is terminal until start() is called again.
 */
enum class ListenerState {
    IDLE,           // Wake-word stream open, scanning frames
    CAPTURING,      // Capture stream open, accumulating the command
    TRANSCRIBING,   // No stream open, model inference running
    DISPATCHING,    // Waiting on the downstream consumer
    STOPPED
};

const char* toString(ListenerState state);

/**
 * Snapshot readable from any thread.
 */
struct ListenerStatus {
    bool is_listening = false;
    bool is_capturing = false;
    bool enabled = false;
    ListenerState state = ListenerState::STOPPED;
};

} // namespace hark
