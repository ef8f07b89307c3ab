/**
 * DispatchBridge.hpp - Hands command text to a consumer thread
 *
 * The consumer runs on the bridge's own worker thread, one command at a
 * time in submission order. dispatch() blocks the caller until the
 * consumer finishes or the timeout elapses; on timeout the consumer keeps
 * running in the background and is not cancelled.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace hark::dispatch {

/** Consumes a command and returns the response text. May throw. */
using CommandHandler = std::function<std::string(const std::string&)>;

/** Called on the consumer thread after the handler returns. */
using ResponseCallback = std::function<void(const std::string& command, const std::string& response)>;

enum class DispatchOutcome {
    COMPLETED,
    FAILED,     // Handler threw
    TIMED_OUT,  // Handler still running, caller released
    REJECTED    // Bridge shut down, or empty command
};

const char* toString(DispatchOutcome outcome);

class DispatchBridge {
public:
    DispatchBridge(CommandHandler handler, std::chrono::milliseconds timeout);

    /** Calls shutdown(). */
    ~DispatchBridge();

    DispatchBridge(const DispatchBridge&) = delete;
    DispatchBridge& operator=(const DispatchBridge&) = delete;

    DispatchOutcome dispatch(const std::string& text);

    void setResponseCallback(ResponseCallback callback);

    std::chrono::milliseconds timeout() const;

    /** Commands queued or running. */
    size_t pending() const;

    /**
     * Drop queued commands (their waiters get REJECTED), then join the
     * worker. Waits for a running handler to return. Idempotent.
     */
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hark::dispatch
