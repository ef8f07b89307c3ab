/**
 * DispatchBridge.cpp - Consumer worker thread with bounded handoff
 */

#include "hark/dispatch/DispatchBridge.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>

namespace hark::dispatch {

const char* toString(DispatchOutcome outcome) {
    switch (outcome) {
        case DispatchOutcome::COMPLETED: return "completed";
        case DispatchOutcome::FAILED:    return "failed";
        case DispatchOutcome::TIMED_OUT: return "timed out";
        case DispatchOutcome::REJECTED:  return "rejected";
    }
    return "unknown";
}

struct DispatchBridge::Impl {
    struct Task {
        std::string text;
        // Shared so a waiter that timed out does not leave a dangling promise
        std::shared_ptr<std::promise<DispatchOutcome>> done;
    };

    CommandHandler handler;
    ResponseCallback response_callback;
    std::chrono::milliseconds timeout;

    std::queue<Task> tasks;
    mutable std::mutex queue_mutex;
    std::condition_variable task_cv;
    std::thread worker;
    std::atomic<bool> running{true};
    std::atomic<size_t> in_flight{0};

    Impl(CommandHandler h, std::chrono::milliseconds t)
        : handler(std::move(h)), timeout(t) {
        worker = std::thread([this]() { consumerWorker(); });
    }

    // Consumer thread: takes commands, runs the handler, fulfils the promise
    void consumerWorker() {
        while (true) {
            Task task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                task_cv.wait(lock, [this]() { return !tasks.empty() || !running; });

                if (!running) break;

                task = std::move(tasks.front());
                tasks.pop();
            }

            DispatchOutcome outcome = runHandler(task.text);
            --in_flight;
            task.done->set_value(outcome);
        }
    }

    DispatchOutcome runHandler(const std::string& text) {
        if (!handler) {
            std::cerr << "[Dispatch] No command handler set" << std::endl;
            return DispatchOutcome::FAILED;
        }

        try {
            std::string response = handler(text);
            std::cout << "[Dispatch] Response: " << response << std::endl;

            ResponseCallback callback;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                callback = response_callback;
            }
            if (callback) {
                callback(text, response);
            }
            return DispatchOutcome::COMPLETED;
        } catch (const std::exception& e) {
            std::cerr << "[Dispatch] Handler failed for \"" << text << "\": " << e.what() << std::endl;
            return DispatchOutcome::FAILED;
        } catch (...) {
            // Nothing may escape into the consumer thread
            std::cerr << "[Dispatch] Handler failed for \"" << text << "\": unknown exception" << std::endl;
            return DispatchOutcome::FAILED;
        }
    }

    void shutdown() {
        std::queue<Task> dropped;
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (!running) return;
            running = false;
            std::swap(dropped, tasks);
        }
        task_cv.notify_all();

        while (!dropped.empty()) {
            --in_flight;
            dropped.front().done->set_value(DispatchOutcome::REJECTED);
            dropped.pop();
        }

        if (worker.joinable()) {
            worker.join();
        }
    }
};

DispatchBridge::DispatchBridge(CommandHandler handler, std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>(std::move(handler), timeout)) {
}

DispatchBridge::~DispatchBridge() {
    shutdown();
}

DispatchOutcome DispatchBridge::dispatch(const std::string& text) {
    if (text.empty()) {
        return DispatchOutcome::REJECTED;
    }

    auto done = std::make_shared<std::promise<DispatchOutcome>>();
    std::future<DispatchOutcome> result = done->get_future();

    {
        std::lock_guard<std::mutex> lock(impl_->queue_mutex);
        if (!impl_->running) {
            std::cerr << "[Dispatch] Warning: bridge is shut down, dropping \"" << text << "\"" << std::endl;
            return DispatchOutcome::REJECTED;
        }
        impl_->tasks.push({text, done});
        ++impl_->in_flight;
    }
    impl_->task_cv.notify_one();

    if (result.wait_for(impl_->timeout) != std::future_status::ready) {
        std::cerr << "[Dispatch] Warning: consumer did not finish within "
                  << impl_->timeout.count() << "ms, resuming without it" << std::endl;
        return DispatchOutcome::TIMED_OUT;
    }

    return result.get();
}

void DispatchBridge::setResponseCallback(ResponseCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->queue_mutex);
    impl_->response_callback = std::move(callback);
}

std::chrono::milliseconds DispatchBridge::timeout() const {
    return impl_->timeout;
}

size_t DispatchBridge::pending() const {
    return impl_->in_flight;
}

void DispatchBridge::shutdown() {
    impl_->shutdown();
}

} // namespace hark::dispatch
