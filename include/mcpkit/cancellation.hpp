#pragma once
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

/// Registry key for a request id: strings verbatim, integers in decimal,
/// anything else as compact JSON.
std::string canonical_request_id(const nlohmann::json& id);

/// One-shot, thread-safe latch. fire() runs the registered callbacks once,
/// outside the internal lock.
class CancelSignal {
public:
    /// Returns false if the signal had already fired.
    bool fire();
    bool fired() const;

    /// Run `cb` when the signal fires; immediately if it already has.
    void on_fire(std::function<void()> cb);

private:
    mutable std::mutex mutex_;
    bool fired_ = false;
    std::vector<std::function<void()>> callbacks_;
};

/// In-flight cancellable requests, one entry per id.
class CancellationRegistry {
public:
    /// Register `id` as active. A colliding id replaces the previous entry.
    std::shared_ptr<CancelSignal> begin(const std::string& id);

    /// Remove and fire the entry for `id`. False if no entry was active.
    bool cancel(const std::string& id);

    /// Remove the entry for `id` if present. Idempotent.
    void end(const std::string& id);

    bool is_active(const std::string& id) const;
    size_t active_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CancelSignal>> active_;
};

/// Launches a unit of work somewhere other than the calling thread.
using Spawner = std::function<void(std::function<void()>)>;

/// Spawner backed by a detached std::thread per task.
Spawner detached_thread_spawner();

/// Run `task` through `spawn` and block until it finishes or `signal`
/// fires. Returns the task's value, or std::nullopt if cancellation won.
/// A task that has finished by the time the waiter wakes always wins,
/// even if the signal fired too. Exceptions from a winning task are
/// rethrown. A losing task keeps running; its result is discarded.
template <typename T>
std::optional<T> run_cancellable(const Spawner& spawn, std::function<T()> task,
                                 CancelSignal& signal) {
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<T> value;
        std::exception_ptr error;
        bool done = false;
        bool cancelled = false;
    };
    auto state = std::make_shared<State>();

    signal.on_fire([state] {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->cancelled = true;
        }
        state->cv.notify_all();
    });

    spawn([state, task = std::move(task)] {
        std::optional<T> value;
        std::exception_ptr error;
        try {
            value.emplace(task());
        } catch (...) {
            error = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->value = std::move(value);
            state->error = error;
            state->done = true;
        }
        state->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait(lock, [&state] { return state->done || state->cancelled; });
    if (!state->done) return std::nullopt;
    if (state->error) std::rethrow_exception(state->error);
    return std::move(state->value);
}

} // namespace mcpkit
