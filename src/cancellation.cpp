#include "mcpkit/cancellation.hpp"
#include <thread>

namespace mcpkit {

std::string canonical_request_id(const nlohmann::json& id) {
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) {
        return id.is_number_unsigned() ? std::to_string(id.get<uint64_t>())
                                       : std::to_string(id.get<int64_t>());
    }
    return id.dump();
}

// ---------- CancelSignal ----------

bool CancelSignal::fire() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fired_) return false;
        fired_ = true;
        callbacks.swap(callbacks_);
    }
    for (auto& cb : callbacks) cb();
    return true;
}

bool CancelSignal::fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

void CancelSignal::on_fire(std::function<void()> cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fired_) {
            callbacks_.push_back(std::move(cb));
            return;
        }
    }
    cb();
}

// ---------- CancellationRegistry ----------

std::shared_ptr<CancelSignal> CancellationRegistry::begin(const std::string& id) {
    auto signal = std::make_shared<CancelSignal>();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    active_[id] = signal;
    return signal;
}

bool CancellationRegistry::cancel(const std::string& id) {
    std::shared_ptr<CancelSignal> signal;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = active_.find(id);
        if (it == active_.end()) return false;
        signal = std::move(it->second);
        active_.erase(it);
    }
    signal->fire();
    return true;
}

void CancellationRegistry::end(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    active_.erase(id);
}

bool CancellationRegistry::is_active(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return active_.count(id) > 0;
}

size_t CancellationRegistry::active_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return active_.size();
}

Spawner detached_thread_spawner() {
    return [](std::function<void()> fn) {
        std::thread(std::move(fn)).detach();
    };
}

} // namespace mcpkit
