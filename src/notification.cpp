#include "mcpkit/notification.hpp"
#include <type_traits>

namespace mcpkit {

std::string notification_method(const ServerNotification& n) {
    return is_progress(n) ? "notifications/progress" : "notifications/resources/updated";
}

void to_json(nlohmann::json& j, const ServerNotification& n) {
    nlohmann::json params = nlohmann::json::object();
    std::visit([&params](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ProgressNotification>) {
            nlohmann::json token;
            to_json(token, v.progress_token);
            params["progressToken"] = token;
            params["progress"] = v.progress;
            if (v.message) params["message"] = *v.message;
            if (v.total) params["total"] = *v.total;
        } else {
            params["uri"] = v.uri;
        }
    }, n);
    j = {{"method", notification_method(n)}, {"params", params}};
}

// ---------- NotificationSender ----------

NotificationSender::NotificationSender(std::shared_ptr<detail::NotificationChannel> channel)
    : channel_(std::move(channel)) {}

bool NotificationSender::send(ServerNotification n) const {
    if (!channel_) return false;
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        if (channel_->closed) return false;
        channel_->items.push_back(std::move(n));
    }
    channel_->cv.notify_one();
    return true;
}

bool NotificationSender::is_closed() const {
    if (!channel_) return true;
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return channel_->closed;
}

// ---------- NotificationStream ----------

NotificationStream::NotificationStream(std::shared_ptr<detail::NotificationChannel> channel)
    : channel_(std::move(channel)) {}

std::optional<ServerNotification> NotificationStream::next() {
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait(lock, [this] { return !channel_->items.empty() || channel_->closed; });
    if (channel_->items.empty()) return std::nullopt;
    ServerNotification n = std::move(channel_->items.front());
    channel_->items.pop_front();
    return n;
}

std::optional<ServerNotification> NotificationStream::try_next() {
    std::lock_guard<std::mutex> lock(channel_->mutex);
    if (channel_->items.empty()) return std::nullopt;
    ServerNotification n = std::move(channel_->items.front());
    channel_->items.pop_front();
    return n;
}

std::optional<ServerNotification> NotificationStream::next_for(std::chrono::milliseconds timeout) {
    return next_until(std::chrono::steady_clock::now() + timeout);
}

std::optional<ServerNotification> NotificationStream::next_until(
    std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->cv.wait_until(lock, deadline, [this] {
        return !channel_->items.empty() || channel_->closed;
    });
    if (channel_->items.empty()) return std::nullopt;
    ServerNotification n = std::move(channel_->items.front());
    channel_->items.pop_front();
    return n;
}

bool NotificationStream::is_finished() const {
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return channel_->closed && channel_->items.empty();
}

FilteredNotificationStream NotificationStream::filter(
    std::function<bool(const ServerNotification&)> pred) && {
    return FilteredNotificationStream(std::move(*this), std::move(pred));
}

FilteredNotificationStream NotificationStream::filter_progress() && {
    return std::move(*this).filter(is_progress);
}

FilteredNotificationStream NotificationStream::filter_resource_updates() && {
    return std::move(*this).filter(is_resource_update);
}

BatchedNotificationStream NotificationStream::batch_with_timeout(
    size_t max_size, std::chrono::milliseconds timeout) && {
    return BatchedNotificationStream(std::move(*this), max_size, timeout);
}

// ---------- Adapters ----------

FilteredNotificationStream::FilteredNotificationStream(
    NotificationStream inner, std::function<bool(const ServerNotification&)> pred)
    : inner_(std::move(inner)), pred_(std::move(pred)) {}

std::optional<ServerNotification> FilteredNotificationStream::next() {
    while (auto n = inner_.next()) {
        if (pred_(*n)) return n;
    }
    return std::nullopt;
}

BatchedNotificationStream::BatchedNotificationStream(NotificationStream inner, size_t max_size,
                                                     std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), max_size_(max_size == 0 ? 1 : max_size), timeout_(timeout) {}

std::optional<std::vector<ServerNotification>> BatchedNotificationStream::next() {
    auto first = inner_.next();
    if (!first) return std::nullopt;

    std::vector<ServerNotification> batch;
    batch.push_back(std::move(*first));
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    while (batch.size() < max_size_) {
        auto n = inner_.next_until(deadline);
        if (!n) break;
        batch.push_back(std::move(*n));
    }
    return batch;
}

// ---------- NotificationQueue ----------

NotificationQueue::NotificationQueue()
    : channel_(std::make_shared<detail::NotificationChannel>()) {}

NotificationQueue::~NotificationQueue() {
    close();
}

NotificationSender NotificationQueue::sender() const {
    return NotificationSender(channel_);
}

std::optional<NotificationStream> NotificationQueue::take_stream() {
    std::lock_guard<std::mutex> lock(take_mutex_);
    if (taken_) return std::nullopt;
    taken_ = true;
    return NotificationStream(channel_);
}

void NotificationQueue::close() {
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        channel_->closed = true;
    }
    channel_->cv.notify_all();
}

} // namespace mcpkit
