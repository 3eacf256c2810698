#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpkit {

// ---------- Outbound notifications ----------

struct ProgressNotification {
    ProgressToken progress_token;
    double progress = 0.0;   // 0.0 .. 1.0
    std::optional<std::string> message;
    std::optional<uint64_t> total;

    bool operator==(const ProgressNotification& o) const {
        return progress_token == o.progress_token && progress == o.progress
               && message == o.message && total == o.total;
    }
};

struct ResourceUpdatedNotification {
    std::string uri;

    bool operator==(const ResourceUpdatedNotification& o) const { return uri == o.uri; }
};

using ServerNotification = std::variant<ProgressNotification, ResourceUpdatedNotification>;

/// "notifications/progress" or "notifications/resources/updated".
std::string notification_method(const ServerNotification& n);

/// Wire shape: {"method": ..., "params": {...}}.
void to_json(nlohmann::json& j, const ServerNotification& n);

inline bool is_progress(const ServerNotification& n) {
    return std::holds_alternative<ProgressNotification>(n);
}

inline bool is_resource_update(const ServerNotification& n) {
    return std::holds_alternative<ResourceUpdatedNotification>(n);
}

// ---------- Queue ----------

namespace detail {

struct NotificationChannel {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<ServerNotification> items;
    bool closed = false;
};

} // namespace detail

/// Producer handle. Cheap to copy; every copy feeds the same queue.
class NotificationSender {
public:
    NotificationSender() = default;
    explicit NotificationSender(std::shared_ptr<detail::NotificationChannel> channel);

    /// Enqueue in FIFO order. Returns false once the queue is closed.
    bool send(ServerNotification n) const;

    bool is_closed() const;

private:
    std::shared_ptr<detail::NotificationChannel> channel_;
};

class FilteredNotificationStream;
class BatchedNotificationStream;

/// The single consumer of a NotificationQueue. Move-only.
class NotificationStream {
public:
    explicit NotificationStream(std::shared_ptr<detail::NotificationChannel> channel);

    NotificationStream(NotificationStream&&) noexcept = default;
    NotificationStream& operator=(NotificationStream&&) noexcept = default;
    NotificationStream(const NotificationStream&) = delete;
    NotificationStream& operator=(const NotificationStream&) = delete;

    /// Block until an item arrives. std::nullopt once closed and drained.
    std::optional<ServerNotification> next();

    std::optional<ServerNotification> try_next();

    /// Wait at most `timeout`. std::nullopt on timeout or when closed and drained.
    std::optional<ServerNotification> next_for(std::chrono::milliseconds timeout);

    /// True once the queue is closed and nothing is left to deliver.
    bool is_finished() const;

    FilteredNotificationStream filter(std::function<bool(const ServerNotification&)> pred) &&;
    FilteredNotificationStream filter_progress() &&;
    FilteredNotificationStream filter_resource_updates() &&;

    /// Group items into batches of at most `max_size`, flushing a partial
    /// batch once `timeout` has passed since its first item.
    BatchedNotificationStream batch_with_timeout(size_t max_size,
                                                 std::chrono::milliseconds timeout) &&;

private:
    friend class BatchedNotificationStream;
    std::optional<ServerNotification> next_until(std::chrono::steady_clock::time_point deadline);

    std::shared_ptr<detail::NotificationChannel> channel_;
};

class FilteredNotificationStream {
public:
    FilteredNotificationStream(NotificationStream inner,
                               std::function<bool(const ServerNotification&)> pred);

    std::optional<ServerNotification> next();

private:
    NotificationStream inner_;
    std::function<bool(const ServerNotification&)> pred_;
};

class BatchedNotificationStream {
public:
    BatchedNotificationStream(NotificationStream inner, size_t max_size,
                              std::chrono::milliseconds timeout);

    /// Next non-empty batch, or std::nullopt once the source is finished.
    std::optional<std::vector<ServerNotification>> next();

private:
    NotificationStream inner_;
    size_t max_size_;
    std::chrono::milliseconds timeout_;
};

/// Unbounded multi-producer, single-consumer queue of server notifications.
/// The consumer side can be taken exactly once.
class NotificationQueue {
public:
    NotificationQueue();
    ~NotificationQueue();

    NotificationQueue(const NotificationQueue&) = delete;
    NotificationQueue& operator=(const NotificationQueue&) = delete;

    NotificationSender sender() const;

    /// Hand out the consumer. std::nullopt after the first call.
    std::optional<NotificationStream> take_stream();

    /// Stop accepting items and wake the consumer. Already queued items
    /// are still delivered.
    void close();

private:
    std::shared_ptr<detail::NotificationChannel> channel_;
    std::mutex take_mutex_;
    bool taken_ = false;
};

} // namespace mcpkit
