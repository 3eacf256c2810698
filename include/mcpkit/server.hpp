#pragma once
#include "capability.hpp"
#include "cancellation.hpp"
#include "json_rpc.hpp"
#include "notification.hpp"
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpkit {

/// Protocol dispatcher. Turns inbound requests into calls on a Capability
/// and shapes the outcome as a version-appropriate Response.
///
/// All public methods are thread-safe. The server never touches a
/// transport; the embedding program feeds it requests or raw lines and
/// writes back whatever it returns.
class Server {
public:
    struct Options {
        ServerCapabilities capabilities;
        int thread_pool_size = 4;
        size_t max_message_size = 4 * 1024 * 1024;
        /// Where tools/call bodies run. They must not run on the waiting
        /// thread, otherwise cancellation cannot interrupt the wait.
        Spawner tool_spawner = detached_thread_spawner();
    };

    Server(std::shared_ptr<Capability> capability, Options opts);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Process one request on the calling thread. Returns std::nullopt for
    /// notifications; otherwise exactly one Response echoing the request id.
    std::optional<Response> handle(const Request& req);

    /// Process `req` off the calling thread and pass the outcome to `on_done`.
    /// Notifications run inline. tools/call waits on a `tool_spawner` thread;
    /// everything else goes to the worker pool.
    void handle_async(Request req, std::function<void(std::optional<Response>)> on_done);

    /// Decode and process one raw line. Oversized or malformed input yields
    /// a serialized error response instead of an exception.
    std::optional<std::string> handle_line(std::string_view raw);

    /// handle_line() with the scheduling of handle_async(). Rejected lines and
    /// notifications complete before this returns.
    void handle_line_async(std::string raw,
                           std::function<void(std::optional<std::string>)> on_done);

    // ---------- Notifications ----------

    /// The single consumer of this server's notifications. Available once.
    std::optional<NotificationStream> take_notification_stream();
    std::optional<FilteredNotificationStream> progress_stream();
    std::optional<FilteredNotificationStream> resource_update_stream();

    NotificationSender notification_sender() const;

    /// Enqueue notifications/resources/updated if `uri` is subscribed.
    /// Returns true if a notification was enqueued.
    bool notify_resource_updated(const std::string& uri);

    // ---------- Introspection ----------

    const ServerCapabilities& capabilities() const;
    bool is_subscribed(const std::string& uri) const;
    bool is_request_active(const nlohmann::json& id) const;
    size_t active_request_count() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

/// Fluent construction of Server::Options.
class ServerBuilder {
public:
    /// Declare tools; the descriptors are advertised under capabilities.tools.
    ServerBuilder& with_tools(const std::vector<Tool>& tools);
    ServerBuilder& with_resources(bool subscribe = true);
    ServerBuilder& with_prompts();
    ServerBuilder& with_completions();
    ServerBuilder& with_logging();
    ServerBuilder& with_thread_pool_size(int n);
    ServerBuilder& with_max_message_size(size_t n);
    ServerBuilder& with_tool_spawner(Spawner spawner);

    const Server::Options& options() const { return opts_; }

    std::unique_ptr<Server> build(std::shared_ptr<Capability> capability) const;

private:
    Server::Options opts_;
};

} // namespace mcpkit
