#include "mcpkit/server.hpp"
#include "mcpkit/codec.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/log.hpp"
#include "mcpkit/method.hpp"
#include "mcpkit/progress.hpp"
#include "mcpkit/subscription.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace mcpkit {

namespace {

/// Removes a request from the registry however the call ends.
class ActiveRequest {
public:
    ActiveRequest(CancellationRegistry& registry, std::string key)
        : registry_(registry), key_(std::move(key)), signal_(registry_.begin(key_)) {}
    ~ActiveRequest() { registry_.end(key_); }

    ActiveRequest(const ActiveRequest&) = delete;
    ActiveRequest& operator=(const ActiveRequest&) = delete;

    CancelSignal& signal() { return *signal_; }

private:
    CancellationRegistry& registry_;
    std::string key_;
    std::shared_ptr<CancelSignal> signal_;
};

const nlohmann::json& require_params(const Request& req) {
    if (!req.params || !req.params->is_object()) {
        throw McpError(ErrorKind::MissingParameters, "params object");
    }
    return *req.params;
}

std::string require_string(const nlohmann::json& params, const char* field) {
    auto it = params.find(field);
    if (it == params.end() || !it->is_string()) {
        throw McpError(ErrorKind::MissingParameters, field);
    }
    return it->get<std::string>();
}

std::optional<std::string> cursor_of(const Request& req) {
    if (!req.params || !req.params->is_object()) return std::nullopt;
    auto it = req.params->find("cursor");
    if (it == req.params->end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

nlohmann::json arguments_of(const nlohmann::json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) return nlohmann::json::object();
    return *it;
}

template <typename T>
nlohmann::json to_value(const T& v) {
    nlohmann::json j;
    to_json(j, v);
    return j;
}

} // anonymous namespace

struct Server::Impl : std::enable_shared_from_this<Server::Impl> {
    std::shared_ptr<Capability> capability;
    Options opts;

    CancellationRegistry cancellations;
    SubscriptionSet subscriptions;
    NotificationQueue notifications;

    // Thread pool
    std::vector<std::thread> thread_pool;
    std::queue<std::function<void()>> task_queue;
    std::mutex pool_mutex;
    std::condition_variable pool_cv;
    std::atomic<bool> pool_running{false};

    Impl(std::shared_ptr<Capability> cap, Options o)
        : capability(std::move(cap)), opts(std::move(o)) {}

    void start_thread_pool() {
        pool_running = true;
        const int n = opts.thread_pool_size > 0 ? opts.thread_pool_size : 1;
        for (int i = 0; i < n; ++i) {
            thread_pool.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(pool_mutex);
                        pool_cv.wait(lock, [this] {
                            return !task_queue.empty() || !pool_running;
                        });
                        if (!pool_running && task_queue.empty()) return;
                        task = std::move(task_queue.front());
                        task_queue.pop();
                    }
                    try {
                        task();
                    } catch (const std::exception& e) {
                        logger()->error("worker task failed: {}", e.what());
                    }
                }
            });
        }
    }

    void stop_thread_pool() {
        pool_running = false;
        pool_cv.notify_all();
        for (auto& t : thread_pool) {
            if (t.joinable()) t.join();
        }
        thread_pool.clear();
    }

    void dispatch_to_pool(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            task_queue.push(std::move(fn));
        }
        pool_cv.notify_one();
    }

    // ---------- Routing ----------

    nlohmann::json route(const Request& req) {
        auto method = method_from_string(req.method);
        if (!method) throw McpError(ErrorKind::MethodNotFound, req.method);
        logger()->debug("dispatching {}", req.method);

        switch (*method) {
        case Method::Initialize:
            return to_value(capability->initialize(opts.capabilities));
        case Method::Ping:
            capability->ping();
            return nlohmann::json::object();
        case Method::ToolsList:
            return page_to_json(capability->list_tools(cursor_of(req)), "tools");
        case Method::ToolsCall:
            return call_tool(req);
        case Method::ResourcesList:
            return page_to_json(capability->list_resources(cursor_of(req)), "resources");
        case Method::ResourcesRead: {
            const auto& params = require_params(req);
            return to_value(capability->read_resource(require_string(params, "uri")));
        }
        case Method::ResourceTemplatesList:
            return page_to_json(capability->list_resource_templates(cursor_of(req)),
                                "resourceTemplates");
        case Method::ResourcesSubscribe: {
            const auto uri = require_string(require_params(req), "uri");
            capability->subscribe(uri);
            subscriptions.add(uri);
            return nlohmann::json::object();
        }
        case Method::ResourcesUnsubscribe: {
            const auto uri = require_string(require_params(req), "uri");
            capability->unsubscribe(uri);
            subscriptions.remove(uri);
            return nlohmann::json::object();
        }
        case Method::PromptsList:
            return page_to_json(capability->list_prompts(cursor_of(req)), "prompts");
        case Method::PromptsGet: {
            const auto& params = require_params(req);
            const auto name = require_string(params, "name");
            return to_value(capability->get_prompt(name, arguments_of(params)));
        }
        case Method::LoggingSetLevel: {
            capability->set_log_level(require_string(require_params(req), "level"));
            return nlohmann::json::object();
        }
        case Method::CompletionComplete:
            return to_value(capability->complete(require_params(req)));
        }
        throw McpError(ErrorKind::MethodNotFound, req.method);
    }

    nlohmann::json call_tool(const Request& req) {
        const auto& params = require_params(req);
        auto name_it = params.find("name");
        if (name_it == params.end() || !name_it->is_string()) {
            throw McpError(ErrorKind::MissingToolName);
        }
        std::string name = name_it->get<std::string>();
        nlohmann::json arguments = arguments_of(params);

        const std::string key = canonical_request_id(*req.id);
        ActiveRequest active(cancellations, key);
        ProgressSender progress(req.progress_token(), notifications.sender());

        auto cap = capability;
        auto outcome = run_cancellable<nlohmann::json>(
            opts.tool_spawner,
            [cap, name = std::move(name), arguments = std::move(arguments), progress] {
                return to_value(cap->call_tool(name, arguments, progress));
            },
            active.signal());
        if (!outcome) throw McpError(ErrorKind::RequestCancelled, key);
        return std::move(*outcome);
    }

    // ---------- Notifications ----------

    void on_notification(const Request& req) {
        if (req.method != CANCELLED_NOTIFICATION) {
            logger()->debug("ignoring notification {}", req.method);
            return;
        }
        if (!req.params || !req.params->is_object()) return;
        const auto& params = *req.params;
        auto rid = params.find("requestId");
        if (rid == params.end() || !(rid->is_string() || rid->is_number_integer())) {
            logger()->debug("cancellation without a usable requestId");
            return;
        }
        std::optional<std::string> reason;
        auto rit = params.find("reason");
        if (rit != params.end() && rit->is_string()) reason = rit->get<std::string>();

        const std::string key = canonical_request_id(*rid);
        if (!cancellations.cancel(key)) {
            logger()->debug("no active request {} to cancel", key);
            return;
        }
        logger()->info("request {} cancelled{}{}", key, reason ? ": " : "", reason.value_or(""));
        try {
            capability->on_request_cancelled(key, reason);
        } catch (const std::exception& e) {
            logger()->warn("on_request_cancelled hook failed for {}: {}", key, e.what());
        }
    }

    // ---------- Entry points ----------

    std::optional<Response> handle(const Request& req) {
        JsonRpcVersion version = JsonRpcVersion::V2;
        try {
            version = detect_version(req);
        } catch (const McpError& e) {
            logger()->warn("{}; answering as 2.0", e.what());
        }

        if (req.is_notification()) {
            on_notification(req);
            return std::nullopt;
        }

        const nlohmann::json& id = *req.id;
        try {
            return Response::success(version, id, route(req));
        } catch (const McpError& e) {
            if (e.kind() == ErrorKind::RequestCancelled) {
                logger()->info("{} {} abandoned after cancellation", req.method, e.detail());
            } else {
                logger()->debug("{} failed: {}", req.method, e.what());
            }
            return Response::failure(version, id, e.to_json_rpc_error());
        } catch (const nlohmann::json::exception& e) {
            logger()->error("{} produced invalid JSON: {}", req.method, e.what());
            return Response::failure(version, id,
                                     McpError(ErrorKind::Serialization, e.what()).to_json_rpc_error());
        } catch (const std::exception& e) {
            logger()->error("{} failed: {}", req.method, e.what());
            return Response::failure(version, id,
                                     McpError(ErrorKind::Internal, e.what()).to_json_rpc_error());
        }
    }

    /// Size check and parse. On failure `rejection` holds the wire reply.
    std::optional<Request> decode(std::string_view raw, std::string& rejection) {
        if (raw.size() > opts.max_message_size) {
            logger()->warn("rejecting {} byte message (limit {})", raw.size(),
                           opts.max_message_size);
            rejection = Codec::serialize(Response::too_large());
            return std::nullopt;
        }
        try {
            return Codec::parse_request(raw);
        } catch (const McpParseError& e) {
            logger()->warn("{}", e.what());
            rejection = Codec::serialize(Response::parse_error());
            return std::nullopt;
        }
    }

    /// Runs a request off the calling thread. A tools/call waits for its tool
    /// on a thread from `tool_spawner`, so it never holds a pool worker.
    void dispatch(Request req, std::function<void(std::optional<Response>)> on_done) {
        auto method = method_from_string(req.method);
        const bool cancellable = method && is_cancellable(*method);
        auto job = [self = shared_from_this(), req = std::move(req),
                    on_done = std::move(on_done)] {
            try {
                auto resp = self->handle(req);
                if (on_done) on_done(std::move(resp));
            } catch (const std::exception& e) {
                logger()->error("completion callback for {} failed: {}", req.method, e.what());
            }
        };
        if (cancellable) {
            opts.tool_spawner(std::move(job));
        } else {
            dispatch_to_pool(std::move(job));
        }
    }
};

Server::Server(std::shared_ptr<Capability> capability, Options opts)
    : impl_(std::make_shared<Impl>(std::move(capability), std::move(opts))) {
    impl_->start_thread_pool();
}

Server::~Server() {
    impl_->stop_thread_pool();
    impl_->notifications.close();
}

std::optional<Response> Server::handle(const Request& req) {
    return impl_->handle(req);
}

void Server::handle_async(Request req, std::function<void(std::optional<Response>)> on_done) {
    // Notifications never wait behind queued requests.
    if (req.is_notification()) {
        auto resp = impl_->handle(req);
        if (on_done) on_done(std::move(resp));
        return;
    }
    impl_->dispatch(std::move(req), std::move(on_done));
}

std::optional<std::string> Server::handle_line(std::string_view raw) {
    std::string rejection;
    auto req = impl_->decode(raw, rejection);
    if (!req) return rejection;
    auto resp = impl_->handle(*req);
    if (!resp) return std::nullopt;
    return Codec::serialize(*resp);
}

void Server::handle_line_async(std::string raw,
                               std::function<void(std::optional<std::string>)> on_done) {
    std::string rejection;
    auto req = impl_->decode(raw, rejection);
    if (!req) {
        if (on_done) on_done(std::move(rejection));
        return;
    }
    if (req->is_notification()) {
        impl_->handle(*req);
        if (on_done) on_done(std::nullopt);
        return;
    }
    impl_->dispatch(std::move(*req), [on_done = std::move(on_done)](std::optional<Response> resp) {
        if (!on_done) return;
        if (!resp) {
            on_done(std::nullopt);
            return;
        }
        on_done(Codec::serialize(*resp));
    });
}

std::optional<NotificationStream> Server::take_notification_stream() {
    return impl_->notifications.take_stream();
}

std::optional<FilteredNotificationStream> Server::progress_stream() {
    auto stream = take_notification_stream();
    if (!stream) return std::nullopt;
    return std::move(*stream).filter_progress();
}

std::optional<FilteredNotificationStream> Server::resource_update_stream() {
    auto stream = take_notification_stream();
    if (!stream) return std::nullopt;
    return std::move(*stream).filter_resource_updates();
}

NotificationSender Server::notification_sender() const {
    return impl_->notifications.sender();
}

bool Server::notify_resource_updated(const std::string& uri) {
    if (!impl_->subscriptions.contains(uri)) return false;
    return impl_->notifications.sender().send(ResourceUpdatedNotification{uri});
}

const ServerCapabilities& Server::capabilities() const {
    return impl_->opts.capabilities;
}

bool Server::is_subscribed(const std::string& uri) const {
    return impl_->subscriptions.contains(uri);
}

bool Server::is_request_active(const nlohmann::json& id) const {
    return impl_->cancellations.is_active(canonical_request_id(id));
}

size_t Server::active_request_count() const {
    return impl_->cancellations.active_count();
}

// ---------- ServerBuilder ----------

ServerBuilder& ServerBuilder::with_tools(const std::vector<Tool>& tools) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& t : tools) list.push_back(to_value(t));
    opts_.capabilities.tools = nlohmann::json{{"tools", std::move(list)}};
    return *this;
}

ServerBuilder& ServerBuilder::with_resources(bool subscribe) {
    opts_.capabilities.resources = nlohmann::json{{"subscribe", subscribe}};
    return *this;
}

ServerBuilder& ServerBuilder::with_prompts() {
    opts_.capabilities.prompts = nlohmann::json::object();
    return *this;
}

ServerBuilder& ServerBuilder::with_completions() {
    opts_.capabilities.completions = nlohmann::json::object();
    return *this;
}

ServerBuilder& ServerBuilder::with_logging() {
    opts_.capabilities.logging = nlohmann::json::object();
    return *this;
}

ServerBuilder& ServerBuilder::with_thread_pool_size(int n) {
    opts_.thread_pool_size = n;
    return *this;
}

ServerBuilder& ServerBuilder::with_max_message_size(size_t n) {
    opts_.max_message_size = n;
    return *this;
}

ServerBuilder& ServerBuilder::with_tool_spawner(Spawner spawner) {
    opts_.tool_spawner = std::move(spawner);
    return *this;
}

std::unique_ptr<Server> ServerBuilder::build(std::shared_ptr<Capability> capability) const {
    return std::make_unique<Server>(std::move(capability), opts_);
}

} // namespace mcpkit
