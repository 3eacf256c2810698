/// Echo server: minimal MCP server over stdio (newline-delimited JSON-RPC).
/// Usage: ./echo_server
/// Diagnostics go to stderr; stdout carries only protocol lines.

#include <mcpkit/mcpkit.hpp>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

namespace {

std::mutex g_out_mutex;

void write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << line << '\n' << std::flush;
}

class EchoCapability : public mcpkit::Capability {
public:
    static std::vector<mcpkit::Tool> tools() {
        mcpkit::Tool echo;
        echo.name = "echo";
        echo.description = "Echo the input text back to the caller";
        echo.input_schema.properties["text"] = {{"type", "string"},
                                                {"description", "The text to echo"}};
        echo.input_schema.required = {"text"};

        mcpkit::Tool count;
        count.name = "count";
        count.description = "Count to n, reporting progress along the way";
        count.input_schema.properties["n"] = {{"type", "integer"}, {"minimum", 1}};
        count.annotations = mcpkit::ToolAnnotations{true, true};
        return {echo, count};
    }

    mcpkit::InitializeResult initialize(const mcpkit::ServerCapabilities& declared) override {
        mcpkit::InitializeResult r;
        r.protocol_version = std::string(mcpkit::PROTOCOL_VERSION);
        r.server_info = {"echo-server", std::string(mcpkit::LIBRARY_VERSION), std::nullopt};
        r.capabilities = declared;
        r.instructions = "A simple echo server that returns whatever you send it.";
        return r;
    }

    mcpkit::Page<mcpkit::Tool> list_tools(const std::optional<std::string>&) override {
        return {tools(), std::nullopt};
    }

    mcpkit::CallToolResult call_tool(const std::string& name, const nlohmann::json& arguments,
                                     const mcpkit::ProgressSender& progress) override {
        mcpkit::CallToolResult result;
        if (name == "echo") {
            auto it = arguments.find("text");
            if (it == arguments.end() || !it->is_string()) {
                result.content.push_back(mcpkit::TextContent{"'text' must be a string"});
                result.is_error = true;
                return result;
            }
            result.content.push_back(mcpkit::TextContent{it->get<std::string>()});
            return result;
        }
        if (name == "count") {
            const int64_t n = arguments.value("n", int64_t{10});
            for (int64_t i = 1; i <= n; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                progress.send(static_cast<double>(i) / static_cast<double>(n),
                              "step " + std::to_string(i), static_cast<uint64_t>(n));
            }
            result.content.push_back(mcpkit::TextContent{"counted to " + std::to_string(n)});
            return result;
        }
        throw mcpkit::McpError(mcpkit::ErrorKind::UnknownTool, name);
    }

    mcpkit::Page<mcpkit::Resource> list_resources(const std::optional<std::string>&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        mcpkit::Page<mcpkit::Resource> page;
        for (const auto& [uri, text] : memos_) {
            mcpkit::Resource r;
            r.uri = uri;
            r.name = uri.substr(7);
            r.mime_type = "text/plain";
            r.size = text.size();
            page.items.push_back(std::move(r));
        }
        return page;
    }

    mcpkit::ReadResourceResult read_resource(const std::string& uri) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memos_.find(uri);
        if (it == memos_.end()) throw mcpkit::McpError(mcpkit::ErrorKind::ResourceNotFound, uri);
        mcpkit::ReadResourceResult r;
        r.contents.push_back(mcpkit::TextResourceContents{uri, std::string("text/plain"), it->second});
        return r;
    }

    mcpkit::Page<mcpkit::ResourceTemplate> list_resource_templates(
        const std::optional<std::string>&) override {
        mcpkit::ResourceTemplate t;
        t.uri_template = "memo://{name}";
        t.name = "memo";
        t.description = "A note kept in memory";
        return {{t}, std::nullopt};
    }

    void subscribe(const std::string& uri) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!memos_.count(uri)) throw mcpkit::McpError(mcpkit::ErrorKind::UnknownResource, uri);
    }

    void unsubscribe(const std::string&) override {}

    mcpkit::Page<mcpkit::Prompt> list_prompts(const std::optional<std::string>&) override {
        mcpkit::Prompt hello;
        hello.name = "hello";
        hello.description = "Say hello to someone";
        hello.arguments = std::vector<mcpkit::PromptArgument>{
            {"name", std::nullopt, std::string("Who to greet"), false}};
        return {{hello}, std::nullopt};
    }

    mcpkit::GetPromptResult get_prompt(const std::string& name,
                                       const nlohmann::json& arguments) override {
        if (name != "hello") throw mcpkit::McpError(mcpkit::ErrorKind::UnknownPrompt, name);
        mcpkit::GetPromptResult r;
        r.messages.push_back({"user", mcpkit::TextContent{
            "Please say hello to " + arguments.value("name", std::string("the world")) + "."}});
        return r;
    }

    void set_log_level(const std::string& level) override {
        const auto parsed = spdlog::level::from_str(level);
        mcpkit::set_log_level(parsed == spdlog::level::off ? spdlog::level::info : parsed);
    }

    mcpkit::CompletionResult complete(const nlohmann::json&) override {
        mcpkit::CompletionResult r;
        r.values = {"world", "friend"};
        r.has_more = false;
        return r;
    }

    void on_request_cancelled(const std::string& request_id,
                              const std::optional<std::string>& reason) override {
        mcpkit::logger()->info("client cancelled {} ({})", request_id, reason.value_or("no reason"));
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::string> memos_{{"memo://welcome", "Hello from echo-server."}};
};

} // namespace

int main() {
    auto server = mcpkit::ServerBuilder()
        .with_tools(EchoCapability::tools())
        .with_resources(true)
        .with_prompts()
        .with_completions()
        .with_logging()
        .build(std::make_shared<EchoCapability>());

    auto stream = server->take_notification_stream();
    std::thread drain([s = std::move(*stream)]() mutable {
        while (auto n = s.next()) write_line(mcpkit::Codec::serialize(*n));
    });

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        server->handle_line_async(line, [](std::optional<std::string> out) {
            if (out) write_line(*out);
        });
    }

    // Destroying the server drains queued requests and closes the queue.
    server.reset();
    drain.join();
    return 0;
}
