#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>

#include "config.hpp"
#include "context_engine.hpp"
#include "utils.hpp"
#include "workspace.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<context_engine::EditorDocument> document_from_json(const json& j) {
    if (!j.is_object() || !j.contains("path") || !j["path"].is_string()) return std::nullopt;

    context_engine::EditorDocument doc;
    doc.path = j["path"].get<std::string>();
    doc.language = j.value("language", context_engine::language_for_path(doc.path));
    doc.content = j.value("content", "");
    if (j.contains("selection") && j["selection"].is_object()) {
        doc.selection = context_engine::DocumentSelection{
            j["selection"].value("line_start", 0),
            j["selection"].value("line_end", 0)
        };
    }
    return doc;
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

} // namespace

class ContextEngineServer {
public:
    ContextEngineServer(context_engine::EngineConfig config)
        : port_(config.server_port),
          workspace_(std::make_shared<context_engine::FilesystemWorkspace>(
              config.workspace_root, config.indexing.exclude_patterns)) {
        context_engine::EngineDependencies deps;
        deps.workspace = workspace_;
        engine_ = std::make_unique<context_engine::ContextEngine>(std::move(config), deps);
        setup_routes();
    }

    bool start() {
        auto status = engine_->initialize();
        if (!status) {
            spdlog::error("❌ Engine failed to start: {}", status.error().describe());
            return false;
        }
        return true;
    }

    void run() {
        spdlog::info("🚀 Starting context engine server on port {}", port_);
        server_.listen("127.0.0.1", port_);
    }

    // Safe from a signal handler: only unblocks listen().
    void interrupt() { server_.stop(); }

    void stop() {
        server_.stop();
        engine_->shutdown();
    }

private:
    int port_;
    httplib::Server server_;
    std::shared_ptr<context_engine::FilesystemWorkspace> workspace_;
    std::unique_ptr<context_engine::ContextEngine> engine_;

    // Wraps a handler so malformed bodies become 400s and anything else a 500.
    template <typename Handler>
    httplib::Server::Handler guarded(Handler handler) {
        return [handler](const httplib::Request& req, httplib::Response& res) {
            try {
                handler(req, res);
            } catch (const json::exception& e) {
                reply_error(res, 400, std::string("Invalid JSON: ") + e.what());
            } catch (const std::exception& e) {
                spdlog::error("❌ {} {} failed: {}", req.method, req.path, e.what());
                reply_error(res, 500, e.what());
            }
        };
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/health", guarded([this](const httplib::Request&, httplib::Response& res) {
            auto store = engine_->store();
            json response = {
                {"status", engine_->is_initialized() ? "ok" : "degraded"},
                {"workspace", workspace_->root().generic_string()},
                {"indexed_files", store->count_context_items()},
                {"code_entities", store->count_code_entities()},
                {"vectors", store->vector_ids().size()},
                {"pending", engine_->indexing()->pending_count()}
            };
            res.set_content(response.dump(), "application/json");
        }));

        server_.Post("/editor/state", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto body = json::parse(req.body);

            auto active = body.contains("active") ? document_from_json(body["active"]) : std::nullopt;
            std::vector<context_engine::EditorDocument> open;
            if (body.contains("open") && body["open"].is_array()) {
                for (const auto& item : body["open"]) {
                    if (auto doc = document_from_json(item)) open.push_back(std::move(*doc));
                }
            }

            std::string active_path = active ? active->path : "";
            workspace_->set_active_document(std::move(active));
            workspace_->set_open_documents(std::move(open));
            if (!active_path.empty()) engine_->on_active_file_changed(active_path);

            res.set_content(json{{"status", "ok"}}.dump(), "application/json");
        }));

        server_.Post("/events/file", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto body = json::parse(req.body);
            std::string path = body.value("path", "");
            std::string kind = body.value("kind", "changed");
            if (path.empty()) return reply_error(res, 400, "Missing path");

            spdlog::debug("File event {} {}", kind, path);
            if (kind == "deleted") {
                engine_->on_file_deleted(path);
            } else if (kind == "active") {
                engine_->on_active_file_changed(path);
            } else if (kind == "changed" || kind == "created") {
                engine_->on_file_changed(path);
            } else {
                return reply_error(res, 400, "Unknown event kind: " + kind);
            }
            res.set_content(json{{"status", "queued"}}.dump(), "application/json");
        }));

        server_.Post("/index/workspace", guarded([this](const httplib::Request&, httplib::Response& res) {
            engine_->reindex_workspace();
            res.status = 202;
            res.set_content(json{{"status", "started"}}.dump(), "application/json");
        }));

        server_.Post("/context", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto body = json::parse(req.body);
            auto request = context_engine::context_request_from_json(body);
            auto result = engine_->assemble_context(request);
            res.set_content(result.to_json().dump(), "application/json");
        }));

        server_.Post("/conversations/:id/messages", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto id = req.path_params.at("id");
            auto body = json::parse(req.body);
            std::string content = body.value("content", "");
            if (content.empty()) return reply_error(res, 400, "Missing content");

            auto role = context_engine::parse_role(body.value("role", "user"));
            auto message_id = engine_->add_message(id, role, content);
            res.set_content(json{{"message_id", message_id}}.dump(), "application/json");
        }));

        server_.Get("/conversations/:id", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto conversation = engine_->get_conversation(req.path_params.at("id"));
            if (!conversation) return reply_error(res, 404, "Conversation not found");
            res.set_content(conversation->to_json().dump(), "application/json");
        }));

        server_.Post("/conversations/:id/context", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto body = req.body.empty() ? json::object() : json::parse(req.body);
            auto text = engine_->get_conversation_context(req.path_params.at("id"),
                                                          body.value("query", ""),
                                                          body.value("max_tokens", 2000));
            res.set_content(json{{"context", text}}.dump(), "application/json");
        }));

        server_.Post("/patterns", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto body = json::parse(req.body);
            auto examples = body.value("examples", std::vector<std::string>{});
            bool saved = engine_->track_usage_pattern(body.value("type", ""), body.value("pattern", ""), examples);
            if (!saved) return reply_error(res, 400, "Pattern not recorded");
            res.set_content(json{{"status", "ok"}}.dump(), "application/json");
        }));

        server_.Post("/memory/options", guarded([this](const httplib::Request& req, httplib::Response& res) {
            auto body = json::parse(req.body);
            auto options = context_engine::memory_options_from_json(body, engine_->config().memory);
            engine_->update_memory_options(options);
            res.set_content(context_engine::memory_options_to_json(options).dump(), "application/json");
        }));
    }
};

namespace {
std::atomic<ContextEngineServer*> g_server{nullptr};

void handle_signal(int) {
    if (auto* server = g_server.load()) server->interrupt();
}
} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_path = argc > 1 ? argv[1] : "context-engine.json";
    auto config = context_engine::load_engine_config(config_path);
    if (argc > 2) config.workspace_root = argv[2];

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    ContextEngineServer server(std::move(config));
    if (!server.start()) return 1;

    g_server = &server;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    server.run();
    server.stop();
    g_server = nullptr;
    return 0;
}
