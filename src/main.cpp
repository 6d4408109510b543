#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "index_service.hpp"
#include "LogManager.hpp"

using json = nlohmann::json;

class CodeScopeServer {
public:
    explicit CodeScopeServer(codescope::EngineConfig config)
        : host_(config.host),
          port_(config.port),
          server_(),
          service_(std::make_unique<codescope::IndexService>(std::move(config)))
    {
        setup_routes();
    }

    void run() {
        spdlog::info("🚀 Starting codescope on {}:{}", host_, port_);
        if (!server_.listen(host_.c_str(), port_)) {
            spdlog::error("❌ Could not bind {}:{}", host_, port_);
        }
    }

private:
    std::string host_;
    int port_;
    httplib::Server server_;
    std::unique_ptr<codescope::IndexService> service_;

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

        server_.Get("/api/code-search/status", [this](const httplib::Request&, httplib::Response& res) {
            reply(res, service_->status_json());
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"engine", service_->status_json()},
                {"logs", codescope::LogManager::instance().get_logs_json()}
            };
            reply(res, response);
        });

        server_.Post("/api/code-search/index", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "indexing codebase", [this](const json& body) {
                codescope::IndexRequest request;
                request.root = get_string(body, "project_path", "root");
                request.extensions = get_json_list(body, "file_extensions", "extensions");
                request.exclude_dirs = get_json_list(body, "exclude_dirs", "excludeDirs");
                request.time_budget_ms = body.value("time_budget_ms", -1LL);
                return service_->index_codebase(request).to_json();
            });
        });

        server_.Post("/api/code-search/reindex-file", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "re-indexing file", [this](const json& body) {
                return service_->reindex_file(body.at("file_path").get<std::string>()).to_json();
            });
        });

        server_.Post("/api/code-search/semantic", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "semantic search", [this](const json& body) {
                std::string query = body.value("query", "");
                std::string scope = get_string(body, "project_path", "scope");
                size_t max_results = body.value("max_results", static_cast<size_t>(20));
                return service_->semantic_search(query, scope, max_results).to_json();
            });
        });

        server_.Post("/api/code-search/similar-patterns", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "finding similar patterns", [this](const json& body) {
                std::string snippet = body.value("code_snippet", "");
                std::string language = body.value("language", "python");
                double threshold = body.value("threshold", 0.7);
                return service_->find_similar_patterns(snippet, language, threshold).to_json();
            });
        });

        server_.Post("/api/code-search/dependencies", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "analyzing dependencies", [this](const json& body) {
                return service_->analyze_dependencies(body.value("symbol_name", ""),
                                                      get_string(body, "file_path", "")).to_json();
            });
        });

        server_.Post("/api/code-search/impact-analysis", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "impact analysis", [this](const json& body) {
                return service_->impact_analysis(body.value("symbol_name", ""),
                                                 get_string(body, "file_path", "")).to_json();
            });
        });

        server_.Post("/api/code-search/dead-code", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "detecting dead code", [this](const json& body) {
                return service_->detect_dead_code(get_string(body, "project_path", "scope")).to_json();
            });
        });

        server_.Post("/api/code-search/find-definition", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "finding definition", [this](const json& body) {
                return service_->find_definition(body.value("symbol_name", "")).to_json();
            });
        });

        server_.Post("/api/code-search/find-references", [this](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, "finding references", [this](const json& body) {
                return service_->find_references(body.value("symbol_name", "")).to_json();
            });
        });
    }

    template <typename Fn>
    void handle(const httplib::Request& req, httplib::Response& res, const char* what, Fn&& fn) {
        try {
            auto body = req.body.empty() ? json::object() : json::parse(req.body);
            reply(res, fn(body));
        } catch (const std::exception& e) {
            spdlog::error("❌ Error {}: {}", what, e.what());
            res.status = 500;
            res.set_content(json{{"success", false}, {"error", e.what()}}.dump(), "application/json");
        }
    }

    static void reply(httplib::Response& res, const json& body) {
        res.set_content(body.dump(), "application/json");
    }

    // Accepts either spelling of a key; null counts as absent
    static std::string get_string(const json& body, const std::string& key1, const std::string& key2) {
        if (body.contains(key1) && !body[key1].is_null()) return body[key1].get<std::string>();
        if (!key2.empty() && body.contains(key2) && !body[key2].is_null()) return body[key2].get<std::string>();
        return "";
    }

    static std::vector<std::string> get_json_list(const json& body, const std::string& key1, const std::string& key2) {
        if (body.contains(key1) && !body[key1].is_null()) return body[key1].get<std::vector<std::string>>();
        if (body.contains(key2) && !body[key2].is_null()) return body[key2].get<std::vector<std::string>>();
        return {};
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto config = codescope::EngineConfig::load(argc > 1 ? argv[1] : "");
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    CodeScopeServer server(std::move(config));
    server.run();
    return 0;
}
