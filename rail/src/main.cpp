#include "config.hpp"
#include "http_client.hpp"
#include "json_rpc.hpp"
#include "endpoint_probe.hpp"
#include "config_store.hpp"
#include "endpoint_pool.hpp"
#include "failover_executor.hpp"
#include "registry_cache.hpp"
#include "chain_reader.hpp"
#include "health.hpp"
#include "util.hpp"
#include "logging.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument:
            return 400;
        case ErrorKind::NoRpcConfigured:
            return 404;
        case ErrorKind::NoPrimaryConfigured:
        case ErrorKind::NoBackupsAvailable:
        case ErrorKind::PoolFull:
        case ErrorKind::DuplicateEndpoint:
        case ErrorKind::UnknownEndpoint:
            return 409;
        case ErrorKind::RegistryUnavailable:
            return 503;
        default:
            return 502;
    }
}

void reply_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void reply_error(httplib::Response& res, const RailError& err) {
    nlohmann::json body = {
        {"ok", false},
        {"error", to_string(err.kind)},
        {"code", error_code(err.kind)},
        {"message", err.message}
    };

    if (!err.attempts.empty()) {
        nlohmann::json attempts = nlohmann::json::array();
        for (const auto& a : err.attempts) {
            attempts.push_back({
                {"url", util::mask_url(a.url)},
                {"error", to_string(a.kind)},
                {"message", a.message}
            });
        }
        body["attempts"] = attempts;
    }

    reply_json(res, http_status_for(err.kind), body);
}

nlohmann::json pool_to_json(const EndpointPool& pool) {
    auto endpoint_json = [](const Endpoint& e) {
        nlohmann::json j = {{"url", util::mask_url(e.url)}, {"status", to_string(e.last_status)}};
        j["latency_ms"] = e.last_latency_ms ? nlohmann::json(*e.last_latency_ms) : nlohmann::json(nullptr);
        return j;
    };

    nlohmann::json backups = nlohmann::json::array();
    for (const auto& b : pool.backups) {
        backups.push_back(endpoint_json(b));
    }
    return nlohmann::json{{"primary", endpoint_json(pool.primary)}, {"backups", backups}};
}

// Chain id from the first regex group, or an InvalidArgument reply
std::optional<ChainId> chain_from(const httplib::Request& req, httplib::Response& res) {
    auto chain_id = util::parse_chain_id(req.matches[1].str());
    if (!chain_id) {
        reply_error(res, make_error(ErrorKind::InvalidArgument, "Chain id must be a positive integer"));
    }
    return chain_id;
}

std::optional<std::string> url_from_body(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = nlohmann::json::parse(req.body);
        if (body.contains("url") && body["url"].is_string()) {
            return body["url"].get<std::string>();
        }
    } catch (const std::exception& e) {
        spdlog::debug("Bad request body: {}", e.what());
    }
    reply_error(res, make_error(ErrorKind::InvalidArgument, "Expected JSON body {\"url\": \"...\"}"));
    return std::nullopt;
}

void register_routes(httplib::Server& server,
                     std::shared_ptr<PoolManager> pools,
                     std::shared_ptr<RegistryCache> registry,
                     std::shared_ptr<ChainReader> reader,
                     std::shared_ptr<HealthCheck> health) {
    server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
        reply_json(res, 200, health->get_status());
    });

    server.Get("/pools", [pools](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = nlohmann::json::object();
        for (const auto& [chain_id, pool] : pools->list()) {
            body[std::to_string(chain_id)] = pool_to_json(pool);
        }
        reply_json(res, 200, {{"ok", true}, {"pools", body}});
    });

    server.Get(R"(/pools/(\d+))", [pools](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto pool = pools->get(*chain_id);
        if (!pool) return reply_error(res, pool.error());
        reply_json(res, 200, {{"ok", true}, {"pool", pool_to_json(pool.value())}});
    });

    server.Post(R"(/pools/(\d+)/primary)", [pools](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;
        auto url = url_from_body(req, res);
        if (!url) return;

        auto latency = pools->set_primary(*chain_id, *url);
        if (!latency) return reply_error(res, latency.error());
        reply_json(res, 200, {{"ok", true}, {"latency_ms", latency.value()}});
    });

    server.Post(R"(/pools/(\d+)/backups)", [pools](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;
        auto url = url_from_body(req, res);
        if (!url) return;

        auto latency = pools->add_backup(*chain_id, *url);
        if (!latency) return reply_error(res, latency.error());
        reply_json(res, 200, {{"ok", true}, {"latency_ms", latency.value()}});
    });

    server.Post(R"(/pools/(\d+)/rotate)", [pools](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto primary = pools->rotate(*chain_id);
        if (!primary) return reply_error(res, primary.error());
        reply_json(res, 200, {{"ok", true}, {"primary", util::mask_url(primary.value())}});
    });

    server.Delete(R"(/pools/(\d+))", [pools](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto removed = pools->remove(*chain_id);
        if (!removed) return reply_error(res, removed.error());
        reply_json(res, 200, {{"ok", true}});
    });

    server.Get(R"(/pools/(\d+)/health)", [health](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto report = health->report(*chain_id);
        if (!report) return reply_error(res, report.error());

        nlohmann::json endpoints = nlohmann::json::array();
        for (const auto& h : report.value()) {
            endpoints.push_back(to_json(h));
        }
        reply_json(res, 200, {{"ok", true}, {"endpoints", endpoints}});
    });

    server.Get(R"(/candidates/(\d+))", [registry](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto ranked = registry->get_ranked_candidates(*chain_id);
        if (!ranked) return reply_error(res, ranked.error());

        nlohmann::json candidates = nlohmann::json::array();
        for (const auto& c : ranked.value()) {
            candidates.push_back({{"url", c.url}, {"latency_ms", c.latency_ms}});
        }
        reply_json(res, 200, {{"ok", true}, {"candidates", candidates}});
    });

    server.Get(R"(/chains/(\d+)/balance/(\w+))", [reader](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto balance = reader->get_native_balance(*chain_id, req.matches[2].str());
        if (!balance) return reply_error(res, balance.error());
        reply_json(res, 200, {{"ok", true}, {"data", to_json(balance.value())}});
    });

    server.Get(R"(/chains/(\d+)/tokens/(\w+))", [reader](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto info = reader->get_token_info(*chain_id, req.matches[2].str());
        if (!info) return reply_error(res, info.error());
        reply_json(res, 200, {{"ok", true}, {"data", to_json(info.value())}});
    });

    server.Get(R"(/chains/(\d+)/tokens/(\w+)/balance/(\w+))", [reader](const httplib::Request& req, httplib::Response& res) {
        auto chain_id = chain_from(req, res);
        if (!chain_id) return;

        auto balance = reader->get_token_balance(*chain_id, req.matches[2].str(), req.matches[3].str());
        if (!balance) return reply_error(res, balance.error());
        reply_json(res, 200, {{"ok", true}, {"data", to_json(balance.value())}});
    });
}

int main(int argc, char* argv[]) {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->service_name, config->log_level, config->log_file);

        spdlog::info("==============================================");
        spdlog::info("RAIL RPC Endpoint Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Initialize components
        auto http = std::make_shared<CurlHttpClient>();
        auto rpc = std::make_shared<JsonRpcClient>(http);
        auto probe = std::make_shared<EndpointProbe>(rpc, config->probe_state_read);
        auto store = std::make_shared<JsonFileConfigStore>(config->config_path);
        auto pools = std::make_shared<PoolManager>(store, probe, config->probe_timeout_ms);
        auto executor = std::make_shared<FailoverExecutor>(pools, config->call_timeout_ms);
        auto registry = std::make_shared<RegistryCache>(http, probe, config->registry_settings());
        auto reader = std::make_shared<ChainReader>(executor, rpc);
        auto health = std::make_shared<HealthCheck>(pools, probe, config->probe_timeout_ms);

        pools->load();

        httplib::Server server;
        register_routes(server, pools, registry, reader, health);

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            if (!server.listen(config->listen_addr.c_str(), config->listen_port)) {
                spdlog::error("HTTP server failed to listen on {}:{}", config->listen_addr, config->listen_port);
                shutdown_requested = true;
            }
        });

        spdlog::info("RPC endpoint service started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        http->cancel_all();
        server.stop();

        if (http_thread.joinable()) http_thread.join();

        spdlog::info("Shutdown complete");
        curl_global_cleanup();
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        curl_global_cleanup();
        return 1;
    }
}
