#include <grpcpp/grpcpp.h>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "context_sync.grpc.pb.h"
#include "code_context/KeyManager.hpp"
#include "code_context/LogManager.hpp"
#include "code_context/config.hpp"
#include "code_context/logging.hpp"
#include "code_context/model/gemini_model.hpp"
#include "code_context/session/server_session.hpp"
#include "code_context/transport/grpc_transport.hpp"

using namespace code_context;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true);
}

class ContextSyncServiceImpl final : public rpc::ContextSync::Service {
public:
    ContextSyncServiceImpl(std::shared_ptr<ModelBackend> model, std::shared_ptr<LogManager> journal,
                           ServerSessionOptions options, std::shared_ptr<spdlog::logger> log)
        : model_(std::move(model)), journal_(std::move(journal)), options_(std::move(options)), log_(std::move(log)) {}

    grpc::Status Converse(grpc::ServerContext* context,
                          grpc::ServerReaderWriter<rpc::Frame, rpc::Frame>* stream) override {
        log_->info("📡 Stream from {}", context->peer());
        GrpcServerTransport transport(stream);
        ServerSession session(transport, *model_, journal_, options_, log_);
        CloseCode ended = session.run();
        log_->info("📴 Stream from {} ended: {}", context->peer(), to_string(ended));
        return grpc::Status::OK;
    }

    grpc::Status Ping(grpc::ServerContext*, const rpc::PingRequest*, rpc::PingReply* reply) override {
        reply->set_payload("pong");
        return grpc::Status::OK;
    }

private:
    std::shared_ptr<ModelBackend> model_;
    std::shared_ptr<LogManager> journal_;
    ServerSessionOptions options_;
    std::shared_ptr<spdlog::logger> log_;
};

// GET /ping and GET /api/admin/interactions
class HealthServer {
public:
    HealthServer(int port, std::shared_ptr<LogManager> journal, std::shared_ptr<spdlog::logger> log)
        : port_(port), journal_(std::move(journal)), log_(std::move(log)) {
        setup_routes();
    }

    void start() {
        thread_ = std::thread([this]() {
            log_->info("🩺 Health endpoint on port {}", port_);
            if (!server_.listen("0.0.0.0", port_)) {
                log_->error("❌ Health endpoint could not bind port {}", port_);
            }
        });
    }

    void stop() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

private:
    int port_;
    std::shared_ptr<LogManager> journal_;
    std::shared_ptr<spdlog::logger> log_;
    httplib::Server server_;
    std::thread thread_;

    void setup_routes() {
        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/ping", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("pong", "text/plain");
        });

        server_.Get("/api/admin/interactions", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(safe_dump(journal_->get_logs_json()), "application/json");
        });
    }
};

} // namespace

int main() {
    // --- 1. CONFIG & LOGGING ---
    ServerConfig config;
    try {
        config = ServerConfig::load();
    } catch (const ConfigError& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 1;
    }

    std::string level_warning;
    LogSettings settings;
    settings.level = resolve_log_level(config.log_level, config.debug, &level_warning);
    auto log = make_logger("server", settings);
    if (!level_warning.empty()) log->warn("{}", level_warning);

    // --- 2. CORE SERVICES ---
    auto keys = std::make_shared<KeyManager>(log, config.keys_file, config.model);
    if (keys->get_active_key_count() == 0) {
        log->error("❌ No API key available, refusing to start");
        return 1;
    }
    auto model = std::make_shared<GeminiModel>(keys, log);
    auto journal = std::make_shared<LogManager>();

    ServerSessionOptions options;
    options.generate.temperature = config.temperature;
    options.debug_snapshot_path = config.debug_snapshot_path;

    ContextSyncServiceImpl service(model, journal, options, log);

    // --- 3. gRPC ---
    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        log->error("❌ Could not listen on {}", config.listen_address);
        return 1;
    }
    log->info("🚀 ContextSync ignited on {} (model {})", config.listen_address, model->name());

    std::unique_ptr<HealthServer> health;
    if (config.health_port > 0) {
        health = std::make_unique<HealthServer>(config.health_port, journal, log);
        health->start();
    }

    // --- 4. SHUTDOWN ---
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::thread watcher([&]() {
        while (!g_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        log->info("🛑 Shutting down");
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    watcher.join();
    if (health) health->stop();
    return 0;
}
