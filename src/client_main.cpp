#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>

#include "code_context/config.hpp"
#include "code_context/logging.hpp"
#include "code_context/session/client_session.hpp"
#include "code_context/snapshot/snapshot_builder.hpp"
#include "code_context/tools/workspace_reader.hpp"
#include "code_context/transport/grpc_transport.hpp"

namespace fs = std::filesystem;
using namespace code_context;

namespace {

std::atomic<ClientSession*> g_session{nullptr};

void on_signal(int) {
    if (ClientSession* session = g_session.load()) {
        session->request_close();
    }
}

std::string read_task_prompt() {
    std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    auto last = text.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) return "";
    return text.substr(0, last + 1);
}

void print_results(const SessionSummary& summary) {
    for (const auto& result : summary.work) {
        if (result.outcome != StageOutcome::Ok || !result.patch) continue;
        std::cout << "# " << result.patch->path << ": " << result.patch->summary << "\n";
        std::cout << result.patch->patch;
        if (!result.patch->patch.empty() && result.patch->patch.back() != '\n') std::cout << "\n";
    }
    std::cout.flush();
}

} // namespace

int main() {
    const fs::path root = fs::current_path();

    // --- 1. CONFIG & LOGGING ---
    ClientConfig config;
    std::string skipped_config;
    try {
        config = ClientConfig::load(root, &skipped_config);
    } catch (const ConfigError& e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 1;
    }

    std::string level_warning;
    LogSettings settings;
    settings.level = resolve_log_level(config.log_level, config.debug, &level_warning);
    auto log = make_logger("client", settings);
    if (!level_warning.empty()) log->warn("{}", level_warning);
    if (!skipped_config.empty()) log->debug("Ignoring project config.json: {}", skipped_config);

    const std::string client_id = config.client_id.empty() ? default_client_id() : config.client_id;

    // --- 2. SNAPSHOT ---
    IgnoreMatcher matcher = IgnoreMatcher::load(root / config.ignore_file, log);
    if (config.include_default_excludes) {
        matcher.add_patterns(default_excludes());
    }

    CodebaseContext context;
    try {
        SnapshotBuilder builder(std::move(matcher), SnapshotOptions{config.max_file_bytes}, log);
        context = builder.build_context(root);
    } catch (const SnapshotError& e) {
        log->error("❌ {}", e.what());
        return 1;
    }

    std::string task = read_task_prompt();
    if (task.empty()) {
        log->error("❌ No task prompt on stdin");
        return 1;
    }

    // --- 3. CONNECT ---
    auto channel = grpc::CreateChannel(config.server_address, grpc::InsecureChannelCredentials());
    if (!GrpcClientTransport::ping(channel, std::chrono::seconds(5))) {
        log->error("❌ Server at {} is not reachable", config.server_address);
        return 1;
    }
    log->info("🛰️ Connected to {} as {}", config.server_address, client_id);

    // --- 4. CONVERSATION ---
    SessionSummary summary;
    try {
        GrpcClientTransport transport(channel);
        WorkspaceReader reader(root, log);
        ClientSession session(client_id, std::move(context), transport, reader, log);

        g_session.store(&session);
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        summary = session.run(task);

        g_session.store(nullptr);
    } catch (const TransportError& e) {
        g_session.store(nullptr);
        log->error("❌ {}", e.what());
        return 1;
    }

    print_results(summary);

    size_t ok = 0;
    for (const auto& r : summary.work) {
        if (r.outcome == StageOutcome::Ok) ok++;
        else log->warn("{} {}: {}", to_string(r.outcome), r.file.path, r.error);
    }
    log->info("🏁 {} of {} files patched", ok, summary.plan.files.size());

    return exit_code_for(summary.close_code.value_or(CloseCode::AbnormalClosure));
}
