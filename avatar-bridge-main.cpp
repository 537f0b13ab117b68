#include "avatar-client.h"
#include "database.h"
#include "llm-client.h"
#include "pipeline-orchestrator.h"
#include "room-coordinator.h"
#include "simple-http-api.h"
#include "stream-session-registry.h"
#include "stt-client.h"
#include "tts-client.h"
#include "ws-transport.h"

#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>
#include <vector>
#include <utility>

static std::atomic<bool> g_shutdown(false);

struct BridgeArgs {
    int port               = 9000;
    std::string db_path    = "avatar_bridge.db";
    bool verbose           = false;
    bool verify_tls        = true;
    std::string tts_url;   // empty keeps the stored value
    std::string stt_url;
    std::string avatar_url;
    std::string llm_url;
    std::vector<std::pair<std::string, std::string>> config_overrides;
};

static void print_usage(const char* prog) {
    std::cout << "\n🧑‍💻 Avatar Live Bridge\n\n";
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --port N               HTTP port [9000]\n";
    std::cout << "  -d, --database PATH        Database path [avatar_bridge.db]\n";
    std::cout << "  --verbose                  Log every frame and audio chunk\n";
    std::cout << "  --no-verify-ssl            Skip TLS certificate verification\n";
    std::cout << "  --tts-url URL              TTS WebSocket endpoint\n";
    std::cout << "  --stt-url URL              STT WebSocket endpoint\n";
    std::cout << "  --avatar-url URL           Avatar control WebSocket endpoint\n";
    std::cout << "  --llm-url URL              LLM API base URL\n";
    std::cout << "  --set KEY=VALUE            Store a config value (e.g. tts_app_key=...) and continue\n";
    std::cout << "  -h, --help                 Show this help\n";
}

static bool parse_args(int argc, char** argv, BridgeArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return false; }
        else if (arg == "--verbose") { a.verbose = true; }
        else if (arg == "--no-verify-ssl") { a.verify_tls = false; }
        else if (!has_value) { std::cout << "Missing value for " << arg << "\n"; print_usage(argv[0]); return false; }
        else if (arg == "-p" || arg == "--port") { a.port = std::stoi(argv[++i]); }
        else if (arg == "-d" || arg == "--database") { a.db_path = argv[++i]; }
        else if (arg == "--tts-url") { a.tts_url = argv[++i]; }
        else if (arg == "--stt-url") { a.stt_url = argv[++i]; }
        else if (arg == "--avatar-url") { a.avatar_url = argv[++i]; }
        else if (arg == "--llm-url") { a.llm_url = argv[++i]; }
        else if (arg == "--set") {
            std::string kv = argv[++i];
            size_t eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cout << "Expected KEY=VALUE, got: " << kv << "\n";
                return false;
            }
            a.config_overrides.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        }
        else { std::cout << "Unknown arg: " << arg << "\n"; print_usage(argv[0]); return false; }
    }
    return true;
}

static void on_signal(int sig) {
    std::cout << "\n🛑 Signal " << sig << " received" << std::endl;
    g_shutdown.store(true);
}

int main(int argc, char** argv) {
    BridgeArgs a;
    try {
        if (!parse_args(argc, argv, a)) return 1;
    } catch (const std::exception& e) {
        std::cout << "❌ Invalid argument: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);
    signal(SIGPIPE, SIG_IGN);

    Database database;
    if (!database.init(a.db_path)) {
        std::cout << "❌ Failed to open database " << a.db_path << std::endl;
        return 1;
    }
    for (const auto& kv : a.config_overrides) {
        if (!database.set_config(kv.first, kv.second)) {
            std::cout << "❌ Failed to store config " << kv.first << std::endl;
            return 1;
        }
    }
    if (!a.tts_url.empty()) database.set_config("tts_url", a.tts_url);
    if (!a.stt_url.empty()) database.set_config("stt_url", a.stt_url);
    if (!a.avatar_url.empty()) database.set_config("avatar_url", a.avatar_url);
    if (!a.llm_url.empty()) database.set_config("llm_base_url", a.llm_url);

    TtsClientConfig tts_cfg;
    tts_cfg.url = database.get_config("tts_url", tts_cfg.url);
    tts_cfg.app_key = database.get_config("tts_app_key");
    tts_cfg.access_key = database.get_config("tts_access_key");
    tts_cfg.resource_id = database.get_config("tts_resource_id", tts_cfg.resource_id);
    tts_cfg.default_speaker = database.get_config("tts_speaker", tts_cfg.default_speaker);
    tts_cfg.verify_tls = a.verify_tls;
    tts_cfg.verbose = a.verbose;

    SttClientConfig stt_cfg;
    stt_cfg.url = database.get_config("stt_url", stt_cfg.url);
    stt_cfg.app_key = database.get_config("stt_app_key");
    stt_cfg.access_key = database.get_config("stt_access_key");
    stt_cfg.resource_id = database.get_config("stt_resource_id", stt_cfg.resource_id);
    stt_cfg.verify_tls = a.verify_tls;
    stt_cfg.verbose = a.verbose;

    AvatarClientConfig avatar_cfg;
    avatar_cfg.url = database.get_config("avatar_url", avatar_cfg.url);
    avatar_cfg.appid = database.get_config("avatar_appid");
    avatar_cfg.token = database.get_config("avatar_token");
    avatar_cfg.verbose = a.verbose;
    if (!a.verify_tls) {
        for (auto& strategy : avatar_cfg.strategies) strategy.verify_tls = false;
    }

    LlmClientConfig llm_cfg;
    llm_cfg.base_url = database.get_config("llm_base_url");
    llm_cfg.api_key = database.get_config("llm_api_key");
    llm_cfg.verify_tls = a.verify_tls;
    llm_cfg.verbose = a.verbose;

    if (a.verbose) {
        for (const auto& kv : database.get_all_config()) {
            bool secret = kv.first.find("key") != std::string::npos || kv.first.find("token") != std::string::npos;
            std::cout << "🔧 " << kv.first << " = "
                      << (kv.second.empty() ? "(empty)" : secret ? "****" : kv.second) << std::endl;
        }
    }
    if (tts_cfg.app_key.empty() || avatar_cfg.appid.empty() || llm_cfg.base_url.empty()) {
        std::cout << "⚠️ Credentials missing (tts_app_key, avatar_appid or llm_base_url); "
                  << "store them with --set KEY=VALUE" << std::endl;
    }

    // Clients connect lazily: the avatar on join, TTS on first synthesis
    TtsClient tts(tts_cfg, make_beast_transport());
    SttClient stt(stt_cfg, make_beast_transport());
    AvatarClient avatar(avatar_cfg, make_beast_transport());
    std::unique_ptr<LlmClient> llm;
    try {
        llm = std::make_unique<LlmClient>(llm_cfg);
    } catch (const BridgeError& e) {
        std::cout << "❌ LLM client: " << e.what() << " (set llm_base_url with --set or --llm-url)" << std::endl;
        return 1;
    }
    StreamSessionRegistry registry;

    CoordinatorConfig coordinator_cfg;
    RoomCoordinator coordinator(coordinator_cfg, avatar, registry, &tts, &stt, &database);
    PipelineOrchestrator orchestrator(*llm, tts, &avatar, registry, &database, a.verbose);

    SimpleHttpServer server(a.port, coordinator, orchestrator, registry, &database, &stt);
    if (!server.start()) {
        std::cout << "❌ Failed to start HTTP server on port " << a.port << std::endl;
        return 1;
    }

    std::cout << "\n🚀 Avatar bridge listening on port " << a.port << std::endl;
    std::cout << "DB: " << a.db_path << std::endl;
    std::cout << "TTS: " << tts_cfg.url << std::endl;
    std::cout << "Avatar: " << avatar_cfg.url << std::endl;
    if (!a.verify_tls) {
        std::cout << "⚠️ TLS verification disabled" << std::endl;
    }
    std::cout << "Press Ctrl+C to stop." << std::endl;

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    // Streams are cancelled before waiting so their handlers unwind; the clients
    // they use must outlive every handler thread
    server.stop_accepting();
    coordinator.reset();
    server.wait_for_clients();
    std::cout << "✅ Avatar bridge stopped" << std::endl;
    return 0;
}
