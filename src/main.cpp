#include "api_server.hpp"
#include "campaign.hpp"
#include "config.hpp"
#include "control_api.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "gateway_directory.hpp"
#include "http.hpp"
#include "store/sqlite_store.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: wacast [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.wacast/config.json)\n"
              << "  --listen HOST:PORT   Control API address (default: 127.0.0.1:8090)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  EVOLUTION_API_URL    Evolution API base URL\n"
              << "  EVOLUTION_GLOBAL_KEY Evolution API key used when a tenant has none\n"
              << "  WACAST_DB_PATH       SQLite database path\n"
              << "  WACAST_LISTEN        Control API address\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string listen;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    wacast::http_init();
    auto config = config_path.empty() ? wacast::Config::load()
                                      : wacast::Config::load_from(config_path);
    if (!listen.empty()) {
        config.server.listen = listen;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    wacast::http_set_abort_flag(&g_shutdown);

    wacast::SqliteStore store(config.storage_path());
    wacast::CurlHttpClient http_client;
    wacast::StoreGatewayDirectory gateways(store, config.gateway, http_client);

    wacast::EventBus bus;
    // The engine logs start and finish itself; this adds the run's timing.
    wacast::subscribe<wacast::CampaignFinishedEvent>(bus,
        [](const wacast::CampaignFinishedEvent& ev) {
            std::cerr << "[events] Tenant " << ev.tenant_id << " campaign #"
                      << ev.status.generation << " "
                      << wacast::run_summary(ev.status, std::chrono::steady_clock::now())
                      << "\n";
        });

    wacast::CampaignEngine engine(gateways, store,
                                  wacast::EngineOptions::from_config(config));
    engine.set_event_bus(&bus);
    engine.start_dispatcher();

    wacast::ControlApi api(engine, store, gateways, config);
    wacast::ApiServer server(config.server.listen, config.server.max_body,
        [&api](const wacast::ApiRequest& req) { return api.handle(req); });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "[server] " << error << "\n";
        engine.shutdown();
        wacast::http_cleanup();
        return 1;
    }
    std::cerr << "[server] Listening on " << config.server.listen
              << " (store: " << store.backend_name() << " " << config.storage_path() << ")\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    engine.shutdown();
    wacast::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
