#include "config.hpp"
#include "http.hpp"
#include "artifact_store.hpp"
#include "consumer.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "generate_client.hpp"
#include "server/gateway.hpp"
#include "server/http_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <memory>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: docrelay serve [--listen HOST:PORT]\n"
              << "       docrelay generate REPO_URL [options]\n"
              << "\n"
              << "Generate options:\n"
              << "  --server URL         Relay server (default: http://127.0.0.1:8787)\n"
              << "  --doc-type TYPE      Documentation type (default: chosen by the agent)\n"
              << "  --owner ID           Owner identity; results are saved when set\n"
              << "  --no-stream          Wait for the complete result instead of streaming\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  AGENT_URL              Generation agent base URL (default: http://localhost:8000)\n"
              << "  DOCRELAY_LISTEN        Listen address for serve\n"
              << "  DOCRELAY_PROXY_SECRET  Shared secret expected in x-relay-secret\n"
              << "  DOCRELAY_STORE_BACKEND Artifact store backend (sqlite, json)\n"
              << "  DOCRELAY_STORE_PATH    Artifact store path\n";
}

static int run_serve(docrelay::Config& config) {
    std::unique_ptr<docrelay::ArtifactStore> store;
    try {
        store = docrelay::create_artifact_store(config);
    } catch (const std::exception& e) {
        std::cerr << "Error opening artifact store: " << e.what() << "\n";
        return 1;
    }

    docrelay::PlatformHttpClient http_client;
    docrelay::Gateway gateway(config, http_client, store.get(), &g_shutdown);

    docrelay::HttpServer server(
        config.server.listen, config.server.max_body, config.server.max_connections,
        [&gateway](const docrelay::InboundRequest& req, docrelay::ResponseWriter& out) {
            gateway.handle(req, out);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "[server] " << error << "\n";
        return 1;
    }

    std::cerr << "[server] Listening on " << config.server.listen
              << ", agent " << config.upstream.agent_url
              << ", store " << store->backend_name()
              << " (" << store->count() << " artifacts)\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
}

static int run_generate(const docrelay::Config& config, docrelay::GenerateOptions opts) {
    opts.owner_header = config.server.owner_header;
    opts.relay_secret = config.server.proxy_secret;
    opts.timeout_seconds = config.upstream.generate_timeout;

    docrelay::EventBus bus;
    docrelay::subscribe<docrelay::GenerationProgressEvent>(bus,
        [](const docrelay::GenerationProgressEvent& ev) {
            std::cerr << "[" << ev.progress << "%] " << ev.message << "\n";
        });
    docrelay::subscribe<docrelay::GenerationErrorEvent>(bus,
        [](const docrelay::GenerationErrorEvent& ev) {
            std::cerr << "Error: " << ev.error << "\n";
        });
    docrelay::subscribe<docrelay::ArtifactSavedEvent>(bus,
        [](const docrelay::ArtifactSavedEvent& ev) {
            std::cerr << "Saved as " << ev.slug << "\n";
        });

    docrelay::StreamConsumer consumer(&bus);
    docrelay::PlatformHttpClient http_client;
    auto state = docrelay::run_generation(http_client, opts, consumer, &g_shutdown);

    if (state == docrelay::GenerationState::Idle) {
        std::cerr << "Cancelled.\n";
        return 1;
    }
    if (state != docrelay::GenerationState::Completed) return 1;

    if (consumer.has_result()) {
        std::cout << consumer.result().dump(2) << "\n";
    } else {
        std::cerr << "Stream ended without a result.\n";
    }
    return 0;
}

int main(int argc, char* argv[]) try {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string mode = argv[1];
    if (mode == "-h" || mode == "--help") {
        print_usage();
        return 0;
    }
    if (mode != "serve" && mode != "generate") {
        std::cerr << "Unknown command: " << mode << "\n";
        print_usage();
        return 1;
    }

    std::string listen;
    docrelay::GenerateOptions opts;

    for (int i = 2; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (mode == "serve" && std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (mode == "generate" && std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            opts.server_url = argv[++i];
        } else if (mode == "generate" && std::strcmp(argv[i], "--doc-type") == 0 && i + 1 < argc) {
            opts.doc_type = argv[++i];
        } else if (mode == "generate" && std::strcmp(argv[i], "--owner") == 0 && i + 1 < argc) {
            opts.owner = argv[++i];
        } else if (mode == "generate" && std::strcmp(argv[i], "--no-stream") == 0) {
            opts.stream = false;
        } else if (mode == "generate" && argv[i][0] != '-' && opts.repo_url.empty()) {
            opts.repo_url = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (mode == "generate" && opts.repo_url.empty()) {
        std::cerr << "generate requires a REPO_URL\n";
        print_usage();
        return 1;
    }

    // Initialize
    docrelay::http_init();
    auto config = docrelay::Config::load();
    if (!listen.empty()) config.server.listen = listen;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN); // TLS writes to a closed peer
#endif
    docrelay::http_set_abort_flag(&g_shutdown);

    int rc = mode == "serve" ? run_serve(config) : run_generate(config, opts);

    docrelay::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
