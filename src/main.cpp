#include "config.hpp"
#include "connection_hub.hpp"
#include "event_loop.hpp"
#include "frame_relay.hpp"
#include "generation_api.hpp"
#include "generation_orchestrator.hpp"
#include "http.hpp"
#include "prompt_cycle_scheduler.hpp"
#include "prompt_generator.hpp"
#include "rtc_peer_transport.hpp"
#include "signaling_client.hpp"
#include "stream_api.hpp"
#include "stream_server.hpp"
#include "ws_server.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <functional>
#include <iostream>
#include <random>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: genstream [options]\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Address for the HTTP/SSE server (default 0.0.0.0:3001)\n"
              << "  --ws-listen HOST:PORT Address for the WebSocket server (default 0.0.0.0:3002)\n"
              << "  --video-api URL      Base URL of the video generation API\n"
              << "  --seed N             Seed for the thought/prompt generators\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  GET  /health         Liveness and connection count\n"
              << "  GET  /api/status     Stream, relay and signaling state\n"
              << "  POST /api/generate   {\"prompt\": \"...\"} starts a generation\n"
              << "  GET  /api/stream     Server-sent events feed\n"
              << "  WebSocket clients connect to the --ws-listen address\n"
              << "\n"
              << "Environment variables:\n"
              << "  VIDEO_API_BASE       Video generation API base URL\n"
              << "  FRAME_RATE           Target frame rate reported in /api/status\n"
              << "  GENERATION_TIMEOUT   Milliseconds allowed to reach an active stream\n"
              << "  LLM_CYCLE_INTERVAL   Milliseconds between prompt cycles\n"
              << "  PORT                 Listen port\n"
              << "  LISTEN_ADDR          Listen address (host:port)\n"
              << "  WS_LISTEN_ADDR       WebSocket listen address (host:port)\n"
              << "  GENSTREAM_ICE_SERVER ICE server URL for the WebRTC session\n";
}

// Re-arm a timer after each run until the loop stops.
static void every(genstream::EventLoop& loop, genstream::Millis interval,
                  std::function<void()> fn) {
    loop.call_later(interval, [&loop, interval, fn]() {
        fn();
        every(loop, interval, fn);
    });
}

int main(int argc, char* argv[]) try {
    std::string listen;
    std::string ws_listen;
    std::string video_api;
    std::string seed_arg;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (std::strcmp(argv[i], "--ws-listen") == 0 && i + 1 < argc) {
            ws_listen = argv[++i];
        } else if (std::strcmp(argv[i], "--video-api") == 0 && i + 1 < argc) {
            video_api = argv[++i];
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            seed_arg = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    genstream::http_init();
    auto config = genstream::Config::load();

    if (!listen.empty()) config.server.listen = listen;
    if (!ws_listen.empty()) config.server.ws_listen = ws_listen;
    if (!video_api.empty()) config.generation.video_api_base = video_api;
    if (!seed_arg.empty()) {
        try {
            config.cycle.seed = std::stoull(seed_arg);
        } catch (const std::exception&) {
            std::cerr << "Invalid --seed value: " << seed_arg << "\n";
            return 1;
        }
    }
    uint64_t seed = config.cycle.seed;
    if (seed == 0) seed = std::random_device{}();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    genstream::http_set_abort_flag(&g_shutdown);
    genstream::init_rtc_logging();

    // The HTTP client outlives the loop, whose destructor joins the workers
    // still running offloaded requests.
    genstream::PlatformHttpClient http_client;
    genstream::PollEventLoop loop;

    genstream::ConnectionHub hub(config.relay.history_limit);

    genstream::FrameRelayOptions relay_options;
    relay_options.staleness = genstream::Millis(config.relay.staleness_ms);
    relay_options.target_frame_rate = config.relay.frame_rate;
    genstream::FrameRelay relay(loop, hub, relay_options);

    genstream::SignalingClient signaling(loop, http_client,
                                         genstream::make_rtc_transport_factory(loop, config),
                                         config.signaling.handshake_timeout_seconds);

    genstream::GenerationApi api(http_client, config.generation.video_api_base,
                                 config.generation.api_timeout_seconds);

    genstream::OrchestratorOptions orchestrator_options;
    orchestrator_options.timeout = genstream::Millis(config.generation.timeout_ms);
    orchestrator_options.quality = config.generation.quality;
    orchestrator_options.duration = config.generation.duration;
    genstream::GenerationOrchestrator orchestrator(loop, hub, relay, signaling, api,
                                                   orchestrator_options);
    hub.set_snapshot_provider([&orchestrator]() { return orchestrator.snapshot(); });

    genstream::CycleTiming timing;
    timing.initial_delay = genstream::Millis(config.cycle.initial_delay_ms);
    timing.interval = genstream::Millis(config.cycle.interval_ms);
    timing.prompt_delay = genstream::Millis(config.cycle.prompt_delay_ms);
    timing.trigger_delay = genstream::Millis(config.cycle.trigger_delay_ms);
    genstream::PromptCycleScheduler scheduler(
        loop, hub, relay, orchestrator,
        std::make_unique<genstream::ThoughtPatterns>(seed),
        std::make_unique<genstream::TemplatePromptGenerator>(seed + 1),
        timing);

    genstream::StreamApi stream_api(hub, relay, orchestrator, signaling,
                                    config.server.history_replay);
    genstream::StreamServer server(loop, config.server, stream_api.handlers());
    genstream::WsServer ws_server(loop, config.server, stream_api.ws_handlers());

    std::string error;
    if (!server.start(error) || !ws_server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        server.stop();
        genstream::http_cleanup();
        return 1;
    }

    std::cerr << "[main] Video API: " << config.generation.video_api_base << "\n"
              << "[main] Target frame rate: " << config.relay.frame_rate
              << ", cycle interval: " << config.cycle.interval_ms << "ms\n";

    every(loop, genstream::Millis(config.relay.waiting_frame_interval_ms),
          [&relay]() { relay.send_waiting_frame(); });
    every(loop, genstream::Millis(config.generation.status_poll_interval_ms),
          [&orchestrator]() { orchestrator.check_status(); });
    every(loop, genstream::Millis(250), [&loop]() {
        if (g_shutdown.load()) loop.stop();
    });

    scheduler.start();
    loop.run();

    std::cerr << "[main] Shutting down\n";
    scheduler.stop();
    orchestrator.shutdown();
    ws_server.stop();
    server.stop();

    genstream::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
