#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace genstream {

struct ServerConfig {
    std::string listen = "0.0.0.0:3001";
    std::string ws_listen = "0.0.0.0:3002"; // WebSocket subscribers
    uint32_t max_body = 65536;
    uint32_t history_replay = 20; // history entries sent to a new subscriber
};

struct GenerationConfig {
    std::string video_api_base = "http://localhost:8000";
    std::string quality = "high";
    uint32_t duration = 10;               // seconds of video requested
    uint32_t timeout_ms = 10000;          // Starting → Active deadline
    uint32_t status_poll_interval_ms = 30000;
    uint32_t api_timeout_seconds = 15;
};

struct RelayConfig {
    uint32_t frame_rate = 30;             // advertised target; every frame is relayed
    uint32_t staleness_ms = 5000;
    uint32_t waiting_frame_interval_ms = 1000;
    uint32_t history_limit = 50;
    uint32_t default_width = 1920;
    uint32_t default_height = 1080;
};

struct CycleConfig {
    uint32_t interval_ms = 7000;
    uint32_t initial_delay_ms = 1000;
    uint32_t prompt_delay_ms = 2000;
    uint32_t trigger_delay_ms = 2000;
    uint64_t seed = 0;                    // 0 = seed from random_device
};

struct SignalingConfig {
    std::vector<std::string> ice_servers = {"stun:stun.l.google.com:19302"};
    uint32_t handshake_timeout_seconds = 10;
};

struct Config {
    ServerConfig server;
    GenerationConfig generation;
    RelayConfig relay;
    CycleConfig cycle;
    SignalingConfig signaling;

    // Load from ~/.genstream/config.json + env vars
    static Config load();

    // Parse a JSON document over the built-in defaults (used by load() and tests)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON
    static nlohmann::json defaults_json();

    // Apply VIDEO_API_BASE, FRAME_RATE, GENERATION_TIMEOUT, LLM_CYCLE_INTERVAL,
    // PORT, LISTEN_ADDR, WS_LISTEN_ADDR and GENSTREAM_ICE_SERVER when set
    void apply_env();
};

} // namespace genstream
