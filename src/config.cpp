#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace genstream {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"listen", "0.0.0.0:3001"},
            {"ws_listen", "0.0.0.0:3002"},
            {"max_body", 65536},
            {"history_replay", 20}
        }},
        {"generation", {
            {"video_api_base", "http://localhost:8000"},
            {"quality", "high"},
            {"duration", 10},
            {"timeout_ms", 10000},
            {"status_poll_interval_ms", 30000},
            {"api_timeout_seconds", 15}
        }},
        {"relay", {
            {"frame_rate", 30},
            {"staleness_ms", 5000},
            {"waiting_frame_interval_ms", 1000},
            {"history_limit", 50},
            {"default_width", 1920},
            {"default_height", 1080}
        }},
        {"cycle", {
            {"interval_ms", 7000},
            {"initial_delay_ms", 1000},
            {"prompt_delay_ms", 2000},
            {"trigger_delay_ms", 2000},
            {"seed", 0}
        }},
        {"signaling", {
            {"ice_servers", {"stun:stun.l.google.com:19302"}},
            {"handshake_timeout_seconds", 10}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

template<typename T>
static void read_unsigned(const nlohmann::json& obj, const char* key, T& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<T>();
}

static const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.contains(name) && j[name].is_object()) return j[name];
    return empty;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    const auto& s = section(j, "server");
    read_string(s, "listen", cfg.server.listen);
    read_string(s, "ws_listen", cfg.server.ws_listen);
    read_unsigned(s, "max_body", cfg.server.max_body);
    read_unsigned(s, "history_replay", cfg.server.history_replay);

    const auto& g = section(j, "generation");
    read_string(g, "video_api_base", cfg.generation.video_api_base);
    read_string(g, "quality", cfg.generation.quality);
    read_unsigned(g, "duration", cfg.generation.duration);
    read_unsigned(g, "timeout_ms", cfg.generation.timeout_ms);
    read_unsigned(g, "status_poll_interval_ms", cfg.generation.status_poll_interval_ms);
    read_unsigned(g, "api_timeout_seconds", cfg.generation.api_timeout_seconds);

    const auto& r = section(j, "relay");
    read_unsigned(r, "frame_rate", cfg.relay.frame_rate);
    read_unsigned(r, "staleness_ms", cfg.relay.staleness_ms);
    read_unsigned(r, "waiting_frame_interval_ms", cfg.relay.waiting_frame_interval_ms);
    read_unsigned(r, "history_limit", cfg.relay.history_limit);
    read_unsigned(r, "default_width", cfg.relay.default_width);
    read_unsigned(r, "default_height", cfg.relay.default_height);

    const auto& c = section(j, "cycle");
    read_unsigned(c, "interval_ms", cfg.cycle.interval_ms);
    read_unsigned(c, "initial_delay_ms", cfg.cycle.initial_delay_ms);
    read_unsigned(c, "prompt_delay_ms", cfg.cycle.prompt_delay_ms);
    read_unsigned(c, "trigger_delay_ms", cfg.cycle.trigger_delay_ms);
    read_unsigned(c, "seed", cfg.cycle.seed);

    const auto& sig = section(j, "signaling");
    if (sig.contains("ice_servers") && sig["ice_servers"].is_array()) {
        cfg.signaling.ice_servers.clear();
        for (const auto& url : sig["ice_servers"]) {
            if (url.is_string()) cfg.signaling.ice_servers.push_back(url.get<std::string>());
        }
    }
    read_unsigned(sig, "handshake_timeout_seconds", cfg.signaling.handshake_timeout_seconds);

    return cfg;
}

// Positive integer from the environment; malformed values are reported and skipped.
static bool env_uint(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(v, &end, 10);
    if (*end != '\0' || parsed == 0 || parsed > UINT32_MAX) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
        return false;
    }
    out = static_cast<uint32_t>(parsed);
    return true;
}

void Config::apply_env() {
    if (const char* v = std::getenv("VIDEO_API_BASE"); v && *v)
        generation.video_api_base = v;
    env_uint("FRAME_RATE", relay.frame_rate);
    env_uint("GENERATION_TIMEOUT", generation.timeout_ms);
    env_uint("LLM_CYCLE_INTERVAL", cycle.interval_ms);

    if (const char* v = std::getenv("LISTEN_ADDR"); v && *v) {
        server.listen = v;
    } else {
        uint32_t port = 0;
        if (env_uint("PORT", port) && port <= 65535) {
            auto colon = server.listen.rfind(':');
            std::string host = colon == std::string::npos
                ? "0.0.0.0" : server.listen.substr(0, colon);
            server.listen = host + ":" + std::to_string(port);
        }
    }

    if (const char* v = std::getenv("WS_LISTEN_ADDR"); v && *v)
        server.ws_listen = v;

    if (const char* v = std::getenv("GENSTREAM_ICE_SERVER"); v && *v)
        signaling.ice_servers = {v};
}

Config Config::load() {
    std::string config_path = expand_home("~/.genstream/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);
    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

} // namespace genstream
