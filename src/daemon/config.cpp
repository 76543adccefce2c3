#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("scan")) {
            auto& s = j["scan"];
            if (s.contains("roots")) cfg.scan.roots = s["roots"].get<std::vector<std::string>>();
            if (s.contains("max_depth")) cfg.scan.max_depth = s["max_depth"].get<int>();
            if (s.contains("interval_seconds")) cfg.scan.interval_seconds = s["interval_seconds"].get<uint32_t>();
        }

        if (j.contains("agents")) {
            cfg.agents = j["agents"].get<std::vector<std::string>>();
        }

        if (j.contains("editor")) {
            auto& e = j["editor"];
            if (e.contains("process")) cfg.editor.process = e["process"].get<std::string>();
            if (e.contains("marker_dir")) cfg.editor.marker_dir = e["marker_dir"].get<std::string>();
        }

        if (j.contains("hub")) {
            auto& h = j["hub"];
            if (h.contains("socket")) cfg.hub.socket = h["socket"].get<std::string>();
            if (h.contains("queue_capacity")) cfg.hub.queue_capacity = h["queue_capacity"].get<size_t>();
            if (h.contains("keepalive_seconds")) cfg.hub.keepalive_seconds = h["keepalive_seconds"].get<uint32_t>();
        }

        if (j.contains("api")) {
            auto& a = j["api"];
            if (a.contains("host")) cfg.api.host = a["host"].get<std::string>();
            if (a.contains("port")) cfg.api.port = a["port"].get<uint16_t>();
            if (a.contains("ws_port")) cfg.api.ws_port = a["ws_port"].get<uint16_t>();
        }

        if (j.contains("servers_file")) cfg.servers_file = j["servers_file"].get<std::string>();
        if (j.contains("snapshot_db")) cfg.snapshot_db = j["snapshot_db"].get<std::string>();

        if (j.contains("ports")) {
            auto& p = j["ports"];
            if (p.contains("min")) cfg.ports.min = p["min"].get<uint16_t>();
            if (p.contains("max")) cfg.ports.max = p["max"].get<uint16_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.hub.queue_capacity == 0) cfg.hub.queue_capacity = Config{}.hub.queue_capacity;
    if (cfg.scan.interval_seconds == 0) cfg.scan.interval_seconds = Config{}.scan.interval_seconds;
    if (cfg.hub.keepalive_seconds == 0) cfg.hub.keepalive_seconds = Config{}.hub.keepalive_seconds;
    if (cfg.ports.min > cfg.ports.max) {
        std::println(stderr, "config: ports.min > ports.max, using defaults");
        cfg.ports = Config::Ports{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::vector<std::string> Config::scan_roots() const {
    if (!scan.roots.empty()) return scan.roots;
    const char* home = std::getenv("HOME");
    if (!home) return {"."};
    return {home};
}

std::string Config::hub_socket() const {
    return hub.socket.empty() ? platform::hub_endpoint() : hub.socket;
}

std::string Config::servers_path() const {
    if (!servers_file.empty()) return servers_file;
    auto dir = platform::config_dir();
    return dir.empty() ? std::string{} : dir + "/servers.json";
}

std::string Config::snapshot_db_path() const {
    if (!snapshot_db.empty()) return snapshot_db;
    auto dir = platform::data_dir();
    return dir.empty() ? std::string{} : dir + "/snapshot.db";
}
