#include "servers/server_registry.hpp"

#include "model/json.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <sstream>

using json = nlohmann::json;

namespace {

std::optional<TimePoint> time_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
    auto tp = parse_timestamp(j[key].get<std::string>());
    // The supervisor writes 0001-01-01T00:00:00Z for "never"
    if (tp && *tp <= Clock::from_time_t(0)) return std::nullopt;
    return tp;
}

} // namespace

ServerRegistry::ServerRegistry(std::string path, bool verbose)
    : path_(std::move(path)), verbose_(verbose) {}

std::vector<ServerEntry> ServerRegistry::load() const {
    std::ifstream f(path_);
    if (!f.is_open()) {
        log("no server registry at " + path_);
        return {};
    }

    std::stringstream ss;
    ss << f.rdbuf();

    auto entries = parse(ss.str());
    if (!entries) {
        std::println(stderr, "servers: ignoring {}: {}", path_, entries.error());
        return {};
    }
    return std::move(*entries);
}

std::expected<std::vector<ServerEntry>, std::string> ServerRegistry::parse(std::string_view text) {
    std::vector<ServerEntry> out;

    try {
        auto j = json::parse(text);
        if (!j.is_object()) return std::unexpected("top level is not an object");
        if (!j.contains("servers") || j["servers"].is_null()) return out;
        if (!j["servers"].is_object()) return std::unexpected("servers is not an object");

        for (auto& [name, s] : j["servers"].items()) {
            if (!s.is_object()) continue;

            ServerEntry e;
            e.name = s.value("name", name);
            e.path = s.value("path", "");
            if (e.path.empty()) continue;

            e.info.port = s.value("port", 0);
            e.info.pid = s.value("pid", 0);
            e.info.status = s.value("status", "stopped");
            e.info.url = s.value("url", "");
            e.info.health = s.value("health", "");
            e.info.started_at = time_field(s, "started_at");
            e.info.stopped_at = time_field(s, "stopped_at");

            if (s.contains("tags") && s["tags"].is_array()) {
                for (auto& t : s["tags"]) {
                    if (t.is_string()) e.tags.push_back(t.get<std::string>());
                }
            }

            out.push_back(std::move(e));
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string(e.what()));
    }

    std::ranges::sort(out, {}, &ServerEntry::name);
    return out;
}

void ServerRegistry::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[treewatch] {}", msg);
    }
}

void attach_servers(std::vector<Worktree>& worktrees, const std::vector<ServerEntry>& servers) {
    for (auto& wt : worktrees) {
        auto it = std::ranges::find(servers, wt.path, &ServerEntry::path);
        if (it == servers.end()) continue;

        wt.server = it->info;
        wt.has_server = it->info.is_running();
        wt.tags = it->tags;
    }
}
