#include "api/snapshot_api.hpp"

#include "model/json.hpp"

#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

SnapshotApi::SnapshotApi(const SnapshotStore& store) : store_(store) {}

ApiResponse SnapshotApi::handle(const std::string& method, const std::string& path) const {
    if (method != "GET") {
        return {405, json{{"error", "Method not allowed"}}.dump()};
    }

    try {
        if (path == "/api/workspaces") {
            auto snap = store_.current();
            return {200, workspaces_json(snap->worktrees, Clock::now()).dump()};
        }
        if (path == "/api/agents") {
            auto snap = store_.current();
            return {200, agents_json(snap->agents).dump()};
        }
        if (path == "/api/health") {
            json j = {{"status", "ok"}, {"timestamp", format_timestamp(Clock::now())}};
            return {200, j.dump()};
        }
    } catch (const json::exception& e) {
        std::println(stderr, "api: failed to encode {}: {}", path, e.what());
        return {500, R"({"error":"Failed to encode response"})"};
    }

    return {404, json{{"error", "Not found"}}.dump()};
}
