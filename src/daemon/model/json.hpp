#pragma once

#include "model/worktree.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Wire shapes consumed by the dashboard, menubar and widget clients.
// Optional fields are omitted rather than sent as null.

nlohmann::json to_json(const ServerInfo& server, TimePoint now);
nlohmann::json to_json(const Worktree& wt, TimePoint now);
nlohmann::json to_json(const AgentRecord& agent);

nlohmann::json workspaces_json(const std::vector<Worktree>& worktrees, TimePoint now);
nlohmann::json agents_json(const std::vector<AgentRecord>& agents);

// RFC 3339, UTC, second precision: "2026-01-02T15:04:05Z".
std::string format_timestamp(TimePoint tp);
std::optional<TimePoint> parse_timestamp(const std::string& s);

// "42s", "17m", "3h5m", "2d4h".
std::string format_duration(std::chrono::seconds d);
