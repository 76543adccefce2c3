#include "model/json.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <format>

using json = nlohmann::json;

std::string format_timestamp(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::optional<TimePoint> parse_timestamp(const std::string& s) {
    if (s.empty()) return std::nullopt;

    std::tm tm{};
    int consumed = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
    if (n < 6) return std::nullopt;

    // Fractional seconds are dropped; the zone may be 'Z' or a +hh:mm offset.
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    }

    long offset = 0;
    if (pos < s.size()) {
        char zone = s[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
            offset = (oh * 3600L + om * 60L) * (zone == '-' ? -1 : 1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != s.size()) return std::nullopt;

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t - offset);
}

std::string format_duration(std::chrono::seconds d) {
    using namespace std::chrono;
    if (d < seconds(0)) d = seconds(0);

    if (d < minutes(1)) return std::format("{}s", d.count());
    if (d < hours(1)) return std::format("{}m", duration_cast<minutes>(d).count());
    if (d < hours(24)) {
        auto h = duration_cast<hours>(d).count();
        auto m = duration_cast<minutes>(d).count() % 60;
        return std::format("{}h{}m", h, m);
    }
    auto total_hours = duration_cast<hours>(d).count();
    return std::format("{}d{}h", total_hours / 24, total_hours % 24);
}

json to_json(const ServerInfo& server, TimePoint now) {
    json j = {
        {"port", server.port},
        {"status", server.status},
        {"url", server.url},
    };
    if (!server.health.empty()) j["health"] = server.health;
    if (server.started_at) {
        j["started_at"] = format_timestamp(*server.started_at);

        auto end = server.is_running() ? now : server.stopped_at.value_or(*server.started_at);
        auto up = std::chrono::duration_cast<std::chrono::seconds>(end - *server.started_at);
        if (up.count() > 0) j["uptime"] = format_duration(up);
    }
    return j;
}

json to_json(const Worktree& wt, TimePoint now) {
    json j = {
        {"name", wt.name},
        {"path", wt.path},
        {"branch", wt.branch},
        {"git_dirty", wt.git_dirty},
        {"has_claude", wt.has_claude},
        {"has_vscode", wt.has_vscode},
    };
    if (!wt.main_repo.empty()) j["main_repo"] = wt.main_repo;
    if (!wt.tags.empty()) j["tags"] = wt.tags;
    if (wt.server) j["server"] = to_json(*wt.server, now);
    return j;
}

json to_json(const AgentRecord& agent) {
    json j = {
        {"worktree", agent.worktree},
        {"path", agent.path},
        {"branch", agent.branch},
        {"type", agent.type},
        {"pid", agent.pid},
    };
    if (agent.start_time) j["start_time"] = format_timestamp(*agent.start_time);
    if (!agent.duration.empty()) j["duration"] = agent.duration;
    return j;
}

json workspaces_json(const std::vector<Worktree>& worktrees, TimePoint now) {
    json arr = json::array();
    for (const auto& wt : worktrees) {
        arr.push_back(to_json(wt, now));
    }
    return arr;
}

json agents_json(const std::vector<AgentRecord>& agents) {
    json arr = json::array();
    for (const auto& a : agents) {
        arr.push_back(to_json(a));
    }
    return arr;
}
