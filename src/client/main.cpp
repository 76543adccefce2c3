#include "api_client.hpp"
#include "platform/linux/unix_socket_client.hpp"

#include "activity/activity_probe.hpp"
#include "config.hpp"
#include "discovery/worktree_discovery.hpp"
#include "model/json.hpp"
#include "platform/linux/procfs_inspector.hpp"
#include "port/allocator.hpp"
#include "port/port_prober.hpp"

#include <charconv>
#include <cstdio>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--config PATH] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  ls [--json]                       List worktrees known to the daemon");
    std::println(stderr, "  agents [--json]                   List running agents");
    std::println(stderr, "  health                            Check that the daemon is serving");
    std::println(stderr, "  watch [--topic T]...              Stream live updates");
    std::println(stderr, "  discover [PATH] [--depth N] [--json]  Scan for worktrees locally");
    std::println(stderr, "  port check N                      Is port N free?");
    std::println(stderr, "  port wait N [--timeout S]         Wait until something listens on N");
    std::println(stderr, "  port free MIN MAX                 First free port in range");
    std::println(stderr, "  port pid N                        PID listening on N");
    std::println(stderr, "  port alloc NAME                   Deterministic port for NAME");
}

template <typename T>
static std::optional<T> parse_number(const std::string& s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

static std::string yes_no(bool b) { return b ? "yes" : "-"; }

static void print_worktrees(const json& arr) {
    std::println("{:<24} {:<28} {:<9} {:<8} {:<6} {}", "NAME", "BRANCH", "SERVER", "AGENT", "DIRTY", "PATH");
    for (auto& wt : arr) {
        std::string server = "-";
        if (wt.contains("server")) {
            server = wt["server"].value("status", "-");
            if (wt["server"].contains("port")) server += ":" + std::to_string(wt["server"]["port"].get<int>());
        }
        std::println("{:<24} {:<28} {:<9} {:<8} {:<6} {}",
                     wt.value("name", ""), wt.value("branch", ""), server,
                     yes_no(wt.value("has_claude", false)),
                     yes_no(wt.value("git_dirty", false)),
                     wt.value("path", ""));
    }
}

static void print_agents(const json& arr) {
    if (arr.empty()) {
        std::println("No agents running");
        return;
    }
    std::println("{:<24} {:<10} {:>8} {:<10} {}", "WORKTREE", "TYPE", "PID", "DURATION", "PATH");
    for (auto& a : arr) {
        std::println("{:<24} {:<10} {:>8} {:<10} {}",
                     a.value("worktree", ""), a.value("type", ""), a.value("pid", 0),
                     a.value("duration", "-"), a.value("path", ""));
    }
}

static int cmd_pull(const Config& config, const std::string& command, bool as_json) {
    ApiClient api(std::format("http://{}:{}", config.api.host, config.api.port));

    std::string path = command == "ls" ? "/api/workspaces"
                     : command == "agents" ? "/api/agents"
                     : "/api/health";

    auto body = api.get(path);
    if (!body) {
        std::println(stderr, "Failed to reach daemon: {}", body.error());
        std::println(stderr, "Is treewatchd running?");
        return 1;
    }

    try {
        auto j = json::parse(*body);
        if (as_json || command == "health") {
            std::println("{}", j.dump(2));
        } else if (command == "ls") {
            print_worktrees(j);
        } else {
            print_agents(j);
        }
    } catch (const json::exception& e) {
        std::println(stderr, "Bad response from daemon: {}", e.what());
        return 1;
    }
    return 0;
}

static int cmd_watch(const Config& config, const std::vector<std::string>& topics) {
    UnixSocketClient client;
    auto sock_path = config.hub_socket();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is treewatchd running?");
        return 1;
    }

    if (!topics.empty() && !client.send({{"type", "subscribe"}, {"payload", topics}})) {
        std::println(stderr, "Failed to send subscription");
        return 1;
    }

    json msg;
    while (client.recv(msg)) {
        std::println("{}", msg.dump());
        std::fflush(stdout);
    }

    std::println(stderr, "Connection closed by daemon");
    return 1;
}

static int cmd_discover(const Config& config, const std::string& path, int depth, bool as_json) {
    ProcfsInspector inspector;
    ActivityProbe probe(inspector, ActivityOptions{
        .agents = config.agents,
        .editor_process = config.editor.process,
        .editor_marker_dir = config.editor.marker_dir,
    });
    WorktreeDiscovery discovery(&probe);

    auto worktrees = discovery.find_all(path, depth);

    try {
        auto j = workspaces_json(worktrees, Clock::now());
        if (as_json) {
            std::println("{}", j.dump(2));
        } else if (worktrees.empty()) {
            std::println("No worktrees found under {}", path);
        } else {
            print_worktrees(j);
        }
    } catch (const json::exception& e) {
        std::println(stderr, "Failed to encode result: {}", e.what());
        return 1;
    }
    return 0;
}

static int cmd_port(const Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::println(stderr, "port: missing subcommand");
        return 1;
    }

    auto& sub = args[0];
    auto port_arg = [&](size_t idx) -> std::optional<uint16_t> {
        if (idx >= args.size()) return std::nullopt;
        return parse_number<uint16_t>(args[idx]);
    };

    if (sub == "check") {
        auto p = port_arg(1);
        if (!p) { std::println(stderr, "port check: expected a port number"); return 1; }
        if (port::is_available(*p)) {
            std::println("{} is available", *p);
            return 0;
        }
        int pid = port::get_listener_pid(*p);
        if (pid > 0) std::println("{} is in use (pid {})", *p, pid);
        else std::println("{} is in use", *p);
        return 1;
    }

    if (sub == "wait") {
        auto p = port_arg(1);
        if (!p) { std::println(stderr, "port wait: expected a port number"); return 1; }
        int timeout_s = 30;
        for (size_t i = 2; i < args.size(); i++) {
            if (args[i] == "--timeout" && i + 1 < args.size()) {
                timeout_s = parse_number<int>(args[++i]).value_or(timeout_s);
            }
        }
        auto res = port::wait_for_port(*p, std::chrono::seconds(timeout_s));
        if (!res) {
            std::println(stderr, "{}", res.error().message);
            return 1;
        }
        std::println("{} is listening", *p);
        return 0;
    }

    if (sub == "free") {
        auto lo = port_arg(1);
        auto hi = port_arg(2);
        if (!lo || !hi) {
            lo = config.ports.min;
            hi = config.ports.max;
        }
        auto res = port::find_available_port(*lo, *hi);
        if (!res) {
            std::println(stderr, "{}", res.error().message);
            return 1;
        }
        std::println("{}", *res);
        return 0;
    }

    if (sub == "pid") {
        auto p = port_arg(1);
        if (!p) { std::println(stderr, "port pid: expected a port number"); return 1; }
        int pid = port::get_listener_pid(*p);
        if (pid <= 0) {
            std::println(stderr, "no listener found on {}", *p);
            return 1;
        }
        std::println("{}", pid);
        return 0;
    }

    if (sub == "alloc") {
        if (args.size() < 2) { std::println(stderr, "port alloc: expected a name"); return 1; }
        port::Allocator alloc(config.ports.min, config.ports.max);
        auto res = alloc.allocate_with_fallback(args[1], {});
        if (!res) {
            std::println(stderr, "{}", res.error().message);
            return 1;
        }
        std::println("{}", *res);
        return 0;
    }

    std::println(stderr, "port: unknown subcommand {}", sub);
    return 1;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    bool as_json = false;
    std::erase_if(rest, [&](const std::string& a) {
        if (a != "--json") return false;
        as_json = true;
        return true;
    });

    if (command == "ls" || command == "agents" || command == "health") {
        return cmd_pull(config, command, as_json);
    }

    if (command == "watch") {
        std::vector<std::string> topics;
        for (size_t i = 0; i < rest.size(); i++) {
            if (rest[i] == "--topic" && i + 1 < rest.size()) topics.push_back(rest[++i]);
        }
        return cmd_watch(config, topics);
    }

    if (command == "discover") {
        std::string path = ".";
        int depth = 1;
        for (size_t i = 0; i < rest.size(); i++) {
            if (rest[i] == "--depth" && i + 1 < rest.size()) {
                auto d = parse_number<int>(rest[++i]);
                if (!d) { std::println(stderr, "discover: bad --depth"); return 1; }
                depth = *d;
            } else if (rest[i] == "--recursive" || rest[i] == "-r") {
                depth = -1;
            } else {
                path = rest[i];
            }
        }
        return cmd_discover(config, path, depth, as_json);
    }

    if (command == "port") {
        return cmd_port(config, rest);
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
