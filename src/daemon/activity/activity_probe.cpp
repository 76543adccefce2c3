#include "activity/activity_probe.hpp"

#include "platform/command.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::string basename_of(const std::string& arg) {
    auto slash = arg.rfind('/');
    return slash == std::string::npos ? arg : arg.substr(slash + 1);
}

} // namespace

ActivityProbe::ActivityProbe(const ProcessInspector& inspector, ActivityOptions options)
    : inspector_(inspector), options_(std::move(options)) {}

void ActivityProbe::detect_activity(Worktree& wt) const {
    AgentProbe agent;
    Signal editor = Signal::NotDetected;
    Signal dirty = Signal::NotDetected;

    {
        const std::string& path = wt.path;
        std::jthread agent_worker([&] { agent = probe_agent(path); });
        std::jthread editor_worker([&] { editor = probe_editor(path); });
        std::jthread git_worker([&] { dirty = probe_git_dirty(path); });
    } // joined here

    wt.agent = agent.agent;
    wt.has_claude = wt.agent && wt.agent->type == "claude";
    wt.has_vscode = detected(editor);
    wt.git_dirty = detected(dirty);

    if (detected(agent.signal) || wt.has_vscode || wt.git_dirty) {
        wt.last_activity = Clock::now();
    }
}

ActivityProbe::AgentProbe ActivityProbe::probe_agent(const std::string& path) const {
    auto processes = inspector_.list_processes();
    if (processes.empty()) return {Signal::Inconclusive, std::nullopt};

    // Agents are checked in configured order so "claude" wins over later types
    for (const auto& signature : options_.agents) {
        for (const auto& proc : processes) {
            if (!matches_agent(proc, signature)) continue;

            auto cwd = inspector_.working_dir(proc.pid);
            if (cwd.empty() || cwd != path) continue;

            return {Signal::Detected, AgentInfo{
                .type = signature,
                .pid = proc.pid,
                .path = cwd,
                .start_time = proc.start_time,
                .command = proc.command_line(),
            }};
        }
    }
    return {Signal::NotDetected, std::nullopt};
}

ActivityProbe::Signal ActivityProbe::probe_editor(const std::string& path) const {
    std::error_code ec;
    if (fs::is_directory(fs::path(path) / options_.editor_marker_dir, ec)) {
        return Signal::Detected;
    }

    auto processes = inspector_.list_processes();
    if (processes.empty()) return Signal::Inconclusive;

    bool found = std::ranges::any_of(processes, [&](const ProcessEntry& proc) {
        return is_editor(proc) && proc.command_line().find(path) != std::string::npos;
    });
    return found ? Signal::Detected : Signal::NotDetected;
}

ActivityProbe::Signal ActivityProbe::probe_git_dirty(const std::string& path) const {
    auto result = platform::run_command({"git", "-C", path, "status", "--porcelain"});
    if (!result || !result->ok()) return Signal::Inconclusive;

    bool dirty = std::ranges::any_of(result->output, [](unsigned char c) {
        return !std::isspace(c);
    });
    return dirty ? Signal::Detected : Signal::NotDetected;
}

bool ActivityProbe::matches_agent(const ProcessEntry& proc, const std::string& signature) const {
    if (proc.comm.find(signature) != std::string::npos) return true;

    // Script-launched agents: "node /usr/lib/.../claude" or "python -m gemini"
    for (size_t i = 0; i < proc.argv.size() && i < 2; ++i) {
        if (basename_of(proc.argv[i]).find(signature) != std::string::npos) return true;
    }
    return false;
}

bool ActivityProbe::is_editor(const ProcessEntry& proc) const {
    if (proc.comm.find(options_.editor_process) != std::string::npos) return true;
    return !proc.argv.empty() &&
           basename_of(proc.argv[0]).find(options_.editor_process) != std::string::npos;
}
