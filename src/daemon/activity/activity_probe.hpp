#pragma once

#include "model/worktree.hpp"
#include "platform/process_inspector.hpp"

#include <optional>
#include <string>
#include <vector>

struct ActivityOptions {
    std::vector<std::string> agents = {"claude", "gemini"};
    std::string editor_process = "code";
    std::string editor_marker_dir = ".vscode-server";
};

// Heuristic activity signals for a worktree. Never fails the caller: a probe
// whose external command is missing or errors simply reports nothing.
class ActivityProbe {
public:
    enum class Signal { Detected, NotDetected, Inconclusive };

    struct AgentProbe {
        Signal signal = Signal::NotDetected;
        std::optional<AgentInfo> agent;
    };

    ActivityProbe(const ProcessInspector& inspector, ActivityOptions options);

    // Runs the agent, editor and git probes in parallel, joins all three,
    // then writes the flags. last_activity moves only if something fired.
    void detect_activity(Worktree& wt) const;

    AgentProbe probe_agent(const std::string& path) const;
    Signal probe_editor(const std::string& path) const;
    Signal probe_git_dirty(const std::string& path) const;

    static bool detected(Signal s) { return s == Signal::Detected; }

private:
    bool matches_agent(const ProcessEntry& proc, const std::string& signature) const;
    bool is_editor(const ProcessEntry& proc) const;

    const ProcessInspector& inspector_;
    ActivityOptions options_;
};
