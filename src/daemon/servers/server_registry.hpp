#pragma once

#include "model/worktree.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

// One entry of the supervisor's servers.json.
struct ServerEntry {
    std::string name;
    std::string path;
    ServerInfo info;
    std::vector<std::string> tags;
};

// Read-only view of the dev-server supervisor's state file. The supervisor
// owns the file; we never write it.
class ServerRegistry {
public:
    explicit ServerRegistry(std::string path, bool verbose = false);

    // Missing file yields an empty list; a corrupt one is logged and ignored.
    std::vector<ServerEntry> load() const;

    const std::string& path() const { return path_; }

    static std::expected<std::vector<ServerEntry>, std::string> parse(std::string_view text);

private:
    void log(const std::string& msg) const;

    std::string path_;
    bool verbose_;
};

// Copies server state and tags onto the worktree with the same path.
void attach_servers(std::vector<Worktree>& worktrees, const std::vector<ServerEntry>& servers);
