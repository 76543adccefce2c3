#include "storage/snapshot_db.hpp"

#include "model/json.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& val) {
    sqlite3_bind_text(stmt, idx, val.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_nullable(sqlite3_stmt* stmt, int idx, const std::string& val) {
    if (val.empty()) sqlite3_bind_null(stmt, idx);
    else bind_text(stmt, idx, val);
}

void bind_time(sqlite3_stmt* stmt, int idx, const std::optional<TimePoint>& tp) {
    if (tp) bind_text(stmt, idx, format_timestamp(*tp));
    else sqlite3_bind_null(stmt, idx);
}

std::optional<TimePoint> column_time(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return parse_timestamp(column_text(stmt, col));
}

} // namespace

SnapshotDb::SnapshotDb() = default;

SnapshotDb::~SnapshotDb() {
    close();
}

bool SnapshotDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Readers in other processes poll this file
    exec("PRAGMA journal_mode=WAL;");

    if (!create_tables()) {
        close();
        return false;
    }

    const char* worktree_sql =
        "INSERT INTO worktrees (name, path, branch, main_repo, discovered_at, last_activity, "
        "has_server, has_claude, has_vscode, git_dirty, agent_type, agent_pid, "
        "server_port, server_status, server_url, server_health, server_started_at, tags) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const char* agent_sql =
        "INSERT INTO agents (worktree, path, branch, type, pid, start_time, duration) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)";

    const char* meta_sql =
        "INSERT OR REPLACE INTO meta (key, value) VALUES ('taken_at', ?)";

    if (sqlite3_prepare_v2(db_, worktree_sql, -1, &worktree_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, agent_sql, -1, &agent_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, meta_sql, -1, &meta_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void SnapshotDb::close() {
    if (worktree_stmt_) { sqlite3_finalize(worktree_stmt_); worktree_stmt_ = nullptr; }
    if (agent_stmt_) { sqlite3_finalize(agent_stmt_); agent_stmt_ = nullptr; }
    if (meta_stmt_) { sqlite3_finalize(meta_stmt_); meta_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool SnapshotDb::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: {} failed: {}", sql, err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SnapshotDb::replace(const Snapshot& snapshot) {
    if (!db_) return false;

    if (!exec("BEGIN IMMEDIATE;")) return false;

    bool ok = exec("DELETE FROM worktrees;") && exec("DELETE FROM agents;");

    for (auto& wt : snapshot.worktrees) {
        if (!ok) break;
        ok = insert_worktree(wt);
    }
    for (auto& agent : snapshot.agents) {
        if (!ok) break;
        ok = insert_agent(agent);
    }

    if (ok) {
        sqlite3_reset(meta_stmt_);
        bind_text(meta_stmt_, 1, format_timestamp(snapshot.taken_at));
        if (sqlite3_step(meta_stmt_) != SQLITE_DONE) {
            std::println(stderr, "db: meta update failed: {}", sqlite3_errmsg(db_));
            ok = false;
        }
    }

    if (!ok) {
        exec("ROLLBACK;");
        return false;
    }
    return exec("COMMIT;");
}

bool SnapshotDb::insert_worktree(const Worktree& wt) {
    auto* s = worktree_stmt_;
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);

    bind_text(s, 1, wt.name);
    bind_text(s, 2, wt.path);
    bind_text(s, 3, wt.branch);
    bind_nullable(s, 4, wt.main_repo);
    bind_text(s, 5, format_timestamp(wt.discovered_at));
    bind_text(s, 6, format_timestamp(wt.last_activity));
    sqlite3_bind_int(s, 7, wt.has_server);
    sqlite3_bind_int(s, 8, wt.has_claude);
    sqlite3_bind_int(s, 9, wt.has_vscode);
    sqlite3_bind_int(s, 10, wt.git_dirty);

    if (wt.agent) {
        bind_text(s, 11, wt.agent->type);
        sqlite3_bind_int(s, 12, wt.agent->pid);
    }

    if (wt.server) {
        sqlite3_bind_int(s, 13, wt.server->port);
        bind_nullable(s, 14, wt.server->status);
        bind_nullable(s, 15, wt.server->url);
        bind_nullable(s, 16, wt.server->health);
        bind_time(s, 17, wt.server->started_at);
    }

    bind_text(s, 18, nlohmann::json(wt.tags).dump());

    if (sqlite3_step(s) != SQLITE_DONE) {
        std::println(stderr, "db: insert worktree {} failed: {}", wt.name, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SnapshotDb::insert_agent(const AgentRecord& agent) {
    auto* s = agent_stmt_;
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);

    bind_text(s, 1, agent.worktree);
    bind_text(s, 2, agent.path);
    bind_text(s, 3, agent.branch);
    bind_text(s, 4, agent.type);
    sqlite3_bind_int(s, 5, agent.pid);
    bind_time(s, 6, agent.start_time);
    bind_nullable(s, 7, agent.duration);

    if (sqlite3_step(s) != SQLITE_DONE) {
        std::println(stderr, "db: insert agent {} failed: {}", agent.pid, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<Snapshot> SnapshotDb::load() {
    if (!db_) return std::nullopt;

    Snapshot snap;
    bool written = false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM meta WHERE key = 'taken_at'", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            written = true;
            snap.taken_at = parse_timestamp(column_text(stmt, 0)).value_or(TimePoint{});
        }
    }
    sqlite3_finalize(stmt);
    if (!written) return std::nullopt;

    const char* wt_sql =
        "SELECT name, path, branch, main_repo, discovered_at, last_activity, "
        "has_server, has_claude, has_vscode, git_dirty, agent_type, agent_pid, "
        "server_port, server_status, server_url, server_health, server_started_at, tags "
        "FROM worktrees ORDER BY name";

    stmt = nullptr;
    if (sqlite3_prepare_v2(db_, wt_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare load failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Worktree wt;
        wt.name = column_text(stmt, 0);
        wt.path = column_text(stmt, 1);
        wt.branch = column_text(stmt, 2);
        wt.main_repo = column_text(stmt, 3);
        wt.discovered_at = column_time(stmt, 4).value_or(TimePoint{});
        wt.last_activity = column_time(stmt, 5).value_or(TimePoint{});
        wt.has_server = sqlite3_column_int(stmt, 6) != 0;
        wt.has_claude = sqlite3_column_int(stmt, 7) != 0;
        wt.has_vscode = sqlite3_column_int(stmt, 8) != 0;
        wt.git_dirty = sqlite3_column_int(stmt, 9) != 0;

        if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
            AgentInfo agent;
            agent.type = column_text(stmt, 10);
            agent.pid = sqlite3_column_int(stmt, 11);
            agent.path = wt.path;
            wt.agent = std::move(agent);
        }

        if (sqlite3_column_type(stmt, 12) != SQLITE_NULL) {
            ServerInfo server;
            server.port = sqlite3_column_int(stmt, 12);
            server.status = column_text(stmt, 13);
            server.url = column_text(stmt, 14);
            server.health = column_text(stmt, 15);
            server.started_at = column_time(stmt, 16);
            wt.server = std::move(server);
        }

        try {
            auto tags = nlohmann::json::parse(column_text(stmt, 17));
            if (tags.is_array()) wt.tags = tags.get<std::vector<std::string>>();
        } catch (const nlohmann::json::exception& e) {
            std::println(stderr, "db: bad tags for {}: {}", wt.name, e.what());
        }

        snap.worktrees.push_back(std::move(wt));
    }
    sqlite3_finalize(stmt);

    const char* agent_sql =
        "SELECT worktree, path, branch, type, pid, start_time, duration FROM agents ORDER BY worktree";

    stmt = nullptr;
    if (sqlite3_prepare_v2(db_, agent_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare load failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AgentRecord a;
        a.worktree = column_text(stmt, 0);
        a.path = column_text(stmt, 1);
        a.branch = column_text(stmt, 2);
        a.type = column_text(stmt, 3);
        a.pid = sqlite3_column_int(stmt, 4);
        a.start_time = column_time(stmt, 5);
        a.duration = column_text(stmt, 6);
        snap.agents.push_back(std::move(a));
    }
    sqlite3_finalize(stmt);

    return snap;
}

bool SnapshotDb::create_tables() {
    return exec(R"(
        CREATE TABLE IF NOT EXISTS worktrees (
            name TEXT NOT NULL,
            path TEXT PRIMARY KEY,
            branch TEXT NOT NULL,
            main_repo TEXT,
            discovered_at TEXT NOT NULL,
            last_activity TEXT NOT NULL,
            has_server INTEGER NOT NULL DEFAULT 0,
            has_claude INTEGER NOT NULL DEFAULT 0,
            has_vscode INTEGER NOT NULL DEFAULT 0,
            git_dirty INTEGER NOT NULL DEFAULT 0,
            agent_type TEXT,
            agent_pid INTEGER,
            server_port INTEGER,
            server_status TEXT,
            server_url TEXT,
            server_health TEXT,
            server_started_at TEXT,
            tags TEXT NOT NULL DEFAULT '[]'
        );
        CREATE TABLE IF NOT EXISTS agents (
            worktree TEXT NOT NULL,
            path TEXT NOT NULL,
            branch TEXT NOT NULL,
            type TEXT NOT NULL,
            pid INTEGER NOT NULL,
            start_time TEXT,
            duration TEXT
        );
        CREATE TABLE IF NOT EXISTS meta (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )");
}
