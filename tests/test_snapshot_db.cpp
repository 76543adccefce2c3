#include <catch2/catch_test_macros.hpp>

#include "storage/snapshot_db.hpp"

#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// RAII helper to create and clean up a temp database directory
struct TmpDb {
    fs::path dir;
    std::string path;

    TmpDb() {
        std::string tmpl = (fs::temp_directory_path() / "tw_test_db_XXXXXX").string();
        dir = ::mkdtemp(tmpl.data());
        path = (dir / "nested" / "snapshot.db").string();
    }

    ~TmpDb() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

TimePoint at(std::time_t t) {
    return Clock::from_time_t(t);
}

Worktree make_worktree(const std::string& name) {
    Worktree wt;
    wt.name = name;
    wt.path = "/src/" + name;
    wt.branch = name;
    wt.main_repo = "/src/main";
    wt.discovered_at = at(1'700'000'000);
    wt.last_activity = at(1'700'000'100);
    return wt;
}

} // namespace

TEST_CASE("SnapshotDb", "[storage]") {
    TmpDb tmp;
    SnapshotDb db;
    REQUIRE(db.open(tmp.path));
    REQUIRE(db.is_open());

    SECTION("OpenCreatesFile") {
        REQUIRE(fs::exists(tmp.path));
    }

    SECTION("EmptyBeforeFirstWrite") {
        REQUIRE_FALSE(db.load().has_value());
    }

    SECTION("EmptySnapshotIsStillAWrite") {
        Snapshot snap;
        snap.taken_at = at(1'700'000'000);
        REQUIRE(db.replace(snap));

        auto loaded = db.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->worktrees.empty());
        REQUIRE(loaded->agents.empty());
        REQUIRE(loaded->taken_at == snap.taken_at);
    }

    SECTION("RoundTripFields") {
        auto wt = make_worktree("feature-auth");
        wt.has_server = true;
        wt.has_claude = true;
        wt.git_dirty = true;
        wt.tags = {"frontend", "auth"};
        wt.agent = AgentInfo{.type = "claude", .pid = 4242, .path = wt.path};
        wt.server = ServerInfo{
            .port = 3846,
            .pid = 99,
            .status = "running",
            .url = "http://localhost:3846",
            .health = "healthy",
            .started_at = at(1'700'000'050),
        };

        Snapshot snap;
        snap.worktrees = {wt};
        snap.agents = {AgentRecord{
            .worktree = wt.name,
            .path = wt.path,
            .branch = wt.branch,
            .type = "claude",
            .pid = 4242,
            .start_time = at(1'700'000'000),
            .duration = "5m",
        }};
        snap.taken_at = at(1'700'000'300);
        REQUIRE(db.replace(snap));

        auto loaded = db.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->worktrees.size() == 1);

        const auto& got = loaded->worktrees[0];
        REQUIRE(got.name == "feature-auth");
        REQUIRE(got.path == "/src/feature-auth");
        REQUIRE(got.main_repo == "/src/main");
        REQUIRE(got.discovered_at == wt.discovered_at);
        REQUIRE(got.last_activity == wt.last_activity);
        REQUIRE(got.has_server);
        REQUIRE(got.has_claude);
        REQUIRE_FALSE(got.has_vscode);
        REQUIRE(got.git_dirty);
        REQUIRE(got.tags == std::vector<std::string>{"frontend", "auth"});

        REQUIRE(got.agent.has_value());
        REQUIRE(got.agent->type == "claude");
        REQUIRE(got.agent->pid == 4242);

        REQUIRE(got.server.has_value());
        REQUIRE(got.server->port == 3846);
        REQUIRE(got.server->status == "running");
        REQUIRE(got.server->health == "healthy");
        REQUIRE(got.server->started_at == wt.server->started_at);

        REQUIRE(loaded->agents.size() == 1);
        REQUIRE(loaded->agents[0].pid == 4242);
        REQUIRE(loaded->agents[0].duration == "5m");
        REQUIRE(loaded->agents[0].start_time == at(1'700'000'000));
    }

    SECTION("ReplaceDoesNotAccumulate") {
        Snapshot first;
        first.worktrees = {make_worktree("alpha"), make_worktree("beta")};
        first.taken_at = at(1'700'000'000);
        REQUIRE(db.replace(first));

        Snapshot second;
        second.worktrees = {make_worktree("gamma")};
        second.taken_at = at(1'700'000'030);
        REQUIRE(db.replace(second));

        auto loaded = db.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->worktrees.size() == 1);
        REQUIRE(loaded->worktrees[0].name == "gamma");
        REQUIRE(loaded->taken_at == second.taken_at);
    }

    SECTION("LoadOrdersByName") {
        Snapshot snap;
        snap.worktrees = {make_worktree("zeta"), make_worktree("alpha")};
        REQUIRE(db.replace(snap));

        auto loaded = db.load();
        REQUIRE(loaded->worktrees.size() == 2);
        REQUIRE(loaded->worktrees[0].name == "alpha");
        REQUIRE(loaded->worktrees[1].name == "zeta");
    }

    SECTION("PersistsAcrossReopen") {
        Snapshot snap;
        snap.worktrees = {make_worktree("main")};
        REQUIRE(db.replace(snap));
        db.close();
        REQUIRE_FALSE(db.is_open());

        SnapshotDb reopened;
        REQUIRE(reopened.open(tmp.path));
        auto loaded = reopened.load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->worktrees.size() == 1);
    }

    SECTION("ClosedDbRejectsWrites") {
        db.close();
        REQUIRE_FALSE(db.replace(Snapshot{}));
        REQUIRE_FALSE(db.load().has_value());
    }
}
