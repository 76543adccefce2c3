#pragma once

#include "activity/activity_probe.hpp"
#include "config.hpp"
#include "hub/hub.hpp"
#include "hub/hub_session.hpp"
#include "model/worktree.hpp"
#include "platform/connection.hpp"
#include "platform/process_inspector.hpp"
#include "servers/health_checker.hpp"
#include "snapshot_store.hpp"
#include "storage/snapshot_db.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Portable daemon logic. Everything except build_snapshot() runs on the
// event loop thread; build_snapshot() runs on the refresh worker.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               const ProcessInspector& inspector, HealthChecker& health,
               Hub& hub, SnapshotStore& store, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // Starts a discovery pass on the worker. A request while one is running
    // is folded into a single follow-up pass.
    void request_refresh();
    void on_refresh_complete();
    bool refresh_in_flight() const { return refresh_in_flight_; }

    // Take ownership of an accepted subscriber: a Unix socket speaking
    // newline-delimited JSON, or a TCP socket about to upgrade to WebSocket.
    void on_hub_client(int fd);
    void on_ws_client(int fd);
    void reap_sessions();
    size_t session_count() const { return sessions_.size(); }

    Snapshot build_snapshot() const;

    void shutdown();

private:
    void start_worker();
    void publish(Snapshot snapshot);
    void attach_session(std::unique_ptr<Connection> conn);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    const ProcessInspector& inspector_;
    HealthChecker& health_;
    Hub& hub_;
    SnapshotStore& store_;
    NotifyCallback notify_;

    ActivityProbe probe_;
    SnapshotDb db_;

    std::vector<std::unique_ptr<HubSession>> sessions_;

    bool refresh_in_flight_ = false;
    bool refresh_pending_ = false;
    Snapshot worker_result_;
    std::jthread worker_;
};
