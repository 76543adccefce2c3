#pragma once

#include "snapshot_store.hpp"

#include <string>

struct ApiResponse {
    int status = 200;
    std::string body;
};

// Pull-based read surface over the current snapshot. Stateless apart from
// the store it reads; safe to call from any thread.
class SnapshotApi {
public:
    explicit SnapshotApi(const SnapshotStore& store);

    ApiResponse handle(const std::string& method, const std::string& path) const;

private:
    const SnapshotStore& store_;
};
