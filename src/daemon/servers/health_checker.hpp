#pragma once

#include "model/worktree.hpp"

#include <string>

// Classifies a dev server as "healthy", "unhealthy" or "unknown".
class HealthChecker {
public:
    virtual ~HealthChecker() = default;
    virtual std::string check(const ServerInfo& server) = 0;
};
