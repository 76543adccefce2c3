#pragma once

#include "servers/health_checker.hpp"

#include <chrono>

// Port check first, then an HTTP GET of the server URL. Any response below
// 500 counts as healthy.
class HttpHealthChecker : public HealthChecker {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{2};

    explicit HttpHealthChecker(std::chrono::seconds timeout = kDefaultTimeout);
    ~HttpHealthChecker() override;

    HttpHealthChecker(const HttpHealthChecker&) = delete;
    HttpHealthChecker& operator=(const HttpHealthChecker&) = delete;

    std::string check(const ServerInfo& server) override;

private:
    std::chrono::seconds timeout_;
};
