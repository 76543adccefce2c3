#pragma once

#include <expected>
#include <string>

// Blocking GETs against the daemon's snapshot API.
class ApiClient {
public:
    explicit ApiClient(std::string base_url, long timeout_s = 5);
    ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    // Body of a 2xx response; anything else is an error.
    std::expected<std::string, std::string> get(const std::string& path) const;

private:
    std::string base_url_;
    long timeout_s_;
};
