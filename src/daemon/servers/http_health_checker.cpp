#include "servers/http_health_checker.hpp"

#include "port/port_prober.hpp"

#include <curl/curl.h>

static size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

HttpHealthChecker::HttpHealthChecker(std::chrono::seconds timeout) : timeout_(timeout) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpHealthChecker::~HttpHealthChecker() {
    curl_global_cleanup();
}

std::string HttpHealthChecker::check(const ServerInfo& server) {
    if (!server.is_running()) return "unknown";
    if (server.port <= 0 || server.port > 65535) return "unhealthy";
    if (!port::is_listening(static_cast<uint16_t>(server.port))) return "unhealthy";

    std::string url = server.url;
    if (url.empty()) url = "http://localhost:" + std::to_string(server.port);

    CURL* curl = curl_easy_init();
    if (!curl) return "unknown";

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long code = 0;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) return "unhealthy";
    return code < 500 ? "healthy" : "unhealthy";
}
