#include "api_client.hpp"

#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

ApiClient::ApiClient(std::string base_url, long timeout_s)
    : base_url_(std::move(base_url)), timeout_s_(timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ApiClient::~ApiClient() {
    curl_global_cleanup();
}

std::expected<std::string, std::string> ApiClient::get(const std::string& path) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string url = base_url_ + path;
    std::string body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_s_);

    CURLcode res = curl_easy_perform(curl);

    long code = 0;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (code < 200 || code >= 300) {
        return std::unexpected("HTTP " + std::to_string(code) + ": " + body);
    }
    return body;
}
