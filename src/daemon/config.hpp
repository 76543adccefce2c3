#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Scan {
        std::vector<std::string> roots;  // empty: $HOME
        int max_depth = 3;               // negative: unlimited
        uint32_t interval_seconds = 30;
    } scan;

    std::vector<std::string> agents = {"claude", "gemini"};

    struct Editor {
        std::string process = "code";
        std::string marker_dir = ".vscode-server";
    } editor;

    struct Hub {
        std::string socket;  // empty: platform default
        size_t queue_capacity = 256;
        uint32_t keepalive_seconds = 30;
    } hub;

    struct Api {
        std::string host = "127.0.0.1";
        uint16_t port = 3099;
        uint16_t ws_port = 3100;  // browser push channel, path /ws
    } api;

    // Empty paths resolve to the platform defaults.
    std::string servers_file;
    std::string snapshot_db;

    struct Ports {
        uint16_t min = 3000;
        uint16_t max = 3999;
    } ports;

    std::vector<std::string> scan_roots() const;
    std::string hub_socket() const;
    std::string servers_path() const;
    std::string snapshot_db_path() const;

    static Config load(const std::string& path);
    static Config load_default();
};
