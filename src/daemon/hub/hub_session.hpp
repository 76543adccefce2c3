#pragma once

#include "hub/hub.hpp"
#include "hub/hub_client.hpp"
#include "platform/connection.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

// Pumps one subscriber connection: a reader that applies subscribe requests
// and a writer that drains the client's queue and sends keepalive pings.
// Either side failing tears the whole session down and unregisters it.
class HubSession {
public:
    static constexpr std::chrono::milliseconds kDefaultKeepalive{30000};
    static constexpr std::chrono::milliseconds kHandshakeTimeout{5000};

    HubSession(Hub& hub, std::unique_ptr<Connection> conn,
               std::shared_ptr<HubClient> client,
               std::chrono::milliseconds keepalive = kDefaultKeepalive,
               bool verbose = false);
    ~HubSession();

    HubSession(const HubSession&) = delete;
    HubSession& operator=(const HubSession&) = delete;

    // Registers the client with the hub and spawns both pumps. The writer
    // holds back until the reader has completed the connection handshake.
    void start();
    void close();

    bool finished() const {
        return reader_done_.load(std::memory_order_acquire) &&
               writer_done_.load(std::memory_order_acquire);
    }

    const std::shared_ptr<HubClient>& client() const { return client_; }

private:
    static constexpr std::chrono::milliseconds kReadPoll{250};

    void read_loop(std::stop_token st);
    void write_loop(std::stop_token st);
    void teardown();

    void log(const std::string& msg);

    Hub& hub_;
    std::unique_ptr<Connection> conn_;
    std::shared_ptr<HubClient> client_;
    std::chrono::milliseconds keepalive_;
    bool verbose_;

    std::atomic<bool> torn_down_{false};
    std::atomic<bool> reader_done_{false};
    std::atomic<bool> writer_done_{false};

    std::promise<bool> handshake_;
    std::shared_future<bool> ready_;

    std::jthread reader_;
    std::jthread writer_;
};
