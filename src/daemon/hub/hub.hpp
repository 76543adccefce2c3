#pragma once

#include "hub/hub_client.hpp"
#include "hub/message.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

// Owns the live subscriber set. Every membership change and every broadcast
// fan-out runs on one control thread; producers only enqueue events.
class Hub {
public:
    explicit Hub(bool verbose = false);
    ~Hub();

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    void start();
    // Closes every client's queue and joins the control thread.
    void stop();

    void register_client(std::shared_ptr<HubClient> client);
    // Removing an unknown client is a no-op.
    void unregister_client(std::shared_ptr<HubClient> client);
    // Drop-on-full per client; never blocks the caller or the control thread.
    void broadcast(Message msg);

    // Blocks until every event posted before this call has been handled.
    void sync();

    size_t client_count() const { return client_count_.load(std::memory_order_acquire); }

private:
    struct RegisterEvent { std::shared_ptr<HubClient> client; };
    struct UnregisterEvent { std::shared_ptr<HubClient> client; };
    struct BroadcastEvent { HubClient::Outbound message; };
    struct BarrierEvent { std::shared_ptr<std::promise<void>> done; };

    using Event = std::variant<RegisterEvent, UnregisterEvent, BroadcastEvent, BarrierEvent>;

    void post(Event ev);
    void run(std::stop_token st);
    void handle(Event& ev);

    void log(const std::string& msg);

    bool verbose_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    bool running_ = false;

    // Control thread only
    std::vector<std::shared_ptr<HubClient>> clients_;
    std::atomic<size_t> client_count_{0};

    std::jthread loop_;
};
