#pragma once

#include "hub/bounded_queue.hpp"
#include "hub/message.hpp"
#include "model/worktree.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// One subscriber as the hub sees it: an outbound queue plus advisory topics.
class HubClient {
public:
    using Outbound = std::shared_ptr<const Message>;

    static constexpr size_t kDefaultQueueCapacity = 256;

    explicit HubClient(size_t queue_capacity = kDefaultQueueCapacity);

    HubClient(const HubClient&) = delete;
    HubClient& operator=(const HubClient&) = delete;

    uint64_t id() const { return id_; }

    // Non-blocking; false if the queue is full or already closed.
    bool offer(Outbound msg) { return outbox_.try_push(std::move(msg)); }

    BoundedQueue<Outbound>& outbox() { return outbox_; }
    void close_outbox() { outbox_.close(); }

    void add_topics(const std::vector<std::string>& topics);
    bool subscribed(const std::string& topic) const;

    // Last time anything crossed the connection in either direction; drives
    // the keepalive.
    void touch();
    TimePoint last_seen() const;

private:
    static std::atomic<uint64_t> next_id_;

    uint64_t id_;
    BoundedQueue<Outbound> outbox_;

    mutable std::mutex mu_;
    std::set<std::string> topics_;
    TimePoint last_seen_;
};
