#include "hub/hub_client.hpp"

std::atomic<uint64_t> HubClient::next_id_{1};

HubClient::HubClient(size_t queue_capacity)
    : id_(next_id_.fetch_add(1, std::memory_order_relaxed)),
      outbox_(queue_capacity),
      last_seen_(Clock::now()) {}

void HubClient::add_topics(const std::vector<std::string>& topics) {
    std::lock_guard lock(mu_);
    topics_.insert(topics.begin(), topics.end());
}

bool HubClient::subscribed(const std::string& topic) const {
    std::lock_guard lock(mu_);
    return topics_.contains(topic);
}

void HubClient::touch() {
    std::lock_guard lock(mu_);
    last_seen_ = Clock::now();
}

TimePoint HubClient::last_seen() const {
    std::lock_guard lock(mu_);
    return last_seen_;
}
