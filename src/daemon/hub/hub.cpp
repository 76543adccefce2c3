#include "hub/hub.hpp"

#include <algorithm>
#include <print>

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

Hub::Hub(bool verbose) : verbose_(verbose) {}

Hub::~Hub() {
    stop();
}

void Hub::start() {
    std::lock_guard lock(mu_);
    if (running_) return;
    running_ = true;
    loop_ = std::jthread([this](std::stop_token st) { run(st); });
}

void Hub::stop() {
    {
        // The stop request must land while the control thread is either
        // outside its wait or blocked in it, never between predicate and wait.
        std::lock_guard lock(mu_);
        if (!running_) return;
        running_ = false;
        loop_.request_stop();
        cv_.notify_all();
    }
    if (loop_.joinable()) loop_.join();
}

void Hub::register_client(std::shared_ptr<HubClient> client) {
    post(RegisterEvent{std::move(client)});
}

void Hub::unregister_client(std::shared_ptr<HubClient> client) {
    post(UnregisterEvent{std::move(client)});
}

void Hub::broadcast(Message msg) {
    post(BroadcastEvent{std::make_shared<const Message>(std::move(msg))});
}

void Hub::sync() {
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    {
        std::lock_guard lock(mu_);
        if (!running_) return;
        events_.push_back(BarrierEvent{std::move(done)});
    }
    cv_.notify_one();
    fut.wait();
}

void Hub::post(Event ev) {
    {
        std::lock_guard lock(mu_);
        if (running_) {
            events_.push_back(std::move(ev));
            cv_.notify_one();
            return;
        }
    }
    // Hub is down: a late registrant must still see its queue closed.
    if (auto* reg = std::get_if<RegisterEvent>(&ev)) {
        reg->client->close_outbox();
    }
}

void Hub::run(std::stop_token st) {
    log("hub started");

    for (;;) {
        std::deque<Event> batch;
        {
            std::unique_lock lock(mu_);
            cv_.wait(lock, [&] { return st.stop_requested() || !events_.empty(); });
            batch.swap(events_);
        }

        for (auto& ev : batch) handle(ev);

        if (st.stop_requested()) break;
    }

    // Events raced with stop(); drain them so waiters and late clients settle.
    std::deque<Event> rest;
    {
        std::lock_guard lock(mu_);
        rest.swap(events_);
    }
    for (auto& ev : rest) handle(ev);

    for (auto& c : clients_) c->close_outbox();
    clients_.clear();
    client_count_.store(0, std::memory_order_release);

    log("hub stopped");
}

void Hub::handle(Event& ev) {
    std::visit(overloaded{
        [this](RegisterEvent& e) {
            clients_.push_back(std::move(e.client));
            client_count_.store(clients_.size(), std::memory_order_release);
            log("client " + std::to_string(clients_.back()->id()) + " registered (" +
                std::to_string(clients_.size()) + " total)");
        },
        [this](UnregisterEvent& e) {
            auto it = std::ranges::find(clients_, e.client);
            if (it == clients_.end()) return;
            (*it)->close_outbox();
            clients_.erase(it);
            client_count_.store(clients_.size(), std::memory_order_release);
            log("client " + std::to_string(e.client->id()) + " unregistered (" +
                std::to_string(clients_.size()) + " total)");
        },
        [this](BroadcastEvent& e) {
            for (auto& c : clients_) {
                if (!c->offer(e.message)) {
                    log("client " + std::to_string(c->id()) + " queue full, dropping " +
                        std::string(message_type(*e.message)));
                }
            }
        },
        [](BarrierEvent& e) {
            e.done->set_value();
        },
    }, ev);
}

void Hub::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[treewatch] {}", msg);
    }
}
