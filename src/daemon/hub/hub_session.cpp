#include "hub/hub_session.hpp"

#include <nlohmann/json.hpp>
#include <print>

HubSession::HubSession(Hub& hub, std::unique_ptr<Connection> conn,
                       std::shared_ptr<HubClient> client,
                       std::chrono::milliseconds keepalive, bool verbose)
    : hub_(hub), conn_(std::move(conn)), client_(std::move(client)),
      keepalive_(keepalive), verbose_(verbose),
      ready_(handshake_.get_future().share()) {}

HubSession::~HubSession() {
    close();
    if (reader_.joinable()) reader_.join();
    if (writer_.joinable()) writer_.join();
}

void HubSession::start() {
    hub_.register_client(client_);
    reader_ = std::jthread([this](std::stop_token st) { read_loop(st); });
    writer_ = std::jthread([this](std::stop_token st) { write_loop(st); });
}

void HubSession::close() {
    reader_.request_stop();
    writer_.request_stop();
    teardown();
    // Hub may already be gone; make sure the writer wakes either way.
    client_->close_outbox();
}

void HubSession::teardown() {
    if (torn_down_.exchange(true)) return;
    conn_->shutdown();
    hub_.unregister_client(client_);
}

void HubSession::read_loop(std::stop_token st) {
    bool ok = conn_->handshake(kHandshakeTimeout);
    handshake_.set_value(ok);
    if (!ok) {
        log("client " + std::to_string(client_->id()) + ": handshake failed");
        teardown();
        reader_done_.store(true, std::memory_order_release);
        return;
    }

    std::string line;
    while (!st.stop_requested()) {
        auto status = conn_->read_line(line, kReadPoll);
        if (status == Connection::ReadStatus::Timeout) continue;
        if (status != Connection::ReadStatus::Line) break;

        client_->touch();
        if (line.empty()) continue;

        auto msg = decode(line);
        if (!msg) {
            if (msg.error().kind == DecodeError::Kind::UnknownType) {
                log("client " + std::to_string(client_->id()) + ": ignoring " + msg.error().message);
                continue;
            }
            log("client " + std::to_string(client_->id()) + ": malformed message, closing");
            break;
        }

        if (auto* sub = std::get_if<Subscribe>(&*msg)) {
            client_->add_topics(sub->topics);
            log("client " + std::to_string(client_->id()) + " subscribed to " +
                std::to_string(sub->topics.size()) + " topic(s)");
        }
    }

    teardown();
    reader_done_.store(true, std::memory_order_release);
}

void HubSession::write_loop(std::stop_token st) {
    if (!ready_.get()) {
        writer_done_.store(true, std::memory_order_release);
        return;
    }

    const std::string ping = encode(Ping{});
    client_->touch();

    while (!st.stop_requested()) {
        // Ping only once the peer has been quiet in both directions
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - client_->last_seen());
        auto wait = keepalive_ > elapsed ? keepalive_ - elapsed : std::chrono::milliseconds(0);

        HubClient::Outbound item;
        auto status = client_->outbox().pop_for(item, wait);

        using PopStatus = BoundedQueue<HubClient::Outbound>::PopStatus;
        if (status == PopStatus::Closed) break;

        std::string line;
        if (status == PopStatus::Item) {
            try {
                line = encode(*item);
            } catch (const nlohmann::json::exception& e) {
                std::println(stderr, "hub: failed to encode {}: {}", message_type(*item), e.what());
                continue;
            }
        } else {
            line = ping;
        }

        if (!conn_->write_line(line)) {
            log("client " + std::to_string(client_->id()) + ": write failed, closing");
            break;
        }
        client_->touch();
    }

    teardown();
    writer_done_.store(true, std::memory_order_release);
}

void HubSession::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[treewatch] {}", msg);
    }
}
