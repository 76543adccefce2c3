#include "hub/message.hpp"

#include "model/json.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

std::string_view message_type(const Message& msg) {
    return std::visit(overloaded{
        [](const WorkspacesUpdated&) { return std::string_view("workspaces_updated"); },
        [](const AgentsUpdated&) { return std::string_view("agents_updated"); },
        [](const Ping&) { return std::string_view("ping"); },
        [](const Subscribe&) { return std::string_view("subscribe"); },
    }, msg);
}

std::string encode(const Message& msg) {
    json j = {{"type", std::string(message_type(msg))}};

    std::visit(overloaded{
        [&j](const WorkspacesUpdated& m) { j["payload"] = workspaces_json(m.workspaces, Clock::now()); },
        [&j](const AgentsUpdated& m) { j["payload"] = agents_json(m.agents); },
        [](const Ping&) {},
        [&j](const Subscribe& m) { j["payload"] = m.topics; },
    }, msg);

    return j.dump();
}

std::expected<Message, DecodeError> decode(std::string_view line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        return std::unexpected(DecodeError{DecodeError::Kind::Malformed, e.what()});
    }

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return std::unexpected(DecodeError{DecodeError::Kind::Malformed, "missing type"});
    }

    auto type = j["type"].get<std::string>();

    if (type == "subscribe") {
        Subscribe sub;
        if (j.contains("payload") && j["payload"].is_array()) {
            for (auto& t : j["payload"]) {
                if (t.is_string()) sub.topics.push_back(t.get<std::string>());
            }
        }
        return sub;
    }

    if (type == "ping") return Ping{};

    return std::unexpected(DecodeError{DecodeError::Kind::UnknownType, "unknown type: " + type});
}
