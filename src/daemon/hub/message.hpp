#pragma once

#include "model/worktree.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Push-channel envelope: {"type": "...", "payload": ...}. The payload shape is
// fixed by the type, so each type is its own struct.

struct WorkspacesUpdated {
    std::vector<Worktree> workspaces;
};

struct AgentsUpdated {
    std::vector<AgentRecord> agents;
};

struct Ping {};

struct Subscribe {
    std::vector<std::string> topics;
};

using Message = std::variant<WorkspacesUpdated, AgentsUpdated, Ping, Subscribe>;

std::string_view message_type(const Message& msg);

// One JSON document, no trailing newline. Throws nlohmann::json::exception
// if a string field is not valid UTF-8.
std::string encode(const Message& msg);

// Inbound decoding. Only `subscribe` carries a meaningful payload from
// clients; `ping` is accepted and ignored by callers.
struct DecodeError {
    enum class Kind { Malformed, UnknownType };

    Kind kind;
    std::string message;
};

std::expected<Message, DecodeError> decode(std::string_view line);
