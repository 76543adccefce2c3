#include <catch2/catch_test_macros.hpp>

#include "hub/message.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Message envelope", "[hub]") {

    SECTION("EncodePing") {
        auto j = json::parse(encode(Ping{}));
        REQUIRE(j["type"] == "ping");
        REQUIRE_FALSE(j.contains("payload"));
    }

    SECTION("EncodeWorkspaces") {
        Worktree wt;
        wt.name = "main";
        wt.path = "/src/app";
        wt.branch = "main";

        auto j = json::parse(encode(WorkspacesUpdated{{wt}}));
        REQUIRE(j["type"] == "workspaces_updated");
        REQUIRE(j["payload"].is_array());
        REQUIRE(j["payload"].size() == 1);
        REQUIRE(j["payload"][0]["name"] == "main");
    }

    SECTION("EncodeAgents") {
        AgentRecord a{.worktree = "main", .path = "/src/app", .branch = "main", .type = "claude", .pid = 42};
        auto j = json::parse(encode(AgentsUpdated{{a}}));
        REQUIRE(j["type"] == "agents_updated");
        REQUIRE(j["payload"][0]["pid"] == 42);
    }

    SECTION("EncodeEmptyListsAsArrays") {
        auto j = json::parse(encode(WorkspacesUpdated{}));
        REQUIRE(j["payload"].is_array());
        REQUIRE(j["payload"].empty());
    }

    SECTION("DecodeSubscribe") {
        auto msg = decode(R"({"type":"subscribe","payload":["workspaces","agents"]})");
        REQUIRE(msg.has_value());
        auto* sub = std::get_if<Subscribe>(&*msg);
        REQUIRE(sub != nullptr);
        REQUIRE(sub->topics == std::vector<std::string>{"workspaces", "agents"});
    }

    SECTION("DecodeSubscribeWithoutPayload") {
        auto msg = decode(R"({"type":"subscribe"})");
        REQUIRE(msg.has_value());
        REQUIRE(std::get<Subscribe>(*msg).topics.empty());
    }

    SECTION("DecodePing") {
        auto msg = decode(R"({"type":"ping"})");
        REQUIRE(msg.has_value());
        REQUIRE(std::holds_alternative<Ping>(*msg));
    }

    SECTION("DecodeUnknownType") {
        auto msg = decode(R"({"type":"reboot"})");
        REQUIRE_FALSE(msg.has_value());
        REQUIRE(msg.error().kind == DecodeError::Kind::UnknownType);
    }

    SECTION("DecodeMalformed") {
        for (const char* line : {"not json", "[1,2]", R"({"payload":[]})", R"({"type":5})", ""}) {
            INFO(line);
            auto msg = decode(line);
            REQUIRE_FALSE(msg.has_value());
            REQUIRE(msg.error().kind == DecodeError::Kind::Malformed);
        }
    }
}
