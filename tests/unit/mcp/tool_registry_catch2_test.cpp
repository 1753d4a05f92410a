// ToolRegistry registration, listing and wrapper behavior

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <string>

#include <devscope/mcp/tool_registry.h>

#include "../../common/async_helpers.h"

using namespace devscope;
using namespace devscope::mcp;
using boost::asio::awaitable;
using devscope::test::runSync;

namespace {

struct CountRequest {
    using RequestType = CountRequest;
    int n = 0;

    static Result<CountRequest> fromJson(const json& j) {
        auto n = json_utils::get_field<int>(j, "n");
        if (!n) {
            return n.error();
        }
        return CountRequest{n.value()};
    }
};

struct CountResponse {
    using ResponseType = CountResponse;
    int n = 0;

    json toJson() const { return json{{"n", n}}; }
};

struct SummaryResponse {
    using ResponseType = SummaryResponse;
    int n = 0;

    json toJson() const { return json{{"n", n}}; }
    std::string toText() const { return "counted " + std::to_string(n); }
};

awaitable<Result<CountResponse>> doubleIt(const CountRequest& req) {
    co_return CountResponse{req.n * 2};
}

} // namespace

TEST_CASE("ToolRegistry - register and list", "[mcp][registry][catch2]") {
    ToolRegistry registry;
    REQUIRE(registry.registerTool<CountRequest, CountResponse>(
        "double", doubleIt, stringParamSchema("n", "A number", true), "Double it", "Math"));
    REQUIRE(registry.registerTool<CountRequest, CountResponse>("noschema", doubleIt, nullptr,
                                                               "No schema given", "Other"));

    CHECK(registry.size() == 2);
    auto list = registry.listTools();
    REQUIRE(list["tools"].size() == 2);
    CHECK(list["tools"][0]["name"] == "double");
    CHECK(list["tools"][0]["description"] == "Double it");
    CHECK(list["tools"][0]["inputSchema"]["required"] == json::array({"n"}));
    // A null schema becomes the empty object schema
    CHECK(list["tools"][1]["inputSchema"] ==
          json{{"type", "object"}, {"properties", json::object()}});

    CHECK(registry.groups() == std::vector<std::string>{"Math", "Other"});
    CHECK(registry.toolsInGroup("Math") == std::vector<std::string>{"double"});
    REQUIRE(registry.getTool("double") != nullptr);
    CHECK(registry.getTool("triple") == nullptr);
}

TEST_CASE("ToolRegistry - duplicate names are rejected", "[mcp][registry][catch2]") {
    ToolRegistry registry;
    REQUIRE(registry.registerTool<CountRequest, CountResponse>("double", doubleIt, nullptr, "a"));
    auto again = registry.registerTool<CountRequest, CountResponse>("double", doubleIt, nullptr,
                                                                    "b");
    REQUIRE_FALSE(again);
    CHECK(again.error().message == "Tool already registered: double");
    CHECK(registry.size() == 1);
}

TEST_CASE("ToolRegistry - call results", "[mcp][registry][catch2]") {
    ToolRegistry registry;
    REQUIRE(registry.registerTool<CountRequest, CountResponse>("double", doubleIt, nullptr, "a"));
    REQUIRE(registry.registerTool<CountRequest, SummaryResponse>(
        "summary",
        [](const CountRequest& req) -> awaitable<Result<SummaryResponse>> {
            if (req.n < 0) {
                co_return Error{ErrorCode::InvalidArgument, "n must be non-negative"};
            }
            co_return SummaryResponse{req.n};
        },
        nullptr, "b"));

    SECTION("structured response is compact JSON text") {
        auto r = runSync(registry.callTool("double", json{{"n", 21}}));
        CHECK_FALSE(r.contains("isError"));
        CHECK(r["content"][0]["type"] == "text");
        CHECK(r["content"][0]["text"] == R"({"n":42})");
    }

    SECTION("text summary responses use toText") {
        auto r = runSync(registry.callTool("summary", json{{"n", 3}}));
        CHECK(r["content"][0]["text"] == "counted 3");
    }

    SECTION("handler failure is an error result") {
        auto r = runSync(registry.callTool("summary", json{{"n", -1}}));
        CHECK(r["isError"] == true);
        CHECK(r["content"][0]["text"] == "Error: n must be non-negative");
    }

    SECTION("argument validation failure is an error result") {
        auto r = runSync(registry.callTool("double", json{{"n", "x"}}));
        CHECK(r["isError"] == true);
        CHECK(r["content"][0]["text"].get<std::string>().rfind("Error: Invalid field 'n'", 0) ==
              0);
    }

    SECTION("unknown tool") {
        auto r = runSync(registry.callTool("missing", json::object()));
        CHECK(r ==
              json{{"content", json::array({json{{"type", "text"},
                                                 {"text", "Unknown tool: missing"}}})},
                   {"isError", true}});
    }
}

TEST_CASE("Tool result helpers", "[mcp][registry][catch2]") {
    CHECK(makeToolError("bad") ==
          json::parse(R"({"content":[{"type":"text","text":"Error: bad"}],"isError":true})"));
    CHECK(makeToolText("ok") == json::parse(R"({"content":[{"type":"text","text":"ok"}]})"));
    CHECK(stringParamSchema("q", "query", false).contains("required") == false);
}
