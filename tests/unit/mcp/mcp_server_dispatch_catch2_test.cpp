// MCPServer end-to-end dispatch tests over in-memory stdio

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <devscope/mcp/mcp_server.h>

#include "../../common/test_helpers_catch2.h"

using namespace devscope;
using namespace devscope::mcp;
using boost::asio::awaitable;

namespace {

using SteadyClock = std::chrono::steady_clock;

// Last time the "stamp" tool ran, as steady_clock ticks
std::atomic<SteadyClock::rep> g_stampedAt{0};

struct EchoRequest {
    using RequestType = EchoRequest;
    std::string text;
    int delayMs = 0;

    static Result<EchoRequest> fromJson(const json& j) {
        if (!j.contains("text") || !j["text"].is_string()) {
            return Error{ErrorCode::InvalidArgument, "text is required"};
        }
        return EchoRequest{j["text"].get<std::string>(), j.value("delayMs", 0)};
    }
};

struct EchoResponse {
    using ResponseType = EchoResponse;
    std::string text;

    json toJson() const { return json{{"echo", text}}; }
};

std::unique_ptr<ToolRegistry> makeTestRegistry() {
    auto registry = std::make_unique<ToolRegistry>();
    auto echo = registry->registerTool<EchoRequest, EchoResponse>(
        "echo",
        [](const EchoRequest& req) -> awaitable<Result<EchoResponse>> {
            if (req.delayMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(req.delayMs));
            }
            co_return EchoResponse{req.text};
        },
        stringParamSchema("text", "Text to echo", true), "Echo the input");
    REQUIRE(echo);

    auto fail = registry->registerTool<EchoRequest, EchoResponse>(
        "explode",
        [](const EchoRequest& req) -> awaitable<Result<EchoResponse>> {
            if (req.text == "throw") {
                throw std::runtime_error("explode handler blew up");
            }
            co_return Error{ErrorCode::NotFound, "nothing named " + req.text};
        },
        stringParamSchema("text", "Failure mode", true), "Fail on purpose");
    REQUIRE(fail);

    auto stamp = registry->registerTool<EchoRequest, EchoResponse>(
        "stamp",
        [](const EchoRequest& req) -> awaitable<Result<EchoResponse>> {
            g_stampedAt.store(SteadyClock::now().time_since_epoch().count());
            co_return EchoResponse{req.text};
        },
        stringParamSchema("text", "Text to echo", true), "Record when the call ran");
    REQUIRE(stamp);
    return registry;
}

std::string line(const json& message) {
    return message.dump() + "\n";
}

json request(const json& id, const std::string& method, json params = nullptr) {
    json m{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        m["params"] = std::move(params);
    }
    return m;
}

json toolCall(const json& id, const std::string& name, json arguments) {
    return request(id, "tools/call", json{{"name", name}, {"arguments", std::move(arguments)}});
}

class ServerHarness {
public:
    explicit ServerHarness(std::string input, ServerOptions options = {})
        : in_(std::move(input)) {
        options.sweepInterval = std::chrono::seconds{0};
        auto transport =
            std::make_unique<StdioTransport>(in_, out_, StdioTransport::Options{});
        server_ = std::make_unique<MCPServer>(std::move(transport), makeTestRegistry(), nullptr,
                                              options);
    }

    // Reads until end of input; every accepted request has been answered on return
    std::vector<json> run() {
        server_->start();
        return devscope::test::parse_ndjson(out_.str());
    }

    std::string rawOutput() const { return out_.str(); }
    MCPServer& server() { return *server_; }

private:
    std::istringstream in_;
    std::ostringstream out_;
    std::unique_ptr<MCPServer> server_;
};

std::map<std::string, std::vector<json>> byId(const std::vector<json>& messages) {
    std::map<std::string, std::vector<json>> out;
    for (const auto& m : messages) {
        out[m["id"].dump()].push_back(m);
    }
    return out;
}

} // namespace

TEST_CASE("MCPServer - unknown method over Content-Length framing",
          "[mcp][server][dispatch][catch2]") {
    // Declared length counts the trailing newline
    ServerHarness harness(
        "Content-Length: 41\r\n\r\n{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
    auto messages = harness.run();

    REQUIRE(messages.size() == 1);
    CHECK(messages[0] == json::parse(R"({"jsonrpc":"2.0","id":1,
                                         "error":{"code":-32601,
                                                  "message":"Method not found: ping"}})"));
}

TEST_CASE("MCPServer - notifications produce no output", "[mcp][server][dispatch][catch2]") {
    ServerHarness harness(line(json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}) +
                          line(json{{"jsonrpc", "2.0"}, {"method", "unknown/notification"}}));
    auto messages = harness.run();

    CHECK(messages.empty());
    CHECK(harness.rawOutput().empty());
    CHECK(harness.server().clientInitialized());
}

TEST_CASE("MCPServer - initialize negotiates the protocol version",
          "[mcp][server][initialize][catch2]") {
    SECTION("supported version is echoed") {
        ServerHarness harness(line(request(
            1, "initialize",
            {{"protocolVersion", "2024-11-05"},
             {"clientInfo", {{"name", "test-client"}, {"version", "1.2"}}}})));
        auto messages = harness.run();

        REQUIRE(messages.size() == 1);
        const auto& result = messages[0]["result"];
        CHECK(result["protocolVersion"] == "2024-11-05");
        CHECK(result["capabilities"]["tools"]["listChanged"] == false);
        CHECK(result["serverInfo"]["name"] == "devscope");
        CHECK(harness.server().negotiatedProtocolVersion() == "2024-11-05");
        CHECK(harness.server().clientInfo().name == "test-client");
    }

    SECTION("unknown version falls back to the newest") {
        ServerHarness harness(line(request(1, "initialize", {{"protocolVersion", "1999-01-01"}})));
        auto messages = harness.run();

        REQUIRE(messages.size() == 1);
        CHECK(messages[0]["result"]["protocolVersion"] == supportedProtocolVersions().back());
    }
}

TEST_CASE("MCPServer - protocol errors", "[mcp][server][errors][catch2]") {
    SECTION("invalid request gets -32600 and the loop continues") {
        ServerHarness harness(line(json{{"jsonrpc", "1.0"}, {"id", 1}, {"method", "tools/list"}}) +
                              line(request(2, "tools/list")));
        auto ids = byId(harness.run());

        REQUIRE(ids.size() == 2);
        CHECK(ids["1"][0]["error"]["code"] == protocol::INVALID_REQUEST);
        CHECK(ids["2"][0]["result"]["tools"].size() == 3);
    }

    SECTION("parse error answers with a null id and closes the connection") {
        ServerHarness harness("{not json\n" + line(request(2, "tools/list")));
        auto messages = harness.run();

        REQUIRE(messages.size() == 1);
        CHECK(messages[0]["id"].is_null());
        CHECK(messages[0]["error"]["code"] == protocol::PARSE_ERROR);
    }

    SECTION("tools/call without a name is invalid params") {
        ServerHarness harness(line(request(3, "tools/call", json::object())));
        auto messages = harness.run();

        REQUIRE(messages.size() == 1);
        CHECK(messages[0]["error"]["code"] == protocol::INVALID_PARAMS);
    }

    SECTION("a throwing handler becomes -32000 with the exception message") {
        ServerHarness harness(line(toolCall(4, "explode", {{"text", "throw"}})));
        auto messages = harness.run();

        REQUIRE(messages.size() == 1);
        CHECK(messages[0]["id"] == 4);
        CHECK(messages[0]["error"]["code"] == protocol::SERVER_ERROR);
        CHECK(messages[0]["error"]["message"] == "explode handler blew up");
    }
}

TEST_CASE("MCPServer - tool level failures are successful results",
          "[mcp][server][tools][catch2]") {
    ServerHarness harness(line(toolCall(1, "explode", {{"text", "widget"}})) +
                          line(toolCall(2, "no_such_tool", json::object())) +
                          line(toolCall(3, "echo", json::object())) +
                          line(toolCall("s", "echo", {{"text", "hi"}})));
    auto ids = byId(harness.run());

    REQUIRE(ids.size() == 4);
    const auto& failed = ids["1"][0]["result"];
    CHECK(failed["isError"] == true);
    CHECK(failed["content"][0]["text"] == "Error: nothing named widget");

    const auto& unknown = ids["2"][0]["result"];
    CHECK(unknown["isError"] == true);
    CHECK(unknown["content"][0]["text"] == "Unknown tool: no_such_tool");

    CHECK(ids["3"][0]["result"]["content"][0]["text"] == "Error: text is required");

    // String ids are echoed unchanged
    const auto& ok = ids["\"s\""][0];
    CHECK(ok["id"] == "s");
    CHECK_FALSE(ok["result"].contains("isError"));
    CHECK(json::parse(ok["result"]["content"][0]["text"].get<std::string>()) ==
          json{{"echo", "hi"}});
}

TEST_CASE("MCPServer - every request is answered exactly once",
          "[mcp][server][concurrency][catch2]") {
    constexpr int kRequests = 64;
    std::string input;
    for (int i = 0; i < kRequests; ++i) {
        input += line(toolCall(i, "echo", {{"text", std::to_string(i)}, {"delayMs", i % 4}}));
    }
    input += line(request("list", "tools/list"));

    ServerOptions options;
    options.workerThreads = 4;
    ServerHarness harness(input, options);
    auto messages = harness.run();
    auto ids = byId(messages);

    REQUIRE(messages.size() == static_cast<std::size_t>(kRequests + 1));
    for (int i = 0; i < kRequests; ++i) {
        const auto& responses = ids[json(i).dump()];
        REQUIRE(responses.size() == 1);
        auto text = responses[0]["result"]["content"][0]["text"].get<std::string>();
        CHECK(json::parse(text)["echo"] == std::to_string(i));
    }
    CHECK(harness.server().responsesWritten() == static_cast<std::size_t>(kRequests + 1));
    CHECK(harness.server().inFlightRequests() == 0);
}

TEST_CASE("MCPServer - duplicate in-flight id is dropped", "[mcp][server][concurrency][catch2]") {
    ServerHarness harness(line(toolCall(9, "echo", {{"text", "first"}, {"delayMs", 200}})) +
                          line(toolCall(9, "echo", {{"text", "second"}})));
    auto messages = harness.run();

    REQUIRE(messages.size() == 1);
    auto text = messages[0]["result"]["content"][0]["text"].get<std::string>();
    CHECK(json::parse(text)["echo"] == "first");
}

TEST_CASE("MCPServer - cancellation", "[mcp][server][cancel][catch2]") {
    SECTION("cancelled request is answered with -32800") {
        ServerHarness harness(
            line(toolCall(5, "echo", {{"text", "slow"}, {"delayMs", 300}})) +
            line(json{{"jsonrpc", "2.0"},
                      {"method", "notifications/cancelled"},
                      {"params", {{"requestId", 5}, {"reason", "user abort"}}}}));
        auto messages = harness.run();

        REQUIRE(messages.size() == 1);
        CHECK(messages[0]["id"] == 5);
        CHECK(messages[0]["error"]["code"] == protocol::REQUEST_CANCELLED);
        CHECK(messages[0]["error"]["message"] == "Request cancelled");
    }

    SECTION("cancelling an unknown id is ignored") {
        ServerHarness harness(
            line(json{{"jsonrpc", "2.0"},
                      {"method", "notifications/cancelled"},
                      {"params", {{"requestId", 77}}}}) +
            line(toolCall(6, "echo", {{"text", "ok"}})));
        auto messages = harness.run();

        REQUIRE(messages.size() == 1);
        CHECK(messages[0]["id"] == 6);
        CHECK(messages[0].contains("result"));
    }
}

TEST_CASE("MCPServer - logging/setLevel", "[mcp][server][catch2]") {
    ServerHarness harness(line(request(1, "logging/setLevel", {{"level", "warning"}})) +
                          line(request(2, "logging/setLevel", {{"level", "loud"}})));
    auto ids = byId(harness.run());

    CHECK(ids["1"][0]["result"] == json::object());
    CHECK(ids["2"][0]["error"]["code"] == protocol::INVALID_PARAMS);
    spdlog::set_level(spdlog::level::info);
}

TEST_CASE("MCPServer - batch requests are answered individually", "[mcp][server][catch2]") {
    json batch = json::array({request(1, "tools/list"),
                              json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
                              request(2, "nope")});
    ServerHarness harness(line(batch));
    auto ids = byId(harness.run());

    REQUIRE(ids.size() == 2);
    CHECK(ids["1"][0].contains("result"));
    CHECK(ids["2"][0]["error"]["message"] == "Method not found: nope");
}

TEST_CASE("MCPServer - dispatch table is frozen after construction", "[mcp][server][catch2]") {
    ServerHarness harness("");
    auto& table = harness.server().dispatchTable();
    CHECK(table.frozen());
    CHECK(table.contains("tools/call"));
    CHECK_FALSE(table.contains("ping"));
}

TEST_CASE("MCPServer - a slow tools/call notification does not stall intake",
          "[mcp][server][concurrency][catch2]") {
    json slowCall{{"jsonrpc", "2.0"},
                  {"method", "tools/call"},
                  {"params",
                   {{"name", "echo"}, {"arguments", {{"text", "slow"}, {"delayMs", 1000}}}}}};
    ServerHarness harness(line(slowCall) + line(toolCall(7, "stamp", {{"text", "now"}})));

    g_stampedAt.store(0);
    const auto started = SteadyClock::now();
    auto messages = harness.run();

    REQUIRE(messages.size() == 1);
    CHECK(messages[0]["id"] == 7);
    REQUIRE(g_stampedAt.load() != 0);
    const auto stampedAt = SteadyClock::time_point(SteadyClock::duration(g_stampedAt.load()));
    CHECK(stampedAt - started < std::chrono::milliseconds(500));
    // start() still drains the notification before returning
    CHECK(SteadyClock::now() - started >= std::chrono::milliseconds(1000));
}
