// Tool catalog tests with in-process browser and analyzer fakes

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>

#include <devscope/mcp/tool_catalog.h>

#include "../../common/async_helpers.h"
#include "../../common/fake_services.h"
#include "../../common/test_helpers_catch2.h"

using namespace devscope;
using namespace devscope::mcp;
using devscope::test::runSync;

namespace {

struct CatalogFixture {
    CatalogFixture() {
        browser = std::make_shared<test::FakeBrowserDriver>();
        analyzer = std::make_shared<test::FakeIntrospectionBackend>();
        sessions = std::make_shared<streaming::StreamingSessionManager>(browser);
        config.projectRoot = root.path();
        build();
    }

    void build() {
        auto r = buildToolRegistry({sessions, browser, analyzer}, config);
        REQUIRE(r);
        registry = std::move(r).value();
    }

    json call(const std::string& name, const json& args = json::object()) {
        return runSync(registry->callTool(name, args));
    }

    static std::string text(const json& result) {
        return result["content"][0]["text"].get<std::string>();
    }

    static bool isError(const json& result) { return result.value("isError", false); }

    // Structured results carry their JSON as the text content
    static json payload(const json& result) { return json::parse(text(result)); }

    test::TempDirGuard root{"devscope_catalog_"};
    std::shared_ptr<test::FakeBrowserDriver> browser;
    std::shared_ptr<test::FakeIntrospectionBackend> analyzer;
    std::shared_ptr<streaming::StreamingSessionManager> sessions;
    config::ServerConfig config;
    std::unique_ptr<ToolRegistry> registry;
};

} // namespace

TEST_CASE("ToolCatalog - listing", "[mcp][catalog][catch2]") {
    CatalogFixture f;

    SECTION("get_database_schema takes no arguments") {
        auto list = f.registry->listTools()["tools"];
        auto it = std::find_if(list.begin(), list.end(),
                               [](const json& t) { return t["name"] == "get_database_schema"; });
        REQUIRE(it != list.end());
        CHECK((*it)["inputSchema"] == json::parse(R"({"type":"object","properties":{}})"));
    }

    SECTION("groups are registered in a fixed order") {
        CHECK(f.registry->groups() == toolGroups());
        CHECK(f.registry->toolsInGroup("UI Streaming") ==
              std::vector<std::string>{"browse_with_playwright_incremental",
                                       "process_ui_action_incremental",
                                       "get_incremental_ui_state", "set_streaming_mode",
                                       "get_stream_stats", "cleanup_incremental_session",
                                       "get_incremental_debug_info"});
        CHECK(f.registry->listTools()["tools"][0]["name"] == "get_database_schema");
    }

    SECTION("every tool has a description and an object schema") {
        for (const auto& tool : f.registry->listTools()["tools"]) {
            INFO(tool["name"]);
            CHECK_FALSE(tool["description"].get<std::string>().empty());
            CHECK(tool["inputSchema"]["type"] == "object");
        }
    }
}

TEST_CASE("ToolCatalog - missing services are rejected", "[mcp][catalog][catch2]") {
    config::ServerConfig config;
    auto r = buildToolRegistry({nullptr, nullptr, nullptr}, config);
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ToolCatalog - analysis tools", "[mcp][catalog][analysis][catch2]") {
    CatalogFixture f;

    SECTION("report is rendered as summary then data") {
        auto r = f.call("get_database_schema");
        REQUIRE_FALSE(CatalogFixture::isError(r));
        auto expectedData = json{{"kind", "get_database_schema"}, {"arguments", json::object()}};
        CHECK(CatalogFixture::text(r) ==
              "Report for get_database_schema\n\n" + expectedData.dump(2));
    }

    SECTION("aliases query the canonical kind") {
        f.call("get_backend_api_endpoints");
        auto queries = f.analyzer->queries();
        REQUIRE(queries.size() == 1);
        CHECK(queries[0].kind == "get_backend_api_routes");
    }

    SECTION("typed arguments are forwarded") {
        f.call("find_implementations", {{"interface", "Repository"}});
        f.call("get_call_graph");
        f.call("get_references", {{"symbol", "User"}, {"filePath", "models/user.go"}});
        auto queries = f.analyzer->queries();
        REQUIRE(queries.size() == 3);
        CHECK(queries[0].arguments == json{{"interface", "Repository"}});
        CHECK(queries[1].arguments == json{{"function", "main"}});
        CHECK(queries[2].arguments == json{{"symbol", "User"}, {"filePath", "models/user.go"}});
    }

    SECTION("missing required argument") {
        auto r = f.call("find_implementations");
        CHECK(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r) ==
              "Error: interface parameter is required and must be a string");
        CHECK(f.analyzer->queries().empty());
    }

    SECTION("wrongly typed argument") {
        auto r = f.call("search_code", {{"query", 12}});
        CHECK(CatalogFixture::isError(r));
    }

    SECTION("analyzer failure") {
        f.analyzer->failWith(Error{ErrorCode::NotSupported, "no analyzer configured"});
        auto r = f.call("get_env_vars");
        CHECK(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r) == "Error: no analyzer configured");
    }
}

TEST_CASE("ToolCatalog - streaming session flow", "[mcp][catalog][streaming][catch2]") {
    CatalogFixture f;

    auto first = f.call("browse_with_playwright_incremental",
                        {{"url", "https://x"}, {"sessionId", "s1"}, {"streamingMode", "full"}});
    REQUIRE_FALSE(CatalogFixture::isError(first));
    auto initial = CatalogFixture::payload(first);
    CHECK(initial["type"] == "initial");
    CHECK(initial["sessionId"] == "s1");
    CHECK(initial["url"] == "https://x");

    auto second = f.call("browse_with_playwright_incremental",
                         {{"url", "https://x"}, {"sessionId", "s1"}, {"mode", "incremental"}});
    auto delta = CatalogFixture::payload(second);
    CHECK(delta["type"] == "incremental");
    CHECK(delta["regions"] == json::array());
    CHECK(delta["tokenSavings"].get<long long>() > 0);

    SECTION("invalid mode is rejected and the previous mode kept") {
        auto bad = f.call("set_streaming_mode", {{"sessionId", "s1"}, {"mode", "bogus"}});
        CHECK(CatalogFixture::isError(bad));
        CHECK(CatalogFixture::text(bad).find("Invalid streaming mode") != std::string::npos);

        auto state = CatalogFixture::payload(
            f.call("get_incremental_ui_state", {{"sessionId", "s1"}}));
        CHECK(state["mode"] == "incremental");
    }

    SECTION("actions report only changed regions") {
        auto r = f.call("process_ui_action_incremental",
                        {{"sessionId", "s1"},
                         {"action", "type"},
                         {"selector", "#header"},
                         {"text", "Hello"}});
        auto body = CatalogFixture::payload(r);
        REQUIRE(body["regions"].size() == 1);
        CHECK(body["regions"][0]["selector"] == "#header");
        CHECK(body["regions"][0]["kind"] == "changed");
        CHECK(body["regions"][0]["payload"] == "Hello");
    }

    SECTION("unsupported action") {
        auto r = f.call("process_ui_action_incremental",
                        {{"sessionId", "s1"}, {"action", "teleport"}});
        CHECK(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r) == "Error: Unsupported action: teleport");
    }

    SECTION("stats, debug info and cleanup") {
        auto stats = CatalogFixture::payload(f.call("get_stream_stats", {{"sessionId", "s1"}}));
        CHECK(stats["sessionId"] == "s1");
        CHECK(stats["totalDeltas"] == 1);

        auto debug = CatalogFixture::payload(f.call(
            "get_incremental_debug_info", {{"sessionId", "s1"}, {"includeDetailedState", true}}));
        CHECK(debug["counters"]["captures"] == 2);
        CHECK(debug["snapshot"]["selectors"].size() == 3);

        auto cleaned =
            CatalogFixture::payload(f.call("cleanup_incremental_session", {{"sessionId", "s1"}}));
        CHECK(cleaned["cleaned"] == true);

        auto gone = f.call("get_incremental_ui_state", {{"sessionId", "s1"}});
        CHECK(CatalogFixture::isError(gone));
        CHECK(CatalogFixture::text(gone) == "Error: Session not found: s1");
    }
}

TEST_CASE("ToolCatalog - generated session ids", "[mcp][catalog][streaming][catch2]") {
    CatalogFixture f;
    auto a = CatalogFixture::payload(
        f.call("browse_with_playwright_incremental", {{"url", "https://a"}}));
    auto b = CatalogFixture::payload(
        f.call("browse_with_playwright_incremental", {{"url", "https://b"}}));
    CHECK(a["sessionId"].get<std::string>().rfind("ui-", 0) == 0);
    CHECK(a["sessionId"] != b["sessionId"]);
    CHECK(f.sessions->activeSessions() == 2);
}

TEST_CASE("ToolCatalog - one-shot UI tools", "[mcp][catalog][ui][catch2]") {
    CatalogFixture f;

    SECTION("metadata requires a previous capture") {
        auto r = f.call("get_ui_metadata");
        CHECK(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r).find("browse_with_playwright") != std::string::npos);
    }

    SECTION("browse then inspect") {
        f.browser->setScreenshot("aGVsbG8=");
        auto browse = CatalogFixture::payload(f.call("browse_with_playwright",
                                                     {{"url", "https://app.local"}}));
        CHECK(browse["regionCount"] == 3);
        CHECK(browse["regions"] == json::array({"#header", "#main", "#footer"}));

        auto meta = CatalogFixture::payload(f.call("get_ui_metadata"));
        CHECK(meta["url"] == "https://app.local");
        CHECK(meta["components"].size() == 3);

        auto shot = CatalogFixture::payload(f.call("get_latest_screenshot", {{"base64", true}}));
        CHECK(shot["data"] == "aGVsbG8=");
    }

    SECTION("test prompt replays actions") {
        auto r = f.call("generate_ui_test_prompt_with_actions",
                        {{"url", "https://app.local/login"},
                         {"actions", json::array({{{"action", "type"},
                                                   {"selector", "#user"},
                                                   {"text", "alice"}},
                                                  {{"action", "click"},
                                                   {"selector", "#submit"}}})}});
        REQUIRE_FALSE(CatalogFixture::isError(r));
        auto text = CatalogFixture::text(r);
        CHECK(text.find("https://app.local/login") != std::string::npos);
        CHECK(text.find("1. type #user \"alice\"") != std::string::npos);
        CHECK(text.find("2. click #submit") != std::string::npos);
        CHECK(f.browser->actions() == std::vector<std::string>{"type", "click"});
    }

    SECTION("invalid action in the list") {
        auto r = f.call("generate_ui_test_prompt_with_actions",
                        {{"url", "https://app.local"},
                         {"actions", json::array({{{"action", "fly"}}})}});
        CHECK(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r).find("actions[0]") != std::string::npos);
    }

    SECTION("driver failure") {
        f.browser->failWith(Error{ErrorCode::NotSupported, "no browser driver"});
        auto r = f.call("get_visual_context", {{"url", "https://app.local"}});
        CHECK(CatalogFixture::text(r) == "Error: no browser driver");
    }
}

TEST_CASE("ToolCatalog - terminal commands", "[mcp][catalog][interactive][catch2]") {
    CatalogFixture f;

    SECTION("successful command") {
        auto r = f.call("run_terminal_command", {{"command", "echo hello"}});
        REQUIRE_FALSE(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r) == "Command executed successfully.\nOutput: hello\n");
    }

    SECTION("non-zero exit is an error carrying the output") {
        auto r = f.call("run_terminal_command", {{"command", "echo oops >&2; exit 3"}});
        CHECK(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r).find("status 3") != std::string::npos);
        CHECK(CatalogFixture::text(r).find("oops") != std::string::npos);
    }

    SECTION("runs in the project root") {
        devscope::test::write_file(f.root.path() / "marker.txt", "x");
        auto r = f.call("run_terminal_command", {{"command", "ls"}});
        CHECK(CatalogFixture::text(r).find("marker.txt") != std::string::npos);
    }

    SECTION("disabled by configuration") {
        f.config.allowTerminal = false;
        f.build();
        auto r = f.call("run_terminal_command", {{"command", "echo hello"}});
        CHECK(CatalogFixture::isError(r));
        CHECK(CatalogFixture::text(r).find("disabled") != std::string::npos);
    }

    SECTION("empty command") {
        auto r = f.call("run_terminal_command", {{"command", ""}});
        CHECK(CatalogFixture::text(r) == "Error: command must not be empty");
    }
}
