// Region diffing and snapshot decoding

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <devscope/crypto/sha256.h>
#include <devscope/streaming/region_diff.h>
#include <devscope/streaming/ui_snapshot.h>

using namespace devscope::streaming;

namespace {

UiSnapshot page(std::vector<UiRegion> regions) {
    UiSnapshot snap;
    snap.url = "https://x";
    snap.title = "X";
    snap.regions = std::move(regions);
    return snap;
}

} // namespace

TEST_CASE("RegionDiff - identical snapshots produce no deltas", "[streaming][diff][catch2]") {
    auto a = page({{"#a", "one"}, {"#b", json{{"n", 1}}}});
    auto deltas = diffSnapshots(a, a);
    CHECK(deltas.empty());
    CHECK(deltaByteSize(deltas) == 2); // "[]"
}

TEST_CASE("RegionDiff - removed, added and changed regions", "[streaming][diff][catch2]") {
    auto before = page({{"#a", "one"}, {"#b", "two"}, {"#c", "three"}});
    auto after = page({{"#c", "THREE"}, {"#a", "one"}, {"#d", "four"}});

    auto deltas = diffSnapshots(before, after);
    REQUIRE(deltas.size() == 3);
    // Removals come first, then additions and changes in the new order
    CHECK(deltas[0] == RegionDelta{DeltaKind::Removed, "#b", nullptr});
    CHECK(deltas[1] == RegionDelta{DeltaKind::Changed, "#c", "THREE"});
    CHECK(deltas[2] == RegionDelta{DeltaKind::Added, "#d", "four"});

    auto j = deltasToJson(deltas);
    CHECK(j[0] == json{{"kind", "removed"}, {"selector", "#b"}, {"payload", nullptr}});
}

TEST_CASE("UiSnapshot - decoding driver output", "[streaming][snapshot][catch2]") {
    SECTION("full document") {
        auto r = UiSnapshot::fromJson(json::parse(R"({
            "url": "https://x", "title": "T", "screenshot": "AAAA",
            "regions": [{"selector": "#a", "content": {"text": "hi"}}, {"selector": "#b"}]
        })"));
        REQUIRE(r);
        CHECK(r.value().regions.size() == 2);
        CHECK(r.value().regions[1].content.is_null());
        CHECK(r.value().screenshot == "AAAA");
        // Screenshot is not part of the page payload
        CHECK(r.value().toJson().contains("screenshot") == false);
        CHECK(r.value().findRegion("#a") != nullptr);
        CHECK(r.value().findRegion("#z") == nullptr);
    }

    SECTION("duplicate selectors are rejected") {
        auto r = UiSnapshot::fromJson(
            json::parse(R"({"regions":[{"selector":"#a"},{"selector":"#a"}]})"));
        REQUIRE_FALSE(r);
        CHECK(r.error().message == "Duplicate region selector: #a");
    }

    SECTION("non-object input") {
        CHECK_FALSE(UiSnapshot::fromJson(json::array()));
        CHECK_FALSE(UiSnapshot::fromJson(json::parse(R"({"regions":5})")));
    }

    CHECK(estimateTokens(0) == 0);
    CHECK(estimateTokens(1) == 1);
    CHECK(estimateTokens(8) == 2);
}

TEST_CASE("ChangeSummary - empty delta set", "[streaming][diff][summary][catch2]") {
    auto summary = summarizeChanges({});
    CHECK(summary.changeType == ChangeType::Dom);
    CHECK(summary.priority == ChangePriority::Low);
    CHECK(summary.affectedAreas.empty());
    CHECK(summary.componentTypes.empty());
    // SHA-256 of "[]"
    CHECK(summary.checksum == "4f53cda18c2baa0c0354bb5f9a3ecbe5ed12ab4d8e11ba873c2f11161202b945");
}

TEST_CASE("ChangeSummary - classification", "[streaming][diff][summary][catch2]") {
    SECTION("text edits are content changes") {
        std::vector<RegionDelta> deltas{{DeltaKind::Changed, "#content", "new text"},
                                        {DeltaKind::Changed, "#main", "more"}};
        auto summary = summarizeChanges(deltas);
        CHECK(summary.changeType == ChangeType::Content);
        CHECK(summary.priority == ChangePriority::Medium);
        CHECK(summary.affectedAreas == std::vector<std::string>{"#content", "#main"});
        CHECK(summary.componentTypes == std::vector<std::string>{"generic"});
    }

    SECTION("an interactive attribute wins over everything else") {
        std::vector<RegionDelta> deltas{
            {DeltaKind::Added, "#footer", "x"},
            {DeltaKind::Removed, "#sidebar", nullptr},
            {DeltaKind::Changed, "#submit-button", json{{"disabled", true}}}};
        auto summary = summarizeChanges(deltas);
        CHECK(summary.changeType == ChangeType::Interaction);
        CHECK(summary.priority == ChangePriority::High);
        CHECK(summary.componentTypes == std::vector<std::string>{"button", "generic"});
    }

    SECTION("style and class edits are visual") {
        std::vector<RegionDelta> deltas{{DeltaKind::Changed, "#logo", json{{"class", "big"}}},
                                        {DeltaKind::Changed, "#hero", json{{"style", "x"}}},
                                        {DeltaKind::Added, "#banner", "hi"}};
        auto summary = summarizeChanges(deltas);
        CHECK(summary.changeType == ChangeType::Visual);
        CHECK(summary.priority == ChangePriority::Medium);
    }

    SECTION("structural changes to alerts are critical") {
        std::vector<RegionDelta> deltas{{DeltaKind::Removed, "#Error-Banner", nullptr},
                                        {DeltaKind::Added, "nav.main", "links"}};
        auto summary = summarizeChanges(deltas);
        CHECK(summary.changeType == ChangeType::Dom);
        CHECK(summary.priority == ChangePriority::Critical);
        CHECK(summary.componentTypes == std::vector<std::string>{"generic", "navigation"});
    }
}

TEST_CASE("ChangeSummary - checksum covers the delta bytes", "[streaming][diff][summary][catch2]") {
    std::vector<RegionDelta> deltas{{DeltaKind::Changed, "#a", "one"}};
    auto summary = summarizeChanges(deltas);
    CHECK(summary.checksum == devscope::crypto::sha256Hex(deltasToJson(deltas).dump()));

    deltas[0].payload = "two";
    CHECK(summarizeChanges(deltas).checksum != summary.checksum);

    auto j = summary.toJson();
    CHECK(j["changeType"] == "content");
    CHECK(j["priority"] == "medium");
    CHECK(j["affectedAreas"] == json::array({"#a"}));
    CHECK(j["componentTypes"] == json::array({"generic"}));
}
