#include <devscope/streaming/ui_snapshot.h>

#include <unordered_set>

namespace devscope::streaming {

const UiRegion* UiSnapshot::findRegion(const std::string& selector) const {
    for (const auto& region : regions) {
        if (region.selector == selector) {
            return &region;
        }
    }
    return nullptr;
}

json UiSnapshot::toJson() const {
    json regionsJson = json::array();
    for (const auto& region : regions) {
        regionsJson.push_back(json{{"selector", region.selector}, {"content", region.content}});
    }
    return json{{"url", url}, {"title", title}, {"regions", std::move(regionsJson)}};
}

std::size_t UiSnapshot::byteSize() const {
    return toJson().dump().size();
}

Result<UiSnapshot> UiSnapshot::fromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Snapshot must be a JSON object"};
    }
    UiSnapshot snap;
    if (auto it = j.find("url"); it != j.end() && it->is_string()) {
        snap.url = it->get<std::string>();
    }
    if (auto it = j.find("title"); it != j.end() && it->is_string()) {
        snap.title = it->get<std::string>();
    }
    if (auto it = j.find("screenshot"); it != j.end() && it->is_string()) {
        snap.screenshot = it->get<std::string>();
    }

    auto regions = j.find("regions");
    if (regions == j.end() || regions->is_null()) {
        return snap;
    }
    if (!regions->is_array()) {
        return Error{ErrorCode::InvalidData, "Snapshot 'regions' must be an array"};
    }

    std::unordered_set<std::string> seen;
    snap.regions.reserve(regions->size());
    for (const auto& r : *regions) {
        if (!r.is_object() || !r.contains("selector") || !r["selector"].is_string()) {
            return Error{ErrorCode::InvalidData, "Snapshot region requires a string 'selector'"};
        }
        auto selector = r["selector"].get<std::string>();
        if (!seen.insert(selector).second) {
            return Error{ErrorCode::InvalidData, "Duplicate region selector: " + selector};
        }
        snap.regions.push_back(
            UiRegion{std::move(selector), r.contains("content") ? r["content"] : json(nullptr)});
    }
    return snap;
}

} // namespace devscope::streaming
