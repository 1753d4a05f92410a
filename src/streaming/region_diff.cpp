#include <devscope/crypto/sha256.h>
#include <devscope/streaming/region_diff.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <set>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace devscope::streaming {

const char* deltaKindName(DeltaKind kind) noexcept {
    switch (kind) {
        case DeltaKind::Added:
            return "added";
        case DeltaKind::Changed:
            return "changed";
        case DeltaKind::Removed:
            return "removed";
    }
    return "unknown";
}

json RegionDelta::toJson() const {
    return json{{"kind", deltaKindName(kind)}, {"selector", selector}, {"payload", payload}};
}

std::vector<RegionDelta> diffSnapshots(const UiSnapshot& previous, const UiSnapshot& next) {
    std::unordered_map<std::string, const UiRegion*> before;
    before.reserve(previous.regions.size());
    for (const auto& region : previous.regions) {
        before.emplace(region.selector, &region);
    }
    std::unordered_set<std::string> after;
    after.reserve(next.regions.size());
    for (const auto& region : next.regions) {
        after.insert(region.selector);
    }

    std::vector<RegionDelta> deltas;
    for (const auto& region : previous.regions) {
        if (!after.contains(region.selector)) {
            deltas.push_back(RegionDelta{DeltaKind::Removed, region.selector, nullptr});
        }
    }
    for (const auto& region : next.regions) {
        auto it = before.find(region.selector);
        if (it == before.end()) {
            deltas.push_back(RegionDelta{DeltaKind::Added, region.selector, region.content});
        } else if (it->second->content != region.content) {
            deltas.push_back(RegionDelta{DeltaKind::Changed, region.selector, region.content});
        }
    }
    return deltas;
}

json deltasToJson(const std::vector<RegionDelta>& deltas) {
    json out = json::array();
    for (const auto& d : deltas) {
        out.push_back(d.toJson());
    }
    return out;
}

std::size_t deltaByteSize(const std::vector<RegionDelta>& deltas) {
    return deltasToJson(deltas).dump().size();
}

const char* changeTypeName(ChangeType type) noexcept {
    switch (type) {
        case ChangeType::Dom:
            return "dom";
        case ChangeType::Content:
            return "content";
        case ChangeType::Visual:
            return "visual";
        case ChangeType::Interaction:
            return "interaction";
    }
    return "unknown";
}

const char* changePriorityName(ChangePriority priority) noexcept {
    switch (priority) {
        case ChangePriority::Low:
            return "low";
        case ChangePriority::Medium:
            return "medium";
        case ChangePriority::High:
            return "high";
        case ChangePriority::Critical:
            return "critical";
    }
    return "unknown";
}

json ChangeSummary::toJson() const {
    return json{{"changeType", changeTypeName(changeType)},
                {"priority", changePriorityName(priority)},
                {"affectedAreas", affectedAreas},
                {"componentTypes", componentTypes},
                {"checksum", checksum}};
}

namespace {

constexpr std::array<std::string_view, 9> kInteractiveAttributes = {
    "disabled", "readonly", "checked",       "selected",     "href",
    "onclick",  "onchange", "aria-expanded", "aria-selected"};

constexpr std::array<std::string_view, 2> kVisualAttributes = {"style", "class"};

std::string lowered(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool containsAny(const std::string& haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
        return haystack.find(n) != std::string::npos;
    });
}

// Changed regions only: object payloads are attribute maps, anything else is text
ChangeType classifyChanged(const json& payload) {
    if (!payload.is_object()) {
        return ChangeType::Content;
    }
    for (auto attr : kInteractiveAttributes) {
        if (payload.contains(std::string(attr))) {
            return ChangeType::Interaction;
        }
    }
    for (auto attr : kVisualAttributes) {
        if (payload.contains(std::string(attr))) {
            return ChangeType::Visual;
        }
    }
    return ChangeType::Content;
}

ChangeType classify(const RegionDelta& delta) {
    return delta.kind == DeltaKind::Changed ? classifyChanged(delta.payload) : ChangeType::Dom;
}

ChangePriority priorityOf(const RegionDelta& delta) {
    const auto path = lowered(delta.selector);
    if (containsAny(path, {"error", "alert", "security", "warning"})) {
        return ChangePriority::Critical;
    }
    if (containsAny(path, {"nav", "modal", "submit", "login"})) {
        return ChangePriority::High;
    }
    const auto type = classify(delta);
    if (type == ChangeType::Content || containsAny(path, {"input", "content"})) {
        return ChangePriority::Medium;
    }
    if (type == ChangeType::Visual) {
        return ChangePriority::Low;
    }
    return ChangePriority::Medium;
}

std::string componentTypeOf(const std::string& selector) {
    const auto path = lowered(selector);
    if (path.find("button") != std::string::npos)
        return "button";
    if (path.find("input") != std::string::npos)
        return "input";
    if (path.find("form") != std::string::npos)
        return "form";
    if (path.find("nav") != std::string::npos)
        return "navigation";
    if (path.find("modal") != std::string::npos)
        return "modal";
    return "generic";
}

} // namespace

ChangeSummary summarizeChanges(const std::vector<RegionDelta>& deltas) {
    ChangeSummary summary;
    summary.checksum = crypto::sha256Hex(deltasToJson(deltas).dump());
    if (deltas.empty()) {
        return summary;
    }

    std::size_t dom = 0;
    std::size_t content = 0;
    std::size_t visual = 0;
    std::size_t interaction = 0;
    std::set<std::string> components;
    for (const auto& delta : deltas) {
        switch (classify(delta)) {
            case ChangeType::Dom:
                ++dom;
                break;
            case ChangeType::Content:
                ++content;
                break;
            case ChangeType::Visual:
                ++visual;
                break;
            case ChangeType::Interaction:
                ++interaction;
                break;
        }
        summary.priority = std::max(summary.priority, priorityOf(delta));
        summary.affectedAreas.push_back(delta.selector);
        components.insert(componentTypeOf(delta.selector));
    }
    summary.componentTypes.assign(components.begin(), components.end());

    if (interaction > 0) {
        summary.changeType = ChangeType::Interaction;
    } else if (content > dom && content > visual) {
        summary.changeType = ChangeType::Content;
    } else if (visual > dom) {
        summary.changeType = ChangeType::Visual;
    } else {
        summary.changeType = ChangeType::Dom;
    }
    return summary;
}

} // namespace devscope::streaming
