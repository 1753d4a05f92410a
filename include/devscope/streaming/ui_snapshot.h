#pragma once

#include <devscope/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace devscope::streaming {

using json = nlohmann::json;

// One addressable part of a page, identified by its CSS selector
struct UiRegion {
    std::string selector;
    json content;

    bool operator==(const UiRegion& other) const {
        return selector == other.selector && content == other.content;
    }
};

/**
 * A captured page as produced by the browser driver. Region selectors are unique within a
 * snapshot; the screenshot (base64) is carried separately and never counted as page payload.
 */
struct UiSnapshot {
    std::string url;
    std::string title;
    std::vector<UiRegion> regions;
    std::optional<std::string> screenshot;

    const UiRegion* findRegion(const std::string& selector) const;

    // Page payload (url, title, regions)
    json toJson() const;
    // Bytes of the compact JSON payload; the unit all savings are measured in
    std::size_t byteSize() const;

    // Accepts {url, title?, regions:[{selector, content}], screenshot?}
    static Result<UiSnapshot> fromJson(const json& j);
};

} // namespace devscope::streaming
