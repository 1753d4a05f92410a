#pragma once

#include <devscope/streaming/ui_snapshot.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devscope::streaming {

enum class DeltaKind { Added, Changed, Removed };

const char* deltaKindName(DeltaKind kind) noexcept;

struct RegionDelta {
    DeltaKind kind = DeltaKind::Changed;
    std::string selector;
    json payload; // new content; null for removed regions

    json toJson() const;

    bool operator==(const RegionDelta& other) const {
        return kind == other.kind && selector == other.selector && payload == other.payload;
    }
};

// Keyed by selector: removed regions in previous order, then added/changed in next order.
std::vector<RegionDelta> diffSnapshots(const UiSnapshot& previous, const UiSnapshot& next);

json deltasToJson(const std::vector<RegionDelta>& deltas);
std::size_t deltaByteSize(const std::vector<RegionDelta>& deltas);

enum class ChangeType { Dom, Content, Visual, Interaction };
enum class ChangePriority { Low, Medium, High, Critical };

const char* changeTypeName(ChangeType type) noexcept;
const char* changePriorityName(ChangePriority priority) noexcept;

/**
 * What a delta set touched, for clients deciding whether a change matters.
 *
 * - changeType: interaction when any changed region carries an interactive attribute, otherwise
 *   the most frequent of content/visual/dom (structural add/remove wins ties).
 * - priority: highest per-region priority, from selector keywords (error/alert/security/warning
 *   are critical; nav/modal/submit/login are high).
 * - affectedAreas: selectors in delta order; componentTypes: sorted, deduplicated.
 * - checksum: SHA-256 of the compact delta array, the bytes a client receives.
 */
struct ChangeSummary {
    ChangeType changeType = ChangeType::Dom;
    ChangePriority priority = ChangePriority::Low;
    std::vector<std::string> affectedAreas;
    std::vector<std::string> componentTypes;
    std::string checksum;

    json toJson() const;
};

ChangeSummary summarizeChanges(const std::vector<RegionDelta>& deltas);

// Rough token estimate for a payload of `bytes` (4 bytes per token, rounded up)
constexpr std::size_t estimateTokens(std::size_t bytes) noexcept {
    return (bytes + 3) / 4;
}

} // namespace devscope::streaming
