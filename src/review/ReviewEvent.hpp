#pragma once

#include "../reference/CellValue.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace review
{

enum class ReviewEventKind
{
    Accept,
    Reject,
    Manual,
    BatchAccept,
    BatchReject
};

const char* eventKindName(ReviewEventKind kind);

/**
 * @brief Decision notification for the host (audit trail, undo stack).
 *
 * value carries the accepted or manual value; for BatchAccept it is only set
 * when one value was forced onto every match.
 */
struct ReviewEvent
{
    ReviewEventKind kind = ReviewEventKind::Accept;
    std::vector<std::string> matchIds;
    std::optional<reference::CellValue> value;
};

/// Fire-and-forget receiver injected into a review session.
using ReviewEventSink = std::function<void(const ReviewEvent&)>;

nlohmann::json toJson(const ReviewEvent& event);

std::optional<ReviewEvent> reviewEventFromJson(const nlohmann::json& j);

} // namespace review
