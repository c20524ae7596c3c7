#include "ReviewEvent.hpp"

namespace review
{

namespace
{

constexpr ReviewEventKind kAllKinds[] = { ReviewEventKind::Accept, ReviewEventKind::Reject, ReviewEventKind::Manual,
                                          ReviewEventKind::BatchAccept, ReviewEventKind::BatchReject };

} // namespace

const char* eventKindName(ReviewEventKind kind)
{
    switch (kind)
    {
    case ReviewEventKind::Accept:
        return "accept";
    case ReviewEventKind::Reject:
        return "reject";
    case ReviewEventKind::Manual:
        return "manual";
    case ReviewEventKind::BatchAccept:
        return "batchAccept";
    case ReviewEventKind::BatchReject:
        return "batchReject";
    }
    return "accept";
}

nlohmann::json toJson(const ReviewEvent& event)
{
    nlohmann::json j = { { "kind", eventKindName(event.kind) }, { "matchIds", event.matchIds } };
    if (event.value)
    {
        j["value"] = reference::toJson(*event.value);
    }
    return j;
}

std::optional<ReviewEvent> reviewEventFromJson(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("kind") || !j.contains("matchIds"))
        return std::nullopt;

    const auto& kind = j.at("kind");
    const auto& ids = j.at("matchIds");
    if (!kind.is_string() || !ids.is_array())
        return std::nullopt;

    ReviewEvent event;
    bool known = false;
    for (ReviewEventKind k : kAllKinds)
    {
        if (kind.get<std::string>() == eventKindName(k))
        {
            event.kind = k;
            known = true;
            break;
        }
    }
    if (!known)
        return std::nullopt;

    for (const auto& id : ids)
    {
        if (!id.is_string())
            return std::nullopt;
        event.matchIds.push_back(id.get<std::string>());
    }

    if (auto it = j.find("value"); it != j.end())
    {
        auto cell = reference::cellFromJson(*it);
        if (!cell)
            return std::nullopt;
        event.value = std::move(*cell);
    }

    return event;
}

} // namespace review
