#include "FuzzyMatchReview.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

namespace review
{

FuzzyMatchReview::FuzzyMatchReview(std::vector<RawFuzzyMatch> matches, ReviewEventSink sink)
    : sink_(std::move(sink))
{
    state_.matches = buildReviewMatches(matches);
    refresh();
}

void FuzzyMatchReview::load(std::vector<RawFuzzyMatch> matches) { dispatch(action::Load{ std::move(matches) }); }

void FuzzyMatchReview::acceptMatch(const std::string& id, std::optional<reference::CellValue> value)
{
    dispatch(action::Accept{ id, std::move(value) });
}

void FuzzyMatchReview::rejectMatch(const std::string& id) { dispatch(action::Reject{ id }); }

void FuzzyMatchReview::setManualValue(const std::string& id, reference::CellValue value)
{
    dispatch(action::SetManual{ id, std::move(value) });
}

void FuzzyMatchReview::toggleSelection(const std::string& id) { dispatch(action::ToggleSelection{ id }); }

void FuzzyMatchReview::selectAll(std::optional<ReviewFilter> criteria)
{
    dispatch(action::SelectAll{ std::move(criteria) });
}

void FuzzyMatchReview::clearSelection() { dispatch(action::ClearSelection{}); }

void FuzzyMatchReview::acceptSelected(std::optional<reference::CellValue> value)
{
    dispatch(action::AcceptSelected{ std::move(value) });
}

void FuzzyMatchReview::rejectSelected() { dispatch(action::RejectSelected{}); }

void FuzzyMatchReview::updateFilter(const ReviewFilterPatch& patch) { dispatch(action::UpdateFilter{ patch }); }

void FuzzyMatchReview::clearFilter() { dispatch(action::ClearFilter{}); }

void FuzzyMatchReview::resetAll() { dispatch(action::ResetAll{}); }

void FuzzyMatchReview::dispatch(const ReviewAction& act)
{
    // Describe against the state before the transition
    std::optional<ReviewEvent> event = describe(act);

    state_ = reduce(std::move(state_), act);
    ++revision_;
    refresh();

    if (event)
    {
        PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
            << "[FuzzyMatchReview] " << eventKindName(event->kind) << " x" << event->matchIds.size()
            << " (progress " << stats_.progress << "%)";
        if (sink_)
            sink_(*event);
    }
}

void FuzzyMatchReview::setEventSink(ReviewEventSink sink) { sink_ = std::move(sink); }

std::optional<ReviewEvent> FuzzyMatchReview::describe(const ReviewAction& act) const
{
    if (const auto* a = std::get_if<action::Accept>(&act))
    {
        const auto* match = findMatch(state_, a->id);
        if (!match)
            return std::nullopt;
        return ReviewEvent{ ReviewEventKind::Accept, { a->id }, a->value ? *a->value : match->suggestedValue };
    }

    if (const auto* a = std::get_if<action::Reject>(&act))
    {
        if (!findMatch(state_, a->id))
            return std::nullopt;
        return ReviewEvent{ ReviewEventKind::Reject, { a->id }, std::nullopt };
    }

    if (const auto* a = std::get_if<action::SetManual>(&act))
    {
        if (!findMatch(state_, a->id))
            return std::nullopt;
        return ReviewEvent{ ReviewEventKind::Manual, { a->id }, a->value };
    }

    if (const auto* a = std::get_if<action::AcceptSelected>(&act))
    {
        auto ids = batchTargets(state_);
        if (ids.empty())
            return std::nullopt;
        return ReviewEvent{ ReviewEventKind::BatchAccept, std::move(ids), a->value };
    }

    if (std::holds_alternative<action::RejectSelected>(act))
    {
        auto ids = batchTargets(state_);
        if (ids.empty())
            return std::nullopt;
        return ReviewEvent{ ReviewEventKind::BatchReject, std::move(ids), std::nullopt };
    }

    return std::nullopt;
}

void FuzzyMatchReview::refresh()
{
    filtered_ = applyFilter(state_.matches, state_.filter);
    stats_ = computeStats(state_.matches);
}

} // namespace review
