#pragma once

#include "ReviewTypes.hpp"

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace review
{

struct ReviewState
{
    std::vector<FuzzyMatchForReview> matches; // Load order
    std::set<std::string> selection;          // May hold ids outside the current filter
    ReviewFilter filter;
};

namespace action
{

struct Load
{
    std::vector<RawFuzzyMatch> matches;
};

struct Accept
{
    std::string id;
    std::optional<reference::CellValue> value; // Defaults to the suggestion
};

struct Reject
{
    std::string id;
};

struct SetManual
{
    std::string id;
    reference::CellValue value;
};

struct ToggleSelection
{
    std::string id;
};

struct SelectAll
{
    std::optional<ReviewFilter> criteria; // Current filter when unset
};

struct ClearSelection
{
};

struct AcceptSelected
{
    std::optional<reference::CellValue> value;
};

struct RejectSelected
{
};

struct UpdateFilter
{
    ReviewFilterPatch patch;
};

struct ClearFilter
{
};

struct ResetAll
{
};

} // namespace action

using ReviewAction = std::variant<action::Load, action::Accept, action::Reject, action::SetManual,
                                  action::ToggleSelection, action::SelectAll, action::ClearSelection,
                                  action::AcceptSelected, action::RejectSelected, action::UpdateFilter,
                                  action::ClearFilter, action::ResetAll>;

/**
 * @brief Assign ids and row indices to raw matches; all start pending.
 *
 * Ids are match_<rowId>_<fieldName>_<ordinal>. rowIndex is N for row ids of
 * the form row_<N>, otherwise the ordinal.
 */
std::vector<FuzzyMatchForReview> buildReviewMatches(const std::vector<RawFuzzyMatch>& raw);

/**
 * @brief Pure transition function of the review workflow.
 *
 * Unknown ids leave the state unchanged. Batch accept/reject only touch
 * selected matches that are still pending and always clear the selection.
 * Changing the filter clears the selection as well.
 */
ReviewState reduce(ReviewState state, const ReviewAction& act);

/// Matches passing the filter, by confidence (high first) then field name.
std::vector<FuzzyMatchForReview> applyFilter(const std::vector<FuzzyMatchForReview>& matches,
                                             const ReviewFilter& filter);

ReviewStats computeStats(const std::vector<FuzzyMatchForReview>& matches);

bool hasChanges(const ReviewState& state);

/// True when nothing is pending (vacuously true with no matches).
bool isComplete(const ReviewState& state);

bool canBatchOperate(const ReviewState& state);

/// Ids a batch action would change: selected and pending, in load order.
std::vector<std::string> batchTargets(const ReviewState& state);

/// Decided matches in load order.
std::vector<ReviewDecision> decisions(const ReviewState& state);

const FuzzyMatchForReview* findMatch(const ReviewState& state, const std::string& id);

} // namespace review
