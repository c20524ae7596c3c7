#pragma once

#include "ReviewEvent.hpp"
#include "ReviewState.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace review
{

/**
 * @brief Review session over a batch of low-confidence matches.
 *
 * Wraps the reducer: every call is one transition, after which the filtered
 * view and statistics are recomputed once and revision() advances. Effective
 * decisions (known ids, non-empty batches) are reported to the event sink.
 *
 * Example:
 * @code
 * JsonlAuditLog audit("logs/review.jsonl");
 * FuzzyMatchReview session(processed.fuzzyMatches, audit.sink());
 * session.selectAll();
 * session.acceptSelected();
 * @endcode
 */
class FuzzyMatchReview
{
public:
    explicit FuzzyMatchReview(std::vector<RawFuzzyMatch> matches = {}, ReviewEventSink sink = {});

    void load(std::vector<RawFuzzyMatch> matches);

    void acceptMatch(const std::string& id, std::optional<reference::CellValue> value = std::nullopt);
    void rejectMatch(const std::string& id);
    void setManualValue(const std::string& id, reference::CellValue value);

    void toggleSelection(const std::string& id);
    /// Selects pending matches passing criteria, or the current filter when unset.
    void selectAll(std::optional<ReviewFilter> criteria = std::nullopt);
    void clearSelection();

    void acceptSelected(std::optional<reference::CellValue> value = std::nullopt);
    void rejectSelected();

    void updateFilter(const ReviewFilterPatch& patch);
    void clearFilter();
    void resetAll();

    void dispatch(const ReviewAction& act);

    void setEventSink(ReviewEventSink sink);

    const ReviewState& state() const { return state_; }
    const std::vector<FuzzyMatchForReview>& matches() const { return state_.matches; }
    const std::set<std::string>& selection() const { return state_.selection; }
    const ReviewFilter& filter() const { return state_.filter; }
    const FuzzyMatchForReview* find(const std::string& id) const { return findMatch(state_, id); }

    const std::vector<FuzzyMatchForReview>& filteredMatches() const { return filtered_; }
    const ReviewStats& stats() const { return stats_; }
    bool hasChanges() const { return review::hasChanges(state_); }
    bool isComplete() const { return review::isComplete(state_); }
    bool canBatchOperate() const { return review::canBatchOperate(state_); }

    std::vector<ReviewDecision> decisions() const { return review::decisions(state_); }

    /// Advances by one per dispatched action.
    std::uint64_t revision() const { return revision_; }

private:
    ReviewState state_;
    ReviewEventSink sink_;
    std::vector<FuzzyMatchForReview> filtered_;
    ReviewStats stats_;
    std::uint64_t revision_ = 0;

    std::optional<ReviewEvent> describe(const ReviewAction& act) const;
    void refresh();
};

} // namespace review
