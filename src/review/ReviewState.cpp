#include "ReviewState.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace review
{

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::size_t parseRowIndex(const std::string& rowId, std::size_t fallback)
{
    static const std::string prefix = "row_";
    if (rowId.size() <= prefix.size() || rowId.compare(0, prefix.size(), prefix) != 0)
        return fallback;

    std::size_t value = 0;
    for (std::size_t i = prefix.size(); i < rowId.size(); ++i)
    {
        char c = rowId[i];
        if (c < '0' || c > '9')
            return fallback;
        value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    return value;
}

FuzzyMatchForReview* locate(ReviewState& state, const std::string& id)
{
    auto it = std::find_if(state.matches.begin(), state.matches.end(),
                           [&](const FuzzyMatchForReview& m) { return m.id == id; });
    return it == state.matches.end() ? nullptr : &*it;
}

void syncSelectedFlags(ReviewState& state)
{
    for (auto& match : state.matches)
    {
        match.selected = state.selection.count(match.id) > 0;
    }
}

void accept(FuzzyMatchForReview& match, const std::optional<reference::CellValue>& value)
{
    match.status = MatchStatus::Accepted;
    match.manualValue = value ? *value : match.suggestedValue;
}

} // namespace

std::vector<FuzzyMatchForReview> buildReviewMatches(const std::vector<RawFuzzyMatch>& raw)
{
    std::vector<FuzzyMatchForReview> matches;
    matches.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i)
    {
        const auto& src = raw[i];
        FuzzyMatchForReview match;
        match.id = "match_" + src.rowId + "_" + src.fieldName + "_" + std::to_string(i);
        match.rowId = src.rowId;
        match.rowIndex = parseRowIndex(src.rowId, i);
        match.fieldName = src.fieldName;
        match.inputValue = src.inputValue;
        match.suggestedValue = src.suggestedValue;
        match.confidence = src.confidence;
        match.candidateValues = src.candidateValues;
        matches.push_back(std::move(match));
    }
    return matches;
}

ReviewState reduce(ReviewState state, const ReviewAction& act)
{
    std::visit(
        overloaded{
            [&](const action::Load& a)
            {
                state.matches = buildReviewMatches(a.matches);
                state.selection.clear();
            },
            [&](const action::Accept& a)
            {
                if (auto* match = locate(state, a.id))
                    accept(*match, a.value);
            },
            [&](const action::Reject& a)
            {
                if (auto* match = locate(state, a.id))
                    match->status = MatchStatus::Rejected;
            },
            [&](const action::SetManual& a)
            {
                if (auto* match = locate(state, a.id))
                {
                    match->status = MatchStatus::Manual;
                    match->manualValue = a.value;
                }
            },
            [&](const action::ToggleSelection& a)
            {
                if (!locate(state, a.id))
                    return;
                if (!state.selection.erase(a.id))
                    state.selection.insert(a.id);
            },
            [&](const action::SelectAll& a)
            {
                const ReviewFilter& criteria = a.criteria ? *a.criteria : state.filter;
                state.selection.clear();
                for (const auto& match : state.matches)
                {
                    if (match.status == MatchStatus::Pending && criteria.matches(match))
                        state.selection.insert(match.id);
                }
            },
            [&](const action::ClearSelection&) { state.selection.clear(); },
            [&](const action::AcceptSelected& a)
            {
                for (auto& match : state.matches)
                {
                    if (match.status == MatchStatus::Pending && state.selection.count(match.id))
                        accept(match, a.value);
                }
                state.selection.clear();
            },
            [&](const action::RejectSelected&)
            {
                for (auto& match : state.matches)
                {
                    if (match.status == MatchStatus::Pending && state.selection.count(match.id))
                        match.status = MatchStatus::Rejected;
                }
                state.selection.clear();
            },
            [&](const action::UpdateFilter& a)
            {
                a.patch.applyTo(state.filter);
                state.selection.clear();
            },
            [&](const action::ClearFilter&)
            {
                state.filter = ReviewFilter{};
                state.selection.clear();
            },
            [&](const action::ResetAll&)
            {
                for (auto& match : state.matches)
                {
                    match.status = MatchStatus::Pending;
                    match.manualValue.reset();
                }
                state.selection.clear();
            } },
        act);

    syncSelectedFlags(state);
    return state;
}

std::vector<FuzzyMatchForReview> applyFilter(const std::vector<FuzzyMatchForReview>& matches,
                                             const ReviewFilter& filter)
{
    std::vector<FuzzyMatchForReview> filtered;
    std::copy_if(matches.begin(), matches.end(), std::back_inserter(filtered),
                 [&](const FuzzyMatchForReview& m) { return filter.matches(m); });

    std::stable_sort(filtered.begin(), filtered.end(),
                     [](const FuzzyMatchForReview& a, const FuzzyMatchForReview& b)
                     {
                         if (a.confidence != b.confidence)
                             return a.confidence > b.confidence;
                         return a.fieldName < b.fieldName;
                     });
    return filtered;
}

ReviewStats computeStats(const std::vector<FuzzyMatchForReview>& matches)
{
    ReviewStats stats;
    stats.totalMatches = matches.size();

    for (const auto& match : matches)
    {
        switch (match.status)
        {
        case MatchStatus::Pending:
            ++stats.pending;
            break;
        case MatchStatus::Accepted:
            ++stats.accepted;
            break;
        case MatchStatus::Rejected:
            ++stats.rejected;
            break;
        case MatchStatus::Manual:
            ++stats.manual;
            break;
        }

        // Buckets by lower bound
        const double c = match.confidence;
        std::size_t bucket = c >= 0.9 ? 0 : c >= 0.8 ? 1 : c >= 0.7 ? 2 : c >= 0.6 ? 3 : 4;
        ++stats.confidenceDistribution[bucket].count;
    }

    if (stats.totalMatches > 0)
    {
        const double decided = static_cast<double>(stats.accepted + stats.rejected + stats.manual);
        stats.progress = static_cast<int>(std::lround(decided / static_cast<double>(stats.totalMatches) * 100.0));
    }
    return stats;
}

bool hasChanges(const ReviewState& state)
{
    return std::any_of(state.matches.begin(), state.matches.end(),
                       [](const FuzzyMatchForReview& m) { return m.status != MatchStatus::Pending; });
}

bool isComplete(const ReviewState& state)
{
    return std::none_of(state.matches.begin(), state.matches.end(),
                        [](const FuzzyMatchForReview& m) { return m.status == MatchStatus::Pending; });
}

bool canBatchOperate(const ReviewState& state) { return !state.selection.empty(); }

std::vector<std::string> batchTargets(const ReviewState& state)
{
    std::vector<std::string> ids;
    for (const auto& match : state.matches)
    {
        if (match.status == MatchStatus::Pending && state.selection.count(match.id))
            ids.push_back(match.id);
    }
    return ids;
}

std::vector<ReviewDecision> decisions(const ReviewState& state)
{
    std::vector<ReviewDecision> out;
    for (const auto& match : state.matches)
    {
        if (match.status == MatchStatus::Pending)
            continue;

        ReviewDecision decision{ match.id, match.rowId, match.fieldName, match.status, std::nullopt };
        if (match.status != MatchStatus::Rejected)
            decision.value = match.manualValue ? *match.manualValue : match.suggestedValue;
        out.push_back(std::move(decision));
    }
    return out;
}

const FuzzyMatchForReview* findMatch(const ReviewState& state, const std::string& id)
{
    auto it = std::find_if(state.matches.begin(), state.matches.end(),
                           [&](const FuzzyMatchForReview& m) { return m.id == id; });
    return it == state.matches.end() ? nullptr : &*it;
}

} // namespace review
