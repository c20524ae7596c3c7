#pragma once

#include "../reference/CellValue.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace review
{

enum class MatchStatus
{
    Pending,
    Accepted,
    Rejected,
    Manual
};

const char* statusName(MatchStatus status);

/**
 * @brief A low-confidence lookup result handed over for review.
 */
struct RawFuzzyMatch
{
    std::string rowId;
    std::string fieldName;
    reference::CellValue inputValue;
    reference::CellValue suggestedValue;
    double confidence = 0.0;
    std::vector<reference::CellValue> candidateValues; // Alternative suggestions
};

struct FuzzyMatchForReview
{
    std::string id; // match_<rowId>_<fieldName>_<ordinal>
    std::string rowId;
    std::size_t rowIndex = 0;
    std::string fieldName;
    reference::CellValue inputValue;
    reference::CellValue suggestedValue;
    double confidence = 0.0;
    MatchStatus status = MatchStatus::Pending;
    std::optional<reference::CellValue> manualValue;
    bool selected = false; // Mirrors membership in the session selection
    std::vector<reference::CellValue> candidateValues;
};

/// Inclusive on both ends.
struct ConfidenceRange
{
    double min = 0.0;
    double max = 1.0;
};

/**
 * @brief Criteria for the visible subset of matches.
 *
 * Unset members impose no constraint; so does an empty status set.
 */
struct ReviewFilter
{
    std::optional<ConfidenceRange> confidenceRange;
    std::optional<std::string> fieldName;
    std::set<MatchStatus> status;
    std::optional<std::string> searchTerm; // Case-insensitive substring of input, suggestion or candidates

    bool matches(const FuzzyMatchForReview& match) const;
};

/**
 * @brief Partial update merged into a ReviewFilter.
 *
 * The outer optional says whether a member changes; an inner nullopt clears it.
 */
struct ReviewFilterPatch
{
    std::optional<std::optional<ConfidenceRange>> confidenceRange;
    std::optional<std::optional<std::string>> fieldName;
    std::optional<std::set<MatchStatus>> status;
    std::optional<std::optional<std::string>> searchTerm;

    void applyTo(ReviewFilter& filter) const;
};

struct ConfidenceBucket
{
    double min = 0.0;
    double max = 0.0;
    std::size_t count = 0;
};

struct ReviewStats
{
    std::size_t totalMatches = 0;
    std::size_t accepted = 0;
    std::size_t rejected = 0;
    std::size_t manual = 0;
    std::size_t pending = 0;
    int progress = 0; // 0-100
    // [0.9-1.0], [0.8-0.9], [0.7-0.8], [0.6-0.7], [0.0-0.6]
    std::array<ConfidenceBucket, 5> confidenceDistribution{ { { 0.9, 1.0, 0 },
                                                              { 0.8, 0.9, 0 },
                                                              { 0.7, 0.8, 0 },
                                                              { 0.6, 0.7, 0 },
                                                              { 0.0, 0.6, 0 } } };
};

/**
 * @brief Final outcome of a decided match, for writing back into the table.
 *
 * value is set for accepted and manual matches, empty for rejected ones.
 */
struct ReviewDecision
{
    std::string matchId;
    std::string rowId;
    std::string fieldName;
    MatchStatus status = MatchStatus::Pending;
    std::optional<reference::CellValue> value;
};

} // namespace review
