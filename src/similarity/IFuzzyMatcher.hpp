#pragma once

#include "../reference/CellValue.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace similarity
{

/**
 * @brief Scoring algorithms supported by the matcher.
 */
enum class MatchAlgorithm
{
    Combined,       // Weighted Levenshtein + Jaro + Jaro-Winkler (default)
    Levenshtein,    // Normalized edit distance
    Jaro,           // Transposition-tolerant, suited to short names
    JaroWinkler,    // Jaro with a shared-prefix bonus
    PartialRatio,   // Best aligned substring (e.g., "Sales" inside "Sales EMEA")
    TokenSortRatio, // Order-independent words ("Doe John" vs "John Doe")
    TokenSetRatio   // Set-based words, tolerant of duplicates
};

/**
 * @brief One candidate that scored at or above the threshold.
 */
struct MatchResult
{
    std::string value;       // Original candidate text, not normalized
    double similarity = 0.0; // Score in [0.0, 1.0]
    std::size_t index = 0;   // Position in the candidate list
};

/**
 * @brief Abstract interface for top-K fuzzy candidate search.
 *
 * Typical use cases:
 * - Fuzzy lookups against a reference column
 * - Ranking alternative suggestions for a reviewer
 */
class IFuzzyMatcher
{
public:
    virtual ~IFuzzyMatcher() = default;

    /**
     * @brief Rank candidates against the target.
     *
     * @param target The value being looked up
     * @param candidates Candidate strings; empty ones are skipped
     * @param threshold Minimum similarity [0.0, 1.0] to keep a candidate
     * @param maxResults Maximum number of results returned
     * @return Matches sorted by similarity (descending, stable for ties)
     */
    virtual std::vector<MatchResult> findBestMatches(const std::string& target,
                                                     const std::vector<std::string>& candidates, double threshold,
                                                     std::size_t maxResults) const = 0;

    /**
     * @brief Same as above for table cells; non-string cells are skipped.
     *
     * Result indices refer to positions in the cell list.
     */
    virtual std::vector<MatchResult> findBestMatches(const std::string& target,
                                                     const std::vector<reference::CellValue>& candidates,
                                                     double threshold, std::size_t maxResults) const = 0;

    /**
     * @brief Similarity of two strings after normalization.
     */
    virtual double similarity(const std::string& s1, const std::string& s2) const = 0;
};

} // namespace similarity
