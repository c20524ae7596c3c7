#pragma once

#include "IFuzzyMatcher.hpp"
#include "StringSimilarity.hpp"
#include "TextNormalizer.hpp"

#include <limits>
#include <utility>

namespace similarity
{

struct MatcherOptions
{
    NormalizeOptions normalization;
    SimilarityWeights weights;
    MatchAlgorithm algorithm = MatchAlgorithm::Combined;
    double prefixScale = kDefaultPrefixScale;
    // Pairs whose shorter/longer length ratio falls below this are never scored
    double lengthRatioFloor = 0.2;
    // Upper bound on results of any search, whatever the caller asks for
    std::size_t maxResults = std::numeric_limits<std::size_t>::max();
};

/**
 * @brief Normalizing fuzzy matcher over reference values.
 *
 * This implementation:
 * - Normalizes the target once and each candidate once
 * - Treats normalized equality as similarity 1 without scoring
 * - Skips pairs with very different lengths before scoring
 * - Scores with the in-house metrics, or rapidfuzz for the token/partial ratios
 *   (rapidfuzz scores 0-100 are scaled to 0.0-1.0)
 *
 * Example:
 * @code
 * FuzzyMatcher matcher;
 * auto hits = matcher.findBestMatches("Enginering", departments, 0.6, 5);
 * @endcode
 */
class FuzzyMatcher : public IFuzzyMatcher
{
public:
    FuzzyMatcher() = default;
    explicit FuzzyMatcher(MatcherOptions options);

    std::vector<MatchResult> findBestMatches(const std::string& target, const std::vector<std::string>& candidates,
                                             double threshold, std::size_t maxResults) const override;

    std::vector<MatchResult> findBestMatches(const std::string& target,
                                             const std::vector<reference::CellValue>& candidates, double threshold,
                                             std::size_t maxResults) const override;

    double similarity(const std::string& s1, const std::string& s2) const override;

    const MatcherOptions& options() const { return options_; }

private:
    MatcherOptions options_;

    // Candidates are (text, original index) so both overloads share one scan
    std::vector<MatchResult> rank(const std::u32string& target,
                                  const std::vector<std::pair<const std::string*, std::size_t>>& candidates,
                                  double threshold, std::size_t maxResults) const;

    double score(const std::u32string& a, const std::u32string& b) const;
};

/// findBestMatches with default options, threshold 0.6 and five results.
std::vector<MatchResult> findBestMatches(const std::string& target, const std::vector<std::string>& candidates,
                                         double threshold = 0.6, std::size_t maxResults = 5);

/// Printable name, e.g. for logs and the [matching] config section.
const char* algorithmName(MatchAlgorithm algorithm);

/// Inverse of algorithmName; unknown names yield Combined.
MatchAlgorithm algorithmFromName(const std::string& name);

} // namespace similarity
