#pragma once

#include <cstddef>
#include <string>

namespace similarity
{

/**
 * @brief Relative contribution of each metric to combinedSimilarity().
 *
 * Weights are re-normalized to sum to 1. A non-positive total falls back to
 * the defaults.
 */
struct SimilarityWeights
{
    double levenshtein = 0.4;
    double jaro = 0.3;
    double jaroWinkler = 0.3;
};

constexpr double kDefaultPrefixScale = 0.1;

/// Number of single-codepoint insertions, deletions and substitutions.
std::size_t levenshteinDistance(const std::u32string& a, const std::u32string& b);
std::size_t levenshteinDistance(const std::string& a, const std::string& b);

/// (maxLen - distance) / maxLen, 1.0 when both strings are empty.
double levenshteinSimilarity(const std::u32string& a, const std::u32string& b);
double levenshteinSimilarity(const std::string& a, const std::string& b);

/**
 * @brief Jaro similarity.
 *
 * Equal strings score 1 (two empty strings included). Otherwise the result is 0
 * when either side is empty or the match window floor(max(len)/2) - 1 is
 * negative.
 */
double jaroSimilarity(const std::u32string& a, const std::u32string& b);
double jaroSimilarity(const std::string& a, const std::string& b);

/**
 * @brief Jaro-Winkler similarity.
 *
 * Adds prefix * prefixScale * (1 - jaro) for a shared prefix of up to four
 * codepoints, but only when the Jaro score is at least 0.7.
 */
double jaroWinklerSimilarity(const std::u32string& a, const std::u32string& b,
                             double prefixScale = kDefaultPrefixScale);
double jaroWinklerSimilarity(const std::string& a, const std::string& b, double prefixScale = kDefaultPrefixScale);

/// Weighted blend of Levenshtein, Jaro and Jaro-Winkler similarity.
double combinedSimilarity(const std::u32string& a, const std::u32string& b, const SimilarityWeights& weights = {},
                          double prefixScale = kDefaultPrefixScale);
double combinedSimilarity(const std::string& a, const std::string& b, const SimilarityWeights& weights = {},
                          double prefixScale = kDefaultPrefixScale);

} // namespace similarity
