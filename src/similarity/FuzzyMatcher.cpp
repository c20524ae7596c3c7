#include "FuzzyMatcher.hpp"
#include "TextUtils.hpp"
#include "../utils/Diagnostics.hpp"

#include <rapidfuzz/fuzz.hpp>
#include <plog/Log.h>

#include <algorithm>

namespace similarity
{

FuzzyMatcher::FuzzyMatcher(MatcherOptions options)
    : options_(std::move(options))
{
}

std::vector<MatchResult> FuzzyMatcher::findBestMatches(const std::string& target,
                                                       const std::vector<std::string>& candidates, double threshold,
                                                       std::size_t maxResults) const
{
    std::vector<std::pair<const std::string*, std::size_t>> refs;
    refs.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        refs.emplace_back(&candidates[i], i);
    }
    return rank(normalizeToCodepoints(target, options_.normalization), refs, threshold, maxResults);
}

std::vector<MatchResult> FuzzyMatcher::findBestMatches(const std::string& target,
                                                       const std::vector<reference::CellValue>& candidates,
                                                       double threshold, std::size_t maxResults) const
{
    std::vector<std::pair<const std::string*, std::size_t>> refs;
    refs.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        if (const std::string* text = reference::asString(candidates[i]))
        {
            refs.emplace_back(text, i);
        }
    }
    return rank(normalizeToCodepoints(target, options_.normalization), refs, threshold, maxResults);
}

double FuzzyMatcher::similarity(const std::string& s1, const std::string& s2) const
{
    std::u32string a = normalizeToCodepoints(s1, options_.normalization);
    std::u32string b = normalizeToCodepoints(s2, options_.normalization);
    if (a == b)
        return 1.0;
    return score(a, b);
}

std::vector<MatchResult> FuzzyMatcher::rank(const std::u32string& target,
                                            const std::vector<std::pair<const std::string*, std::size_t>>& candidates,
                                            double threshold, std::size_t maxResults) const
{
    std::vector<MatchResult> results;
    maxResults = std::min(maxResults, options_.maxResults);
    if (maxResults == 0)
        return results;

    const bool verbose = utils::Diagnostics::IsVerbose();

    for (const auto& [text, index] : candidates)
    {
        if (text->empty())
            continue;

        std::u32string normalized = normalizeToCodepoints(*text, options_.normalization);

        // Quick exact check first
        if (normalized == target)
        {
            results.push_back(MatchResult{ *text, 1.0, index });
            continue;
        }

        const double shorter = static_cast<double>(std::min(normalized.size(), target.size()));
        const double longer = static_cast<double>(std::max(normalized.size(), target.size()));
        if (shorter / longer < options_.lengthRatioFloor)
            continue;

        double sim = score(target, normalized);
        if (verbose)
        {
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                << "[FuzzyMatcher] " << algorithmName(options_.algorithm) << " "
                << utils::Diagnostics::Preview(*text) << " -> " << sim;
        }

        if (sim >= threshold)
        {
            results.push_back(MatchResult{ *text, sim, index });
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const MatchResult& a, const MatchResult& b) { return a.similarity > b.similarity; });

    if (results.size() > maxResults)
        results.resize(maxResults);

    return results;
}

double FuzzyMatcher::score(const std::u32string& a, const std::u32string& b) const
{
    switch (options_.algorithm)
    {
    case MatchAlgorithm::Levenshtein:
        return levenshteinSimilarity(a, b);

    case MatchAlgorithm::Jaro:
        return jaroSimilarity(a, b);

    case MatchAlgorithm::JaroWinkler:
        return jaroWinklerSimilarity(a, b, options_.prefixScale);

    // rapidfuzz reports [0, 100]
    case MatchAlgorithm::PartialRatio:
        return rapidfuzz::fuzz::partial_ratio(a, b) / 100.0;

    case MatchAlgorithm::TokenSortRatio:
        return rapidfuzz::fuzz::token_sort_ratio(a, b) / 100.0;

    case MatchAlgorithm::TokenSetRatio:
        return rapidfuzz::fuzz::token_set_ratio(a, b) / 100.0;

    case MatchAlgorithm::Combined:
    default:
        return combinedSimilarity(a, b, options_.weights, options_.prefixScale);
    }
}

std::vector<MatchResult> findBestMatches(const std::string& target, const std::vector<std::string>& candidates,
                                         double threshold, std::size_t maxResults)
{
    static const FuzzyMatcher matcher{};
    return matcher.findBestMatches(target, candidates, threshold, maxResults);
}

const char* algorithmName(MatchAlgorithm algorithm)
{
    switch (algorithm)
    {
    case MatchAlgorithm::Combined:
        return "combined";
    case MatchAlgorithm::Levenshtein:
        return "levenshtein";
    case MatchAlgorithm::Jaro:
        return "jaro";
    case MatchAlgorithm::JaroWinkler:
        return "jaro_winkler";
    case MatchAlgorithm::PartialRatio:
        return "partial_ratio";
    case MatchAlgorithm::TokenSortRatio:
        return "token_sort_ratio";
    case MatchAlgorithm::TokenSetRatio:
        return "token_set_ratio";
    }
    return "combined";
}

MatchAlgorithm algorithmFromName(const std::string& name)
{
    for (MatchAlgorithm algorithm :
         { MatchAlgorithm::Combined, MatchAlgorithm::Levenshtein, MatchAlgorithm::Jaro, MatchAlgorithm::JaroWinkler,
           MatchAlgorithm::PartialRatio, MatchAlgorithm::TokenSortRatio, MatchAlgorithm::TokenSetRatio })
    {
        if (name == algorithmName(algorithm))
            return algorithm;
    }
    return MatchAlgorithm::Combined;
}

} // namespace similarity
