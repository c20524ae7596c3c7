#include "StringSimilarity.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace similarity
{

std::size_t levenshteinDistance(const std::u32string& a, const std::u32string& b)
{
    if (a == b)
        return 0;

    // Keep the DP rows as short as the shorter input
    const std::u32string& longer = a.size() >= b.size() ? a : b;
    const std::u32string& shorter = a.size() >= b.size() ? b : a;
    if (shorter.empty())
        return longer.size();

    std::vector<std::size_t> previous(shorter.size() + 1);
    std::vector<std::size_t> current(shorter.size() + 1);
    std::iota(previous.begin(), previous.end(), std::size_t{ 0 });

    for (std::size_t i = 1; i <= longer.size(); ++i)
    {
        current[0] = i;
        for (std::size_t j = 1; j <= shorter.size(); ++j)
        {
            std::size_t cost = longer[i - 1] == shorter[j - 1] ? 0 : 1;
            current[j] = std::min({ previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost });
        }
        std::swap(previous, current);
    }

    return previous[shorter.size()];
}

std::size_t levenshteinDistance(const std::string& a, const std::string& b)
{
    return levenshteinDistance(utf8ToUtf32(a), utf8ToUtf32(b));
}

double levenshteinSimilarity(const std::u32string& a, const std::u32string& b)
{
    if (a == b)
        return 1.0;

    const double max_len = static_cast<double>(std::max(a.size(), b.size()));
    const double distance = static_cast<double>(levenshteinDistance(a, b));
    return (max_len - distance) / max_len;
}

double levenshteinSimilarity(const std::string& a, const std::string& b)
{
    return levenshteinSimilarity(utf8ToUtf32(a), utf8ToUtf32(b));
}

double jaroSimilarity(const std::u32string& a, const std::u32string& b)
{
    if (a == b)
        return 1.0;
    if (a.empty() || b.empty())
        return 0.0;

    const long window = static_cast<long>(std::max(a.size(), b.size()) / 2) - 1;
    if (window < 0)
        return 0.0;

    std::vector<bool> a_matched(a.size(), false);
    std::vector<bool> b_matched(b.size(), false);
    std::size_t matches = 0;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const std::size_t start = static_cast<long>(i) > window ? i - static_cast<std::size_t>(window) : 0;
        const std::size_t end = std::min(i + static_cast<std::size_t>(window) + 1, b.size());
        for (std::size_t j = start; j < end; ++j)
        {
            if (b_matched[j] || a[i] != b[j])
                continue;
            a_matched[i] = true;
            b_matched[j] = true;
            ++matches;
            break;
        }
    }

    if (matches == 0)
        return 0.0;

    std::size_t transpositions = 0;
    std::size_t k = 0;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (!a_matched[i])
            continue;
        while (!b_matched[k])
            ++k;
        if (a[i] != b[k])
            ++transpositions;
        ++k;
    }

    const double m = static_cast<double>(matches);
    return (m / static_cast<double>(a.size()) + m / static_cast<double>(b.size()) +
            (m - static_cast<double>(transpositions) / 2.0) / m) /
           3.0;
}

double jaroSimilarity(const std::string& a, const std::string& b)
{
    return jaroSimilarity(utf8ToUtf32(a), utf8ToUtf32(b));
}

double jaroWinklerSimilarity(const std::u32string& a, const std::u32string& b, double prefixScale)
{
    const double jaro = jaroSimilarity(a, b);
    if (jaro < 0.7)
        return jaro;

    const std::size_t max_prefix = std::min<std::size_t>(4, std::min(a.size(), b.size()));
    std::size_t prefix = 0;
    while (prefix < max_prefix && a[prefix] == b[prefix])
        ++prefix;

    return jaro + static_cast<double>(prefix) * prefixScale * (1.0 - jaro);
}

double jaroWinklerSimilarity(const std::string& a, const std::string& b, double prefixScale)
{
    return jaroWinklerSimilarity(utf8ToUtf32(a), utf8ToUtf32(b), prefixScale);
}

double combinedSimilarity(const std::u32string& a, const std::u32string& b, const SimilarityWeights& weights,
                          double prefixScale)
{
    // Negative or non-finite weights count as zero; otherwise the sum could leave [0, 1]
    auto usable = [](double weight) { return std::isfinite(weight) ? std::max(weight, 0.0) : 0.0; };
    SimilarityWeights w{ usable(weights.levenshtein), usable(weights.jaro), usable(weights.jaroWinkler) };
    double total = w.levenshtein + w.jaro + w.jaroWinkler;
    if (!(total > 0.0))
    {
        w = SimilarityWeights{};
        total = w.levenshtein + w.jaro + w.jaroWinkler;
    }

    return levenshteinSimilarity(a, b) * (w.levenshtein / total) + jaroSimilarity(a, b) * (w.jaro / total) +
           jaroWinklerSimilarity(a, b, prefixScale) * (w.jaroWinkler / total);
}

double combinedSimilarity(const std::string& a, const std::string& b, const SimilarityWeights& weights,
                          double prefixScale)
{
    return combinedSimilarity(utf8ToUtf32(a), utf8ToUtf32(b), weights, prefixScale);
}

} // namespace similarity
