#pragma once

#include "../reference/CellValue.hpp"
#include "../similarity/IFuzzyMatcher.hpp"
#include "../similarity/TextNormalizer.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lookup
{

enum class MatchType
{
    Exact,
    Normalized,
    Fuzzy,
    None
};

const char* matchTypeName(MatchType type);

/// Copy sourceColumn of the matched row into the output field targetFieldName.
struct DerivedField
{
    std::string sourceColumn;
    std::string targetFieldName;
};

struct NormalizationSettings
{
    bool caseSensitive = false;
    bool trimWhitespace = true;
    bool removeAccents = true;
    bool collapseWhitespace = true;

    similarity::NormalizeOptions toOptions() const;
};

/**
 * @brief How one input column is resolved against one reference dataset.
 *
 * sourceColumn is compared with the input, targetColumn supplies the
 * resolved value.
 */
struct MatchConfig
{
    std::string sourceColumn;
    std::string targetColumn;
    double fuzzyThreshold = 0.6; // [0, 1]
    std::vector<DerivedField> alsoGet;
    bool fuzzyEnabled = true;
    NormalizationSettings normalization;
    std::size_t maxSuggestions = 3;
    similarity::MatchAlgorithm algorithm = similarity::MatchAlgorithm::Combined;
};

struct LookupSuggestion
{
    reference::CellValue value; // targetColumn of the suggested row
    double confidence = 0.0;
    std::string reason;
    std::size_t rowIndex = 0;
};

struct LookupMetrics
{
    std::int64_t elapsedMicros = 0;
    std::size_t comparisons = 0;
};

struct LookupResult
{
    std::string inputValue;
    bool matched = false;
    double confidence = 0.0;
    MatchType matchType = MatchType::None;
    reference::CellValue matchedValue;
    std::map<std::string, reference::CellValue> derivedValues; // targetFieldName -> value
    std::vector<LookupSuggestion> suggestions;
    std::optional<std::size_t> matchedRowIndex;
    LookupMetrics metrics;
};

struct BatchMetrics
{
    double totalMillis = 0.0;
    double averageMillis = 0.0;
    std::size_t totalComparisons = 0;
    double matchRate = 0.0;  // [0, 1]
    double throughput = 0.0; // Lookups per second
};

struct BatchProgress
{
    std::size_t completed = 0;
    std::size_t total = 0;
    double percentage = 0.0;
};

using BatchProgressCallback = std::function<void(const BatchProgress&)>;

struct BatchLookupResult
{
    std::vector<LookupResult> results;
    BatchMetrics metrics;
};

} // namespace lookup
