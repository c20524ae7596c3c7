#include "LookupMatchingEngine.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/Stopwatch.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace lookup
{

namespace
{

bool contains(const std::vector<std::string>& columns, const std::string& column)
{
    return std::find(columns.begin(), columns.end(), column) != columns.end();
}

LookupResult noMatch(const std::string& inputValue)
{
    LookupResult result;
    result.inputValue = inputValue;
    return result;
}

} // namespace

LookupMatchingEngine::LookupMatchingEngine(similarity::MatcherOptions scoring)
    : scoring_(std::move(scoring))
{
}

LookupResult LookupMatchingEngine::performLookup(const std::string& inputValue,
                                                 const reference::ReferenceDataset& dataset,
                                                 const MatchConfig& config) const
{
    return performLookup(inputValue, dataset.columns, dataset.rows, config);
}

LookupResult LookupMatchingEngine::performLookup(const std::string& inputValue,
                                                 const reference::IReferenceDataStore& store,
                                                 const std::string& datasetId, const MatchConfig& config) const
{
    const auto* rows = store.getRows(datasetId);
    auto metadata = store.getMetadata(datasetId);
    if (!rows || !metadata)
    {
        PLOG_WARNING_(utils::Diagnostics::kLogInstance)
            << "[LookupMatchingEngine] Reference dataset '" << datasetId << "' not found";
        return noMatch(inputValue);
    }
    return performLookup(inputValue, metadata->columns, *rows, config);
}

LookupResult LookupMatchingEngine::performLookup(const std::string& inputValue,
                                                 const std::vector<std::string>& columns,
                                                 const std::vector<reference::ReferenceRow>& rows,
                                                 const MatchConfig& config) const
{
    utils::Stopwatch stopwatch;

    if (inputValue.empty() || rows.empty())
    {
        return noMatch(inputValue);
    }

    if (!contains(columns, config.sourceColumn) || !contains(columns, config.targetColumn))
    {
        PLOG_WARNING_(utils::Diagnostics::kLogInstance)
            << "[LookupMatchingEngine] Column not in dataset (source '" << config.sourceColumn << "', target '"
            << config.targetColumn << "')";
        return noMatch(inputValue);
    }

    std::size_t comparisons = 0;
    auto finish = [&](LookupResult result)
    {
        result.metrics.comparisons = comparisons;
        result.metrics.elapsedMicros = stopwatch.elapsedMicros();
        if (utils::Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                << "[LookupMatchingEngine] " << utils::Diagnostics::Preview(inputValue) << " -> "
                << matchTypeName(result.matchType) << " (" << result.confidence << ")";
        }
        return result;
    };

    // Step 1: exact
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        const auto* cell = cellAt(rows[i], config.sourceColumn);
        if (cell && !reference::isNull(*cell) && reference::displayText(*cell) == inputValue)
        {
            comparisons += i + 1;
            return finish(matchedResult(inputValue, columns, rows[i], i, config, 1.0, MatchType::Exact));
        }
    }
    comparisons += rows.size();

    // Step 2: normalized
    const similarity::NormalizeOptions normalize = config.normalization.toOptions();
    const std::string normalized_input = similarity::normalizeString(inputValue, normalize);
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        const auto* cell = cellAt(rows[i], config.sourceColumn);
        if (!cell || reference::isNull(*cell))
            continue;

        if (similarity::normalizeString(reference::displayText(*cell), normalize) == normalized_input)
        {
            comparisons += i + 1;
            return finish(
                matchedResult(inputValue, columns, rows[i], i, config, kNormalizedConfidence, MatchType::Normalized));
        }
    }
    comparisons += rows.size();

    if (!config.fuzzyEnabled)
    {
        return finish(noMatch(inputValue));
    }

    // Step 3: fuzzy. One cell per row so match indices are row indices.
    std::vector<reference::CellValue> candidates;
    candidates.reserve(rows.size());
    for (const auto& row : rows)
    {
        const auto* cell = cellAt(row, config.sourceColumn);
        candidates.push_back(cell ? *cell : reference::CellValue{});
    }
    comparisons += rows.size();

    similarity::MatcherOptions options = scoring_;
    options.normalization = normalize;
    options.algorithm = config.algorithm;
    similarity::FuzzyMatcher matcher(options);

    const double floor = std::min(kSuggestionFloor, config.fuzzyThreshold);
    auto matches = matcher.findBestMatches(inputValue, candidates, floor, config.maxSuggestions + 5);

    LookupResult result = noMatch(inputValue);
    bool best_taken = false;
    if (!matches.empty() && matches.front().similarity >= config.fuzzyThreshold)
    {
        const auto& best = matches.front();
        result = matchedResult(inputValue, columns, rows[best.index], best.index, config, best.similarity,
                               MatchType::Fuzzy);
        best_taken = true;
    }

    const std::size_t first = best_taken ? 1 : 0;
    const std::size_t limit = std::min(matches.size(), config.maxSuggestions);
    for (std::size_t i = first; i < limit; ++i)
    {
        const auto& match = matches[i];
        const auto* value = cellAt(rows[match.index], config.targetColumn);
        result.suggestions.push_back(LookupSuggestion{ value ? *value : reference::CellValue{}, match.similarity,
                                                       suggestionReason(match.similarity, inputValue, match.value),
                                                       match.index });
    }

    return finish(std::move(result));
}

BatchLookupResult LookupMatchingEngine::batchLookup(const std::vector<std::string>& inputValues,
                                                    const reference::ReferenceDataset& dataset,
                                                    const MatchConfig& config, std::size_t batchSize,
                                                    const BatchProgressCallback& onProgress) const
{
    utils::Stopwatch stopwatch;
    BatchLookupResult batch;
    batch.results.reserve(inputValues.size());

    if (batchSize == 0)
        batchSize = 1;

    std::size_t match_count = 0;
    const std::size_t total = inputValues.size();
    for (std::size_t start = 0; start < total; start += batchSize)
    {
        const std::size_t end = std::min(start + batchSize, total);
        for (std::size_t i = start; i < end; ++i)
        {
            LookupResult result = performLookup(inputValues[i], dataset, config);
            batch.metrics.totalComparisons += result.metrics.comparisons;
            if (result.matched)
                ++match_count;
            batch.results.push_back(std::move(result));
        }

        if (onProgress)
        {
            onProgress(BatchProgress{ end, total, static_cast<double>(end) / static_cast<double>(total) * 100.0 });
        }
    }

    auto& metrics = batch.metrics;
    metrics.totalMillis = stopwatch.elapsedMillis();
    if (total > 0)
    {
        metrics.averageMillis = metrics.totalMillis / static_cast<double>(total);
        metrics.matchRate = static_cast<double>(match_count) / static_cast<double>(total);
    }
    if (metrics.totalMillis > 0.0)
    {
        metrics.throughput = static_cast<double>(total) / (metrics.totalMillis / 1000.0);
    }

    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[LookupMatchingEngine] Batch of " << total << " against '" << dataset.id << "': " << match_count
        << " matched in " << metrics.totalMillis << " ms";

    return batch;
}

double LookupMatchingEngine::calculateSimilarity(const std::string& a, const std::string& b) const
{
    return similarity::FuzzyMatcher(scoring_).similarity(a, b);
}

std::string LookupMatchingEngine::suggestionReason(double confidence, const std::string& input,
                                                   const std::string& suggestion)
{
    if (confidence >= 0.9)
        return "Very similar spelling";
    if (confidence >= 0.8)
        return "Similar spelling";
    if (confidence >= 0.7)
        return "Possible match";

    similarity::NormalizeOptions case_only;
    case_only.trim = false;
    case_only.removeAccents = false;
    case_only.collapseWhitespace = false;
    if (similarity::normalizeString(input, case_only) == similarity::normalizeString(suggestion, case_only))
        return "Case difference";

    similarity::NormalizeOptions loose;
    loose.removeNonAlphanumeric = true;
    if (similarity::normalizeString(input, loose) == similarity::normalizeString(suggestion, loose))
        return "Spacing or punctuation difference";

    return "Partial match";
}

LookupResult LookupMatchingEngine::matchedResult(const std::string& inputValue,
                                                 const std::vector<std::string>& columns,
                                                 const reference::ReferenceRow& row, std::size_t rowIndex,
                                                 const MatchConfig& config, double confidence, MatchType type) const
{
    LookupResult result;
    result.inputValue = inputValue;
    result.matched = true;
    result.confidence = confidence;
    result.matchType = type;
    result.matchedRowIndex = rowIndex;

    if (const auto* value = cellAt(row, config.targetColumn))
    {
        result.matchedValue = *value;
    }

    for (const auto& derived : config.alsoGet)
    {
        if (!contains(columns, derived.sourceColumn))
            continue;

        const auto* value = cellAt(row, derived.sourceColumn);
        result.derivedValues[derived.targetFieldName] = value ? *value : reference::CellValue{};
    }

    return result;
}

const reference::CellValue* LookupMatchingEngine::cellAt(const reference::ReferenceRow& row,
                                                         const std::string& column)
{
    auto it = row.find(column);
    return it == row.end() ? nullptr : &it->second;
}

} // namespace lookup
