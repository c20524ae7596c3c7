#pragma once

#include "LookupTypes.hpp"
#include "../reference/IReferenceDataStore.hpp"
#include "../similarity/FuzzyMatcher.hpp"

#include <string>
#include <vector>

namespace lookup
{

/**
 * @brief Resolves input values against a reference dataset.
 *
 * Tiers are tried in order and the first hit wins:
 *  1. exact      - display text of sourceColumn equals the input (confidence 1.0)
 *  2. normalized - equal after normalization (confidence 0.95)
 *  3. fuzzy      - best scored candidate at or above fuzzyThreshold
 *  4. none
 *
 * The engine holds no per-lookup state; results depend only on the arguments.
 * Configuration problems (unknown columns, missing datasets) produce a "none"
 * result instead of an error.
 */
class LookupMatchingEngine
{
public:
    static constexpr double kNormalizedConfidence = 0.95;
    // Candidates down to this score are kept as suggestions
    static constexpr double kSuggestionFloor = 0.1;

    LookupMatchingEngine() = default;

    /// Weights, prefix scale and length-ratio floor come from scoring; the
    /// algorithm and normalization are taken from each MatchConfig.
    explicit LookupMatchingEngine(similarity::MatcherOptions scoring);

    LookupResult performLookup(const std::string& inputValue, const reference::ReferenceDataset& dataset,
                               const MatchConfig& config) const;

    LookupResult performLookup(const std::string& inputValue, const reference::IReferenceDataStore& store,
                               const std::string& datasetId, const MatchConfig& config) const;

    LookupResult performLookup(const std::string& inputValue, const std::vector<std::string>& columns,
                               const std::vector<reference::ReferenceRow>& rows, const MatchConfig& config) const;

    /**
     * @brief Look up many values against one dataset.
     *
     * The progress callback fires after every batchSize inputs and once at
     * the end.
     */
    BatchLookupResult batchLookup(const std::vector<std::string>& inputValues,
                                  const reference::ReferenceDataset& dataset, const MatchConfig& config,
                                  std::size_t batchSize = 1000, const BatchProgressCallback& onProgress = {}) const;

    /// Similarity of two values under the engine's scoring options.
    double calculateSimilarity(const std::string& a, const std::string& b) const;

    /**
     * @brief Human-readable reason attached to a suggestion.
     *
     * By score: "Very similar spelling" (>= 0.9), "Similar spelling" (>= 0.8),
     * "Possible match" (>= 0.7). Below that "Case difference" when only case
     * differs, "Spacing or punctuation difference" when the values agree after
     * folding spacing and punctuation, otherwise "Partial match".
     */
    static std::string suggestionReason(double confidence, const std::string& input, const std::string& suggestion);

private:
    similarity::MatcherOptions scoring_;

    LookupResult matchedResult(const std::string& inputValue, const std::vector<std::string>& columns,
                               const reference::ReferenceRow& row, std::size_t rowIndex, const MatchConfig& config,
                               double confidence, MatchType type) const;

    static const reference::CellValue* cellAt(const reference::ReferenceRow& row, const std::string& column);
};

} // namespace lookup
