#pragma once

#include "LookupMatchingEngine.hpp"
#include "../review/ReviewTypes.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lookup
{

/// One row of the table being enriched; cells keyed by field name.
struct TableRow
{
    std::string rowId; // Empty ids become row_<index>
    std::map<std::string, reference::CellValue> cells;
};

enum class OnMismatch
{
    Error,   // Record an error; aborts when continueOnError is off
    Warning, // Record an error, never aborts
    Null     // Clear the cell, record nothing
};

struct LookupFieldDefinition
{
    std::string name; // Table field holding the input value
    std::string datasetId;
    MatchConfig config;
    OnMismatch onMismatch = OnMismatch::Error;
};

enum class LookupErrorType
{
    NoMatch,
    ReferenceMissing,
    InvalidInput
};

const char* lookupErrorTypeName(LookupErrorType type);

struct LookupError
{
    std::string rowId;
    std::string fieldName;
    reference::CellValue inputValue;
    LookupErrorType type = LookupErrorType::NoMatch;
    std::string message;
    std::vector<reference::CellValue> suggestions;
};

struct LookupStats
{
    std::size_t totalFields = 0;
    std::size_t totalRows = 0;
    std::size_t exactMatches = 0;
    std::size_t normalizedMatches = 0;
    std::size_t fuzzyMatches = 0;
    std::size_t noMatches = 0;
    std::size_t derivedColumns = 0;
    double successRate = 0.0;
};

struct ProcessingPerformance
{
    double totalMillis = 0.0;
    double averageMillisPerRow = 0.0;
    double throughput = 0.0; // Rows per second
    std::size_t lookupOperations = 0;
};

struct ProcessingOptions
{
    double minConfidence = 0.7;        // Fuzzy matches below this go to review
    std::size_t maxFuzzyMatches = 100; // Cap on review records
    bool processDerivedFields = true;
    bool continueOnError = true;
    std::function<void(std::size_t processed, std::size_t total)> onProgress;
};

struct ProcessedLookupResult
{
    std::vector<TableRow> rows;
    std::vector<LookupError> errors;
    LookupStats stats;
    std::vector<review::RawFuzzyMatch> fuzzyMatches;
    ProcessingPerformance performance;
    bool aborted = false; // Stopped at the first error; later rows are unchanged
};

/**
 * @brief Applies lookup fields to every row of a table.
 *
 * Matched fields are replaced by the matched value and derived values are
 * written into the row. Low-confidence fuzzy matches are collected as review
 * input.
 */
class LookupProcessor
{
public:
    explicit LookupProcessor(const reference::IReferenceDataStore& store, LookupMatchingEngine engine = {});

    ProcessedLookupResult process(const std::vector<TableRow>& rows, const std::vector<LookupFieldDefinition>& fields,
                                  const ProcessingOptions& options = {}) const;

private:
    const reference::IReferenceDataStore& store_;
    LookupMatchingEngine engine_;
};

} // namespace lookup
