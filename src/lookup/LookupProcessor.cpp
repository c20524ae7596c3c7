#include "LookupProcessor.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Stopwatch.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace lookup
{

namespace
{

bool hasColumn(const std::vector<std::string>& columns, const std::string& column)
{
    return std::find(columns.begin(), columns.end(), column) != columns.end();
}

} // namespace

const char* lookupErrorTypeName(LookupErrorType type)
{
    switch (type)
    {
    case LookupErrorType::NoMatch:
        return "no_match";
    case LookupErrorType::ReferenceMissing:
        return "reference_missing";
    case LookupErrorType::InvalidInput:
        return "invalid_input";
    }
    return "no_match";
}

LookupProcessor::LookupProcessor(const reference::IReferenceDataStore& store, LookupMatchingEngine engine)
    : store_(store)
    , engine_(std::move(engine))
{
}

ProcessedLookupResult LookupProcessor::process(const std::vector<TableRow>& rows,
                                               const std::vector<LookupFieldDefinition>& fields,
                                               const ProcessingOptions& options) const
{
    utils::Stopwatch stopwatch;
    ProcessedLookupResult out;
    out.rows = rows;
    out.stats.totalFields = fields.size();
    out.stats.totalRows = rows.size();

    if (fields.empty() || rows.empty())
    {
        out.stats.successRate = 1.0;
        out.performance.totalMillis = stopwatch.elapsedMillis();
        return out;
    }

    // Resolve each field's dataset once; problems are reported per row below
    struct FieldContext
    {
        const std::vector<reference::ReferenceRow>* rows = nullptr;
        std::vector<std::string> columns;
        std::string problem;
        LookupErrorType problemType = LookupErrorType::ReferenceMissing;
    };

    std::vector<FieldContext> contexts(fields.size());
    std::size_t derived_per_row = 0;
    for (std::size_t f = 0; f < fields.size(); ++f)
    {
        const auto& field = fields[f];
        auto& ctx = contexts[f];
        derived_per_row += field.config.alsoGet.size();

        ctx.rows = store_.getRows(field.datasetId);
        auto metadata = store_.getMetadata(field.datasetId);
        if (!ctx.rows || !metadata || ctx.rows->empty())
        {
            ctx.problem = "Reference data not found for " + field.datasetId;
            ctx.problemType = LookupErrorType::ReferenceMissing;
        }
        else if (!hasColumn(metadata->columns, field.config.sourceColumn) ||
                 !hasColumn(metadata->columns, field.config.targetColumn))
        {
            ctx.problem = "Lookup columns '" + field.config.sourceColumn + "' / '" + field.config.targetColumn +
                          "' not found in " + field.datasetId;
            ctx.problemType = LookupErrorType::InvalidInput;
        }
        else
        {
            ctx.columns = std::move(metadata->columns);
        }

        if (!ctx.problem.empty())
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Lookup, "Lookup field cannot be resolved",
                                                field.name + ": " + ctx.problem);
        }
    }

    for (std::size_t index = 0; index < out.rows.size() && !out.aborted; ++index)
    {
        if (options.onProgress && index % 100 == 0)
        {
            options.onProgress(index, out.rows.size());
        }

        TableRow& row = out.rows[index];
        const std::string row_id = row.rowId.empty() ? "row_" + std::to_string(index) : row.rowId;

        for (std::size_t f = 0; f < fields.size(); ++f)
        {
            const auto& field = fields[f];
            const auto& ctx = contexts[f];

            auto cell_it = row.cells.find(field.name);
            reference::CellValue input = cell_it != row.cells.end() ? cell_it->second : reference::CellValue{};

            if (!ctx.problem.empty())
            {
                out.errors.push_back(LookupError{ row_id, field.name, input, ctx.problemType, ctx.problem, {} });
                if (!options.continueOnError)
                {
                    out.aborted = true;
                    break;
                }
                continue;
            }

            LookupResult result = engine_.performLookup(reference::displayText(input), ctx.columns, *ctx.rows,
                                                        field.config);
            ++out.performance.lookupOperations;

            if (result.matched)
            {
                row.cells[field.name] = result.matchedValue;
                if (options.processDerivedFields)
                {
                    for (const auto& [target, value] : result.derivedValues)
                    {
                        row.cells[target] = value;
                    }
                }

                switch (result.matchType)
                {
                case MatchType::Exact:
                    ++out.stats.exactMatches;
                    break;
                case MatchType::Normalized:
                    ++out.stats.normalizedMatches;
                    break;
                case MatchType::Fuzzy:
                    ++out.stats.fuzzyMatches;
                    if (result.confidence < options.minConfidence &&
                        out.fuzzyMatches.size() < options.maxFuzzyMatches)
                    {
                        review::RawFuzzyMatch match;
                        match.rowId = row_id;
                        match.fieldName = field.name;
                        match.inputValue = input;
                        match.suggestedValue = result.matchedValue;
                        match.confidence = result.confidence;
                        for (const auto& suggestion : result.suggestions)
                        {
                            match.candidateValues.push_back(suggestion.value);
                        }
                        out.fuzzyMatches.push_back(std::move(match));
                    }
                    break;
                case MatchType::None:
                    break;
                }
                continue;
            }

            ++out.stats.noMatches;

            if (field.onMismatch == OnMismatch::Null)
            {
                row.cells[field.name] = reference::CellValue{};
                continue;
            }

            LookupError error{ row_id,
                               field.name,
                               input,
                               LookupErrorType::NoMatch,
                               "No match found for \"" + result.inputValue + "\" in " + field.datasetId,
                               {} };
            for (const auto& suggestion : result.suggestions)
            {
                error.suggestions.push_back(suggestion.value);
            }
            out.errors.push_back(std::move(error));

            if (field.onMismatch == OnMismatch::Error && !options.continueOnError)
            {
                out.aborted = true;
                break;
            }
        }

        if (options.processDerivedFields)
        {
            out.stats.derivedColumns += derived_per_row;
        }
    }

    if (out.aborted)
    {
        PLOG_WARNING_(utils::Diagnostics::kLogInstance)
            << "[LookupProcessor] Stopped at first error: " << out.errors.back().message;
    }
    else if (options.onProgress)
    {
        options.onProgress(out.rows.size(), out.rows.size());
    }

    const double attempted = static_cast<double>(out.rows.size() * fields.size());
    out.stats.successRate =
        static_cast<double>(out.stats.exactMatches + out.stats.normalizedMatches + out.stats.fuzzyMatches) /
        attempted;

    auto& perf = out.performance;
    perf.totalMillis = stopwatch.elapsedMillis();
    perf.averageMillisPerRow = perf.totalMillis / static_cast<double>(out.rows.size());
    if (perf.totalMillis > 0.0)
    {
        perf.throughput = static_cast<double>(out.rows.size()) / (perf.totalMillis / 1000.0);
    }

    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[LookupProcessor] " << out.rows.size() << " rows x " << fields.size() << " fields: "
        << out.stats.exactMatches << " exact, " << out.stats.normalizedMatches << " normalized, "
        << out.stats.fuzzyMatches << " fuzzy, " << out.stats.noMatches << " unmatched, "
        << out.fuzzyMatches.size() << " for review";

    return out;
}

} // namespace lookup
