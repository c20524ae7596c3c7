#pragma once

#include "CellValue.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace reference
{

/// Column name -> cell. After ingestion every dataset column has an entry.
using ReferenceRow = std::unordered_map<std::string, CellValue>;

struct ValidationResult
{
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;

    void addError(std::string message)
    {
        valid = false;
        errors.push_back(std::move(message));
    }

    void addWarning(std::string message) { warnings.push_back(std::move(message)); }

    void merge(const ValidationResult& other);
};

struct ReferenceDataset
{
    std::string id;
    std::string name;
    std::vector<std::string> columns; // Fixed order
    std::vector<ReferenceRow> rows;

    bool hasColumn(const std::string& column) const;
};

struct DatasetMetadata
{
    std::vector<std::string> columns;
    std::size_t rowCount = 0;
};

struct DatasetInfo
{
    std::string id;
    std::string name;
    std::vector<std::string> columns;
    std::size_t rowCount = 0;
    std::string createdAt;  // ISO-8601 UTC
    std::string modifiedAt; // ISO-8601 UTC
};

struct StoreStats
{
    struct Entry
    {
        std::string id;
        std::string name;
        std::size_t rows = 0;
    };

    std::size_t totalDatasets = 0;
    std::size_t totalRows = 0;
    std::vector<Entry> datasets;
};

/**
 * @brief Ingestion check applied whenever rows enter a dataset.
 *
 * Fills missing columns with null and rejects keys outside the column list.
 * Duplicate or empty column names are errors as well. Rows are only modified
 * when the result is valid.
 */
ValidationResult validateDataset(ReferenceDataset& dataset);

} // namespace reference
