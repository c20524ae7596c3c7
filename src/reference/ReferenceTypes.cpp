#include "ReferenceTypes.hpp"

#include <algorithm>
#include <unordered_set>

namespace reference
{

void ValidationResult::merge(const ValidationResult& other)
{
    valid = valid && other.valid;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    suggestions.insert(suggestions.end(), other.suggestions.begin(), other.suggestions.end());
}

bool ReferenceDataset::hasColumn(const std::string& column) const
{
    return std::find(columns.begin(), columns.end(), column) != columns.end();
}

ValidationResult validateDataset(ReferenceDataset& dataset)
{
    ValidationResult result;

    if (dataset.id.empty())
    {
        result.addError("Dataset id must not be empty");
    }

    std::unordered_set<std::string> column_set;
    for (const auto& column : dataset.columns)
    {
        if (column.empty())
        {
            result.addError("Column names must not be empty");
        }
        else if (!column_set.insert(column).second)
        {
            result.addError("Duplicate column '" + column + "'");
        }
    }

    std::size_t incomplete_rows = 0;
    for (std::size_t i = 0; i < dataset.rows.size(); ++i)
    {
        const auto& row = dataset.rows[i];
        for (const auto& [key, value] : row)
        {
            if (column_set.find(key) == column_set.end())
            {
                result.addError("Row " + std::to_string(i + 1) + " has unknown column '" + key + "'");
            }
        }
        if (row.size() < column_set.size())
        {
            ++incomplete_rows;
        }
    }

    if (!result.valid)
        return result;

    if (dataset.rows.empty())
    {
        result.addWarning("Dataset has no rows");
    }

    if (incomplete_rows > 0)
    {
        result.addWarning(std::to_string(incomplete_rows) + " row(s) missing columns, filled with null");
        for (auto& row : dataset.rows)
        {
            for (const auto& column : dataset.columns)
            {
                row.try_emplace(column);
            }
        }
    }

    return result;
}

} // namespace reference
