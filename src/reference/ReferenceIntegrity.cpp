#include "ReferenceIntegrity.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace reference
{

namespace
{

std::string asciiLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

ValidationResult validateReferenceIntegrity(const ReferenceDataset& dataset, const std::string& keyColumn)
{
    ValidationResult result;

    if (dataset.rows.empty())
    {
        result.addError("Reference data is empty");
        return result;
    }

    if (!dataset.hasColumn(keyColumn))
    {
        result.addError("Key column \"" + keyColumn + "\" not found in reference data");
        const std::string key_lower = asciiLower(keyColumn);
        for (const auto& column : dataset.columns)
        {
            const std::string column_lower = asciiLower(column);
            if (column_lower.find(key_lower) != std::string::npos || key_lower.find(column_lower) != std::string::npos)
            {
                result.suggestions.push_back(column);
            }
        }
        return result;
    }

    std::unordered_map<std::string, std::size_t> seen;
    std::vector<std::string> duplicates;
    std::size_t empty_keys = 0;

    for (const auto& row : dataset.rows)
    {
        auto cell = row.find(keyColumn);
        std::string text = cell != row.end() ? displayText(cell->second) : std::string();
        if (text.empty())
        {
            ++empty_keys;
            continue;
        }

        if (++seen[asciiLower(text)] == 2)
        {
            duplicates.push_back(text);
        }
    }

    if (!duplicates.empty())
    {
        std::string listed;
        for (std::size_t i = 0; i < duplicates.size() && i < 3; ++i)
        {
            if (i > 0)
                listed += ", ";
            listed += duplicates[i];
        }
        if (duplicates.size() > 3)
            listed += "...";
        result.addWarning("Duplicate values found in key column \"" + keyColumn + "\": " + listed);
    }

    if (empty_keys > 0)
    {
        result.addWarning(std::to_string(empty_keys) + " row(s) have empty values in key column \"" + keyColumn +
                          "\"");
    }

    return result;
}

std::vector<std::string> uniqueValues(const ReferenceDataset& dataset, const std::string& column)
{
    std::vector<std::string> values;
    std::unordered_set<std::string> seen;
    for (const auto& row : dataset.rows)
    {
        auto cell = row.find(column);
        if (cell == row.end())
            continue;

        std::string text = displayText(cell->second);
        if (!text.empty() && seen.insert(text).second)
        {
            values.push_back(std::move(text));
        }
    }
    return values;
}

} // namespace reference
