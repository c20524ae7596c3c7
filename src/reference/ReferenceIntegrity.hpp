#pragma once

#include "ReferenceTypes.hpp"

#include <string>
#include <vector>

namespace reference
{

/**
 * @brief Check that a dataset can serve as lookup source for keyColumn.
 *
 * Errors: empty dataset, missing key column (suggestions then list columns
 * whose names contain, or are contained in, the key column, ignoring case).
 * Warnings: duplicate key values (ignoring case) and rows with an empty key.
 */
ValidationResult validateReferenceIntegrity(const ReferenceDataset& dataset, const std::string& keyColumn);

/// Distinct non-empty display values of a column, in first-appearance order.
std::vector<std::string> uniqueValues(const ReferenceDataset& dataset, const std::string& column);

} // namespace reference
