#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace reference
{

/// A single table cell: null, boolean, number or text.
using CellValue = std::variant<std::monostate, bool, double, std::string>;

inline bool isNull(const CellValue& value) { return std::holds_alternative<std::monostate>(value); }

/// Text of a string cell, nullptr for every other kind.
inline const std::string* asString(const CellValue& value) { return std::get_if<std::string>(&value); }

/**
 * @brief Text shown for a cell and used for exact comparisons.
 *
 * Strings verbatim, booleans as true/false, integral numbers without a
 * fractional part, other numbers in shortest round-trip form, null as "".
 */
std::string displayText(const CellValue& value);

nlohmann::json toJson(const CellValue& value);

/// Scalar JSON only; arrays and objects yield std::nullopt.
template <typename BasicJson>
std::optional<CellValue> cellFromJson(const BasicJson& j)
{
    if (j.is_null())
        return CellValue{};
    if (j.is_boolean())
        return CellValue{ j.template get<bool>() };
    if (j.is_number())
        return CellValue{ j.template get<double>() };
    if (j.is_string())
        return CellValue{ j.template get<std::string>() };
    return std::nullopt;
}

} // namespace reference
