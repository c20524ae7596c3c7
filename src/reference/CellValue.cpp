#include "CellValue.hpp"

#include <charconv>
#include <cmath>
#include <type_traits>

namespace reference
{

namespace
{

std::string numberText(double number)
{
    if (std::isnan(number))
        return "NaN";
    if (std::isinf(number))
        return number > 0 ? "Infinity" : "-Infinity";
    if (number == 0.0)
        return "0";

    char buffer[64];
    std::to_chars_result res{};
    if (std::trunc(number) == number && std::fabs(number) < 1e21)
    {
        res = std::to_chars(buffer, buffer + sizeof(buffer), number, std::chars_format::fixed);
    }
    else
    {
        res = std::to_chars(buffer, buffer + sizeof(buffer), number);
    }
    if (res.ec != std::errc())
        return std::to_string(number);
    return std::string(buffer, res.ptr);
}

} // namespace

std::string displayText(const CellValue& value)
{
    return std::visit(
        [](const auto& v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                return {};
            else if constexpr (std::is_same_v<T, bool>)
                return v ? "true" : "false";
            else if constexpr (std::is_same_v<T, double>)
                return numberText(v);
            else
                return v;
        },
        value);
}

nlohmann::json toJson(const CellValue& value)
{
    return std::visit(
        [](const auto& v) -> nlohmann::json
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                return nullptr;
            else
                return v;
        },
        value);
}

} // namespace reference
