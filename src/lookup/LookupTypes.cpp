#include "LookupTypes.hpp"

namespace lookup
{

const char* matchTypeName(MatchType type)
{
    switch (type)
    {
    case MatchType::Exact:
        return "exact";
    case MatchType::Normalized:
        return "normalized";
    case MatchType::Fuzzy:
        return "fuzzy";
    case MatchType::None:
        return "none";
    }
    return "none";
}

similarity::NormalizeOptions NormalizationSettings::toOptions() const
{
    similarity::NormalizeOptions options;
    options.trim = trimWhitespace;
    options.lowercase = !caseSensitive;
    options.removeAccents = removeAccents;
    options.collapseWhitespace = collapseWhitespace;
    return options;
}

} // namespace lookup
