#include "ReviewTypes.hpp"
#include "../similarity/TextNormalizer.hpp"

namespace review
{

namespace
{

std::string foldCase(const std::string& text)
{
    similarity::NormalizeOptions options;
    options.trim = false;
    options.removeAccents = false;
    options.collapseWhitespace = false;
    return similarity::normalizeString(text, options);
}

bool containsFolded(const reference::CellValue& value, const std::string& needle)
{
    return foldCase(reference::displayText(value)).find(needle) != std::string::npos;
}

} // namespace

const char* statusName(MatchStatus status)
{
    switch (status)
    {
    case MatchStatus::Pending:
        return "pending";
    case MatchStatus::Accepted:
        return "accepted";
    case MatchStatus::Rejected:
        return "rejected";
    case MatchStatus::Manual:
        return "manual";
    }
    return "pending";
}

bool ReviewFilter::matches(const FuzzyMatchForReview& match) const
{
    if (confidenceRange && (match.confidence < confidenceRange->min || match.confidence > confidenceRange->max))
        return false;

    if (fieldName && match.fieldName != *fieldName)
        return false;

    if (!status.empty() && status.find(match.status) == status.end())
        return false;

    if (searchTerm && !searchTerm->empty())
    {
        const std::string needle = foldCase(*searchTerm);
        bool found = containsFolded(match.inputValue, needle) || containsFolded(match.suggestedValue, needle);
        for (std::size_t i = 0; !found && i < match.candidateValues.size(); ++i)
        {
            found = containsFolded(match.candidateValues[i], needle);
        }
        if (!found)
            return false;
    }

    return true;
}

void ReviewFilterPatch::applyTo(ReviewFilter& filter) const
{
    if (confidenceRange)
        filter.confidenceRange = *confidenceRange;
    if (fieldName)
        filter.fieldName = *fieldName;
    if (status)
        filter.status = *status;
    if (searchTerm)
        filter.searchTerm = *searchTerm;
}

} // namespace review
