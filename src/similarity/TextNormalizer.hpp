#pragma once

#include <string>

namespace similarity
{

/**
 * @brief Steps of the comparison normalization pipeline.
 *
 * Steps run in a fixed order: lowercase, accent strip, non-alphanumeric
 * replacement, whitespace collapse, trim. The defaults fold case, accents and
 * spacing but keep punctuation.
 */
struct NormalizeOptions
{
    bool trim = true;
    bool lowercase = true;
    bool removeAccents = true;
    bool removeNonAlphanumeric = false; // Replaced by a space so words stay separated
    bool collapseWhitespace = true;
};

/**
 * @brief Normalize a UTF-8 string for comparison.
 *
 * Accent stripping decomposes (NFD), drops combining diacritical marks
 * U+0300..U+036F and recomposes (NFC). When collapseWhitespace is set and
 * trim is not, leading and trailing whitespace is kept as-is and only the
 * interior runs are collapsed to a single space.
 */
std::string normalizeString(const std::string& text, const NormalizeOptions& options = {});

/// Codepoint form of normalizeString for callers that score the result.
std::u32string normalizeToCodepoints(const std::string& text, const NormalizeOptions& options = {});

} // namespace similarity
