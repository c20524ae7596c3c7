#pragma once

#include <string>

namespace similarity
{

/// UTF-8 to UTF-32 conversion; malformed bytes become U+FFFD
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Whitespace as understood by the normalizer (ASCII controls, Unicode space separators, BOM)
bool isWhitespace(char32_t cp);

/// Letters and numbers in any script (Unicode categories L* and N*)
bool isAlphanumeric(char32_t cp);

/// Simple case mapping of a single codepoint
char32_t toLower(char32_t cp);

constexpr char32_t REPLACEMENT_CHAR = U'\uFFFD';

} // namespace similarity
