#include "TextNormalizer.hpp"
#include "TextUtils.hpp"
#include "../utils/Diagnostics.hpp"

#include <utf8proc.h>
#include <plog/Log.h>

#include <cstdlib>

namespace similarity
{

namespace
{

bool isCombiningDiacritic(char32_t cp) { return cp >= U'\u0300' && cp <= U'\u036F'; }

constexpr auto kDecompose = static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_DECOMPOSE);
constexpr auto kCompose = static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE);

// Explicit length so embedded NULs survive. ok is false when utf8proc rejects
// the input; the input is returned unchanged.
std::string runUtf8proc(const std::string& text, utf8proc_option_t options, bool& ok)
{
    utf8proc_uint8_t* out = nullptr;
    const utf8proc_ssize_t length =
        utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                     static_cast<utf8proc_ssize_t>(text.size()), &out, options);
    if (length < 0)
    {
        ok = false;
        return text;
    }
    std::string result(reinterpret_cast<const char*>(out), static_cast<std::size_t>(length));
    std::free(out);
    ok = true;
    return result;
}

std::u32string stripAccents(const std::u32string& text)
{
    bool ok = false;
    std::string decomposed = runUtf8proc(utf32ToUtf8(text), kDecompose, ok);
    if (!ok)
    {
        PLOG_WARNING_(utils::Diagnostics::kLogInstance)
            << "[TextNormalizer] NFD decomposition failed, accents kept for "
            << utils::Diagnostics::Preview(utf32ToUtf8(text));
        return text;
    }

    std::u32string stripped;
    stripped.reserve(decomposed.size());
    for (char32_t cp : utf8ToUtf32(decomposed))
    {
        if (!isCombiningDiacritic(cp))
            stripped.push_back(cp);
    }

    std::string recomposed = runUtf8proc(utf32ToUtf8(stripped), kCompose, ok);
    return ok ? utf8ToUtf32(recomposed) : stripped;
}

std::u32string collapseInterior(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    bool in_space = false;
    for (char32_t cp : text)
    {
        if (isWhitespace(cp))
        {
            if (!in_space)
                out.push_back(U' ');
            in_space = true;
        }
        else
        {
            out.push_back(cp);
            in_space = false;
        }
    }
    return out;
}

} // namespace

std::u32string normalizeToCodepoints(const std::string& text, const NormalizeOptions& options)
{
    std::u32string cps = utf8ToUtf32(text);
    if (cps.empty())
        return cps;

    if (options.lowercase)
    {
        for (char32_t& cp : cps)
            cp = toLower(cp);
    }

    if (options.removeAccents)
    {
        cps = stripAccents(cps);
    }

    if (options.removeNonAlphanumeric)
    {
        for (char32_t& cp : cps)
        {
            if (!isAlphanumeric(cp) && !isWhitespace(cp))
                cp = U' ';
        }
    }

    size_t begin = 0;
    while (begin < cps.size() && isWhitespace(cps[begin]))
        ++begin;
    size_t end = cps.size();
    while (end > begin && isWhitespace(cps[end - 1]))
        --end;

    if (options.collapseWhitespace)
    {
        std::u32string content = collapseInterior(cps.substr(begin, end - begin));
        if (options.trim)
            return content;
        return cps.substr(0, begin) + content + cps.substr(end);
    }

    if (options.trim)
        return cps.substr(begin, end - begin);

    return cps;
}

std::string normalizeString(const std::string& text, const NormalizeOptions& options)
{
    return utf32ToUtf8(normalizeToCodepoints(text, options));
}

} // namespace similarity
