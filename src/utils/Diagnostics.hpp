#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace utils
{

/// Shared switches for the matching/review log channel.
class Diagnostics
{
public:
    /// plog instance used by similarity, reference, lookup and review code.
    static constexpr int kLogInstance = 1;

    /// Per-candidate scoring traces are only written in verbose mode.
    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /// Escaped, length-limited rendering of a user value for log lines.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace utils
