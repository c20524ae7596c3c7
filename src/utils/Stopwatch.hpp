#pragma once

#include <chrono>
#include <cstdint>

namespace utils
{

/**
 * @brief Monotonic elapsed-time timer for lookup metrics
 *
 * Starts on construction; reading does not stop it.
 */
class Stopwatch
{
public:
    Stopwatch() noexcept
        : start_(std::chrono::steady_clock::now())
    {
    }

    void restart() noexcept { start_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] std::int64_t elapsedMicros() const noexcept
    {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::microseconds>(now - start_).count();
    }

    [[nodiscard]] double elapsedMillis() const noexcept { return elapsedMicros() / 1000.0; }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace utils
