#pragma once

#include "ReviewEvent.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace review
{

/**
 * @brief Appends review events to a JSON Lines file.
 *
 * Each line is the event JSON plus a "timestamp" member. Write failures are
 * reported through utils::ErrorReporter (the first few per log) and never
 * reach the review session.
 */
class JsonlAuditLog
{
public:
    explicit JsonlAuditLog(std::string path = "review_audit.jsonl");

    bool append(const ReviewEvent& event);

    /// Sink bound to this log; the log must outlive the session using it.
    ReviewEventSink sink();

    /// Events read back in file order. Malformed lines are skipped.
    std::vector<ReviewEvent> readAll() const;

    const std::string& path() const { return path_; }
    std::size_t failedWrites() const { return failed_writes_; }

private:
    std::string path_;
    std::size_t failed_writes_ = 0;

    void reportFailure(const std::string& message, const std::string& detail);
};

} // namespace review
