#include <catch2/catch_test_macros.hpp>
#include "review/FuzzyMatchReview.hpp"
#include "review/JsonlAuditLog.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

using namespace review;
using reference::CellValue;
namespace fs = std::filesystem;

namespace
{

// Helper to create and clean up a scratch directory
class TempDir
{
public:
    TempDir()
        : path_("test_audit_temp")
    {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() { fs::remove_all(path_); }

    std::string file(const std::string& name) const { return (fs::path(path_) / name).string(); }

private:
    std::string path_;
};

} // namespace

TEST_CASE("ReviewEvent - JSON", "[review][audit]")
{
    ReviewEvent event{ ReviewEventKind::BatchAccept, { "match_a", "match_b" }, CellValue{ 3.0 } };
    nlohmann::json j = toJson(event);
    REQUIRE(j["kind"] == "batchAccept");
    REQUIRE(j["matchIds"].size() == 2);
    REQUIRE(j["value"] == 3.0);

    auto parsed = reviewEventFromJson(j);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->kind == ReviewEventKind::BatchAccept);
    REQUIRE(parsed->matchIds == event.matchIds);
    REQUIRE(parsed->value == event.value);

    REQUIRE_FALSE(reviewEventFromJson(nlohmann::json{ { "kind", "undo" }, { "matchIds", nlohmann::json::array() } })
                      .has_value());
    REQUIRE_FALSE(reviewEventFromJson(nlohmann::json::array()).has_value());
}

TEST_CASE("JsonlAuditLog - Append and read back", "[review][audit]")
{
    TempDir dir;
    JsonlAuditLog log(dir.file("nested/audit.jsonl"));

    REQUIRE(log.append(ReviewEvent{ ReviewEventKind::Reject, { "match_1" }, std::nullopt }));
    REQUIRE(log.append(ReviewEvent{ ReviewEventKind::Manual, { "match_2" }, CellValue{ std::string("HR") } }));

    auto events = log.readAll();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].kind == ReviewEventKind::Reject);
    REQUIRE(events[1].value == std::optional<CellValue>(CellValue{ std::string("HR") }));

    SECTION("Each line carries a timestamp")
    {
        std::ifstream in(log.path());
        std::string line;
        REQUIRE(std::getline(in, line));
        REQUIRE(nlohmann::json::parse(line).contains("timestamp"));
    }

    SECTION("Malformed lines are skipped")
    {
        {
            std::ofstream out(log.path(), std::ios::app);
            out << "{not json\n";
            out << "{\"kind\":\"accept\"}\n";
        }
        REQUIRE(log.append(ReviewEvent{ ReviewEventKind::Accept, { "match_3" }, CellValue{ true } }));
        REQUIRE(log.readAll().size() == 3);
    }
}

TEST_CASE("JsonlAuditLog - Session sink", "[review][audit]")
{
    TempDir dir;
    JsonlAuditLog log(dir.file("session.jsonl"));

    std::vector<RawFuzzyMatch> raw = { { "row_0", "city", CellValue{ std::string("Pari") },
                                         CellValue{ std::string("Paris") }, 0.8, {} } };
    FuzzyMatchReview session(raw, log.sink());
    session.acceptMatch(session.matches()[0].id);

    auto events = log.readAll();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].value == std::optional<CellValue>(CellValue{ std::string("Paris") }));
}

TEST_CASE("JsonlAuditLog - Write failures are reported", "[review][audit]")
{
    utils::ErrorReporter::ClearHistory();
    TempDir dir;

    // A regular file where the log directory should be
    const std::string blocker = dir.file("blocker");
    {
        std::ofstream out(blocker);
        out << "x";
    }

    JsonlAuditLog log(blocker + "/audit.jsonl");
    REQUIRE_FALSE(log.append(ReviewEvent{}));
    REQUIRE(log.failedWrites() == 1);
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Review);

    for (int i = 0; i < 5; ++i)
        log.append(ReviewEvent{});
    REQUIRE(log.failedWrites() == 6);
    REQUIRE(utils::ErrorReporter::CountReports(utils::ErrorCategory::Review) == 3);
}
