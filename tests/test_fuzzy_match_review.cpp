#include <catch2/catch_test_macros.hpp>
#include "review/FuzzyMatchReview.hpp"

using namespace review;
using reference::CellValue;

namespace
{

CellValue text(const char* s) { return CellValue{ std::string(s) }; }

std::vector<RawFuzzyMatch> sampleMatches()
{
    return {
        { "row_0", "department", text("Enginering"), text("Engineering"), 0.9, {} },
        { "row_1", "department", text("Markting"), text("Marketing"), 0.75, {} },
        { "row_2", "department", text("Sals"), text("Sales"), 0.85, {} },
    };
}

} // namespace

TEST_CASE("FuzzyMatchReview - Filtered view", "[review][session]")
{
    FuzzyMatchReview session(sampleMatches());

    REQUIRE(session.matches().size() == 3);
    REQUIRE(session.filteredMatches().size() == 3);
    REQUIRE(session.filteredMatches()[0].confidence == 0.9);

    ReviewFilterPatch patch;
    patch.confidenceRange = ConfidenceRange{ 0.8, 1.0 };
    session.updateFilter(patch);

    const auto& visible = session.filteredMatches();
    REQUIRE(visible.size() == 2);
    REQUIRE(visible[0].confidence == 0.9);
    REQUIRE(visible[1].confidence == 0.85);

    session.clearFilter();
    REQUIRE(session.filteredMatches().size() == 3);
}

TEST_CASE("FuzzyMatchReview - Events", "[review][session]")
{
    std::vector<ReviewEvent> events;
    FuzzyMatchReview session(sampleMatches(), [&](const ReviewEvent& e) { events.push_back(e); });
    const std::string first = session.matches()[0].id;
    const std::string second = session.matches()[1].id;

    SECTION("Accept reports the suggested value")
    {
        session.acceptMatch(first);
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].kind == ReviewEventKind::Accept);
        REQUIRE(events[0].matchIds == std::vector<std::string>{ first });
        REQUIRE(events[0].value == std::optional<CellValue>(text("Engineering")));
    }

    SECTION("Reject and manual")
    {
        session.rejectMatch(first);
        session.setManualValue(second, text("Marketing EMEA"));
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].kind == ReviewEventKind::Reject);
        REQUIRE_FALSE(events[0].value.has_value());
        REQUIRE(events[1].kind == ReviewEventKind::Manual);
        REQUIRE(events[1].value == std::optional<CellValue>(text("Marketing EMEA")));
    }

    SECTION("Batch events list the affected ids")
    {
        session.rejectMatch(first);
        events.clear();

        session.selectAll();
        session.acceptSelected();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].kind == ReviewEventKind::BatchAccept);
        REQUIRE(events[0].matchIds.size() == 2);
        REQUIRE_FALSE(events[0].value.has_value());
        REQUIRE(session.isComplete());
    }

    SECTION("Ineffective operations are silent")
    {
        session.acceptMatch("match_missing");
        session.rejectSelected();
        session.toggleSelection(first);
        session.clearSelection();
        session.acceptSelected();
        REQUIRE(events.empty());
    }

    SECTION("Sink can be replaced")
    {
        int replaced = 0;
        session.setEventSink([&](const ReviewEvent&) { ++replaced; });
        session.rejectMatch(first);
        REQUIRE(replaced == 1);
        REQUIRE(events.empty());
    }
}

TEST_CASE("FuzzyMatchReview - Statistics and revision", "[review][session]")
{
    FuzzyMatchReview session(sampleMatches());
    REQUIRE(session.revision() == 0);
    REQUIRE(session.stats().pending == 3);
    REQUIRE_FALSE(session.hasChanges());

    const std::string first = session.matches()[0].id;
    session.acceptMatch(first, text("R&D"));
    REQUIRE(session.revision() == 1);
    REQUIRE(session.stats().accepted == 1);
    REQUIRE(session.stats().progress == 33);
    REQUIRE(session.find(first)->manualValue == std::optional<CellValue>(text("R&D")));
    REQUIRE(session.hasChanges());

    session.toggleSelection(session.matches()[1].id);
    REQUIRE(session.canBatchOperate());
    REQUIRE(session.matches()[1].selected);
    session.rejectSelected();
    REQUIRE(session.revision() == 3);
    REQUIRE(session.selection().empty());

    auto decided = session.decisions();
    REQUIRE(decided.size() == 2);
    REQUIRE(decided[1].status == MatchStatus::Rejected);

    session.resetAll();
    REQUIRE(session.stats().pending == 3);
    REQUIRE(session.decisions().empty());

    session.load({});
    REQUIRE(session.matches().empty());
    REQUIRE(session.isComplete());
    REQUIRE(session.stats().progress == 0);
}
