#include <catch2/catch_test_macros.hpp>
#include "reference/ReferenceDataStore.hpp"
#include "reference/ReferenceIntegrity.hpp"
#include "utils/ErrorReporter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace reference;
namespace fs = std::filesystem;

namespace
{

CellValue text(const char* s) { return CellValue{ std::string(s) }; }

ReferenceDataset departments()
{
    ReferenceDataset dataset;
    dataset.id = "departments";
    dataset.name = "Departments";
    dataset.columns = { "code", "name", "manager" };
    dataset.rows = {
        { { "code", text("D01") }, { "name", text("Engineering") }, { "manager", text("Alice") } },
        { { "code", text("D02") }, { "name", text("Marketing") }, { "manager", text("Bob") } },
        { { "code", text("D03") }, { "name", text("Sales") }, { "manager", text("Carol") } },
    };
    return dataset;
}

// Helper to create a temporary reference JSON file
class TempJsonFile
{
public:
    TempJsonFile(const std::string& content)
        : path_("test_reference_temp.json")
    {
        std::ofstream file(path_);
        file << content;
        file.close();
    }

    ~TempJsonFile()
    {
        if (fs::exists(path_))
        {
            fs::remove(path_);
        }
    }

    std::string getPath() const { return path_; }

private:
    std::string path_;
};

} // namespace

TEST_CASE("CellValue - Display text", "[reference]")
{
    REQUIRE(displayText(CellValue{}) == "");
    REQUIRE(displayText(CellValue{ true }) == "true");
    REQUIRE(displayText(CellValue{ false }) == "false");
    REQUIRE(displayText(CellValue{ 42.0 }) == "42");
    REQUIRE(displayText(CellValue{ -7.0 }) == "-7");
    REQUIRE(displayText(CellValue{ 3.5 }) == "3.5");
    REQUIRE(displayText(CellValue{ 0.1 }) == "0.1");
    REQUIRE(displayText(CellValue{ 0.0 }) == "0");
    REQUIRE(displayText(CellValue{ std::numeric_limits<double>::quiet_NaN() }) == "NaN");
    REQUIRE(displayText(CellValue{ std::numeric_limits<double>::infinity() }) == "Infinity");
    REQUIRE(displayText(text("Sales")) == "Sales");
}

TEST_CASE("CellValue - JSON conversion", "[reference]")
{
    REQUIRE(toJson(CellValue{}).is_null());
    REQUIRE(toJson(CellValue{ 2.5 }) == nlohmann::json(2.5));
    REQUIRE(toJson(text("x")) == nlohmann::json("x"));

    REQUIRE(cellFromJson(nlohmann::json(true)) == CellValue{ true });
    REQUIRE(cellFromJson(nlohmann::json(7)) == CellValue{ 7.0 });
    REQUIRE(cellFromJson(nlohmann::json("abc")) == text("abc"));
    REQUIRE_FALSE(cellFromJson(nlohmann::json::array({ 1, 2 })).has_value());
    REQUIRE_FALSE(cellFromJson(nlohmann::json::object()).has_value());
}

TEST_CASE("validateDataset - Ingestion rules", "[reference]")
{
    SECTION("Missing cells are filled with null")
    {
        ReferenceDataset dataset = departments();
        dataset.rows.push_back({ { "code", text("D04") } });

        ValidationResult result = validateDataset(dataset);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0] == "1 row(s) missing columns, filled with null");
        REQUIRE(dataset.rows[3].size() == 3);
        REQUIRE(isNull(dataset.rows[3].at("name")));
    }

    SECTION("Unknown keys are rejected and rows stay untouched")
    {
        ReferenceDataset dataset = departments();
        dataset.rows.push_back({ { "code", text("D04") }, { "budget", CellValue{ 10.0 } } });

        ValidationResult result = validateDataset(dataset);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors[0] == "Row 4 has unknown column 'budget'");
        REQUIRE(dataset.rows[3].size() == 2);
    }

    SECTION("Duplicate and empty column names")
    {
        ReferenceDataset dataset;
        dataset.id = "bad";
        dataset.columns = { "a", "a", "" };
        ValidationResult result = validateDataset(dataset);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors.size() == 2);
    }

    SECTION("Empty dataset only warns")
    {
        ReferenceDataset dataset;
        dataset.id = "empty";
        dataset.columns = { "a" };
        ValidationResult result = validateDataset(dataset);
        REQUIRE(result.valid);
        REQUIRE(result.warnings == std::vector<std::string>{ "Dataset has no rows" });
    }
}

TEST_CASE("ReferenceDataStore - CRUD", "[reference]")
{
    ReferenceDataStore store;
    REQUIRE(store.add(departments()).valid);

    SECTION("Stored dataset is readable through the interface")
    {
        REQUIRE(store.has("departments"));
        const auto* rows = store.getRows("departments");
        REQUIRE(rows != nullptr);
        REQUIRE(rows->size() == 3);

        auto metadata = store.getMetadata("departments");
        REQUIRE(metadata.has_value());
        REQUIRE(metadata->columns == std::vector<std::string>{ "code", "name", "manager" });
        REQUIRE(metadata->rowCount == 3);

        REQUIRE(store.getRows("missing") == nullptr);
        REQUIRE_FALSE(store.getMetadata("missing").has_value());
    }

    SECTION("Duplicate id is rejected without overwrite")
    {
        ValidationResult result = store.add(departments());
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors[0] == "Reference data with ID 'departments' already exists");

        ReferenceDataset replacement = departments();
        replacement.rows.pop_back();
        REQUIRE(store.add(replacement, true).valid);
        REQUIRE(store.getRows("departments")->size() == 2);
    }

    SECTION("List is sorted by id")
    {
        ReferenceDataset other;
        other.id = "cities";
        other.columns = { "name" };
        other.rows = { { { "name", text("Paris") } } };
        REQUIRE(store.add(other).valid);

        auto infos = store.list();
        REQUIRE(infos.size() == 2);
        REQUIRE(infos[0].id == "cities");
        REQUIRE(infos[1].id == "departments");
        REQUIRE(infos[1].name == "Departments");
        REQUIRE(infos[1].rowCount == 3);
        REQUIRE_FALSE(infos[1].createdAt.empty());
    }

    SECTION("Update replaces rows and keeps columns")
    {
        ValidationResult result = store.update("departments", { { { "code", text("D09") } } });
        REQUIRE(result.valid);
        REQUIRE(store.get("departments")->rows.size() == 1);
        REQUIRE(isNull(store.get("departments")->rows[0].at("manager")));

        REQUIRE_FALSE(store.update("missing", {}).valid);
        REQUIRE_FALSE(store.update("departments", { { { "floor", CellValue{ 3.0 } } } }).valid);
        REQUIRE(store.get("departments")->rows.size() == 1);
    }

    SECTION("Remove, stats and clear")
    {
        StoreStats stats = store.stats();
        REQUIRE(stats.totalDatasets == 1);
        REQUIRE(stats.totalRows == 3);
        REQUIRE(stats.datasets[0].name == "Departments");

        REQUIRE(store.remove("departments"));
        REQUIRE_FALSE(store.remove("departments"));

        REQUIRE(store.add(departments()).valid);
        store.clearAll();
        REQUIRE(store.list().empty());
    }
}

TEST_CASE("ReferenceDataStore - Backup and restore", "[reference]")
{
    utils::ErrorReporter::ClearHistory();

    ReferenceDataStore source;
    REQUIRE(source.add(departments()).valid);
    nlohmann::json backup = source.exportJson();

    REQUIRE(backup.contains("departments"));
    REQUIRE(backup["departments"]["info"]["rowCount"] == 3);
    REQUIRE(backup["departments"]["data"][1]["name"] == "Marketing");

    SECTION("Import restores datasets")
    {
        ReferenceDataStore restored;
        REQUIRE(restored.importJson(backup).valid);
        const auto* dataset = restored.get("departments");
        REQUIRE(dataset != nullptr);
        REQUIRE(dataset->columns == std::vector<std::string>{ "code", "name", "manager" });
        REQUIRE(dataset->rows[2].at("manager") == text("Carol"));
        REQUIRE(restored.info("departments")->createdAt == source.info("departments")->createdAt);
    }

    SECTION("Invalid entries are skipped and reported")
    {
        nlohmann::json nested_row = { { "x", nlohmann::json::array({ 1, 2 }) } };
        backup["broken"]["info"]["name"] = "Broken";
        backup["broken"]["data"] = nlohmann::json::array({ nested_row });
        backup["nodata"]["info"]["name"] = "No data";

        ReferenceDataStore restored;
        ValidationResult result = restored.importJson(backup);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors.size() == 2);
        REQUIRE(restored.has("departments"));
        REQUIRE_FALSE(restored.has("broken"));
        REQUIRE_FALSE(restored.has("nodata"));
        REQUIRE(utils::ErrorReporter::CountReports(utils::ErrorCategory::ReferenceData) > 0);
    }

    utils::ErrorReporter::ClearHistory();
}

TEST_CASE("ReferenceDataStore - JSON files", "[reference]")
{
    utils::ErrorReporter::ClearHistory();
    ReferenceDataStore store;

    SECTION("Columns follow the file's key order")
    {
        TempJsonFile temp(R"([
            {"code": "E001", "name": "Alice", "salary": 50000},
            {"code": "E002", "name": "Bob", "active": true}
        ])");

        ValidationResult result = store.loadJsonFile(temp.getPath(), "employees");
        REQUIRE(result.valid);
        const auto* dataset = store.get("employees");
        REQUIRE(dataset != nullptr);
        REQUIRE(dataset->columns == std::vector<std::string>{ "code", "name", "salary", "active" });
        REQUIRE(dataset->name == "test_reference_temp");
        REQUIRE(dataset->rows[0].at("salary") == CellValue{ 50000.0 });
        REQUIRE(isNull(dataset->rows[0].at("active")));
    }

    SECTION("Nested values are rejected")
    {
        TempJsonFile temp(R"([{"code": "E001", "tags": ["a", "b"]}])");
        ValidationResult result = store.loadJsonFile(temp.getPath(), "employees", "Employees");
        REQUIRE_FALSE(result.valid);
        REQUIRE_FALSE(store.has("employees"));
    }

    SECTION("Top level must be an array")
    {
        TempJsonFile temp(R"({"code": "E001"})");
        REQUIRE_FALSE(store.loadJsonFile(temp.getPath(), "employees").valid);
    }

    SECTION("Parse errors are reported")
    {
        TempJsonFile temp("[{\"code\": ");
        ValidationResult result = store.loadJsonFile(temp.getPath(), "employees");
        REQUIRE_FALSE(result.valid);
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::ReferenceData);
    }

    SECTION("Missing file is reported")
    {
        ValidationResult result = store.loadJsonFile("no_such_reference_file.json", "employees");
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors[0] == "File not found: no_such_reference_file.json");
        REQUIRE(utils::ErrorReporter::CountReports(utils::ErrorCategory::ReferenceData) > 0);
    }

    utils::ErrorReporter::ClearHistory();
}

TEST_CASE("ReferenceIntegrity - Key column checks", "[reference]")
{
    SECTION("Clean dataset passes")
    {
        ValidationResult result = validateReferenceIntegrity(departments(), "name");
        REQUIRE(result.valid);
        REQUIRE(result.warnings.empty());
    }

    SECTION("Empty dataset")
    {
        ReferenceDataset dataset;
        dataset.id = "empty";
        dataset.columns = { "name" };
        ValidationResult result = validateReferenceIntegrity(dataset, "name");
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors[0] == "Reference data is empty");
    }

    SECTION("Missing key column suggests similar names")
    {
        ReferenceDataset dataset;
        dataset.id = "staff";
        dataset.columns = { "Emp_ID", "name" };
        dataset.rows = { { { "Emp_ID", text("1") }, { "name", text("Alice") } } };

        ValidationResult result = validateReferenceIntegrity(dataset, "id");
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors[0] == "Key column \"id\" not found in reference data");
        REQUIRE(result.suggestions == std::vector<std::string>{ "Emp_ID" });
    }

    SECTION("Duplicates ignore case and empty keys are counted")
    {
        ReferenceDataset dataset = departments();
        dataset.rows.push_back({ { "code", text("D04") }, { "name", text("sales") }, { "manager", text("Dan") } });
        dataset.rows.push_back({ { "code", text("D05") }, { "name", text("") }, { "manager", text("Eve") } });

        ValidationResult result = validateReferenceIntegrity(dataset, "name");
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 2);
        REQUIRE(result.warnings[0] == "Duplicate values found in key column \"name\": sales");
        REQUIRE(result.warnings[1] == "1 row(s) have empty values in key column \"name\"");
    }

    SECTION("Unique values keep first appearance order")
    {
        ReferenceDataset dataset = departments();
        dataset.rows.push_back({ { "code", text("D04") }, { "name", text("Sales") }, { "manager", text("Dan") } });
        REQUIRE(uniqueValues(dataset, "name") == std::vector<std::string>{ "Engineering", "Marketing", "Sales" });
    }
}
