#include "ReferenceDataStore.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace reference
{

namespace
{

// Converts an array of flat objects into rows, appending newly seen keys to columns
template <typename BasicJson>
ValidationResult rowsFromJson(const BasicJson& array, std::vector<std::string>& columns, bool infer_columns,
                              std::vector<ReferenceRow>& rows)
{
    ValidationResult result;
    if (!array.is_array())
    {
        result.addError("JSON must be an array of objects");
        return result;
    }

    rows.clear();
    rows.reserve(array.size());
    std::size_t index = 0;
    for (const auto& item : array)
    {
        ++index;
        if (!item.is_object())
        {
            result.addError("Item " + std::to_string(index) + " is not an object");
            continue;
        }

        ReferenceRow row;
        for (const auto& [key, value] : item.items())
        {
            auto cell = cellFromJson(value);
            if (!cell)
            {
                result.addError("Item " + std::to_string(index) + " has nested value for '" + key + "'");
                continue;
            }
            if (infer_columns && std::find(columns.begin(), columns.end(), key) == columns.end())
            {
                columns.push_back(key);
            }
            row.emplace(key, std::move(*cell));
        }
        rows.push_back(std::move(row));
    }
    return result;
}

} // namespace

const std::vector<ReferenceRow>* ReferenceDataStore::getRows(const std::string& id) const
{
    auto it = datasets_.find(id);
    if (it == datasets_.end())
        return nullptr;
    return &it->second.dataset.rows;
}

std::optional<DatasetMetadata> ReferenceDataStore::getMetadata(const std::string& id) const
{
    auto it = datasets_.find(id);
    if (it == datasets_.end())
        return std::nullopt;
    return DatasetMetadata{ it->second.dataset.columns, it->second.dataset.rows.size() };
}

ValidationResult ReferenceDataStore::add(ReferenceDataset dataset, bool overwrite)
{
    if (!overwrite && has(dataset.id))
    {
        ValidationResult duplicate;
        duplicate.addError("Reference data with ID '" + dataset.id + "' already exists");
        return duplicate;
    }

    ValidationResult result = validateDataset(dataset);
    if (!result.valid)
    {
        PLOG_WARNING_(utils::Diagnostics::kLogInstance)
            << "[ReferenceDataStore] Rejected dataset '" << dataset.id << "': " << result.errors.front();
        return result;
    }

    std::string now = currentTimestamp();
    auto existing = datasets_.find(dataset.id);
    std::string created = existing != datasets_.end() ? existing->second.createdAt : now;

    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[ReferenceDataStore] Stored '" << dataset.id << "': " << dataset.rows.size() << " rows, "
        << dataset.columns.size() << " columns";

    std::string id = dataset.id;
    datasets_[id] = Entry{ std::move(dataset), std::move(created), std::move(now) };
    return result;
}

const ReferenceDataset* ReferenceDataStore::get(const std::string& id) const
{
    auto it = datasets_.find(id);
    return it == datasets_.end() ? nullptr : &it->second.dataset;
}

bool ReferenceDataStore::has(const std::string& id) const { return datasets_.find(id) != datasets_.end(); }

std::vector<DatasetInfo> ReferenceDataStore::list() const
{
    std::vector<DatasetInfo> infos;
    infos.reserve(datasets_.size());
    for (const auto& [id, entry] : datasets_)
    {
        infos.push_back(makeInfo(entry));
    }
    return infos;
}

std::optional<DatasetInfo> ReferenceDataStore::info(const std::string& id) const
{
    auto it = datasets_.find(id);
    if (it == datasets_.end())
        return std::nullopt;
    return makeInfo(it->second);
}

bool ReferenceDataStore::remove(const std::string& id)
{
    if (datasets_.erase(id) == 0)
        return false;

    PLOG_INFO_(utils::Diagnostics::kLogInstance) << "[ReferenceDataStore] Removed '" << id << "'";
    return true;
}

ValidationResult ReferenceDataStore::update(const std::string& id, std::vector<ReferenceRow> rows)
{
    auto it = datasets_.find(id);
    if (it == datasets_.end())
    {
        ValidationResult missing;
        missing.addError("Reference data with ID '" + id + "' not found");
        return missing;
    }

    ReferenceDataset candidate = it->second.dataset;
    candidate.rows = std::move(rows);
    ValidationResult result = validateDataset(candidate);
    if (!result.valid)
        return result;

    it->second.dataset = std::move(candidate);
    it->second.modifiedAt = currentTimestamp();
    return result;
}

void ReferenceDataStore::clearAll()
{
    PLOG_INFO_(utils::Diagnostics::kLogInstance)
        << "[ReferenceDataStore] Clearing " << datasets_.size() << " dataset(s)";
    datasets_.clear();
}

StoreStats ReferenceDataStore::stats() const
{
    StoreStats stats;
    stats.totalDatasets = datasets_.size();
    for (const auto& [id, entry] : datasets_)
    {
        stats.totalRows += entry.dataset.rows.size();
        stats.datasets.push_back(StoreStats::Entry{ id, entry.dataset.name, entry.dataset.rows.size() });
    }
    return stats;
}

json ReferenceDataStore::exportJson() const
{
    json backup = json::object();
    for (const auto& [id, entry] : datasets_)
    {
        const auto& dataset = entry.dataset;

        json data = json::array();
        for (const auto& row : dataset.rows)
        {
            json obj = json::object();
            for (const auto& column : dataset.columns)
            {
                auto cell = row.find(column);
                obj[column] = cell != row.end() ? toJson(cell->second) : json(nullptr);
            }
            data.push_back(std::move(obj));
        }

        backup[id] = { { "info",
                         { { "id", id },
                           { "name", dataset.name },
                           { "columns", dataset.columns },
                           { "rowCount", dataset.rows.size() },
                           { "createdAt", entry.createdAt },
                           { "modifiedAt", entry.modifiedAt } } },
                       { "data", std::move(data) } };
    }
    return backup;
}

ValidationResult ReferenceDataStore::importJson(const json& backup)
{
    ValidationResult result;
    if (!backup.is_object())
    {
        result.addError("Backup must be an object keyed by dataset id");
        utils::ErrorReporter::ReportError(utils::ErrorCategory::ReferenceData, "Failed to import reference data",
                                          result.errors.front());
        return result;
    }

    std::size_t imported = 0;
    for (const auto& [id, entry] : backup.items())
    {
        if (!entry.is_object() || !entry.contains("data"))
        {
            result.addError("Dataset '" + id + "' has no data array");
            continue;
        }

        ReferenceDataset dataset;
        dataset.id = id;
        dataset.name = id;
        std::string created;
        std::string modified;
        bool infer_columns = true;

        try
        {
            if (auto info = entry.find("info"); info != entry.end() && info->is_object())
            {
                dataset.name = info->value("name", id);
                created = info->value("createdAt", std::string());
                modified = info->value("modifiedAt", std::string());
                if (auto cols = info->find("columns"); cols != info->end() && cols->is_array())
                {
                    dataset.columns = cols->get<std::vector<std::string>>();
                    infer_columns = false;
                }
            }
        }
        catch (const json::exception& e)
        {
            result.addError("Dataset '" + id + "' has malformed info: " + e.what());
            continue;
        }

        ValidationResult parsed = rowsFromJson(entry.at("data"), dataset.columns, infer_columns, dataset.rows);
        if (parsed.valid)
        {
            parsed.merge(validateDataset(dataset));
        }
        if (!parsed.valid)
        {
            for (const auto& error : parsed.errors)
            {
                result.addError("Dataset '" + id + "': " + error);
            }
            continue;
        }

        std::string now = currentTimestamp();
        datasets_[id] = Entry{ std::move(dataset), created.empty() ? now : created, modified.empty() ? now : modified };
        ++imported;
    }

    if (!result.valid)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ReferenceData,
                                            "Some reference datasets could not be imported",
                                            std::to_string(result.errors.size()) + " error(s), first: " +
                                                result.errors.front());
    }

    PLOG_INFO_(utils::Diagnostics::kLogInstance) << "[ReferenceDataStore] Imported " << imported << " dataset(s)";
    return result;
}

ValidationResult ReferenceDataStore::loadJsonFile(const std::string& path, const std::string& id,
                                                  const std::string& name, bool overwrite)
{
    ValidationResult result;

    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        result.addError("File not found: " + path);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::ReferenceData, "Reference file not found", path);
        return result;
    }

    std::ifstream file(path);
    if (!file.is_open())
    {
        result.addError("Failed to open file: " + path);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::ReferenceData, "Failed to open reference file", path);
        return result;
    }

    ReferenceDataset dataset;
    dataset.id = id;
    dataset.name = name.empty() ? fs::path(path).stem().string() : name;

    try
    {
        // ordered_json keeps the file's key order for the column list
        nlohmann::ordered_json j = nlohmann::ordered_json::parse(file);
        result = rowsFromJson(j, dataset.columns, true, dataset.rows);
    }
    catch (const nlohmann::ordered_json::exception& e)
    {
        result.addError(std::string("Invalid JSON: ") + e.what());
        utils::ErrorReporter::ReportError(utils::ErrorCategory::ReferenceData, "Failed to parse reference file",
                                          path + ": " + e.what());
        return result;
    }

    if (!result.valid)
    {
        PLOG_WARNING_(utils::Diagnostics::kLogInstance)
            << "[ReferenceDataStore] " << path << " rejected: " << result.errors.front();
        return result;
    }

    ValidationResult stored = add(std::move(dataset), overwrite);
    result.merge(stored);
    return result;
}

DatasetInfo ReferenceDataStore::makeInfo(const Entry& entry)
{
    return DatasetInfo{ entry.dataset.id,        entry.dataset.name, entry.dataset.columns,
                        entry.dataset.rows.size(), entry.createdAt,    entry.modifiedAt };
}

std::string ReferenceDataStore::currentTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    gmtime_r(&now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace reference
