#pragma once

#include "IReferenceDataStore.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace reference
{

/**
 * @brief In-memory reference dataset store.
 *
 * Every dataset passes validateDataset() on the way in, so readers can rely on
 * each row carrying every column. JSON backups use the layout
 * { "<id>": { "info": {...}, "data": [ {row}, ... ] }, ... }.
 */
class ReferenceDataStore : public IReferenceDataStore
{
public:
    ReferenceDataStore() = default;

    // IReferenceDataStore
    const std::vector<ReferenceRow>* getRows(const std::string& id) const override;
    std::optional<DatasetMetadata> getMetadata(const std::string& id) const override;

    /// Adds a dataset. An existing id is rejected unless overwrite is set.
    ValidationResult add(ReferenceDataset dataset, bool overwrite = false);

    const ReferenceDataset* get(const std::string& id) const;
    bool has(const std::string& id) const;

    /// Infos sorted by id.
    std::vector<DatasetInfo> list() const;
    std::optional<DatasetInfo> info(const std::string& id) const;

    bool remove(const std::string& id);

    /// Replaces the rows of an existing dataset; columns are kept.
    ValidationResult update(const std::string& id, std::vector<ReferenceRow> rows);

    void clearAll();

    StoreStats stats() const;

    nlohmann::json exportJson() const;

    /**
     * @brief Restore datasets from exportJson() output.
     *
     * Invalid entries are skipped and listed in the result; valid ones are
     * stored (replacing datasets with the same id).
     */
    ValidationResult importJson(const nlohmann::json& backup);

    /**
     * @brief Load a JSON array of flat objects as a dataset.
     *
     * Columns follow the order in which keys first appear in the file.
     * Nested arrays or objects are rejected. Parse and I/O failures are
     * reported through utils::ErrorReporter as well as in the result.
     */
    ValidationResult loadJsonFile(const std::string& path, const std::string& id, const std::string& name = "",
                                  bool overwrite = false);

private:
    struct Entry
    {
        ReferenceDataset dataset;
        std::string createdAt;
        std::string modifiedAt;
    };

    static DatasetInfo makeInfo(const Entry& entry);
    static std::string currentTimestamp();

    std::map<std::string, Entry> datasets_;
};

} // namespace reference
