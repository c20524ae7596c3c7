#pragma once

#include "ReferenceTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace reference
{

/**
 * @brief Read access to named reference datasets.
 *
 * The lookup engine only consumes this interface; it never writes.
 */
class IReferenceDataStore
{
public:
    virtual ~IReferenceDataStore() = default;

    /**
     * @brief Rows of a dataset.
     * @return nullptr when the dataset does not exist. The pointer stays valid
     *         until the dataset is modified or removed.
     */
    virtual const std::vector<ReferenceRow>* getRows(const std::string& id) const = 0;

    virtual std::optional<DatasetMetadata> getMetadata(const std::string& id) const = 0;
};

} // namespace reference
