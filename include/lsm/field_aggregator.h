// include/lsm/field_aggregator.h
#pragma once

#include "../types.h"

#include <memory>
#include <string>

namespace lakestore {
namespace lsm {

/**
 * @class FieldAggregator
 * @brief Folds the versions of one field, oldest first.
 */
class FieldAggregator {
public:
    explicit FieldAggregator(std::string name) : name_(std::move(name)) {}
    virtual ~FieldAggregator() = default;

    virtual Value agg(const Value& accumulator, const Value& input) = 0;
    // Called whenever a new key starts, or the record is reset by a DELETE.
    virtual void reset() {}

    const std::string& name() const { return name_; }

    /**
     * @brief Builds the aggregator named by `fields.<field>.aggregate-function`.
     * @throws storage::StorageError (INVALID_CONFIGURATION) for an unknown
     * function or one that does not support the field type.
     */
    static std::unique_ptr<FieldAggregator> create(const std::string& function,
                                                   const std::string& field_name,
                                                   DataType type,
                                                   const std::string& list_agg_delimiter);

private:
    std::string name_;
};

} // namespace lsm
} // namespace lakestore
