// include/lsm/merge_function.h
#pragma once

#include "field_aggregator.h"
#include "../types.h"
#include "../config/core_options.h"
#include "../schema/table_schema.h"

#include <memory>
#include <optional>
#include <vector>

namespace lakestore {
namespace lsm {

/**
 * @class MergeFunction
 * @brief Folds all versions of one key, fed oldest first (ascending sequence).
 *
 * A result with a retracting kind (DELETE, UPDATE_BEFORE) must still be
 * written by a compaction that does not reach the highest level, so that it
 * keeps shadowing older runs.
 */
class MergeFunction {
public:
    virtual ~MergeFunction() = default;

    virtual void reset() = 0;
    virtual void add(const KeyValue& kv) = 0;
    // nullopt when the versions fold to nothing worth keeping.
    virtual std::optional<KeyValue> getResult() = 0;

    /**
     * @brief True when folding a subset of runs and then the rest can differ
     * from folding everything at once. Every compaction of such a table must
     * then include all runs.
     */
    virtual bool requiresFullCompaction() const { return false; }
};

// Latest version wins, whatever its kind.
class DeduplicateMergeFunction : public MergeFunction {
public:
    void reset() override { latest_.reset(); }
    void add(const KeyValue& kv) override { latest_ = kv; }
    std::optional<KeyValue> getResult() override { return latest_; }

private:
    std::optional<KeyValue> latest_;
};

/**
 * @brief Non-null fields of newer versions overwrite older ones.
 * Retractions are ignored unless `remove_record_on_delete`, in which case a
 * DELETE discards everything accumulated so far.
 */
class PartialUpdateMergeFunction : public MergeFunction {
public:
    explicit PartialUpdateMergeFunction(bool remove_record_on_delete);

    void reset() override;
    void add(const KeyValue& kv) override;
    std::optional<KeyValue> getResult() override;
    bool requiresFullCompaction() const override { return remove_record_on_delete_; }

private:
    bool remove_record_on_delete_;
    std::optional<KeyValue> current_;
    std::optional<KeyValue> last_delete_;
};

/**
 * @brief Per-field aggregation. Retractions are handled as in partial update.
 */
class AggregateMergeFunction : public MergeFunction {
public:
    AggregateMergeFunction(std::vector<std::unique_ptr<FieldAggregator>> aggregators, bool remove_record_on_delete);

    void reset() override;
    void add(const KeyValue& kv) override;
    std::optional<KeyValue> getResult() override;
    bool requiresFullCompaction() const override { return remove_record_on_delete_; }

private:
    void resetAccumulator();

    std::vector<std::unique_ptr<FieldAggregator>> aggregators_;
    bool remove_record_on_delete_;
    Row accumulator_;
    std::optional<KeyValue> latest_;
    std::optional<KeyValue> last_delete_;
    bool has_add_ = false;
};

// Earliest added version wins; retractions are ignored.
class FirstRowMergeFunction : public MergeFunction {
public:
    void reset() override { first_.reset(); }
    void add(const KeyValue& kv) override;
    std::optional<KeyValue> getResult() override { return first_; }

private:
    std::optional<KeyValue> first_;
};

/**
 * @class MergeFunctionFactory
 * @brief Resolves the table's merge engine once, at table open, and hands out
 * fresh MergeFunction instances (they are stateful) to readers and compactions.
 */
class MergeFunctionFactory {
public:
    /**
     * @throws storage::StorageError (INVALID_CONFIGURATION) for an aggregate
     * function that is unknown or does not fit its field type.
     */
    explicit MergeFunctionFactory(const schema::TableSchema& schema);

    std::unique_ptr<MergeFunction> create() const;
    MergeEngine engine() const { return engine_; }
    bool requiresFullCompaction() const;

private:
    MergeEngine engine_;
    bool partial_update_remove_on_delete_;
    bool aggregation_remove_on_delete_;
    std::vector<std::string> functions_;
    std::vector<std::string> field_names_;
    std::vector<DataType> types_;
    std::vector<std::string> delimiters_;
};

} // namespace lsm
} // namespace lakestore
