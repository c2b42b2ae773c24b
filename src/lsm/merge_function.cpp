// src/lsm/merge_function.cpp
#include "../../include/lsm/merge_function.h"

#include <algorithm>

namespace lakestore {
namespace lsm {

// --- PartialUpdateMergeFunction ---

PartialUpdateMergeFunction::PartialUpdateMergeFunction(bool remove_record_on_delete)
    : remove_record_on_delete_(remove_record_on_delete) {}

void PartialUpdateMergeFunction::reset() {
    current_.reset();
    last_delete_.reset();
}

void PartialUpdateMergeFunction::add(const KeyValue& kv) {
    if (!kv.isAdd()) {
        if (remove_record_on_delete_ && kv.kind == RowKind::DELETE) {
            current_.reset();
            last_delete_ = kv;
        }
        return;
    }
    if (!current_) {
        current_ = KeyValue(kv.key, kv.sequence_number, RowKind::INSERT, kv.value);
        return;
    }
    current_->sequence_number = kv.sequence_number;
    for (size_t i = 0; i < kv.value.size() && i < current_->value.size(); ++i) {
        if (!isNull(kv.value[i])) current_->value[i] = kv.value[i];
    }
}

std::optional<KeyValue> PartialUpdateMergeFunction::getResult() {
    if (current_) return current_;
    // Keeps shadowing older runs until a compaction reaches the highest level.
    return last_delete_;
}

// --- AggregateMergeFunction ---

AggregateMergeFunction::AggregateMergeFunction(std::vector<std::unique_ptr<FieldAggregator>> aggregators,
                                               bool remove_record_on_delete)
    : aggregators_(std::move(aggregators)), remove_record_on_delete_(remove_record_on_delete) {
    resetAccumulator();
}

void AggregateMergeFunction::resetAccumulator() {
    accumulator_.assign(aggregators_.size(), Value{});
    for (auto& agg : aggregators_) agg->reset();
    has_add_ = false;
}

void AggregateMergeFunction::reset() {
    resetAccumulator();
    latest_.reset();
    last_delete_.reset();
}

void AggregateMergeFunction::add(const KeyValue& kv) {
    if (!kv.isAdd()) {
        if (remove_record_on_delete_ && kv.kind == RowKind::DELETE) {
            resetAccumulator();
            last_delete_ = kv;
        }
        return;
    }
    for (size_t i = 0; i < aggregators_.size() && i < kv.value.size(); ++i) {
        accumulator_[i] = aggregators_[i]->agg(accumulator_[i], kv.value[i]);
    }
    latest_ = kv;
    has_add_ = true;
}

std::optional<KeyValue> AggregateMergeFunction::getResult() {
    if (has_add_) {
        return KeyValue(latest_->key, latest_->sequence_number, RowKind::INSERT, accumulator_);
    }
    return last_delete_;
}

// --- FirstRowMergeFunction ---

void FirstRowMergeFunction::add(const KeyValue& kv) {
    if (!first_ && kv.isAdd()) {
        first_ = KeyValue(kv.key, kv.sequence_number, RowKind::INSERT, kv.value);
    }
}

// --- MergeFunctionFactory ---

MergeFunctionFactory::MergeFunctionFactory(const schema::TableSchema& schema)
    : engine_(schema.coreOptions().merge_engine),
      partial_update_remove_on_delete_(schema.coreOptions().partial_update_remove_record_on_delete),
      aggregation_remove_on_delete_(schema.coreOptions().aggregation_remove_record_on_delete) {
    if (engine_ != MergeEngine::AGGREGATE) return;

    const auto& options = schema.coreOptions();
    const auto& pk = schema.primaryKeys();
    for (const auto& field : schema.fields()) {
        std::string function = "last_non_null_value";
        if (std::find(pk.begin(), pk.end(), field.name) != pk.end()) {
            function = "primary-key";
        } else {
            auto it = options.field_aggregate_functions.find(field.name);
            if (it != options.field_aggregate_functions.end()) function = it->second;
        }
        std::string delimiter = ",";
        auto d = options.field_list_agg_delimiters.find(field.name);
        if (d != options.field_list_agg_delimiters.end()) delimiter = d->second;

        // Validates the function against the type; throws on mismatch.
        FieldAggregator::create(function, field.name, field.type, delimiter);

        functions_.push_back(function);
        field_names_.push_back(field.name);
        types_.push_back(field.type);
        delimiters_.push_back(delimiter);
    }
}

std::unique_ptr<MergeFunction> MergeFunctionFactory::create() const {
    switch (engine_) {
        case MergeEngine::DEDUPLICATE:
            return std::make_unique<DeduplicateMergeFunction>();
        case MergeEngine::PARTIAL_UPDATE:
            return std::make_unique<PartialUpdateMergeFunction>(partial_update_remove_on_delete_);
        case MergeEngine::AGGREGATE: {
            std::vector<std::unique_ptr<FieldAggregator>> aggregators;
            for (size_t i = 0; i < functions_.size(); ++i) {
                aggregators.push_back(FieldAggregator::create(functions_[i], field_names_[i], types_[i], delimiters_[i]));
            }
            return std::make_unique<AggregateMergeFunction>(std::move(aggregators), aggregation_remove_on_delete_);
        }
        case MergeEngine::FIRST_ROW:
            return std::make_unique<FirstRowMergeFunction>();
    }
    return std::make_unique<DeduplicateMergeFunction>();
}

bool MergeFunctionFactory::requiresFullCompaction() const {
    return (engine_ == MergeEngine::PARTIAL_UPDATE && partial_update_remove_on_delete_)
        || (engine_ == MergeEngine::AGGREGATE && aggregation_remove_on_delete_);
}

} // namespace lsm
} // namespace lakestore
