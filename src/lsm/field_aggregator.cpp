// src/lsm/field_aggregator.cpp
#include "../../include/lsm/field_aggregator.h"
#include "../../include/storage_error/storage_error.h"

namespace lakestore {
namespace lsm {

namespace {

class LastValueAgg : public FieldAggregator {
public:
    LastValueAgg() : FieldAggregator("last_value") {}
    Value agg(const Value&, const Value& input) override { return input; }
};

// Also used for primary-key fields, which are equal across versions.
class LastNonNullValueAgg : public FieldAggregator {
public:
    explicit LastNonNullValueAgg(std::string name = "last_non_null_value") : FieldAggregator(std::move(name)) {}
    Value agg(const Value& accumulator, const Value& input) override {
        return isNull(input) ? accumulator : input;
    }
};

class FirstValueAgg : public FieldAggregator {
public:
    FirstValueAgg() : FieldAggregator("first_value") {}
    Value agg(const Value& accumulator, const Value& input) override {
        if (initialized_) return accumulator;
        initialized_ = true;
        return input;
    }
    void reset() override { initialized_ = false; }

private:
    bool initialized_ = false;
};

class FirstNonNullValueAgg : public FieldAggregator {
public:
    FirstNonNullValueAgg() : FieldAggregator("first_non_null_value") {}
    Value agg(const Value& accumulator, const Value& input) override {
        return isNull(accumulator) ? input : accumulator;
    }
};

class SumAgg : public FieldAggregator {
public:
    SumAgg() : FieldAggregator("sum") {}
    Value agg(const Value& accumulator, const Value& input) override {
        if (isNull(accumulator)) return input;
        if (isNull(input)) return accumulator;
        if (std::holds_alternative<int64_t>(accumulator)) {
            return Value{std::get<int64_t>(accumulator) + std::get<int64_t>(input)};
        }
        return Value{std::get<double>(accumulator) + std::get<double>(input)};
    }
};

class MaxAgg : public FieldAggregator {
public:
    MaxAgg() : FieldAggregator("max") {}
    Value agg(const Value& accumulator, const Value& input) override {
        if (isNull(accumulator)) return input;
        if (isNull(input)) return accumulator;
        return compareValues(input, accumulator) > 0 ? input : accumulator;
    }
};

class MinAgg : public FieldAggregator {
public:
    MinAgg() : FieldAggregator("min") {}
    Value agg(const Value& accumulator, const Value& input) override {
        if (isNull(accumulator)) return input;
        if (isNull(input)) return accumulator;
        return compareValues(input, accumulator) < 0 ? input : accumulator;
    }
};

class BoolAndAgg : public FieldAggregator {
public:
    BoolAndAgg() : FieldAggregator("bool_and") {}
    Value agg(const Value& accumulator, const Value& input) override {
        if (isNull(accumulator)) return input;
        if (isNull(input)) return accumulator;
        return Value{std::get<bool>(accumulator) && std::get<bool>(input)};
    }
};

class BoolOrAgg : public FieldAggregator {
public:
    BoolOrAgg() : FieldAggregator("bool_or") {}
    Value agg(const Value& accumulator, const Value& input) override {
        if (isNull(accumulator)) return input;
        if (isNull(input)) return accumulator;
        return Value{std::get<bool>(accumulator) || std::get<bool>(input)};
    }
};

class ListAggAgg : public FieldAggregator {
public:
    explicit ListAggAgg(std::string delimiter) : FieldAggregator("listagg"), delimiter_(std::move(delimiter)) {}
    Value agg(const Value& accumulator, const Value& input) override {
        if (isNull(accumulator)) return input;
        if (isNull(input)) return accumulator;
        return Value{std::get<std::string>(accumulator) + delimiter_ + std::get<std::string>(input)};
    }

private:
    std::string delimiter_;
};

storage::StorageError unsupported(const std::string& function, const std::string& field, DataType type) {
    return storage::StorageError::invalidConfiguration(
        "Aggregate function '" + function + "' does not support field '" + field + "' of type " +
        dataTypeToString(type));
}

} // namespace

std::unique_ptr<FieldAggregator> FieldAggregator::create(const std::string& function,
                                                         const std::string& field_name,
                                                         DataType type,
                                                         const std::string& list_agg_delimiter) {
    if (function == "last_value") return std::make_unique<LastValueAgg>();
    if (function == "last_non_null_value") return std::make_unique<LastNonNullValueAgg>();
    if (function == "primary-key") return std::make_unique<LastNonNullValueAgg>("primary-key");
    if (function == "first_value") return std::make_unique<FirstValueAgg>();
    if (function == "first_non_null_value") return std::make_unique<FirstNonNullValueAgg>();
    if (function == "sum") {
        if (type != DataType::BIGINT && type != DataType::DOUBLE) throw unsupported(function, field_name, type);
        return std::make_unique<SumAgg>();
    }
    if (function == "max" || function == "min") {
        if (type == DataType::BOOLEAN) throw unsupported(function, field_name, type);
        if (function == "max") return std::make_unique<MaxAgg>();
        return std::make_unique<MinAgg>();
    }
    if (function == "bool_and" || function == "bool_or") {
        if (type != DataType::BOOLEAN) throw unsupported(function, field_name, type);
        if (function == "bool_and") return std::make_unique<BoolAndAgg>();
        return std::make_unique<BoolOrAgg>();
    }
    if (function == "listagg") {
        if (type != DataType::STRING) throw unsupported(function, field_name, type);
        return std::make_unique<ListAggAgg>(list_agg_delimiter);
    }
    throw storage::StorageError::invalidConfiguration(
        "Unknown aggregate function '" + function + "' for field '" + field_name + "'");
}

} // namespace lsm
} // namespace lakestore
