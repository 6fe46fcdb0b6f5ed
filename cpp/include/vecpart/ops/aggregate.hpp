#pragma once

#include "../partition/vector_partition.hpp"

#include <cstdint>
#include <optional>

namespace vecpart {
namespace ops {

enum class AggregateFunction {
    SUM,
    MIN,
    MAX,
    COUNT
};

const char* aggregate_function_name(AggregateFunction function);

/**
 * Aggregates a partition's values straight off the vector, without
 * going through the element iterator.
 *
 * SUM, MIN and MAX need a fixed-width vector (INT or BIGINT) and throw
 * Error(TYPE_MISMATCH) otherwise. COUNT works for every type. MIN and
 * MAX of an empty partition are empty. A SUM outside the int64 range
 * throws std::overflow_error.
 */
std::optional<int64_t> aggregate(
    const partition::VectorPartition& partition,
    AggregateFunction function
);

// Folds two partial results of the same function; SUM and COUNT throw
// std::overflow_error past the int64 range
std::optional<int64_t> combine(
    AggregateFunction function,
    std::optional<int64_t> lhs,
    std::optional<int64_t> rhs
);

} // namespace ops
} // namespace vecpart
