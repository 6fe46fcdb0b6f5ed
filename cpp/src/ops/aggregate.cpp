#include "vecpart/ops/aggregate.hpp"
#include "vecpart/common/error.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <string>

namespace vecpart {
namespace ops {

namespace {

int64_t checked_add(int64_t lhs, int64_t rhs) {
    int64_t result;
    if (__builtin_add_overflow(lhs, rhs, &result)) {
        throw std::overflow_error(
            "Sum of " + std::to_string(lhs) + " and " + std::to_string(rhs) + " overflows int64"
        );
    }
    return result;
}

} // namespace

const char* aggregate_function_name(AggregateFunction function) {
    switch (function) {
        case AggregateFunction::SUM: return "SUM";
        case AggregateFunction::MIN: return "MIN";
        case AggregateFunction::MAX: return "MAX";
        case AggregateFunction::COUNT: return "COUNT";
    }
    return "UNKNOWN";
}

std::optional<int64_t> aggregate(
    const partition::VectorPartition& partition,
    AggregateFunction function
) {
    if (function == AggregateFunction::COUNT) {
        return static_cast<int64_t>(partition.value_count());
    }

    if (!partition.has_vector() || partition.value_count() == 0) {
        if (function == AggregateFunction::SUM) {
            return int64_t{0};
        }
        return std::nullopt;
    }

    return partition.visit([&](const auto& vector) -> std::optional<int64_t> {
        using VectorType = std::decay_t<decltype(vector)>;

        if constexpr (columnar::MinorTypeTraits<VectorType::TYPE>::FIXED_WIDTH) {
            const auto* values = vector.data();
            size_t count = vector.value_count();

            switch (function) {
                case AggregateFunction::SUM: {
                    int64_t sum = 0;
                    for (size_t i = 0; i < count; ++i) {
                        sum = checked_add(sum, static_cast<int64_t>(values[i]));
                    }
                    return sum;
                }

                case AggregateFunction::MIN:
                    return static_cast<int64_t>(*std::min_element(values, values + count));

                case AggregateFunction::MAX:
                    return static_cast<int64_t>(*std::max_element(values, values + count));

                case AggregateFunction::COUNT:
                    return static_cast<int64_t>(count);
            }
            return std::nullopt;
        } else {
            throw Error(
                ErrorKind::TYPE_MISMATCH,
                std::string(aggregate_function_name(function)) + " is not defined for " +
                columnar::minor_type_name(VectorType::TYPE) + " values in " + partition.describe()
            );
        }
    });
}

std::optional<int64_t> combine(
    AggregateFunction function,
    std::optional<int64_t> lhs,
    std::optional<int64_t> rhs
) {
    if (!lhs) return rhs;
    if (!rhs) return lhs;

    switch (function) {
        case AggregateFunction::SUM:
        case AggregateFunction::COUNT:
            return checked_add(*lhs, *rhs);
        case AggregateFunction::MIN:
            return std::min(*lhs, *rhs);
        case AggregateFunction::MAX:
            return std::max(*lhs, *rhs);
    }
    return std::nullopt;
}

} // namespace ops
} // namespace vecpart
