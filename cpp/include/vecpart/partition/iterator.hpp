#pragma once

#include "../columnar/type_traits.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vecpart {
namespace partition {

/**
 * Lazy single-pass iterator over a vector's populated slots
 *
 * Reads slot `position()` on each next() and advances. There is no
 * reset; iterate again by asking the partition for a new iterator.
 * Not safe to share between threads.
 */
template<typename T>
class VectorIterator {
public:
    using VectorType = typename columnar::ElementTraits<T>::VectorType;

    // A null vector iterates as empty
    explicit VectorIterator(const VectorType* vector) : vector_(vector) {}

    bool has_next() const {
        return vector_ != nullptr && cursor_ < vector_->value_count();
    }

    T next() {
        if (!has_next()) {
            throw std::out_of_range(
                "Iterator exhausted after " + std::to_string(cursor_) + " values"
            );
        }
        return vector_->get(cursor_++);
    }

    size_t position() const { return cursor_; }

private:
    const VectorType* vector_;
    size_t cursor_ = 0;
};

} // namespace partition
} // namespace vecpart
