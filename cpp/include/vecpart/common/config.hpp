#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace vecpart {

/**
 * Bounds applied while decoding a partition.
 * A stream that declares more than these is treated as corrupt.
 */
struct CodecOptions {
    int32_t max_value_count = std::numeric_limits<int32_t>::max();
    uint32_t max_element_bytes = 64u * 1024u * 1024u;

    // Name given to vectors rebuilt by the decoder
    std::string vector_name = "vector";
};

struct CollectionOptions {
    CodecOptions codec;

    // Decode every shipped payload once before handing it out
    bool verify_on_ship = false;
};

} // namespace vecpart
