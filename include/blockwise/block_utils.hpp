#pragma once

#include <blockwise/block_value.hpp>
#include <blockwise/exceptions.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace blockwise::block_utils {

// Block size utilities
//
// Unlike block_value construction, these conversions are strict: a block size
// must already be one of the eight sizes the SZX field can express.

inline auto size_exponent_to_block_size(std::uint8_t szx) -> std::size_t {
    if (szx > block_value::max_size_exponent) {
        throw block_config_error("Invalid SZX value: " + std::to_string(szx) + ". Must be 0-7");
    }

    return std::size_t{1} << (szx + 4);  // 2^(SZX+4)
}

inline auto block_size_to_size_exponent(std::size_t block_size) -> std::uint8_t {
    if (block_size < 16 || block_size > 2048) {
        throw block_config_error("Block size must be between 16 and 2048 bytes, got " + std::to_string(block_size));
    }

    if ((block_size & (block_size - 1)) != 0) {
        throw block_config_error("Block size must be a power of 2, got " + std::to_string(block_size));
    }

    auto exponent = block_value::largest_power_of_2_not_in_excess(block_size);
    return static_cast<std::uint8_t>(*exponent - 4);
}

inline auto is_valid_block_size(std::size_t block_size) -> bool {
    try {
        block_size_to_size_exponent(block_size);
        return true;
    } catch (const block_config_error&) {
        return false;
    }
}

} // namespace blockwise::block_utils
