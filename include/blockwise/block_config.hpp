#pragma once

#include <blockwise/block_utils.hpp>
#include <blockwise/exceptions.hpp>

#include <cstddef>
#include <string>

namespace blockwise {

// Configuration for block_option_codec
struct block_codec_config {
    // Block size used when the caller does not ask for one
    std::size_t preferred_block_size{1024};

    // Largest block size accepted for encoding (and for decoding in strict mode)
    std::size_t max_block_size{1024};

    // Decoding normally trusts the wire bits. When set, decoded values whose
    // NUM exceeds 2^20 - 1 or whose size exceeds max_block_size are rejected.
    bool strict_decode{false};
};

inline auto validate_block_codec_config(const block_codec_config& config) -> void {
    if (!block_utils::is_valid_block_size(config.preferred_block_size)) {
        throw block_config_error("preferred_block_size must be a power of 2 between 16 and 2048, got " +
                                 std::to_string(config.preferred_block_size));
    }

    if (!block_utils::is_valid_block_size(config.max_block_size)) {
        throw block_config_error("max_block_size must be a power of 2 between 16 and 2048, got " +
                                 std::to_string(config.max_block_size));
    }

    if (config.preferred_block_size > config.max_block_size) {
        throw block_config_error("preferred_block_size must not exceed max_block_size");
    }
}

} // namespace blockwise
