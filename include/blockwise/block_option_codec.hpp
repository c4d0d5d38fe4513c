#pragma once

#include <blockwise/block_config.hpp>
#include <blockwise/block_value.hpp>
#include <blockwise/exceptions.hpp>
#include <blockwise/logger.hpp>
#include <blockwise/metrics.hpp>
#include <blockwise/option_value.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace blockwise {

// Configured front end for one Block option (Block1 or Block2).
//
// Builds block values at the configured sizes, encodes them to option bytes
// and decodes option bytes back. Every call is logged at trace level and
// counted through Metrics. Errors propagate to the caller unchanged.
template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
class block_option_codec {
public:
    block_option_codec(
        option_number option,
        block_codec_config config,
        Metrics metrics,
        Logger logger
    );

    // Block at the preferred block size
    auto make_block(std::size_t num, bool more) -> block_value;

    // Block at the requested size, capped at max_block_size
    auto make_block(std::size_t num, bool more, std::size_t size) -> block_value;

    auto encode(const block_value& value) -> std::vector<std::byte>;

    auto decode(const std::vector<std::byte>& bytes) -> block_value;

    auto option() const -> option_number {
        return _option;
    }

    auto config() const -> const block_codec_config& {
        return _config;
    }

private:
    auto record(const char* metric_name) -> void;
    auto check_decoded(const block_value& value) const -> void;

    option_number _option;
    block_codec_config _config;
    Metrics _metrics;
    Logger _logger;

    // Serializes the set_metric_name ... emit sequence in record()
    std::mutex _metrics_mutex;
};

} // namespace blockwise

#include <blockwise/block_option_codec_impl.hpp>
