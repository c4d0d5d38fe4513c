#pragma once

#include <blockwise/block_option_codec.hpp>

#include <algorithm>
#include <utility>
#include <string>

namespace blockwise {

template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
block_option_codec<Metrics, Logger>::block_option_codec(
    option_number option,
    block_codec_config config,
    Metrics metrics,
    Logger logger
) : _option{option}
  , _config{std::move(config)}
  , _metrics{std::move(metrics)}
  , _logger{std::move(logger)}
{
    if (!is_block_option(_option)) {
        throw block_config_error(std::string("Option ") + option_number_to_string(_option) +
                                 " does not carry a block value");
    }

    validate_block_codec_config(_config);

    _logger.debug("Block option codec initialized", {
        {"option", option_number_to_string(_option)},
        {"preferred_block_size", std::to_string(_config.preferred_block_size)},
        {"max_block_size", std::to_string(_config.max_block_size)},
        {"strict_decode", _config.strict_decode ? "true" : "false"}
    });
}

template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
auto block_option_codec<Metrics, Logger>::make_block(std::size_t num, bool more) -> block_value {
    return make_block(num, more, _config.preferred_block_size);
}

template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
auto block_option_codec<Metrics, Logger>::make_block(
    std::size_t num,
    bool more,
    std::size_t size
) -> block_value {
    try {
        return block_value(num, more, std::min(size, _config.max_block_size));
    } catch (const invalid_block_value&) {
        record("block_option.rejected");
        throw;
    }
}

template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
auto block_option_codec<Metrics, Logger>::encode(const block_value& value) -> std::vector<std::byte> {
    if (value.size() > _config.max_block_size) {
        record("block_option.rejected");
        throw block_config_error("Block size " + std::to_string(value.size()) +
                                 " exceeds max_block_size " + std::to_string(_config.max_block_size));
    }

    auto bytes = value.to_bytes();

    _logger.trace("Encoded block option", {
        {"option", option_number_to_string(_option)},
        {"num", std::to_string(value.num())},
        {"more", value.more() ? "true" : "false"},
        {"size", std::to_string(value.size())},
        {"length", std::to_string(bytes.size())}
    });
    record("block_option.encode");

    return bytes;
}

template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
auto block_option_codec<Metrics, Logger>::decode(const std::vector<std::byte>& bytes) -> block_value {
    try {
        auto value = block_value::from_bytes(bytes);
        check_decoded(value);

        _logger.trace("Decoded block option", {
            {"option", option_number_to_string(_option)},
            {"num", std::to_string(value.num())},
            {"more", value.more() ? "true" : "false"},
            {"size", std::to_string(value.size())},
            {"length", std::to_string(bytes.size())}
        });
        record("block_option.decode");

        return value;
    } catch (const block_option_error&) {
        record("block_option.rejected");
        throw;
    }
}

template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
auto block_option_codec<Metrics, Logger>::check_decoded(const block_value& value) const -> void {
    if (!_config.strict_decode) {
        return;
    }

    if (value.num() > block_value::max_block_number) {
        throw maximum_number_exceeded(value.num());
    }

    if (value.size() > _config.max_block_size) {
        throw size_exponent_encoding_error(value.size());
    }
}

template<typename Metrics, typename Logger>
requires metrics<Metrics> && diagnostic_logger<Logger>
auto block_option_codec<Metrics, Logger>::record(const char* metric_name) -> void {
    std::lock_guard<std::mutex> lock(_metrics_mutex);
    _metrics.set_metric_name(metric_name);
    _metrics.add_dimension("option", option_number_to_string(_option));
    _metrics.add_one();
    _metrics.emit();
}

} // namespace blockwise
