// Example: Building, encoding and decoding CoAP Block options
// This example shows how to:
// 1. Configure a Block2 option codec
// 2. Derive block values from arbitrary byte sizes
// 3. Produce the Block2 option bytes for each block of a payload
// 4. Decode received option bytes and handle invalid input

#include <blockwise/block_option_codec.hpp>
#include <blockwise/console_logger.hpp>
#include <blockwise/metrics.hpp>

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
    constexpr std::size_t preferred_block_size = 512;
    constexpr std::size_t max_block_size = 1024;
    constexpr std::size_t payload_size = 2000;
    constexpr std::size_t odd_requested_size = 1158;

    using example_codec = blockwise::block_option_codec<blockwise::counting_metrics, blockwise::console_logger>;

    auto to_hex(const std::vector<std::byte>& bytes) -> std::string {
        if (bytes.empty()) {
            return "(empty)";
        }

        std::ostringstream oss;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i > 0) {
                oss << ' ';
            }
            oss << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<unsigned>(static_cast<std::uint8_t>(bytes[i]));
        }
        return oss.str();
    }
}

auto show_size_rounding(example_codec& codec) -> bool {
    std::cout << "Scenario 1: Size exponent derivation\n";

    try {
        auto value = codec.make_block(0, true, odd_requested_size);
        std::cout << "  ✓ Requested " << odd_requested_size << " bytes, got " << value << "\n";

        auto small = blockwise::block_value(0, false, 5);
        std::cout << "  ✓ Requested 5 bytes, got " << small << "\n";
        return true;
    } catch (const blockwise::block_option_error& e) {
        std::cerr << "  ✗ " << e.what() << "\n";
        return false;
    }
}

auto show_payload_blocks(example_codec& codec) -> bool {
    std::cout << "Scenario 2: Block2 options for a " << payload_size << " byte payload\n";

    try {
        auto block_size = codec.config().preferred_block_size;
        auto block_count = (payload_size + block_size - 1) / block_size;

        for (std::size_t num = 0; num < block_count; ++num) {
            auto value = codec.make_block(num, num + 1 < block_count);
            auto bytes = codec.encode(value);
            auto decoded = codec.decode(bytes);

            if (decoded != value) {
                std::cerr << "  ✗ Block " << num << " did not survive the round trip\n";
                return false;
            }

            std::cout << "  ✓ " << value << " -> " << to_hex(bytes) << "\n";
        }
        return true;
    } catch (const blockwise::block_option_error& e) {
        std::cerr << "  ✗ " << e.what() << "\n";
        return false;
    }
}

auto show_invalid_input(example_codec& codec) -> bool {
    std::cout << "Scenario 3: Invalid input\n";

    try {
        codec.make_block(blockwise::block_value::max_block_number + 1, false);
        std::cerr << "  ✗ Block number above 2^20 - 1 was accepted\n";
        return false;
    } catch (const blockwise::maximum_number_exceeded& e) {
        std::cout << "  ✓ Rejected: " << e.what() << "\n";
    }

    try {
        codec.decode(std::vector<std::byte>(5, std::byte{0x01}));
        std::cerr << "  ✗ Five byte option value was accepted\n";
        return false;
    } catch (const blockwise::incompatible_option_value_format& e) {
        std::cout << "  ✓ Rejected: " << e.what() << "\n";
    }

    return true;
}

auto main() -> int {
    std::cout << std::string(60, '=') << "\n";
    std::cout << "  CoAP Block Option Example\n";
    std::cout << std::string(60, '=') << "\n\n";

    blockwise::block_codec_config config;
    config.preferred_block_size = preferred_block_size;
    config.max_block_size = max_block_size;

    blockwise::counting_metrics metrics;
    blockwise::console_logger logger(blockwise::log_level::info);
    logger.set_component("Block2");

    example_codec codec(blockwise::option_number::block2, config, metrics, std::move(logger));

    int failed_scenarios = 0;

    if (!show_size_rounding(codec)) failed_scenarios++;
    if (!show_payload_blocks(codec)) failed_scenarios++;
    if (!show_invalid_input(codec)) failed_scenarios++;

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Encoded: " << metrics.count("block_option.encode")
              << ", decoded: " << metrics.count("block_option.decode")
              << ", rejected: " << metrics.count("block_option.rejected") << "\n";

    if (failed_scenarios > 0) {
        std::cerr << "Summary: " << failed_scenarios << " scenario(s) failed\n";
        return 1;
    }

    std::cout << "Summary: All scenarios passed!\n";
    return 0;
}
