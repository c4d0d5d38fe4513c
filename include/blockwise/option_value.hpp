#pragma once

#include <blockwise/exceptions.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <vector>

namespace blockwise {

// CoAP option numbers used by block-wise transfers (RFC 7959 Section 2.1, 4)
enum class option_number : std::uint16_t {
    block2 = 23,
    block1 = 27,
    size2 = 28,
    size1 = 60
};

inline auto is_block_option(option_number number) -> bool {
    return number == option_number::block1 || number == option_number::block2;
}

inline auto option_number_to_string(option_number number) -> const char* {
    switch (number) {
        case option_number::block2: return "Block2";
        case option_number::block1: return "Block1";
        case option_number::size2:  return "Size2";
        case option_number::size1:  return "Size1";
    }
    return "unknown";
}

// Unsigned integer option value (RFC 7252 Section 3.2, "uint" format)
//
// The value is carried as a big-endian integer using the smallest number of
// bytes that can represent it. Zero is carried as the empty sequence.
template<std::unsigned_integral T>
struct option_value_uint {
    T value{0};

    // Serialize to minimal big-endian bytes
    auto to_bytes() const -> std::vector<std::byte> {
        std::vector<std::byte> bytes;
        bytes.reserve(sizeof(T));

        bool leading = true;
        for (std::size_t i = sizeof(T); i-- > 0;) {
            auto octet = static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) >> (i * 8)) & 0xFF);
            if (leading && octet == 0) {
                continue;
            }
            leading = false;
            bytes.push_back(static_cast<std::byte>(octet));
        }

        return bytes;
    }

    // Parse big-endian bytes; leading zero bytes are tolerated
    static auto from_bytes(const std::vector<std::byte>& bytes) -> option_value_uint {
        if (bytes.size() > sizeof(T)) {
            throw incompatible_option_value_format(std::format(
                "Option value of {} bytes does not fit a {}-byte unsigned integer",
                bytes.size(), sizeof(T)));
        }

        std::uint64_t accumulated = 0;
        for (auto b : bytes) {
            accumulated = (accumulated << 8) | static_cast<std::uint64_t>(b);
        }

        return option_value_uint{static_cast<T>(accumulated)};
    }

    auto operator==(const option_value_uint&) const -> bool = default;
};

using option_value_u8 = option_value_uint<std::uint8_t>;
using option_value_u16 = option_value_uint<std::uint16_t>;
using option_value_u32 = option_value_uint<std::uint32_t>;
using option_value_u64 = option_value_uint<std::uint64_t>;

} // namespace blockwise
