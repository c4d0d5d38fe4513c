#pragma once

#include <blockwise/exceptions.hpp>
#include <blockwise/option_value.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <vector>

namespace blockwise {

// Block1/Block2 option value for CoAP block-wise transfer
// Based on RFC 7959 - Block-Wise Transfers in the Constrained Application Protocol (CoAP)
//
// RFC 7959 Section 2.2: Block Option Format (shown at its 3-byte length)
//  0                   1                   2
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                   NUM                 |M| SZX |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// NUM: Block number (up to 20 bits)
// M: More flag (1 bit) - indicates if more blocks follow
// SZX: Size exponent (3 bits) - block size = 2^(SZX + 4) bytes
//
// The packed scalar travels as a minimal big-endian uint option value.
// Construction validates every field; decoding takes the wire bits as they are.
class block_value {
public:
    // 2^20 - 1
    static constexpr std::uint32_t max_block_number = 1048575;
    static constexpr std::uint8_t max_size_exponent = 0x7;

    // Build from a block number, more flag and a byte size. The size is
    // rounded down to a power of two; sizes below 16 use the minimum exponent.
    block_value(std::size_t num, bool more, std::size_t size)
        : _more(more) {
        auto true_size_exponent = largest_power_of_2_not_in_excess(size);
        if (!true_size_exponent) {
            throw size_exponent_encoding_error(size);
        }

        // Sizes below 16 clamp to SZX 0
        auto exponent = *true_size_exponent > 4 ? *true_size_exponent - 4 : 0;
        if (exponent > max_size_exponent) {
            throw size_exponent_encoding_error(size);
        }
        _size_exponent = static_cast<std::uint8_t>(exponent);

        if (num > std::numeric_limits<std::uint32_t>::max()) {
            throw type_bounds_error(static_cast<std::uint64_t>(num));
        }
        _num = static_cast<std::uint32_t>(num);
        if (_num > max_block_number) {
            throw maximum_number_exceeded(_num);
        }
    }

    // Unpack a wire scalar. NUM is not checked against max_block_number.
    static auto from_scalar(std::uint32_t scalar) -> block_value {
        return block_value(
            unchecked_tag{},
            scalar >> 4,
            ((scalar >> 3) & 0x1) == 0x1,
            static_cast<std::uint8_t>(scalar & 0x7));
    }

    static auto from_bytes(const std::vector<std::byte>& bytes) -> block_value {
        return from_scalar(option_value_u32::from_bytes(bytes).value);
    }

    auto to_scalar() const -> std::uint32_t {
        return _num << 4
            | static_cast<std::uint32_t>(_more ? 1 : 0) << 3
            | static_cast<std::uint32_t>(_size_exponent & 0x7);
    }

    auto to_bytes() const -> std::vector<std::byte> {
        return option_value_u32{to_scalar()}.to_bytes();
    }

    // Finds the exponent of the largest power of 2 that does not exceed
    // target. Returns the bit width of std::size_t when no representable
    // power of 2 exceeds target.
    static auto largest_power_of_2_not_in_excess(std::size_t target) -> std::optional<std::size_t> {
        if (target == 0) {
            return std::nullopt;
        }

        constexpr std::size_t max_power = std::numeric_limits<std::size_t>::digits;
        for (std::size_t i = 0; i < max_power; ++i) {
            if ((std::size_t{1} << i) > target) {
                return i - 1;
            }
        }
        return max_power;
    }

    // True when the constructor would accept these arguments
    static auto is_representable(std::size_t num, std::size_t size) -> bool {
        try {
            block_value probe(num, false, size);
            return true;
        } catch (const invalid_block_value&) {
            return false;
        }
    }

    auto num() const -> std::uint32_t {
        return _num;
    }

    auto more() const -> bool {
        return _more;
    }

    auto size_exponent() const -> std::uint8_t {
        return _size_exponent;
    }

    // Block size in bytes: 2^(SZX + 4)
    auto size() const -> std::size_t {
        return std::size_t{16} << _size_exponent;
    }

    auto operator==(const block_value&) const -> bool = default;

private:
    struct unchecked_tag {};

    block_value(unchecked_tag, std::uint32_t num, bool more, std::uint8_t size_exponent)
        : _num(num)
        , _more(more)
        , _size_exponent(size_exponent) {}

    std::uint32_t _num{0};
    bool _more{false};
    std::uint8_t _size_exponent{0};
};

inline auto operator<<(std::ostream& os, const block_value& value) -> std::ostream& {
    return os << "block_value{num=" << value.num()
              << ", more=" << (value.more() ? "true" : "false")
              << ", size=" << value.size() << "}";
}

} // namespace blockwise
