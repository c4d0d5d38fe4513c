#pragma once

#include <stdexcept>
#include <string>
#include <format>
#include <cstddef>
#include <cstdint>

namespace blockwise {

// Base exception class for Block option errors
class block_option_error : public std::runtime_error {
public:
    explicit block_option_error(const std::string& message)
        : std::runtime_error(message) {}
};

// Base exception for values that cannot be encoded into a Block option
class invalid_block_value : public block_option_error {
public:
    explicit invalid_block_value(const std::string& message)
        : block_option_error(message) {}
};

// Requested block size is zero or needs a size exponent wider than 3 bits
class size_exponent_encoding_error : public invalid_block_value {
public:
    explicit size_exponent_encoding_error(std::size_t size)
        : invalid_block_value(std::format("Block size {} cannot be encoded as a size exponent", size))
        , _size(size) {}

    auto size() const -> std::size_t {
        return _size;
    }

private:
    std::size_t _size;
};

// A native integer does not fit the fixed-width wire representation
class type_bounds_error : public invalid_block_value {
public:
    explicit type_bounds_error(std::uint64_t value)
        : invalid_block_value(std::format("Value {} does not fit the wire integer width", value))
        , _value(value) {}

    auto value() const -> std::uint64_t {
        return _value;
    }

private:
    std::uint64_t _value;
};

// Block number does not fit the 20-bit NUM field
class maximum_number_exceeded : public invalid_block_value {
public:
    explicit maximum_number_exceeded(std::uint32_t num)
        : invalid_block_value(std::format("Block number {} exceeds the maximum of 1048575", num))
        , _num(num) {}

    auto num() const -> std::uint32_t {
        return _num;
    }

private:
    std::uint32_t _num;
};

// Option bytes cannot be interpreted by the scalar option codec
class incompatible_option_value_format : public block_option_error {
public:
    explicit incompatible_option_value_format(const std::string& message)
        : block_option_error(message) {}
};

// Exception for invalid codec configuration
class block_config_error : public block_option_error {
public:
    explicit block_config_error(const std::string& message)
        : block_option_error(message) {}
};

} // namespace blockwise
