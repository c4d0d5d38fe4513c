#define BOOST_TEST_MODULE block_config_test
#include <boost/test/unit_test.hpp>

#include <blockwise/block_config.hpp>
#include <blockwise/block_utils.hpp>
#include <blockwise/exceptions.hpp>

#include <cstddef>
#include <cstdint>

using namespace blockwise;
using namespace blockwise::block_utils;

namespace {
    constexpr std::size_t valid_block_size = 1024;
    constexpr std::size_t non_power_block_size = 100;
    constexpr std::size_t too_small_block_size = 8;
    constexpr std::size_t too_large_block_size = 4096;
}

BOOST_AUTO_TEST_SUITE(block_utils_tests)

BOOST_AUTO_TEST_CASE(test_size_exponent_to_block_size, * boost::unit_test::timeout(15)) {
    BOOST_CHECK_EQUAL(size_exponent_to_block_size(0), 16u);
    BOOST_CHECK_EQUAL(size_exponent_to_block_size(6), 1024u);
    BOOST_CHECK_EQUAL(size_exponent_to_block_size(7), 2048u);
    BOOST_CHECK_THROW(size_exponent_to_block_size(8), block_config_error);
}

BOOST_AUTO_TEST_CASE(test_block_size_to_size_exponent, * boost::unit_test::timeout(15)) {
    BOOST_CHECK_EQUAL(block_size_to_size_exponent(16), 0);
    BOOST_CHECK_EQUAL(block_size_to_size_exponent(256), 4);
    BOOST_CHECK_EQUAL(block_size_to_size_exponent(2048), 7);

    BOOST_CHECK_THROW(block_size_to_size_exponent(non_power_block_size), block_config_error);
    BOOST_CHECK_THROW(block_size_to_size_exponent(too_small_block_size), block_config_error);
    BOOST_CHECK_THROW(block_size_to_size_exponent(too_large_block_size), block_config_error);
    BOOST_CHECK_THROW(block_size_to_size_exponent(0), block_config_error);
}

BOOST_AUTO_TEST_CASE(test_is_valid_block_size, * boost::unit_test::timeout(15)) {
    for (std::uint8_t szx = 0; szx <= 7; ++szx) {
        BOOST_CHECK(is_valid_block_size(size_exponent_to_block_size(szx)));
    }
    BOOST_CHECK(!is_valid_block_size(non_power_block_size));
    BOOST_CHECK(!is_valid_block_size(too_large_block_size));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(block_codec_config_tests)

BOOST_AUTO_TEST_CASE(test_default_config_is_valid, * boost::unit_test::timeout(15)) {
    block_codec_config config;
    BOOST_CHECK_EQUAL(config.preferred_block_size, valid_block_size);
    BOOST_CHECK_EQUAL(config.max_block_size, valid_block_size);
    BOOST_CHECK(!config.strict_decode);
    BOOST_CHECK_NO_THROW(validate_block_codec_config(config));
}

BOOST_AUTO_TEST_CASE(test_invalid_preferred_block_size, * boost::unit_test::timeout(15)) {
    block_codec_config config;
    config.preferred_block_size = non_power_block_size;

    BOOST_CHECK_THROW(validate_block_codec_config(config), block_config_error);
}

BOOST_AUTO_TEST_CASE(test_invalid_max_block_size, * boost::unit_test::timeout(15)) {
    block_codec_config config;
    config.max_block_size = too_large_block_size;

    BOOST_CHECK_THROW(validate_block_codec_config(config), block_config_error);
}

BOOST_AUTO_TEST_CASE(test_preferred_above_max, * boost::unit_test::timeout(15)) {
    block_codec_config config;
    config.preferred_block_size = 2048;
    config.max_block_size = 512;

    BOOST_CHECK_THROW(validate_block_codec_config(config), block_config_error);
}

BOOST_AUTO_TEST_CASE(test_largest_sizes_accepted, * boost::unit_test::timeout(15)) {
    block_codec_config config;
    config.preferred_block_size = 2048;
    config.max_block_size = 2048;
    config.strict_decode = true;

    BOOST_CHECK_NO_THROW(validate_block_codec_config(config));
}

BOOST_AUTO_TEST_SUITE_END()
