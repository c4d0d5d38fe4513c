#define BOOST_TEST_MODULE option_value_test
#include <boost/test/unit_test.hpp>

#include <blockwise/option_value.hpp>
#include <blockwise/exceptions.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace blockwise;

namespace {
    auto to_uint8_vector(const std::vector<std::byte>& byte_vec) -> std::vector<std::uint8_t> {
        std::vector<std::uint8_t> result;
        result.reserve(byte_vec.size());
        for (const auto& b : byte_vec) {
            result.push_back(static_cast<std::uint8_t>(b));
        }
        return result;
    }

    auto make_bytes(std::initializer_list<std::uint8_t> octets) -> std::vector<std::byte> {
        std::vector<std::byte> bytes;
        for (auto octet : octets) {
            bytes.push_back(static_cast<std::byte>(octet));
        }
        return bytes;
    }
}

BOOST_AUTO_TEST_SUITE(option_value_uint_tests)

BOOST_AUTO_TEST_CASE(test_zero_is_empty, * boost::unit_test::timeout(15)) {
    BOOST_CHECK(option_value_u32{0}.to_bytes().empty());
    BOOST_CHECK(option_value_u8{0}.to_bytes().empty());
    BOOST_CHECK_EQUAL(option_value_u32::from_bytes({}).value, 0u);
}

BOOST_AUTO_TEST_CASE(test_minimal_length, * boost::unit_test::timeout(15)) {
    auto one = to_uint8_vector(option_value_u32{0x01}.to_bytes());
    std::vector<std::uint8_t> expected_one{0x01};
    BOOST_CHECK_EQUAL_COLLECTIONS(one.begin(), one.end(), expected_one.begin(), expected_one.end());

    auto three = to_uint8_vector(option_value_u32{0x010006}.to_bytes());
    std::vector<std::uint8_t> expected_three{0x01, 0x00, 0x06};
    BOOST_CHECK_EQUAL_COLLECTIONS(three.begin(), three.end(), expected_three.begin(), expected_three.end());

    auto full = to_uint8_vector(option_value_u32{0xdeadbeef}.to_bytes());
    std::vector<std::uint8_t> expected_full{0xde, 0xad, 0xbe, 0xef};
    BOOST_CHECK_EQUAL_COLLECTIONS(full.begin(), full.end(), expected_full.begin(), expected_full.end());
}

BOOST_AUTO_TEST_CASE(test_inner_zero_bytes_kept, * boost::unit_test::timeout(15)) {
    auto bytes = to_uint8_vector(option_value_u64{0x0100000000000000ull}.to_bytes());
    BOOST_CHECK_EQUAL(bytes.size(), 8u);
    BOOST_CHECK_EQUAL(bytes.front(), 0x01);
    BOOST_CHECK_EQUAL(bytes.back(), 0x00);
}

BOOST_AUTO_TEST_CASE(test_decode_big_endian, * boost::unit_test::timeout(15)) {
    BOOST_CHECK_EQUAL(option_value_u32::from_bytes(make_bytes({0xff, 0xf6})).value, 0xfff6u);
    BOOST_CHECK_EQUAL(option_value_u16::from_bytes(make_bytes({0x12, 0x34})).value, 0x1234u);
    BOOST_CHECK_EQUAL(option_value_u64::from_bytes(make_bytes({0x01, 0, 0, 0, 0, 0, 0, 0})).value,
                      0x0100000000000000ull);
}

BOOST_AUTO_TEST_CASE(test_decode_tolerates_leading_zeros, * boost::unit_test::timeout(15)) {
    BOOST_CHECK_EQUAL(option_value_u32::from_bytes(make_bytes({0x00, 0x00, 0x00, 0x2a})).value, 42u);
}

BOOST_AUTO_TEST_CASE(test_decode_rejects_overlong_input, * boost::unit_test::timeout(15)) {
    BOOST_CHECK_THROW(option_value_u32::from_bytes(make_bytes({1, 2, 3, 4, 5})), incompatible_option_value_format);
    BOOST_CHECK_THROW(option_value_u8::from_bytes(make_bytes({1, 2})), incompatible_option_value_format);
    BOOST_CHECK_NO_THROW(option_value_u8::from_bytes(make_bytes({0xff})));

    try {
        option_value_u16::from_bytes(make_bytes({1, 2, 3}));
        BOOST_FAIL("Expected incompatible_option_value_format");
    } catch (const incompatible_option_value_format& e) {
        BOOST_CHECK(std::string(e.what()).find("3 bytes") != std::string::npos);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(option_number_tests)

BOOST_AUTO_TEST_CASE(test_rfc7959_option_numbers, * boost::unit_test::timeout(15)) {
    BOOST_CHECK_EQUAL(static_cast<std::uint16_t>(option_number::block2), 23);
    BOOST_CHECK_EQUAL(static_cast<std::uint16_t>(option_number::block1), 27);
    BOOST_CHECK_EQUAL(static_cast<std::uint16_t>(option_number::size2), 28);
    BOOST_CHECK_EQUAL(static_cast<std::uint16_t>(option_number::size1), 60);
}

BOOST_AUTO_TEST_CASE(test_is_block_option, * boost::unit_test::timeout(15)) {
    BOOST_CHECK(is_block_option(option_number::block1));
    BOOST_CHECK(is_block_option(option_number::block2));
    BOOST_CHECK(!is_block_option(option_number::size1));
    BOOST_CHECK(!is_block_option(option_number::size2));
    BOOST_CHECK_EQUAL(std::string(option_number_to_string(option_number::block2)), "Block2");
}

BOOST_AUTO_TEST_SUITE_END()
