#include "ethbridge/utils.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace ethbridge;

TEST_CASE( "HashTest", "[utils]" ) {
    std::string_view input = "hello world!";
    std::string hash_hello_world = utils::toHexString(utils::hashBytes(std::span{input.data(), input.size()}));
    REQUIRE( hash_hello_world == "57caa176af1ac0433c5df30e8dabcd2ec1af1e92a26eced5f719b88458777cd6" );

    std::string hash_empty = utils::toHexString(utils::hashBytesPtr("", 0));
    REQUIRE( hash_empty == "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470" );
}

TEST_CASE( "Event topic of an ERC20 Transfer", "[utils]" ) {
    auto topic = utils::toEthEventTopic("Transfer(address,address,uint256)");
    REQUIRE( utils::toHexString(topic) == "ddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef" );
}

TEST_CASE( "Hex parsing", "[utils]" ) {
    REQUIRE( utils::fromHexString("0x0aff") == std::vector<unsigned char>{0x0a, 0xff} );
    REQUIRE( utils::fromHexString("0aff") == std::vector<unsigned char>{0x0a, 0xff} );
    REQUIRE( utils::fromHexString("0x").empty() );
    REQUIRE_THROWS_AS( utils::fromHexString("0xabc"), std::invalid_argument );
    REQUIRE_THROWS_AS( utils::fromHexString("0xgg"), std::invalid_argument );

    auto address = utils::fromHexString20Byte("0xcffeaaf7681c89285d65cfbe808b80e502696573");
    REQUIRE( address[0] == 0xcf );
    REQUIRE( address[19] == 0x73 );
    REQUIRE_THROWS_AS( utils::fromHexString20Byte("0xcffeaaf7681c89285d65cfbe808b80e5026965"), std::invalid_argument );
    REQUIRE_THROWS_AS( utils::fromHexString32Byte("0xcffeaaf7681c89285d65cfbe808b80e502696573"), std::invalid_argument );

    REQUIRE( utils::hexStringToU64("0x1a") == 26 );
    REQUIRE_THROWS_AS( utils::hexStringToU64("0x"), std::invalid_argument );
}

TEST_CASE( "256-bit words", "[utils]" ) {
    SECTION( "from and to uint64" ) {
        Uint256 w = utils::toUint256(0x0102030405060708);
        REQUIRE( utils::toHexString(w) == "0000000000000000000000000000000000000000000000000102030405060708" );
        REQUIRE( utils::lowU64(w) == 0x0102030405060708 );
    }
    SECTION( "low 64 bits of a wider value" ) {
        Uint256 w = utils::fromHexString32Byte("0000000000000000000000000000000000000000000000010000000000000007");
        REQUIRE( utils::lowU64(w) == 7 );
        REQUIRE_FALSE( utils::fitsInBits(w, 64) );
        REQUIRE( utils::fitsInBits(w, 65) );
        REQUIRE( utils::uint256ToDecimal(w) == "18446744073709551623" );
    }
    SECTION( "bit width checks" ) {
        REQUIRE( utils::fitsInBits(utils::toUint256(255), 8) );
        REQUIRE_FALSE( utils::fitsInBits(utils::toUint256(256), 8) );
        REQUIRE( utils::fitsInBits(utils::toUint256(0xfff), 12) );
        REQUIRE_FALSE( utils::fitsInBits(utils::toUint256(0x1000), 12) );
        REQUIRE( utils::fitsInBits(utils::toUint256(UINT64_MAX), 64) );
        REQUIRE( utils::fitsInBits(utils::toUint256(0), 0) );
        REQUIRE_FALSE( utils::fitsInBits(utils::toUint256(1), 0) );

        Uint256 max;
        max.fill(0xff);
        REQUIRE( utils::fitsInBits(max, 256) );
        REQUIRE_FALSE( utils::fitsInBits(max, 255) );
    }
    SECTION( "decimal rendering and parsing" ) {
        REQUIRE( utils::uint256ToDecimal(Uint256{}) == "0" );
        REQUIRE( utils::uint256ToDecimal(utils::toUint256(10)) == "10" );
        REQUIRE( utils::uint256FromString("10") == utils::toUint256(10) );
        REQUIRE( utils::uint256FromString("0x10000000000000007") ==
                 utils::fromHexString32Byte("0000000000000000000000000000000000000000000000010000000000000007") );

        std::string max = "115792089237316195423570985008687907853269984665640564039457584007913129639935";
        REQUIRE( utils::uint256ToDecimal(utils::uint256FromString(max)) == max );
        REQUIRE_THROWS_AS( utils::uint256FromString("115792089237316195423570985008687907853269984665640564039457584007913129639936"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("-1"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString(""), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("12ab"), std::invalid_argument );
    }
    SECTION( "only decimal and 0x hex are accepted" ) {
        REQUIRE( utils::uint256FromString("010") == utils::toUint256(10) );
        REQUIRE( utils::uint256FromString("0x0a") == utils::toUint256(10) );
        REQUIRE( utils::uint256FromString("0xFF") == utils::toUint256(255) );
        REQUIRE_THROWS_AS( utils::uint256FromString("0x"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString(" 10"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("10 "), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("1 0"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("0b1"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("0b101"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("+5"), std::invalid_argument );
        REQUIRE_THROWS_AS( utils::uint256FromString("0x-1"), std::invalid_argument );
    }
}
