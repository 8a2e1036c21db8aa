#pragma once

#include <charconv>
#include <iterator>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <array>
#include <vector>
#include <stdexcept>

#include <oxenc/common.h>
#include <oxenc/hex.h>

namespace ethbridge
{
using Bytes20 = std::array<unsigned char, 20>;
using Bytes32 = std::array<unsigned char, 32>;

/// A 256-bit unsigned integer held as its 32-byte big-endian ABI word.
using Uint256 = Bytes32;

namespace utils
{
    template <typename Container>
    std::string toHexString(const Container& bytes) {
        return oxenc::to_hex(bytes.begin(), bytes.end());
    }

    std::string_view trimPrefix(std::string_view src, std::string_view prefix);
    std::string_view trimLeadingZeros(std::string_view src);

    using oxenc::basic_char;
    template <basic_char Char = unsigned char>
    std::vector<Char> fromHexString(std::string_view hexStr) {
        hexStr = trimPrefix(hexStr, "0x");

        if (!oxenc::is_hex(hexStr))
            throw std::invalid_argument{"input string is not hex"};

        std::vector<Char> result;
        result.reserve(oxenc::from_hex_size(hexStr.size()));
        oxenc::from_hex(hexStr.begin(), hexStr.end(), std::back_inserter(result));
        return result;
    }
    extern template std::vector<unsigned char> fromHexString<unsigned char>(std::string_view);

    /// Parses exactly `N` bytes of hex (with or without a `0x` prefix).  Throws
    /// `std::invalid_argument` if the input is not hex or is the wrong length.
    template <size_t N, basic_char Char = unsigned char>
    std::array<Char, N> fromHexStringNBytes(std::string_view hexStr) {
        hexStr = trimPrefix(hexStr, "0x");

        if (!oxenc::is_hex(hexStr) || hexStr.size() != 2 * N) {
            throw std::invalid_argument(
                    "Input string length should be " + std::to_string(2 * N) + " hex characters for " +
                    std::to_string(N) + " bytes");
        }

        std::array<Char, N> bytesArr;
        oxenc::from_hex(hexStr.begin(), hexStr.end(), bytesArr.begin());
        return bytesArr;
    }

    inline Bytes32 fromHexString32Byte(std::string_view hexStr) {
        return fromHexStringNBytes<32>(hexStr);
    }

    inline Bytes20 fromHexString20Byte(std::string_view hexStr) {
        return fromHexStringNBytes<20>(hexStr);
    }

    uint64_t hexStringToU64(std::string_view hexStr);

    /// Parses an integer of some sort from a string, requiring that the entire string be consumed
    /// during parsing.  Return false if parsing failed, sets `value` and returns true if the entire
    /// string was consumed.
    template <typename T>
    bool parseInt(const std::string_view str, T& value, int base = 10) {
        T tmp;
        auto* strend = str.data() + str.size();
        auto [p, ec] = std::from_chars(str.data(), strend, tmp, base);
        if (ec != std::errc() || p != strend)
            return false;
        value = tmp;
        return true;
    }

    Bytes32 hashBytesPtr(const void *bytes, size_t size);
    Bytes32 hashBytes(std::span<const char> bytes);

    /// Keccak-256 of a canonical event signature such as `Transfer(address,address,uint256)`;
    /// this is the value a non-anonymous event carries in its first topic.
    Bytes32 toEthEventTopic(std::string_view signature);

    /// Big-endian 256-bit word holding `value`.
    Uint256 toUint256(uint64_t value);

    /// Low-order 64 bits of a big-endian 256-bit word (truncating).
    uint64_t lowU64(const Uint256& word);

    /// True if the big-endian word's value fits into its low `bits` bits.
    bool fitsInBits(const Uint256& word, size_t bits);

    /// Base-10 rendering of a big-endian 256-bit word.
    std::string uint256ToDecimal(const Uint256& word);

    /// Parses a base-10 or `0x` prefixed base-16 string into a big-endian 256-bit word.  Leading
    /// zeros are insignificant in either base.  Throws `std::invalid_argument` on an empty digit
    /// string, any character outside the base's digits, or a value that does not fit into 256 bits.
    Uint256 uint256FromString(std::string_view str);
}  // namespace utils
}  // namespace ethbridge
