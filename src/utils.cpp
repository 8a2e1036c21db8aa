#include "ethbridge/utils.hpp"

#include <oxenc/endian.h>
#include <oxenc/hex.h>

#include <ethash/keccak.hpp>

#include <gmpxx.h>

#include <algorithm>
#include <iterator>
#include <string>

namespace ethbridge
{
std::string_view utils::trimPrefix(std::string_view src, std::string_view prefix) {
    if (src.starts_with(prefix))
        return src.substr(prefix.size());
    return src;
}

std::string_view utils::trimLeadingZeros(std::string_view src) {
    if (auto p = src.find_first_not_of('0'); p != src.npos)
        return src.substr(p);
    return src;
}

uint64_t utils::hexStringToU64(std::string_view hexStr) {
    uint64_t val;
    if (parseInt(trimPrefix(hexStr, "0x"), val, 16))
        return val;

    throw std::invalid_argument{"failed to parse integer from hex input"};
}

template std::vector<unsigned char> utils::fromHexString<unsigned char>(std::string_view);

Bytes32 utils::hashBytesPtr(const void *bytes, size_t size) {
    ethash::hash256 digest = ethash::keccak256(reinterpret_cast<const uint8_t*>(bytes), size);
    Bytes32 result;
    std::copy(std::begin(digest.bytes), std::end(digest.bytes), result.begin());
    return result;
}

Bytes32 utils::hashBytes(std::span<const char> bytes) {
    Bytes32 result = hashBytesPtr(bytes.data(), bytes.size());
    return result;
}

Bytes32 utils::toEthEventTopic(std::string_view signature) {
    return hashBytes(std::span{signature.data(), signature.size()});
}

Uint256 utils::toUint256(uint64_t value) {
    Uint256 result = {};
    oxenc::write_host_as_big(value, result.data() + result.size() - sizeof(value));
    return result;
}

uint64_t utils::lowU64(const Uint256& word) {
    return oxenc::load_big_to_host<uint64_t>(word.data() + word.size() - sizeof(uint64_t));
}

bool utils::fitsInBits(const Uint256& word, size_t bits) {
    if (bits >= 256)
        return true;

    // Every byte above the partially used one must be zero
    size_t full_bytes = bits / 8;
    size_t high_bytes = word.size() - full_bytes;
    size_t partial_bits = bits % 8;
    for (size_t i = 0; i < high_bytes; ++i) {
        unsigned char b = word[i];
        if (i + 1 == high_bytes && partial_bits != 0)
            b >>= partial_bits;
        if (b != 0)
            return false;
    }
    return true;
}

std::string utils::uint256ToDecimal(const Uint256& word) {
    mpz_class value;
    mpz_import(value.get_mpz_t(), word.size(), 1 /*most significant word first*/, 1, 1 /*big endian*/, 0, word.data());
    return value.get_str(10);
}

Uint256 utils::uint256FromString(std::string_view str) {
    std::string input{str};
    const bool hex = str.starts_with("0x");
    std::string_view digits = trimPrefix(str, "0x");
    auto is_digit = [hex](char c) {
        return (c >= '0' && c <= '9') || (hex && ((c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F')));
    };

    mpz_class value;
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit) ||
        value.set_str(std::string{digits}, hex ? 16 : 10) != 0)
        throw std::invalid_argument{"failed to parse 256-bit integer from \"" + input + "\""};

    if (mpz_sizeinbase(value.get_mpz_t(), 2) > 256)
        throw std::invalid_argument{"integer \"" + input + "\" does not fit into 256 bits"};

    Uint256 result = {};
    size_t count = 0;
    std::array<unsigned char, 32> buf;
    mpz_export(buf.data(), &count, 1, 1, 1, 0, value.get_mpz_t());
    std::copy(buf.begin(), buf.begin() + count, result.end() - count);
    return result;
}
}  // namespace ethbridge
