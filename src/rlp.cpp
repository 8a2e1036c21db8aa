#include "ethbridge/rlp.hpp"

#include <cstdint>
#include <string>

namespace ethbridge::rlp
{
namespace
{
// Length of a long-form item: `len_of_len` (1..8) big-endian bytes following the prefix
size_t read_long_length(std::span<const unsigned char> in, size_t len_of_len) {
    if (in.size() < 1 + len_of_len)
        throw Error{"RLP input too short for length prefix"};
    if (in[1] == 0)
        throw Error{"RLP length has leading zero bytes"};

    uint64_t length = 0;
    for (size_t i = 0; i < len_of_len; ++i)
        length = (length << 8) | in[1 + i];

    if (length <= 55)
        throw Error{"RLP long form used for a length of " + std::to_string(length)};
    return length;
}

std::span<const unsigned char> take(std::span<const unsigned char>& in, size_t header, uint64_t length) {
    if (in.size() - header < length)
        throw Error{"RLP item length " + std::to_string(length) + " exceeds remaining input of " +
                    std::to_string(in.size() - header) + " bytes"};
    auto payload = in.subspan(header, length);
    in = in.subspan(header + length);
    return payload;
}
}  // namespace

Item decodeItem(std::span<const unsigned char>& in) {
    if (in.empty())
        throw Error{"RLP input is empty"};

    const unsigned char prefix = in[0];
    Item item;
    if (prefix < 0x80) {
        item.payload = in.subspan(0, 1);
        in = in.subspan(1);
    } else if (prefix <= 0xb7) {
        item.payload = take(in, 1, prefix - 0x80);
        if (item.payload.size() == 1 && item.payload[0] < 0x80)
            throw Error{"RLP single byte below 0x80 must not carry a string prefix"};
    } else if (prefix <= 0xbf) {
        size_t len_of_len = prefix - 0xb7;
        uint64_t length = read_long_length(in, len_of_len);
        item.payload = take(in, 1 + len_of_len, length);
    } else if (prefix <= 0xf7) {
        item.isList = true;
        item.payload = take(in, 1, prefix - 0xc0);
    } else {
        size_t len_of_len = prefix - 0xf7;
        uint64_t length = read_long_length(in, len_of_len);
        item.isList = true;
        item.payload = take(in, 1 + len_of_len, length);
    }
    return item;
}

Item decodeSingle(std::span<const unsigned char> in) {
    Item item = decodeItem(in);
    if (!in.empty())
        throw Error{"RLP input has " + std::to_string(in.size()) + " trailing bytes"};
    return item;
}

std::vector<Item> decodeList(const Item& list) {
    if (!list.isList)
        throw Error{"RLP item is a string, expected a list"};

    std::vector<Item> items;
    auto rest = list.payload;
    while (!rest.empty())
        items.push_back(decodeItem(rest));
    return items;
}

std::span<const unsigned char> expectString(const Item& item) {
    if (item.isList)
        throw Error{"RLP item is a list, expected a string"};
    return item.payload;
}
}  // namespace ethbridge::rlp
