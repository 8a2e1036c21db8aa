#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <vector>

namespace ethbridge::rlp
{
/// Thrown when input is not a canonical RLP encoding.
struct Error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// One decoded RLP item.  `payload` points into the input buffer: for a string it is the string's
/// bytes, for a list it is the concatenated encodings of the list's items.
struct Item
{
    bool isList = false;
    std::span<const unsigned char> payload;
};

/// Decodes the item at the front of `in` and advances `in` past it.
Item decodeItem(std::span<const unsigned char>& in);

/// Decodes an item that must span the whole of `in` (no trailing bytes).
Item decodeSingle(std::span<const unsigned char> in);

/// Splits a list item into its elements.  Throws if `list` is a string item.
std::vector<Item> decodeList(const Item& list);

/// Returns the payload of a string item.  Throws if `item` is a list.
std::span<const unsigned char> expectString(const Item& item);
}  // namespace ethbridge::rlp
