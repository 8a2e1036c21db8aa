#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

namespace ethbridge::abi
{
/// Thrown when input bytes do not satisfy the declared ABI grammar.
struct Error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

enum class Kind {
    Address,
    Bool,
    Uint,
    Int,
    FixedBytes,
    Bytes,
    String,
};

/// A parameter type.  `size` is the bit width for Uint/Int (8..256, multiple of 8), the byte
/// length for FixedBytes (1..32) and unused for the other kinds.
struct ParamKind
{
    Kind kind;
    size_t size = 0;

    static constexpr ParamKind address() { return {Kind::Address}; }
    static constexpr ParamKind boolean() { return {Kind::Bool}; }
    static constexpr ParamKind uintN(size_t bits) { return {Kind::Uint, bits}; }
    static constexpr ParamKind intN(size_t bits) { return {Kind::Int, bits}; }
    static constexpr ParamKind fixedBytes(size_t len) { return {Kind::FixedBytes, len}; }
    static constexpr ParamKind bytes() { return {Kind::Bytes}; }
    static constexpr ParamKind string() { return {Kind::String}; }

    /// True for kinds whose encoding lives in the tail (`bytes`, `string`).
    constexpr bool isDynamic() const { return kind == Kind::Bytes || kind == Kind::String; }

    bool operator==(const ParamKind&) const = default;
};

/// Canonical Solidity type name: `address`, `uint256`, `bytes32`, `bytes`, ...
std::string toString(const ParamKind& kind);

/// A decoded value.  `value` holds:
/// - Address: the 20 address bytes
/// - Uint, Int: the full 32-byte big-endian word
/// - Bool: a single byte, 0 or 1
/// - FixedBytes: the declared number of leading bytes of the word
/// - Bytes, String: the raw bytes of the tail
struct Token
{
    Kind kind;
    std::vector<unsigned char> value;

    bool operator==(const Token&) const = default;

    /// The 32-byte word of a Uint/Int token.  Throws `abi::Error` for other kinds or if the value
    /// is not exactly 32 bytes.
    Uint256 word() const;
};

/// Decodes `data` as the tuple of `kinds`.  Throws `abi::Error` if the data is too short, an
/// offset or length points outside of the data, or a bool word is neither 0 nor 1.
std::vector<Token> decode(std::span<const ParamKind> kinds, std::span<const unsigned char> data);

/// Decodes a single static parameter from a 32-byte topic.  Dynamic parameters are indexed by
/// their hash and cannot be recovered; they are returned as a FixedBytes(32) token.
Token decodeTopic(const ParamKind& kind, const Bytes32& topic);

struct Param
{
    ParamKind kind;
    bool indexed = false;
};

/// An event declaration, e.g. `event Transfer(address indexed from, address indexed to, uint256 value)`.
struct Event
{
    std::string name;
    std::vector<Param> inputs;
    bool anonymous = false;

    /// `Name(type1,type2,...)`
    std::string signature() const;

    /// keccak-256 of `signature()`, the first topic of a non-anonymous event.
    Bytes32 topic() const;

    /// Decodes a log's topics and data against this event.  Tokens are returned in declaration
    /// order.  Throws `abi::Error` if the topic count does not match the indexed inputs, if the
    /// signature topic differs, or if the data does not decode.
    std::vector<Token> decode(std::span<const Bytes32> topics, std::span<const unsigned char> data) const;
};
}  // namespace ethbridge::abi
