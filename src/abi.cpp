#include "ethbridge/abi.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace ethbridge::abi
{
namespace
{
constexpr size_t WORD_SIZE = 32;

void check_declaration(const ParamKind& kind) {
    switch (kind.kind) {
        case Kind::Uint:
        case Kind::Int:
            if (kind.size < 8 || kind.size > 256 || kind.size % 8 != 0)
                throw std::invalid_argument{"invalid integer width " + std::to_string(kind.size)};
            break;
        case Kind::FixedBytes:
            if (kind.size < 1 || kind.size > 32)
                throw std::invalid_argument{"invalid fixed bytes length " + std::to_string(kind.size)};
            break;
        default:
            break;
    }
}

std::span<const unsigned char, WORD_SIZE> read_word(std::span<const unsigned char> data, size_t offset) {
    if (offset > data.size() || data.size() - offset < WORD_SIZE)
        throw Error{"input too short: need 32 bytes at offset " + std::to_string(offset) + ", have " +
                    std::to_string(data.size())};
    return data.subspan(offset).first<WORD_SIZE>();
}

// Offsets and lengths are uint256 words that have to fit a size_t to be meaningful
size_t word_to_size(std::span<const unsigned char, WORD_SIZE> word) {
    Uint256 w;
    std::copy(word.begin(), word.end(), w.begin());
    if (!utils::fitsInBits(w, 64))
        throw Error{"offset or length does not fit into 64 bits"};
    uint64_t value = utils::lowU64(w);
    if constexpr (sizeof(size_t) < sizeof(uint64_t)) {
        if (value > std::numeric_limits<size_t>::max())
            throw Error{"offset or length does not fit into size_t"};
    }
    return static_cast<size_t>(value);
}

Token decode_static(const ParamKind& kind, std::span<const unsigned char, WORD_SIZE> word) {
    Token token{kind.kind, {}};
    switch (kind.kind) {
        case Kind::Address:
            // High-order padding is ignored, as Solidity does since 0.5.0
            token.value.assign(word.begin() + (WORD_SIZE - sizeof(Bytes20)), word.end());
            break;
        case Kind::Bool:
            if (!std::all_of(word.begin(), word.end() - 1, [](unsigned char b) { return b == 0; }) ||
                word[WORD_SIZE - 1] > 1)
                throw Error{"bool word is neither 0 nor 1"};
            token.value.push_back(word[WORD_SIZE - 1]);
            break;
        case Kind::Uint:
        case Kind::Int:
            token.value.assign(word.begin(), word.end());
            break;
        case Kind::FixedBytes:
            token.value.assign(word.begin(), word.begin() + kind.size);
            break;
        case Kind::Bytes:
        case Kind::String:
            throw std::logic_error{"dynamic kind passed to decode_static"};
    }
    return token;
}

Token decode_dynamic(const ParamKind& kind, std::span<const unsigned char> data, size_t offset) {
    size_t length = word_to_size(read_word(data, offset));
    size_t start = offset + WORD_SIZE;
    if (data.size() - start < length)
        throw Error{"dynamic value of length " + std::to_string(length) + " at offset " +
                    std::to_string(offset) + " overruns input of " + std::to_string(data.size()) + " bytes"};

    auto bytes = data.subspan(start, length);
    return Token{kind.kind, std::vector<unsigned char>(bytes.begin(), bytes.end())};
}
}  // namespace

std::string toString(const ParamKind& kind) {
    switch (kind.kind) {
        case Kind::Address: return "address";
        case Kind::Bool: return "bool";
        case Kind::Uint: return "uint" + std::to_string(kind.size);
        case Kind::Int: return "int" + std::to_string(kind.size);
        case Kind::FixedBytes: return "bytes" + std::to_string(kind.size);
        case Kind::Bytes: return "bytes";
        case Kind::String: return "string";
    }
    return "unknown";
}

Uint256 Token::word() const {
    if (kind != Kind::Uint && kind != Kind::Int)
        throw Error{"token is not an integer"};
    if (value.size() != sizeof(Uint256))
        throw Error{"integer token is " + std::to_string(value.size()) + " bytes, expected 32"};
    Uint256 result;
    std::copy(value.begin(), value.end(), result.begin());
    return result;
}

std::vector<Token> decode(std::span<const ParamKind> kinds, std::span<const unsigned char> data) {
    std::vector<Token> tokens;
    tokens.reserve(kinds.size());

    size_t head = 0;
    for (const auto& kind : kinds) {
        check_declaration(kind);
        auto word = read_word(data, head);
        if (kind.isDynamic())
            tokens.push_back(decode_dynamic(kind, data, word_to_size(word)));
        else
            tokens.push_back(decode_static(kind, word));
        head += WORD_SIZE;
    }
    return tokens;
}

Token decodeTopic(const ParamKind& kind, const Bytes32& topic) {
    check_declaration(kind);
    if (kind.isDynamic())
        return Token{Kind::FixedBytes, std::vector<unsigned char>(topic.begin(), topic.end())};
    return decode_static(kind, std::span<const unsigned char, WORD_SIZE>{topic});
}

std::string Event::signature() const {
    std::string result = name;
    result += '(';
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (i)
            result += ',';
        result += toString(inputs[i].kind);
    }
    result += ')';
    return result;
}

Bytes32 Event::topic() const {
    return utils::toEthEventTopic(signature());
}

std::vector<Token> Event::decode(std::span<const Bytes32> topics, std::span<const unsigned char> data) const {
    size_t indexed = std::count_if(inputs.begin(), inputs.end(), [](const Param& p) { return p.indexed; });
    size_t skip = anonymous ? 0 : 1;
    if (topics.size() != indexed + skip)
        throw Error{"event " + name + " expects " + std::to_string(indexed + skip) + " topics, got " +
                    std::to_string(topics.size())};

    if (!anonymous && topics[0] != topic())
        throw Error{"log topic does not match the signature of event " + signature()};

    std::vector<ParamKind> data_kinds;
    for (const auto& input : inputs)
        if (!input.indexed)
            data_kinds.push_back(input.kind);
    std::vector<Token> data_tokens = abi::decode(data_kinds, data);

    std::vector<Token> tokens;
    tokens.reserve(inputs.size());
    size_t next_topic = skip;
    size_t next_data = 0;
    for (const auto& input : inputs) {
        if (input.indexed)
            tokens.push_back(decodeTopic(input.kind, topics[next_topic++]));
        else
            tokens.push_back(std::move(data_tokens[next_data++]));
    }
    return tokens;
}
}  // namespace ethbridge::abi
