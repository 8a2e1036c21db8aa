#include "ethbridge/decoder.hpp"
#include "ethbridge/rlp.hpp"

#include <oxen/log.hpp>

#include <algorithm>
#include <array>
#include <string>

namespace
{
auto logcat = oxen::log::Cat("ethbridge");
}

namespace ethbridge
{
namespace log = oxen::log;

namespace
{
constexpr std::array<abi::ParamKind, 5> PAYLOAD_ABI = {
    abi::ParamKind::address(),        // sender
    abi::ParamKind::fixedBytes(32),   // recipient on the receiving chain
    abi::ParamKind::address(),        // token contract, unused for SendNative
    abi::ParamKind::uintN(256),       // amount
    abi::ParamKind::uintN(256),       // nonce
};

[[noreturn]] void fail(DecodeErrorKind kind, const std::string& what) {
    throw DecodeError{kind, what};
}

const abi::Token& expect_token(std::span<const abi::Token> tokens, size_t index, abi::Kind kind, std::string_view field) {
    if (index >= tokens.size())
        fail(DecodeErrorKind::InvalidPayload, "missing " + std::string{field} + " at position " + std::to_string(index));
    const auto& token = tokens[index];
    if (token.kind != kind)
        fail(DecodeErrorKind::InvalidPayload, std::string{field} + " at position " + std::to_string(index) + " has the wrong type");
    return token;
}

template <size_t N>
std::array<unsigned char, N> expect_width(const abi::Token& token, std::string_view field) {
    if (token.value.size() != N)
        fail(DecodeErrorKind::InvalidPayload, std::string{field} + " is " + std::to_string(token.value.size()) +
                                                      " bytes, expected " + std::to_string(N));
    std::array<unsigned char, N> result;
    std::copy(token.value.begin(), token.value.end(), result.begin());
    return result;
}
}  // namespace

std::string_view toString(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::InvalidRLP: return "InvalidRLP";
        case DecodeErrorKind::InvalidData: return "InvalidData";
        case DecodeErrorKind::InvalidTag: return "InvalidTag";
        case DecodeErrorKind::InvalidAddress: return "InvalidAddress";
        case DecodeErrorKind::InvalidPayload: return "InvalidPayload";
    }
    return "Unknown";
}

DecodeError::DecodeError(DecodeErrorKind kind, const std::string& what)
    : std::runtime_error{std::string{toString(kind)} + ": " + what}, kind{kind} {}

const abi::Event& appEvent() {
    static const abi::Event event{
        "AppEvent",
        {{abi::ParamKind::uintN(256), false}, {abi::ParamKind::bytes(), false}},
        false};
    return event;
}

EventFrame EventFrame::decode(const Log& log, const DecodeOptions& options) {
    std::vector<abi::Token> tokens;
    try {
        tokens = appEvent().decode(log.topics, log.data);
    } catch (const abi::Error& e) {
        fail(DecodeErrorKind::InvalidData, e.what());
    }
    return fromTokens(tokens, options);
}

EventFrame EventFrame::fromTokens(std::span<const abi::Token> tokens, const DecodeOptions& options) {
    const auto& tag_token = expect_token(tokens, 0, abi::Kind::Uint, "tag");
    Uint256 tag_word = expect_width<sizeof(Uint256)>(tag_token, "tag");
    const auto& payload_token = expect_token(tokens, 1, abi::Kind::Bytes, "payload");

    // Value checks only once the frame's shape is known to be right
    if (options.strictNarrowing && !utils::fitsInBits(tag_word, 8))
        fail(DecodeErrorKind::InvalidTag, "tag 0x" + std::string{utils::trimLeadingZeros(utils::toHexString(tag_word))} +
                                                  " does not fit into a byte");

    EventFrame frame;
    // Low-order byte of the big-endian word
    frame.tag = tag_word.back();
    frame.payload = payload_token.value;
    log::trace(logcat, "decoded event frame: tag {}, {} payload bytes", frame.tag, frame.payload.size());
    return frame;
}

Payload Payload::decode(std::span<const unsigned char> data, const DecodeOptions& options) {
    std::vector<abi::Token> tokens;
    try {
        tokens = abi::decode(PAYLOAD_ABI, data);
    } catch (const abi::Error& e) {
        fail(DecodeErrorKind::InvalidData, e.what());
    }
    return fromTokens(tokens, options);
}

Payload Payload::fromTokens(std::span<const abi::Token> tokens, const DecodeOptions& options) {
    Payload payload;
    payload.sender = expect_width<sizeof(Bytes20)>(expect_token(tokens, 0, abi::Kind::Address, "sender"), "sender");
    payload.recipient = expect_width<sizeof(Bytes32)>(expect_token(tokens, 1, abi::Kind::FixedBytes, "recipient"), "recipient");
    payload.token = expect_width<sizeof(Bytes20)>(expect_token(tokens, 2, abi::Kind::Address, "token"), "token");
    payload.amount = expect_width<sizeof(Uint256)>(expect_token(tokens, 3, abi::Kind::Uint, "amount"), "amount");

    Uint256 nonce_word = expect_width<sizeof(Uint256)>(expect_token(tokens, 4, abi::Kind::Uint, "nonce"), "nonce");
    if (options.strictNarrowing && !utils::fitsInBits(nonce_word, 64))
        fail(DecodeErrorKind::InvalidPayload, "nonce " + utils::uint256ToDecimal(nonce_word) + " does not fit into 64 bits");
    payload.nonce = utils::lowU64(nonce_word);

    log::trace(logcat, "decoded payload: sender 0x{}, nonce {}", utils::toHexString(payload.sender), payload.nonce);
    return payload;
}

Message assembleMessage(uint8_t tag, const Payload& payload) {
    switch (tag) {
        case static_cast<uint8_t>(MessageTag::SendNative):
            return SendNative{payload.sender, payload.recipient, payload.amount, payload.nonce};
        case static_cast<uint8_t>(MessageTag::SendToken):
            return SendToken{payload.sender, payload.recipient, payload.token, payload.amount, payload.nonce};
        default:
            fail(DecodeErrorKind::InvalidTag, "unknown message tag " + std::to_string(tag));
    }
}

Message decodeMessage(const Log& log, const DecodeOptions& options) {
    EventFrame frame = EventFrame::decode(log, options);
    Payload payload = Payload::decode(frame.payload, options);
    Message msg = assembleMessage(frame.tag, payload);
    log::debug(logcat, "decoded bridge message from 0x{}: {}", utils::toHexString(log.address), toString(msg));
    return msg;
}

Message decodeMessage(const LogEntry& entry, const DecodeOptions& options) {
    try {
        utils::fromHexString20Byte(entry.address);
    } catch (const std::invalid_argument& e) {
        fail(DecodeErrorKind::InvalidAddress, "log address \"" + entry.address + "\": " + e.what());
    }

    Log log;
    try {
        log = Log::fromLogEntry(entry);
    } catch (const std::invalid_argument& e) {
        fail(DecodeErrorKind::InvalidRLP, e.what());
    }
    return decodeMessage(log, options);
}

Message decodeMessageRlp(std::span<const unsigned char> encoded, const DecodeOptions& options) {
    Log log;
    try {
        log = Log::fromRlp(encoded);
    } catch (const rlp::Error& e) {
        fail(DecodeErrorKind::InvalidRLP, e.what());
    }
    return decodeMessage(log, options);
}

std::optional<Message> tryDecodeMessage(const Log& log, const DecodeOptions& options) {
    try {
        return decodeMessage(log, options);
    } catch (const DecodeError& e) {
        if (options.logRejections)
            log::warning(logcat, "rejected bridge log from 0x{}: {}", utils::toHexString(log.address), e.what());
    }
    return std::nullopt;
}

std::optional<Message> tryDecodeMessage(const LogEntry& entry, const DecodeOptions& options) {
    try {
        return decodeMessage(entry, options);
    } catch (const DecodeError& e) {
        if (options.logRejections)
            log::warning(logcat, "rejected bridge log from {}: {}", entry.address, e.what());
    }
    return std::nullopt;
}
}  // namespace ethbridge
