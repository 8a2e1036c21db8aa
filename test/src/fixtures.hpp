#pragma once

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "ethbridge/decoder.hpp"
#include "ethbridge/logs.hpp"
#include "ethbridge/utils.hpp"

// Hand-assembled ABI words for building bridge logs in tests.
namespace fixtures
{
using namespace ethbridge;

inline constexpr std::string_view APP_EVENT_TOPIC = "6bafbf13bfcea5e4ce5cd1a03b246069acefcd0bada5ef4e1a059b37a08c2399";
inline constexpr std::string_view CONTRACT = "fc97a6197dc90bef6bbefd672742ed75e9768553";
inline constexpr std::string_view SENDER = "cffeaaf7681c89285d65cfbe808b80e502696573";
inline constexpr std::string_view RECIPIENT = "8eaf04151687736326c9fea17e25fc5287613693c912909cb226aa4794f26a48";
inline constexpr std::string_view TOKEN = "1f9840a85d5af5bf1d1762f925bdaddc4201f984";
inline constexpr std::string_view ZERO_ADDRESS = "0000000000000000000000000000000000000000";

// 2^64 + 7
inline constexpr std::string_view NONCE_ABOVE_U64 = "0000000000000000000000000000000000000000000000010000000000000007";

inline std::string word(uint64_t value) {
    return utils::toHexString(utils::toUint256(value));
}

// Zero-fills hex on the left (numbers, addresses) or right (byte strings) up to a full word
inline std::string padWord(std::string_view hex, bool right = false) {
    std::string zeros(64 - std::min<size_t>(hex.size(), 64), '0');
    return right ? std::string{hex} + zeros : zeros + std::string{hex};
}

inline std::string addressWord(std::string_view address) {
    return padWord(address);
}

inline std::string payloadHex(std::string_view sender, std::string_view recipient, std::string_view token,
                              std::string_view amountWord, std::string_view nonceWord) {
    std::string out = addressWord(sender);
    out += recipient;
    out += addressWord(token);
    out += amountWord;
    out += nonceWord;
    return out;
}

inline std::string payloadHex(std::string_view token = ZERO_ADDRESS, uint64_t amount = 10, uint64_t nonce = 7) {
    return payloadHex(SENDER, RECIPIENT, token, word(amount), word(nonce));
}

/// `AppEvent` data: tag word, offset of the bytes field, its length, then the bytes right padded
/// to a whole word.
inline std::string frameHex(std::string_view tagWord, std::string_view payload) {
    std::string out{tagWord};
    out += word(0x40);
    out += word(payload.size() / 2);
    out += payload;
    if (size_t rem = out.size() % 64; rem != 0)
        out.append(64 - rem, '0');
    return out;
}

inline std::string frameHex(uint64_t tag, std::string_view payload) {
    return frameHex(word(tag), payload);
}

inline Log appEventLog(std::string_view dataHex) {
    Log log;
    log.address = utils::fromHexString20Byte(CONTRACT);
    log.topics.push_back(utils::fromHexString32Byte(APP_EVENT_TOPIC));
    log.data = utils::fromHexString(dataHex);
    return log;
}

inline Log appEventLog(uint64_t tag, std::string_view payload) {
    return appEventLog(frameHex(tag, payload));
}

/// Receipt RLP of `[CONTRACT, [APP_EVENT_TOPIC], data]` for a 256 byte data field.
inline std::string rlpLogHex(std::string_view dataHex) {
    std::string out = "f9013a";
    out += "94";
    out += CONTRACT;
    out += "e1a0";
    out += APP_EVENT_TOPIC;
    out += "b90100";
    out += dataHex;
    return out;
}

/// The kind of DecodeError thrown by `fn`, nullopt if it does not throw.
inline std::optional<DecodeErrorKind> errorKind(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const DecodeError& e) {
        return e.kind;
    }
    return std::nullopt;
}
}  // namespace fixtures
