#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "abi.hpp"
#include "logs.hpp"
#include "message.hpp"
#include "utils.hpp"

namespace ethbridge
{
/// Signature of the bridge event: `event AppEvent(uint256 tag, bytes payload)`, neither field
/// indexed.  Changing the emitting contract's event requires changing this.
inline constexpr std::string_view APP_EVENT_SIGNATURE = "AppEvent(uint256,bytes)";

enum class DecodeErrorKind {
    InvalidRLP,      // the log record itself could not be reconstructed
    InvalidData,     // bytes rejected by the ABI grammar
    InvalidTag,      // discriminant outside of MessageTag
    InvalidAddress,  // malformed emitter address
    InvalidPayload,  // tokens of the wrong count, kind or width
};

std::string_view toString(DecodeErrorKind kind);

/// Thrown by every decode stage; the message is aborted, nothing is partially returned.
struct DecodeError : std::runtime_error
{
    DecodeError(DecodeErrorKind kind, const std::string& what);

    DecodeErrorKind kind;
};

struct DecodeOptions
{
    /// Reject a tag word above 255 (InvalidTag) and a nonce word above 2^64-1 (InvalidPayload)
    /// rather than keeping their low-order bits.
    bool strictNarrowing = false;

    /// Log a warning for every log the `tryDecodeMessage` functions reject.
    bool logRejections = true;
};

/// The `AppEvent` declaration the frame is checked against.
const abi::Event& appEvent();

/// Outer layer of a bridge log: the tag and the still-encoded payload blob.
struct EventFrame
{
    uint8_t tag = 0;
    std::vector<unsigned char> payload;

    /// Decodes `log` against `appEvent()`.  InvalidData if the topics or data do not satisfy the
    /// event's ABI, otherwise as `fromTokens`.
    static EventFrame decode(const Log& log, const DecodeOptions& options = {});

    /// Extracts the frame from decoded `(uint256, bytes)` event tokens.  InvalidPayload if either
    /// token is missing or of the wrong kind.
    static EventFrame fromTokens(std::span<const abi::Token> tokens, const DecodeOptions& options = {});
};

/// Inner layer: `(address sender, bytes32 recipient, address token, uint256 amount, uint256 nonce)`.
struct Payload
{
    Bytes20 sender = {};
    Bytes32 recipient = {};
    Bytes20 token = {};
    Uint256 amount = {};
    uint64_t nonce = 0;

    /// InvalidData if `data` does not satisfy the payload ABI, otherwise as `fromTokens`.
    static Payload decode(std::span<const unsigned char> data, const DecodeOptions& options = {});

    /// InvalidPayload if any of the five tokens is missing, of the wrong kind or of the wrong
    /// width.
    static Payload fromTokens(std::span<const abi::Token> tokens, const DecodeOptions& options = {});
};

/// Maps a tag and payload onto a Message; SendNative drops `payload.token`.  InvalidTag for any
/// tag other than 0 or 1.
Message assembleMessage(uint8_t tag, const Payload& payload);

/// Decodes a bridge log into a Message.  Throws DecodeError.
Message decodeMessage(const Log& log, const DecodeOptions& options = {});

/// As above, for a log still in JSON-RPC hex form.  InvalidAddress if the emitter address is not
/// 20 bytes of hex, InvalidRLP if a topic or the data is not valid hex.
Message decodeMessage(const LogEntry& entry, const DecodeOptions& options = {});

/// As above, for a log in its receipt RLP encoding.  InvalidRLP if the encoding is malformed.
Message decodeMessageRlp(std::span<const unsigned char> encoded, const DecodeOptions& options = {});

/// Non-throwing variants: nullopt on any DecodeError (logged if `options.logRejections`).
std::optional<Message> tryDecodeMessage(const Log& log, const DecodeOptions& options = {});
std::optional<Message> tryDecodeMessage(const LogEntry& entry, const DecodeOptions& options = {});
}  // namespace ethbridge
