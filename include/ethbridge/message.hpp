#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "utils.hpp"

namespace ethbridge
{
/// Discriminant carried in the first field of an `AppEvent` log.
enum class MessageTag : uint8_t {
    SendNative = 0,
    SendToken = 1,
};

/// Transfer of the source chain's native currency.
struct SendNative
{
    Bytes20 sender = {};
    Bytes32 recipient = {};
    Uint256 amount = {};
    uint64_t nonce = 0;

    bool operator==(const SendNative&) const = default;
};

/// Transfer of a token held by the contract at `token`.
struct SendToken
{
    Bytes20 sender = {};
    Bytes32 recipient = {};
    Bytes20 token = {};
    Uint256 amount = {};
    uint64_t nonce = 0;

    bool operator==(const SendToken&) const = default;
};

using Message = std::variant<SendNative, SendToken>;

MessageTag messageTag(const Message& msg);
const Bytes20& messageSender(const Message& msg);
const Bytes32& messageRecipient(const Message& msg);
const Uint256& messageAmount(const Message& msg);
uint64_t messageNonce(const Message& msg);

/// The token contract for a SendToken message, nullopt for SendNative.
std::optional<Bytes20> messageToken(const Message& msg);

std::string toString(MessageTag tag);

/// Human readable rendering, e.g.
/// `SendNative{sender: 0xcffe..., recipient: 0x8eaf..., amount: 10, nonce: 7}`
std::string toString(const Message& msg);
}  // namespace ethbridge
