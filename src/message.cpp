#include "ethbridge/message.hpp"

namespace ethbridge
{
namespace
{
template <typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string hex_0x(const auto& bytes) {
    return "0x" + utils::toHexString(bytes);
}
}  // namespace

MessageTag messageTag(const Message& msg) {
    return std::holds_alternative<SendNative>(msg) ? MessageTag::SendNative : MessageTag::SendToken;
}

const Bytes20& messageSender(const Message& msg) {
    return std::visit([](const auto& m) -> const Bytes20& { return m.sender; }, msg);
}

const Bytes32& messageRecipient(const Message& msg) {
    return std::visit([](const auto& m) -> const Bytes32& { return m.recipient; }, msg);
}

const Uint256& messageAmount(const Message& msg) {
    return std::visit([](const auto& m) -> const Uint256& { return m.amount; }, msg);
}

uint64_t messageNonce(const Message& msg) {
    return std::visit([](const auto& m) { return m.nonce; }, msg);
}

std::optional<Bytes20> messageToken(const Message& msg) {
    if (auto* token = std::get_if<SendToken>(&msg))
        return token->token;
    return std::nullopt;
}

std::string toString(MessageTag tag) {
    switch (tag) {
        case MessageTag::SendNative: return "SendNative";
        case MessageTag::SendToken: return "SendToken";
    }
    return "MessageTag(" + std::to_string(static_cast<int>(tag)) + ")";
}

std::string toString(const Message& msg) {
    return std::visit(overloaded{
        [](const SendNative& m) {
            return "SendNative{sender: " + hex_0x(m.sender) +
                   ", recipient: " + hex_0x(m.recipient) +
                   ", amount: " + utils::uint256ToDecimal(m.amount) +
                   ", nonce: " + std::to_string(m.nonce) + "}";
        },
        [](const SendToken& m) {
            return "SendToken{sender: " + hex_0x(m.sender) +
                   ", recipient: " + hex_0x(m.recipient) +
                   ", token: " + hex_0x(m.token) +
                   ", amount: " + utils::uint256ToDecimal(m.amount) +
                   ", nonce: " + std::to_string(m.nonce) + "}";
        }},
        msg);
}
}  // namespace ethbridge
