#include "ethbridge/logs.hpp"
#include "ethbridge/rlp.hpp"
#include "ethbridge/utils.hpp"

#pragma GCC diagnostic push
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#include <nlohmann/json.hpp>
#pragma GCC diagnostic pop

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace ethbridge
{
LogEntry parseLogEntry(const nlohmann::json& logJson) {
    LogEntry logEntry;
    logEntry.address = logJson.contains("address") ? logJson["address"].get<std::string>() : "";

    if (logJson.contains("topics")) {
        for (const auto& topic : logJson["topics"]) {
            logEntry.topics.push_back(topic.get<std::string>());
        }
    }

    logEntry.data = logJson.contains("data") ? logJson["data"].get<std::string>() : "";
    logEntry.blockNumber = logJson.contains("blockNumber") ? std::make_optional(utils::hexStringToU64(logJson["blockNumber"].get<std::string>())) : std::nullopt;
    logEntry.transactionHash = logJson.contains("transactionHash") ? std::make_optional(logJson["transactionHash"].get<std::string>()) : std::nullopt;
    logEntry.blockHash = logJson.contains("blockHash") ? std::make_optional(logJson["blockHash"].get<std::string>()) : std::nullopt;

    if (logJson.contains("transactionIndex"))
    {
        uint64_t tx_index = utils::hexStringToU64(logJson["transactionIndex"].get<std::string>());
        if (tx_index > std::numeric_limits<uint32_t>::max())
            throw std::runtime_error{"Error transactionIndex element > uint32_t max"};
        logEntry.transactionIndex = static_cast<uint32_t>(tx_index);
    }

    if (logJson.contains("logIndex"))
    {
        uint64_t log_index = utils::hexStringToU64(logJson["logIndex"].get<std::string>());
        if (log_index > std::numeric_limits<uint32_t>::max())
            throw std::runtime_error{"Error logIndex element > uint32_t max"};
        logEntry.logIndex = static_cast<uint32_t>(log_index);
    }

    logEntry.removed = logJson.contains("removed") ? logJson["removed"].get<bool>() : false;
    return logEntry;
}

Log Log::fromRlp(std::span<const unsigned char> encoded) {
    auto fields = rlp::decodeList(rlp::decodeSingle(encoded));
    if (fields.size() != 3)
        throw rlp::Error{"log must be a list of 3 items, got " + std::to_string(fields.size())};

    Log result;
    auto address = rlp::expectString(fields[0]);
    if (address.size() != result.address.size())
        throw rlp::Error{"log address must be 20 bytes, got " + std::to_string(address.size())};
    std::copy(address.begin(), address.end(), result.address.begin());

    for (const auto& item : rlp::decodeList(fields[1])) {
        auto topic = rlp::expectString(item);
        if (topic.size() != sizeof(Bytes32))
            throw rlp::Error{"log topic must be 32 bytes, got " + std::to_string(topic.size())};
        Bytes32& dst = result.topics.emplace_back();
        std::copy(topic.begin(), topic.end(), dst.begin());
    }

    auto data = rlp::expectString(fields[2]);
    result.data.assign(data.begin(), data.end());
    return result;
}

Log Log::fromLogEntry(const LogEntry& entry) {
    Log result;
    result.address = utils::fromHexString20Byte(entry.address);
    result.topics.reserve(entry.topics.size());
    for (const auto& topic : entry.topics)
        result.topics.push_back(utils::fromHexString32Byte(topic));
    result.data = utils::fromHexString(entry.data);
    return result;
}
}  // namespace ethbridge
