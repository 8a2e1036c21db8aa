// logs.hpp
#pragma once

#include <string>
#include <vector>
#include <optional>
#include <span>
#include <cstdint>

#include <nlohmann/json_fwd.hpp>

#include "utils.hpp"

namespace ethbridge
{
/// A log as reported by a JSON-RPC node (`eth_getLogs`, receipts), fields still in hex.
struct LogEntry {
    std::string address; // Address from which this log originated
    std::vector<std::string> topics; // Array of 0-4 32-byte data of indexed log arguments
    std::string data; // One or more 32-byte non-indexed arguments of the log
    std::optional<uint64_t> blockNumber; // Block number where this log was in (optional)
    std::optional<std::string> transactionHash; // Hash of the transaction this log was created from (optional)
    std::optional<uint32_t> transactionIndex; // Index of the transaction in the block (optional)
    std::optional<std::string> blockHash; // Hash of the block where this log was in (optional)
    std::optional<uint32_t> logIndex; // Index of the log in the block (optional)
    bool removed = false; // True if log was removed due to a chain reorganization
};

/// Builds a LogEntry from one element of an `eth_getLogs` result array.  Throws on missing or
/// malformed fields.
LogEntry parseLogEntry(const nlohmann::json& logJson);

/// A log record in binary form, as it appears inside a transaction receipt.
struct Log {
    Bytes20 address = {};
    std::vector<Bytes32> topics;
    std::vector<unsigned char> data;

    bool operator==(const Log&) const = default;

    /// Reconstructs a log from its receipt RLP encoding `[address, [topic, ...], data]`.  Throws
    /// `rlp::Error` if the encoding is malformed or the fields have the wrong widths.
    static Log fromRlp(std::span<const unsigned char> encoded);

    /// Converts the hex fields of a JSON-RPC log.  Throws `std::invalid_argument` if any field is
    /// not hex of the expected width.
    static Log fromLogEntry(const LogEntry& entry);
};
}  // namespace ethbridge
