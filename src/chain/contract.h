// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_CHAIN_CONTRACT_H
#define XFACTORY_CHAIN_CONTRACT_H

#include <uint256.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chain {

/**
 * Kinds of contract the world state can hold
 */
enum class ContractType : uint8_t {
    XERC20_TOKEN = 0x01,
    XERC20_LOCKBOX = 0x02,
};

std::string ContractTypeToString(ContractType type);

/**
 * Event log entry. topics[0] is the hash of the event signature,
 * data holds the ABI-encoded non-indexed arguments.
 */
struct LogEntry {
    uint160 contractAddress;
    std::vector<uint256> topics;
    std::vector<uint8_t> data;

    bool operator==(const LogEntry& other) const {
        return contractAddress == other.contractAddress &&
               topics == other.topics &&
               data == other.data;
    }

    bool operator!=(const LogEntry& other) const {
        return !(*this == other);
    }
};

/**
 * Compute the topic identifying an event, e.g. EventTopic("TokenDeployed(address)")
 */
uint256 EventTopic(const std::string& signature);

/**
 * Contract deployed in the world state.
 *
 * Instances are copied on first write inside an atomic operation, so
 * every subclass must implement Clone() returning a full copy of its
 * state.
 */
class Contract {
public:
    Contract(const uint160& address, const uint256& codeHash);
    virtual ~Contract() {}

    /** Address the contract was created at */
    const uint160& GetAddress() const { return address_; }

    /** Hash of the init code the contract was created from */
    const uint256& GetCodeHash() const { return codeHash_; }

    virtual ContractType GetType() const = 0;

    virtual std::unique_ptr<Contract> Clone() const = 0;

protected:
    Contract(const Contract&) = default;
    Contract& operator=(const Contract&) = delete;

private:
    uint160 address_;
    uint256 codeHash_;
};

} // namespace chain

#endif // XFACTORY_CHAIN_CONTRACT_H
