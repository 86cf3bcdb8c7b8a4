// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_CHAIN_WORLD_STATE_H
#define XFACTORY_CHAIN_WORLD_STATE_H

/**
 * @file world_state.h
 * @brief Address space of deployed contracts and its transaction boundary
 *
 * The world state plays the role of the execution environment for the
 * factory: it owns every deployed contract, admits new contracts
 * exclusively by address, and records event logs. All changes happen
 * inside an AtomicOperation; a failed operation leaves no trace.
 */

#include <chain/contract.h>
#include <chain/revert.h>
#include <sync.h>
#include <uint256.h>

#include <boost/signals2/signal.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace chain {

class AtomicOperation;

/**
 * Signal combiner that delivers to every slot. A slot throwing
 * std::exception is logged and skipped; the remaining slots still run.
 */
struct LogCommittedCombiner
{
    typedef void result_type;

    template<typename InputIterator>
    void operator()(InputIterator first, InputIterator last) const
    {
        for (; first != last; ++first) {
            try {
                *first;
            } catch (const std::exception& e) {
                LogSubscriberFailure(e);
            }
        }
    }

private:
    static void LogSubscriberFailure(const std::exception& e);
};

/**
 * @brief Deployed contracts and committed logs of one chain
 *
 * Writes made inside an atomic operation go to a pending overlay:
 * created contracts, copies of modified contracts and emitted logs.
 * Commit publishes the overlay, rollback drops it. The world lock is
 * held for the lifetime of the atomic operation, so operations are
 * fully serialized.
 *
 * Thread-safe for concurrent access.
 */
class WorldState {
public:
    explicit WorldState(uint64_t chainId);
    ~WorldState();

    WorldState(const WorldState&) = delete;
    WorldState& operator=(const WorldState&) = delete;

    uint64_t GetChainId() const { return chainId_; }

    /**
     * @brief Check whether an address is occupied by a contract
     *
     * Inside an atomic operation, contracts created by that operation
     * count as existing.
     */
    bool AccountExists(const uint160& address) const;

    /**
     * @brief Admit a new contract at its address
     * @throws Revert DEPLOYMENT_COLLISION if the address is occupied
     * @throws std::logic_error outside an atomic operation
     */
    void CreateContract(std::unique_ptr<Contract> contract);

    /**
     * @brief Read-only view of a contract
     * @return nullptr if no contract of type T exists at the address
     */
    template <typename T>
    std::shared_ptr<const T> GetContract(const uint160& address) const
    {
        LOCK(cs_world);
        return std::dynamic_pointer_cast<const T>(FindContract(address));
    }

    /**
     * @brief Writable contract within the current atomic operation
     *
     * The first call for an address copies the committed contract into
     * the pending overlay; the reference stays valid until the
     * operation ends.
     *
     * @throws Revert CONTRACT_NOT_FOUND if no contract of type T exists
     * @throws std::logic_error outside an atomic operation
     */
    template <typename T>
    T& GetContractForWrite(const uint160& address)
    {
        LOCK(cs_world);
        T* contract = dynamic_cast<T*>(FindContractForWrite(address));
        if (!contract) {
            throw Revert(RevertCode::CONTRACT_NOT_FOUND,
                         "no contract of the requested type at " + address.ToString());
        }
        return *contract;
    }

    /**
     * @brief Record a log entry in the current atomic operation
     * @throws std::logic_error outside an atomic operation
     */
    void EmitLog(const LogEntry& log);

    /** Committed logs, in emission order */
    std::vector<LogEntry> GetLogs() const;

    /** Committed logs emitted by one contract, in emission order */
    std::vector<LogEntry> GetLogs(const uint160& emitter) const;

    /** Number of committed contracts */
    size_t GetContractCount() const;

    bool IsInAtomicOperation() const;

    /**
     * Fired for every log entry once its atomic operation commits, after
     * the world lock is released. Subscriber failures do not affect the
     * committed state.
     */
    boost::signals2::signal<void (const LogEntry&), LogCommittedCombiner> LogCommitted;

private:
    friend class AtomicOperation;

    void BeginAtomicOperation();
    std::vector<LogEntry> CommitAtomicOperation();
    void RollbackAtomicOperation();
    void NotifyCommitted(const std::vector<LogEntry>& logs);

    std::shared_ptr<Contract> FindContract(const uint160& address) const;
    Contract* FindContractForWrite(const uint160& address);
    void CheckInAtomicOperation(const char* action) const;

    const uint64_t chainId_;

    mutable CCriticalSection cs_world;

    std::map<uint160, std::shared_ptr<Contract>> contracts_;
    std::vector<LogEntry> logs_;

    // Atomic operation state
    bool inAtomicOperation_;
    std::map<uint160, std::shared_ptr<Contract>> pendingContracts_;
    std::vector<LogEntry> pendingLogs_;
};

/**
 * @brief RAII transaction boundary over a WorldState
 *
 * Takes the world lock and begins an atomic operation. Commit()
 * publishes the pending changes; destruction without Commit() rolls
 * them back.
 */
class AtomicOperation {
public:
    explicit AtomicOperation(WorldState& world);
    ~AtomicOperation();

    AtomicOperation(const AtomicOperation&) = delete;
    AtomicOperation& operator=(const AtomicOperation&) = delete;

    /**
     * Publish pending changes, release the world lock and notify
     * LogCommitted subscribers. Returns the logs emitted by this operation.
     */
    std::vector<LogEntry> Commit();

private:
    WorldState& world_;
    std::unique_lock<CCriticalSection> lock_;
    bool finished_;
};

/**
 * @brief Message context a contract function executes under
 *
 * Carries the immediate caller (the message sender) and gives contract
 * code access to the world state for log emission.
 */
class ExecutionContext {
public:
    ExecutionContext(WorldState& world, const uint160& sender)
        : world_(world), sender_(sender) {}

    const uint160& GetSender() const { return sender_; }
    WorldState& GetWorld() const { return world_; }

    /** Record a log entry emitted by `emitter` */
    void EmitLog(const uint160& emitter, const std::vector<uint256>& topics,
                 const std::vector<uint8_t>& data) const;

private:
    WorldState& world_;
    uint160 sender_;
};

} // namespace chain

#endif // XFACTORY_CHAIN_WORLD_STATE_H
