// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chain/world_state.h>
#include <util.h>

#include <stdexcept>

namespace chain {

// ============================================================================
// WorldState
// ============================================================================

void LogCommittedCombiner::LogSubscriberFailure(const std::exception& e)
{
    LogPrintf("WorldState: LogCommitted subscriber failed: %s\n", e.what());
}

WorldState::WorldState(uint64_t chainId)
    : chainId_(chainId)
    , inAtomicOperation_(false)
{
}

WorldState::~WorldState()
{
    if (inAtomicOperation_) {
        LogPrintf("WorldState: Warning - destroying with pending atomic operation\n");
    }
}

bool WorldState::AccountExists(const uint160& address) const
{
    LOCK(cs_world);
    if (inAtomicOperation_ && pendingContracts_.count(address) > 0) {
        return true;
    }
    return contracts_.count(address) > 0;
}

void WorldState::CreateContract(std::unique_ptr<Contract> contract)
{
    LOCK(cs_world);
    CheckInAtomicOperation("CreateContract");

    const uint160 address = contract->GetAddress();
    if (AccountExists(address)) {
        LogPrint(BCLog::CHAIN, "WorldState: Rejected %s at occupied address %s\n",
                 ContractTypeToString(contract->GetType()), address.ToString());
        throw Revert(RevertCode::DEPLOYMENT_COLLISION,
                     "contract already deployed at " + address.ToString());
    }

    LogPrint(BCLog::CHAIN, "WorldState: Created %s at %s (chain %d)\n",
             ContractTypeToString(contract->GetType()), address.ToString(), chainId_);
    pendingContracts_[address] = std::move(contract);
}

void WorldState::EmitLog(const LogEntry& log)
{
    LOCK(cs_world);
    CheckInAtomicOperation("EmitLog");
    pendingLogs_.push_back(log);
}

std::vector<LogEntry> WorldState::GetLogs() const
{
    LOCK(cs_world);
    return logs_;
}

std::vector<LogEntry> WorldState::GetLogs(const uint160& emitter) const
{
    LOCK(cs_world);
    std::vector<LogEntry> result;
    for (const LogEntry& log : logs_) {
        if (log.contractAddress == emitter) {
            result.push_back(log);
        }
    }
    return result;
}

size_t WorldState::GetContractCount() const
{
    LOCK(cs_world);
    return contracts_.size();
}

bool WorldState::IsInAtomicOperation() const
{
    LOCK(cs_world);
    return inAtomicOperation_;
}

std::shared_ptr<Contract> WorldState::FindContract(const uint160& address) const
{
    if (inAtomicOperation_) {
        auto pending = pendingContracts_.find(address);
        if (pending != pendingContracts_.end()) {
            return pending->second;
        }
    }
    auto it = contracts_.find(address);
    if (it != contracts_.end()) {
        return it->second;
    }
    return nullptr;
}

Contract* WorldState::FindContractForWrite(const uint160& address)
{
    CheckInAtomicOperation("GetContractForWrite");

    auto pending = pendingContracts_.find(address);
    if (pending != pendingContracts_.end()) {
        return pending->second.get();
    }

    auto it = contracts_.find(address);
    if (it == contracts_.end()) {
        return nullptr;
    }

    // Copy on first write so a rollback leaves the committed contract untouched
    std::shared_ptr<Contract> copy(it->second->Clone());
    pendingContracts_[address] = copy;
    return copy.get();
}

void WorldState::CheckInAtomicOperation(const char* action) const
{
    if (!inAtomicOperation_) {
        throw std::logic_error(std::string("WorldState: ") + action + " outside an atomic operation");
    }
}

void WorldState::BeginAtomicOperation()
{
    LOCK(cs_world);
    if (inAtomicOperation_) {
        throw std::logic_error("WorldState: nested atomic operation");
    }
    inAtomicOperation_ = true;
    pendingContracts_.clear();
    pendingLogs_.clear();
}

std::vector<LogEntry> WorldState::CommitAtomicOperation()
{
    LOCK(cs_world);
    CheckInAtomicOperation("Commit");

    for (auto& entry : pendingContracts_) {
        contracts_[entry.first] = std::move(entry.second);
    }
    logs_.insert(logs_.end(), pendingLogs_.begin(), pendingLogs_.end());

    LogPrint(BCLog::CHAIN, "WorldState: Committed %u contract writes, %u logs\n",
             pendingContracts_.size(), pendingLogs_.size());

    std::vector<LogEntry> committed;
    committed.swap(pendingLogs_);
    pendingContracts_.clear();
    inAtomicOperation_ = false;
    return committed;
}

void WorldState::NotifyCommitted(const std::vector<LogEntry>& logs)
{
    for (const LogEntry& log : logs) {
        LogCommitted(log);
    }
}

void WorldState::RollbackAtomicOperation()
{
    LOCK(cs_world);
    if (!inAtomicOperation_) {
        return;
    }

    LogPrint(BCLog::CHAIN, "WorldState: Rolled back %u contract writes, %u logs\n",
             pendingContracts_.size(), pendingLogs_.size());

    pendingContracts_.clear();
    pendingLogs_.clear();
    inAtomicOperation_ = false;
}

// ============================================================================
// AtomicOperation
// ============================================================================

AtomicOperation::AtomicOperation(WorldState& world)
    : world_(world)
    , lock_(world.cs_world)
    , finished_(false)
{
    world_.BeginAtomicOperation();
}

AtomicOperation::~AtomicOperation()
{
    if (!finished_) {
        world_.RollbackAtomicOperation();
    }
}

std::vector<LogEntry> AtomicOperation::Commit()
{
    if (finished_) {
        throw std::logic_error("AtomicOperation: already committed");
    }
    finished_ = true;
    std::vector<LogEntry> committed = world_.CommitAtomicOperation();

    // Subscribers run outside the world lock
    lock_.unlock();
    world_.NotifyCommitted(committed);
    return committed;
}

// ============================================================================
// ExecutionContext
// ============================================================================

void ExecutionContext::EmitLog(const uint160& emitter, const std::vector<uint256>& topics,
                               const std::vector<uint8_t>& data) const
{
    LogEntry log;
    log.contractAddress = emitter;
    log.topics = topics;
    log.data = data;
    world_.EmitLog(log);
}

} // namespace chain
