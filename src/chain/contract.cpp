// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <chain/contract.h>
#include <hash.h>

namespace chain {

std::string ContractTypeToString(ContractType type)
{
    switch (type) {
        case ContractType::XERC20_TOKEN: return "xerc20-token";
        case ContractType::XERC20_LOCKBOX: return "xerc20-lockbox";
    }
    return "unknown";
}

uint256 EventTopic(const std::string& signature)
{
    CHashWriter ss;
    ss << signature;
    return ss.GetHash();
}

Contract::Contract(const uint160& address, const uint256& codeHash)
    : address_(address)
    , codeHash_(codeHash)
{
}

} // namespace chain
