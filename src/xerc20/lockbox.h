// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_XERC20_LOCKBOX_H
#define XFACTORY_XERC20_LOCKBOX_H

#include <chain/contract.h>
#include <uint256.h>

#include <memory>
#include <vector>

namespace xerc20 {

/**
 * Custody contract holding a base asset 1:1 against an XERC20 token.
 *
 * The base asset is either an ERC20 (baseAsset set, isNative false) or
 * the chain's native gas asset (baseAsset null, isNative true). All
 * fields are fixed at construction; deposit/withdraw accounting is not
 * modelled.
 */
class XERC20Lockbox : public chain::Contract {
public:
    XERC20Lockbox(const uint160& address, const uint160& token,
                  const uint160& baseAsset, bool isNative);

    /** Fingerprint of the lockbox's creation bytecode */
    static const std::vector<unsigned char>& CreationCode();

    /** Creation bytecode followed by the ABI-encoded constructor arguments */
    static std::vector<unsigned char> InitCode(const uint160& token, const uint160& baseAsset, bool isNative);

    chain::ContractType GetType() const override { return chain::ContractType::XERC20_LOCKBOX; }
    std::unique_ptr<chain::Contract> Clone() const override;

    const uint160& GetToken() const { return token_; }
    const uint160& GetBaseAsset() const { return baseAsset_; }
    bool IsNative() const { return isNative_; }

private:
    const uint160 token_;
    const uint160 baseAsset_;
    const bool isNative_;
};

} // namespace xerc20

#endif // XFACTORY_XERC20_LOCKBOX_H
