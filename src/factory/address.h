// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_FACTORY_ADDRESS_H
#define XFACTORY_FACTORY_ADDRESS_H

/**
 * @file address.h
 * @brief Deterministic contract address derivation
 *
 * Addresses depend only on the deployer address, a 32-byte salt and the
 * init code (creation bytecode plus constructor arguments). Nothing
 * read from mutable chain state (height, nonces) enters the result, so
 * a factory deployed at the same address on several chains produces the
 * same contract addresses on all of them.
 */

#include <uint256.h>

#include <string>
#include <vector>

namespace factory {

/** Prefix byte separating CREATE2 preimages from other hashed data */
static constexpr uint8_t CREATE2_PREFIX = 0xff;

/**
 * Token salt: the owner's 20 bytes in the high-order bytes followed by
 * the 12-byte discriminator in the low-order bytes.
 */
uint256 MakeTokenSalt(const uint160& owner, const uint96& discriminator);

/**
 * Lockbox salt: hash of the packed (token, baseAsset, isNative) triple.
 * There is no owner component.
 */
uint256 MakeLockboxSalt(const uint160& token, const uint160& baseAsset, bool isNative);

/**
 * Generate contract address using CREATE2
 * address = Hash(0xff ++ deployer ++ salt ++ Hash(init_code))[12:]
 */
uint160 ComputeCreate2Address(const uint160& deployer, const uint256& salt,
                              const std::vector<unsigned char>& initCode);

/** Address of the token a factory creates for (owner, discriminator, name, symbol) */
uint160 ComputeTokenAddress(const uint160& factory, const uint160& owner, const uint96& discriminator,
                            const std::string& name, const std::string& symbol);

/** Address of the lockbox a factory creates for (token, baseAsset, isNative) */
uint160 ComputeLockboxAddress(const uint160& factory, const uint160& token,
                              const uint160& baseAsset, bool isNative);

} // namespace factory

#endif // XFACTORY_FACTORY_ADDRESS_H
