// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_FACTORY_LOCKBOX_LINKER_H
#define XFACTORY_FACTORY_LOCKBOX_LINKER_H

#include <chain/world_state.h>
#include <uint256.h>

namespace xerc20 {
class XERC20Token;
}

namespace factory {

/**
 * Register `lockbox` as the token's active lockbox, replacing any
 * previous link. ctx must carry the token owner as sender.
 *
 * The lockbox's own token reference is not checked against `token`;
 * callers link a lockbox right after creating it for that token.
 */
void LinkLockbox(const chain::ExecutionContext& ctx, xerc20::XERC20Token& token, const uint160& lockbox);

} // namespace factory

#endif // XFACTORY_FACTORY_LOCKBOX_LINKER_H
