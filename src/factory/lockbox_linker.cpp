// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <factory/lockbox_linker.h>

#include <util.h>
#include <xerc20/token.h>

namespace factory {

void LinkLockbox(const chain::ExecutionContext& ctx, xerc20::XERC20Token& token, const uint160& lockbox)
{
    const uint160 previous = token.GetLockbox();
    token.SetLockbox(ctx, lockbox);

    if (!previous.IsNull() && previous != lockbox) {
        LogPrint(BCLog::FACTORY, "Token %s: lockbox %s replaced by %s\n",
                 token.GetAddress().ToString(), previous.ToString(), lockbox.ToString());
    } else {
        LogPrint(BCLog::FACTORY, "Token %s: linked lockbox %s\n",
                 token.GetAddress().ToString(), lockbox.ToString());
    }
}

} // namespace factory
