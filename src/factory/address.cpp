// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <factory/address.h>

#include <hash.h>
#include <util.h>
#include <xerc20/lockbox.h>
#include <xerc20/token.h>

#include <algorithm>

namespace factory {

uint256 MakeTokenSalt(const uint160& owner, const uint96& discriminator)
{
    uint256 salt;
    std::copy(owner.begin(), owner.end(), salt.begin());
    std::copy(discriminator.begin(), discriminator.end(), salt.begin() + owner.size());
    return salt;
}

uint256 MakeLockboxSalt(const uint160& token, const uint160& baseAsset, bool isNative)
{
    CHashWriter hasher;
    hasher << token << baseAsset << isNative;
    return hasher.GetHash();
}

uint160 ComputeCreate2Address(const uint160& deployer, const uint256& salt,
                              const std::vector<unsigned char>& initCode)
{
    CHashWriter hasher;
    hasher << CREATE2_PREFIX << deployer << salt << Hash(initCode);
    uint256 hash = hasher.GetHash();

    // Take the last 160 bits (20 bytes) of the hash
    uint160 contractAddr;
    std::copy(hash.end() - contractAddr.size(), hash.end(), contractAddr.begin());

    LogPrint(BCLog::FACTORY, "Generated CREATE2 address %s from deployer %s salt %s\n",
             contractAddr.ToString(), deployer.ToString(), salt.ToString());

    return contractAddr;
}

uint160 ComputeTokenAddress(const uint160& factory, const uint160& owner, const uint96& discriminator,
                            const std::string& name, const std::string& symbol)
{
    return ComputeCreate2Address(factory, MakeTokenSalt(owner, discriminator),
                                 xerc20::XERC20Token::InitCode(name, symbol, factory));
}

uint160 ComputeLockboxAddress(const uint160& factory, const uint160& token,
                              const uint160& baseAsset, bool isNative)
{
    return ComputeCreate2Address(factory, MakeLockboxSalt(token, baseAsset, isNative),
                                 xerc20::XERC20Lockbox::InitCode(token, baseAsset, isNative));
}

} // namespace factory
