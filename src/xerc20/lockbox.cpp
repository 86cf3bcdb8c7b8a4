// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <xerc20/lockbox.h>

#include <chain/abi.h>
#include <hash.h>

#include <string>

namespace xerc20 {

XERC20Lockbox::XERC20Lockbox(const uint160& address, const uint160& token,
                             const uint160& baseAsset, bool isNative)
    : chain::Contract(address, Hash(InitCode(token, baseAsset, isNative)))
    , token_(token)
    , baseAsset_(baseAsset)
    , isNative_(isNative)
{
}

const std::vector<unsigned char>& XERC20Lockbox::CreationCode()
{
    static const std::string tag = "XERC20/lockbox/v1";
    static const std::vector<unsigned char> code(tag.begin(), tag.end());
    return code;
}

std::vector<unsigned char> XERC20Lockbox::InitCode(const uint160& token, const uint160& baseAsset, bool isNative)
{
    std::vector<unsigned char> initCode = CreationCode();
    std::vector<unsigned char> args = chain::AbiEncoder()
        .Address(token)
        .Address(baseAsset)
        .Bool(isNative)
        .Encode();
    initCode.insert(initCode.end(), args.begin(), args.end());
    return initCode;
}

std::unique_ptr<chain::Contract> XERC20Lockbox::Clone() const
{
    return std::make_unique<XERC20Lockbox>(*this);
}

} // namespace xerc20
