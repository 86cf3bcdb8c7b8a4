// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <factory/factory_config.h>

#include <util.h>
#include <utilstrencodings.h>

#include <atomic>
#include <mutex>

namespace factory {

static std::mutex cs_config;
static uint160 g_factory_address = uint160S(DEFAULT_FACTORY_ADDRESS);
static std::atomic<uint64_t> g_chain_id{(uint64_t)DEFAULT_CHAIN_ID};

std::string GetFactoryHelpMessage()
{
    std::string strUsage = HelpMessageGroup("Factory options:");
    strUsage += HelpMessageOpt("-factoryaddress=<hex>",
        strprintf("Address the factory is deployed at; must match on every chain (default: %s)", DEFAULT_FACTORY_ADDRESS));
    strUsage += HelpMessageOpt("-chainid=<n>",
        strprintf("Chain id of the local world state (default: %d)", DEFAULT_CHAIN_ID));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>",
        "Output debugging information (default: 0). If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-printtoconsole",
        strprintf("Send trace/debug info to console instead of the debug log file (default: %u)", DEFAULT_PRINTTOCONSOLE));
    strUsage += HelpMessageOpt("-logtimestamps",
        strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-debuglogfile=<file>",
        strprintf("Specify location of debug log file (default: %s)", DEFAULT_DEBUGLOGFILE));
    return strUsage;
}

static bool InitLogging(std::string& error)
{
    g_logger->m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    g_logger->m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    for (const std::string& category : gArgs.GetArgs("-debug")) {
        if (!g_logger->EnableCategory(category)) {
            error = strprintf("Unsupported logging category -debug=%s", category);
            return false;
        }
    }

    g_logger->m_print_to_file = false;
    if (!g_logger->m_print_to_console) {
        g_logger->m_file_path = fs::absolute(gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE));
        g_logger->m_print_to_file = true;
        if (!g_logger->OpenDebugLog()) {
            error = strprintf("Could not open debug log file %s", g_logger->m_file_path.string());
            return false;
        }
    }
    return true;
}

bool InitFactoryConfig(std::string& error)
{
    if (!InitLogging(error)) {
        return false;
    }

    std::string addressArg = gArgs.GetArg("-factoryaddress", DEFAULT_FACTORY_ADDRESS);
    std::string hex = addressArg;
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (!IsHex(hex) || hex.size() != 2 * uint160::size()) {
        error = strprintf("Invalid -factoryaddress '%s': expected 40 hex digits", addressArg);
        return false;
    }
    uint160 factoryAddress = uint160S(hex);
    if (factoryAddress.IsNull()) {
        error = "Invalid -factoryaddress: the zero address cannot host the factory";
        return false;
    }

    int64_t chainId = gArgs.GetArg("-chainid", DEFAULT_CHAIN_ID);
    if (chainId <= 0) {
        error = strprintf("Invalid -chainid %d: must be positive", chainId);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(cs_config);
        g_factory_address = factoryAddress;
    }
    g_chain_id = (uint64_t)chainId;

    LogPrint(BCLog::CONFIG, "Factory configured at %s on chain %d\n", factoryAddress.ToString(), chainId);
    return true;
}

uint160 GetConfiguredFactoryAddress()
{
    std::lock_guard<std::mutex> lock(cs_config);
    return g_factory_address;
}

uint64_t GetConfiguredChainId()
{
    return g_chain_id;
}

std::unique_ptr<chain::WorldState> CreateConfiguredWorldState()
{
    const uint64_t chainId = GetConfiguredChainId();
    LogPrint(BCLog::CONFIG, "Creating world state for chain %d\n", chainId);
    return std::make_unique<chain::WorldState>(chainId);
}

std::unique_ptr<XERC20Factory> CreateConfiguredFactory(chain::WorldState& world)
{
    const uint160 address = GetConfiguredFactoryAddress();
    LogPrint(BCLog::CONFIG, "Creating factory at %s on chain %d\n", address.ToString(), world.GetChainId());
    return std::make_unique<XERC20Factory>(world, address);
}

} // namespace factory
