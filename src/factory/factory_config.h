// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_FACTORY_CONFIG_H
#define XFACTORY_FACTORY_CONFIG_H

/**
 * @file factory_config.h
 * @brief Factory configuration and initialization
 *
 * Reads the factory options from gArgs (command line and config file)
 * and applies the logging options.
 */

#include <chain/world_state.h>
#include <factory/factory.h>
#include <uint256.h>

#include <cstdint>
#include <memory>
#include <string>

namespace factory {

/**
 * Default factory address. Integrators must deploy the factory at the
 * same address on every chain; this default only serves local setups.
 */
static const char* const DEFAULT_FACTORY_ADDRESS = "0x000000000000000000000000000000000000fac7";
static const int64_t DEFAULT_CHAIN_ID = 1;

/**
 * Get factory help message for command-line options
 * @return Help message string
 */
std::string GetFactoryHelpMessage();

/**
 * Initialize factory configuration from gArgs
 * Validates -factoryaddress and -chainid and configures logging
 * (-debug, -printtoconsole, -logtimestamps, -debuglogfile).
 * @return true if initialization successful; error is set otherwise
 */
bool InitFactoryConfig(std::string& error);

/** Factory address configured by InitFactoryConfig */
uint160 GetConfiguredFactoryAddress();

/** Chain id configured by InitFactoryConfig */
uint64_t GetConfiguredChainId();

/** Empty world state for the configured chain id */
std::unique_ptr<chain::WorldState> CreateConfiguredWorldState();

/**
 * Factory at the configured address on `world`. The address must be the
 * same on every chain for deployments to land at identical addresses.
 */
std::unique_ptr<XERC20Factory> CreateConfiguredFactory(chain::WorldState& world);

} // namespace factory

#endif // XFACTORY_FACTORY_CONFIG_H
