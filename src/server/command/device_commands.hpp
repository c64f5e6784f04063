#ifndef SIMDECK_SERVER_DEVICE_COMMANDS_HPP
#define SIMDECK_SERVER_DEVICE_COMMANDS_HPP

#include "server/command.hpp"

namespace simdeck::server {

/**
 * @brief devices.list, simulator.boot, simulator.shutdown and state
 */
void registerDeviceCommands(CommandDispatcher& dispatcher);

}  // namespace simdeck::server

#endif  // SIMDECK_SERVER_DEVICE_COMMANDS_HPP
