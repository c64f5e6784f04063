#ifndef SIMDECK_SERVER_APP_COMMANDS_HPP
#define SIMDECK_SERVER_APP_COMMANDS_HPP

#include "server/command.hpp"

namespace simdeck::server {

/**
 * @brief app.launch, app.terminate and app.install
 */
void registerAppCommands(CommandDispatcher& dispatcher);

}  // namespace simdeck::server

#endif  // SIMDECK_SERVER_APP_COMMANDS_HPP
