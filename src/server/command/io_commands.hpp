#ifndef SIMDECK_SERVER_IO_COMMANDS_HPP
#define SIMDECK_SERVER_IO_COMMANDS_HPP

#include <string>

#include "server/command.hpp"

namespace simdeck::server {

/**
 * @brief screenshot.capture and io.tap/text/swipe/button
 */
void registerIoCommands(CommandDispatcher& dispatcher);

/**
 * @brief "/tmp/screenshot-<stamp>.png", or ".jpg" for jpeg
 */
[[nodiscard]] auto defaultScreenshotPath(device::ImageFormat format)
    -> std::string;

}  // namespace simdeck::server

#endif  // SIMDECK_SERVER_IO_COMMANDS_HPP
