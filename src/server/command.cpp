#include "command.hpp"

#include <spdlog/spdlog.h>

#include "command/app_commands.hpp"
#include "command/device_commands.hpp"
#include "command/io_commands.hpp"

namespace simdeck::server {

namespace {

const std::map<std::string, std::string>& singleWordAliases() {
    static const std::map<std::string, std::string> aliases{
        {"devices", "devices.list"},
        {"state", "state"},
        {"screenshot", "screenshot.capture"},
    };
    return aliases;
}

}  // namespace

void CommandDispatcher::registerCommand(const CommandID& id,
                                        CommandHandler handler) {
    handlers_[id] = std::move(handler);
    spdlog::trace("Registered command handler for '{}'", id);
}

auto CommandDispatcher::hasCommand(const CommandID& id) const -> bool {
    return handlers_.contains(id);
}

auto CommandDispatcher::resolve(const std::vector<std::string>& path) const
    -> std::optional<CommandID> {
    if (path.size() == 1) {
        const auto& aliases = singleWordAliases();
        if (auto it = aliases.find(path.front());
            it != aliases.end() && hasCommand(it->second)) {
            return it->second;
        }
        return std::nullopt;
    }
    if (path.size() == 2) {
        auto id = path[0] + "." + path[1];
        if (hasCommand(id)) {
            return id;
        }
    }
    return std::nullopt;
}

auto CommandDispatcher::dispatch(const CommandID& id,
                                 const CommandContext& context) const
    -> Envelope {
    auto it = handlers_.find(id);
    if (it == handlers_.end()) {
        return Envelope::makeError(
            id, device::error::internalError("Unknown command: " + id));
    }

    spdlog::debug("Dispatching '{}'", id);
    auto outcome = device::tryExecute(
        [&]() -> device::DeviceResult<json> { return it->second(context); });
    if (!outcome) {
        spdlog::debug("'{}' failed with {}", id,
                      device::deviceErrorCodeToString(outcome.error().code));
        return Envelope::makeError(id, std::move(outcome.error()));
    }
    return Envelope::makeSuccess(id, std::move(*outcome));
}

auto CommandDispatcher::getCommands() const -> std::vector<CommandID> {
    std::vector<CommandID> ids;
    ids.reserve(handlers_.size());
    for (const auto& [id, handler] : handlers_) {
        ids.push_back(id);
    }
    return ids;
}

void registerAllCommands(CommandDispatcher& dispatcher) {
    registerDeviceCommands(dispatcher);
    registerIoCommands(dispatcher);
    registerAppCommands(dispatcher);
}

}  // namespace simdeck::server
