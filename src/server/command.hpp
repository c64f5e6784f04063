#ifndef SIMDECK_SERVER_COMMAND_HPP
#define SIMDECK_SERVER_COMMAND_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cli/command_line.hpp"
#include "config/config_loader.hpp"
#include "device/bridge/remote_bridge.hpp"
#include "device/manager/lifecycle_manager.hpp"
#include "envelope.hpp"
#include "utils/process/process_runner.hpp"

namespace simdeck::server {

/**
 * @brief Everything a command handler may use for one invocation
 */
struct CommandContext {
    const config::SimdeckConfig& config;
    const cli::CommandLine& args;
    device::LifecycleManager& manager;
    std::shared_ptr<utils::CommandRunner> runner;
    std::optional<device::RemoteEndpoint> remote;  ///< Set with --remote-host

    /**
     * @brief Value of --device, empty when absent
     */
    [[nodiscard]] auto deviceId() const -> std::string {
        return args.getString("device").value_or("");
    }

    /**
     * @brief --device, or DeviceRequired when it is missing
     */
    [[nodiscard]] auto requireDevice() const
        -> device::DeviceResult<std::string> {
        auto id = deviceId();
        if (id.empty()) {
            return std::unexpected(device::error::deviceRequired());
        }
        return id;
    }

    [[nodiscard]] auto isRemote() const -> bool { return remote.has_value(); }
};

/**
 * @brief Serialize a typed result for the envelope
 */
template <typename T>
auto toJsonResult(const device::DeviceResult<T>& outcome)
    -> device::DeviceResult<json> {
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return outcome->toJson();
}

/**
 * @brief Maps action names ("simulator.boot") to their handlers
 *
 * Dispatch is synchronous: one invocation runs one command and produces
 * exactly one envelope.
 */
class CommandDispatcher {
public:
    using CommandID = std::string;
    using CommandHandler =
        std::function<device::DeviceResult<json>(const CommandContext&)>;

    /**
     * @brief Registers a handler, replacing any previous one for `id`
     */
    void registerCommand(const CommandID& id, CommandHandler handler);

    [[nodiscard]] auto hasCommand(const CommandID& id) const -> bool;

    /**
     * @brief Turn a command path ("io", "tap") into a registered action
     *
     * Single-word commands use their own alias table ("devices" resolves
     * to "devices.list").
     */
    [[nodiscard]] auto resolve(const std::vector<std::string>& path) const
        -> std::optional<CommandID>;

    /**
     * @brief Run a handler and wrap its outcome
     *
     * Exceptions escaping the handler become error envelopes; an unknown id
     * yields INTERNAL_ERROR.
     */
    [[nodiscard]] auto dispatch(const CommandID& id,
                                const CommandContext& context) const
        -> Envelope;

    [[nodiscard]] auto getCommands() const -> std::vector<CommandID>;

private:
    std::map<CommandID, CommandHandler> handlers_;
};

/**
 * @brief Register every simdeck command
 */
void registerAllCommands(CommandDispatcher& dispatcher);

}  // namespace simdeck::server

#endif  // SIMDECK_SERVER_COMMAND_HPP
