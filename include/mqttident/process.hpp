#pragma once

/**
 * @file process.hpp
 * @brief Bounded external command execution for the fact probe
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mqttident {
namespace process {

/// Default per-command timeout used by probes
constexpr std::chrono::milliseconds DEFAULT_COMMAND_TIMEOUT{2000};

/// Outcome of a command run
enum class CommandStatus {
    Completed,     // Exited with code 0
    Failed,        // Exited non-zero or killed by a signal
    TimedOut,      // Killed after the timeout elapsed
    NotLaunched    // Binary missing or process creation failed
};

/// Convert command status to string
[[nodiscard]] constexpr const char* command_status_to_string(CommandStatus status) noexcept {
    switch (status) {
        case CommandStatus::Completed:
            return "completed";
        case CommandStatus::Failed:
            return "failed";
        case CommandStatus::TimedOut:
            return "timeout";
        case CommandStatus::NotLaunched:
            return "not launched";
    }
    return "unknown";
}

/// Captured result of a command
struct CommandResult {
    CommandStatus status = CommandStatus::NotLaunched;
    int exit_code = -1;
    std::string output;  // stdout only; stderr is discarded
};

/**
 * @brief Run a command with a fixed argument list and no shell
 *
 * argv[0] is looked up on PATH. The child is killed once `timeout` elapses.
 */
[[nodiscard]] CommandResult run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout = DEFAULT_COMMAND_TIMEOUT);

/// Run a command and return its stdout only when it completed successfully
[[nodiscard]] std::optional<std::string> capture_output(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout = DEFAULT_COMMAND_TIMEOUT);

}  // namespace process
}  // namespace mqttident
