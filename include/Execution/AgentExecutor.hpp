#pragma once

#include "Communication/channel/ControlChannel.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

struct ExecutionResult {
    int exitCode{-1};
    std::string stdoutText;
    std::string stderrText;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool success() const noexcept { return exitCode == 0; }
};

/**
 * @brief Runs a command inside the guest over an established control channel.
 *
 * Heartbeat and Status frames received while waiting are skipped. When the
 * deadline passes a Stop frame is sent and TimeoutError is thrown.
 */
class AgentExecutor {
public:
    explicit AgentExecutor(std::chrono::milliseconds defaultTimeout = std::chrono::seconds(300),
                           std::chrono::milliseconds maxTimeout = std::chrono::seconds(3600));

    /**
     * @throws std::invalid_argument for an empty command or an out-of-range timeout
     * @throws ExecutionError when the guest reports an error or sends a malformed result
     * @throws TimeoutError when no result arrives before the deadline
     * @throws TransportError, ProtocolError from the channel
     */
    [[nodiscard]] ExecutionResult execute(PROTOCOL::ControlChannel& channel,
                                          std::string_view command,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    // True when the guest answers a Status probe within `timeout`.
    [[nodiscard]] bool ping(PROTOCOL::ControlChannel& channel, std::chrono::milliseconds timeout) const;

    // Parses a Result payload: {"exit_code": int, "stdout": str, "stderr": str}.
    [[nodiscard]] static ExecutionResult parseResult(std::string_view json);

    [[nodiscard]] std::chrono::milliseconds defaultTimeout() const noexcept { return defaultTimeout_; }
    [[nodiscard]] std::chrono::milliseconds maxTimeout() const noexcept { return maxTimeout_; }

private:
    std::chrono::milliseconds defaultTimeout_;
    std::chrono::milliseconds maxTimeout_;
};
