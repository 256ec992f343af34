#include "Execution/AgentExecutor.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <sstream>
#include <stdexcept>

using PROTOCOL::Message;
using PROTOCOL::MessageType;

AgentExecutor::AgentExecutor(std::chrono::milliseconds defaultTimeout, std::chrono::milliseconds maxTimeout)
    : defaultTimeout_(defaultTimeout), maxTimeout_(maxTimeout) {
    if (maxTimeout_.count() <= 0) {
        throw std::invalid_argument("max timeout must be positive");
    }
    if (defaultTimeout_.count() <= 0 || defaultTimeout_ > maxTimeout_) {
        throw std::invalid_argument("default timeout must be positive and not exceed the max timeout");
    }
}

ExecutionResult AgentExecutor::execute(PROTOCOL::ControlChannel& channel,
                                       std::string_view command,
                                       std::optional<std::chrono::milliseconds> timeout) const {
    if (command.empty()) {
        throw std::invalid_argument("command must not be empty");
    }
    const auto limit = timeout.value_or(defaultTimeout_);
    if (limit.count() <= 0 || limit > maxTimeout_) {
        throw std::invalid_argument("timeout must be in (0, " + std::to_string(maxTimeout_.count()) + "] ms, got " +
                                    std::to_string(limit.count()));
    }

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + limit;

    channel.sendMessage(MessageType::Execute, command);
    AH_LOG_DEBUG("Execute sent ({} bytes, timeout {}ms)", command.size(), limit.count());

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        Message reply;
        try {
            reply = channel.receiveMessage(remaining);
        } catch (const TimeoutError&) {
            break;
        }

        switch (reply.type) {
            case MessageType::Result: {
                ExecutionResult result = parseResult(reply.text());
                result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
                AH_LOG_INFO("Command finished with exit code {} in {}ms", result.exitCode, result.duration.count());
                return result;
            }
            case MessageType::Error:
                throw ExecutionError("guest reported: " + reply.text());
            case MessageType::Heartbeat:
                AH_LOG_TRACE("Heartbeat while waiting for result");
                break;
            case MessageType::Status:
                AH_LOG_DEBUG("Guest status: {}", reply.text());
                break;
            default:
                AH_LOG_WARN("Ignoring unexpected {} frame while waiting for result", PROTOCOL::toString(reply.type));
                break;
        }
    }

    try {
        channel.sendMessage(MessageType::Stop, std::string_view{});
    } catch (const TransportError& e) {
        AH_LOG_WARN("Could not deliver stop request: {}", e.what());
    }
    throw TimeoutError("command did not complete within " + std::to_string(limit.count()) + "ms");
}

bool AgentExecutor::ping(PROTOCOL::ControlChannel& channel, std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    channel.sendMessage(MessageType::Status, std::string_view{});

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return false;
        }
        try {
            const Message reply = channel.receiveMessage(remaining);
            if (reply.type == MessageType::Status) {
                return true;
            }
        } catch (const TimeoutError&) {
            return false;
        }
    }
}

ExecutionResult AgentExecutor::parseResult(std::string_view json) {
    namespace pt = boost::property_tree;

    pt::ptree tree;
    try {
        std::istringstream in{std::string(json)};
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& e) {
        throw ExecutionError(std::string("malformed result payload: ") + e.what());
    }

    const auto exitCode = tree.get_optional<int>("exit_code");
    if (!exitCode) {
        throw ExecutionError("result payload is missing exit_code");
    }

    ExecutionResult result;
    result.exitCode = *exitCode;
    result.stdoutText = tree.get<std::string>("stdout", "");
    result.stderrText = tree.get<std::string>("stderr", "");
    return result;
}
