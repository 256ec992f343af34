#pragma once
#include <stdexcept>
#include <string>

// Connection is broken; the owning channel must be discarded.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg) : std::runtime_error("[Transport] " + msg) {}
};

// Frame rejected (checksum mismatch, unknown type, oversized length).
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error("[Protocol] " + msg) {}
};

class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& msg) : std::runtime_error("[Timeout] " + msg) {}
};

class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(const std::string& msg) : std::runtime_error("[Execution] " + msg) {}
};
