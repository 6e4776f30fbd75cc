#pragma once

#include <stdexcept>
#include <string>

class PlugupException : public std::runtime_error {
public:
    explicit PlugupException(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised for invalid identities or configuration options.
class ConfigError : public PlugupException {
public:
    explicit ConfigError(const std::string& message)
        : PlugupException(message) {}
};

// Network-level failure (DNS, connect, timeout, TLS). No HTTP status exists.
class TransportError : public PlugupException {
public:
    explicit TransportError(const std::string& message)
        : PlugupException(message) {}
};

// A download grew past its configured byte limit.
class SizeLimitError : public PlugupException {
public:
    explicit SizeLimitError(const std::string& message)
        : PlugupException(message) {}
};
