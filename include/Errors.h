#pragma once

#include <stdexcept>
#include <string>

namespace kitcheck {

// Template or toolkit definition cannot be analyzed as stored.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Captured image bytes or pixel buffer are unusable.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace kitcheck
