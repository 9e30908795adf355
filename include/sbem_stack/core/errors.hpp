#pragma once

#include <stdexcept>
#include <string>

namespace sbem_stack {

class SbemStackError : public std::runtime_error {
public:
    explicit SbemStackError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public SbemStackError {
public:
    explicit ConfigError(const std::string& message)
        : SbemStackError("Config error: " + message) {}
};

class ValidationError : public SbemStackError {
public:
    explicit ValidationError(const std::string& message)
        : SbemStackError("Validation error: " + message) {}
};

class IOError : public SbemStackError {
public:
    explicit IOError(const std::string& message)
        : SbemStackError("I/O error: " + message) {}
};

class GridError : public SbemStackError {
public:
    explicit GridError(const std::string& message)
        : SbemStackError("Grid error: " + message) {}
};

class StateError : public SbemStackError {
public:
    explicit StateError(const std::string& message)
        : SbemStackError("State error: " + message) {}
};

} // namespace sbem_stack
