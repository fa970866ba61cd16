#pragma once

#include <stdexcept>
#include <string>

#include "core/types.hpp"

namespace sandgrade::core {

enum class ErrorKind {
    kValidation,
    kImageNotFound,
    kCapacityExceeded,
    kRunnerInternalFault,
    kConfig
};

const char* ToString(ErrorKind kind);

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad request shape; raised before any container work.
class ValidationError : public EngineError {
public:
    explicit ValidationError(const std::string& message)
        : EngineError(ErrorKind::kValidation, message) {}
};

class ImageNotFoundError : public EngineError {
public:
    explicit ImageNotFoundError(const std::string& message)
        : EngineError(ErrorKind::kImageNotFound, message) {}
};

class CapacityExceededError : public EngineError {
public:
    explicit CapacityExceededError(const std::string& message)
        : EngineError(ErrorKind::kCapacityExceeded, message) {}
};

// Infrastructure failure, distinct from a failure of the submitted code.
// Carries a failed result so callers always have something to render.
class RunnerInternalFault : public EngineError {
public:
    explicit RunnerInternalFault(const std::string& message)
        : EngineError(ErrorKind::kRunnerInternalFault, message) {}
    RunnerInternalFault(const std::string& message, ExecutionResult result)
        : EngineError(ErrorKind::kRunnerInternalFault, message), result_(std::move(result)) {}

    const ExecutionResult& Result() const { return result_; }

private:
    ExecutionResult result_;
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& message)
        : EngineError(ErrorKind::kConfig, message) {}
};

// Raised by container runtime back-ends when the daemon cannot be reached or
// rejects a request. Never escapes the sandbox runner.
class RuntimeFault : public std::runtime_error {
public:
    explicit RuntimeFault(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace sandgrade::core
