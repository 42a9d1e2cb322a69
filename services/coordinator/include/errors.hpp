#pragma once
#include <stdexcept>
#include <string>

// Typed, recoverable failures of coordinator operations. None of these leave
// partial state behind.
class CoordinatorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DuplicateAgent : public CoordinatorError {
public:
    explicit DuplicateAgent(const std::string& id)
        : CoordinatorError("agent already registered: " + id) {}
};

class InvalidTransition : public CoordinatorError {
public:
    using CoordinatorError::CoordinatorError;
};

class UnknownTask : public CoordinatorError {
public:
    explicit UnknownTask(const std::string& id)
        : CoordinatorError("unknown task: " + id) {}
};

class UnknownAgent : public CoordinatorError {
public:
    explicit UnknownAgent(const std::string& id)
        : CoordinatorError("unknown agent: " + id) {}
};

class UnknownRole : public CoordinatorError {
public:
    explicit UnknownRole(const std::string& role)
        : CoordinatorError("unknown agent role: " + role) {}
};

class InvalidArgument : public CoordinatorError {
public:
    using CoordinatorError::CoordinatorError;
};

class ConfigError : public CoordinatorError {
public:
    using CoordinatorError::CoordinatorError;
};
