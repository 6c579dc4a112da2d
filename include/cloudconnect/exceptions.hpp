#pragma once

#include "cloudconnect/types.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace cloudconnect {

class CloudConnectException : public std::runtime_error {
public:
    CloudConnectException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public CloudConnectException {
public:
    ValidationError(std::string field, const std::string& reason)
        : CloudConnectException(ErrorKind::Validation,
                                "Invalid value for '" + field + "': " + reason)
        , field_(std::move(field)) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class DuplicateNameError : public CloudConnectException {
public:
    explicit DuplicateNameError(std::string name)
        : CloudConnectException(ErrorKind::DuplicateName,
                                "A resource named '" + name + "' already exists.")
        , name_(std::move(name)) {}

    const std::string& resource_name() const noexcept { return name_; }

private:
    std::string name_;
};

class NotFoundError : public CloudConnectException {
public:
    explicit NotFoundError(std::string name)
        : CloudConnectException(ErrorKind::NotFound,
                                "Resource '" + name + "' not found.")
        , name_(std::move(name)) {}

    const std::string& resource_name() const noexcept { return name_; }

private:
    std::string name_;
};

class UnknownTypeError : public CloudConnectException {
public:
    explicit UnknownTypeError(std::string type_name)
        : CloudConnectException(ErrorKind::UnknownType,
                                "Unknown resource type: '" + type_name + "'")
        , type_name_(std::move(type_name)) {}

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class DuplicateTypeError : public CloudConnectException {
public:
    explicit DuplicateTypeError(std::string type_name)
        : CloudConnectException(ErrorKind::DuplicateType,
                                "Resource type already registered: '" + type_name + "'")
        , type_name_(std::move(type_name)) {}

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

// Raised when a lifecycle operation is illegal in the resource's current state
class InvalidTransitionError : public CloudConnectException {
public:
    InvalidTransitionError(std::string name, Transition attempted,
                           ResourceState current)
        : CloudConnectException(ErrorKind::InvalidTransition,
                                describe(name, attempted, current))
        , name_(std::move(name))
        , attempted_(attempted)
        , current_(current) {}

    const std::string& resource_name() const noexcept { return name_; }
    Transition transition() const noexcept { return attempted_; }
    ResourceState current_state() const noexcept { return current_; }

private:
    std::string   name_;
    Transition    attempted_;
    ResourceState current_;

    static std::string describe(const std::string& name, Transition t,
                                ResourceState s);
};

} // namespace cloudconnect
