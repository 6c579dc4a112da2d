#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace cloudconnect {

// Time types (wall clock: audit entries carry human-readable times)
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Generic construction input: field name -> typed value
using FieldValue = std::variant<bool, std::int64_t, std::string>;
using FieldBag = std::unordered_map<std::string, FieldValue>;

// Resource lifecycle state
enum class ResourceState {
    Stopped,
    Running,
    Deleted
};

// Lifecycle operations the manager can apply
enum class Transition {
    Start,
    Stop,
    Delete
};

// Error kinds surfaced to callers
enum class ErrorKind {
    Validation,
    DuplicateName,
    UnknownType,
    DuplicateType,
    NotFound,
    InvalidTransition
};

// One line of a resource's audit trail
struct AuditEntry {
    Timestamp timestamp{};
    std::string message;
};

// Read-only snapshot of one managed resource
struct ResourceInfo {
    std::string name;
    std::string type_tag;
    ResourceState state{ResourceState::Stopped};
    std::string description;
    std::string start_detail;        // e.g. "in WestEurope", may be empty
    Timestamp created_at{};
    Timestamp last_transition_at{};
};

inline const char* to_string(ResourceState s) {
    switch (s) {
        case ResourceState::Stopped: return "Stopped";
        case ResourceState::Running: return "Running";
        case ResourceState::Deleted: return "Deleted";
    }
    return "Unknown";
}

inline const char* to_string(Transition t) {
    switch (t) {
        case Transition::Start:  return "start";
        case Transition::Stop:   return "stop";
        case Transition::Delete: return "delete";
    }
    return "unknown";
}

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation:        return "ValidationError";
        case ErrorKind::DuplicateName:     return "DuplicateNameError";
        case ErrorKind::UnknownType:       return "UnknownTypeError";
        case ErrorKind::DuplicateType:     return "DuplicateTypeError";
        case ErrorKind::NotFound:          return "NotFoundError";
        case ErrorKind::InvalidTransition: return "InvalidTransitionError";
    }
    return "Unknown";
}

// Lifecycle transition table. Returns nullopt when the move is illegal.
constexpr std::optional<ResourceState> next_state(ResourceState current,
                                                  Transition t) noexcept {
    switch (current) {
        case ResourceState::Stopped:
            switch (t) {
                case Transition::Start:  return ResourceState::Running;
                case Transition::Stop:   return std::nullopt;
                case Transition::Delete: return ResourceState::Deleted;
            }
            break;
        case ResourceState::Running:
            switch (t) {
                case Transition::Start:  return std::nullopt;
                case Transition::Stop:   return ResourceState::Stopped;
                case Transition::Delete: return std::nullopt;
            }
            break;
        case ResourceState::Deleted:
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace cloudconnect
