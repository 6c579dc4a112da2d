#include "cloudconnect/exceptions.hpp"

namespace cloudconnect {

std::string InvalidTransitionError::describe(const std::string& name,
                                             Transition t, ResourceState s) {
    const std::string quoted = "Resource '" + name + "'";

    switch (t) {
        case Transition::Start:
            if (s == ResourceState::Running) {
                return quoted + " is already running.";
            }
            if (s == ResourceState::Deleted) {
                return quoted + " is deleted and cannot be started.";
            }
            break;
        case Transition::Stop:
            if (s == ResourceState::Stopped) {
                return quoted + " is already stopped.";
            }
            if (s == ResourceState::Deleted) {
                return quoted + " is deleted and cannot be stopped.";
            }
            break;
        case Transition::Delete:
            if (s == ResourceState::Running) {
                return "Cannot delete: " + quoted + " must be stopped first.";
            }
            if (s == ResourceState::Deleted) {
                return quoted + " is already deleted.";
            }
            break;
    }
    return "Cannot " + std::string(to_string(t)) + " " + quoted +
           " in state " + to_string(s) + ".";
}

} // namespace cloudconnect
