#include "cloudconnect/resource.hpp"
#include "cloudconnect/exceptions.hpp"

namespace cloudconnect {

Resource::Resource(std::string name, std::string type_tag)
    : name_(std::move(name))
    , type_tag_(std::move(type_tag))
    , created_at_(Clock::now())
    , last_transition_at_(created_at_)
{
    if (name_.empty()) {
        throw ValidationError("name", "must not be empty");
    }
}

const std::string& Resource::name() const noexcept { return name_; }
const std::string& Resource::type_tag() const noexcept { return type_tag_; }
ResourceState Resource::state() const noexcept { return state_; }
Timestamp Resource::created_at() const noexcept { return created_at_; }
Timestamp Resource::last_transition_at() const noexcept { return last_transition_at_; }

std::string Resource::start_detail() const {
    return {};
}

ResourceInfo Resource::info() const {
    ResourceInfo out;
    out.name = name_;
    out.type_tag = type_tag_;
    out.state = state_;
    out.description = describe();
    out.start_detail = start_detail();
    out.created_at = created_at_;
    out.last_transition_at = last_transition_at_;
    return out;
}

void Resource::set_state(ResourceState s, Timestamp at) {
    state_ = s;
    last_transition_at_ = at;
}

} // namespace cloudconnect
