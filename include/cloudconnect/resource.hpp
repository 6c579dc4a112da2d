#pragma once

#include "cloudconnect/types.hpp"
#include <string>

namespace cloudconnect {

class ResourceManager;

// Base of every managed resource type. Concrete types hold their own
// configuration and render it through describe(); lifecycle state is only
// changed by the ResourceManager.
class Resource {
public:
    virtual ~Resource() = default;

    Resource(const Resource&) = delete;
    Resource& operator=(const Resource&) = delete;

    const std::string& name() const noexcept;
    const std::string& type_tag() const noexcept;
    ResourceState state() const noexcept;
    Timestamp created_at() const noexcept;
    Timestamp last_transition_at() const noexcept;

    // Human-readable summary of the type-specific configuration
    virtual std::string describe() const = 0;

    // Suffix for the "started" audit entry, e.g. "in WestEurope". Empty by default.
    virtual std::string start_detail() const;

    ResourceInfo info() const;

protected:
    // Throws ValidationError if name is empty.
    Resource(std::string name, std::string type_tag);

private:
    std::string   name_;
    std::string   type_tag_;
    ResourceState state_{ResourceState::Stopped};
    Timestamp     created_at_;
    Timestamp     last_transition_at_;

    // ResourceManager drives the lifecycle
    void set_state(ResourceState s, Timestamp at);

    friend class ResourceManager;
};

} // namespace cloudconnect
