#pragma once

#include "cloudconnect/resource.hpp"
#include "cloudconnect/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudconnect {

// Maps a resource type name to the factory that builds it from a FieldBag.
// Keeps ResourceManager decoupled from the concrete resource types.
class ResourceRegistry {
public:
    using Factory = std::function<std::unique_ptr<Resource>(const std::string& name,
                                                            const FieldBag& fields)>;

    ResourceRegistry() = default;

    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    // Throws DuplicateTypeError if type_name is already registered.
    void register_type(const std::string& type_name, Factory factory);

    // Throws UnknownTypeError if type_name was never registered. Whatever the
    // factory throws (usually ValidationError) propagates unchanged.
    std::unique_ptr<Resource> create(const std::string& type_name,
                                     const std::string& name,
                                     const FieldBag& fields) const;

    bool contains(const std::string& type_name) const;
    std::size_t size() const;

    // Type names in registration order
    std::vector<std::string> registered_types() const;

    // Process-wide registry with AppService, StorageAccount and CacheDB
    // registered on first use.
    static ResourceRegistry& global();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Factory> factories_;
    std::vector<std::string> order_;
};

// Registers AppService, StorageAccount and CacheDB.
void register_builtin_types(ResourceRegistry& registry);

} // namespace cloudconnect
