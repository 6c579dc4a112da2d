#include "cloudconnect/resource_registry.hpp"
#include "cloudconnect/exceptions.hpp"
#include "cloudconnect/resources/app_service.hpp"
#include "cloudconnect/resources/cache_db.hpp"
#include "cloudconnect/resources/storage_account.hpp"

#include <mutex>
#include <stdexcept>

namespace cloudconnect {

void ResourceRegistry::register_type(const std::string& type_name, Factory factory) {
    if (!factory) {
        throw std::invalid_argument("ResourceRegistry factory must not be empty");
    }
    std::unique_lock lock(mutex_);
    if (factories_.count(type_name) > 0) {
        throw DuplicateTypeError(type_name);
    }
    factories_.emplace(type_name, std::move(factory));
    order_.push_back(type_name);
}

std::unique_ptr<Resource> ResourceRegistry::create(const std::string& type_name,
                                                   const std::string& name,
                                                   const FieldBag& fields) const {
    Factory factory;
    {
        std::shared_lock lock(mutex_);
        auto it = factories_.find(type_name);
        if (it == factories_.end()) {
            throw UnknownTypeError(type_name);
        }
        factory = it->second;
    }

    auto resource = factory(name, fields);
    if (!resource) {
        throw std::logic_error("Factory for '" + type_name + "' returned null");
    }
    return resource;
}

bool ResourceRegistry::contains(const std::string& type_name) const {
    std::shared_lock lock(mutex_);
    return factories_.count(type_name) > 0;
}

std::size_t ResourceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return factories_.size();
}

std::vector<std::string> ResourceRegistry::registered_types() const {
    std::shared_lock lock(mutex_);
    return order_;
}

ResourceRegistry& ResourceRegistry::global() {
    static ResourceRegistry instance;
    static std::once_flag builtins_registered;
    std::call_once(builtins_registered, [] { register_builtin_types(instance); });
    return instance;
}

void register_builtin_types(ResourceRegistry& registry) {
    registry.register_type(resources::AppService::TYPE_TAG,
                           &resources::AppService::from_fields);
    registry.register_type(resources::StorageAccount::TYPE_TAG,
                           &resources::StorageAccount::from_fields);
    registry.register_type(resources::CacheDB::TYPE_TAG,
                           &resources::CacheDB::from_fields);
}

} // namespace cloudconnect
