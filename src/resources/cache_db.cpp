#include "cloudconnect/resources/cache_db.hpp"
#include "cloudconnect/exceptions.hpp"
#include "cloudconnect/field_bag.hpp"

namespace cloudconnect::resources {

CacheDB::CacheDB(std::string name, std::int64_t ttl_seconds,
                 std::int64_t capacity_mb, std::string eviction_policy)
    : Resource(std::move(name), TYPE_TAG)
    , ttl_seconds_(ttl_seconds)
    , capacity_mb_(capacity_mb)
    , eviction_policy_(std::move(eviction_policy))
{
    if (ttl_seconds_ <= 0) {
        throw ValidationError("ttl_seconds", "must be a positive integer, got " +
                                             std::to_string(ttl_seconds_));
    }
    if (capacity_mb_ <= 0) {
        throw ValidationError("capacity_mb", "must be a positive integer, got " +
                                             std::to_string(capacity_mb_));
    }
    if (eviction_policy_.empty()) {
        throw ValidationError("eviction_policy", "must not be empty");
    }
}

std::unique_ptr<Resource> CacheDB::from_fields(const std::string& name,
                                               const FieldBag& fields) {
    std::int64_t ttl = require_positive(fields, "ttl_seconds");
    std::int64_t capacity = require_positive(fields, "capacity_mb");
    const std::string& policy = require_string(fields, "eviction_policy");
    return std::make_unique<CacheDB>(name, ttl, capacity, policy);
}

std::int64_t CacheDB::ttl_seconds() const noexcept { return ttl_seconds_; }
std::int64_t CacheDB::capacity_mb() const noexcept { return capacity_mb_; }
const std::string& CacheDB::eviction_policy() const noexcept { return eviction_policy_; }

std::string CacheDB::describe() const {
    return "CacheDB: ttl=" + std::to_string(ttl_seconds_) +
           "s, capacity=" + std::to_string(capacity_mb_) +
           "MB, policy=" + eviction_policy_;
}

} // namespace cloudconnect::resources
