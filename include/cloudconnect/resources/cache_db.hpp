#pragma once

#include "cloudconnect/resource.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace cloudconnect::resources {

// In-memory cache database. The eviction policy is an open set
// ("LRU", "FIFO", ...); any non-empty name is accepted.
class CacheDB : public Resource {
public:
    static constexpr const char* TYPE_TAG = "CacheDB";

    CacheDB(std::string name, std::int64_t ttl_seconds, std::int64_t capacity_mb,
            std::string eviction_policy);

    // Fields: ttl_seconds (int), capacity_mb (int), eviction_policy (string)
    static std::unique_ptr<Resource> from_fields(const std::string& name,
                                                 const FieldBag& fields);

    std::int64_t ttl_seconds() const noexcept;
    std::int64_t capacity_mb() const noexcept;
    const std::string& eviction_policy() const noexcept;

    std::string describe() const override;

private:
    std::int64_t ttl_seconds_;
    std::int64_t capacity_mb_;
    std::string  eviction_policy_;
};

} // namespace cloudconnect::resources
