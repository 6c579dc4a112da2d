#pragma once

#include "cloudconnect/resource.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace cloudconnect::resources {

class StorageAccount : public Resource {
public:
    static constexpr const char* TYPE_TAG = "StorageAccount";

    StorageAccount(std::string name, bool encryption_enabled,
                   std::string access_key, std::int64_t max_size_gb);

    // Fields: encryption_enabled (bool), access_key (string), max_size_gb (int)
    static std::unique_ptr<Resource> from_fields(const std::string& name,
                                                 const FieldBag& fields);

    bool encryption_enabled() const noexcept;
    const std::string& access_key() const noexcept;
    std::int64_t max_size_gb() const noexcept;

    // Never includes the access key
    std::string describe() const override;

private:
    bool         encryption_enabled_;
    std::string  access_key_;
    std::int64_t max_size_gb_;
};

} // namespace cloudconnect::resources
