#include "cloudconnect/resources/storage_account.hpp"
#include "cloudconnect/exceptions.hpp"
#include "cloudconnect/field_bag.hpp"

namespace cloudconnect::resources {

StorageAccount::StorageAccount(std::string name, bool encryption_enabled,
                               std::string access_key, std::int64_t max_size_gb)
    : Resource(std::move(name), TYPE_TAG)
    , encryption_enabled_(encryption_enabled)
    , access_key_(std::move(access_key))
    , max_size_gb_(max_size_gb)
{
    if (max_size_gb_ <= 0) {
        throw ValidationError("max_size_gb", "must be a positive integer, got " +
                                             std::to_string(max_size_gb_));
    }
}

std::unique_ptr<Resource> StorageAccount::from_fields(const std::string& name,
                                                      const FieldBag& fields) {
    bool encryption = require_bool(fields, "encryption_enabled");
    const std::string& key = require_string(fields, "access_key");
    std::int64_t size = require_positive(fields, "max_size_gb");
    return std::make_unique<StorageAccount>(name, encryption, key, size);
}

bool StorageAccount::encryption_enabled() const noexcept { return encryption_enabled_; }
const std::string& StorageAccount::access_key() const noexcept { return access_key_; }
std::int64_t StorageAccount::max_size_gb() const noexcept { return max_size_gb_; }

std::string StorageAccount::describe() const {
    return std::string("StorageAccount: encryption=") +
           (encryption_enabled_ ? "true" : "false") +
           ", size=" + std::to_string(max_size_gb_) + "GB";
}

} // namespace cloudconnect::resources
