#include "cloudconnect/resources/app_service.hpp"
#include "cloudconnect/exceptions.hpp"
#include "cloudconnect/field_bag.hpp"

namespace cloudconnect::resources {

const char* to_string(Runtime r) {
    switch (r) {
        case Runtime::Python: return "python";
        case Runtime::NodeJs: return "nodejs";
        case Runtime::DotNet: return "dotnet";
    }
    return "unknown";
}

const char* to_string(Region r) {
    switch (r) {
        case Region::EastUS:       return "EastUS";
        case Region::WestEurope:   return "WestEurope";
        case Region::CentralIndia: return "CentralIndia";
    }
    return "Unknown";
}

std::optional<Runtime> parse_runtime(const std::string& s) {
    for (auto r : {Runtime::Python, Runtime::NodeJs, Runtime::DotNet}) {
        if (s == to_string(r)) return r;
    }
    return std::nullopt;
}

std::optional<Region> parse_region(const std::string& s) {
    for (auto r : {Region::EastUS, Region::WestEurope, Region::CentralIndia}) {
        if (s == to_string(r)) return r;
    }
    return std::nullopt;
}

AppService::AppService(std::string name, Runtime runtime, Region region,
                       int replica_count)
    : Resource(std::move(name), TYPE_TAG)
    , runtime_(runtime)
    , region_(region)
    , replica_count_(replica_count)
{
    if (replica_count_ < 1 || replica_count_ > 3) {
        throw ValidationError("replica_count", "must be 1, 2 or 3, got " +
                                               std::to_string(replica_count_));
    }
}

std::unique_ptr<Resource> AppService::from_fields(const std::string& name,
                                                  const FieldBag& fields) {
    const std::string& runtime_str = require_string(fields, "runtime");
    auto runtime = parse_runtime(runtime_str);
    if (!runtime) {
        throw ValidationError("runtime", "'" + runtime_str +
                                         "' is not one of python, nodejs, dotnet");
    }

    const std::string& region_str = require_string(fields, "region");
    auto region = parse_region(region_str);
    if (!region) {
        throw ValidationError("region", "'" + region_str +
                                        "' is not one of EastUS, WestEurope, CentralIndia");
    }

    std::int64_t replicas = require_int(fields, "replica_count");
    if (replicas < 1 || replicas > 3) {
        throw ValidationError("replica_count", "must be 1, 2 or 3, got " +
                                               std::to_string(replicas));
    }

    return std::make_unique<AppService>(name, *runtime, *region,
                                        static_cast<int>(replicas));
}

Runtime AppService::runtime() const noexcept { return runtime_; }
Region AppService::region() const noexcept { return region_; }
int AppService::replica_count() const noexcept { return replica_count_; }

std::string AppService::describe() const {
    return std::string("AppService: runtime=") + to_string(runtime_) +
           ", region=" + to_string(region_) +
           ", replicas=" + std::to_string(replica_count_);
}

std::string AppService::start_detail() const {
    return std::string("in ") + to_string(region_);
}

} // namespace cloudconnect::resources
