#pragma once

#include "cloudconnect/resource.hpp"
#include <memory>
#include <optional>
#include <string>

namespace cloudconnect::resources {

enum class Runtime { Python, NodeJs, DotNet };
enum class Region { EastUS, WestEurope, CentralIndia };

const char* to_string(Runtime r);
const char* to_string(Region r);
std::optional<Runtime> parse_runtime(const std::string& s);
std::optional<Region> parse_region(const std::string& s);

// Hosted application: runtime, region and a replica count of 1-3.
class AppService : public Resource {
public:
    static constexpr const char* TYPE_TAG = "AppService";

    AppService(std::string name, Runtime runtime, Region region, int replica_count);

    // Fields: runtime (string), region (string), replica_count (int)
    static std::unique_ptr<Resource> from_fields(const std::string& name,
                                                 const FieldBag& fields);

    Runtime runtime() const noexcept;
    Region region() const noexcept;
    int replica_count() const noexcept;

    std::string describe() const override;
    std::string start_detail() const override;

private:
    Runtime runtime_;
    Region  region_;
    int     replica_count_;
};

} // namespace cloudconnect::resources
