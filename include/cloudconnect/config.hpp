#pragma once

#include <cstddef>
#include <string>

namespace cloudconnect {

struct Config {
    // Directory holding one "<resource>.log" audit file per resource
    std::string log_dir = "logs";

    // If false, the default audit sink keeps entries in memory only
    bool write_audit_files = true;

    // Maximum number of resources (deleted ones included) in one manager
    std::size_t max_resources = 4096;

    // Forward every audit entry to the monitor as well
    bool echo_audit_to_monitor = true;
};

} // namespace cloudconnect
