// 01_basic_lifecycle.cpp
//
// Minimal CloudConnect example: one resource of each built-in type.
// Walks an AppService through create -> start -> stop -> delete and shows
// the lifecycle rules rejecting illegal moves.
//
// Scenario:
//   - "svc1" (AppService, python, WestEurope, 2 replicas) is created and started.
//   - Starting it again is rejected: it is already running.
//   - It is stopped and deleted; the deleted record stays queryable.
//   - Re-creating "svc1" is rejected: deleted names are never reused.

#include <cloudconnect/cloudconnect.hpp>

#include <cstdint>
#include <iostream>
#include <string>

using namespace cloudconnect;

int main() {
    std::cout << "=== CloudConnect: Basic Lifecycle Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the manager. Audit lines go to an in-memory sink here;
    //    the default configuration writes logs/<name>.log instead.
    // ----------------------------------------------------------------
    Config config;
    auto sink = std::make_shared<MemoryLogSink>();
    ResourceManager manager(config, sink);

    manager.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Create one resource of each built-in type.
    // ----------------------------------------------------------------
    FieldBag app;
    app["runtime"] = std::string("python");
    app["region"] = std::string("WestEurope");
    app["replica_count"] = std::int64_t{2};
    manager.create_resource("AppService", "svc1", app);

    FieldBag storage;
    storage["encryption_enabled"] = true;
    storage["access_key"] = std::string("k3y-0001");
    storage["max_size_gb"] = std::int64_t{500};
    manager.create_resource("StorageAccount", "blob1", storage);

    FieldBag cache;
    cache["ttl_seconds"] = std::int64_t{300};
    cache["capacity_mb"] = std::int64_t{128};
    cache["eviction_policy"] = std::string("LRU");
    manager.create_resource("CacheDB", "cache1", cache);

    std::cout << "\nResources:\n";
    for (auto& r : manager.get_all_resources()) {
        std::cout << "  " << r.name << " [" << to_string(r.state) << "] "
                  << r.description << "\n";
    }
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 3. Drive svc1 through its lifecycle.
    // ----------------------------------------------------------------
    manager.start_resource("svc1");

    try {
        manager.start_resource("svc1");
    } catch (const InvalidTransitionError& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    manager.stop_resource("svc1");
    manager.delete_resource("svc1");

    try {
        manager.start_resource("svc1");
    } catch (const InvalidTransitionError& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    try {
        manager.create_resource("AppService", "svc1", app);
    } catch (const DuplicateNameError& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    }

    // ----------------------------------------------------------------
    // 4. The audit trail survives deletion.
    // ----------------------------------------------------------------
    std::cout << "\nAudit trail for svc1:\n";
    for (auto& line : manager.view_logs("svc1")) {
        std::cout << "  " << line << "\n";
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
