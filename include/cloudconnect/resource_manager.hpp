#pragma once

#include "cloudconnect/types.hpp"
#include "cloudconnect/resource.hpp"
#include "cloudconnect/resource_registry.hpp"
#include "cloudconnect/log_sink.hpp"
#include "cloudconnect/monitor.hpp"
#include "cloudconnect/config.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudconnect {

// Owns every resource created through it and enforces the lifecycle:
//
//   create -> Stopped --start--> Running --stop--> Stopped --delete--> Deleted
//
// Names are unique for the lifetime of the manager; deleted resources keep
// their record, their audit history and their name.
//
// Each operation checks all of its preconditions before mutating anything.
// Failures throw a CloudConnectException subclass and leave the collection
// untouched.
//
// Resource code (describe(), start_detail()), sinks and monitors are never
// called while the manager's lock is held. Audit lines reach the sink in the
// order their transitions were committed.
class ResourceManager {
public:
    // Uses the global registry and a FileLogSink under config.log_dir
    // (or a MemoryLogSink if config.write_audit_files is false).
    explicit ResourceManager(Config config = Config{});

    // sink may be null, in which case only the in-memory history is kept.
    ResourceManager(Config config,
                    std::shared_ptr<LogSink> sink,
                    ResourceRegistry& registry = ResourceRegistry::global());

    ~ResourceManager() = default;

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    // ==================== Resource Types ====================

    void register_resource_type(const std::string& type_name,
                                ResourceRegistry::Factory factory);
    std::vector<std::string> registered_types() const;

    // ==================== Lifecycle ====================

    // Throws DuplicateNameError, UnknownTypeError or ValidationError.
    ResourceInfo create_resource(const std::string& type_name,
                                 const std::string& name,
                                 const FieldBag& fields);

    // Each throws NotFoundError or InvalidTransitionError.
    ResourceInfo start_resource(const std::string& name);
    ResourceInfo stop_resource(const std::string& name);
    ResourceInfo delete_resource(const std::string& name);

    // ==================== Queries ====================

    // Formatted audit lines, oldest first. Works for deleted resources.
    std::vector<std::string> view_logs(const std::string& name) const;
    std::vector<AuditEntry> audit_history(const std::string& name) const;

    std::optional<ResourceInfo> get_resource(const std::string& name) const;
    std::vector<ResourceInfo> get_all_resources() const;   // creation order
    std::size_t resource_count() const;
    bool contains(const std::string& name) const;

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);
    void set_log_sink(std::shared_ptr<LogSink> sink);
    std::shared_ptr<LogSink> log_sink() const;
    const Config& config() const noexcept;

private:
    // Hands out sink-write turns for one resource in commit order
    struct AuditOrder {
        std::mutex mutex;
        std::condition_variable turn_changed;
        std::uint64_t next_to_write{0};

        void wait_turn(std::uint64_t seq);
        void finish_turn();
    };

    struct Entry {
        std::unique_ptr<Resource> resource;
        std::string description;     // cached, configuration is immutable
        std::string start_detail;
        std::vector<AuditEntry> history;
        std::uint64_t next_audit_seq{0};
        std::shared_ptr<AuditOrder> audit_order;
    };

    Config config_;
    ResourceRegistry& registry_;

    mutable std::shared_mutex state_mutex_;
    std::unordered_map<std::string, Entry> resources_;
    std::vector<std::string> creation_order_;

    std::shared_ptr<LogSink> log_sink_;
    std::shared_ptr<Monitor> monitor_;

    const Entry& find_entry(const std::string& name) const;
    static ResourceInfo snapshot(const Entry& entry);
    ResourceInfo apply_transition(const std::string& name, Transition t);
    void write_audit(const std::string& name, const std::string& type_tag,
                     const std::string& message,
                     const std::shared_ptr<LogSink>& sink,
                     AuditOrder& order, std::uint64_t seq);
    void emit_event(EventType type, const std::string& message,
                    std::optional<std::string> resource_name = std::nullopt,
                    std::optional<std::string> type_tag = std::nullopt,
                    std::optional<ResourceState> state = std::nullopt,
                    std::optional<ErrorKind> error = std::nullopt);
};

} // namespace cloudconnect
