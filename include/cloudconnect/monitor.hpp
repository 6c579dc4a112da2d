#pragma once

#include "cloudconnect/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloudconnect {

enum class EventType {
    ResourceTypeRegistered,
    ResourceCreated,
    ResourceStarted,
    ResourceStopped,
    ResourceDeleted,
    AuditEntryWritten,
    TransitionRejected,
    OperationFailed,
    AuditWriteFailed
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<std::string> resource_name;
    std::optional<std::string> type_tag;
    std::optional<ResourceState> state;
    std::optional<ErrorKind> error;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Counts lifecycle operations and failures
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t resources_created{0};
        std::uint64_t resources_started{0};
        std::uint64_t resources_stopped{0};
        std::uint64_t resources_deleted{0};
        std::uint64_t transitions_rejected{0};
        std::uint64_t operations_failed{0};
        std::uint64_t audit_write_failures{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace cloudconnect
