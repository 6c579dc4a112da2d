#include "cloudconnect/monitor.hpp"

#include <iostream>

namespace cloudconnect {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::ResourceTypeRegistered: return "ResourceTypeRegistered";
        case EventType::ResourceCreated:        return "ResourceCreated";
        case EventType::ResourceStarted:        return "ResourceStarted";
        case EventType::ResourceStopped:        return "ResourceStopped";
        case EventType::ResourceDeleted:        return "ResourceDeleted";
        case EventType::AuditEntryWritten:      return "AuditEntryWritten";
        case EventType::TransitionRejected:     return "TransitionRejected";
        case EventType::OperationFailed:        return "OperationFailed";
        case EventType::AuditWriteFailed:       return "AuditWriteFailed";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::ResourceCreated:
        case EventType::ResourceStarted:
        case EventType::ResourceStopped:
        case EventType::ResourceDeleted:
        case EventType::AuditWriteFailed:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::ostream& out = (event.type == EventType::AuditWriteFailed) ? std::cerr : std::cout;
    out << "[CloudConnect] " << to_string(event.type);

    if (event.resource_name.has_value()) {
        out << " resource=" << event.resource_name.value();
    }
    if (event.type_tag.has_value()) {
        out << " type=" << event.type_tag.value();
    }
    if (event.state.has_value()) {
        out << " state=" << to_string(event.state.value());
    }
    if (event.error.has_value()) {
        out << " error=" << to_string(event.error.value());
    }

    if (!event.message.empty()) {
        out << " | " << event.message;
    }

    out << "\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::ResourceCreated:
            metrics_.resources_created++;
            break;
        case EventType::ResourceStarted:
            metrics_.resources_started++;
            break;
        case EventType::ResourceStopped:
            metrics_.resources_stopped++;
            break;
        case EventType::ResourceDeleted:
            metrics_.resources_deleted++;
            break;
        case EventType::TransitionRejected:
            metrics_.transitions_rejected++;
            break;
        case EventType::OperationFailed:
            metrics_.operations_failed++;
            break;
        case EventType::AuditWriteFailed:
            metrics_.audit_write_failures++;
            break;
        default:
            break;
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

} // namespace cloudconnect
