#include "cloudconnect/resource_manager.hpp"
#include "cloudconnect/exceptions.hpp"

#include <exception>
#include <stdexcept>

namespace cloudconnect {

namespace {

std::string audit_message(const std::string& type_tag, const std::string& start_detail,
                          Transition t) {
    switch (t) {
        case Transition::Start:
            return type_tag + " started" + (start_detail.empty() ? "" : " " + start_detail);
        case Transition::Stop:
            return type_tag + " stopped successfully";
        case Transition::Delete:
            return type_tag + " marked as deleted";
    }
    return type_tag + " updated";
}

EventType event_for(Transition t) {
    switch (t) {
        case Transition::Start:  return EventType::ResourceStarted;
        case Transition::Stop:   return EventType::ResourceStopped;
        case Transition::Delete: return EventType::ResourceDeleted;
    }
    return EventType::OperationFailed;
}

} // anonymous namespace

ResourceManager::ResourceManager(Config config)
    : ResourceManager(config, make_default_sink(config))
{}

ResourceManager::ResourceManager(Config config,
                                 std::shared_ptr<LogSink> sink,
                                 ResourceRegistry& registry)
    : config_(std::move(config))
    , registry_(registry)
    , log_sink_(std::move(sink))
{}

// ==================== Resource Types ====================

void ResourceManager::register_resource_type(const std::string& type_name,
                                             ResourceRegistry::Factory factory) {
    registry_.register_type(type_name, std::move(factory));
    emit_event(EventType::ResourceTypeRegistered,
               "Resource type registered: " + type_name,
               std::nullopt, type_name);
}

std::vector<std::string> ResourceManager::registered_types() const {
    return registry_.registered_types();
}

// ==================== Lifecycle ====================

ResourceInfo ResourceManager::create_resource(const std::string& type_name,
                                              const std::string& name,
                                              const FieldBag& fields) {
    // Reject known duplicates before running the factory
    if (contains(name)) {
        emit_event(EventType::OperationFailed, "Duplicate resource name",
                   name, type_name, std::nullopt, ErrorKind::DuplicateName);
        throw DuplicateNameError(name);
    }

    std::unique_ptr<Resource> resource;
    try {
        resource = registry_.create(type_name, name, fields);
    } catch (const CloudConnectException& e) {
        emit_event(EventType::OperationFailed, e.what(), name, type_name,
                   std::nullopt, e.kind());
        throw;
    }
    if (resource->name() != name) {
        throw std::logic_error("Factory for '" + type_name + "' produced a resource named '" +
                               resource->name() + "' instead of '" + name + "'");
    }

    // Not shared yet, so resource code runs without the lock
    Entry entry;
    entry.description = resource->describe();
    entry.start_detail = resource->start_detail();
    std::string message = resource->type_tag() + " created (" + entry.description + ")";
    entry.resource = std::move(resource);
    entry.audit_order = std::make_shared<AuditOrder>();
    ResourceInfo info = snapshot(entry);
    entry.history.push_back(AuditEntry{info.created_at, message});

    std::unique_lock lock(state_mutex_);
    // A concurrent create may have claimed the name meanwhile
    if (resources_.count(name) > 0) {
        lock.unlock();
        emit_event(EventType::OperationFailed, "Duplicate resource name",
                   name, type_name, std::nullopt, ErrorKind::DuplicateName);
        throw DuplicateNameError(name);
    }
    if (resources_.size() >= config_.max_resources) {
        lock.unlock();
        emit_event(EventType::OperationFailed, "Resource limit reached",
                   name, type_name, std::nullopt, ErrorKind::Validation);
        throw ValidationError("name", "resource limit of " +
                                      std::to_string(config_.max_resources) +
                                      " reached");
    }

    std::uint64_t seq = entry.next_audit_seq++;
    std::shared_ptr<AuditOrder> order = entry.audit_order;
    std::shared_ptr<LogSink> sink = log_sink_;
    resources_.emplace(name, std::move(entry));
    creation_order_.push_back(name);
    lock.unlock();

    write_audit(name, info.type_tag, message, sink, *order, seq);
    emit_event(EventType::ResourceCreated, message, name, info.type_tag, info.state);
    return info;
}

ResourceInfo ResourceManager::start_resource(const std::string& name) {
    return apply_transition(name, Transition::Start);
}

ResourceInfo ResourceManager::stop_resource(const std::string& name) {
    return apply_transition(name, Transition::Stop);
}

ResourceInfo ResourceManager::delete_resource(const std::string& name) {
    return apply_transition(name, Transition::Delete);
}

ResourceInfo ResourceManager::apply_transition(const std::string& name, Transition t) {
    std::unique_lock lock(state_mutex_);
    auto it = resources_.find(name);
    if (it == resources_.end()) {
        lock.unlock();
        emit_event(EventType::OperationFailed,
                   std::string("Cannot ") + to_string(t) + " unknown resource",
                   name, std::nullopt, std::nullopt, ErrorKind::NotFound);
        throw NotFoundError(name);
    }

    Entry& entry = it->second;
    Resource& resource = *entry.resource;
    ResourceState current = resource.state();
    auto next = next_state(current, t);
    if (!next) {
        InvalidTransitionError error(name, t, current);
        std::string tag = resource.type_tag();
        lock.unlock();
        emit_event(EventType::TransitionRejected, error.what(), name, tag, current,
                   ErrorKind::InvalidTransition);
        throw error;
    }

    Timestamp now = Clock::now();
    resource.set_state(*next, now);
    std::string message = audit_message(resource.type_tag(), entry.start_detail, t);
    entry.history.push_back(AuditEntry{now, message});
    ResourceInfo info = snapshot(entry);
    std::uint64_t seq = entry.next_audit_seq++;
    std::shared_ptr<AuditOrder> order = entry.audit_order;
    std::shared_ptr<LogSink> sink = log_sink_;
    lock.unlock();

    write_audit(name, info.type_tag, message, sink, *order, seq);
    emit_event(event_for(t), message, name, info.type_tag, info.state);
    return info;
}

// ==================== Queries ====================

const ResourceManager::Entry& ResourceManager::find_entry(const std::string& name) const {
    auto it = resources_.find(name);
    if (it == resources_.end()) {
        throw NotFoundError(name);
    }
    return it->second;
}

ResourceInfo ResourceManager::snapshot(const Entry& entry) {
    const Resource& r = *entry.resource;
    ResourceInfo out;
    out.name = r.name();
    out.type_tag = r.type_tag();
    out.state = r.state();
    out.description = entry.description;
    out.start_detail = entry.start_detail;
    out.created_at = r.created_at();
    out.last_transition_at = r.last_transition_at();
    return out;
}

std::vector<std::string> ResourceManager::view_logs(const std::string& name) const {
    std::shared_lock lock(state_mutex_);
    const Entry& entry = find_entry(name);
    std::vector<std::string> lines;
    lines.reserve(entry.history.size());
    for (auto& e : entry.history) {
        lines.push_back(format_audit_line(e.timestamp, e.message));
    }
    return lines;
}

std::vector<AuditEntry> ResourceManager::audit_history(const std::string& name) const {
    std::shared_lock lock(state_mutex_);
    return find_entry(name).history;
}

std::optional<ResourceInfo> ResourceManager::get_resource(const std::string& name) const {
    std::shared_lock lock(state_mutex_);
    auto it = resources_.find(name);
    if (it == resources_.end()) return std::nullopt;
    return snapshot(it->second);
}

std::vector<ResourceInfo> ResourceManager::get_all_resources() const {
    std::shared_lock lock(state_mutex_);
    std::vector<ResourceInfo> result;
    result.reserve(creation_order_.size());
    for (auto& name : creation_order_) {
        result.push_back(snapshot(resources_.at(name)));
    }
    return result;
}

std::size_t ResourceManager::resource_count() const {
    std::shared_lock lock(state_mutex_);
    return resources_.size();
}

bool ResourceManager::contains(const std::string& name) const {
    std::shared_lock lock(state_mutex_);
    return resources_.count(name) > 0;
}

// ==================== Configuration ====================

void ResourceManager::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::unique_lock lock(state_mutex_);
    monitor_ = std::move(monitor);
}

void ResourceManager::set_log_sink(std::shared_ptr<LogSink> sink) {
    std::unique_lock lock(state_mutex_);
    log_sink_ = std::move(sink);
}

std::shared_ptr<LogSink> ResourceManager::log_sink() const {
    std::shared_lock lock(state_mutex_);
    return log_sink_;
}

const Config& ResourceManager::config() const noexcept {
    return config_;
}

// ==================== Internal helpers ====================

void ResourceManager::AuditOrder::wait_turn(std::uint64_t seq) {
    std::unique_lock<std::mutex> lock(mutex);
    turn_changed.wait(lock, [&] { return next_to_write == seq; });
}

void ResourceManager::AuditOrder::finish_turn() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++next_to_write;
    }
    turn_changed.notify_all();
}

void ResourceManager::write_audit(const std::string& name, const std::string& type_tag,
                                  const std::string& message,
                                  const std::shared_ptr<LogSink>& sink,
                                  AuditOrder& order, std::uint64_t seq) {
    std::optional<std::string> failure;
    {
        order.wait_turn(seq);
        struct TurnGuard {
            AuditOrder& order;
            ~TurnGuard() { order.finish_turn(); }
        } guard{order};

        // The transition is already committed; a failing sink is reported, not propagated.
        if (sink) {
            try {
                sink->append(name, message);
            } catch (const std::exception& e) {
                failure = e.what();
            }
        }
    }

    if (!sink) return;
    if (failure) {
        emit_event(EventType::AuditWriteFailed, *failure, name, type_tag);
        return;
    }
    if (config_.echo_audit_to_monitor) {
        emit_event(EventType::AuditEntryWritten, message, name, type_tag);
    }
}

void ResourceManager::emit_event(EventType type, const std::string& message,
                                 std::optional<std::string> resource_name,
                                 std::optional<std::string> type_tag,
                                 std::optional<ResourceState> state,
                                 std::optional<ErrorKind> error) {
    std::shared_ptr<Monitor> monitor;
    {
        std::shared_lock lock(state_mutex_);
        monitor = monitor_;
    }
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.resource_name = std::move(resource_name);
    event.type_tag = std::move(type_tag);
    event.state = state;
    event.error = error;

    monitor->on_event(event);
}

} // namespace cloudconnect
