#include <gtest/gtest.h>
#include <cloudconnect/cloudconnect.hpp>

#include <iostream>
#include <memory>
#include <sstream>

using namespace cloudconnect;

namespace {

FieldBag cache_fields() {
    FieldBag f;
    f["ttl_seconds"] = std::int64_t{60};
    f["capacity_mb"] = std::int64_t{64};
    f["eviction_policy"] = std::string("LRU");
    return f;
}

MonitorEvent make_event(EventType type) {
    MonitorEvent e;
    e.type = type;
    e.timestamp = Clock::now();
    e.message = "test message";
    e.resource_name = "cache1";
    e.type_tag = "CacheDB";
    e.state = ResourceState::Running;
    return e;
}

// Redirects std::cout into a buffer for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

} // anonymous namespace

// ===========================================================================
// MetricsMonitor
// ===========================================================================

TEST(MonitorTest, MetricsCountLifecycleThroughManager) {
    ResourceRegistry registry;
    register_builtin_types(registry);
    ResourceManager mgr(Config{}, std::make_shared<MemoryLogSink>(), registry);
    auto metrics = std::make_shared<MetricsMonitor>();
    mgr.set_monitor(metrics);

    mgr.create_resource("CacheDB", "cache1", cache_fields());
    mgr.start_resource("cache1");
    EXPECT_THROW(mgr.start_resource("cache1"), InvalidTransitionError);
    mgr.stop_resource("cache1");
    mgr.delete_resource("cache1");
    EXPECT_THROW(mgr.delete_resource("ghost"), NotFoundError);

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.resources_created, 1u);
    EXPECT_EQ(m.resources_started, 1u);
    EXPECT_EQ(m.resources_stopped, 1u);
    EXPECT_EQ(m.resources_deleted, 1u);
    EXPECT_EQ(m.transitions_rejected, 1u);
    EXPECT_EQ(m.operations_failed, 1u);
    EXPECT_EQ(m.audit_write_failures, 0u);
}

TEST(MonitorTest, MetricsReset) {
    MetricsMonitor metrics;
    metrics.on_event(make_event(EventType::ResourceCreated));
    metrics.on_event(make_event(EventType::AuditWriteFailed));
    EXPECT_EQ(metrics.get_metrics().resources_created, 1u);
    EXPECT_EQ(metrics.get_metrics().audit_write_failures, 1u);

    metrics.reset_metrics();
    EXPECT_EQ(metrics.get_metrics().resources_created, 0u);
    EXPECT_EQ(metrics.get_metrics().audit_write_failures, 0u);
}

TEST(MonitorTest, MetricsIgnoreInformationalEvents) {
    MetricsMonitor metrics;
    metrics.on_event(make_event(EventType::AuditEntryWritten));
    metrics.on_event(make_event(EventType::ResourceTypeRegistered));

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.resources_created + m.resources_started + m.operations_failed, 0u);
}

// ===========================================================================
// CompositeMonitor
// ===========================================================================

TEST(MonitorTest, CompositeForwardsToEveryMonitor) {
    auto a = std::make_shared<MetricsMonitor>();
    auto b = std::make_shared<MetricsMonitor>();
    CompositeMonitor composite;
    composite.add_monitor(a);
    composite.add_monitor(b);

    composite.on_event(make_event(EventType::ResourceStarted));
    EXPECT_EQ(a->get_metrics().resources_started, 1u);
    EXPECT_EQ(b->get_metrics().resources_started, 1u);
}

// ===========================================================================
// ConsoleMonitor
// ===========================================================================

TEST(MonitorTest, ConsoleNormalPrintsImportantEvents) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);
    CoutCapture capture;

    console.on_event(make_event(EventType::ResourceStarted));
    console.on_event(make_event(EventType::AuditEntryWritten));

    std::string out = capture.str();
    EXPECT_NE(out.find("[CloudConnect] ResourceStarted"), std::string::npos);
    EXPECT_NE(out.find("resource=cache1"), std::string::npos);
    EXPECT_NE(out.find("state=Running"), std::string::npos);
    EXPECT_NE(out.find("| test message"), std::string::npos);
    EXPECT_EQ(out.find("AuditEntryWritten"), std::string::npos);
}

TEST(MonitorTest, ConsoleQuietPrintsNothing) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Quiet);
    CoutCapture capture;
    console.on_event(make_event(EventType::ResourceCreated));
    EXPECT_TRUE(capture.str().empty());
}

TEST(MonitorTest, ConsoleVerbosePrintsEverything) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Verbose);
    CoutCapture capture;
    console.on_event(make_event(EventType::AuditEntryWritten));
    EXPECT_NE(capture.str().find("AuditEntryWritten"), std::string::npos);
}

TEST(MonitorTest, EventTypeNames) {
    EXPECT_STREQ(to_string(EventType::TransitionRejected), "TransitionRejected");
    EXPECT_STREQ(to_string(EventType::AuditWriteFailed), "AuditWriteFailed");
}
