#pragma once

#include "cloudconnect/types.hpp"
#include "cloudconnect/config.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudconnect {

// "10:42 AM" in local time
std::string format_clock_time(Timestamp t);

// "[10:42 AM] AppService started in WestEurope"
std::string format_audit_line(Timestamp t, const std::string& message);

// Destination for per-resource audit lines. append() stamps the line with
// the current time. Implementations report write failures by throwing.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void append(const std::string& resource_name, const std::string& message) = 0;
};

// One "<log_dir>/<resource>.log" file per resource, appended line by line.
class FileLogSink : public LogSink {
public:
    // Creates log_dir if it does not exist.
    explicit FileLogSink(std::string log_dir = "logs");

    void append(const std::string& resource_name, const std::string& message) override;

    // Escapes '%', '/' and '\\' as %25, %2F and %5C so that distinct
    // resource names never share a file.
    std::string path_for(const std::string& resource_name) const;

    // Lines of the resource's file; empty if it has none.
    std::vector<std::string> read(const std::string& resource_name) const;

    const std::string& log_dir() const noexcept;

private:
    std::string log_dir_;
    std::mutex write_mutex_;
};

// Keeps audit lines in memory
class MemoryLogSink : public LogSink {
public:
    void append(const std::string& resource_name, const std::string& message) override;

    std::vector<std::string> lines(const std::string& resource_name) const;
    std::size_t total_lines() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> lines_;
};

// Fan-out to multiple sinks
class CompositeLogSink : public LogSink {
public:
    void add_sink(std::shared_ptr<LogSink> sink);

    // Every sink is tried; the first failure is rethrown afterwards.
    void append(const std::string& resource_name, const std::string& message) override;

private:
    std::vector<std::shared_ptr<LogSink>> sinks_;
};

// FileLogSink under config.log_dir, or a MemoryLogSink if
// config.write_audit_files is false.
std::shared_ptr<LogSink> make_default_sink(const Config& config);

} // namespace cloudconnect
