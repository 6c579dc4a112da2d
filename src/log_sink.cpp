#include "cloudconnect/log_sink.hpp"

#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cloudconnect {

namespace fs = std::filesystem;

std::string format_clock_time(Timestamp t) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &tt);
#else
    localtime_r(&tt, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%I:%M %p");
    return oss.str();
}

std::string format_audit_line(Timestamp t, const std::string& message) {
    return "[" + format_clock_time(t) + "] " + message;
}

// ========== FileLogSink ==========

FileLogSink::FileLogSink(std::string log_dir)
    : log_dir_(std::move(log_dir))
{
    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create log directory '" + log_dir_ +
                                 "': " + ec.message());
    }
}

void FileLogSink::append(const std::string& resource_name, const std::string& message) {
    std::string line = format_audit_line(Clock::now(), message);
    std::string path = path_for(resource_name);

    std::lock_guard<std::mutex> lock(write_mutex_);
    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open log file '" + path + "'");
    }
    out << line << "\n";
    out.flush();
    if (!out) {
        throw std::runtime_error("Write to log file '" + path + "' failed");
    }
}

std::string FileLogSink::path_for(const std::string& resource_name) const {
    std::string file;
    file.reserve(resource_name.size());
    for (char c : resource_name) {
        switch (c) {
            case '%':  file += "%25"; break;
            case '/':  file += "%2F"; break;
            case '\\': file += "%5C"; break;
            default:   file += c;     break;
        }
    }
    return (fs::path(log_dir_) / (file + ".log")).string();
}

std::vector<std::string> FileLogSink::read(const std::string& resource_name) const {
    std::vector<std::string> result;
    std::ifstream in(path_for(resource_name));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) result.push_back(line);
    }
    return result;
}

const std::string& FileLogSink::log_dir() const noexcept { return log_dir_; }

// ========== MemoryLogSink ==========

void MemoryLogSink::append(const std::string& resource_name, const std::string& message) {
    std::string line = format_audit_line(Clock::now(), message);
    std::lock_guard<std::mutex> lock(mutex_);
    lines_[resource_name].push_back(std::move(line));
}

std::vector<std::string> MemoryLogSink::lines(const std::string& resource_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lines_.find(resource_name);
    if (it == lines_.end()) return {};
    return it->second;
}

std::size_t MemoryLogSink::total_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (auto& [_, v] : lines_) {
        total += v.size();
    }
    return total;
}

void MemoryLogSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

// ========== CompositeLogSink ==========

void CompositeLogSink::add_sink(std::shared_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

void CompositeLogSink::append(const std::string& resource_name, const std::string& message) {
    std::exception_ptr first_error;
    for (auto& s : sinks_) {
        try {
            s->append(resource_name, message);
        } catch (const std::exception&) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

// ========== Default sink ==========

std::shared_ptr<LogSink> make_default_sink(const Config& config) {
    if (config.write_audit_files) {
        return std::make_shared<FileLogSink>(config.log_dir);
    }
    return std::make_shared<MemoryLogSink>();
}

} // namespace cloudconnect
