// cloudconnect: interactive console for the resource manager
//
// Menu-driven front-end: every action reads its input, calls into the
// ResourceManager and prints the outcome. Errors are shown and the loop
// continues.

#include <cloudconnect/cloudconnect.hpp>

#include <cctype>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cloudconnect;

namespace {

enum class FieldKind { Text, Integer, Boolean };

struct FieldPrompt {
    std::string field;
    std::string prompt;
    FieldKind kind;
};

// Prompts for the built-in types. Types registered later without an entry
// here are created with an empty field set.
const std::map<std::string, std::vector<FieldPrompt>>& field_prompts() {
    static const std::map<std::string, std::vector<FieldPrompt>> prompts = {
        {"AppService", {
            {"runtime",       "Select runtime (python / nodejs / dotnet): ",           FieldKind::Text},
            {"region",        "Select region (EastUS / WestEurope / CentralIndia): ", FieldKind::Text},
            {"replica_count", "Select replica count (1 / 2 / 3): ",                   FieldKind::Integer},
        }},
        {"StorageAccount", {
            {"encryption_enabled", "Enable encryption? (true / false): ", FieldKind::Boolean},
            {"access_key",         "Enter access key: ",                  FieldKind::Text},
            {"max_size_gb",        "Enter max size (GB): ",               FieldKind::Integer},
        }},
        {"CacheDB", {
            {"ttl_seconds",     "Enter TTL (seconds): ",                   FieldKind::Integer},
            {"capacity_mb",     "Enter capacity (MB): ",                   FieldKind::Integer},
            {"eviction_policy", "Enter eviction policy (LRU / FIFO): ",    FieldKind::Text},
        }},
    };
    return prompts;
}

bool read_line(const std::string& prompt, std::string& out) {
    std::cout << prompt;
    return static_cast<bool>(std::getline(std::cin, out));
}

// Converts console text to a typed field value. Returns false if the text
// is not a valid integer.
bool to_field_value(const std::string& text, FieldKind kind, FieldValue& out) {
    switch (kind) {
        case FieldKind::Text:
            out = text;
            return true;
        case FieldKind::Boolean: {
            std::string lower;
            for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            out = (lower == "true");
            return true;
        }
        case FieldKind::Integer:
            try {
                std::size_t pos = 0;
                std::int64_t v = std::stoll(text, &pos);
                if (pos != text.size()) return false;
                out = v;
                return true;
            } catch (const std::logic_error&) {
                return false;
            }
    }
    return false;
}

std::string log_location(const ResourceManager& manager, const std::string& name) {
    if (auto file_sink = std::dynamic_pointer_cast<FileLogSink>(manager.log_sink())) {
        return file_sink->path_for(name);
    }
    return "in-memory audit log";
}

class Console {
public:
    explicit Console(ResourceManager& manager) : manager_(manager) {}

    void run() {
        std::string choice;
        while (true) {
            std::cout << "\n1. Create Resource\n"
                      << "2. Start Resource\n"
                      << "3. Stop Resource\n"
                      << "4. Delete Resource\n"
                      << "5. View Logs\n"
                      << "6. Exit\n"
                      << "7. List Resources\n";
            if (!read_line("Enter choice: ", choice)) return;

            if (choice == "1")      create_resource();
            else if (choice == "2") start_resource();
            else if (choice == "3") stop_resource();
            else if (choice == "4") delete_resource();
            else if (choice == "5") view_logs();
            else if (choice == "6") return;
            else if (choice == "7") list_resources();
            else std::cout << "Invalid choice. Please try again.\n";
        }
    }

private:
    ResourceManager& manager_;

    void create_resource() {
        auto types = manager_.registered_types();
        std::cout << "Select resource type:\n";
        for (std::size_t i = 0; i < types.size(); ++i) {
            std::cout << (i + 1) << ". " << types[i] << "\n";
        }

        std::string text;
        if (!read_line("Choice: ", text)) return;
        FieldValue index;
        if (!to_field_value(text, FieldKind::Integer, index)) {
            std::cout << "Invalid selection. Please try again.\n";
            return;
        }
        auto idx = std::get<std::int64_t>(index) - 1;
        if (idx < 0 || idx >= static_cast<std::int64_t>(types.size())) {
            std::cout << "Invalid selection. Please try again.\n";
            return;
        }
        const std::string& type = types[static_cast<std::size_t>(idx)];

        std::string name;
        if (!read_line("Enter resource name: ", name)) return;
        if (manager_.contains(name)) {
            std::cout << "Error: A resource with this name already exists.\n";
            return;
        }

        FieldBag fields;
        auto it = field_prompts().find(type);
        if (it != field_prompts().end()) {
            for (auto& p : it->second) {
                if (!read_line(p.prompt, text)) return;
                FieldValue value;
                if (!to_field_value(text, p.kind, value)) {
                    std::cout << "Invalid selection. Please try again.\n";
                    return;
                }
                fields[p.field] = value;
            }
        }

        try {
            manager_.create_resource(type, name, fields);
            std::cout << type << " created successfully!\n";
        } catch (const CloudConnectException& e) {
            std::cout << e.what() << "\n";
        }
    }

    void start_resource() {
        std::string name;
        if (!read_line("Enter resource name: ", name)) return;
        try {
            auto info = manager_.start_resource(name);
            std::cout << info.type_tag << " started at "
                      << format_clock_time(info.last_transition_at) << " "
                      << (info.start_detail.empty() ? "in N/A" : info.start_detail)
                      << "\n(Log written to " << log_location(manager_, name) << ")\n";
        } catch (const CloudConnectException& e) {
            std::cout << e.what() << "\n";
        }
    }

    void stop_resource() {
        std::string name;
        if (!read_line("Enter resource name: ", name)) return;
        try {
            auto info = manager_.stop_resource(name);
            std::cout << info.type_tag << " stopped successfully.\n";
        } catch (const CloudConnectException& e) {
            std::cout << e.what() << "\n";
        }
    }

    void delete_resource() {
        std::string name;
        if (!read_line("Enter resource name: ", name)) return;
        try {
            auto info = manager_.delete_resource(name);
            std::cout << info.type_tag << " marked as deleted.\n";
        } catch (const CloudConnectException& e) {
            std::cout << e.what() << "\n";
        }
    }

    void view_logs() {
        std::string name;
        if (!read_line("Enter resource name: ", name)) return;
        try {
            auto lines = manager_.view_logs(name);
            std::cout << "Displaying latest log entries...\n";
            for (auto& line : lines) {
                std::cout << line << "\n";
            }
        } catch (const NotFoundError&) {
            std::cout << "No logs found for this resource.\n";
        }
    }

    void list_resources() {
        auto all = manager_.get_all_resources();
        if (all.empty()) {
            std::cout << "No resources yet.\n";
            return;
        }
        for (auto& r : all) {
            std::cout << "  " << r.name << " [" << to_string(r.state) << "] "
                      << r.description << "\n";
        }
    }
};

} // anonymous namespace

int main(int argc, char** argv) {
    Config config;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-dir" && i + 1 < argc) {
            config.log_dir = argv[++i];
        } else if (arg == "--no-log-files") {
            config.write_audit_files = false;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "usage: " << argv[0]
                      << " [--log-dir DIR] [--no-log-files] [--verbose]\n";
            return 2;
        }
    }

    try {
        ResourceManager manager(config);
        manager.set_monitor(std::make_shared<ConsoleMonitor>(
            verbose ? ConsoleMonitor::Verbosity::Verbose : ConsoleMonitor::Verbosity::Quiet));

        Console console(manager);
        console.run();
    } catch (const std::exception& e) {
        std::cerr << "cloudconnect: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
