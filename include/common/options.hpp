#pragma once
#include <string>
#include <vector>

namespace schemalint {

enum class SchemaFormat {
    CONTROL_FILE, // <data_dir>/schema<extension>
    JSON
};

struct LintOptions {
    std::string data_dir = ".";
    std::string schema_path;            // JSON schema document, only for SchemaFormat::JSON
    SchemaFormat schema_format = SchemaFormat::CONTROL_FILE;
    std::string extension = ".csv";     // appended to table names to find their files
    char delimiter = ',';
    bool check_only = false;            // stop after the consistency check
    bool dump_schema = false;           // print the checked schema as JSON and stop
    bool verbose = false;
    bool show_help = false;
};

// Parses command-line arguments (without the program name). Throws
// UsageError on unknown flags, missing values or conflicting options.
LintOptions parse_options(const std::vector<std::string>& args);

std::string usage(const std::string& program);

} // namespace schemalint
