#include "common/options.hpp"

#include <sstream>

#include "common/errors.hpp"

namespace schemalint {

static std::string unescape_delimiter(const std::string& value) {
    if (value == "\\t" || value == "tab") return "\t";
    return value;
}

LintOptions parse_options(const std::vector<std::string>& args) {
    LintOptions options;
    bool control_file_requested = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw UsageError("Missing value for option '" + arg + "'");
            return args[++i];
        };

        if (arg == "--data-dir" || arg == "-d") {
            options.data_dir = value();
        } else if (arg == "--schema" || arg == "-s") {
            options.schema_path = value();
            options.schema_format = SchemaFormat::JSON;
        } else if (arg == "--control-file") {
            control_file_requested = true;
        } else if (arg == "--extension") {
            options.extension = value();
        } else if (arg == "--delimiter") {
            const std::string delimiter = unescape_delimiter(value());
            if (delimiter.size() != 1 || delimiter == "\"" || delimiter == "\n" || delimiter == "\r") {
                throw UsageError("Delimiter must be a single character other than quote or line break");
            }
            options.delimiter = delimiter[0];
        } else if (arg == "--check-only") {
            options.check_only = true;
        } else if (arg == "--dump-schema") {
            options.dump_schema = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            throw UsageError("Unknown option '" + arg + "'");
        }
    }

    if (control_file_requested && options.schema_format == SchemaFormat::JSON) {
        throw UsageError("--schema and --control-file are mutually exclusive");
    }
    if (options.schema_format == SchemaFormat::JSON && options.schema_path.empty()) {
        throw UsageError("--schema needs a file name");
    }
    return options;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Checks delimited data files against a relational schema.\n"
        << "\n"
        << "  -d, --data-dir DIR    directory holding the table files (default: .)\n"
        << "  -s, --schema FILE     JSON schema document\n"
        << "      --control-file    read the schema from DIR/schema.csv (default)\n"
        << "      --extension EXT   table file extension (default: .csv)\n"
        << "      --delimiter C     field delimiter, '\\t' for tab (default: ,)\n"
        << "      --check-only      only check the schema, read no data\n"
        << "      --dump-schema     print the checked schema as JSON\n"
        << "  -v, --verbose         log progress to stdout\n"
        << "  -h, --help            show this help\n"
        << "\n"
        << "Exit status: 0 ok, 1 schema or data violation, 2 unreadable input, 64 usage error.\n";
    return oss.str();
}

} // namespace schemalint
