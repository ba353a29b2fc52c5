#include "linter/linter.hpp"

#include <iostream>

#include "schema/consistency_checker.hpp"
#include "schema/control_file_reader.hpp"
#include "schema/json_schema_reader.hpp"
#include "source/file_system_row_source.hpp"
#include "validation/data_validator.hpp"

namespace schemalint {

void lint(const Schema& schema, RowSource& source, bool enable_logging) {
    // 1) schema only: nothing is read before the schema is proven consistent
    ConsistencyChecker checker(enable_logging);
    const AnnotatedSchema tables = checker.check(schema);

    // 2) data
    DataValidator validator(enable_logging);
    validator.validate(tables, source);
}

Linter::Linter(LintOptions options)
    : options_(std::move(options)),
      source_(std::make_unique<FileSystemRowSource>(options_.data_dir, options_.extension, options_.delimiter,
                                                    options_.verbose)) {}

Linter::Linter(LintOptions options, std::unique_ptr<RowSource> source)
    : options_(std::move(options)), source_(std::move(source)) {}

void Linter::log(const std::string& msg) const {
    if (options_.verbose) std::cout << "[Linter] " << msg << std::endl;
}

Schema Linter::load_schema() {
    if (options_.schema_format == SchemaFormat::JSON) {
        log("reading schema document " + options_.schema_path);
        return read_json_schema(options_.schema_path);
    }
    log("reading control file '" + std::string(CONTROL_FILE_TABLE) + "' in " + options_.data_dir);
    return read_control_file(*source_, CONTROL_FILE_TABLE, options_.verbose);
}

void Linter::run(std::ostream& out) {
    const Schema schema = load_schema();

    if (options_.dump_schema) {
        ConsistencyChecker(options_.verbose).check(schema);
        out << schema_to_json(schema).dump(2) << std::endl;
        return;
    }
    if (options_.check_only) {
        ConsistencyChecker(options_.verbose).check(schema);
        log("schema is consistent");
        return;
    }

    lint(schema, *source_, options_.verbose);
    log("data satisfies the schema");
}

int exit_code_for(const LintError& error) {
    if (dynamic_cast<const UsageError*>(&error)) return 64;
    if (dynamic_cast<const SourceError*>(&error)) return 2;
    return 1;
}

} // namespace schemalint
