#pragma once
#include <memory>
#include <ostream>
#include <string>

#include "common/errors.hpp"
#include "common/options.hpp"
#include "schema/types.hpp"
#include "source/row_source.hpp"

namespace schemalint {

// Consistency check followed by data validation. Throws the first
// violation; returns normally when the data satisfies the schema.
void lint(const Schema& schema, RowSource& source, bool enable_logging = false);

// Front door used by the command line: loads the schema named by the
// options, then checks it against the files in the data directory.
class Linter {
public:
    explicit Linter(LintOptions options);
    // Uses the given source instead of the data directory
    Linter(LintOptions options, std::unique_ptr<RowSource> source);

    Schema load_schema();

    // Runs the pass selected by the options. Only --dump-schema writes to out.
    void run(std::ostream& out);

private:
    void log(const std::string& msg) const;

    LintOptions options_;
    std::unique_ptr<RowSource> source_;
};

// Process exit status for a diagnostic: 1 for schema/data violations,
// 2 for unreadable input, 64 for usage errors.
int exit_code_for(const LintError& error);

} // namespace schemalint
