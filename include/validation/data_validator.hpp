#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "schema/types.hpp"
#include "source/row_source.hpp"
#include "validation/composite_key_set.hpp"

namespace schemalint {

// Streams every table of a checked schema through a fixed pipeline of row
// checks. Fail-fast: the first violation throws DataError and nothing after
// it is read.
//
// Not enforced: uniqueness of unique_columns other than the primary key,
// existence of foreign-key values in the referenced table, and null-freedom
// of the individual columns of a composite primary key.
class DataValidator {
public:
    explicit DataValidator(bool enable_logging = false) : enable_logging_(enable_logging) {}

    // Tables are validated one at a time, in schema order
    void validate(const AnnotatedSchema& tables, RowSource& source) const;

    void validate_table(const AnnotatedTableSpec& table, RowSource& source) const;

private:
    // One stage of the per-row pipeline; throws DataError on violation
    using RowCheck = std::function<void(const Record& row, std::size_t row_number)>;

    void checkHeaders(const TableSpec& spec, const Record& headers) const;
    // keys must outlive the returned pipeline
    std::vector<RowCheck> buildPipeline(const AnnotatedTableSpec& table, CompositeKeySet& keys) const;

    void log(const std::string& msg) const;

    bool enable_logging_;
};

} // namespace schemalint
