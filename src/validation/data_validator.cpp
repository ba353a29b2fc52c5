#include "validation/data_validator.hpp"

#include <iostream>
#include <sstream>

#include "validation/value_validator.hpp"

namespace schemalint {

namespace {

std::string row_prefix(const TableSpec& spec, std::size_t row_number) {
    return "Table '" + spec.name + "' row " + std::to_string(row_number);
}

std::string render_tuple(const CompositeKeySet::Tuple& tuple) {
    std::ostringstream oss;
    oss << '(';
    for (std::size_t i = 0; i < tuple.size(); ++i) {
        if (i) oss << ", ";
        oss << '"' << tuple[i] << '"';
    }
    oss << ')';
    return oss.str();
}

} // namespace

void DataValidator::log(const std::string& msg) const {
    if (enable_logging_) std::cout << "[DataValidator] " << msg << std::endl;
}

void DataValidator::validate(const AnnotatedSchema& tables, RowSource& source) const {
    for (const auto& table : tables) {
        validate_table(table, source);
    }
    log("all " + std::to_string(tables.size()) + " tables passed");
}

void DataValidator::validate_table(const AnnotatedTableSpec& table, RowSource& source) const {
    const TableSpec& spec = table.spec;
    source.with_table(spec.name, [&](Rows& rows) {
        checkHeaders(spec, rows.headers());

        // scoped to this table; dropped when validation of the table ends
        CompositeKeySet keys;
        const std::vector<RowCheck> pipeline = buildPipeline(table, keys);

        std::size_t row_number = 1; // header
        while (rows.next()) {
            ++row_number;
            const Record& row = rows.current();
            for (const auto& check : pipeline) {
                check(row, row_number);
            }
        }
        log("table '" + spec.name + "' ok: " + std::to_string(row_number - 1) + " rows, " +
            std::to_string(keys.size()) + " distinct keys");
    });
}

void DataValidator::checkHeaders(const TableSpec& spec, const Record& headers) const {
    if (headers.size() != spec.columns.size()) {
        std::ostringstream ss;
        ss << "Table '" << spec.name << "': column number mismatch; wanted " << spec.columns.size()
           << " columns, found " << headers.size();
        throw DataError(DataErrorKind::HEADER_ARITY, spec.name, 1, ss.str());
    }
    // positional: a permuted header is rejected even when the names match as a set
    for (std::size_t i = 0; i < headers.size(); ++i) {
        if (headers[i] != spec.columns[i].name) {
            std::ostringstream ss;
            ss << "Table '" << spec.name << "': header mismatch at position " << (i + 1) << "; wanted '"
               << spec.columns[i].name << "', found '" << headers[i] << "'";
            throw DataError(DataErrorKind::HEADER_MISMATCH, spec.name, 1, ss.str());
        }
    }
}

std::vector<DataValidator::RowCheck> DataValidator::buildPipeline(const AnnotatedTableSpec& table,
                                                                  CompositeKeySet& keys) const {
    const TableSpec& spec = table.spec;
    std::vector<RowCheck> pipeline;

    // 1) cell count
    pipeline.push_back([&spec](const Record& row, std::size_t row_number) {
        if (row.size() != spec.columns.size()) {
            std::ostringstream ss;
            ss << row_prefix(spec, row_number) << ": column count mismatch; wanted " << spec.columns.size()
               << " columns, found " << row.size();
            throw DataError(DataErrorKind::ROW_ARITY, spec.name, row_number, ss.str());
        }
    });

    // 2) cell types, every cell including empty ones
    pipeline.push_back([&spec](const Record& row, std::size_t row_number) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (auto error = validate_value(spec.columns[i].type, row[i])) {
                throw DataError(DataErrorKind::TYPE_MISMATCH, spec.name, row_number,
                                row_prefix(spec, row_number) + " column '" + spec.columns[i].name + "': " + *error);
            }
        }
    });

    // 3) not-null
    std::vector<std::size_t> not_null;
    for (std::size_t i = 0; i < spec.columns.size(); ++i) {
        if (spec.columns[i].not_null) not_null.push_back(i);
    }
    if (!not_null.empty()) {
        pipeline.push_back([&spec, not_null](const Record& row, std::size_t row_number) {
            for (auto i : not_null) {
                if (row[i].empty()) {
                    throw DataError(DataErrorKind::NULL_VIOLATION, spec.name, row_number,
                                    row_prefix(spec, row_number) + " column '" + spec.columns[i].name +
                                        "': found null value in not-null column");
                }
            }
        });
    }

    // 4) primary-key uniqueness over the projected tuple
    if (spec.primary_key) {
        const std::vector<std::size_t>& indices = table.primary_key_indices;
        pipeline.push_back([&spec, &indices, &keys](const Record& row, std::size_t row_number) {
            CompositeKeySet::Tuple tuple;
            tuple.reserve(indices.size());
            for (auto i : indices) tuple.push_back(row[i]);
            if (keys.exists(tuple)) {
                throw DataError(DataErrorKind::DUPLICATE_KEY, spec.name, row_number,
                                row_prefix(spec, row_number) + ": duplicate value for primary key " +
                                    spec.primary_key->to_string() + ": " + render_tuple(tuple));
            }
            keys.insert(tuple);
        });
    }

    log("table '" + spec.name + "': " + std::to_string(pipeline.size()) + " row checks");
    return pipeline;
}

} // namespace schemalint
