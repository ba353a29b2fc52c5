#include "schema/consistency_checker.hpp"

#include <iostream>
#include <sstream>
#include <unordered_set>

namespace schemalint {

void ConsistencyChecker::log(const std::string& msg) const {
    if (enable_logging_) std::cout << "[ConsistencyChecker] " << msg << std::endl;
}

void ConsistencyChecker::reportError(SchemaErrorKind kind, const TableSpec& table, const std::string& message) {
    throw SchemaError(kind, table.name, message);
}

std::optional<std::size_t> ConsistencyChecker::findColumn(const TableSpec& table, const ColumnName& name) {
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (table.columns[i].name == name) return i;
    }
    return std::nullopt;
}

AnnotatedSchema ConsistencyChecker::check(const Schema& schema) const {
    const TableIndex tables = checkTableNames(schema);

    AnnotatedSchema annotated;
    for (const auto& table : schema) {
        checkColumnNames(table);
        auto indices = resolvePrimaryKey(table);
        checkUniqueColumns(table);
        for (const auto& fk : table.foreign_keys) {
            checkForeignKey(table, fk, tables);
        }
        annotated.add(AnnotatedTableSpec{table, std::move(indices)});
        log("table '" + table.name + "' ok (" + std::to_string(table.columns.size()) + " columns, " +
            std::to_string(table.foreign_keys.size()) + " foreign keys)");
    }
    log("schema ok: " + std::to_string(annotated.size()) + " tables");
    return annotated;
}

ConsistencyChecker::TableIndex ConsistencyChecker::checkTableNames(const Schema& schema) const {
    TableIndex tables;
    for (const auto& table : schema) {
        if (table.name.empty()) {
            reportError(SchemaErrorKind::EMPTY_TABLE_NAME, table, "Invalid table name: ''");
        }
        if (!tables.emplace(table.name, &table).second) {
            reportError(SchemaErrorKind::DUPLICATE_TABLE, table, "Table name exists: '" + table.name + "'");
        }
    }
    return tables;
}

void ConsistencyChecker::checkColumnNames(const TableSpec& table) const {
    std::unordered_set<ColumnName> names;
    for (const auto& column : table.columns) {
        if (column.name.empty()) {
            reportError(SchemaErrorKind::EMPTY_COLUMN_NAME, table,
                        "Invalid column name: '" + table.name + "'.''");
        }
        if (!names.insert(column.name).second) {
            reportError(SchemaErrorKind::DUPLICATE_COLUMN, table,
                        "Column name exists: '" + table.name + "'.'" + column.name + "'");
        }
    }
}

std::vector<std::size_t> ConsistencyChecker::resolvePrimaryKey(const TableSpec& table) const {
    std::vector<std::size_t> indices;
    if (!table.primary_key) return indices;
    indices.reserve(table.primary_key->size());
    for (const auto& name : *table.primary_key) {
        auto index = findColumn(table, name);
        if (!index) {
            reportError(SchemaErrorKind::UNRESOLVED_PRIMARY_KEY, table,
                        "Primary key column not found: '" + table.name + "'.'" + name + "'");
        }
        indices.push_back(*index);
    }
    return indices;
}

void ConsistencyChecker::checkUniqueColumns(const TableSpec& table) const {
    for (const auto& unique : table.unique_columns) {
        for (const auto& name : unique) {
            if (!findColumn(table, name)) {
                reportError(SchemaErrorKind::UNRESOLVED_UNIQUE_COLUMN, table,
                            "Unique column not found: '" + table.name + "'.'" + name + "' in unique key " +
                                unique.to_string());
            }
        }
    }
}

void ConsistencyChecker::checkForeignKey(const TableSpec& table,
                                         const ForeignKeyMapping& fk,
                                         const TableIndex& tables) const {
    const std::string describe = "Foreign key " + fk.local_column.to_string() + " of table '" + table.name +
                                 "' referencing '" + fk.foreign_table + "' " + fk.foreign_column.to_string();

    // a. arity
    if (fk.local_column.size() != fk.foreign_column.size()) {
        std::ostringstream ss;
        ss << describe << ": column count mismatch; " << fk.local_column.size() << " local columns, "
           << fk.foreign_column.size() << " foreign columns";
        reportError(SchemaErrorKind::FOREIGN_KEY_ARITY, table, ss.str());
    }

    // b. foreign table, looked up across the whole schema
    auto it = tables.find(fk.foreign_table);
    if (it == tables.end()) {
        reportError(SchemaErrorKind::UNRESOLVED_FOREIGN_TABLE, table,
                    describe + ": table '" + fk.foreign_table + "' is missing from the schema");
    }
    const TableSpec& foreign = *it->second;

    // c. foreign table must have a primary key
    if (!foreign.primary_key || foreign.primary_key->size() == 0) {
        reportError(SchemaErrorKind::FOREIGN_TABLE_WITHOUT_PRIMARY_KEY, table,
                    describe + ": table '" + foreign.name + "' has no primary key");
    }

    // d. exactly the primary key, same names in the same order
    if (fk.foreign_column != *foreign.primary_key) {
        reportError(SchemaErrorKind::FOREIGN_COLUMN_NOT_PRIMARY_KEY, table,
                    describe + ": foreign column is not the primary key of '" + foreign.name + "' " +
                        foreign.primary_key->to_string());
    }

    // e. every name resolves on both sides
    std::vector<std::size_t> local_indices;
    std::vector<std::size_t> foreign_indices;
    for (const auto& name : fk.local_column) {
        auto index = findColumn(table, name);
        if (!index) {
            reportError(SchemaErrorKind::UNRESOLVED_LOCAL_COLUMN, table,
                        describe + ": column '" + table.name + "'.'" + name + "' does not exist");
        }
        local_indices.push_back(*index);
    }
    for (const auto& name : fk.foreign_column) {
        auto index = findColumn(foreign, name);
        if (!index) {
            reportError(SchemaErrorKind::UNRESOLVED_FOREIGN_COLUMN, table,
                        describe + ": found table, but column '" + foreign.name + "'.'" + name +
                            "' is missing from the table's schema");
        }
        foreign_indices.push_back(*index);
    }

    // f. pairwise type equality
    for (std::size_t i = 0; i < local_indices.size(); ++i) {
        const ColumnSpec& local = table.columns[local_indices[i]];
        const ColumnSpec& remote = foreign.columns[foreign_indices[i]];
        if (local.type != remote.type) {
            reportError(SchemaErrorKind::FOREIGN_KEY_TYPE_MISMATCH, table,
                        describe + ": type mismatch between '" + table.name + "'.'" + local.name + "' (" +
                            local.type.to_string() + ") and '" + foreign.name + "'.'" + remote.name + "' (" +
                            remote.type.to_string() + ")");
        }
    }
}

} // namespace schemalint
