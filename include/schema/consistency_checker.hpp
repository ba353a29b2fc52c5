#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/errors.hpp"
#include "schema/types.hpp"

namespace schemalint {

// Proves a schema well-formed without touching any data. Checks run in a
// fixed order and the first violation throws SchemaError:
//   1. table names are non-empty and unique
//   then, per table in schema order:
//   2. column names are non-empty and unique
//   3. primary-key columns resolve (their positions are recorded)
//   4. unique-column names resolve
//   5. each foreign key, in declaration order: equal arity, foreign table
//      exists (anywhere in the schema), it has a primary key, the foreign
//      column is exactly that key, every name resolves on both sides, and
//      the paired column types are equal
class ConsistencyChecker {
public:
    explicit ConsistencyChecker(bool enable_logging = false) : enable_logging_(enable_logging) {}

    AnnotatedSchema check(const Schema& schema) const;

private:
    using TableIndex = std::unordered_map<TableName, const TableSpec*>;

    TableIndex checkTableNames(const Schema& schema) const;
    void checkColumnNames(const TableSpec& table) const;
    std::vector<std::size_t> resolvePrimaryKey(const TableSpec& table) const;
    void checkUniqueColumns(const TableSpec& table) const;
    void checkForeignKey(const TableSpec& table, const ForeignKeyMapping& fk, const TableIndex& tables) const;

    // Position of name within table.columns, if declared
    static std::optional<std::size_t> findColumn(const TableSpec& table, const ColumnName& name);
    [[noreturn]] static void reportError(SchemaErrorKind kind, const TableSpec& table, const std::string& message);

    void log(const std::string& msg) const;

    bool enable_logging_;
};

} // namespace schemalint
