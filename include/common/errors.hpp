#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace schemalint {

// Root of every diagnostic the linter can raise. what() is the single
// user-facing message for the run.
class LintError : public std::runtime_error {
public:
    explicit LintError(const std::string& message) : std::runtime_error(message) {}
};

enum class SchemaErrorKind {
    EMPTY_TABLE_NAME,
    DUPLICATE_TABLE,
    EMPTY_COLUMN_NAME,
    DUPLICATE_COLUMN,
    UNRESOLVED_PRIMARY_KEY,
    UNRESOLVED_UNIQUE_COLUMN,
    FOREIGN_KEY_ARITY,
    UNRESOLVED_FOREIGN_TABLE,
    FOREIGN_TABLE_WITHOUT_PRIMARY_KEY,
    FOREIGN_COLUMN_NOT_PRIMARY_KEY,
    UNRESOLVED_LOCAL_COLUMN,
    UNRESOLVED_FOREIGN_COLUMN,
    FOREIGN_KEY_TYPE_MISMATCH
};

inline const char* to_string(SchemaErrorKind kind) {
    switch (kind) {
        case SchemaErrorKind::EMPTY_TABLE_NAME: return "EMPTY_TABLE_NAME";
        case SchemaErrorKind::DUPLICATE_TABLE: return "DUPLICATE_TABLE";
        case SchemaErrorKind::EMPTY_COLUMN_NAME: return "EMPTY_COLUMN_NAME";
        case SchemaErrorKind::DUPLICATE_COLUMN: return "DUPLICATE_COLUMN";
        case SchemaErrorKind::UNRESOLVED_PRIMARY_KEY: return "UNRESOLVED_PRIMARY_KEY";
        case SchemaErrorKind::UNRESOLVED_UNIQUE_COLUMN: return "UNRESOLVED_UNIQUE_COLUMN";
        case SchemaErrorKind::FOREIGN_KEY_ARITY: return "FOREIGN_KEY_ARITY";
        case SchemaErrorKind::UNRESOLVED_FOREIGN_TABLE: return "UNRESOLVED_FOREIGN_TABLE";
        case SchemaErrorKind::FOREIGN_TABLE_WITHOUT_PRIMARY_KEY: return "FOREIGN_TABLE_WITHOUT_PRIMARY_KEY";
        case SchemaErrorKind::FOREIGN_COLUMN_NOT_PRIMARY_KEY: return "FOREIGN_COLUMN_NOT_PRIMARY_KEY";
        case SchemaErrorKind::UNRESOLVED_LOCAL_COLUMN: return "UNRESOLVED_LOCAL_COLUMN";
        case SchemaErrorKind::UNRESOLVED_FOREIGN_COLUMN: return "UNRESOLVED_FOREIGN_COLUMN";
        case SchemaErrorKind::FOREIGN_KEY_TYPE_MISMATCH: return "FOREIGN_KEY_TYPE_MISMATCH";
    }
    return "UNKNOWN";
}

// Structural problem in a schema, found without reading any data.
class SchemaError : public LintError {
public:
    SchemaError(SchemaErrorKind kind, const std::string& table, const std::string& message)
        : LintError(message), kind_(kind), table_(table) {}

    SchemaErrorKind kind() const { return kind_; }
    const std::string& table() const { return table_; }

private:
    SchemaErrorKind kind_;
    std::string table_;
};

// A schema description could not be decoded (bad JSON, unknown type string...).
class SchemaParseError : public LintError {
public:
    explicit SchemaParseError(const std::string& message) : LintError(message) {}
};

// The row source could not locate, open or read a table.
class SourceError : public LintError {
public:
    SourceError(const std::string& table, const std::string& message)
        : LintError(message), table_(table) {}

    const std::string& table() const { return table_; }

private:
    std::string table_;
};

enum class DataErrorKind {
    HEADER_ARITY,
    HEADER_MISMATCH,
    ROW_ARITY,
    TYPE_MISMATCH,
    NULL_VIOLATION,
    DUPLICATE_KEY
};

inline const char* to_string(DataErrorKind kind) {
    switch (kind) {
        case DataErrorKind::HEADER_ARITY: return "HEADER_ARITY";
        case DataErrorKind::HEADER_MISMATCH: return "HEADER_MISMATCH";
        case DataErrorKind::ROW_ARITY: return "ROW_ARITY";
        case DataErrorKind::TYPE_MISMATCH: return "TYPE_MISMATCH";
        case DataErrorKind::NULL_VIOLATION: return "NULL_VIOLATION";
        case DataErrorKind::DUPLICATE_KEY: return "DUPLICATE_KEY";
    }
    return "UNKNOWN";
}

// A table's data violates the schema. row is 1-based with the header as
// row 1, so the first data row is 2.
class DataError : public LintError {
public:
    DataError(DataErrorKind kind, const std::string& table, std::size_t row, const std::string& message)
        : LintError(message), kind_(kind), table_(table), row_(row) {}

    DataErrorKind kind() const { return kind_; }
    const std::string& table() const { return table_; }
    std::size_t row() const { return row_; }

private:
    DataErrorKind kind_;
    std::string table_;
    std::size_t row_;
};

class UsageError : public LintError {
public:
    explicit UsageError(const std::string& message) : LintError(message) {}
};

} // namespace schemalint
