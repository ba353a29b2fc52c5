#pragma once
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemalint {

// Shared schema types for the consistency checker, the data validator and
// the schema readers.

enum class TypeKind {
    INT,
    BOOL,
    STRING,
    DATE
};

struct DataType {
    TypeKind kind = TypeKind::STRING;
    std::string format; // strptime-style layout, DATE only

    bool operator==(const DataType& other) const {
        return kind == other.kind && (kind != TypeKind::DATE || format == other.format);
    }
    bool operator!=(const DataType& other) const { return !(*this == other); }

    // Textual form: int, bool, string or date(<format>)
    std::string to_string() const;
};

// Parses the textual form produced by DataType::to_string(). Returns
// std::nullopt for anything else; callers turn that into a parse error.
std::optional<DataType> parse_data_type(const std::string& text);

using ColumnName = std::string;
using TableName = std::string;

// Ordered, non-empty list of column names. A single column when size() == 1,
// a composite key otherwise. Equality is positional.
class Column {
public:
    explicit Column(std::vector<ColumnName> names);
    Column(std::initializer_list<ColumnName> names);

    const std::vector<ColumnName>& names() const { return names_; }
    std::size_t size() const { return names_.size(); }
    const ColumnName& operator[](std::size_t i) const { return names_[i]; }
    std::vector<ColumnName>::const_iterator begin() const { return names_.begin(); }
    std::vector<ColumnName>::const_iterator end() const { return names_.end(); }

    // 'a' for a single column, ('a', 'b') for a composite one
    std::string to_string() const;

    bool operator==(const Column& other) const { return names_ == other.names_; }
    bool operator!=(const Column& other) const { return !(*this == other); }

private:
    std::vector<ColumnName> names_;
};

struct ColumnSpec {
    ColumnName name;
    DataType type;
    bool not_null = false;
};

struct ForeignKeyMapping {
    Column local_column;
    TableName foreign_table;
    Column foreign_column;
};

struct TableSpec {
    TableName name;
    std::optional<Column> primary_key;
    std::vector<Column> unique_columns;
    std::vector<ForeignKeyMapping> foreign_keys;
    std::vector<ColumnSpec> columns;
};

using Schema = std::vector<TableSpec>;

// TableSpec plus the position of every primary-key column within columns.
struct AnnotatedTableSpec {
    TableSpec spec;
    std::vector<std::size_t> primary_key_indices;
};

// Output of the consistency check: tables in schema order, addressable by
// name. Built once, read-only afterwards.
class AnnotatedSchema {
public:
    using const_iterator = std::vector<AnnotatedTableSpec>::const_iterator;

    void add(AnnotatedTableSpec table);

    const AnnotatedTableSpec* find(const TableName& name) const;
    const AnnotatedTableSpec& at(const TableName& name) const;

    std::size_t size() const { return tables_.size(); }
    bool empty() const { return tables_.empty(); }
    const_iterator begin() const { return tables_.begin(); }
    const_iterator end() const { return tables_.end(); }

private:
    std::vector<AnnotatedTableSpec> tables_;
    std::unordered_map<TableName, std::size_t> index_; // table name -> position in tables_
};

} // namespace schemalint
