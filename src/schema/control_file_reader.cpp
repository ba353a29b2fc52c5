#include "schema/control_file_reader.hpp"

#include <iostream>
#include <unordered_map>

#include "common/errors.hpp"
#include "schema/consistency_checker.hpp"
#include "validation/data_validator.hpp"

namespace schemalint {

namespace {

// Header positions; the metaschema check guarantees this exact order
enum ControlColumn : std::size_t {
    COL_TABLE = 0,
    COL_COLUMN,
    COL_NOT_NULL,
    COL_UNIQUE,
    COL_PRIMARY_KEY,
    COL_TYPE,
    COL_REFERENCES_TABLE,
    COL_REFERENCES_COLUMN
};

bool parse_flag(const std::string& value, const std::string& where) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw SchemaParseError(where + ": failed to parse bool: '" + value + "'");
}

// Accumulates rows into tables, keeping first-appearance order
class SchemaBuilder {
public:
    TableSpec& table(const TableName& name) {
        auto it = index_.find(name);
        if (it != index_.end()) return tables_[it->second].spec;
        index_[name] = tables_.size();
        tables_.push_back(Pending{});
        tables_.back().spec.name = name;
        return tables_.back().spec;
    }

    // name must already have been opened with table()
    void add_primary_key_column(const TableName& name, const ColumnName& column) {
        tables_[index_.at(name)].primary_key.push_back(column);
    }

    Schema build() {
        Schema schema;
        schema.reserve(tables_.size());
        for (auto& pending : tables_) {
            if (!pending.primary_key.empty()) pending.spec.primary_key = Column(std::move(pending.primary_key));
            schema.push_back(std::move(pending.spec));
        }
        return schema;
    }

private:
    struct Pending {
        TableSpec spec;
        std::vector<ColumnName> primary_key;
    };

    std::vector<Pending> tables_;
    std::unordered_map<TableName, std::size_t> index_;
};

} // namespace

Schema control_file_metaschema(const TableName& name) {
    const DataType string_type{TypeKind::STRING, ""};
    const DataType bool_type{TypeKind::BOOL, ""};

    TableSpec meta;
    meta.name = name;
    meta.columns = {
        {"table", string_type, true},
        {"column", string_type, true},
        {"not_null", bool_type, true},
        {"unique", bool_type, true},
        {"primary_key", bool_type, true},
        {"type", string_type, true},
        {"references_table", string_type, false},
        {"references_column", string_type, false},
    };
    // one row per column of each described table
    meta.primary_key = Column{"table", "column"};
    return Schema{meta};
}

Schema read_control_file(RowSource& source, const TableName& name, bool enable_logging) {
    // the control file is itself data: validate it like any other table first
    const AnnotatedSchema meta = ConsistencyChecker(enable_logging).check(control_file_metaschema(name));
    DataValidator(enable_logging).validate(meta, source);

    SchemaBuilder builder;
    source.with_table(name, [&](Rows& rows) {
        std::size_t row_number = 1;
        while (rows.next()) {
            ++row_number;
            const Record& row = rows.current();
            const std::string where = "Table '" + name + "' row " + std::to_string(row_number);

            const TableName& table_name = row[COL_TABLE];
            const std::string& type_text = row[COL_TYPE];
            auto type = parse_data_type(type_text);
            if (!type) {
                throw SchemaParseError("Error parsing column type in " + where + ": Couldn't match type: '" +
                                       type_text + "'");
            }

            ColumnSpec column{row[COL_COLUMN], *type, parse_flag(row[COL_NOT_NULL], where)};
            const bool unique = parse_flag(row[COL_UNIQUE], where);
            const bool primary = parse_flag(row[COL_PRIMARY_KEY], where);
            const std::string& ref_table = row[COL_REFERENCES_TABLE];
            const std::string& ref_column = row[COL_REFERENCES_COLUMN];
            if (ref_table.empty() != ref_column.empty()) {
                throw SchemaParseError(where + ": references_table and references_column must be given together");
            }

            TableSpec& table = builder.table(table_name);
            table.columns.push_back(column);
            if (unique) table.unique_columns.push_back(Column{column.name});
            if (!ref_table.empty()) {
                table.foreign_keys.push_back(ForeignKeyMapping{Column{column.name}, ref_table, Column{ref_column}});
            }
            if (primary) builder.add_primary_key_column(table_name, column.name);
        }
        if (enable_logging) {
            std::cout << "[ControlFileReader] lowered " << (row_number - 1) << " column rows" << std::endl;
        }
    });
    return builder.build();
}

} // namespace schemalint
