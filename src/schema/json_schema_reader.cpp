#include "schema/json_schema_reader.hpp"

#include <fstream>
#include <sstream>

#include "common/errors.hpp"

namespace schemalint {

namespace {

// Member of obj, or nullptr when absent or null
const json* member(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

std::string string_member(const json& obj, const char* key, const std::string& where) {
    const json* value = member(obj, key);
    if (!value) throw SchemaParseError(where + ": missing member '" + key + "'");
    if (!value->is_string()) throw SchemaParseError(where + ": member '" + key + "' must be a string");
    return value->get<std::string>();
}

Column column_from_json(const json& j, const std::string& where) {
    if (!j.is_array()) throw SchemaParseError(where + ": expected an array of column names");
    if (j.empty()) throw SchemaParseError(where + ": composite columns must be at least one column long");
    std::vector<ColumnName> names;
    names.reserve(j.size());
    for (const auto& name : j) {
        if (!name.is_string()) throw SchemaParseError(where + ": column names must be strings");
        names.push_back(name.get<std::string>());
    }
    return Column(std::move(names));
}

ColumnSpec column_spec_from_json(const json& j, const std::string& where) {
    if (!j.is_object()) throw SchemaParseError(where + ": expected an object");
    ColumnSpec column;
    column.name = string_member(j, "name", where);
    const std::string type_text = string_member(j, "type", where);
    auto type = parse_data_type(type_text);
    if (!type) throw SchemaParseError(where + ": Couldn't match type: '" + type_text + "'");
    column.type = *type;
    if (const json* not_null = member(j, "not_null")) {
        if (!not_null->is_boolean()) throw SchemaParseError(where + ": member 'not_null' must be a boolean");
        column.not_null = not_null->get<bool>();
    }
    return column;
}

TableSpec table_from_json(const json& j, std::size_t position) {
    std::string where = "table #" + std::to_string(position + 1);
    if (!j.is_object()) throw SchemaParseError(where + ": expected an object");

    TableSpec table;
    table.name = string_member(j, "name", where);
    where = "table '" + table.name + "'";

    if (const json* pk = member(j, "primary_key")) {
        table.primary_key = column_from_json(*pk, where + " primary_key");
    }
    if (const json* uniques = member(j, "unique_columns")) {
        if (!uniques->is_array()) throw SchemaParseError(where + ": member 'unique_columns' must be an array");
        for (const auto& unique : *uniques) {
            table.unique_columns.push_back(column_from_json(unique, where + " unique_columns"));
        }
    }
    if (const json* fks = member(j, "foreign_keys")) {
        if (!fks->is_array()) throw SchemaParseError(where + ": member 'foreign_keys' must be an array");
        for (const auto& fk : *fks) {
            const std::string fk_where = where + " foreign key";
            if (!fk.is_object()) throw SchemaParseError(fk_where + ": expected an object");
            const json* local = member(fk, "local_column");
            const json* foreign = member(fk, "foreign_column");
            if (!local) throw SchemaParseError(fk_where + ": missing member 'local_column'");
            if (!foreign) throw SchemaParseError(fk_where + ": missing member 'foreign_column'");
            table.foreign_keys.push_back(ForeignKeyMapping{column_from_json(*local, fk_where + " local_column"),
                                                           string_member(fk, "foreign_table", fk_where),
                                                           column_from_json(*foreign, fk_where + " foreign_column")});
        }
    }

    const json* columns = member(j, "columns");
    if (!columns || !columns->is_array()) throw SchemaParseError(where + ": member 'columns' must be an array");
    for (std::size_t i = 0; i < columns->size(); ++i) {
        table.columns.push_back(column_spec_from_json((*columns)[i], where + " column #" + std::to_string(i + 1)));
    }
    return table;
}

json column_to_json(const Column& column) {
    return json(column.names());
}

} // namespace

Schema parse_json_schema(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw SchemaParseError(std::string("Malformed schema document: ") + e.what());
    }

    const json* tables = &doc;
    if (doc.is_object()) {
        tables = member(doc, "tables");
        if (!tables) throw SchemaParseError("Schema document has no 'tables' member");
    }
    if (!tables->is_array()) throw SchemaParseError("Schema document must be an array of tables");

    Schema schema;
    schema.reserve(tables->size());
    for (std::size_t i = 0; i < tables->size(); ++i) {
        schema.push_back(table_from_json((*tables)[i], i));
    }
    return schema;
}

Schema read_json_schema(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) throw SourceError("", "Cannot open schema file: " + path.string());
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) throw SourceError("", "Failed to read schema file: " + path.string());
    return parse_json_schema(buffer.str());
}

json schema_to_json(const Schema& schema) {
    json tables = json::array();
    for (const auto& table : schema) {
        json t;
        t["name"] = table.name;
        t["primary_key"] = table.primary_key ? column_to_json(*table.primary_key) : json(nullptr);
        t["unique_columns"] = json::array();
        for (const auto& unique : table.unique_columns) t["unique_columns"].push_back(column_to_json(unique));
        t["foreign_keys"] = json::array();
        for (const auto& fk : table.foreign_keys) {
            t["foreign_keys"].push_back({{"local_column", column_to_json(fk.local_column)},
                                         {"foreign_table", fk.foreign_table},
                                         {"foreign_column", column_to_json(fk.foreign_column)}});
        }
        t["columns"] = json::array();
        for (const auto& column : table.columns) {
            t["columns"].push_back(
                {{"name", column.name}, {"type", column.type.to_string()}, {"not_null", column.not_null}});
        }
        tables.push_back(std::move(t));
    }
    return json{{"tables", tables}};
}

} // namespace schemalint
