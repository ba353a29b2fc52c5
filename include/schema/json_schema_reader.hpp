#pragma once
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "schema/types.hpp"

namespace schemalint {

using json = nlohmann::json;

// JSON schema documents. Either a top-level array of tables or an object
// with a "tables" array; each table looks like
//
//   {
//     "name": "orders",
//     "primary_key": ["id"],                         (optional, may be null)
//     "unique_columns": [["code"], ["a", "b"]],      (optional)
//     "foreign_keys": [{"local_column": ["user_id"],
//                       "foreign_table": "users",
//                       "foreign_column": ["id"]}],  (optional)
//     "columns": [{"name": "id", "type": "int", "not_null": true}, ...]
//   }
//
// Malformed documents throw SchemaParseError. Only the shape is checked
// here; the consistency checker proves the rest.
Schema parse_json_schema(const std::string& text);

// Throws SourceError if the file cannot be read
Schema read_json_schema(const std::filesystem::path& path);

json schema_to_json(const Schema& schema);

} // namespace schemalint
