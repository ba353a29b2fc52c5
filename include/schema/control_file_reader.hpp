#pragma once
#include <string>

#include "schema/types.hpp"
#include "source/row_source.hpp"

namespace schemalint {

constexpr const char* CONTROL_FILE_TABLE = "schema";

// Flat schema description, one row per column:
//
//   table,column,not_null,unique,primary_key,type,references_table,references_column
//   users,id,true,false,true,int,,
//   orders,user_id,true,false,false,int,users,id
//
// The file is first validated against control_file_metaschema() with the
// regular data validator, then lowered to the canonical schema:
//   - tables in order of first appearance, columns in row order
//   - primary_key=true columns form the primary key, in row order
//   - unique=true adds a single-column unique key
//   - references_table/references_column add a single-column foreign key
Schema control_file_metaschema(const TableName& name = CONTROL_FILE_TABLE);

// Throws DataError when the control file breaks the metaschema and
// SchemaParseError when a row cannot be lowered (unknown type string...).
Schema read_control_file(RowSource& source, const TableName& name = CONTROL_FILE_TABLE, bool enable_logging = false);

} // namespace schemalint
