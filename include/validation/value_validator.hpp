#pragma once
#include <optional>
#include <string>

#include "schema/types.hpp"

namespace schemalint {

// Per-cell type checks. All functions are pure and may be shared freely.

// Signed decimal literal [+-]?[0-9]+ that fits in 64 bits.
bool is_int_literal(const std::string& raw);

// Exactly "true" or "false".
bool is_bool_literal(const std::string& raw);

// raw parses with the strptime-style format and nothing is left over.
bool is_date_literal(const std::string& format, const std::string& raw);

// Returns std::nullopt when raw is a valid literal of type, otherwise a
// description naming the type and echoing the value.
std::optional<std::string> validate_value(const DataType& type, const std::string& raw);

} // namespace schemalint
