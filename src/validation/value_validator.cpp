#include "validation/value_validator.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <system_error>

namespace schemalint {

static bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }

bool is_int_literal(const std::string& raw) {
    std::size_t digits_begin = 0;
    if (!raw.empty() && (raw[0] == '+' || raw[0] == '-')) digits_begin = 1;
    if (digits_begin == raw.size()) return false;
    for (std::size_t i = digits_begin; i < raw.size(); ++i) {
        if (!is_ascii_digit(raw[i])) return false;
    }
    // from_chars takes a leading '-' but not '+'
    const char* first = raw.data() + (raw[0] == '+' ? 1 : 0);
    const char* last = raw.data() + raw.size();
    long long value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

bool is_bool_literal(const std::string& raw) {
    return raw == "true" || raw == "false";
}

static bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// tm_mon is 0-based, tm_year counts from 1900
static int days_in_month(const std::tm& tm) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (tm.tm_mon == 1 && is_leap_year(tm.tm_year + 1900)) return 29;
    return DAYS[tm.tm_mon];
}

bool is_date_literal(const std::string& format, const std::string& raw) {
    if (raw.empty()) return false;
    std::istringstream stream(raw);
    stream.imbue(std::locale::classic());
    std::tm tm = {};
    stream >> std::get_time(&tm, format.c_str());
    // the whole value must be consumed, not just a prefix
    if (stream.fail() || stream.peek() != std::char_traits<char>::eof()) return false;
    // get_time range-checks each field on its own; the day must also exist in
    // its month. tm_mday stays 0 when the layout has no day field.
    if (tm.tm_mon < 0 || tm.tm_mon > 11) return false;
    return tm.tm_mday == 0 || tm.tm_mday <= days_in_month(tm);
}

std::optional<std::string> validate_value(const DataType& type, const std::string& raw) {
    switch (type.kind) {
        case TypeKind::INT:
            if (is_int_literal(raw)) return std::nullopt;
            return "Illegal value for type 'int': '" + raw + "'";
        case TypeKind::BOOL:
            if (is_bool_literal(raw)) return std::nullopt;
            return "Illegal value for type 'bool': '" + raw + "'";
        case TypeKind::STRING:
            return std::nullopt;
        case TypeKind::DATE:
            if (is_date_literal(type.format, raw)) return std::nullopt;
            return "Value '" + raw + "' does not match date format '" + type.format + "'";
    }
    return "Unsupported data type for value '" + raw + "'";
}

} // namespace schemalint
