#include "schema/types.hpp"

#include <sstream>
#include <stdexcept>

namespace schemalint {

static const std::string DATE_PREFIX = "date(";
static const std::string DATE_SUFFIX = ")";

std::string DataType::to_string() const {
    switch (kind) {
        case TypeKind::INT: return "int";
        case TypeKind::BOOL: return "bool";
        case TypeKind::STRING: return "string";
        case TypeKind::DATE: return DATE_PREFIX + format + DATE_SUFFIX;
    }
    return "unknown";
}

std::optional<DataType> parse_data_type(const std::string& text) {
    if (text == "int") return DataType{TypeKind::INT, ""};
    if (text == "bool") return DataType{TypeKind::BOOL, ""};
    if (text == "string") return DataType{TypeKind::STRING, ""};

    // date(<format>): everything between the outer parentheses is the layout
    if (text.size() >= DATE_PREFIX.size() + DATE_SUFFIX.size() &&
        text.compare(0, DATE_PREFIX.size(), DATE_PREFIX) == 0 &&
        text.compare(text.size() - DATE_SUFFIX.size(), DATE_SUFFIX.size(), DATE_SUFFIX) == 0) {
        std::string format = text.substr(DATE_PREFIX.size(),
                                         text.size() - DATE_PREFIX.size() - DATE_SUFFIX.size());
        if (format.empty()) return std::nullopt;
        return DataType{TypeKind::DATE, format};
    }
    return std::nullopt;
}

Column::Column(std::vector<ColumnName> names) : names_(std::move(names)) {
    if (names_.empty()) throw std::invalid_argument("composite column must have at least one name");
}

Column::Column(std::initializer_list<ColumnName> names) : names_(names) {
    if (names_.empty()) throw std::invalid_argument("composite column must have at least one name");
}

std::string Column::to_string() const {
    if (names_.size() == 1) return "'" + names_.front() + "'";
    std::ostringstream oss;
    oss << '(';
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (i) oss << ", ";
        oss << '\'' << names_[i] << '\'';
    }
    oss << ')';
    return oss.str();
}

void AnnotatedSchema::add(AnnotatedTableSpec table) {
    if (index_.count(table.spec.name)) {
        throw std::invalid_argument("AnnotatedSchema: table exists: " + table.spec.name);
    }
    index_[table.spec.name] = tables_.size();
    tables_.push_back(std::move(table));
}

const AnnotatedTableSpec* AnnotatedSchema::find(const TableName& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &tables_[it->second];
}

const AnnotatedTableSpec& AnnotatedSchema::at(const TableName& name) const {
    const AnnotatedTableSpec* table = find(name);
    if (!table) throw std::out_of_range("AnnotatedSchema: table not found: " + name);
    return *table;
}

} // namespace schemalint
