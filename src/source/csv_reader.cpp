#include "source/csv_reader.hpp"

#include <stdexcept>

#include "common/errors.hpp"

namespace schemalint {

using traits = std::char_traits<char>;

CsvReader::CsvReader(std::istream& in, char delimiter, std::string source_name, std::string table)
    : in_(in), delimiter_(traits::to_int_type(delimiter)),
      source_name_(std::move(source_name)), table_(std::move(table)) {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw std::invalid_argument("CsvReader: invalid delimiter");
    }
}

void CsvReader::fail(const std::string& message, std::size_t line) const {
    std::string where = source_name_.empty() ? std::string("line ") : source_name_ + ":";
    throw SourceError(table_, where + std::to_string(line) + ": " + message);
}

bool CsvReader::read_record(std::vector<std::string>& record) {
    record.clear();
    skipBlankLines();
    if (in_.peek() == traits::eof()) {
        if (in_.bad()) fail("read error", current_line_);
        return false;
    }

    std::string field;
    FieldEnd end;
    do {
        end = readField(field);
        record.push_back(field);
    } while (end == FieldEnd::DELIMITER);

    if (in_.bad()) fail("read error", current_line_);
    return true;
}

void CsvReader::skipBlankLines() {
    while (true) {
        int c = in_.peek();
        if (c == '\n') {
            in_.get();
            ++current_line_;
        } else if (c == '\r') {
            in_.get();
            if (in_.peek() != '\n') {
                in_.putback('\r'); // lone \r is data
                return;
            }
            in_.get();
            ++current_line_;
        } else {
            return;
        }
    }
}

CsvReader::FieldEnd CsvReader::readField(std::string& field) {
    field.clear();
    if (in_.peek() == '"') return readQuotedField(field);

    while (true) {
        int c = in_.get();
        if (c == traits::eof()) return FieldEnd::INPUT;
        if (c == delimiter_) return FieldEnd::DELIMITER;
        if (c == '\n') {
            ++current_line_;
            return FieldEnd::LINE;
        }
        if (c == '\r' && in_.peek() == '\n') {
            in_.get();
            ++current_line_;
            return FieldEnd::LINE;
        }
        if (c == '"') fail("bare \" in non-quoted field", current_line_);
        field.push_back(traits::to_char_type(c));
    }
}

CsvReader::FieldEnd CsvReader::readQuotedField(std::string& field) {
    const std::size_t start_line = current_line_;
    in_.get(); // opening quote
    while (true) {
        int c = in_.get();
        if (c == traits::eof()) fail("unterminated quoted field", start_line);
        if (c == '"') {
            if (in_.peek() == '"') {
                in_.get();
                field.push_back('"');
                continue;
            }
            return afterQuote();
        }
        if (c == '\n') ++current_line_;
        field.push_back(traits::to_char_type(c));
    }
}

CsvReader::FieldEnd CsvReader::afterQuote() {
    int c = in_.get();
    if (c == traits::eof()) return FieldEnd::INPUT;
    if (c == delimiter_) return FieldEnd::DELIMITER;
    if (c == '\n') {
        ++current_line_;
        return FieldEnd::LINE;
    }
    if (c == '\r' && in_.peek() == '\n') {
        in_.get();
        ++current_line_;
        return FieldEnd::LINE;
    }
    fail("extraneous character after closing quote", current_line_);
}

} // namespace schemalint
