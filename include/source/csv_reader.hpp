#ifndef SOURCE_CSV_READER_H
#define SOURCE_CSV_READER_H

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace schemalint {

// Reads delimited records (RFC 4180 style) from a stream.
//   - fields may be double-quoted; quoted fields can hold the delimiter,
//     line breaks and "" for a literal quote
//   - records end at \n or \r\n; blank lines are skipped
//   - a quote inside an unquoted field, text after a closing quote and an
//     unterminated quoted field are read errors (SourceError)
class CsvReader {
public:
    CsvReader(std::istream& in, char delimiter = ',', std::string source_name = "", std::string table = "");

    // Reads the next record into record. Returns false at end of input.
    bool read_record(std::vector<std::string>& record);

private:
    enum class FieldEnd {
        DELIMITER,
        LINE,
        INPUT
    };

    void skipBlankLines();
    FieldEnd readField(std::string& field);
    FieldEnd readQuotedField(std::string& field);
    // Consumes what follows a closing quote
    FieldEnd afterQuote();
    [[noreturn]] void fail(const std::string& message, std::size_t line) const;

    std::istream& in_;
    int delimiter_;
    std::string source_name_;
    std::string table_;
    std::size_t current_line_{1};
};

} // namespace schemalint

#endif // SOURCE_CSV_READER_H
