#include "source/file_system_row_source.hpp"

#include <fstream>
#include <iostream>

#include "common/errors.hpp"
#include "source/csv_reader.hpp"

namespace schemalint {

namespace {

// Rows backed by a CsvReader over an open file. Lives on the stack of
// with_table, so the file is closed on every exit path.
class CsvRows : public Rows {
public:
    CsvRows(CsvReader& reader, Record headers) : reader_(reader), headers_(std::move(headers)) {}

    const Record& headers() const override { return headers_; }

    bool next() override {
        if (exhausted_) return false;
        if (!reader_.read_record(current_)) {
            exhausted_ = true;
            current_.clear();
            return false;
        }
        return true;
    }

    const Record& current() const override { return current_; }

private:
    CsvReader& reader_;
    Record headers_;
    Record current_;
    bool exhausted_{false};
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

FileSystemRowSource::FileSystemRowSource(const std::string& data_dir,
                                         const std::string& extension,
                                         char delimiter,
                                         bool enable_logging)
    : data_dir_(data_dir), extension_(extension), delimiter_(delimiter), enable_logging_(enable_logging) {}

void FileSystemRowSource::log(const std::string& msg) const {
    if (enable_logging_) std::cout << "[FileSystemRowSource] " << msg << std::endl;
}

std::filesystem::path FileSystemRowSource::table_path(const TableName& name) const {
    if (name.find("..") != std::string::npos) {
        throw SourceError(name, "Illegal character sequence in table identifier '" + name + "': '..'");
    }
    std::filesystem::path relative(ends_with(name, extension_) ? name : name + extension_);
    if (relative.is_absolute() || relative.has_root_path()) {
        throw SourceError(name, "Table identifier must be a relative name: '" + name + "'");
    }
    return data_dir_ / relative;
}

void FileSystemRowSource::with_table(const TableName& name, const TableBody& body) {
    const auto path = table_path(name);
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw SourceError(name, "Cannot open table '" + name + "': " + path.string());
    }
    log("open " + path.string());

    CsvReader reader(ifs, delimiter_, path.filename().string(), name);
    Record headers;
    if (!reader.read_record(headers)) {
        throw SourceError(name, "Table '" + name + "' has no header row: " + path.string());
    }

    CsvRows rows(reader, std::move(headers));
    body(rows);
    log("close " + path.string());
}

} // namespace schemalint
