#pragma once
#include <filesystem>
#include <string>

#include "source/row_source.hpp"

namespace schemalint {

// Row source over a directory of delimited files. Table T lives in
// <data_dir>/T<extension>; the extension is not appended twice when the table
// name already carries it (so "items.csv" and "items" name the same file).
class FileSystemRowSource : public RowSource {
public:
    explicit FileSystemRowSource(const std::string& data_dir = ".",
                                 const std::string& extension = ".csv",
                                 char delimiter = ',',
                                 bool enable_logging = false);

    void with_table(const TableName& name, const TableBody& body) override;

    // Throws SourceError for identifiers that would escape data_dir
    std::filesystem::path table_path(const TableName& name) const;

private:
    void log(const std::string& msg) const;

    std::filesystem::path data_dir_;
    std::string extension_;
    char delimiter_;
    bool enable_logging_;
};

} // namespace schemalint
