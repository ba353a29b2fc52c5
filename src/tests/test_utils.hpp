#pragma once
#include <cassert>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/errors.hpp"
#include "schema/types.hpp"
#include "source/row_source.hpp"

namespace schemalint::test {

// In-memory tables: the first record is the header
class MemoryRowSource : public RowSource {
public:
    void add_table(const TableName& name, std::vector<Record> records) { tables_[name] = std::move(records); }

    void with_table(const TableName& name, const TableBody& body) override {
        auto it = tables_.find(name);
        if (it == tables_.end()) throw SourceError(name, "Table not found: '" + name + "'");
        ++opened_[name];
        MemoryRows rows(it->second);
        body(rows);
    }

    int open_count(const TableName& name) const {
        auto it = opened_.find(name);
        return it == opened_.end() ? 0 : it->second;
    }

private:
    class MemoryRows : public Rows {
    public:
        explicit MemoryRows(const std::vector<Record>& records) : records_(records) {}

        const Record& headers() const override { return records_.front(); }
        bool next() override {
            if (pos_ + 1 >= records_.size()) return false;
            ++pos_;
            return true;
        }
        const Record& current() const override { return records_[pos_]; }

    private:
        const std::vector<Record>& records_;
        std::size_t pos_{0};
    };

    std::map<TableName, std::vector<Record>> tables_;
    std::map<TableName, int> opened_;
};

// Runs fn and returns the exception of type E it throws; fails the test if
// nothing (or something else) is thrown.
template <typename E, typename F>
E expect_throw(F&& fn) {
    try {
        fn();
    } catch (const E& e) {
        return e;
    }
    assert(false && "expected an exception");
    throw std::logic_error("expected an exception");
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

inline DataType int_type() { return DataType{TypeKind::INT, ""}; }
inline DataType bool_type() { return DataType{TypeKind::BOOL, ""}; }
inline DataType string_type() { return DataType{TypeKind::STRING, ""}; }
inline DataType date_type(const std::string& format) { return DataType{TypeKind::DATE, format}; }

inline TableSpec make_table(const TableName& name, std::vector<ColumnSpec> columns) {
    TableSpec table;
    table.name = name;
    table.columns = std::move(columns);
    return table;
}

// users {pk=(id)}: id int not null, name string
inline TableSpec users_table() {
    TableSpec users = make_table("users", {{"id", int_type(), true}, {"name", string_type(), false}});
    users.primary_key = Column{"id"};
    return users;
}

// Directory under the system temp dir, removed on destruction
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("schemalint_" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    void write(const std::string& file, const std::string& content) const {
        std::ofstream ofs(path_ / file, std::ios::binary);
        ofs << content;
    }

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace schemalint::test
