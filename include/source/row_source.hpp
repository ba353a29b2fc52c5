#pragma once
#include <functional>
#include <string>
#include <vector>

#include "schema/types.hpp"

namespace schemalint {

using Record = std::vector<std::string>;

// Single-pass, forward-only view of one table: the header record plus the
// data records that follow it.
class Rows {
public:
    virtual ~Rows() = default;

    virtual const Record& headers() const = 0;

    // Advances to the next record. Returns false once the table is exhausted;
    // a read failure throws SourceError instead.
    virtual bool next() = 0;

    // Valid after next() returned true
    virtual const Record& current() const = 0;
};

// Supplier of table data. The Rows handed to the body stay valid only for
// the duration of the call; the underlying resource is released when
// with_table returns or unwinds.
class RowSource {
public:
    using TableBody = std::function<void(Rows&)>;

    virtual ~RowSource() = default;

    // Throws SourceError if the table cannot be located or opened.
    virtual void with_table(const TableName& name, const TableBody& body) = 0;
};

} // namespace schemalint
