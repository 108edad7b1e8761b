//Tables.h -- a minimal 2D 'stringly-typed' sparse table used for delimited time series and exports.

#pragma once

#include <set>
#include <string>
#include <optional>
#include <utility>
#include <istream>
#include <ostream>
#include <cstdint>

namespace kfit {
namespace tables {

using cell_coord_t = std::pair<int64_t, int64_t>;

class cell {
    private:
        int64_t row;
        int64_t col;

    public:
        std::string val;

        cell();
        cell(int64_t r, int64_t c, const std::string& v);

        int64_t get_row() const;
        int64_t get_col() const;

        bool operator==(const cell &) const;
        bool operator!=(const cell &) const;
        bool operator<(const cell &) const;
};

struct table2 {
    std::set< cell > data;

    // Constructor.
    table2();

    // These functions return the (inclusive) bounds of the content currently in the table.
    // They throw if the table is empty.
    cell_coord_t min_max_row() const;
    cell_coord_t min_max_col() const;

    // The number of columns that have content in the given row, counting holes up to the last occupied column.
    int64_t row_width(int64_t row) const;

    // Overwrite existing or insert new cell.
    void inject(int64_t row, int64_t col, const std::string& val);

    // Const value extraction. Optional is disengaged if cell does not exist.
    std::optional<std::string> value(int64_t row, int64_t col) const;

    // Read from a stream.
    //
    // Purges any existing cells.
    // Also accepts TSV files (auto-detects tabs in the first few lines).
    // Throws on error or if nothing was read. Should work equally well with binary and text mode streams.
    void read_csv( std::istream &is );

    // Write to a stream.
    //
    // Cells containing separators, quotes, or leading/trailing whitespace are quoted. Missing cells are written
    // as empty fields. Throws on error. Defaults to the bounds of the content.
    void write_csv( std::ostream &os,
                    char separator = ',', // Also accepts tabs.
                    std::optional<cell_coord_t> row_bounds = {},
                    std::optional<cell_coord_t> col_bounds = {} ) const;

};

} // namespace tables
} // namespace kfit
