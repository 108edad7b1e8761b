//Tables.cc - A part of Kinefit 2026.
//
// A minimal sparse table of strings with delimited-text input and output.
//

#include <set>
#include <list>
#include <string>
#include <iostream>
#include <sstream>
#include <limits>
#include <utility>
#include <istream>
#include <ostream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <cstdint>

#include "YgorString.h"
#include "YgorLog.h"

#include "Tables.h"

namespace kfit {
namespace tables {

// cell class.

cell::cell() : row(-1), col(-1) {}

cell::cell(int64_t r, int64_t c, const std::string& v) : row(r), col(c), val(v) {}

bool
cell::operator==(const cell& rhs) const {
    return (this->row == rhs.row) && (this->col == rhs.col);
}

bool
cell::operator!=(const cell& rhs) const {
    return !(*this == rhs);
}

bool
cell::operator<(const cell& rhs) const {
    // Make the primary sorting axis the row number so rows can be streamed in order.
    return (this->row == rhs.row) ? (this->col < rhs.col)
                                  : (this->row < rhs.row);
}

int64_t
cell::get_row() const {
    return this->row;
}

int64_t
cell::get_col() const {
    return this->col;
}

// table2 class.

table2::table2(){};

cell_coord_t
table2::min_max_row() const {
    int64_t min = std::numeric_limits<int64_t>::max();
    int64_t max = std::numeric_limits<int64_t>::lowest();
    if(const auto it = std::rbegin(this->data); it != std::rend(this->data)){
        max = it->get_row();
    }
    if(const auto it = std::begin(this->data); it != std::end(this->data)){
        min = it->get_row();
    }
    if(max < min){
        throw std::runtime_error("No data available, min and max rows are not defined");
    }
    return {min, max};
}

cell_coord_t
table2::min_max_col() const {
    int64_t min = std::numeric_limits<int64_t>::max();
    int64_t max = std::numeric_limits<int64_t>::lowest();

    for(const auto& c : this->data){
        const auto col = c.get_col();
        max = std::max<int64_t>(max, col);
        min = std::min<int64_t>(min, col);
    }
    if(max < min){
        throw std::runtime_error("No data available, min and max columns are not defined");
    }
    return {min, max};
}

int64_t
table2::row_width(int64_t row) const {
    int64_t out = 0;
    auto it = this->data.lower_bound( cell(row, std::numeric_limits<int64_t>::lowest(), "") );
    for( ; (it != std::end(this->data)) && (it->get_row() == row); ++it){
        out = std::max<int64_t>(out, it->get_col() + 1);
    }
    return out;
}

std::optional<std::string>
table2::value(int64_t row, int64_t col) const {
    std::optional<std::string> out;
    auto it = this->data.find( cell(row, col, "") );
    if(it != std::end(this->data)){
        out = it->val;
    }
    return out;
}

void
table2::inject(int64_t row, int64_t col, const std::string& val){
    cell n(row, col, val);
    auto it = this->data.find( n );
    if(it != std::end(this->data)){
        // std::set only orders on the coordinates, so the value can be altered in-place.
        (const_cast<cell&>(*it)).val = val;
    }else{
        this->data.insert( n );
    }
    return;
}

void
table2::read_csv( std::istream &is ){
    this->data.clear();

    const std::string quotes = "\"";  // Characters that open a quote.
    const std::string escs   = "\\";  // The escape character(s) inside quotes.
    const std::string pseps  = "\t";  // 'Priority' separation characters. If detected, these take priority over others.
    std::string seps   = ",";   // The characters that separate cells.

    std::stringstream ss;

    // --- Automatic separator detection ---
    const int64_t autodetect_separator_rows = 10;

    // Buffer the first few lines, checking for the presence of priority separators.
    bool use_pseps = false;
    for(int64_t i = 0; i < autodetect_separator_rows; ++i){
        std::string line;
        if(std::getline(is, line)){
            // Avoid newline at end, which can appear as an extra empty row later.
            ss << ((i==0) ? "" : "\n") << line;

            const bool has_pseps = (line.find_first_of(pseps) != std::string::npos);
            if(has_pseps){
                use_pseps = true;
                break;
            }
        }
    }
    if(use_pseps){
        seps = pseps;
        YLOGINFO("Detected alternative separators, switching acceptable separators");
    }

    // -------------------------------------

    const auto clean_string = [](const std::string &in){
        return Canonicalize_String2(in, CANONICALIZE::TRIM_ENDS);
    };

    int64_t row_num = -1;
    std::string line;
    while(std::getline(ss, line) || std::getline(is, line)){
        ++row_num;
        bool inside_quote = false;
        std::string cell_buf;

        // Windows line endings leave a trailing carriage return.
        if(!line.empty() && (line.back() == '\r')) line.pop_back();

        int64_t col_num = 0;
        auto c_it = std::begin(line);
        const auto end = std::end(line);
        for( ; c_it != end; ++c_it){
            const bool is_quote = (quotes.find_first_of(*c_it) != std::string::npos);
            const bool is_print = std::isprint(static_cast<unsigned char>(*c_it));
            auto c_next_it = std::next(c_it);

            if(inside_quote){
                const bool is_esc = (escs.find_first_of(*c_it) != std::string::npos);

                if(is_quote){
                    // Close the quote.
                    inside_quote = false;

                }else if(is_esc){
                    // Implement escape of next character.
                    if(c_next_it == end){
                        throw std::runtime_error("Nothing to escape (row " + std::to_string(row_num) + ")");
                    }
                    cell_buf.push_back( *c_next_it );
                    ++c_it;
                    ++c_next_it;

                }else if(is_print){
                    cell_buf.push_back( *c_it );
                }

            }else{
                const bool is_sep = (seps.find_first_of(*c_it) != std::string::npos);

                if(is_quote){
                    // Open the quote.
                    inside_quote = true;

                }else if( is_sep ){
                    // Push cell into table.
                    cell_buf = clean_string(cell_buf);
                    if(!cell_buf.empty()) this->inject(row_num, col_num, cell_buf);
                    ++col_num;
                    cell_buf.clear();

                }else if(is_print){
                    cell_buf.push_back( *c_it );
                }
            }

            if( c_next_it == end ){
                // Push cell into table.
                cell_buf = clean_string(cell_buf);
                if(!cell_buf.empty()) this->inject(row_num, col_num, cell_buf);
                ++col_num;
                cell_buf.clear();
            }
        }

        if(inside_quote){
            throw std::invalid_argument("Unterminated quote in row " + std::to_string(row_num));
        }
    }

    if(this->data.empty()){
        throw std::runtime_error("Unable to extract any data from file");
    }
    return;
}

void
table2::write_csv( std::ostream &os,
                   char separator,
                   std::optional<cell_coord_t> row_bounds,
                   std::optional<cell_coord_t> col_bounds ) const {
    if(this->data.empty() && (!row_bounds || !col_bounds)){
        throw std::runtime_error("Refusing to write an empty table without explicit bounds");
    }
    const auto [row_min, row_max] = row_bounds.value_or(this->min_max_row());
    const auto [col_min, col_max] = col_bounds.value_or(this->min_max_col());
    const char quote = '"';
    const char esc = '\\';

    const auto needs_quotes = [&](const std::string &val) -> bool {
        return (val.find_first_of(std::string(1, separator) + "\"\\\n") != std::string::npos)
            || (std::isspace(static_cast<unsigned char>(val.front())))
            || (std::isspace(static_cast<unsigned char>(val.back())));
    };

    for(int64_t row = row_min; row <= row_max; ++row){
        for(int64_t col = col_min; col <= col_max; ++col){
            if(col != col_min) os << separator;
            const auto val = this->value(row, col).value_or("");
            if(val.empty()) continue;
            if(needs_quotes(val)){
                os << std::quoted(val, quote, esc);
            }else{
                os << val;
            }
        }
        os << "\n";
    }
    os.flush();
    if(!os){
        throw std::runtime_error("Unable to write table");
    }
    return;
}

} // namespace tables
} // namespace kfit
