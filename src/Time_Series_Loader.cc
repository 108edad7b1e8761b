// Time_Series_Loader.cc - A part of Kinefit 2026.
//
// This program loads CSV-formatted time courses.
//

#include <string>
#include <map>
#include <set>
#include <vector>
#include <fstream>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <algorithm>
#include <filesystem>

#include "YgorMisc.h"
#include "YgorString.h"
#include "YgorLog.h"

#include "Kinefit_Errors.h"
#include "Signal_Conversion.h"
#include "Tables.h"
#include "Time_Series_Loader.h"

namespace {

kfit::load_result
rejected(kfit::validation_stage stage, const std::string &reason){
    kfit::load_result out;
    out.failure = kfit::validation_failure{ stage, reason };
    return out;
}

std::string
lowercase(std::string s){
    std::transform(std::begin(s), std::end(s), std::begin(s),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

size_t
kfit::time_series_set::size() const {
    return this->time.size();
}

bool
kfit::time_series_set::has(const std::string &name) const {
    return (this->series.count(name) != 0);
}

const std::vector<double>&
kfit::time_series_set::get(const std::string &name) const {
    const auto it = this->series.find(name);
    if(it == std::end(this->series)){
        throw std::out_of_range("Series '" + name + "' is not present");
    }
    return it->second;
}

std::string
kfit::Validation_Stage_Name(kfit::validation_stage s){
    switch(s){
        case validation_stage::unreadable:          return "unreadable";
        case validation_stage::too_few_columns:     return "too few columns";
        case validation_stage::missing_time_header: return "missing time header";
        case validation_stage::non_numeric_cell:    return "non-numeric cell";
        case validation_stage::too_few_series:      return "too few series";
        case validation_stage::no_samples:          return "no samples";
        case validation_stage::non_monotonic_time:  return "non-monotonic time";
    }
    throw std::logic_error("Unhandled validation stage");
}

bool
kfit::load_result::ok() const {
    return this->data.has_value() && !this->failure.has_value();
}

kfit::load_result
kfit::Parse_Time_Series(std::istream &is, const std::string &source_name){
    kfit::tables::table2 tab;
    try{
        tab.read_csv(is);
    }catch(const std::exception &e){
        return rejected(validation_stage::unreadable, "Unable to parse '"_s + source_name + "' as delimited text: " + e.what());
    }

    const auto [row_min, row_max] = tab.min_max_row();
    const auto header_row = row_min;

    // (1) Column count.
    const auto N_cols = tab.row_width(header_row);
    if(N_cols < 3){
        return rejected(validation_stage::too_few_columns,
                        "File has " + std::to_string(N_cols) + " columns; at least 3 (time and two series) are required");
    }

    // (2) Time header.
    const auto time_header = tab.value(header_row, 0).value_or("");
    if(lowercase(time_header).find("time") == std::string::npos){
        return rejected(validation_stage::missing_time_header,
                        "First column header '" + time_header + "' does not contain 'time'");
    }

    // (3) Numeric cells. Blank lines are ignored.
    std::vector<int64_t> data_rows;
    for(int64_t row = header_row + 1; row <= row_max; ++row){
        const auto width = tab.row_width(row);
        if(width == 0) continue;
        if(N_cols < width){
            return rejected(validation_stage::non_numeric_cell,
                            "Row " + std::to_string(row + 1) + " has more cells than the header");
        }
        for(int64_t col = 0; col < N_cols; ++col){
            const auto val = tab.value(row, col);
            if(!val){
                return rejected(validation_stage::non_numeric_cell,
                                "Row " + std::to_string(row + 1) + ", column " + std::to_string(col + 1) + " is empty");
            }
            if( !Is_String_An_X<double>(val.value())
            ||  !std::isfinite(stringtoX<double>(val.value())) ){
                return rejected(validation_stage::non_numeric_cell,
                                "Row " + std::to_string(row + 1) + ", column " + std::to_string(col + 1)
                                + " contains non-numeric value '" + val.value() + "'");
            }
        }
        data_rows.push_back(row);
    }

    // (4) Series count.
    std::vector<std::string> names;
    std::set<std::string> distinct;
    for(int64_t col = 1; col < N_cols; ++col){
        const auto name = tab.value(header_row, col).value_or("");
        if(name.empty() || (lowercase(name) == "time")) continue;
        if(!distinct.insert(name).second) continue;
        names.push_back(name);
    }
    if( (names.size() < 2) || (static_cast<int64_t>(names.size()) != (N_cols - 1)) ){
        return rejected(validation_stage::too_few_series,
                        "File has " + std::to_string(names.size()) + " distinct named series out of "
                        + std::to_string(N_cols - 1) + " non-time columns; at least 2 are required and every column must be uniquely named");
    }

    // (5) Samples.
    if(data_rows.empty()){
        return rejected(validation_stage::no_samples, "File contains a header but no samples");
    }

    time_series_set set;
    set.names = names;
    for(const auto row : data_rows){
        set.time.push_back( stringtoX<double>(tab.value(row, 0).value()) / 60.0 ); // Seconds -> minutes.
        for(int64_t col = 1; col < N_cols; ++col){
            set.series[names.at(col - 1)].push_back( stringtoX<double>(tab.value(row, col).value()) );
        }
    }

    // (6) Monotonicity.
    for(size_t i = 1; i < set.time.size(); ++i){
        if(!(set.time[i-1] < set.time[i])){
            return rejected(validation_stage::non_monotonic_time,
                            "Time does not strictly increase at sample " + std::to_string(i + 1));
        }
    }

    YLOGINFO("Loaded '" << source_name << "' with " << set.size() << " samples and " << set.names.size() << " series");
    load_result out;
    out.data = std::move(set);
    return out;
}

kfit::load_result
kfit::Load_Time_Series(const std::filesystem::path &path){
    std::ifstream is(path, std::ios::in | std::ios::binary);
    if(!is){
        return rejected(validation_stage::unreadable, "Unable to open '" + path.string() + "'");
    }
    return Parse_Time_Series(is, path.filename().string());
}

kfit::selected_series_t
kfit::Select_Fit_Series(const kfit::time_series_set &set,
                        const std::string &roi,
                        const std::string &aif,
                        const std::optional<std::string> &vif,
                        const std::optional<kfit::constant_set_t> &convert_with){
    const auto fetch = [&](const std::string &name, const std::string &role) -> std::vector<double> {
        if(!set.has(name)){
            throw std::out_of_range("The " + role + " series '" + name + "' is not present in the file");
        }
        auto s = set.get(name);
        if(convert_with){
            const auto c = Extract_SPGR_Constants(convert_with.value(), name);
            s = Signal_To_Concentration(s, c);
        }
        return s;
    };

    selected_series_t out;
    out.observed = fetch(roi, "ROI");
    out.inputs.time = set.time;
    out.inputs.aif = fetch(aif, "AIF");
    if(vif){
        out.inputs.vif = fetch(vif.value(), "VIF");
    }
    return out;
}
