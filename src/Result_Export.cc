//Result_Export.cc - A part of Kinefit 2026.

#include <cmath>
#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include <cstdint>

#include "YgorMisc.h"
#include "YgorLog.h"

#include "Tables.h"
#include "Result_Export.h"

const std::string kfit::absent_marker = "NA";

std::string
kfit::Format_Number(double x){
    if(!std::isfinite(x)) return absent_marker;
    std::stringstream ss;
    ss << std::setprecision(10) << x;
    return ss.str();
}

kfit::tables::table2
kfit::Make_Plot_Table(const std::vector<double> &time,
                      const std::vector<kfit::plot_series_t> &series){
    tables::table2 tab;
    tab.inject(0, 0, "time");
    int64_t col = 1;
    for(const auto &s : series){
        if(s.values.size() != time.size()){
            throw std::invalid_argument("Series '" + s.name + "' does not match the time axis");
        }
        tab.inject(0, col++, s.name);
    }
    for(size_t i = 0; i < time.size(); ++i){
        const auto row = static_cast<int64_t>(i) + 1;
        tab.inject(row, 0, Format_Number(time[i]));
        col = 1;
        for(const auto &s : series){
            tab.inject(row, col++, Format_Number(s.values[i]));
        }
    }
    return tab;
}

void
kfit::Write_Plot_Data(std::ostream &os,
                      const std::vector<double> &time,
                      const std::vector<kfit::plot_series_t> &series){
    const auto tab = Make_Plot_Table(time, series);
    tab.write_csv(os);
    return;
}

void
kfit::Write_Plot_Data(const std::filesystem::path &path,
                      const std::vector<double> &time,
                      const std::vector<kfit::plot_series_t> &series){
    std::ofstream os(path, std::ios::out | std::ios::trunc);
    if(!os){
        throw std::runtime_error("Unable to open '" + path.string() + "' for writing");
    }
    Write_Plot_Data(os, time, series);
    YLOGINFO("Wrote plot data to '" << path.string() << "'");
    return;
}

std::vector<std::string>
kfit::Summary_Header(const std::vector<std::string> &parameter_names){
    std::vector<std::string> out = { "file", "status" };
    for(const auto &n : parameter_names){
        out.push_back(n);
        out.push_back(n + " lower");
        out.push_back(n + " upper");
    }
    out.push_back("converged");
    out.push_back("RSS");
    out.push_back("reason");
    return out;
}

std::vector<std::string>
kfit::Summary_Row(const std::string &file,
                  const std::string &status,
                  const kfit::fit_result *fit,
                  const std::string &reason,
                  size_t N_params){
    std::vector<std::string> out = { file, status };
    const bool have_params = (fit != nullptr) && fit->ok() && (fit->parameters.size() == N_params);
    for(size_t i = 0; i < N_params; ++i){
        if(have_params){
            out.push_back( Format_Number(fit->parameters[i]) );
            const auto &ci = fit->intervals.at(i);
            out.push_back( ci ? Format_Number(ci->lower) : absent_marker );
            out.push_back( ci ? Format_Number(ci->upper) : absent_marker );
        }else{
            out.insert(std::end(out), 3, absent_marker);
        }
    }
    if(have_params){
        out.push_back( fit->converged ? "true" : "false" );
        out.push_back( Format_Number(fit->RSS) );
    }else{
        out.push_back( absent_marker );
        out.push_back( absent_marker );
    }
    out.push_back(reason);
    return out;
}

std::string
kfit::Format_CSV_Row(const std::vector<std::string> &cells){
    if(cells.empty()) return "\n";
    tables::table2 tab;
    for(size_t i = 0; i < cells.size(); ++i){
        tab.inject(0, static_cast<int64_t>(i), cells[i]);
    }
    std::stringstream ss;
    tab.write_csv(ss, ',', tables::cell_coord_t{0, 0},
                          tables::cell_coord_t{0, static_cast<int64_t>(cells.size()) - 1});
    return ss.str();
}
