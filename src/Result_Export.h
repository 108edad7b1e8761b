//Result_Export.h - A part of Kinefit 2026.
//
// Tabular outputs: plot data (time plus displayed series) and per-file batch summary rows.

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <ostream>

#include "Tables.h"
#include "Curve_Fitting.h"

namespace kfit {

// Marker written where a value is absent.
extern const std::string absent_marker;

struct plot_series_t {
    std::string name;
    std::vector<double> values;
};

// Formats a number for export. Non-finite values are written as the absent marker.
std::string
Format_Number(double x);

// Builds a table with a header row ('time' followed by series names) and one row per sample.
//
// Throws std::invalid_argument if a series length differs from the time axis.
tables::table2
Make_Plot_Table(const std::vector<double> &time,
                const std::vector<plot_series_t> &series);

void
Write_Plot_Data(std::ostream &os,
                const std::vector<double> &time,
                const std::vector<plot_series_t> &series);

// Writes plot data to a file, replacing it if it exists. Throws on I/O errors.
void
Write_Plot_Data(const std::filesystem::path &path,
                const std::vector<double> &time,
                const std::vector<plot_series_t> &series);

// Batch summary columns: file, status, then for each parameter '<name>', '<name> lower', '<name> upper', then
// converged, RSS, reason.
std::vector<std::string>
Summary_Header(const std::vector<std::string> &parameter_names);

// A summary row. 'fit' may be nullptr for files that never reached fitting.
std::vector<std::string>
Summary_Row(const std::string &file,
            const std::string &status,
            const fit_result *fit,
            const std::string &reason,
            size_t N_params);

// A single delimited line (with trailing newline), quoting cells as needed.
std::string
Format_CSV_Row(const std::vector<std::string> &cells);

} // namespace kfit
