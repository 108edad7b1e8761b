//Time_Series_Loader.h - A part of Kinefit 2026.
//
// Loads delimited time-course files (a 'time' column followed by one column per organ or input function).

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <istream>
#include <filesystem>

#include "Signal_Conversion.h"
#include "Tracer_Kinetic_Models.h"

namespace kfit {

// A set of equal-length series sharing one strictly increasing time axis (minutes).
struct time_series_set {
    std::vector<double> time;
    std::map<std::string, std::vector<double>> series;
    std::vector<std::string> names;   // Series names in file order, excluding time.

    size_t size() const;
    bool has(const std::string &name) const;

    // Throws std::out_of_range if the series is not present.
    const std::vector<double>& get(const std::string &name) const;
};

enum class validation_stage {
    unreadable,           // The file could not be opened or parsed as delimited text.
    too_few_columns,      // Fewer than three columns.
    missing_time_header,  // The first header does not mention time.
    non_numeric_cell,     // A data cell is missing or not a number.
    too_few_series,       // Fewer than two named, distinct non-time columns.
    no_samples,           // Header only.
    non_monotonic_time,   // Time does not strictly increase.
};

std::string
Validation_Stage_Name(validation_stage s);

struct validation_failure {
    validation_stage stage = validation_stage::unreadable;
    std::string reason;
};

// Either a loaded series set or the reason it was rejected.
struct load_result {
    std::optional<time_series_set> data;
    std::optional<validation_failure> failure;

    bool ok() const;
};

// Parses and validates a delimited time-course document. Never throws for malformed content.
//
// Validation short-circuits in this order: column count, time header, numeric cells, series count, sample count,
// time monotonicity. Time values are converted from seconds to minutes.
load_result
Parse_Time_Series(std::istream &is, const std::string &source_name = "stream");

load_result
Load_Time_Series(const std::filesystem::path &path);

// The observed tissue curve and the input functions selected from a loaded set.
struct selected_series_t {
    std::vector<double> observed;
    model_inputs_t inputs;
};

// Selects the ROI and input function series. If 'convert_with' is provided, every selected series is converted from
// signal to concentration using those constants (with per-series "R10_<name>" overrides).
//
// Throws std::out_of_range naming the missing series, or kfit::domain_error if a conversion fails.
selected_series_t
Select_Fit_Series(const time_series_set &set,
                  const std::string &roi,
                  const std::string &aif,
                  const std::optional<std::string> &vif,
                  const std::optional<constant_set_t> &convert_with = {});

} // namespace kfit
