//Batch_Processing.h - A part of Kinefit 2026.
//
// Unattended fitting of every time-course file in a folder.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <ostream>
#include <utility>

#include "Model_Catalog.h"
#include "Curve_Fitting.h"
#include "Result_Export.h"

namespace kfit {

struct batch_config {
    std::filesystem::path folder;
    std::string extension = ".csv";     // Case-insensitive.

    std::string roi;
    std::string aif;
    std::optional<std::string> vif;

    std::string model_id;
    std::optional<std::vector<double>> initial;     // Catalog units. Defaults to the catalog defaults.
    std::optional<parameter_bounds_t> bounds;

    // Convert signal series to concentration before fitting (see Signal_Conversion.h).
    bool convert_signal = false;

    fit_options_t fit_options;

    // If provided, per-file series and a running summary are written here.
    std::optional<std::filesystem::path> output_dir;
};

enum class batch_state {
    rejected,     // The file failed validation or lacked a selected series.
    fit_failed,   // The fit could not be performed.
    fitted,       // Fitted (possibly without convergence) but nothing was written.
    exported,     // Fitted and outputs written.
};

std::string
Batch_State_Name(batch_state s);

struct batch_record {
    std::string file;                 // File name only.
    std::filesystem::path path;
    batch_state state = batch_state::rejected;
    std::string reason;               // Rejection or failure reason. Empty on success.

    std::optional<fit_result> fit;

    std::vector<double> time;         // Derived series for export (minutes).
    std::vector<plot_series_t> derived;

    std::vector<std::filesystem::path> outputs;
};

struct batch_summary {
    std::string model_id;
    std::vector<std::string> parameter_names;
    std::vector<batch_record> records;
    size_t total_files = 0;
    bool cancelled = false;

    size_t count(batch_state s) const;

    // Reasons for every file that was rejected or could not be fitted, in processing order.
    std::vector<std::pair<std::string, std::string>> skipped_files() const;
};

// Called after each file with (processed, total, record).
using batch_progress_callback_t = std::function<void(size_t, size_t, const batch_record &)>;

// Polled before each file. Returning true stops the batch; completed records are kept.
using batch_cancel_callback_t = std::function<bool(void)>;

// Files that would be processed, sorted by name.
std::vector<std::filesystem::path>
Find_Batch_Files(const batch_config &config);

// Processes every eligible file sequentially. Each file yields exactly one record and per-file problems never
// escape. Throws std::invalid_argument only if the configuration itself is unusable (unknown model, missing
// folder).
batch_summary
Run_Batch(const batch_config &config,
          const model_catalog_t &catalog,
          const batch_progress_callback_t &progress = {},
          const batch_cancel_callback_t &cancel = {});

// Writes the complete summary (header plus one row per record) to a stream.
void
Write_Batch_Summary(std::ostream &os, const batch_summary &summary);

} // namespace kfit
