//Analysis_Session.h - A part of Kinefit 2026.
//
// State for interactive analysis of a single file: the loaded series, the selected series and model, and the
// current fit. The owner (e.g., a user interface or script) holds the session; nothing is process-wide.

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <istream>

#include "Model_Catalog.h"
#include "Time_Series_Loader.h"
#include "Curve_Fitting.h"
#include "Result_Export.h"

namespace kfit {

class analysis_session {
    private:
        model_catalog_t catalog;

        std::optional<time_series_set> loaded;
        std::string source;

        std::string roi;
        std::string aif;
        std::optional<std::string> vif;

        // Resolved through 'catalog' on use so copies of the session stay self-contained.
        std::optional<std::string> model_id;

        bool convert_signal = false;
        fit_options_t options;

        std::optional<fit_result> fit;

        void clear_selection();
        const model_descriptor_t& require_model() const;
        selected_series_t selected() const;

    public:
        explicit analysis_session(model_catalog_t c);

        const model_catalog_t& get_catalog() const;

        // Replaces the loaded data. On failure the session holds no data and the failure is returned.
        // Selections and any fit are reset either way.
        load_result load_data(const std::filesystem::path &path);
        load_result load_data(std::istream &is, const std::string &source_name);

        bool has_data() const;
        const time_series_set& get_data() const; // Throws std::logic_error if nothing is loaded.

        // Throws std::invalid_argument if a series is not present, or std::logic_error if nothing is loaded.
        void select_series(const std::string &roi_name,
                           const std::string &aif_name,
                           const std::optional<std::string> &vif_name = {});

        // Throws std::invalid_argument if the model is not in the catalog.
        void select_model(const std::string &model_id);
        const model_descriptor_t* get_model() const; // Points into this session's catalog; nullptr if none.

        void set_signal_conversion(bool convert);
        void set_fit_options(const fit_options_t &o);

        // Fits the selected model to the selected series. Defaults come from the catalog.
        // Throws std::logic_error if no data, series, or model is selected. Fit problems are reported in the result.
        const fit_result& run_fit(const std::optional<std::vector<double>> &initial = {},
                                  const std::optional<parameter_bounds_t> &bounds = {});

        const std::optional<fit_result>& get_fit() const;

        // Evaluates the selected model with the given parameters (catalog units) at the loaded time samples.
        std::vector<double> predict(const std::vector<double> &params) const;

        // Manually overrides a fitted parameter. Confidence intervals become absent and the predicted curve is
        // recomputed without refitting. Throws std::logic_error if there is no successful fit.
        const fit_result& edit_parameter(size_t index, double value);

        // The displayed series: ROI, AIF, VIF (if selected), and the model curve (if fitted).
        std::vector<plot_series_t> plot_series() const;

        void export_plot_data(const std::filesystem::path &path) const;
};

// Loads a file into the session and applies the model and series selections.
//
// Problems with the file itself (validation failures, absent series) are returned as a reason and leave the session
// without a usable selection. An unknown model id is a configuration error and throws std::invalid_argument.
std::optional<std::string>
Prepare_Session(analysis_session &session,
                const std::filesystem::path &path,
                const std::string &model_id,
                const std::string &roi_name,
                const std::string &aif_name,
                const std::optional<std::string> &vif_name = {});

} // namespace kfit
