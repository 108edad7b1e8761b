//Analysis_Session.cc - A part of Kinefit 2026.

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "YgorMisc.h"
#include "YgorString.h"
#include "YgorLog.h"

#include "Kinefit_Errors.h"
#include "Analysis_Session.h"

kfit::analysis_session::analysis_session(kfit::model_catalog_t c) : catalog(std::move(c)) {}

const kfit::model_catalog_t&
kfit::analysis_session::get_catalog() const {
    return this->catalog;
}

void
kfit::analysis_session::clear_selection(){
    this->roi.clear();
    this->aif.clear();
    this->vif.reset();
    this->fit.reset();
    return;
}

kfit::load_result
kfit::analysis_session::load_data(const std::filesystem::path &path){
    auto res = Load_Time_Series(path);
    this->clear_selection();
    this->loaded = res.data;
    this->source = res.ok() ? path.string() : "";
    return res;
}

kfit::load_result
kfit::analysis_session::load_data(std::istream &is, const std::string &source_name){
    auto res = Parse_Time_Series(is, source_name);
    this->clear_selection();
    this->loaded = res.data;
    this->source = res.ok() ? source_name : "";
    return res;
}

bool
kfit::analysis_session::has_data() const {
    return this->loaded.has_value();
}

const kfit::time_series_set&
kfit::analysis_session::get_data() const {
    if(!this->loaded){
        throw std::logic_error("No data has been loaded");
    }
    return this->loaded.value();
}

void
kfit::analysis_session::select_series(const std::string &roi_name,
                                      const std::string &aif_name,
                                      const std::optional<std::string> &vif_name){
    const auto &set = this->get_data();
    for(const auto &n : { std::optional<std::string>(roi_name), std::optional<std::string>(aif_name), vif_name }){
        if(n && !set.has(n.value())){
            throw std::invalid_argument("Series '" + n.value() + "' is not present in '" + this->source + "'");
        }
    }
    this->roi = roi_name;
    this->aif = aif_name;
    this->vif = vif_name;
    this->fit.reset();
    return;
}

void
kfit::analysis_session::select_model(const std::string &model_id){
    const auto *m = this->catalog.find_model(model_id);
    if(m == nullptr){
        throw std::invalid_argument("Model '" + model_id + "' is not defined in the catalog");
    }
    this->model_id = m->id;
    this->fit.reset();
    return;
}

const kfit::model_descriptor_t*
kfit::analysis_session::get_model() const {
    return this->model_id ? this->catalog.find_model(this->model_id.value()) : nullptr;
}

const kfit::model_descriptor_t&
kfit::analysis_session::require_model() const {
    const auto *m = this->get_model();
    if(m == nullptr){
        throw std::logic_error("No model has been selected");
    }
    return *m;
}

void
kfit::analysis_session::set_signal_conversion(bool convert){
    this->convert_signal = convert;
    this->fit.reset();
    return;
}

void
kfit::analysis_session::set_fit_options(const kfit::fit_options_t &o){
    this->options = o;
    return;
}

kfit::selected_series_t
kfit::analysis_session::selected() const {
    const auto &set = this->get_data();
    if(this->roi.empty() || this->aif.empty()){
        throw std::logic_error("ROI and AIF series have not been selected");
    }
    const auto &m = this->require_model();
    std::optional<constant_set_t> convert_with;
    if(this->convert_signal && (m.kind != model_kind::high_flow_spgr_signal)){
        convert_with = this->catalog.constants;
    }
    return Select_Fit_Series(set, this->roi, this->aif, this->vif, convert_with);
}

const kfit::fit_result&
kfit::analysis_session::run_fit(const std::optional<std::vector<double>> &initial,
                                const std::optional<kfit::parameter_bounds_t> &bounds){
    const auto &m = this->require_model();

    selected_series_t sel;
    try{
        sel = this->selected();
    }catch(const kfit::domain_error &e){
        fit_result res;
        res.model_id = m.id;
        res.parameter_names = m.parameter_names();
        res.parameters = initial.value_or(m.default_parameters());
        res.failure = fit_failure_t::domain_error;
        res.reason = "Signal conversion failed: "_s + e.what();
        res.intervals.assign(res.parameters.size(), std::nullopt);
        res.interval_status.assign(res.parameters.size(), ci_status_t::not_computed);
        this->fit = res;
        return this->fit.value();
    }

    this->fit = Fit_Model(m, sel.observed, sel.inputs, initial.value_or(m.default_parameters()),
                          bounds, this->catalog.constants, this->options);
    return this->fit.value();
}

const std::optional<kfit::fit_result>&
kfit::analysis_session::get_fit() const {
    return this->fit;
}

std::vector<double>
kfit::analysis_session::predict(const std::vector<double> &params) const {
    const auto sel = this->selected();
    return Evaluate_Descriptor(this->require_model(), sel.inputs, params, this->catalog.constants);
}

const kfit::fit_result&
kfit::analysis_session::edit_parameter(size_t index, double value){
    if(!this->fit || !this->fit->ok()){
        throw std::logic_error("There is no fit to edit");
    }
    auto edited = Override_Parameter(this->fit.value(), index, value);
    edited.predicted = this->predict(edited.parameters);

    const auto sel = this->selected();
    edited.RSS = 0.0;
    for(size_t i = 0; i < sel.observed.size(); ++i){
        edited.RSS += (edited.predicted[i] - sel.observed[i]) * (edited.predicted[i] - sel.observed[i]);
    }
    YLOGINFO("Parameter '" << edited.parameter_names.at(index) << "' set to " << value
             << "; confidence intervals cleared");
    this->fit = std::move(edited);
    return this->fit.value();
}

std::vector<kfit::plot_series_t>
kfit::analysis_session::plot_series() const {
    const auto sel = this->selected();
    std::vector<plot_series_t> out;
    out.push_back({ this->roi, sel.observed });
    out.push_back({ this->aif, sel.inputs.aif });
    if(this->vif && sel.inputs.vif){
        out.push_back({ this->vif.value(), sel.inputs.vif.value() });
    }
    if(this->fit && this->fit->ok() && (this->fit->predicted.size() == sel.observed.size())){
        out.push_back({ this->require_model().id + " model", this->fit->predicted });
    }
    return out;
}

void
kfit::analysis_session::export_plot_data(const std::filesystem::path &path) const {
    Write_Plot_Data(path, this->get_data().time, this->plot_series());
    return;
}

std::optional<std::string>
kfit::Prepare_Session(kfit::analysis_session &session,
                      const std::filesystem::path &path,
                      const std::string &model_id,
                      const std::string &roi_name,
                      const std::string &aif_name,
                      const std::optional<std::string> &vif_name){
    session.select_model(model_id);

    const auto loaded = session.load_data(path);
    if(!loaded.ok()){
        return Validation_Stage_Name(loaded.failure->stage) + ": " + loaded.failure->reason;
    }
    try{
        session.select_series(roi_name, aif_name, vif_name);
    }catch(const std::invalid_argument &e){
        return std::string(e.what());
    }
    return {};
}
