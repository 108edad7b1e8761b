//Batch_Processing.cc - A part of Kinefit 2026.

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <sstream>
#include <cctype>

#include "YgorMisc.h"
#include "YgorString.h"
#include "YgorLog.h"

#include "Kinefit_Errors.h"
#include "Time_Series_Loader.h"
#include "Write_File.h"
#include "Batch_Processing.h"

namespace {

const std::string summary_file_name = "batch_summary.csv";
const std::string per_file_suffix = "_fit.csv";

std::string
lowercase(std::string s){
    std::transform(std::begin(s), std::end(s), std::begin(s),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool
ends_with(const std::string &s, const std::string &suffix){
    return (suffix.size() <= s.size())
        && (s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
}

// Applies the loader, series selection, and fitting engine to a single file.
void
process_file(const kfit::batch_config &config,
             const kfit::model_catalog_t &catalog,
             const kfit::model_descriptor_t &model,
             kfit::batch_record &rec){

    const auto loaded = kfit::Load_Time_Series(rec.path);
    if(!loaded.ok()){
        rec.state = kfit::batch_state::rejected;
        rec.reason = loaded.failure.value().reason;
        return;
    }
    const auto &set = loaded.data.value();

    std::optional<kfit::constant_set_t> convert_with;
    if(config.convert_signal && (model.kind != kfit::model_kind::high_flow_spgr_signal)){
        convert_with = catalog.constants;
    }

    kfit::selected_series_t sel;
    try{
        sel = kfit::Select_Fit_Series(set, config.roi, config.aif, config.vif, convert_with);
    }catch(const std::out_of_range &e){
        rec.state = kfit::batch_state::rejected;
        rec.reason = e.what();
        return;
    }catch(const kfit::domain_error &e){
        rec.state = kfit::batch_state::fit_failed;
        rec.reason = "Signal conversion failed: "_s + e.what();
        return;
    }

    const auto initial = config.initial.value_or(model.default_parameters());
    auto fit = kfit::Fit_Model(model, sel.observed, sel.inputs, initial, config.bounds,
                               catalog.constants, config.fit_options);
    if(!fit.ok()){
        rec.state = kfit::batch_state::fit_failed;
        rec.reason = fit.reason;
        rec.fit = std::move(fit);
        return;
    }

    rec.time = sel.inputs.time;
    rec.derived.push_back({ config.roi, sel.observed });
    rec.derived.push_back({ config.aif, sel.inputs.aif });
    if(sel.inputs.vif){
        rec.derived.push_back({ config.vif.value(), sel.inputs.vif.value() });
    }
    rec.derived.push_back({ model.id + " model", fit.predicted });
    rec.state = kfit::batch_state::fitted;
    if(!fit.converged){
        rec.reason = fit.interval_reason;
    }
    rec.fit = std::move(fit);

    if(config.output_dir){
        const auto out_path = config.output_dir.value() / (rec.path.stem().string() + per_file_suffix);
        try{
            kfit::Write_Plot_Data(out_path, rec.time, rec.derived);
        }catch(const std::exception &e){
            // The fit itself stands; only the export is missing.
            YLOGWARN("Unable to export '" << rec.file << "': " << e.what());
            rec.reason += (rec.reason.empty() ? "" : "; ") + "export failed: "_s + e.what();
            return;
        }
        rec.outputs.push_back(out_path);
        rec.state = kfit::batch_state::exported;
    }
    return;
}

} // namespace

std::string
kfit::Batch_State_Name(kfit::batch_state s){
    switch(s){
        case batch_state::rejected:   return "rejected";
        case batch_state::fit_failed: return "fit failed";
        case batch_state::fitted:     return "fitted";
        case batch_state::exported:   return "exported";
    }
    throw std::logic_error("Unhandled batch state");
}

size_t
kfit::batch_summary::count(kfit::batch_state s) const {
    return static_cast<size_t>(std::count_if(std::begin(this->records), std::end(this->records),
                                             [s](const batch_record &r){ return r.state == s; }));
}

std::vector<std::pair<std::string, std::string>>
kfit::batch_summary::skipped_files() const {
    std::vector<std::pair<std::string, std::string>> out;
    for(const auto &r : this->records){
        if( (r.state == batch_state::rejected)
        ||  (r.state == batch_state::fit_failed) ){
            out.emplace_back(r.file, r.reason);
        }
    }
    return out;
}

std::vector<std::filesystem::path>
kfit::Find_Batch_Files(const kfit::batch_config &config){
    if(!std::filesystem::is_directory(config.folder)){
        throw std::invalid_argument("Batch folder '" + config.folder.string() + "' does not exist or is not a directory");
    }
    const auto ext = lowercase(config.extension);
    const bool outputs_alongside = config.output_dir
                                && std::filesystem::exists(config.output_dir.value())
                                && std::filesystem::equivalent(config.output_dir.value(), config.folder);

    std::vector<std::filesystem::path> out;
    for(const auto &entry : std::filesystem::directory_iterator(config.folder)){
        if(!entry.is_regular_file()) continue;
        const auto name = entry.path().filename().string();
        if(lowercase(entry.path().extension().string()) != ext) continue;
        if(name == summary_file_name) continue;
        if(outputs_alongside && ends_with(name, per_file_suffix)) continue;
        out.push_back(entry.path());
    }
    std::sort(std::begin(out), std::end(out));
    return out;
}

kfit::batch_summary
kfit::Run_Batch(const kfit::batch_config &config,
                const kfit::model_catalog_t &catalog,
                const kfit::batch_progress_callback_t &progress,
                const kfit::batch_cancel_callback_t &cancel){

    const auto *model = catalog.find_model(config.model_id);
    if(model == nullptr){
        throw std::invalid_argument("Model '" + config.model_id + "' is not defined in the catalog");
    }
    if(config.output_dir){
        std::filesystem::create_directories(config.output_dir.value());
    }
    if(config.convert_signal && (model->kind == model_kind::high_flow_spgr_signal)){
        YLOGWARN("Model '" << model->id << "' operates on signal directly; signal conversion is disabled");
    }

    const auto files = Find_Batch_Files(config);

    batch_summary summary;
    summary.model_id = model->id;
    summary.parameter_names = model->parameter_names();
    summary.total_files = files.size();

    const auto header = Format_CSV_Row(Summary_Header(summary.parameter_names));
    std::optional<std::filesystem::path> summary_path;
    if(config.output_dir){
        // Rows from earlier runs into the same directory are discarded.
        summary_path = config.output_dir.value() / summary_file_name;
        Overwrite_File( [&](){ return summary_path.value(); },
                        Mutex_Name_For_File(summary_path.value()),
                        header );
    }

    const size_t N = files.size();
    size_t i = 0;
    for(const auto &f : files){
        if(cancel && cancel()){
            YLOGWARN("Batch cancelled after " << i << " of " << N << " files");
            summary.cancelled = true;
            break;
        }
        YLOGINFO("Processing file #" << i+1 << "/" << N << " = " << 100*(i+1)/N << "%");
        ++i;

        batch_record rec;
        rec.file = f.filename().string();
        rec.path = f;
        try{
            process_file(config, catalog, *model, rec);
        }catch(const std::exception &e){
            rec.state = batch_state::fit_failed;
            rec.reason = e.what();
        }
        if( (rec.state == batch_state::rejected)
        ||  (rec.state == batch_state::fit_failed) ){
            YLOGWARN("Skipping file '" << rec.file << "': " << rec.reason);
        }

        if(summary_path){
            const auto row = Format_CSV_Row(Summary_Row(rec.file, Batch_State_Name(rec.state),
                                                        rec.fit ? &(rec.fit.value()) : nullptr,
                                                        rec.reason, summary.parameter_names.size()));
            try{
                Append_File( [&](){ return summary_path.value(); },
                             Mutex_Name_For_File(summary_path.value()),
                             header,
                             row );
            }catch(const std::exception &e){
                YLOGWARN("Unable to append summary for '" << rec.file << "': " << e.what());
                rec.reason += (rec.reason.empty() ? "" : "; ") + "summary not written: "_s + e.what();
            }
        }

        summary.records.emplace_back(std::move(rec));
        if(progress){
            progress(summary.records.size(), N, summary.records.back());
        }
    }

    YLOGINFO("Batch finished: " << summary.records.size() << " of " << N << " files processed, "
             << summary.count(batch_state::rejected) << " rejected, "
             << summary.count(batch_state::fit_failed) << " failed");
    return summary;
}

void
kfit::Write_Batch_Summary(std::ostream &os, const kfit::batch_summary &summary){
    os << Format_CSV_Row(Summary_Header(summary.parameter_names));
    for(const auto &rec : summary.records){
        os << Format_CSV_Row(Summary_Row(rec.file, Batch_State_Name(rec.state),
                                         rec.fit ? &(rec.fit.value()) : nullptr,
                                         rec.reason, summary.parameter_names.size()));
    }
    os.flush();
    if(!os){
        throw std::runtime_error("Unable to write batch summary");
    }
    return;
}
