//Kinefit.cc - A part of Kinefit 2026.
//
// Command-line driver. Fits a catalog model to a single time-course file, or to every file in a folder.
//

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <exception>
#include <stdexcept>
#include <cstdlib>
#include <utility>

#include "YgorMisc.h"
#include "YgorLog.h"
#include "YgorString.h"      //Needed for SplitStringToVector(...).
#include "YgorArguments.h"   //Needed for ArgumentHandler class.
#include "YgorFilesDirs.h"   //Needed for Does_File_Exist_And_Can_Be_Read(...).

#include "Model_Catalog.h"
#include "Curve_Fitting.h"
#include "Time_Series_Loader.h"
#include "Analysis_Session.h"
#include "Batch_Processing.h"
#include "Result_Export.h"

#ifndef KFIT_VERSION_STR
    #define KFIT_VERSION_STR "unknown"
#endif

namespace {

// Splits 'name=value' into its parts.
std::pair<std::string, std::string>
split_assignment(const std::string &optarg){
    auto tokens = SplitStringToVector(optarg, '=', 'd');
    if(tokens.size() != 2){
        throw std::invalid_argument("Assignment format not recognized: '" + optarg + "'. Use 'A=B'");
    }
    return { Canonicalize_String2(tokens.front(), CANONICALIZE::TRIM_ENDS),
             Canonicalize_String2(tokens.back(), CANONICALIZE::TRIM_ENDS) };
}

double
parse_number(const std::string &s){
    if(!Is_String_An_X<double>(s)){
        throw std::invalid_argument("Unable to parse '" + s + "' as a number");
    }
    return stringtoX<double>(s);
}

size_t
parameter_index(const kfit::model_descriptor_t &model, const std::string &name){
    for(size_t i = 0; i < model.parameters.size(); ++i){
        if( (model.parameters[i].short_name == name)
        ||  (model.parameters[i].long_name == name) ) return i;
    }
    throw std::invalid_argument("Model '" + model.id + "' has no parameter named '" + name + "'");
}

void
print_models(std::ostream &os, const kfit::model_catalog_t &catalog){
    for(const auto &m : catalog.models){
        os << m.id << " : " << m.long_name << " (" << kfit::Function_Name(m.kind) << ", "
           << kfit::Inlet_Type_Name(m.inlet) << " inlet)" << std::endl;
        for(const auto &p : m.parameters){
            os << "    " << p.short_name << " [" << p.units << "] default " << p.default_value
               << ", constrained to [" << p.lower << ", " << p.upper << "]" << std::endl;
        }
    }
    return;
}

void
print_fit(std::ostream &os, const kfit::fit_result &fit){
    if(!fit.ok()){
        os << "Fit failed (" << kfit::Fit_Failure_Name(fit.failure) << "): " << fit.reason << std::endl;
        return;
    }
    os << "Model '" << fit.model_id << "' via " << fit.method
       << (fit.converged ? " converged" : " did not converge")
       << " after " << fit.iterations << " iterations. RSS = " << kfit::Format_Number(fit.RSS) << std::endl;
    for(size_t i = 0; i < fit.parameters.size(); ++i){
        os << "    " << fit.parameter_names[i] << " = " << kfit::Format_Number(fit.parameters[i]);
        if(fit.intervals[i]){
            os << "  [" << kfit::Format_Number(fit.intervals[i]->lower)
               << ", " << kfit::Format_Number(fit.intervals[i]->upper) << "]";
        }else{
            os << "  (no interval: " << kfit::CI_Status_Name(fit.interval_status[i]) << ")";
        }
        os << std::endl;
    }
    return;
}

} // namespace


int main(int argc, char* argv[]){

    std::filesystem::path catalog_path("Model_Catalog.xml");
    std::optional<std::filesystem::path> batch_folder;
    std::vector<std::filesystem::path> single_files;
    std::optional<std::filesystem::path> output_dir;

    std::string roi;
    std::string aif;
    std::optional<std::string> vif;
    std::string model_id;

    std::vector<std::pair<std::string, std::string>> initial_values;
    std::vector<std::pair<std::string, std::string>> bound_values;
    std::vector<std::pair<std::string, std::string>> edits;

    kfit::fit_options_t fit_options;
    bool convert_signal = false;
    bool list_models = false;

    //================================================ Argument Parsing ==============================================

    class ArgumentHandler arger;
    const std::string progname(argv[0]);
    arger.examples = { { "--help",
                         "Show the help screen and some info about the program." },
                       { "-c catalog.xml -L",
                         "List the models defined in the catalog and their parameters." },
                       { "-c catalog.xml -m 1 -r Liver -a Aorta -v Portal patient.csv",
                         "Fit model '1' to the 'Liver' series of a single file, using 'Aorta' and 'Portal' as"
                         " arterial and venous inputs." },
                       { "-c catalog.xml -m 2 -r Liver -a Aorta -d data/ -o results/ -s",
                         "Convert every file in 'data/' from signal to concentration, fit model '2', and write"
                         " per-file series and a summary to 'results/'." },
                       { "-m 1 -r Liver -a Aorta -p Ve=20 -b Ve=5:60 -e Kbh=0.1 patient.csv",
                         "Start the fit at Ve=20, restrict Ve to [5,60], and then override Kbh." } };
    arger.description = "A program for fitting tracer-kinetic models to MR time courses. Version: "_s + KFIT_VERSION_STR;

    arger.default_callback = [](int, const std::string &optarg) -> void {
      YLOGERR("Unrecognized option with argument: '" << optarg << "'");
      return;
    };
    arger.optionless_callback = [&](const std::string &optarg) -> void {
      single_files.emplace_back(optarg);
      return;
    };

    arger.push_back( ygor_arg_handlr_t(0, 'V', "version", false, "",
      "Print the version and quit.",
      [&](const std::string &) -> void {
        std::cout << "Kinefit version: " << KFIT_VERSION_STR << std::endl;
        std::exit(0);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(100, 'c', "catalog", true, catalog_path.string(),
      "The model catalog (XML) defining the available models, their parameters, and shared constants.",
      [&](const std::string &optarg) -> void {
        catalog_path = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(110, 'L', "list-models", false, "",
      "List the models in the catalog and quit.",
      [&](const std::string &) -> void {
        list_models = true;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(200, 'f', "file", true, "/path/to/file.csv",
      "A single time-course file to fit. (This is the default for argument-less options.)",
      [&](const std::string &optarg) -> void {
        single_files.emplace_back(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(210, 'd', "folder", true, "/path/to/dir/",
      "Fit every time-course file in the given folder.",
      [&](const std::string &optarg) -> void {
        batch_folder = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(220, 'o', "output-dir", true, "/path/to/dir/",
      "Where derived series and summaries are written.",
      [&](const std::string &optarg) -> void {
        output_dir = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(300, 'r', "roi", true, "Liver",
      "The header of the observed (tissue) series.",
      [&](const std::string &optarg) -> void {
        roi = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(310, 'a', "aif", true, "Aorta",
      "The header of the arterial input function series.",
      [&](const std::string &optarg) -> void {
        aif = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(320, 'v', "vif", true, "Portal",
      "The header of the venous input function series. Required by dual-inlet models.",
      [&](const std::string &optarg) -> void {
        vif = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(330, 's', "convert-signal", false, "",
      "Treat the series as SPGR signal and convert them to concentration before fitting.",
      [&](const std::string &) -> void {
        convert_signal = true;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(400, 'm', "model", true, "1",
      "The catalog identifier of the model to fit.",
      [&](const std::string &optarg) -> void {
        model_id = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(410, 'p', "parameter", true, "Ve=20",
      "An initial value for a model parameter, in catalog units. Overrides the catalog default.",
      [&](const std::string &optarg) -> void {
        try{
          initial_values.emplace_back( split_assignment(optarg) );
        }catch(const std::exception &e){
          YLOGERR("Unable to parse parameter: " << e.what());
        }
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(420, 'b', "bounds", true, "Ve=5:60",
      "Restrict a parameter to 'lower:upper'. The catalog constraints still apply. Equal bounds fix the parameter.",
      [&](const std::string &optarg) -> void {
        try{
          bound_values.emplace_back( split_assignment(optarg) );
        }catch(const std::exception &e){
          YLOGERR("Unable to parse bounds: " << e.what());
        }
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(430, 'M', "method", true, "lm",
      "The fitting method: 'lm' (Levenberg-Marquardt) or 'bobyqa'.",
      [&](const std::string &optarg) -> void {
        const auto method = kfit::Fit_Method_From_Name(optarg);
        if(!method) YLOGERR("Unrecognized fitting method '" << optarg << "'");
        fit_options.method = method.value();
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(440, 'e', "edit", true, "Kbh=0.1",
      "Single-file mode only: after fitting, override a parameter and recompute the model curve.",
      [&](const std::string &optarg) -> void {
        try{
          edits.emplace_back( split_assignment(optarg) );
        }catch(const std::exception &e){
          YLOGERR("Unable to parse edit: " << e.what());
        }
        return;
      })
    );

    arger.Launch(argc, argv);

    //============================================== Input Verification ==============================================

    try{
        if(!Does_File_Exist_And_Can_Be_Read(catalog_path.string())){
            throw std::invalid_argument("Unable to read model catalog '" + catalog_path.string() + "'");
        }
        const auto catalog = kfit::Load_Catalog_File(catalog_path);

        if(list_models){
            print_models(std::cout, catalog);
            return 0;
        }

        if(model_id.empty()) throw std::invalid_argument("No model was selected");
        const auto *model = catalog.find_model(model_id);
        if(model == nullptr) throw std::invalid_argument("Model '" + model_id + "' is not defined in the catalog");
        if(roi.empty() || aif.empty()) throw std::invalid_argument("Both ROI and AIF series must be named");
        if(batch_folder && !single_files.empty()){
            throw std::invalid_argument("Provide either a folder or individual files, not both");
        }
        if(!batch_folder && single_files.empty()){
            throw std::invalid_argument("No input files were provided");
        }

        std::optional<std::vector<double>> initial;
        if(!initial_values.empty()){
            initial = model->default_parameters();
            for(const auto &[name, value] : initial_values){
                initial.value().at(parameter_index(*model, name)) = parse_number(value);
            }
        }

        std::optional<kfit::parameter_bounds_t> bounds;
        if(!bound_values.empty()){
            bounds = kfit::parameter_bounds_t{ model->lower_bounds(), model->upper_bounds() };
            for(const auto &[name, range] : bound_values){
                const auto tokens = SplitStringToVector(range, ':', 'd');
                if(tokens.size() != 2){
                    throw std::invalid_argument("Bounds format not recognized: '" + range + "'. Use 'lower:upper'");
                }
                const auto i = parameter_index(*model, name);
                bounds.value().lower.at(i) = parse_number(tokens.front());
                bounds.value().upper.at(i) = parse_number(tokens.back());
            }
        }

        //================================================ Batch Processing ============================================

        if(batch_folder){
            kfit::batch_config config;
            config.folder = batch_folder.value();
            config.roi = roi;
            config.aif = aif;
            config.vif = vif;
            config.model_id = model_id;
            config.initial = initial;
            config.bounds = bounds;
            config.convert_signal = convert_signal;
            config.fit_options = fit_options;
            config.output_dir = output_dir;

            const auto summary = kfit::Run_Batch(config, catalog,
                [](size_t processed, size_t total, const kfit::batch_record &r) -> void {
                    YLOGINFO("Completed " << processed << " of " << total << ": '" << r.file << "' ("
                             << kfit::Batch_State_Name(r.state) << ")");
                    return;
                });

            kfit::Write_Batch_Summary(std::cout, summary);
            for(const auto &[file, reason] : summary.skipped_files()){
                YLOGWARN("Skipped '" << file << "': " << reason);
            }
            return 0;
        }

        //=============================================== Single-File Fitting ==========================================

        for(const auto &f : single_files){
            kfit::analysis_session session(catalog);
            session.set_signal_conversion(convert_signal);
            session.set_fit_options(fit_options);

            const auto problem = kfit::Prepare_Session(session, f, model_id, roi, aif, vif);
            if(problem){
                YLOGWARN("Skipping '" << f.string() << "': " << problem.value());
                continue;
            }

            std::cout << "File '" << f.string() << "'" << std::endl;
            const auto &fit = session.run_fit(initial, bounds);
            print_fit(std::cout, fit);
            if(!fit.ok()) continue;

            for(const auto &[name, value] : edits){
                print_fit(std::cout, session.edit_parameter(parameter_index(*model, name), parse_number(value)));
            }

            if(output_dir){
                std::filesystem::create_directories(output_dir.value());
                const auto out = output_dir.value() / (f.stem().string() + "_fit.csv");
                session.export_plot_data(out);
                YLOGINFO("Wrote plot data to '" << out.string() << "'");
            }
        }

    }catch(const std::exception &e){
        YLOGWARN("Analysis failed: " << e.what());
        return 1;
    }

    return 0;
}
