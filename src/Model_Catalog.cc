//Model_Catalog.cc - A part of Kinefit 2026.
//
// Parses the model catalog document. The expected layout is:
//
//   <catalog>
//     <data_file_path>...</data_file_path>                      (optional)
//     <plot><y_axis_label>...</y_axis_label></plot>             (optional)
//     <constants>
//       <constant><name>TR</name><value>0.0058</value></constant>
//     </constants>
//     <model id="...">
//       <name><short>...</short><long>...</long></name>
//       <function>...</function>
//       <image>...</image>                                      (optional)
//       <inlet_type>single|dual</inlet_type>
//       <parameters>
//         <parameter>
//           <name><short>...</short><long>...</long></name>
//           <units>...</units>                                  (optional)
//           <default>...</default>
//           <step>...</step>                                    (optional)
//           <precision>...</precision>                          (optional)
//           <range><min>...</min><max>...</max></range>         (optional, defaults to the constraints)
//           <constraints><lower>...</lower><upper>...</upper></constraints>
//         </parameter>
//       </parameters>
//     </model>
//   </catalog>
//

#include <string>
#include <vector>
#include <optional>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

#include "YgorMisc.h"
#include "YgorString.h"
#include "YgorLog.h"

#include "Kinefit_Errors.h"
#include "XML_Tools.h"
#include "Model_Catalog.h"

namespace {

std::string
lowercase(std::string s){
    std::transform(std::begin(s), std::end(s), std::begin(s),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string
require_content(kfit::xml::node &n,
                std::initializer_list<std::string> names,
                const std::string &context){
    const auto c = kfit::xml::child_content(n, names);
    if(!c || c->empty()){
        std::string path;
        for(const auto &s : names) path += (path.empty() ? "" : "/") + s;
        throw kfit::missing_element_error("Missing mandatory element '" + path + "' in " + context);
    }
    return c.value();
}

double
parse_number(const std::string &s, const std::string &what){
    if(!Is_String_An_X<double>(s)){
        throw kfit::catalog_parse_error("Unable to parse " + what + " '" + s + "' as a number");
    }
    const auto x = stringtoX<double>(s);
    if(!std::isfinite(x)){
        throw kfit::catalog_parse_error("Value of " + what + " is not finite");
    }
    return x;
}

std::optional<double>
optional_number(kfit::xml::node &n,
                std::initializer_list<std::string> names,
                const std::string &what){
    std::optional<double> out;
    const auto c = kfit::xml::child_content(n, names);
    if(c && !c->empty()){
        out = parse_number(c.value(), what);
    }
    return out;
}

kfit::parameter_spec_t
parse_parameter(kfit::xml::node &n, const std::string &model_id){
    kfit::parameter_spec_t p;
    const auto context = "a parameter of model '" + model_id + "'";
    p.short_name = require_content(n, {"name", "short"}, context);
    p.long_name  = kfit::xml::child_content(n, {"name", "long"}).value_or(p.short_name);
    p.units      = kfit::xml::child_content(n, {"units"}).value_or("");

    const auto what = "parameter '" + p.short_name + "' of model '" + model_id + "'";
    p.default_value = parse_number(require_content(n, {"default"}, what), "default of " + what);
    p.lower = parse_number(require_content(n, {"constraints", "lower"}, what), "lower constraint of " + what);
    p.upper = parse_number(require_content(n, {"constraints", "upper"}, what), "upper constraint of " + what);

    if(p.upper < p.lower){
        throw kfit::invalid_parameter_range_error("Lower constraint exceeds upper constraint for " + what);
    }
    if( (p.default_value < p.lower) || (p.upper < p.default_value) ){
        throw kfit::invalid_parameter_range_error("Default value lies outside the constraints for " + what);
    }

    p.display_min = optional_number(n, {"range", "min"}, "display minimum of " + what).value_or(p.lower);
    p.display_max = optional_number(n, {"range", "max"}, "display maximum of " + what).value_or(p.upper);
    if(p.display_max < p.display_min){
        throw kfit::invalid_parameter_range_error("Display range is inverted for " + what);
    }

    p.step = optional_number(n, {"step"}, "step of " + what).value_or( (p.upper - p.lower) / 100.0 );
    const auto precision = optional_number(n, {"precision"}, "precision of " + what);
    if(precision){
        if( (precision.value() < 0.0) || (std::round(precision.value()) != precision.value()) ){
            throw kfit::catalog_parse_error("Precision must be a non-negative integer for " + what);
        }
        p.precision = static_cast<int64_t>(precision.value());
    }
    return p;
}

kfit::model_descriptor_t
parse_model(kfit::xml::node &n){
    kfit::model_descriptor_t m;

    const auto id_it = n.metadata.find("id");
    m.short_name = kfit::xml::child_content(n, {"name", "short"}).value_or("");
    m.id = (id_it != std::end(n.metadata)) ? Canonicalize_String2(id_it->second, CANONICALIZE::TRIM_ENDS)
                                           : m.short_name;
    if(m.id.empty()){
        throw kfit::missing_element_error("A model has neither an 'id' attribute nor a short name");
    }
    if(m.short_name.empty()) m.short_name = m.id;
    m.long_name = kfit::xml::child_content(n, {"name", "long"}).value_or(m.short_name);
    m.image     = kfit::xml::child_content(n, {"image"}).value_or("");

    const auto context = "model '" + m.id + "'";
    m.function_name = require_content(n, {"function"}, context);
    const auto kind = kfit::Model_Kind_From_Function_Name(m.function_name);
    if(!kind){
        throw kfit::unknown_function_error("Model '" + m.id + "' references unknown function '" + m.function_name + "'");
    }
    m.kind = kind.value();

    const auto inlet_name = require_content(n, {"inlet_type"}, context);
    const auto inlet = kfit::Inlet_Type_From_Name(inlet_name);
    if(!inlet){
        throw kfit::catalog_parse_error("Model '" + m.id + "' has unrecognized inlet type '" + inlet_name + "'");
    }
    if(inlet.value() != kfit::Inlet_Type(m.kind)){
        throw kfit::catalog_parse_error("Model '" + m.id + "' declares a " + kfit::Inlet_Type_Name(inlet.value())
                                        + " inlet but function '" + m.function_name + "' requires a "
                                        + kfit::Inlet_Type_Name(kfit::Inlet_Type(m.kind)) + " inlet");
    }
    m.inlet = inlet.value();

    for(auto &params_node : kfit::xml::children_named(n, "parameters")){
        for(auto &param_node : kfit::xml::children_named(params_node.get(), "parameter")){
            m.parameters.emplace_back( parse_parameter(param_node.get(), m.id) );
        }
    }
    if(m.parameters.empty()){
        throw kfit::missing_element_error("Model '" + m.id + "' declares no parameters");
    }

    const auto expected = kfit::Parameter_Names(m.kind);
    if(expected.size() != m.parameters.size()){
        throw kfit::catalog_parse_error("Model '" + m.id + "' declares " + std::to_string(m.parameters.size())
                                        + " parameters but function '" + m.function_name + "' requires "
                                        + std::to_string(expected.size()));
    }

    // Parameters are bound to the function's arguments by (case-insensitive) short name, not by position.
    std::vector<kfit::parameter_spec_t> ordered;
    for(const auto &name : expected){
        const auto matches = std::count_if(std::begin(m.parameters), std::end(m.parameters),
                                           [&](const kfit::parameter_spec_t &p){
                                               return lowercase(p.short_name) == lowercase(name);
                                           });
        if(matches != 1){
            throw kfit::catalog_parse_error("Model '" + m.id + "' must declare parameter '" + name
                                            + "' exactly once for function '" + m.function_name + "'");
        }
        const auto it = std::find_if(std::begin(m.parameters), std::end(m.parameters),
                                     [&](const kfit::parameter_spec_t &p){
                                         return lowercase(p.short_name) == lowercase(name);
                                     });
        ordered.push_back(*it);
    }
    for(size_t i = 0; i < expected.size(); ++i){
        if(ordered[i].short_name != m.parameters[i].short_name){
            YLOGINFO("Parameters of model '" << m.id << "' were reordered to match function '"
                     << m.function_name << "'");
            break;
        }
    }
    m.parameters = ordered;
    return m;
}

} // namespace

bool
kfit::parameter_spec_t::is_percentage() const {
    return (Canonicalize_String2(this->units, CANONICALIZE::TRIM_ENDS) == "%");
}

std::vector<double>
kfit::model_descriptor_t::default_parameters() const {
    std::vector<double> out;
    for(const auto &p : this->parameters) out.push_back(p.default_value);
    return out;
}

std::vector<double>
kfit::model_descriptor_t::lower_bounds() const {
    std::vector<double> out;
    for(const auto &p : this->parameters) out.push_back(p.lower);
    return out;
}

std::vector<double>
kfit::model_descriptor_t::upper_bounds() const {
    std::vector<double> out;
    for(const auto &p : this->parameters) out.push_back(p.upper);
    return out;
}

std::vector<std::string>
kfit::model_descriptor_t::parameter_names() const {
    std::vector<std::string> out;
    for(const auto &p : this->parameters) out.push_back(p.short_name);
    return out;
}

const kfit::model_descriptor_t*
kfit::model_catalog_t::find_model(const std::string &id) const {
    for(const auto &m : this->models){
        if(m.id == id) return &m;
    }
    return nullptr;
}

kfit::model_catalog_t
kfit::Load_Catalog(std::istream &is){
    kfit::xml::node doc;
    try{
        kfit::xml::read_node(is, doc);
    }catch(const std::exception &e){
        throw kfit::catalog_parse_error("Unable to parse catalog document: "_s + e.what());
    }

    model_catalog_t catalog;

    kfit::xml::search_callback_t f_folder = [&](const kfit::xml::node_chain_t &nc) -> bool {
        const auto c = Canonicalize_String2(nc.back().get().content, CANONICALIZE::TRIM_ENDS);
        if(!c.empty()) catalog.data_folder = c;
        return false;
    };
    kfit::xml::search_by_names(doc, {"data_file_path"}, f_folder);

    kfit::xml::search_callback_t f_label = [&](const kfit::xml::node_chain_t &nc) -> bool {
        const auto c = Canonicalize_String2(nc.back().get().content, CANONICALIZE::TRIM_ENDS);
        if(!c.empty()) catalog.y_axis_label = c;
        return false;
    };
    kfit::xml::search_by_names(doc, {"plot", "y_axis_label"}, f_label);

    kfit::xml::search_callback_t f_constant = [&](const kfit::xml::node_chain_t &nc) -> bool {
        auto &n = nc.back().get();
        const auto name = require_content(n, {"name"}, "a constant");
        const auto value = require_content(n, {"value"}, "constant '" + name + "'");
        if(!Is_String_An_X<double>(value)){
            throw kfit::malformed_constant_error("Constant '" + name + "' has non-numeric value '" + value + "'");
        }
        if(catalog.constants.count(name) != 0){
            throw kfit::duplicate_constant_error("Constant '" + name + "' is specified more than once");
        }
        catalog.constants[name] = stringtoX<double>(value);
        return true;
    };
    kfit::xml::search_by_names(doc, {"constants", "constant"}, f_constant);

    std::set<std::string> ids;
    kfit::xml::search_callback_t f_model = [&](const kfit::xml::node_chain_t &nc) -> bool {
        auto m = parse_model(nc.back().get());
        if(!ids.insert(m.id).second){
            throw kfit::catalog_parse_error("Model id '" + m.id + "' is used more than once");
        }
        catalog.models.emplace_back(std::move(m));
        return true;
    };
    kfit::xml::search_by_names(doc, {"model"}, f_model);

    if(catalog.models.empty()){
        throw kfit::catalog_parse_error("Catalog does not define any models");
    }

    YLOGINFO("Loaded model catalog with " << catalog.constants.size() << " constants and "
             << catalog.models.size() << " models");
    return catalog;
}

kfit::model_catalog_t
kfit::Load_Catalog_File(const std::filesystem::path &path){
    std::ifstream ifs(path);
    if(!ifs){
        throw kfit::catalog_parse_error("Unable to open catalog file '" + path.string() + "'");
    }
    auto catalog = Load_Catalog(ifs);
    YLOGINFO("Catalog read from '" << path.string() << "'");
    return catalog;
}

std::vector<double>
kfit::To_Model_Units(const kfit::model_descriptor_t &model, const std::vector<double> &params){
    if(params.size() != model.parameters.size()){
        throw std::invalid_argument("Model '" + model.id + "' requires " + std::to_string(model.parameters.size())
                                    + " parameters but " + std::to_string(params.size()) + " were provided");
    }
    std::vector<double> out(params);
    for(size_t i = 0; i < params.size(); ++i){
        if(model.parameters[i].is_percentage()) out[i] /= 100.0;
    }
    return out;
}

std::vector<double>
kfit::Evaluate_Descriptor(const kfit::model_descriptor_t &model,
                          const kfit::model_inputs_t &inputs,
                          const std::vector<double> &params,
                          const kfit::constant_set_t &constants){
    return kfit::Evaluate_Model(model.kind, inputs, To_Model_Units(model, params), constants);
}
