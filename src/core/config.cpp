/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "dsmash/core/config.hpp"
#include "dsmash/core/grid.hpp"
#include "dsmash/core/states.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <iostream>
#include <iomanip>
#include <algorithm>

namespace dsmash {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

template<typename T, typename F>
std::vector<T> parse_list(const std::string& value, F&& convert) {
    std::vector<T> out;
    for (const auto& item : config_io::split_list(value)) {
        out.push_back(convert(item));
    }
    return out;
}

template<typename T, typename F>
void write_list(std::ostream& os, const std::string& key, const std::vector<T>& values, F&& convert) {
    if (values.empty()) return;
    os << "  " << key << ": ";
    for (Size i = 0; i < values.size(); ++i) {
        if (i > 0) os << ", ";
        os << convert(values[i]);
    }
    os << "\n";
}

Real to_real(const std::string& s) { return std::stod(s); }
Index to_index(const std::string& s) { return std::stoll(s); }

} // anonymous namespace

// ============================================================================
// ModelConfig / CostConfig
// ============================================================================

void ModelConfig::print(std::ostream& os) const {
    os << "Model:\n";
    os << "  Structure:  " << config_io::to_string(structure) << "\n";
    os << "  dt:         " << dt << " s\n";
    os << "  Time steps: " << ntime_step << "\n";
    os << "  Storage:    " << grid_io::to_string(storage) << "\n";
}

Real CostConfig::gauge_weight(Index g) const {
    if (gauge_weights.empty()) {
        return g == 0 ? 1.0 : 0.0;
    }
    if (g < 0 || g >= static_cast<Index>(gauge_weights.size())) {
        return 0.0;
    }
    return gauge_weights[g];
}

bool CostConfig::is_optimized(ParameterName name) const {
    return std::find(optim_parameters.begin(), optim_parameters.end(), name) != optim_parameters.end();
}

bool CostConfig::is_optimized(StateName name) const {
    return std::find(optim_states.begin(), optim_states.end(), name) != optim_states.end();
}

void CostConfig::print(std::ostream& os) const {
    os << "Cost:\n";
    os << "  Jobs:       ";
    for (Size j = 0; j < jobs_functions.size(); ++j) {
        os << config_io::to_string(jobs_functions[j]) << " (" << jobs_weights[j] << ") ";
    }
    os << "\n";
    if (!jreg_functions.empty()) {
        os << "  Jreg:       ";
        for (Size j = 0; j < jreg_functions.size(); ++j) {
            os << config_io::to_string(jreg_functions[j]) << " (" << jreg_weights[j] << ") ";
        }
        os << "\n  wjreg:      " << wjreg << "\n";
    }
    os << "  Start step: " << optimize_start_step << "\n";
    os << "  Mapping:    " << config_io::to_string(mapping) << "\n";
    os << "  Optimized:  " << optim_parameters.size() << " parameters, "
       << optim_states.size() << " states\n";
}

// ============================================================================
// Config
// ============================================================================

Config Config::from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath.string());
    }
    return parse(file);
}

Config Config::from_string(const std::string& text) {
    std::istringstream in(text);
    return parse(in);
}

Config Config::parse(std::istream& in) {
    Config config;

    // Simple key-value parser (no YAML library dependency)
    std::string line;
    std::string current_section;

    while (std::getline(in, line)) {
        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        line = trim(line);
        if (line.empty()) continue;

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Section headers have no value
        if (value.empty()) {
            current_section = key;
            continue;
        }

        if (current_section == "model") {
            if (key == "structure")
                config.model.structure = config_io::structure_from_string(value);
            else if (key == "dt")
                config.model.dt = std::stod(value);
            else if (key == "ntime_step")
                config.model.ntime_step = std::stoll(value);
            else if (key == "storage")
                config.model.storage = grid_io::storage_layout_from_string(value);
            else if (key == "verbose")
                config.model.verbose = config_io::bool_from_string(value);
        } else if (current_section == "output") {
            if (key == "save_qsim_domain")
                config.output.save_qsim_domain = config_io::bool_from_string(value);
            else if (key == "save_net_prcp_domain")
                config.output.save_net_prcp_domain = config_io::bool_from_string(value);
        } else if (current_section == "cost") {
            if (key == "jobs_functions")
                config.cost.jobs_functions = parse_list<JobsFunction>(value, config_io::jobs_function_from_string);
            else if (key == "jobs_weights")
                config.cost.jobs_weights = parse_list<Real>(value, to_real);
            else if (key == "jreg_functions")
                config.cost.jreg_functions = parse_list<JregFunction>(value, config_io::jreg_function_from_string);
            else if (key == "jreg_weights")
                config.cost.jreg_weights = parse_list<Real>(value, to_real);
            else if (key == "wjreg")
                config.cost.wjreg = std::stod(value);
            else if (key == "optimize_start_step")
                config.cost.optimize_start_step = std::stoll(value);
            else if (key == "gauge_weights")
                config.cost.gauge_weights = parse_list<Real>(value, to_real);
            else if (key == "denormalize_forward")
                config.cost.denormalize_forward = config_io::bool_from_string(value);
            else if (key == "mapping")
                config.cost.mapping = config_io::mapping_from_string(value);
            else if (key == "optim_parameters")
                config.cost.optim_parameters = parse_list<ParameterName>(value, parameter_from_string);
            else if (key == "optim_states")
                config.cost.optim_states = parse_list<StateName>(value, state_from_string);
        } else if (current_section == "reg_descriptors") {
            auto indices = parse_list<Index>(value, to_index);
            bool is_parameter = std::any_of(all_parameters().begin(), all_parameters().end(),
                [&](ParameterName p) { return dsmash::to_string(p) == key; });
            if (is_parameter)
                config.cost.reg_descriptors_parameters[parameter_from_string(key)] = indices;
            else
                config.cost.reg_descriptors_states[state_from_string(key)] = indices;
        } else if (current_section == "bounds") {
            auto values = parse_list<Real>(value, to_real);
            if (values.size() != 2) {
                throw std::invalid_argument("Bounds for " + key + " need two values");
            }
            bool is_parameter = std::any_of(all_parameters().begin(), all_parameters().end(),
                [&](ParameterName p) { return dsmash::to_string(p) == key; });
            if (is_parameter)
                config.bounds[parameter_from_string(key)] = {values[0], values[1]};
            else
                config.bounds[state_from_string(key)] = {values[0], values[1]};
        } else if (current_section == "parallel") {
            if (key == "wavefront")
                config.parallel.wavefront = config_io::bool_from_string(value);
            else if (key == "num_threads")
                config.parallel.num_threads = std::stoi(value);
        }
    }

    return config;
}

void Config::to_file(const std::filesystem::path& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + filepath.string());
    }
    write(file);
}

std::string Config::to_string() const {
    std::ostringstream os;
    write(os);
    return os.str();
}

void Config::write(std::ostream& os) const {
    const Bounds defaults = Bounds::defaults();
    os << std::setprecision(12);

    os << "# dSMASH Configuration File\n\n";

    os << "model:\n";
    os << "  structure: " << config_io::to_string(model.structure) << "\n";
    os << "  dt: " << model.dt << "\n";
    os << "  ntime_step: " << model.ntime_step << "\n";
    os << "  storage: " << grid_io::to_string(model.storage) << "\n";
    os << "  verbose: " << (model.verbose ? "true" : "false") << "\n\n";

    os << "output:\n";
    os << "  save_qsim_domain: " << (output.save_qsim_domain ? "true" : "false") << "\n";
    os << "  save_net_prcp_domain: " << (output.save_net_prcp_domain ? "true" : "false") << "\n\n";

    auto real_str = [](Real v) { std::ostringstream s; s << std::setprecision(12) << v; return s.str(); };

    os << "cost:\n";
    write_list(os, "jobs_functions", cost.jobs_functions,
               [](JobsFunction f) { return config_io::to_string(f); });
    write_list(os, "jobs_weights", cost.jobs_weights, real_str);
    write_list(os, "jreg_functions", cost.jreg_functions,
               [](JregFunction f) { return config_io::to_string(f); });
    write_list(os, "jreg_weights", cost.jreg_weights, real_str);
    os << "  wjreg: " << cost.wjreg << "\n";
    os << "  optimize_start_step: " << cost.optimize_start_step << "\n";
    write_list(os, "gauge_weights", cost.gauge_weights, real_str);
    os << "  denormalize_forward: " << (cost.denormalize_forward ? "true" : "false") << "\n";
    os << "  mapping: " << config_io::to_string(cost.mapping) << "\n";
    write_list(os, "optim_parameters", cost.optim_parameters,
               [](ParameterName p) { return dsmash::to_string(p); });
    write_list(os, "optim_states", cost.optim_states,
               [](StateName s) { return dsmash::to_string(s); });
    os << "\n";

    if (!cost.reg_descriptors_parameters.empty() || !cost.reg_descriptors_states.empty()) {
        os << "reg_descriptors:\n";
        auto idx_str = [](Index i) { return std::to_string(i); };
        for (const auto& [name, indices] : cost.reg_descriptors_parameters)
            write_list(os, dsmash::to_string(name), indices, idx_str);
        for (const auto& [name, indices] : cost.reg_descriptors_states)
            write_list(os, dsmash::to_string(name), indices, idx_str);
        os << "\n";
    }

    // Only bounds that differ from the defaults
    std::ostringstream bounds_block;
    bounds_block << std::setprecision(12);
    for (auto name : all_parameters()) {
        const Bound& bd = bounds[name];
        const Bound& def = defaults[name];
        if (bd.lower != def.lower || bd.upper != def.upper)
            bounds_block << "  " << dsmash::to_string(name) << ": " << bd.lower << ", " << bd.upper << "\n";
    }
    for (auto name : all_states()) {
        const Bound& bd = bounds[name];
        const Bound& def = defaults[name];
        if (bd.lower != def.lower || bd.upper != def.upper)
            bounds_block << "  " << dsmash::to_string(name) << ": " << bd.lower << ", " << bd.upper << "\n";
    }
    if (!bounds_block.str().empty()) {
        os << "bounds:\n" << bounds_block.str() << "\n";
    }

    os << "parallel:\n";
    os << "  wavefront: " << (parallel.wavefront ? "true" : "false") << "\n";
    os << "  num_threads: " << parallel.num_threads << "\n";
}

void Config::validate() const {
    if (model.dt <= 0.0) {
        throw std::invalid_argument("dt must be positive");
    }
    if (model.ntime_step < 0) {
        throw std::invalid_argument("ntime_step must be >= 0");
    }
    if (cost.jobs_functions.size() != cost.jobs_weights.size()) {
        throw std::invalid_argument("jobs_functions and jobs_weights differ in length");
    }
    if (cost.jreg_functions.size() != cost.jreg_weights.size()) {
        throw std::invalid_argument("jreg_functions and jreg_weights differ in length");
    }
    if (cost.optimize_start_step < 0) {
        throw std::invalid_argument("optimize_start_step must be >= 0");
    }
    for (auto name : all_parameters()) {
        if (bounds[name].lower >= bounds[name].upper) {
            throw std::invalid_argument("Empty bounds for parameter " + dsmash::to_string(name));
        }
    }
    for (auto name : all_states()) {
        if (bounds[name].lower >= bounds[name].upper) {
            throw std::invalid_argument("Empty bounds for state " + dsmash::to_string(name));
        }
    }
}

void Config::print_summary(std::ostream& os) const {
    os << "=== dSMASH Configuration ===\n";
    model.print(os);
    cost.print(os);
    os << "Output:\n";
    os << "  qsim_domain:     " << (output.save_qsim_domain ? "yes" : "no") << "\n";
    os << "  net_prcp_domain: " << (output.save_net_prcp_domain ? "yes" : "no") << "\n";
    os << "Parallel:\n";
    os << "  Wavefront: " << (parallel.wavefront ? "yes" : "no") << "\n";
    os << "============================\n";
}

// ============================================================================
// config_io helpers
// ============================================================================

namespace config_io {

std::string to_string(StructureType st) {
    switch (st) {
        case StructureType::GrA: return "gr_a";
        case StructureType::GrB: return "gr_b";
        case StructureType::GrC: return "gr_c";
        case StructureType::GrD: return "gr_d";
        case StructureType::VicA: return "vic_a";
        default: return "unknown";
    }
}

std::string to_string(JobsFunction jf) {
    switch (jf) {
        case JobsFunction::NSE: return "nse";
        case JobsFunction::KGE: return "kge";
        case JobsFunction::KGE2: return "kge2";
        case JobsFunction::SE: return "se";
        case JobsFunction::RMSE: return "rmse";
        case JobsFunction::Logarithmic: return "logarithmic";
        case JobsFunction::Crc: return "Crc";
        case JobsFunction::Cfp2: return "Cfp2";
        case JobsFunction::Cfp10: return "Cfp10";
        case JobsFunction::Cfp50: return "Cfp50";
        case JobsFunction::Cfp90: return "Cfp90";
        case JobsFunction::Epf: return "Epf";
        case JobsFunction::Elt: return "Elt";
        case JobsFunction::Erc: return "Erc";
        default: return "unknown";
    }
}

std::string to_string(JregFunction jr) {
    switch (jr) {
        case JregFunction::Prior: return "prior";
        case JregFunction::Smoothing: return "smoothing";
        case JregFunction::HardSmoothing: return "hard_smoothing";
        case JregFunction::DistanceCorrelation: return "distance_correlation";
        default: return "unknown";
    }
}

std::string to_string(MappingType mt) {
    switch (mt) {
        case MappingType::Uniform: return "uniform";
        case MappingType::Distributed: return "distributed";
        case MappingType::HyperLinear: return "hyper-linear";
        case MappingType::HyperPolynomial: return "hyper-polynomial";
        default: return "unknown";
    }
}

// String to enum converters

StructureType structure_from_string(const std::string& s) {
    if (s == "gr_a") return StructureType::GrA;
    if (s == "gr_b") return StructureType::GrB;
    if (s == "gr_c") return StructureType::GrC;
    if (s == "gr_d") return StructureType::GrD;
    if (s == "vic_a") return StructureType::VicA;
    throw std::invalid_argument("Unknown structure: " + s);
}

JobsFunction jobs_function_from_string(const std::string& s) {
    if (s == "nse") return JobsFunction::NSE;
    if (s == "kge") return JobsFunction::KGE;
    if (s == "kge2") return JobsFunction::KGE2;
    if (s == "se") return JobsFunction::SE;
    if (s == "rmse") return JobsFunction::RMSE;
    if (s == "logarithmic") return JobsFunction::Logarithmic;
    if (s == "Crc") return JobsFunction::Crc;
    if (s == "Cfp2") return JobsFunction::Cfp2;
    if (s == "Cfp10") return JobsFunction::Cfp10;
    if (s == "Cfp50") return JobsFunction::Cfp50;
    if (s == "Cfp90") return JobsFunction::Cfp90;
    if (s == "Epf") return JobsFunction::Epf;
    if (s == "Elt") return JobsFunction::Elt;
    if (s == "Erc") return JobsFunction::Erc;
    throw std::invalid_argument("Unknown jobs function: " + s);
}

JregFunction jreg_function_from_string(const std::string& s) {
    if (s == "prior") return JregFunction::Prior;
    if (s == "smoothing") return JregFunction::Smoothing;
    if (s == "hard_smoothing") return JregFunction::HardSmoothing;
    if (s == "distance_correlation") return JregFunction::DistanceCorrelation;
    throw std::invalid_argument("Unknown jreg function: " + s);
}

MappingType mapping_from_string(const std::string& s) {
    if (s == "uniform") return MappingType::Uniform;
    if (s == "distributed") return MappingType::Distributed;
    if (s == "hyper-linear") return MappingType::HyperLinear;
    if (s == "hyper-polynomial") return MappingType::HyperPolynomial;
    throw std::invalid_argument("Unknown mapping: " + s);
}

bool bool_from_string(const std::string& s) {
    if (s == "true" || s == "yes" || s == "1") return true;
    if (s == "false" || s == "no" || s == "0") return false;
    throw std::invalid_argument("Not a boolean: " + s);
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> items;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

} // namespace config_io

} // namespace dsmash
