/**
 * @file config.hpp
 * @brief Configuration and decisions for dSMASH
 * 
 * Defines the runtime configuration including:
 * - Model structure, time stepping and storage layout
 * - Optional domain outputs
 * - Cost function (fit metrics, regularization, gauges, mapping)
 * - Calibration bounds
 * - Parallel execution
 */

#pragma once

#include "types.hpp"
#include "parameters.hpp"
#include <filesystem>
#include <istream>
#include <map>
#include <ostream>

namespace dsmash {

/**
 * @brief Model decisions
 */
struct ModelConfig {
    StructureType structure = StructureType::GrA;
    Real dt = 3600.0;               ///< [s] Time step length
    Index ntime_step = 0;           ///< Number of time steps
    StorageLayout storage = StorageLayout::Dense;
    bool verbose = false;

    void print(std::ostream& os) const;
};

/**
 * @brief Optional domain-wide outputs
 */
struct OutputConfig {
    bool save_qsim_domain = false;
    bool save_net_prcp_domain = false;
};

/**
 * @brief Cost function configuration
 */
struct CostConfig {
    // Fit to observations, combined by weighted sum per gauge
    std::vector<JobsFunction> jobs_functions = {JobsFunction::NSE};
    std::vector<Real> jobs_weights = {1.0};

    // Regularization terms
    std::vector<JregFunction> jreg_functions;
    std::vector<Real> jreg_weights;
    Real wjreg = 0.0;               ///< cost = jobs + wjreg * jreg

    Index optimize_start_step = 0;  ///< First step entering the cost (0-based)

    /// Per-gauge weight: > 0 additive, < 0 median pool, 0 disabled.
    /// Empty means weight 1 on the first gauge only.
    std::vector<Real> gauge_weights;

    bool denormalize_forward = false;
    MappingType mapping = MappingType::Uniform;

    // Fields being optimized
    std::vector<ParameterName> optim_parameters;
    std::vector<StateName> optim_states;

    // Descriptors used by distance correlation, per optimized field
    std::map<ParameterName, std::vector<Index>> reg_descriptors_parameters;
    std::map<StateName, std::vector<Index>> reg_descriptors_states;

    /// Effective weight of gauge g
    Real gauge_weight(Index g) const;

    bool is_optimized(ParameterName name) const;
    bool is_optimized(StateName name) const;

    void print(std::ostream& os) const;
};

/**
 * @brief Parallel execution configuration
 */
struct ParallelConfig {
    bool wavefront = false;         ///< Run same-rank cells concurrently
    int num_threads = 0;            ///< 0 = runtime default
};

/**
 * @brief Complete configuration
 */
class Config {
public:
    Config() = default;

    // Load from sectioned key/value file
    static Config from_file(const std::filesystem::path& filepath);

    // Parse from text in the file format
    static Config from_string(const std::string& text);

    // Save to file
    void to_file(const std::filesystem::path& filepath) const;

    // Serialize in the file format
    std::string to_string() const;

    /**
     * @brief Validate configuration
     * @throws std::invalid_argument on inconsistent values
     */
    void validate() const;

    // Sub-configurations
    ModelConfig model;
    OutputConfig output;
    CostConfig cost;
    ParallelConfig parallel;
    Bounds bounds = Bounds::defaults();

    // Print summary
    void print_summary(std::ostream& os) const;

private:
    static Config parse(std::istream& in);
    void write(std::ostream& os) const;
};

// ============================================================================
// Parser Helpers
// ============================================================================

namespace config_io {
    // Enum to string
    std::string to_string(StructureType st);
    std::string to_string(JobsFunction jf);
    std::string to_string(JregFunction jr);
    std::string to_string(MappingType mt);

    // String to enum
    StructureType structure_from_string(const std::string& s);
    JobsFunction jobs_function_from_string(const std::string& s);
    JregFunction jreg_function_from_string(const std::string& s);
    MappingType mapping_from_string(const std::string& s);

    // Value parsing
    bool bool_from_string(const std::string& s);
    std::vector<std::string> split_list(const std::string& s);
}

} // namespace dsmash
