/**
 * @file dsmash.hpp
 * @brief Main dSMASH model class
 * 
 * This is the primary interface for the distributed hydrological model.
 * It orchestrates grid, inputs, structures and the cost engine, and
 * provides a clean API for:
 * - Forward simulation of gauge discharge
 * - Cost evaluation (fit to observations + regularization)
 * - Control vectors and gradients for calibration drivers
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/grid.hpp"
#include "core/config.hpp"
#include "core/input_data.hpp"
#include "core/parameters.hpp"
#include "core/states.hpp"
#include "core/output.hpp"

// Physics includes
#include "physics/operators.hpp"
#include "physics/routing.hpp"
#include "physics/structure.hpp"
#include "physics/forward.hpp"

// Cost includes
#include "cost/metrics.hpp"
#include "cost/signatures.hpp"
#include "cost/regularization.hpp"
#include "cost/cost.hpp"

// Calibration includes
#include "calibration/mapping.hpp"
#include "calibration/control.hpp"
#include "calibration/gradient_check.hpp"

namespace dsmash {

/**
 * @brief Result of a pure evaluation
 */
struct Evaluation {
    Output output;
    States final_states;
    Real cost = 0.0;
};

/**
 * @brief Distributed hydrological model
 * 
 * Example usage:
 * @code
 * Model model;
 * model.set_grid(grid);
 * model.set_config(Config::from_file("basin.cfg"));
 * model.set_input_data(input);
 * model.initialize();
 * 
 * // Simulate and score
 * Real j = model.compute_cost();
 * 
 * // Calibration interface
 * Vector x = model.control_vector();
 * Vector g = model.compute_gradient(x);
 * @endcode
 */
class Model {
public:
    Model();
    ~Model();

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    Model(Model&&) noexcept;
    Model& operator=(Model&&) noexcept;

    // ========================================================================
    // Factory Methods
    // ========================================================================

    /**
     * @brief Create model from configuration file
     * 
     * Grid and inputs are supplied afterwards by the caller.
     */
    static Model from_config(const std::string& config_file);

    static Model from_config(const Config& config);

    // ========================================================================
    // Setup Methods
    // ========================================================================

    void set_grid(Ptr<Grid> grid);
    void set_config(const Config& config);
    void set_input_data(Ptr<InputData> input);

    /**
     * @brief Set parameters (defaults are used when never set)
     */
    void set_parameters(const Parameters& params);

    /**
     * @brief Set the initial condition of every run
     */
    void set_states(const States& states);

    /**
     * @brief Set reference fields for regularization
     * 
     * Defaults to the parameters and states at initialize().
     */
    void set_background(const Background& background);

    void set_output_callback(OutputCallback callback);

    /**
     * @brief Validate shapes and allocate defaults (call after setup)
     * @throws std::runtime_error if grid or inputs are missing
     * @throws std::invalid_argument on shape mismatch
     */
    void initialize();

    bool is_initialized() const { return initialized_; }

    // ========================================================================
    // Simulation
    // ========================================================================

    /**
     * @brief Run the whole period from the initial states
     * 
     * Results are available through output() and final_states().
     */
    RunResult run();

    /**
     * @brief Run, then evaluate the cost into output()
     */
    Real compute_cost();

    /**
     * @brief Pure evaluation (parameters, initial states) -> (output, cost)
     * 
     * The model itself is not modified.
     */
    Evaluation evaluate(const Parameters& params, const States& states) const;

    // ========================================================================
    // Calibration
    // ========================================================================

    /// Control vector layout for the configured mapping
    Control control() const;

    /// Control vector of the current parameters and initial states
    Vector control_vector() const;

    /// Cost of the fields described by control vector x
    Real cost_of(const Vector& x) const;

    /// x -> cost_of(x)
    CostFunc cost_function() const;

    /// Central finite-difference gradient of cost_of at x
    Vector compute_gradient(const Vector& x, Real epsilon = 1e-6) const;

    /**
     * @brief Gradient test of a gradient provider at x
     * 
     * @param grad Gradient to validate (e.g. from an adjoint)
     */
    GradientTestResult check_gradient(const Vector& x, const Vector& grad,
                                      const Vector& direction, Index n_steps = 16) const;

    /// Write the fields described by x into the model
    void apply_control(const Vector& x);

    // ========================================================================
    // Access
    // ========================================================================

    const Grid& grid() const { return *grid_; }
    const Config& config() const { return config_; }
    const InputData& input_data() const { return *input_; }

    const Parameters& parameters() const { return params_; }
    Parameters& parameters() { return params_; }

    const States& initial_states() const { return initial_states_; }
    States& initial_states() { return initial_states_; }

    const States& final_states() const { return states_; }
    const Output& output() const { return output_; }
    const Background& background() const { return background_; }

    void print_summary(std::ostream& os) const;

private:
    Ptr<Grid> grid_;
    Ptr<InputData> input_;
    Config config_;

    Parameters params_;
    States initial_states_;
    States states_;
    Background background_;
    Output output_;

    OutputCallback callback_;

    bool initialized_ = false;
    bool background_set_ = false;

    void require_initialized() const;
};

} // namespace dsmash
