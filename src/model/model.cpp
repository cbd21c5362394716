/**
 * @file model.cpp
 * @brief Model orchestration and calibration interface
 */

#include "dsmash/dsmash.hpp"
#include <iostream>
#include <stdexcept>

namespace dsmash {

Model::Model() = default;
Model::~Model() = default;
Model::Model(Model&&) noexcept = default;
Model& Model::operator=(Model&&) noexcept = default;

// ============================================================================
// Factory Methods
// ============================================================================

Model Model::from_config(const std::string& config_file) {
    return from_config(Config::from_file(config_file));
}

Model Model::from_config(const Config& config) {
    Model model;
    model.set_config(config);
    return model;
}

// ============================================================================
// Setup
// ============================================================================

void Model::set_grid(Ptr<Grid> grid) {
    grid_ = std::move(grid);
    initialized_ = false;
}

void Model::set_config(const Config& config) {
    config_ = config;
    initialized_ = false;
}

void Model::set_input_data(Ptr<InputData> input) {
    input_ = std::move(input);
    initialized_ = false;
}

void Model::set_parameters(const Parameters& params) {
    params_ = params;
    initialized_ = false;
}

void Model::set_states(const States& states) {
    initial_states_ = states;
    initialized_ = false;
}

void Model::set_background(const Background& background) {
    background_ = background;
    background_set_ = true;
    initialized_ = false;
}

void Model::set_output_callback(OutputCallback callback) {
    callback_ = std::move(callback);
}

void Model::initialize() {
    if (!grid_) {
        throw std::runtime_error("Model has no grid");
    }
    if (!input_) {
        throw std::runtime_error("Model has no input data");
    }

    config_.validate();

    if (!grid_->is_finalized() || grid_->layout() != config_.model.storage) {
        grid_->finalize(config_.model.storage);
    }

    const Index n = grid_->n_storage();

    if (params_.size() == 0) params_.initialize(n);
    params_.validate(n);

    if (initial_states_.size() == 0) initial_states_.initialize(n);
    initial_states_.validate(n);

    input_->validate(*grid_, config_.model.ntime_step);

    if (!background_set_) {
        background_.parameters = params_;
        background_.states = initial_states_;
    }
    background_.parameters.validate(n);
    background_.states.validate(n);

    states_ = initial_states_;
    initialized_ = true;

    if (config_.model.verbose) {
        std::cerr << "dSMASH initialized: " << config_io::to_string(config_.model.structure)
                  << ", " << grid_->nrow() << " x " << grid_->ncol() << " grid ("
                  << grid_io::to_string(grid_->layout()) << "), "
                  << grid_->n_active() << " active cells, "
                  << grid_->wavefronts().size() << " wavefronts, "
                  << config_.model.ntime_step << " steps\n";
    }
}

void Model::require_initialized() const {
    if (!initialized_) {
        throw std::runtime_error("Model not initialized");
    }
}

// ============================================================================
// Simulation
// ============================================================================

RunResult Model::run() {
    require_initialized();

    // Every run starts from the stored initial condition
    states_ = initial_states_;

    Forward forward(*grid_, config_, *input_);
    RunResult result = forward.run(params_, states_, output_, callback_);

    if (config_.model.verbose) {
        std::cerr << "  run: " << result.steps << " steps in "
                  << result.run_time_ms << " ms\n";
    }
    return result;
}

Real Model::compute_cost() {
    run();
    return dsmash::compute_cost(*grid_, config_, *input_, params_, initial_states_,
                                background_, output_);
}

Evaluation Model::evaluate(const Parameters& params, const States& states) const {
    require_initialized();

    Evaluation eval;
    Parameters p = params;
    States initial = states;
    eval.final_states = states;

    Forward forward(*grid_, config_, *input_);
    forward.run(p, eval.final_states, eval.output);

    eval.cost = dsmash::compute_cost(*grid_, config_, *input_, p, initial, background_,
                                     eval.output);
    return eval;
}

// ============================================================================
// Calibration
// ============================================================================

Control Model::control() const {
    require_initialized();
    return Control(*grid_, config_, *input_);
}

Vector Model::control_vector() const {
    return control().pack(params_, initial_states_);
}

Real Model::cost_of(const Vector& x) const {
    Parameters p = params_;
    States s = initial_states_;
    control().unpack(x, p, s);
    return evaluate(p, s).cost;
}

CostFunc Model::cost_function() const {
    return [this](const Vector& x) { return cost_of(x); };
}

Vector Model::compute_gradient(const Vector& x, Real epsilon) const {
    return finite_difference_gradient(cost_function(), x, epsilon);
}

GradientTestResult Model::check_gradient(const Vector& x, const Vector& grad,
                                         const Vector& direction, Index n_steps) const {
    GradientTestResult result = gradient_test(cost_function(), x, grad, direction, n_steps);

    if (config_.model.verbose) {
        std::cerr << "Gradient test:\n";
        for (Size n = 0; n < result.ia.size(); ++n) {
            std::cerr << "  a = 2^-" << n << "  |ia - 1| = " << result.ia[n] << "\n";
        }
    }
    return result;
}

void Model::apply_control(const Vector& x) {
    control().unpack(x, params_, initial_states_);
}

void Model::print_summary(std::ostream& os) const {
    os << "=== dSMASH Model ===\n";
    if (grid_) grid_->print_summary(os);
    config_.print_summary(os);
    if (output_.qsim.size() > 0) {
        os << "Last evaluation:\n";
        os << "  cost: " << output_.cost << " (jobs " << output_.cost_jobs
           << ", jreg " << output_.cost_jreg << ")\n";
    }
}

} // namespace dsmash
