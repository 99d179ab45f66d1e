#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "pde_solver.hpp"
#include "post_processing.hpp"
#include <memory>
#include <string>
#include <vector>

namespace asian_pricer {

struct PipelineTask {
    EquationKind equation;
    Scheme scheme;
    OptionKind option;

    // e.g. "explicit_H call"
    std::string label() const;
};

struct RunResult {
    Solution solution;
    BoundedSolution bounded;         // x restricted to the "{scheme}_{option}" bounds
    BoundedSolution changedBounded;  // x restricted to the "canvi_{scheme}_{option}" bounds
    std::vector<double> assetRatio;  // R for the rows of changedBounded
    std::vector<double> time;        // t for every tau
};

struct RunOutcome {
    PipelineTask task;
    bool succeeded = false;
    std::string error;
    RunResult result;
};

// Runs every enabled (equation, scheme, option) combination. Combinations share no state and
// run concurrently; a failing one is logged and reported without affecting the others.
class PricingPipeline {
public:
    explicit PricingPipeline(PipelineConfig config, std::shared_ptr<Logger> logger = nullptr);

    std::vector<PipelineTask> tasks() const;

    RunOutcome runTask(const PipelineTask& task) const;

    std::vector<RunOutcome> run() const;

private:
    PipelineConfig config_;
    std::shared_ptr<Logger> logger_;

    const EquationConfig& equationConfig(EquationKind equation) const;
    RunResult solveTask(const EquationConfig& config, const PipelineTask& task) const;
    void exportResult(const EquationConfig& config, const PipelineTask& task, const RunResult& result) const;
};

} // namespace asian_pricer
