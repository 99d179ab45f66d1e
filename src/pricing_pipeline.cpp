#include "pricing_pipeline.hpp"
#include "errors.hpp"
#include "table_writer.hpp"
#include <exception>
#include <utility>

namespace asian_pricer {

std::string PipelineTask::label() const {
    return toString(scheme) + "_" + toString(equation) + " " + toString(option);
}

PricingPipeline::PricingPipeline(PipelineConfig config, std::shared_ptr<Logger> logger)
    : config_(std::move(config)), logger_(orNullLogger(std::move(logger))) {}

std::vector<PipelineTask> PricingPipeline::tasks() const {
    std::vector<PipelineTask> result;
    for (const EquationConfig& eq : config_.equations) {
        if (eq.runExplicit) {
            result.push_back({eq.equation, Scheme::Explicit, OptionKind::Call});
            result.push_back({eq.equation, Scheme::Explicit, OptionKind::Put});
        }
        if (eq.runCrankNicolson) {
            result.push_back({eq.equation, Scheme::CrankNicolson, OptionKind::Call});
            result.push_back({eq.equation, Scheme::CrankNicolson, OptionKind::Put});
        }
    }
    return result;
}

const EquationConfig& PricingPipeline::equationConfig(EquationKind equation) const {
    for (const EquationConfig& eq : config_.equations) {
        if (eq.equation == equation) {
            return eq;
        }
    }
    throw ConfigurationMissing(toString(equation));
}

RunResult PricingPipeline::solveTask(const EquationConfig& config, const PipelineTask& task) const {
    RunResult result;

    PDESolver solver(config.params, task.equation, task.option, logger_);
    result.solution = solver.solve(task.scheme);
    const Solution& solution = result.solution;

    // Bounds see the mesh that was actually used
    ModelParameters effective = config.params;
    effective.M = solution.x.size();
    effective.N = solution.tau.size() - 1;
    const ExpressionVariables variables = boundVariables(effective, solution.coefficients);

    const IntervalBounds& bounds = config.boundsFor(boundsKey(task.scheme, task.option));
    result.bounded = boundedInterval(solution.x, solution.values,
                                     bounds.lower.evaluate(variables), bounds.upper.evaluate(variables));

    const IntervalBounds& changed = config.boundsFor(changedBoundsKey(task.scheme, task.option));
    result.changedBounded = boundedInterval(solution.x, solution.values,
                                            changed.lower.evaluate(variables), changed.upper.evaluate(variables));

    result.time = undoTimeChange(config.params.T, solution.tau, config.params.sigma);
    result.assetRatio = (task.equation == EquationKind::H)
        ? assetRatioH(config.params.T, result.changedBounded.coordinates)
        : assetRatioW(config.params.T, result.changedBounded.coordinates);
    return result;
}

void PricingPipeline::exportResult(const EquationConfig& config, const PipelineTask& task,
                                   const RunResult& result) const {
    const std::string directory = config_.outputDirectory + "/" + toString(task.scheme) + "_" +
                                  toString(task.equation) + "/";
    const std::string name = toString(task.equation);
    const std::string option = toString(task.option);

    const TableLabels xTau{"x", "tau", name + "(x, tau)"};
    if (config.exportUnbounded && task.scheme == Scheme::Explicit) {
        writeTable(directory + option + ".csv", result.solution.x, result.solution.tau,
                   result.solution.values, xTau);
    }
    writeTable(directory + option + "_bounded.csv", result.bounded.coordinates, result.solution.tau,
               result.bounded.values, xTau);
    writeTable(directory + option + "_R.csv", result.assetRatio, result.time,
               result.changedBounded.values, TableLabels{"R", "t", name + "(R, t)"});

    logger_->info("Tables for " + task.label() + " written to " + directory);
}

RunOutcome PricingPipeline::runTask(const PipelineTask& task) const {
    RunOutcome outcome;
    outcome.task = task;

    logger_->info("Solving " + task.label());
    try {
        const EquationConfig& config = equationConfig(task.equation);
        outcome.result = solveTask(config, task);
        if (!config_.outputDirectory.empty()) {
            exportResult(config, task, outcome.result);
        }
        outcome.succeeded = true;
        logger_->info("Finished " + task.label());
    } catch (const std::exception& e) {
        outcome.error = e.what();
        logger_->error("Error solving " + task.label() + ": " + outcome.error);
    }
    return outcome;
}

std::vector<RunOutcome> PricingPipeline::run() const {
    const std::vector<PipelineTask> all = tasks();
    std::vector<RunOutcome> outcomes(all.size());

    #pragma omp parallel for schedule(dynamic)
    for (size_t i = 0; i < all.size(); ++i) {
        outcomes[i] = runTask(all[i]);
    }
    return outcomes;
}

} // namespace asian_pricer
