#pragma once

#include "option.hpp"
#include "bound_expression.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace asian_pricer {

struct IntervalBounds {
    BoundExpression lower;
    BoundExpression upper;
};

// "{scheme}_{option}", e.g. "explicit_call": bounds x for the (x, tau) output
std::string boundsKey(Scheme scheme, OptionKind option);

// "canvi_{scheme}_{option}": bounds x before mapping back to (R, t)
std::string changedBoundsKey(Scheme scheme, OptionKind option);

struct EquationConfig {
    EquationKind equation = EquationKind::H;
    ModelParameters params;
    bool runExplicit = true;
    bool runCrankNicolson = true;
    bool exportUnbounded = false;
    std::map<std::string, IntervalBounds> bounds;

    // Throws ConfigurationMissing if no bounds were configured under key
    const IntervalBounds& boundsFor(const std::string& key) const;
};

struct PipelineConfig {
    std::vector<EquationConfig> equations;
    std::string outputDirectory;  // Empty disables CSV export
};

// Reads the section of one equation ("H" or "W")
EquationConfig parseEquationConfig(EquationKind equation, const nlohmann::json& section);

PipelineConfig parseConfiguration(const nlohmann::json& document);

PipelineConfig loadConfiguration(const std::string& path);

} // namespace asian_pricer
