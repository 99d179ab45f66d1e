#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace asian_pricer {

struct ModelParameters;
struct SchemeCoefficients;

using ExpressionVariables = std::map<std::string, double>;

// Names a bound formula may refer to
const std::vector<std::string>& boundVariableNames();

// x_min, x_max, T, sigma, r, M, N, h, k, tau_max for one solver run
ExpressionVariables boundVariables(const ModelParameters& params, const SchemeCoefficients& coefficients);

// Arithmetic formula over a fixed set of named inputs, used for interval bounds in the
// configuration. Supports + - * / ^, unary sign, parentheses, exp log sqrt abs min max,
// and the constants pi and e. Compiled once, evaluated many times.
class BoundExpression {
public:
    struct Node;

    BoundExpression() = default;

    // Throws ExpressionError on malformed input or unknown names
    static BoundExpression parse(const std::string& text);

    // Throws ExpressionError if a variable is not supplied or the result is not finite
    double evaluate(const ExpressionVariables& variables) const;

    const std::string& text() const { return text_; }

private:
    std::string text_;
    std::shared_ptr<const Node> root_;
};

} // namespace asian_pricer
