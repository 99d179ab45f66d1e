#include "post_processing.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace asian_pricer {

using std::vector;

BoundedSolution boundedInterval(const vector<double>& coordinates, const SolutionMatrix& values,
                                double minVal, double maxVal) {
    if (coordinates.size() != values.rows()) {
        throw InvalidParameters("Coordinate array does not match the solution rows");
    }

    const auto first = std::lower_bound(coordinates.begin(), coordinates.end(), minVal);
    const auto last = std::max(first, std::lower_bound(coordinates.begin(), coordinates.end(), maxVal));
    const size_t begin = static_cast<size_t>(first - coordinates.begin());
    const size_t end = static_cast<size_t>(last - coordinates.begin());

    BoundedSolution bounded;
    bounded.coordinates.assign(first, last);
    bounded.values = values.rowSlice(begin, end);
    return bounded;
}

double undoTimeChange(double T, double tau, double sigma) {
    return T - 2.0 * tau / (sigma * sigma);
}

vector<double> undoTimeChange(double T, const vector<double>& tau, double sigma) {
    vector<double> t(tau.size());
    std::transform(tau.begin(), tau.end(), t.begin(),
                   [T, sigma](double value) { return undoTimeChange(T, value, sigma); });
    return t;
}

double timeToTau(double T, double t, double sigma) {
    return 0.5 * sigma * sigma * (T - t);
}

vector<double> assetRatioH(double T, const vector<double>& x) {
    vector<double> R(x.size());
    std::transform(x.begin(), x.end(), R.begin(), [T](double value) { return std::exp(value) * T; });
    return R;
}

vector<double> assetRatioW(double T, const vector<double>& x) {
    vector<double> R(x.size());
    std::transform(x.begin(), x.end(), R.begin(), [T](double value) { return std::exp(value) / T; });
    return R;
}

} // namespace asian_pricer
