#pragma once

#include "mesh.hpp"
#include <vector>

namespace asian_pricer {

struct BoundedSolution {
    std::vector<double> coordinates;
    SolutionMatrix values;
};

// Keeps the rows whose coordinate lies in [minVal, maxVal). coordinates must be increasing;
// the bounding indices are found by binary search.
BoundedSolution boundedInterval(const std::vector<double>& coordinates, const SolutionMatrix& values,
                                double minVal, double maxVal);

// t = T - 2 tau / sigma^2
double undoTimeChange(double T, double tau, double sigma);
std::vector<double> undoTimeChange(double T, const std::vector<double>& tau, double sigma);

// tau = sigma^2 (T - t) / 2
double timeToTau(double T, double t, double sigma);

// R = e^x T for equation H
std::vector<double> assetRatioH(double T, const std::vector<double>& x);

// R = e^x / T for equation W
std::vector<double> assetRatioW(double T, const std::vector<double>& x);

} // namespace asian_pricer
