#pragma once

#include "mesh.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace asian_pricer {

struct TableLabels {
    std::string space = "x";
    std::string time = "tau";
    std::string value = "H(x, tau)";
};

// Long format, one row per (space, time) pair with time as the outer loop
void writeTable(std::ostream& out, const std::vector<double>& space, const std::vector<double>& time,
                const SolutionMatrix& values, const TableLabels& labels);

// Creates missing parent directories; throws PricerError if the file cannot be written
void writeTable(const std::string& path, const std::vector<double>& space, const std::vector<double>& time,
                const SolutionMatrix& values, const TableLabels& labels);

} // namespace asian_pricer
