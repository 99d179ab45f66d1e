#include "table_writer.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>

namespace asian_pricer {

void writeTable(std::ostream& out, const std::vector<double>& space, const std::vector<double>& time,
                const SolutionMatrix& values, const TableLabels& labels) {
    if (values.rows() != space.size() || values.cols() != time.size()) {
        throw InvalidParameters("Table axes do not match the solution matrix");
    }

    out << labels.space << ',' << labels.time << ",\"" << labels.value << "\"\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (size_t n = 0; n < time.size(); ++n) {
        for (size_t m = 0; m < space.size(); ++m) {
            out << space[m] << ',' << time[n] << ',' << values(m, n) << '\n';
        }
    }
}

void writeTable(const std::string& path, const std::vector<double>& space, const std::vector<double>& time,
                const SolutionMatrix& values, const TableLabels& labels) {
    const std::filesystem::path file(path);
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            throw PricerError("Failed to create directory " + file.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(file);
    if (!out.is_open()) {
        throw PricerError("Failed to open table file: " + path);
    }
    writeTable(out, space, time, values, labels);
    out.flush();
    if (!out) {
        throw PricerError("Failed to write table file: " + path);
    }
}

} // namespace asian_pricer
