#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "pricing_pipeline.hpp"
#include <iostream>
#include <memory>
#include <chrono>

using std::cout;
using std::cerr;
using std::endl;
using namespace std::chrono;

int main(int argc, char* argv[]) {
    if (argc != 2) {
        cerr << "Usage: " << argv[0] << " <config.json>" << endl;
        return 1;
    }

    auto logger = std::make_shared<asian_pricer::ConsoleLogger>();
    logger->info("Starting the pipeline");

    asian_pricer::PipelineConfig config;
    try {
        config = asian_pricer::loadConfiguration(argv[1]);
    } catch (const asian_pricer::PricerError& e) {
        logger->error(e.what());
        return 1;
    }

    asian_pricer::PricingPipeline pipeline(config, logger);

    auto start = high_resolution_clock::now();
    const auto outcomes = pipeline.run();
    auto duration = duration_cast<milliseconds>(high_resolution_clock::now() - start);

    size_t failures = 0;
    cout << "\nSummary:\n";
    cout << "--------\n";
    for (const auto& outcome : outcomes) {
        cout << outcome.task.label() << ": ";
        if (outcome.succeeded) {
            const auto& solution = outcome.result.solution;
            cout << "ok (M = " << solution.x.size() << ", N = " << solution.tau.size() - 1
                 << ", k = " << solution.coefficients.k;
            if (solution.stability.adjusted) {
                cout << ", step sizes adjusted for stability";
            }
            cout << ")\n";
        } else {
            ++failures;
            cout << "FAILED - " << outcome.error << "\n";
        }
    }
    cout << "Total time: " << duration.count() << "ms" << endl;

    logger->info("Finished solving the equations");
    return failures == 0 ? 0 : 2;
}
