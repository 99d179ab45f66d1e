#include "config.hpp"
#include "errors.hpp"
#include <fstream>

namespace asian_pricer {

using nlohmann::json;

namespace {

const json& require(const json& section, const std::string& key, const std::string& path) {
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        throw ConfigurationMissing(path + "." + key);
    }
    return *it;
}

double requireNumber(const json& section, const std::string& key, const std::string& path) {
    const json& value = require(section, key, path);
    if (!value.is_number()) {
        throw ConfigurationError(path + "." + key + " must be a number");
    }
    return value.get<double>();
}

size_t requireCount(const json& section, const std::string& key, const std::string& path) {
    const json& value = require(section, key, path);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigurationError(path + "." + key + " must be a non-negative integer");
    }
    return value.get<size_t>();
}

bool optionalFlag(const json& section, const std::string& key, bool fallback, const std::string& path) {
    const auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw ConfigurationError(path + "." + key + " must be true or false");
    }
    return it->get<bool>();
}

BoundExpression parseBound(const json& value, const std::string& path) {
    if (value.is_number()) {
        return BoundExpression::parse(value.dump());
    }
    if (value.is_string()) {
        return BoundExpression::parse(value.get<std::string>());
    }
    throw ConfigurationError(path + " must be a number or a formula string");
}

// "[canvi_]{scheme}_{option}" with any accepted spelling, rewritten to the canonical key
std::string canonicalBoundsKey(const std::string& key, const std::string& path) {
    const std::string prefix = "canvi_";
    const bool changed = key.compare(0, prefix.size(), prefix) == 0;
    const std::string pair = changed ? key.substr(prefix.size()) : key;

    const size_t split = pair.rfind('_');
    if (split == std::string::npos) {
        throw ConfigurationError(path + ": bounds key must name a scheme and an option");
    }
    try {
        const Scheme scheme = parseScheme(pair.substr(0, split));
        const OptionKind option = parseOptionKind(pair.substr(split + 1));
        return changed ? changedBoundsKey(scheme, option) : boundsKey(scheme, option);
    } catch (const PricerError& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
}

} // namespace

std::string boundsKey(Scheme scheme, OptionKind option) {
    return toString(scheme) + "_" + toString(option);
}

std::string changedBoundsKey(Scheme scheme, OptionKind option) {
    return "canvi_" + boundsKey(scheme, option);
}

const IntervalBounds& EquationConfig::boundsFor(const std::string& key) const {
    const auto it = bounds.find(key);
    if (it == bounds.end()) {
        throw ConfigurationMissing(toString(equation) + ".bounds." + key);
    }
    return it->second;
}

EquationConfig parseEquationConfig(EquationKind equation, const json& section) {
    const std::string path = toString(equation);
    if (!section.is_object()) {
        throw ConfigurationError("Section " + path + " must be an object");
    }

    EquationConfig config;
    config.equation = equation;
    config.params.M = requireCount(section, "M", path);
    config.params.N = requireCount(section, "N", path);
    config.params.xMin = requireNumber(section, "x_min", path);
    config.params.xMax = requireNumber(section, "x_max", path);
    config.params.T = requireNumber(section, "T", path);
    config.params.sigma = requireNumber(section, "sigma", path);
    config.params.r = requireNumber(section, "r", path);

    config.runExplicit = optionalFlag(section, "run_explicit", true, path);
    config.runCrankNicolson = optionalFlag(section, "run_crank_nicolson", true, path);
    config.exportUnbounded = optionalFlag(section, "plot_unbounded", false, path);

    const auto bounds = section.find("bounds");
    if (bounds != section.end() && !bounds->is_null()) {
        if (!bounds->is_object()) {
            throw ConfigurationError(path + ".bounds must be an object");
        }
        for (auto it = bounds->begin(); it != bounds->end(); ++it) {
            const std::string entryPath = path + ".bounds." + it.key();
            if (!it->is_array() || it->size() != 2) {
                throw ConfigurationError(entryPath + " must be a [lower, upper] pair");
            }
            IntervalBounds interval;
            interval.lower = parseBound((*it)[0], entryPath + "[0]");
            interval.upper = parseBound((*it)[1], entryPath + "[1]");
            const std::string key = canonicalBoundsKey(it.key(), entryPath);
            if (!config.bounds.emplace(key, std::move(interval)).second) {
                throw ConfigurationError(entryPath + " duplicates the bounds for " + key);
            }
        }
    }

    return config;
}

PipelineConfig parseConfiguration(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("Configuration root must be an object");
    }

    PipelineConfig config;
    for (EquationKind equation : {EquationKind::H, EquationKind::W}) {
        const auto section = document.find(toString(equation));
        if (section != document.end() && !section->is_null()) {
            config.equations.push_back(parseEquationConfig(equation, *section));
        }
    }
    if (config.equations.empty()) {
        throw ConfigurationMissing("H or W");
    }

    const auto output = document.find("output_directory");
    if (output != document.end() && !output->is_null()) {
        if (!output->is_string()) {
            throw ConfigurationError("output_directory must be a string");
        }
        config.outputDirectory = output->get<std::string>();
    }
    return config;
}

PipelineConfig loadConfiguration(const std::string& path) {
    std::ifstream configFile(path);
    if (!configFile.is_open()) {
        throw ConfigurationError("Failed to open configuration file: " + path);
    }

    json document;
    try {
        configFile >> document;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Failed to parse " + path + ": " + e.what());
    }
    return parseConfiguration(document);
}

} // namespace asian_pricer
