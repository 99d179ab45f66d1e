#include "option.hpp"
#include "errors.hpp"
#include <cmath>
#include <algorithm>
#include <cctype>

namespace asian_pricer {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

OptionKind parseOptionKind(const std::string& text) {
    const std::string tag = lowercase(text);
    if (tag == "call") return OptionKind::Call;
    if (tag == "put") return OptionKind::Put;
    throw InvalidOptionKind(text);
}

Scheme parseScheme(const std::string& text) {
    const std::string tag = lowercase(text);
    if (tag == "explicit") return Scheme::Explicit;
    if (tag == "cn" || tag == "crank_nicolson") return Scheme::CrankNicolson;
    throw ConfigurationError("Unknown scheme: '" + text + "' (expected 'explicit' or 'cn')");
}

std::string toString(OptionKind kind) {
    switch (kind) {
        case OptionKind::Call: return "call";
        case OptionKind::Put: return "put";
    }
    throw InvalidOptionKind(std::to_string(static_cast<int>(kind)));
}

std::string toString(EquationKind kind) {
    switch (kind) {
        case EquationKind::H: return "H";
        case EquationKind::W: return "W";
    }
    throw InvalidEquationKind(std::to_string(static_cast<int>(kind)));
}

std::string toString(Scheme scheme) {
    switch (scheme) {
        case Scheme::Explicit: return "explicit";
        case Scheme::CrankNicolson: return "cn";
    }
    throw ConfigurationError("Unknown scheme: " + std::to_string(static_cast<int>(scheme)));
}

void ModelParameters::validate() const {
    if (M < 3) {
        throw InvalidParameters("M must be at least 3 (got " + std::to_string(M) + ")");
    }
    if (N < 1) {
        throw InvalidParameters("N must be at least 1");
    }
    if (!std::isfinite(xMin) || !std::isfinite(xMax) || !(xMin < xMax)) {
        throw InvalidParameters("x_min must be finite and strictly below x_max");
    }
    if (!std::isfinite(T) || T <= 0.0) {
        throw InvalidParameters("T must be positive");
    }
    if (!std::isfinite(sigma) || sigma <= 0.0) {
        throw InvalidParameters("sigma must be positive");
    }
    if (!std::isfinite(r)) {
        throw InvalidParameters("r must be finite");
    }
}

} // namespace asian_pricer
