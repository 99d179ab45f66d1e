#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>

namespace asian_pricer {

namespace {

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warning: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
    }
    return "";
}

const char* RESET = "\033[0m";

} // namespace

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

ConsoleLogger::ConsoleLogger(std::ostream& out, bool useColors)
    : out_(out), useColors_(useColors) {}

void ConsoleLogger::log(const std::string& message, LogLevel level) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm localTime{};
    localtime_r(&now, &localTime);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << " - " << toString(level) << " - ";
    if (useColors_) {
        out_ << colorCode(level) << message << RESET;
    } else {
        out_ << message;
    }
    out_ << std::endl;
}

std::shared_ptr<Logger> orNullLogger(std::shared_ptr<Logger> logger) {
    if (logger) {
        return logger;
    }
    return std::make_shared<NullLogger>();
}

} // namespace asian_pricer
