#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace asian_pricer {

enum class LogLevel { Info, Warning, Error };

std::string toString(LogLevel level);

// Logging capability handed to solvers and to the pipeline
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(const std::string& message, LogLevel level = LogLevel::Info) = 0;

    void info(const std::string& message) { log(message, LogLevel::Info); }
    void warning(const std::string& message) { log(message, LogLevel::Warning); }
    void error(const std::string& message) { log(message, LogLevel::Error); }
};

// "2026-01-31 12:00:00 - INFO - message", optionally coloured per level
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::ostream& out = std::cerr, bool useColors = true);

    void log(const std::string& message, LogLevel level = LogLevel::Info) override;

private:
    std::ostream& out_;
    bool useColors_;
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    void log(const std::string&, LogLevel = LogLevel::Info) override {}
};

// Substitutes a NullLogger for an empty pointer
std::shared_ptr<Logger> orNullLogger(std::shared_ptr<Logger> logger);

} // namespace asian_pricer
