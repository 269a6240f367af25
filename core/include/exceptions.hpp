#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class ChartEngineException : public std::runtime_error {
    public:
        explicit ChartEngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit ChartEngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public ChartEngineException {
    public: using ChartEngineException::ChartEngineException; };

    // Network failure, timeout or non-2xx status
    class ApiRequestException : public ChartEngineException {
    public: using ChartEngineException::ChartEngineException; };

    // Payload that cannot be interpreted at all (not an array, bad date...)
    class ParseException : public ChartEngineException {
    public: using ChartEngineException::ChartEngineException; };

    class IndicatorCalculationException : public ChartEngineException {
    public: using ChartEngineException::ChartEngineException; };

} // namespace core
