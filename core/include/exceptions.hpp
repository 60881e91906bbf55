#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class BacktestPlatformException : public std::runtime_error {
    public:
        explicit BacktestPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BacktestPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Invalid engine or strategy configuration, raised before any simulation step
    class ConfigurationException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    // Malformed bar sequence (empty, non-monotonic timestamps, unusable prices)
    class DataIntegrityException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class DataLoadException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class IndicatorCalculationException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

    class StrategyException : public BacktestPlatformException {
    public: using BacktestPlatformException::BacktestPlatformException; };

} // namespace core
