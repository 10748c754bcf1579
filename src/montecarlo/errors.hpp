/**
 * Engine error types.
 *
 *   ConfigurationError     invalid configuration, detected at load time
 *   EmptyInventoryError    draw attempted on an empty machine (logic defect)
 *   InsufficientDataError  too few runs or samples for a statistic
 */

#ifndef GACHA_MC_ERRORS_HPP
#define GACHA_MC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gacha::mc {

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error("Configuration error: " + msg) {}
};

class EmptyInventoryError : public std::logic_error {
public:
    EmptyInventoryError()
        : std::logic_error("draw attempted on an empty inventory") {}
};

class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& msg)
        : std::runtime_error("Insufficient data: " + msg) {}
};

} // namespace gacha::mc

#endif // GACHA_MC_ERRORS_HPP
