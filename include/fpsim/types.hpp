// filename: types.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fpsim {

constexpr double PI = 3.14159265358979323846;

enum class BoundaryKind { Reflecting, Absorbing, Periodic };

/**
 * @brief Discretisation of the diffusive flux.
 *
 * Fickian: F = -D(x_face) * dp/dx. Ito: F = -d(D p)/dx with D sampled at cell centres.
 */
enum class DiffusionForm { Fickian, Ito };

/**
 * @brief Invalid engine or scenario configuration. Raised before any stepping.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Step size over the stability limit, or a step that produced non-finite density.
 */
class NumericalInstabilityError : public std::runtime_error {
public:
    NumericalInstabilityError(const std::string& what, std::size_t step, double time)
        : std::runtime_error(what), step_(step), time_(time) {}

    [[nodiscard]] std::size_t step() const { return step_; }
    [[nodiscard]] double time() const { return time_; }

private:
    std::size_t step_{0};
    double time_{0.0};
};

BoundaryKind parseBoundaryKind(const std::string& value);
const char* toString(BoundaryKind kind);

DiffusionForm parseDiffusionForm(const std::string& value);
const char* toString(DiffusionForm form);

}  // namespace fpsim
