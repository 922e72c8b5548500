// filename: stability.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

#include "fpsim/grid.hpp"

namespace fpsim {

/**
 * @brief Explicit Euler step limits. Infinite entries mean the term is absent.
 *
 * limit() is the bound of the full upwind update, dt * (2 sum D/dx^2 + sum |A|/dx) <= 1, so it is
 * never larger than either term on its own.
 */
struct StabilityLimits {
    double diffusive{std::numeric_limits<double>::infinity()};
    double advective{std::numeric_limits<double>::infinity()};

    [[nodiscard]] double limit() const { return 1.0 / (1.0 / diffusive + 1.0 / advective); }
    [[nodiscard]] bool bounded() const { return limit() < std::numeric_limits<double>::infinity(); }
};

/**
 * @brief Per-axis coefficient bounds feeding the stability limits.
 */
struct AxisCoefficientBounds {
    double maxDrift{0.0};      // max |A| over the axis' faces
    double maxDiffusion{0.0};  // max D over the axis' faces (or centres for the Ito form)
    double spacing{1.0};
};

/**
 * @brief Combine per-axis bounds into diffusive (1 / (2 sum D/dx^2)) and advective
 *        (1 / sum |A|/dx) limits.
 */
StabilityLimits computeStabilityLimits(const std::vector<AxisCoefficientBounds>& axes);

struct StepPlan {
    std::size_t steps{0};
    double dt{0.0};
};

/**
 * @brief Resolve the number of forward Euler steps and the uniform step size for a run.
 *
 * Auto mode (no dt, no steps) takes courant * limit and shortens it so an integer number of
 * steps lands exactly on totalTime. A caller dt or step count is checked against limit()
 * and rejected with NumericalInstabilityError when it exceeds it by more than
 * tolerance (relative).
 */
StepPlan planSteps(double totalTime,
                   std::optional<double> dt,
                   std::optional<std::size_t> steps,
                   const StabilityLimits& limits,
                   double courant,
                   double tolerance);

[[nodiscard]] double totalMass(const std::vector<double>& density, double cellVolume);

[[nodiscard]] bool allFinite(const std::vector<double>& values);

[[nodiscard]] double minValue(const std::vector<double>& values);
[[nodiscard]] double maxValue(const std::vector<double>& values);

/**
 * @brief Marginal density p(x) = sum_j p(i, j) dy.
 */
std::vector<double> marginalX(const Grid2D& grid, const std::vector<double>& density);

/**
 * @brief Marginal density p(y) = sum_i p(i, j) dx.
 */
std::vector<double> marginalY(const Grid2D& grid, const std::vector<double>& density);

}  // namespace fpsim
