// filename: stability.cpp
// part of Fokker-Planck FVM Simulator
// MIT License

#include "fpsim/stability.hpp"

#include "fpsim/types.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fpsim {
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kTimeSlack = 1e-9;

std::string describeLimit(double dt, double limit) {
    std::ostringstream oss;
    oss << "time step " << dt << " exceeds stability limit " << limit << " (ratio " << dt / limit << ")";
    return oss.str();
}

}  // namespace

StabilityLimits computeStabilityLimits(const std::vector<AxisCoefficientBounds>& axes) {
    double diffusionRate = 0.0;
    double advectionRate = 0.0;
    for (const auto& axis : axes) {
        if (!(axis.spacing > 0.0)) {
            throw std::invalid_argument("computeStabilityLimits: spacing must be positive");
        }
        diffusionRate += axis.maxDiffusion / (axis.spacing * axis.spacing);
        advectionRate += axis.maxDrift / axis.spacing;
    }

    StabilityLimits limits{};
    limits.diffusive = diffusionRate > 0.0 ? 1.0 / (2.0 * diffusionRate) : kInf;
    limits.advective = advectionRate > 0.0 ? 1.0 / advectionRate : kInf;
    return limits;
}

StepPlan planSteps(double totalTime,
                   std::optional<double> dt,
                   std::optional<std::size_t> steps,
                   const StabilityLimits& limits,
                   double courant,
                   double tolerance) {
    if (!(totalTime > 0.0) || !std::isfinite(totalTime)) {
        throw ConfigurationError("Run: total time must be positive and finite");
    }
    if (dt && steps) {
        throw ConfigurationError("Run: specify either dt or steps, not both");
    }
    if (!(courant > 0.0) || courant > 1.0) {
        throw ConfigurationError("Run: stability constant must lie in (0, 1]");
    }
    if (!(tolerance >= 0.0) || !std::isfinite(tolerance)) {
        throw ConfigurationError("Run: stability tolerance must be non-negative and finite");
    }

    StepPlan plan{};
    if (steps) {
        if (*steps == 0) {
            throw ConfigurationError("Run: step count must be positive");
        }
        plan.steps = *steps;
        plan.dt = totalTime / static_cast<double>(plan.steps);
    } else if (dt) {
        if (!(*dt > 0.0) || !std::isfinite(*dt)) {
            throw ConfigurationError("Run: dt must be positive and finite");
        }
        const double ratio = totalTime / *dt;
        plan.steps = static_cast<std::size_t>(std::ceil(ratio - kTimeSlack));
        plan.steps = std::max<std::size_t>(plan.steps, 1);
        plan.dt = totalTime / static_cast<double>(plan.steps);
    } else {
        if (!limits.bounded()) {
            // Neither drift nor diffusion: any step is stable, one step reaches the horizon.
            plan.steps = 1;
            plan.dt = totalTime;
            return plan;
        }
        const double target = courant * limits.limit();
        plan.steps = static_cast<std::size_t>(std::ceil(totalTime / target - kTimeSlack));
        plan.steps = std::max<std::size_t>(plan.steps, 1);
        plan.dt = totalTime / static_cast<double>(plan.steps);
        return plan;
    }

    if (limits.bounded() && plan.dt > limits.limit() * (1.0 + tolerance)) {
        throw NumericalInstabilityError(describeLimit(plan.dt, limits.limit()), 0, 0.0);
    }
    return plan;
}

double totalMass(const std::vector<double>& density, double cellVolume) {
    double sum = 0.0;
    for (const double value : density) {
        sum += value;
    }
    return sum * cellVolume;
}

bool allFinite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

double minValue(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return *std::min_element(values.begin(), values.end());
}

double maxValue(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return *std::max_element(values.begin(), values.end());
}

std::vector<double> marginalX(const Grid2D& grid, const std::vector<double>& density) {
    if (density.size() != grid.size()) {
        throw std::invalid_argument("marginalX: density size does not match grid");
    }
    std::vector<double> out(grid.nx, 0.0);
    for (std::size_t j = 0; j < grid.ny; ++j) {
        for (std::size_t i = 0; i < grid.nx; ++i) {
            out[i] += density[grid.idx(i, j)];
        }
    }
    for (double& value : out) {
        value *= grid.dy;
    }
    return out;
}

std::vector<double> marginalY(const Grid2D& grid, const std::vector<double>& density) {
    if (density.size() != grid.size()) {
        throw std::invalid_argument("marginalY: density size does not match grid");
    }
    std::vector<double> out(grid.ny, 0.0);
    for (std::size_t j = 0; j < grid.ny; ++j) {
        double rowSum = 0.0;
        for (std::size_t i = 0; i < grid.nx; ++i) {
            rowSum += density[grid.idx(i, j)];
        }
        out[j] = rowSum * grid.dx;
    }
    return out;
}

}  // namespace fpsim
