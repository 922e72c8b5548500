// filename: solver1d.cpp
// part of Fokker-Planck FVM Simulator
// MIT License

#include "fpsim/solver.hpp"

#include "run_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fpsim {
namespace {

double standardNormal(double x) {
    return std::exp(-0.5 * x * x) / std::sqrt(2.0 * PI);
}

std::vector<double> buildInitialDensity(const Config1D& config, const Grid1D& grid) {
    std::vector<double> density;
    if (!config.initialDensity.empty()) {
        if (config.initialDensity.size() != grid.nx) {
            throw ConfigurationError("FokkerPlanck1D: initial density has " +
                                     std::to_string(config.initialDensity.size()) + " values, grid has " +
                                     std::to_string(grid.nx) + " cells");
        }
        density = config.initialDensity;
    } else {
        const Field1D generator = config.initialCondition ? config.initialCondition : Field1D(standardNormal);
        density.resize(grid.nx);
        for (std::size_t i = 0; i < grid.nx; ++i) {
            density[i] = generator(grid.center(i));
        }
    }

    for (std::size_t i = 0; i < density.size(); ++i) {
        if (!std::isfinite(density[i]) || density[i] < 0.0) {
            throw ConfigurationError("FokkerPlanck1D: initial density must be finite and non-negative (cell " +
                                     std::to_string(i) + ")");
        }
    }

    if (config.normalize) {
        const double mass = totalMass(density, grid.dx);
        if (!(mass > 0.0)) {
            throw ConfigurationError("FokkerPlanck1D: cannot normalise an initial density with zero mass");
        }
        for (double& value : density) {
            value /= mass;
        }
    }
    return density;
}

double sampleCoefficient(const Field1D& field, double x, const char* name) {
    const double value = field(x);
    if (!std::isfinite(value)) {
        throw ConfigurationError(std::string("FokkerPlanck1D: ") + name + " is not finite at x=" +
                                 std::to_string(x));
    }
    return value;
}

}  // namespace

std::vector<double> SnapshotSeries1D::times() const {
    std::vector<double> out;
    out.reserve(snapshots.size());
    for (const auto& snap : snapshots) {
        out.push_back(snap.time);
    }
    return out;
}

std::vector<double> SnapshotSeries1D::masses() const {
    std::vector<double> out;
    out.reserve(snapshots.size());
    for (const auto& snap : snapshots) {
        out.push_back(snap.mass);
    }
    return out;
}

FokkerPlanck1D::FokkerPlanck1D(const Config1D& config)
    : grid_(config.nx, config.xMin, config.xMax), boundary_(config.boundary), form_(config.diffusionForm) {
    if (!config.drift || !config.diffusion) {
        throw ConfigurationError("FokkerPlanck1D: drift and diffusion callables are required");
    }

    const std::size_t n = grid_.nx;
    std::vector<double> centerDiffusion;
    if (form_ == DiffusionForm::Ito) {
        centerDiffusion.resize(n);
        for (std::size_t i = 0; i < n; ++i) {
            centerDiffusion[i] = sampleCoefficient(config.diffusion, grid_.center(i), "diffusion");
        }
    }

    AxisCoefficientBounds bounds{};
    bounds.spacing = grid_.dx;

    faces_.resize(faceCount(n, boundary_));
    for (std::size_t f = 0; f < faces_.size(); ++f) {
        FaceStencil& face = faces_[f];
        face.kind = classifyFace(f, n, boundary_, face.left, face.right);
        if (face.kind == FaceKind::Wall) {
            continue;
        }
        // The wrap face of a periodic axis is evaluated at xMin.
        const double xf = grid_.face(f);
        face.drift = sampleCoefficient(config.drift, xf, "drift");
        if (form_ == DiffusionForm::Ito) {
            face.diffLeft = centerDiffusion[face.left];
            face.diffRight = centerDiffusion[face.right];
        } else {
            const double d = sampleCoefficient(config.diffusion, xf, "diffusion");
            face.diffLeft = d;
            face.diffRight = d;
        }
        if (face.diffLeft < 0.0 || face.diffRight < 0.0) {
            throw ConfigurationError("FokkerPlanck1D: diffusion must be non-negative (x=" + std::to_string(xf) +
                                     ")");
        }
        bounds.maxDrift = std::max(bounds.maxDrift, std::abs(face.drift));
        bounds.maxDiffusion = std::max({bounds.maxDiffusion, face.diffLeft, face.diffRight});
    }
    limits_ = computeStabilityLimits({bounds});

    density_ = buildInitialDensity(config, grid_);
    rate_.assign(n, 0.0);
    next_.assign(n, 0.0);
}

double FokkerPlanck1D::totalMass() const {
    return fpsim::totalMass(density_, grid_.dx);
}

void FokkerPlanck1D::computeRate(const std::vector<double>& density, std::vector<double>& rate) const {
    const std::size_t n = grid_.nx;
    if (density.size() != n) {
        throw std::invalid_argument("FokkerPlanck1D::computeRate: density size does not match grid");
    }
    rate.assign(n, 0.0);

    const double invDx = 1.0 / grid_.dx;
    for (const FaceStencil& face : faces_) {
        if (face.kind == FaceKind::Wall) {
            continue;
        }
        const double flux = faceFlux(face, density[face.left], density[face.right], invDx) * invDx;
        if (face.kind != FaceKind::GhostLeft) {
            rate[face.left] -= flux;
        }
        if (face.kind != FaceKind::GhostRight) {
            rate[face.right] += flux;
        }
    }
}

void FokkerPlanck1D::advance(double dt, std::size_t step) {
    computeRate(density_, rate_);
    for (std::size_t i = 0; i < density_.size(); ++i) {
        next_[i] = density_[i] + dt * rate_[i];
    }
    if (!allFinite(next_)) {
        throw NumericalInstabilityError("FokkerPlanck1D: non-finite density at step " + std::to_string(step),
                                        step, time_ + dt);
    }
    density_.swap(next_);
}

SnapshotSeries1D FokkerPlanck1D::run(const RunOptions& options, ProgressSink* progress) {
    if (hasRun_) {
        throw std::logic_error("FokkerPlanck1D::run: engine already ran; construct a new engine to restart");
    }
    if (options.sampleStride == 0) {
        throw ConfigurationError("Run: sample stride must be positive");
    }
    const StepPlan plan =
        planSteps(options.totalTime, options.dt, options.steps, limits_, options.courant, options.stabilityTolerance);
    hasRun_ = true;

    if (options.verbose) {
        std::cout << "FokkerPlanck1D: nx=" << grid_.nx << " dx=" << grid_.dx << " boundary=" << toString(boundary_)
                  << " diffusion=" << toString(form_) << " dt=" << plan.dt << " steps=" << plan.steps
                  << " (limit=" << limits_.limit() << ")\n";
    }

    SnapshotSeries1D series{};
    series.grid = grid_;
    series.boundary = boundary_;
    series.x = grid_.centers();
    series.dt = plan.dt;
    series.steps = plan.steps;
    series.snapshots.reserve(plan.steps / options.sampleStride + 2);

    const double initialMass = totalMass();
    series.snapshots.push_back({time_, initialMass, density_});

    const bool conserving = boundary_ != BoundaryKind::Absorbing;
    detail::RunMonitor monitor("FokkerPlanck1D", options, progress, plan.steps, initialMass, conserving);

    const double startTime = time_;
    for (std::size_t step = 1; step <= plan.steps; ++step) {
        advance(plan.dt, step);
        time_ = startTime + static_cast<double>(step) * plan.dt;
        const double mass = totalMass();
        monitor.onStep(step, time_, mass);
        if (step % options.sampleStride == 0 || step == plan.steps) {
            series.snapshots.push_back({time_, mass, density_});
        }
    }

    series.massAnomaly = monitor.massAnomaly();
    series.maxMassDrift = monitor.maxMassDrift();
    return series;
}

}  // namespace fpsim
