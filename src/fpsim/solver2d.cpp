// filename: solver2d.cpp
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

double standardNormal2D(double x, double y) {
    return std::exp(-0.5 * (x * x + y * y)) / (2.0 * PI);
}

std::vector<double> buildInitialDensity(const Config2D& config, const Grid2D& grid) {
    std::vector<double> density;
    if (!config.initialDensity.empty()) {
        if (config.initialDensity.size() != grid.size()) {
            throw ConfigurationError("FokkerPlanck2D: initial density has " +
                                     std::to_string(config.initialDensity.size()) + " values, grid has " +
                                     std::to_string(grid.size()) + " cells");
        }
        density = config.initialDensity;
    } else {
        const Field2D generator = config.initialCondition ? config.initialCondition : Field2D(standardNormal2D);
        density.resize(grid.size());
        for (std::size_t j = 0; j < grid.ny; ++j) {
            for (std::size_t i = 0; i < grid.nx; ++i) {
                density[grid.idx(i, j)] = generator(grid.centerX(i), grid.centerY(j));
            }
        }
    }

    for (std::size_t k = 0; k < density.size(); ++k) {
        if (!std::isfinite(density[k]) || density[k] < 0.0) {
            throw ConfigurationError("FokkerPlanck2D: initial density must be finite and non-negative (cell " +
                                     std::to_string(k % grid.nx) + "," + std::to_string(k / grid.nx) + ")");
        }
    }

    if (config.normalize) {
        const double mass = totalMass(density, grid.cellArea());
        if (!(mass > 0.0)) {
            throw ConfigurationError("FokkerPlanck2D: cannot normalise an initial density with zero mass");
        }
        for (double& value : density) {
            value /= mass;
        }
    }
    return density;
}

double sampleCoefficient(const Field2D& field, double x, double y, const char* name) {
    const double value = field(x, y);
    if (!std::isfinite(value)) {
        throw ConfigurationError(std::string("FokkerPlanck2D: ") + name + " is not finite at (" +
                                 std::to_string(x) + ", " + std::to_string(y) + ")");
    }
    return value;
}

void requireNonNegativeDiffusion(const FaceStencil& face, double x, double y) {
    if (face.diffLeft < 0.0 || face.diffRight < 0.0) {
        throw ConfigurationError("FokkerPlanck2D: diffusion must be non-negative at (" + std::to_string(x) + ", " +
                                 std::to_string(y) + ")");
    }
}

}  // namespace

std::vector<double> SnapshotSeries2D::times() const {
    std::vector<double> out;
    out.reserve(snapshots.size());
    for (const auto& snap : snapshots) {
        out.push_back(snap.time);
    }
    return out;
}

std::vector<double> SnapshotSeries2D::masses() const {
    std::vector<double> out;
    out.reserve(snapshots.size());
    for (const auto& snap : snapshots) {
        out.push_back(snap.mass);
    }
    return out;
}

FokkerPlanck2D::FokkerPlanck2D(const Config2D& config)
    : grid_(config.nx, config.ny, config.xMin, config.xMax, config.yMin, config.yMax),
      boundaryX_(config.boundaryX), boundaryY_(config.boundaryY), form_(config.diffusionForm) {
    if (!config.driftX || !config.driftY || !config.diffusionX || !config.diffusionY) {
        throw ConfigurationError("FokkerPlanck2D: drift and diffusion callables are required for both axes");
    }

    const std::size_t nx = grid_.nx;
    const std::size_t ny = grid_.ny;

    std::vector<double> centerDx;
    std::vector<double> centerDy;
    if (form_ == DiffusionForm::Ito) {
        centerDx.resize(grid_.size());
        centerDy.resize(grid_.size());
        for (std::size_t j = 0; j < ny; ++j) {
            for (std::size_t i = 0; i < nx; ++i) {
                const double x = grid_.centerX(i);
                const double y = grid_.centerY(j);
                centerDx[grid_.idx(i, j)] = sampleCoefficient(config.diffusionX, x, y, "diffusionX");
                centerDy[grid_.idx(i, j)] = sampleCoefficient(config.diffusionY, x, y, "diffusionY");
            }
        }
    }

    AxisCoefficientBounds boundsX{};
    boundsX.spacing = grid_.dx;
    AxisCoefficientBounds boundsY{};
    boundsY.spacing = grid_.dy;

    // x-direction faces: a row of faceCount(nx) faces for every cell row j. Stencil indices are
    // converted from along-axis positions to flat cell indices.
    xFacesPerRow_ = faceCount(nx, boundaryX_);
    xFaces_.resize(xFacesPerRow_ * ny);
    for (std::size_t j = 0; j < ny; ++j) {
        const double y = grid_.centerY(j);
        for (std::size_t f = 0; f < xFacesPerRow_; ++f) {
            FaceStencil& face = xFaces_[j * xFacesPerRow_ + f];
            std::size_t iL = 0;
            std::size_t iR = 0;
            face.kind = classifyFace(f, nx, boundaryX_, iL, iR);
            face.left = grid_.idx(iL, j);
            face.right = grid_.idx(iR, j);
            if (face.kind == FaceKind::Wall) {
                continue;
            }
            const double x = grid_.faceX(f);
            face.drift = sampleCoefficient(config.driftX, x, y, "driftX");
            if (form_ == DiffusionForm::Ito) {
                face.diffLeft = centerDx[face.left];
                face.diffRight = centerDx[face.right];
            } else {
                const double d = sampleCoefficient(config.diffusionX, x, y, "diffusionX");
                face.diffLeft = d;
                face.diffRight = d;
            }
            requireNonNegativeDiffusion(face, x, y);
            boundsX.maxDrift = std::max(boundsX.maxDrift, std::abs(face.drift));
            boundsX.maxDiffusion = std::max({boundsX.maxDiffusion, face.diffLeft, face.diffRight});
        }
    }

    // y-direction faces: a row of nx faces for every face position f along y.
    yFacesPerColumn_ = faceCount(ny, boundaryY_);
    yFaces_.resize(yFacesPerColumn_ * nx);
    for (std::size_t f = 0; f < yFacesPerColumn_; ++f) {
        const double y = grid_.faceY(f);
        for (std::size_t i = 0; i < nx; ++i) {
            FaceStencil& face = yFaces_[f * nx + i];
            std::size_t jL = 0;
            std::size_t jR = 0;
            face.kind = classifyFace(f, ny, boundaryY_, jL, jR);
            face.left = grid_.idx(i, jL);
            face.right = grid_.idx(i, jR);
            if (face.kind == FaceKind::Wall) {
                continue;
            }
            const double x = grid_.centerX(i);
            face.drift = sampleCoefficient(config.driftY, x, y, "driftY");
            if (form_ == DiffusionForm::Ito) {
                face.diffLeft = centerDy[face.left];
                face.diffRight = centerDy[face.right];
            } else {
                const double d = sampleCoefficient(config.diffusionY, x, y, "diffusionY");
                face.diffLeft = d;
                face.diffRight = d;
            }
            requireNonNegativeDiffusion(face, x, y);
            boundsY.maxDrift = std::max(boundsY.maxDrift, std::abs(face.drift));
            boundsY.maxDiffusion = std::max({boundsY.maxDiffusion, face.diffLeft, face.diffRight});
        }
    }

    limits_ = computeStabilityLimits({boundsX, boundsY});

    density_ = buildInitialDensity(config, grid_);
    rate_.assign(grid_.size(), 0.0);
    next_.assign(grid_.size(), 0.0);
}

double FokkerPlanck2D::totalMass() const {
    return fpsim::totalMass(density_, grid_.cellArea());
}

void FokkerPlanck2D::computeRate(const std::vector<double>& density, std::vector<double>& rate) const {
    if (density.size() != grid_.size()) {
        throw std::invalid_argument("FokkerPlanck2D::computeRate: density size does not match grid");
    }
    rate.assign(grid_.size(), 0.0);

    const auto scatter = [&](const std::vector<FaceStencil>& faces, double invSpacing) {
        for (const FaceStencil& face : faces) {
            if (face.kind == FaceKind::Wall) {
                continue;
            }
            const double flux = faceFlux(face, density[face.left], density[face.right], invSpacing) * invSpacing;
            if (face.kind != FaceKind::GhostLeft) {
                rate[face.left] -= flux;
            }
            if (face.kind != FaceKind::GhostRight) {
                rate[face.right] += flux;
            }
        }
    };

    scatter(xFaces_, 1.0 / grid_.dx);
    scatter(yFaces_, 1.0 / grid_.dy);
}

void FokkerPlanck2D::advance(double dt, std::size_t step) {
    computeRate(density_, rate_);
    for (std::size_t k = 0; k < density_.size(); ++k) {
        next_[k] = density_[k] + dt * rate_[k];
    }
    if (!allFinite(next_)) {
        throw NumericalInstabilityError("FokkerPlanck2D: non-finite density at step " + std::to_string(step),
                                        step, time_ + dt);
    }
    density_.swap(next_);
}

SnapshotSeries2D FokkerPlanck2D::run(const RunOptions& options, ProgressSink* progress) {
    if (hasRun_) {
        throw std::logic_error("FokkerPlanck2D::run: engine already ran; construct a new engine to restart");
    }
    if (options.sampleStride == 0) {
        throw ConfigurationError("Run: sample stride must be positive");
    }
    const StepPlan plan =
        planSteps(options.totalTime, options.dt, options.steps, limits_, options.courant, options.stabilityTolerance);
    hasRun_ = true;

    if (options.verbose) {
        std::cout << "FokkerPlanck2D: " << grid_.nx << 'x' << grid_.ny << " dx=" << grid_.dx << " dy=" << grid_.dy
                  << " boundary=" << toString(boundaryX_) << '/' << toString(boundaryY_)
                  << " diffusion=" << toString(form_) << " dt=" << plan.dt << " steps=" << plan.steps
                  << " (limit=" << limits_.limit() << ")\n";
    }

    SnapshotSeries2D series{};
    series.grid = grid_;
    series.boundaryX = boundaryX_;
    series.boundaryY = boundaryY_;
    series.x = grid_.centersX();
    series.y = grid_.centersY();
    series.dt = plan.dt;
    series.steps = plan.steps;
    series.snapshots.reserve(plan.steps / options.sampleStride + 2);

    const double initialMass = totalMass();
    series.snapshots.push_back({time_, initialMass, density_});

    const bool conserving = boundaryX_ != BoundaryKind::Absorbing && boundaryY_ != BoundaryKind::Absorbing;
    detail::RunMonitor monitor("FokkerPlanck2D", options, progress, plan.steps, initialMass, conserving);

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
