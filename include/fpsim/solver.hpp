// filename: solver.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include "grid.hpp"
#include "flux.hpp"
#include "stability.hpp"
#include "types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace fpsim {

using Field1D = std::function<double(double)>;
using Field2D = std::function<double(double, double)>;

/**
 * @brief Progress report emitted while an engine is stepping.
 */
struct ProgressSample {
    std::size_t step{0};
    std::size_t totalSteps{0};
    double time{0.0};
    double mass{0.0};
    double elapsedSeconds{0.0};
};

struct ProgressSink {
    virtual ~ProgressSink() = default;
    virtual void onProgress(const ProgressSample& sample) = 0;
};

struct RunOptions {
    double totalTime{1.0};
    std::optional<double> dt;           // nullopt selects courant * stability limit
    std::optional<std::size_t> steps;   // alternative to dt: fixed number of uniform steps
    std::size_t sampleStride{1};        // record every N accepted steps
    double courant{0.3};
    double stabilityTolerance{0.05};    // relative slack on a caller dt before rejection
    double massTolerance{1e-9};         // relative drift reported as an anomaly
    double progressEverySec{2.0};
    bool verbose{false};
};

struct Snapshot1D {
    double time{0.0};
    double mass{0.0};
    std::vector<double> density;
};

struct Snapshot2D {
    double time{0.0};
    double mass{0.0};
    std::vector<double> density;
};

/**
 * @brief Finalised output of a 1D run: cell centres plus the ordered snapshots.
 */
struct SnapshotSeries1D {
    Grid1D grid;
    BoundaryKind boundary{BoundaryKind::Reflecting};
    std::vector<double> x;
    std::vector<Snapshot1D> snapshots;
    double dt{0.0};
    std::size_t steps{0};
    bool massAnomaly{false};
    double maxMassDrift{0.0};

    [[nodiscard]] std::vector<double> times() const;
    [[nodiscard]] std::vector<double> masses() const;
};

struct SnapshotSeries2D {
    Grid2D grid;
    BoundaryKind boundaryX{BoundaryKind::Reflecting};
    BoundaryKind boundaryY{BoundaryKind::Reflecting};
    std::vector<double> x;
    std::vector<double> y;
    std::vector<Snapshot2D> snapshots;
    double dt{0.0};
    std::size_t steps{0};
    bool massAnomaly{false};
    double maxMassDrift{0.0};

    [[nodiscard]] std::vector<double> times() const;
    [[nodiscard]] std::vector<double> masses() const;
};

struct Config1D {
    Field1D drift;
    Field1D diffusion;
    double xMin{-5.0};
    double xMax{5.0};
    std::size_t nx{100};
    BoundaryKind boundary{BoundaryKind::Reflecting};
    DiffusionForm diffusionForm{DiffusionForm::Fickian};
    // Initial density: explicit cell values take precedence over the generator; with neither
    // set the standard normal density is used.
    std::vector<double> initialDensity;
    Field1D initialCondition;
    bool normalize{false};
};

struct Config2D {
    Field2D driftX;
    Field2D driftY;
    Field2D diffusionX;
    Field2D diffusionY;
    double xMin{-5.0};
    double xMax{5.0};
    double yMin{-5.0};
    double yMax{5.0};
    std::size_t nx{50};
    std::size_t ny{50};
    BoundaryKind boundaryX{BoundaryKind::Reflecting};
    BoundaryKind boundaryY{BoundaryKind::Reflecting};
    DiffusionForm diffusionForm{DiffusionForm::Fickian};
    std::vector<double> initialDensity;  // row-major, idx(i, j) = j * nx + i
    Field2D initialCondition;
    bool normalize{false};

    void setBoundary(BoundaryKind kind) {
        boundaryX = kind;
        boundaryY = kind;
    }
};

/**
 * @brief Explicit finite-volume Fokker-Planck solver on a uniform 1D grid.
 *
 * Drift and diffusion are sampled once at construction. Each run() owns the density buffer,
 * advances it with forward Euler and returns the recorded snapshots. An engine runs once;
 * construct a new one to restart.
 */
class FokkerPlanck1D {
public:
    explicit FokkerPlanck1D(const Config1D& config);

    [[nodiscard]] const Grid1D& grid() const { return grid_; }
    [[nodiscard]] BoundaryKind boundary() const { return boundary_; }
    [[nodiscard]] DiffusionForm diffusionForm() const { return form_; }
    [[nodiscard]] const std::vector<double>& density() const { return density_; }
    [[nodiscard]] double time() const { return time_; }
    [[nodiscard]] double totalMass() const;
    [[nodiscard]] const StabilityLimits& stabilityLimits() const { return limits_; }

    /**
     * @brief Evaluate dp/dt = -div F for an arbitrary field on this grid.
     */
    void computeRate(const std::vector<double>& density, std::vector<double>& rate) const;

    SnapshotSeries1D run(const RunOptions& options, ProgressSink* progress = nullptr);

private:
    void advance(double dt, std::size_t step);

    Grid1D grid_;
    BoundaryKind boundary_{BoundaryKind::Reflecting};
    DiffusionForm form_{DiffusionForm::Fickian};
    std::vector<FaceStencil> faces_;
    StabilityLimits limits_;
    std::vector<double> density_;
    std::vector<double> rate_;
    std::vector<double> next_;
    double time_{0.0};
    bool hasRun_{false};
};

/**
 * @brief 2D analogue of FokkerPlanck1D. x-fluxes cross vertical faces, y-fluxes horizontal
 *        ones; each axis carries its own boundary policy.
 */
class FokkerPlanck2D {
public:
    explicit FokkerPlanck2D(const Config2D& config);

    [[nodiscard]] const Grid2D& grid() const { return grid_; }
    [[nodiscard]] BoundaryKind boundaryX() const { return boundaryX_; }
    [[nodiscard]] BoundaryKind boundaryY() const { return boundaryY_; }
    [[nodiscard]] DiffusionForm diffusionForm() const { return form_; }
    [[nodiscard]] const std::vector<double>& density() const { return density_; }
    [[nodiscard]] double time() const { return time_; }
    [[nodiscard]] double totalMass() const;
    [[nodiscard]] const StabilityLimits& stabilityLimits() const { return limits_; }

    void computeRate(const std::vector<double>& density, std::vector<double>& rate) const;

    SnapshotSeries2D run(const RunOptions& options, ProgressSink* progress = nullptr);

private:
    void advance(double dt, std::size_t step);

    Grid2D grid_;
    BoundaryKind boundaryX_{BoundaryKind::Reflecting};
    BoundaryKind boundaryY_{BoundaryKind::Reflecting};
    DiffusionForm form_{DiffusionForm::Fickian};
    std::size_t xFacesPerRow_{0};
    std::size_t yFacesPerColumn_{0};
    std::vector<FaceStencil> xFaces_;  // index j * xFacesPerRow_ + f
    std::vector<FaceStencil> yFaces_;  // index f * nx + i
    StabilityLimits limits_;
    std::vector<double> density_;
    std::vector<double> rate_;
    std::vector<double> next_;
    double time_{0.0};
    bool hasRun_{false};
};

}  // namespace fpsim
