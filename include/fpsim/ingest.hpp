// filename: ingest.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "fpsim/solver.hpp"
#include "fpsim/types.hpp"

namespace fpsim {

/**
 * @brief Coefficient field given as a sum of monomials c * x^px * y^py.
 *
 * A scalar in the scenario file becomes a single constant term.
 */
struct PolynomialField {
    struct Term {
        double c{0.0};
        int px{0};
        int py{0};
    };

    std::vector<Term> terms;

    [[nodiscard]] double operator()(double x, double y = 0.0) const;

    static PolynomialField constant(double value) { return PolynomialField{{Term{value, 0, 0}}}; }
};

struct InitialConditionSpec {
    enum class Kind { StandardNormal, Gaussian, Uniform, Values };

    Kind kind{Kind::StandardNormal};
    double centerX{0.0};
    double centerY{0.0};
    double widthX{1.0};
    double widthY{1.0};
    std::vector<double> values;
    bool normalize{true};
};

struct ScenarioSpec {
    struct Outputs {
        std::string csv;           // long-format density series
        std::string massHistory;   // time,mass
        std::string marginals;     // 2D only: time-indexed p(x,t) and p(y,t)
        std::string vtkDirectory;  // .vti per snapshot plus a .pvd collection
        std::string html;          // standalone animation
    };

    std::string version;
    int dimension{1};
    double xMin{-5.0};
    double xMax{5.0};
    double yMin{-5.0};
    double yMax{5.0};
    std::size_t nx{100};
    std::size_t ny{1};
    BoundaryKind boundaryX{BoundaryKind::Reflecting};
    BoundaryKind boundaryY{BoundaryKind::Reflecting};
    DiffusionForm diffusionForm{DiffusionForm::Fickian};
    PolynomialField driftX;
    PolynomialField driftY;
    PolynomialField diffusionX;
    PolynomialField diffusionY;
    InitialConditionSpec initial;
    RunOptions run;
    Outputs outputs;
};

ScenarioSpec loadScenarioFromJson(const std::string& path);

ScenarioSpec parseScenarioJson(const std::string& text);

Config1D makeConfig1D(const ScenarioSpec& spec);

Config2D makeConfig2D(const ScenarioSpec& spec);

/**
 * @brief Built-in demo setups: A = -0.2 x^3, D = 0.5 on [-5, 5] with 100 cells (1D), and
 *        A = (-0.2 x^3, -y), D = 0.5 on [-5, 5]^2 with 50 x 50 cells (2D).
 */
ScenarioSpec defaultScenario(int dimension);

}  // namespace fpsim
