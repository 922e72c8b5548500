// filename: grid.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include <cstddef>
#include <vector>

namespace fpsim {

/**
 * @brief Uniform cell-centred 1D grid over [xMin, xMax].
 *
 * Cell i spans [xMin + i*dx, xMin + (i+1)*dx]; face i sits at xMin + i*dx for i in [0, nx].
 */
struct Grid1D {
    std::size_t nx{0};
    double xMin{0.0};
    double xMax{1.0};
    double dx{1.0};

    Grid1D() = default;

    Grid1D(std::size_t nxIn, double xMinIn, double xMaxIn);

    [[nodiscard]] inline double center(std::size_t i) const {
        return xMin + (static_cast<double>(i) + 0.5) * dx;
    }

    [[nodiscard]] inline double face(std::size_t i) const {
        return xMin + static_cast<double>(i) * dx;
    }

    [[nodiscard]] inline std::size_t size() const { return nx; }

    [[nodiscard]] std::vector<double> centers() const;
};

/**
 * @brief Uniform cell-centred 2D grid. Fields are stored row-major with x fastest.
 */
struct Grid2D {
    std::size_t nx{0};
    std::size_t ny{0};
    double xMin{0.0};
    double xMax{1.0};
    double yMin{0.0};
    double yMax{1.0};
    double dx{1.0};
    double dy{1.0};

    Grid2D() = default;

    Grid2D(std::size_t nxIn, std::size_t nyIn, double xMinIn, double xMaxIn, double yMinIn, double yMaxIn);

    [[nodiscard]] inline std::size_t idx(std::size_t i, std::size_t j) const {
        return j * nx + i;
    }

    [[nodiscard]] inline double centerX(std::size_t i) const {
        return xMin + (static_cast<double>(i) + 0.5) * dx;
    }

    [[nodiscard]] inline double centerY(std::size_t j) const {
        return yMin + (static_cast<double>(j) + 0.5) * dy;
    }

    [[nodiscard]] inline double faceX(std::size_t i) const {
        return xMin + static_cast<double>(i) * dx;
    }

    [[nodiscard]] inline double faceY(std::size_t j) const {
        return yMin + static_cast<double>(j) * dy;
    }

    [[nodiscard]] inline std::size_t size() const { return nx * ny; }

    [[nodiscard]] inline double cellArea() const { return dx * dy; }

    [[nodiscard]] std::vector<double> centersX() const;
    [[nodiscard]] std::vector<double> centersY() const;
};

}  // namespace fpsim
