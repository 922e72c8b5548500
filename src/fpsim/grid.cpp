#include "fpsim/grid.hpp"

#include "fpsim/types.hpp"

#include <cmath>
#include <string>

namespace fpsim {
namespace {

double requireSpacing(const char* axis, std::size_t cells, double lo, double hi) {
    if (cells < 2) {
        throw ConfigurationError(std::string("Grid: n") + axis + " must be at least 2");
    }
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        throw ConfigurationError(std::string("Grid: ") + axis + " bounds must be finite");
    }
    if (!(lo < hi)) {
        throw ConfigurationError(std::string("Grid: degenerate domain, ") + axis + "_min must be below " + axis +
                                 "_max");
    }
    return (hi - lo) / static_cast<double>(cells);
}

std::vector<double> cellCenters(std::size_t cells, double lo, double spacing) {
    std::vector<double> out(cells);
    for (std::size_t i = 0; i < cells; ++i) {
        out[i] = lo + (static_cast<double>(i) + 0.5) * spacing;
    }
    return out;
}

}  // namespace

Grid1D::Grid1D(std::size_t nxIn, double xMinIn, double xMaxIn)
    : nx(nxIn), xMin(xMinIn), xMax(xMaxIn), dx(requireSpacing("x", nxIn, xMinIn, xMaxIn)) {}

std::vector<double> Grid1D::centers() const {
    return cellCenters(nx, xMin, dx);
}

Grid2D::Grid2D(std::size_t nxIn, std::size_t nyIn, double xMinIn, double xMaxIn, double yMinIn, double yMaxIn)
    : nx(nxIn), ny(nyIn), xMin(xMinIn), xMax(xMaxIn), yMin(yMinIn), yMax(yMaxIn),
      dx(requireSpacing("x", nxIn, xMinIn, xMaxIn)), dy(requireSpacing("y", nyIn, yMinIn, yMaxIn)) {}

std::vector<double> Grid2D::centersX() const {
    return cellCenters(nx, xMin, dx);
}

std::vector<double> Grid2D::centersY() const {
    return cellCenters(ny, yMin, dy);
}

}  // namespace fpsim
