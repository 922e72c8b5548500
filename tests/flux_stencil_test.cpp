#include "fpsim/flux.hpp"
#include "fpsim/grid.hpp"
#include "fpsim/solver.hpp"

#include <cmath>
#include <iostream>
#include <numeric>
#include <vector>

int main() {
    using namespace fpsim;

    // Face classification along a 5-cell axis.
    {
        std::size_t left = 0;
        std::size_t right = 0;
        if (faceCount(5, BoundaryKind::Reflecting) != 6 || faceCount(5, BoundaryKind::Periodic) != 5) {
            std::cerr << "faceCount wrong\n";
            return 1;
        }
        if (classifyFace(0, 5, BoundaryKind::Reflecting, left, right) != FaceKind::Wall ||
            classifyFace(5, 5, BoundaryKind::Reflecting, left, right) != FaceKind::Wall) {
            std::cerr << "Reflecting edges should be walls\n";
            return 1;
        }
        if (classifyFace(0, 5, BoundaryKind::Absorbing, left, right) != FaceKind::GhostLeft || right != 0 ||
            classifyFace(5, 5, BoundaryKind::Absorbing, left, right) != FaceKind::GhostRight || left != 4) {
            std::cerr << "Absorbing edges should face ghost cells next to the edge cells\n";
            return 1;
        }
        if (classifyFace(0, 5, BoundaryKind::Periodic, left, right) != FaceKind::Interior || left != 4 ||
            right != 0) {
            std::cerr << "Periodic seam should join cell 4 to cell 0\n";
            return 1;
        }
        if (classifyFace(3, 5, BoundaryKind::Absorbing, left, right) != FaceKind::Interior || left != 2 ||
            right != 3) {
            std::cerr << "Interior face 3 should join cells 2 and 3\n";
            return 1;
        }
    }

    // Flux through a single face: upwind drift plus Fickian diffusion.
    {
        FaceStencil face{};
        face.drift = 2.0;
        face.diffLeft = 0.5;
        face.diffRight = 0.5;
        const double flux = faceFlux(face, 3.0, 1.0, 10.0);
        // 2 * 3 - 0.5 * (1 - 3) * 10
        if (std::abs(flux - 16.0) > 1e-12) {
            std::cerr << "Interior flux " << flux << ", expected 16\n";
            return 1;
        }
        face.drift = -2.0;
        if (std::abs(faceFlux(face, 3.0, 1.0, 10.0) - 8.0) > 1e-12) {
            std::cerr << "Negative drift should upwind from the right cell\n";
            return 1;
        }
        face.kind = FaceKind::GhostRight;
        // Outflow into an empty ghost: -2 * 0 - 0.5 * (0 - 3) * 10
        if (std::abs(faceFlux(face, 3.0, 1.0, 10.0) - 15.0) > 1e-12) {
            std::cerr << "Ghost-right flux ignores the zero ghost density\n";
            return 1;
        }
        face.kind = FaceKind::Wall;
        if (faceFlux(face, 3.0, 1.0, 10.0) != 0.0) {
            std::cerr << "Walls carry no flux\n";
            return 1;
        }
    }

    // The rate of a uniform field under constant coefficients vanishes on a periodic ring.
    {
        Config1D config{};
        config.drift = [](double) { return 0.7; };
        config.diffusion = [](double) { return 0.3; };
        config.xMin = 0.0;
        config.xMax = 2.0;
        config.nx = 16;
        config.boundary = BoundaryKind::Periodic;
        FokkerPlanck1D engine(config);
        std::vector<double> uniform(16, 0.5);
        std::vector<double> rate;
        engine.computeRate(uniform, rate);
        for (const double r : rate) {
            if (std::abs(r) > 1e-12) {
                std::cerr << "Uniform periodic field should be stationary, rate " << r << '\n';
                return 1;
            }
        }
    }

    // Reflecting walls: the rate integrates to zero for any field; absorbing edges only drain.
    {
        Config1D config{};
        config.drift = [](double x) { return std::sin(3.0 * x); };
        config.diffusion = [](double x) { return 0.1 + 0.05 * x * x; };
        config.xMin = -2.0;
        config.xMax = 2.0;
        config.nx = 25;
        std::vector<double> field(25);
        for (std::size_t i = 0; i < field.size(); ++i) {
            field[i] = 1.0 + 0.5 * std::cos(static_cast<double>(i));
        }
        std::vector<double> rate;

        FokkerPlanck1D reflecting(config);
        reflecting.computeRate(field, rate);
        const double netReflecting = std::accumulate(rate.begin(), rate.end(), 0.0);
        if (std::abs(netReflecting) > 1e-12) {
            std::cerr << "Reflecting rate sums to " << netReflecting << '\n';
            return 1;
        }

        config.boundary = BoundaryKind::Absorbing;
        config.drift = [](double) { return 0.0; };
        FokkerPlanck1D absorbing(config);
        absorbing.computeRate(field, rate);
        const double netAbsorbing = std::accumulate(rate.begin(), rate.end(), 0.0);
        if (!(netAbsorbing < 0.0)) {
            std::cerr << "Absorbing edges should drain a positive field, net rate " << netAbsorbing << '\n';
            return 1;
        }
    }

    // 2D periodic ring: a field varying only in x has no y flux, and a uniform field is stationary.
    {
        Config2D config{};
        config.driftX = [](double, double) { return 1.0; };
        config.driftY = [](double, double) { return -0.4; };
        config.diffusionX = [](double, double) { return 0.2; };
        config.diffusionY = [](double, double) { return 0.1; };
        config.xMin = 0.0;
        config.xMax = 1.0;
        config.yMin = 0.0;
        config.yMax = 1.0;
        config.nx = 8;
        config.ny = 6;
        config.setBoundary(BoundaryKind::Periodic);
        FokkerPlanck2D engine(config);
        const Grid2D& grid = engine.grid();
        if (grid.size() != 48 || grid.idx(3, 2) != 19) {
            std::cerr << "Grid2D indexing wrong\n";
            return 1;
        }
        std::vector<double> uniform(grid.size(), 2.0);
        std::vector<double> rate;
        engine.computeRate(uniform, rate);
        for (const double r : rate) {
            if (std::abs(r) > 1e-12) {
                std::cerr << "Uniform 2D periodic field should be stationary, rate " << r << '\n';
                return 1;
            }
        }
        bool threw = false;
        try {
            engine.computeRate(std::vector<double>(3, 1.0), rate);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "computeRate accepted a field of the wrong size\n";
            return 1;
        }
    }

    std::cout << "Face stencils and rates verified\n";
    return 0;
}
