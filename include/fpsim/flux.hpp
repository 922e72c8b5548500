// filename: flux.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include <cstddef>

#include "fpsim/types.hpp"

namespace fpsim {

/**
 * @brief Role of a face along one axis once the boundary policy has been resolved.
 *
 * Interior faces (periodic wrap faces included) sit between two real cells. Wall faces carry
 * no flux. GhostLeft / GhostRight faces have a zero-density ghost cell on that side.
 */
enum class FaceKind { Interior, Wall, GhostLeft, GhostRight };

/**
 * @brief Precomputed stencil and coefficients of a single face.
 *
 * The flux through the face (positive towards increasing index) is
 *   F = drift * p_upwind - (diffRight * p_right - diffLeft * p_left) / spacing
 * where diffLeft == diffRight == D(face) for the Fickian form and the cell-centre values of D
 * for the Ito form.
 */
struct FaceStencil {
    std::size_t left{0};
    std::size_t right{0};
    FaceKind kind{FaceKind::Interior};
    double drift{0.0};
    double diffLeft{0.0};
    double diffRight{0.0};
};

/**
 * @brief Number of distinct faces along an axis with `cells` cells.
 *
 * Periodic axes share the first and last face, so they have one face per cell.
 */
[[nodiscard]] inline std::size_t faceCount(std::size_t cells, BoundaryKind boundary) {
    return boundary == BoundaryKind::Periodic ? cells : cells + 1;
}

/**
 * @brief Resolve face f (0 <= f < faceCount) into neighbour cell indices along an axis.
 *
 * Ghost sides report the adjacent real cell index so coefficient lookups stay in range.
 */
FaceKind classifyFace(std::size_t f, std::size_t cells, BoundaryKind boundary, std::size_t& left,
                      std::size_t& right);

[[nodiscard]] inline double faceFlux(const FaceStencil& s, double pLeft, double pRight, double invSpacing) {
    switch (s.kind) {
        case FaceKind::Wall:
            return 0.0;
        case FaceKind::GhostLeft:
            pLeft = 0.0;
            break;
        case FaceKind::GhostRight:
            pRight = 0.0;
            break;
        case FaceKind::Interior:
            break;
    }
    const double upwind = s.drift > 0.0 ? pLeft : pRight;
    return s.drift * upwind - (s.diffRight * pRight - s.diffLeft * pLeft) * invSpacing;
}

}  // namespace fpsim
