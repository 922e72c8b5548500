#include "fpsim/flux.hpp"

#include <stdexcept>

namespace fpsim {

FaceKind classifyFace(std::size_t f, std::size_t cells, BoundaryKind boundary, std::size_t& left,
                      std::size_t& right) {
    if (cells < 2) {
        throw std::invalid_argument("classifyFace: axis needs at least two cells");
    }
    if (f >= faceCount(cells, boundary)) {
        throw std::out_of_range("classifyFace: face index out of range");
    }

    if (boundary == BoundaryKind::Periodic) {
        left = f == 0 ? cells - 1 : f - 1;
        right = f;
        return FaceKind::Interior;
    }

    if (f == 0) {
        left = 0;
        right = 0;
        return boundary == BoundaryKind::Reflecting ? FaceKind::Wall : FaceKind::GhostLeft;
    }
    if (f == cells) {
        left = cells - 1;
        right = cells - 1;
        return boundary == BoundaryKind::Reflecting ? FaceKind::Wall : FaceKind::GhostRight;
    }
    left = f - 1;
    right = f;
    return FaceKind::Interior;
}

}  // namespace fpsim
