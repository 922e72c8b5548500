// filename: types.cpp
// part of Fokker-Planck FVM Simulator
// MIT License

#include "fpsim/types.hpp"

namespace fpsim {

BoundaryKind parseBoundaryKind(const std::string& value) {
    if (value == "reflecting") {
        return BoundaryKind::Reflecting;
    }
    if (value == "absorbing") {
        return BoundaryKind::Absorbing;
    }
    if (value == "periodic") {
        return BoundaryKind::Periodic;
    }
    throw ConfigurationError("Unsupported boundary type: " + value);
}

const char* toString(BoundaryKind kind) {
    switch (kind) {
        case BoundaryKind::Reflecting:
            return "reflecting";
        case BoundaryKind::Absorbing:
            return "absorbing";
        case BoundaryKind::Periodic:
            return "periodic";
    }
    return "unknown";
}

DiffusionForm parseDiffusionForm(const std::string& value) {
    if (value == "fickian") {
        return DiffusionForm::Fickian;
    }
    if (value == "ito") {
        return DiffusionForm::Ito;
    }
    throw ConfigurationError("Unsupported diffusion form: " + value);
}

const char* toString(DiffusionForm form) {
    switch (form) {
        case DiffusionForm::Fickian:
            return "fickian";
        case DiffusionForm::Ito:
            return "ito";
    }
    return "unknown";
}

}  // namespace fpsim
