#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "fpsim/solver.hpp"

namespace fpsim {

// Writes a VTK ImageData (.vti) file holding one cell-centred scalar array.
// values must contain nx * ny samples laid out row-major with x fastest.
void write_vti_cell_field(const std::string& path,
                          std::size_t nx,
                          std::size_t ny,
                          double originX,
                          double originY,
                          double dx,
                          double dy,
                          const std::string& name,
                          const std::vector<double>& values);

struct PvdDataSet {
    double time{0.0};
    std::string file;
};

// ParaView collection indexing one dataset per timestep. File entries are written as given,
// so callers pass paths relative to the .pvd location.
void write_pvd_series(const std::string& path, const std::vector<PvdDataSet>& datasets);

// Writes <directory>/<basename>_NNNN.vti for every snapshot plus <directory>/<basename>.pvd.
// 1D series are stored as an nx x 1 image. Returns the path of the .pvd file.
std::string write_vtk_series(const std::string& directory, const std::string& basename,
                             const SnapshotSeries1D& series);

std::string write_vtk_series(const std::string& directory, const std::string& basename,
                             const SnapshotSeries2D& series);

}  // namespace fpsim
