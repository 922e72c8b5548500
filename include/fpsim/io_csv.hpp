// filename: io_csv.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include <string>
#include <vector>

#include "fpsim/solver.hpp"

namespace fpsim {

// Long format: one row per (snapshot, cell) with columns time,x,density.
void write_csv_series(const std::string& path, const SnapshotSeries1D& series);

// Long format: one row per (snapshot, cell) with columns time,x,y,density.
void write_csv_series(const std::string& path, const SnapshotSeries2D& series);

void write_csv_mass_history(const std::string& path,
                            const std::vector<double>& times,
                            const std::vector<double>& masses);

// Marginal densities of every snapshot: columns time,axis,coordinate,density.
void write_csv_marginals(const std::string& path, const SnapshotSeries2D& series);

}  // namespace fpsim
