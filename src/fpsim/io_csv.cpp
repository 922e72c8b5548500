// filename: io_csv.cpp
// part of Fokker-Planck FVM Simulator
// MIT License

#include "fpsim/io_csv.hpp"

#include "fpsim/stability.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace fpsim {
namespace {

std::ofstream openCsv(const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }
    ofs.precision(std::numeric_limits<double>::max_digits10);
    return ofs;
}

void finishCsv(std::ofstream& ofs, const std::string& path) {
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing CSV output: " + path);
    }
}

}  // namespace

void write_csv_series(const std::string& path, const SnapshotSeries1D& series) {
    for (const auto& snap : series.snapshots) {
        if (snap.density.size() != series.x.size()) {
            throw std::invalid_argument("write_csv_series: snapshot size does not match grid");
        }
    }

    std::ofstream ofs = openCsv(path);
    ofs << "time,x,density\n";
    for (const auto& snap : series.snapshots) {
        for (std::size_t i = 0; i < series.x.size(); ++i) {
            ofs << snap.time << ',' << series.x[i] << ',' << snap.density[i] << '\n';
        }
    }
    finishCsv(ofs, path);
}

void write_csv_series(const std::string& path, const SnapshotSeries2D& series) {
    const Grid2D& grid = series.grid;
    for (const auto& snap : series.snapshots) {
        if (snap.density.size() != grid.size()) {
            throw std::invalid_argument("write_csv_series: snapshot size does not match grid");
        }
    }

    std::ofstream ofs = openCsv(path);
    ofs << "time,x,y,density\n";
    for (const auto& snap : series.snapshots) {
        for (std::size_t j = 0; j < grid.ny; ++j) {
            for (std::size_t i = 0; i < grid.nx; ++i) {
                ofs << snap.time << ',' << grid.centerX(i) << ',' << grid.centerY(j) << ','
                    << snap.density[grid.idx(i, j)] << '\n';
            }
        }
    }
    finishCsv(ofs, path);
}

void write_csv_mass_history(const std::string& path,
                            const std::vector<double>& times,
                            const std::vector<double>& masses) {
    if (times.size() != masses.size()) {
        throw std::invalid_argument("write_csv_mass_history: mismatched vector sizes");
    }

    std::ofstream ofs = openCsv(path);
    ofs << "time,mass\n";
    for (std::size_t k = 0; k < times.size(); ++k) {
        ofs << times[k] << ',' << masses[k] << '\n';
    }
    finishCsv(ofs, path);
}

void write_csv_marginals(const std::string& path, const SnapshotSeries2D& series) {
    const Grid2D& grid = series.grid;
    std::ofstream ofs = openCsv(path);
    ofs << "time,axis,coordinate,density\n";
    for (const auto& snap : series.snapshots) {
        const std::vector<double> px = marginalX(grid, snap.density);
        const std::vector<double> py = marginalY(grid, snap.density);
        for (std::size_t i = 0; i < px.size(); ++i) {
            ofs << snap.time << ",x," << grid.centerX(i) << ',' << px[i] << '\n';
        }
        for (std::size_t j = 0; j < py.size(); ++j) {
            ofs << snap.time << ",y," << grid.centerY(j) << ',' << py[j] << '\n';
        }
    }
    finishCsv(ofs, path);
}

}  // namespace fpsim
