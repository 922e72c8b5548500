#include "fpsim/io_vtk.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fpsim {
namespace {

bool isLittleEndian() {
    const std::uint16_t value = 1;
    return reinterpret_cast<const std::uint8_t*>(&value)[0] == 1;
}

std::string frameFileName(const std::string& basename, std::size_t index, std::size_t count) {
    std::size_t digits = 4;
    for (std::size_t limit = 10000; limit <= count; limit *= 10) {
        ++digits;
    }
    std::ostringstream name;
    name << basename << '_' << std::setfill('0') << std::setw(static_cast<int>(digits)) << index << ".vti";
    return name.str();
}

std::filesystem::path prepareDirectory(const std::string& directory) {
    const std::filesystem::path dir(directory);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create VTK output directory " + directory + ": " + ec.message());
    }
    return dir;
}

}  // namespace

void write_vti_cell_field(const std::string& path,
                          std::size_t nx,
                          std::size_t ny,
                          double originX,
                          double originY,
                          double dx,
                          double dy,
                          const std::string& name,
                          const std::vector<double>& values) {
    if (nx == 0 || ny == 0) {
        throw std::invalid_argument("VTK export requires a non-empty grid");
    }
    if (values.size() != nx * ny) {
        throw std::invalid_argument("VTK export requires nx * ny cell values");
    }

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open VTK output: " + path);
    }
    ofs.precision(std::numeric_limits<double>::max_digits10);

    const bool littleEndian = isLittleEndian();
    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"ImageData\" version=\"0.1\" byte_order=\""
        << (littleEndian ? "LittleEndian" : "BigEndian") << "\" header_type=\"UInt64\">\n";
    ofs << "  <ImageData WholeExtent=\"0 " << nx << " 0 " << ny << " 0 0\""
        << " Origin=\"" << originX << ' ' << originY << " 0\""
        << " Spacing=\"" << dx << ' ' << dy << " 1\">\n";
    ofs << "    <Piece Extent=\"0 " << nx << " 0 " << ny << " 0 0\">\n";
    ofs << "      <CellData Scalars=\"" << name << "\">\n";
    ofs << "        <DataArray type=\"Float64\" Name=\"" << name << "\" format=\"appended\" offset=\"0\"/>\n";
    ofs << "      </CellData>\n";
    ofs << "    </Piece>\n";
    ofs << "  </ImageData>\n";
    ofs << "  <AppendedData encoding=\"raw\">\n";
    ofs << '_';

    const std::uint64_t bytes = static_cast<std::uint64_t>(values.size()) * sizeof(double);
    ofs.write(reinterpret_cast<const char*>(&bytes), sizeof(bytes));
    ofs.write(reinterpret_cast<const char*>(values.data()), static_cast<std::streamsize>(bytes));

    ofs << "\n";
    ofs << "  </AppendedData>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing VTK output: " + path);
    }
}

void write_pvd_series(const std::string& path, const std::vector<PvdDataSet>& datasets) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open PVD output: " + path);
    }
    ofs.precision(std::numeric_limits<double>::max_digits10);

    ofs << "<?xml version=\"1.0\"?>\n";
    ofs << "<VTKFile type=\"Collection\" version=\"0.1\">\n";
    ofs << "  <Collection>\n";
    for (const auto& dataset : datasets) {
        ofs << "    <DataSet timestep=\"" << dataset.time << "\" group=\"\" part=\"0\" file=\"" << dataset.file
            << "\"/>\n";
    }
    ofs << "  </Collection>\n";
    ofs << "</VTKFile>\n";
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed while writing PVD output: " + path);
    }
}

std::string write_vtk_series(const std::string& directory, const std::string& basename,
                             const SnapshotSeries1D& series) {
    const std::filesystem::path dir = prepareDirectory(directory);
    const Grid1D& grid = series.grid;

    std::vector<PvdDataSet> datasets;
    datasets.reserve(series.snapshots.size());
    for (std::size_t k = 0; k < series.snapshots.size(); ++k) {
        const Snapshot1D& snap = series.snapshots[k];
        const std::string file = frameFileName(basename, k, series.snapshots.size());
        write_vti_cell_field((dir / file).string(), grid.nx, 1, grid.xMin, 0.0, grid.dx, grid.dx, "density",
                             snap.density);
        datasets.push_back({snap.time, file});
    }

    const std::filesystem::path pvdPath = dir / (basename + ".pvd");
    write_pvd_series(pvdPath.string(), datasets);
    return pvdPath.string();
}

std::string write_vtk_series(const std::string& directory, const std::string& basename,
                             const SnapshotSeries2D& series) {
    const std::filesystem::path dir = prepareDirectory(directory);
    const Grid2D& grid = series.grid;

    std::vector<PvdDataSet> datasets;
    datasets.reserve(series.snapshots.size());
    for (std::size_t k = 0; k < series.snapshots.size(); ++k) {
        const Snapshot2D& snap = series.snapshots[k];
        const std::string file = frameFileName(basename, k, series.snapshots.size());
        write_vti_cell_field((dir / file).string(), grid.nx, grid.ny, grid.xMin, grid.yMin, grid.dx, grid.dy,
                             "density", snap.density);
        datasets.push_back({snap.time, file});
    }

    const std::filesystem::path pvdPath = dir / (basename + ".pvd");
    write_pvd_series(pvdPath.string(), datasets);
    return pvdPath.string();
}

}  // namespace fpsim
