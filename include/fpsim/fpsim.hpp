// filename: fpsim.hpp
// part of Fokker-Planck FVM Simulator
// MIT License

#pragma once

#include "grid.hpp"
#include "flux.hpp"
#include "stability.hpp"
#include "solver.hpp"
#include "ingest.hpp"
#include "io_csv.hpp"
#include "io_vtk.hpp"
#include "render.hpp"
#include "types.hpp"
