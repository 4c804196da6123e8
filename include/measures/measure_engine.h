#pragma once

#include "grid/grid.h"
#include "grid/quantizer.h"
#include "grid/trajectory.h"
#include "measures/grid_measures.h"

#include <vector>

namespace ssg::measures {

// Reduce already quantized trajectories to one GridMeasures record.
// `total_cells` is the cell count of the grid they were quantized on.
// Sequential fold; call after the per-trajectory stage has completed.
// Throws ComputeError when `trajectories` is empty.
GridMeasures computeMeasures(std::vector<QuantizedTrajectory const*> const& trajectories,
                             size_t total_cells);

// Measures of every member of `grid`, evaluated together
GridMeasures getMeasures(Grid& grid);

// One record per member of `grid`, each against the grid's cell count
std::vector<GridMeasures> getMeasuresPerTrajectory(Grid& grid);

// Quantize `trajectories` together (explicit `config` fields override the
// inferred ones) and measure them as one group
GridMeasures getMeasures(std::vector<Trajectory> const& trajectories,
                         QuantizationConfig const& config = {},
                         int thread_count = 1);

// Shannon entropy (natural log) of a visit-count distribution; zero counts
// are skipped. UNDEFINED when the counts sum to zero.
double visitEntropy(std::map<Cell, size_t> const& visits);

} // namespace ssg::measures
