#include "measures/measure_engine.h"

#include "errors.h"
#include "measures/measure_series.h"

#include <cmath>

namespace ssg::measures {

namespace {

void requireTrajectories(size_t count) {
    if (count == 0) {
        throw ComputeError("Measures require at least one trajectory");
    }
}

} // namespace

double visitEntropy(std::map<Cell, size_t> const& visits) {
    size_t total = 0;
    for (auto const& [cell, count] : visits) {
        total += count;
    }
    if (total == 0) {
        return UNDEFINED;
    }

    double entropy = 0.0;
    for (auto const& [cell, count] : visits) {
        if (count == 0) {
            continue;
        }
        double p = static_cast<double>(count) / static_cast<double>(total);
        entropy -= p * std::log(p);
    }
    return entropy;
}

GridMeasures computeMeasures(std::vector<QuantizedTrajectory const*> const& trajectories,
                             size_t total_cells) {
    requireTrajectories(trajectories.size());

    MeasureSeries<double> durations;
    MeasureSeries<double> events;
    MeasureSeries<double> visits;
    MeasureSeries<double> cell_ranges;
    MeasureSeries<double> per_event;
    MeasureSeries<double> per_visit;
    MeasureSeries<double> per_cell;
    MeasureSeries<double> dispersions;

    GridMeasures result;
    CellTotals combined;

    for (auto const* trajectory : trajectories) {
        double const duration = trajectory->duration();
        double const n_events = static_cast<double>(trajectory->eventCount());
        double const n_visits = static_cast<double>(trajectory->numVisits());
        double const range = static_cast<double>(trajectory->cellRange());

        durations.push(duration);
        events.push(n_events);
        visits.push(n_visits);
        cell_ranges.push(range);

        // Ratios per trajectory, averaged afterwards
        per_event.push(duration / n_events);
        per_visit.push(duration / n_visits);
        per_cell.push(duration / range);

        if (auto d = trajectory->dispersion(total_cells)) {
            dispersions.push(*d);
        } else {
            result.undefined_dispersion_ids.push_back(trajectory->id());
        }

        combined.add(*trajectory);
        result.trajectory_ids.push_back(trajectory->id());
    }

    result.trajectory_count = static_cast<double>(trajectories.size());
    result.mean_duration = durations.mean();
    result.mean_number_of_events = events.mean();
    result.mean_number_of_visits = visits.mean();
    result.mean_cell_range = cell_ranges.mean();
    result.overall_cell_range = static_cast<double>(combined.visitedCells());
    result.mean_duration_per_event = per_event.mean();
    result.mean_duration_per_visit = per_visit.mean();
    result.mean_duration_per_cell = per_cell.mean();
    result.dispersion = dispersions.empty() ? UNDEFINED : dispersions.mean();
    result.visited_entropy = visitEntropy(combined.visits);

    return result;
}

GridMeasures getMeasures(Grid& grid) {
    requireTrajectories(grid.size());

    std::vector<QuantizedTrajectory const*> members;
    for (auto const& trajectory : grid.quantizedTrajectories()) {
        members.push_back(&trajectory);
    }
    return computeMeasures(members, grid.totalCells());
}

std::vector<GridMeasures> getMeasuresPerTrajectory(Grid& grid) {
    requireTrajectories(grid.size());

    size_t const total_cells = grid.totalCells();
    std::vector<GridMeasures> rows;
    for (auto const& trajectory : grid.quantizedTrajectories()) {
        rows.push_back(computeMeasures({&trajectory}, total_cells));
    }
    return rows;
}

GridMeasures getMeasures(std::vector<Trajectory> const& trajectories,
                         QuantizationConfig const& config,
                         int thread_count) {
    requireTrajectories(trajectories.size());

    Grid grid(config, thread_count);
    grid.addTrajectories(trajectories);
    return getMeasures(grid);
}

} // namespace ssg::measures
