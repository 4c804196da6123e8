#include <gtest/gtest.h>

#include "errors.h"
#include "grid/grid.h"
#include "measures/measure_engine.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace ssg;
using namespace ssg::measures;

namespace {

std::vector<AxisValue> labels(std::vector<std::string> const& values) {
    return std::vector<AxisValue>(values.begin(), values.end());
}

QuantizationConfig ratingGrid() {
    QuantizationConfig config;
    config.x.order = labels({"bad", "ok", "good"});
    config.y.order = labels({"bad", "ok", "good"});
    return config;
}

// Three events, one per diagonal cell
Trajectory diagonal() {
    return Trajectory(labels({"bad", "ok", "good"}), labels({"bad", "ok", "good"}),
                      {1.0, 1.1, 1.5, 2.0}, "diagonal");
}

// Five events, four visits, three cells
Trajectory corners() {
    return Trajectory(labels({"bad", "ok", "ok", "good", "bad"}),
                      labels({"good", "ok", "ok", "bad", "good"}),
                      {0.0, 0.9, 1.0, 1.5, 1.7, 2.0}, "corners");
}

Trajectory numeric(std::vector<double> const& x, std::vector<double> const& y,
                   std::vector<double> t, std::string id) {
    return Trajectory::numeric(x, y, std::move(t), std::move(id));
}

} // namespace

TEST(MeasureEngineTest, NoTrajectoriesFails) {
    EXPECT_THROW(computeMeasures({}, 4), ComputeError);
    EXPECT_THROW(getMeasures(std::vector<Trajectory>{}), ComputeError);

    Grid grid;
    EXPECT_THROW(getMeasures(grid), ComputeError);
    EXPECT_THROW(getMeasuresPerTrajectory(grid), ComputeError);
}

TEST(MeasureEngineTest, SingleTrajectoryOnCategoricalGrid) {
    auto m = getMeasures({diagonal()}, ratingGrid());

    EXPECT_EQ(m.trajectory_ids, std::vector<std::string>{"diagonal"});
    EXPECT_TRUE(m.undefined_dispersion_ids.empty());
    EXPECT_EQ(m.trajectory_count, 1.0);
    EXPECT_EQ(m.mean_cell_range, 3.0);
    EXPECT_EQ(m.overall_cell_range, 3.0);
    EXPECT_EQ(m.mean_number_of_events, 3.0);
    EXPECT_EQ(m.mean_number_of_visits, 3.0);
    EXPECT_DOUBLE_EQ(m.mean_duration, 1.0);
    EXPECT_DOUBLE_EQ(m.mean_duration_per_event, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.mean_duration_per_visit, 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.mean_duration_per_cell, 1.0 / 3.0);
    EXPECT_NEAR(m.dispersion, 0.6525, 1e-9);
    EXPECT_NEAR(m.visited_entropy, std::log(3.0), 1e-12);
}

TEST(MeasureEngineTest, RevisitingTrajectory) {
    auto m = getMeasures({corners()}, ratingGrid());

    EXPECT_EQ(m.mean_cell_range, 3.0);
    EXPECT_EQ(m.mean_number_of_events, 5.0);
    EXPECT_EQ(m.mean_number_of_visits, 4.0);
    EXPECT_DOUBLE_EQ(m.mean_duration, 2.0);
    EXPECT_DOUBLE_EQ(m.mean_duration_per_event, 0.4);
    EXPECT_DOUBLE_EQ(m.mean_duration_per_visit, 0.5);
    EXPECT_DOUBLE_EQ(m.mean_duration_per_cell, 2.0 / 3.0);
    EXPECT_NEAR(m.dispersion, 0.6075, 1e-9);
}

TEST(MeasureEngineTest, TwoTrajectoriesTogether) {
    auto m = getMeasures({diagonal(), corners()}, ratingGrid());

    EXPECT_EQ(m.trajectory_ids, (std::vector<std::string>{"diagonal", "corners"}));
    EXPECT_EQ(m.trajectory_count, 2.0);
    EXPECT_EQ(m.mean_cell_range, 3.0);
    EXPECT_EQ(m.overall_cell_range, 5.0);
    EXPECT_EQ(m.mean_number_of_events, 4.0);
    EXPECT_EQ(m.mean_number_of_visits, 3.5);
    EXPECT_DOUBLE_EQ(m.mean_duration, 1.5);
    EXPECT_NEAR(m.mean_duration_per_event, 0.3666666666666, 1e-9);
    EXPECT_NEAR(m.mean_duration_per_visit, 0.4166666666666, 1e-9);
    EXPECT_NEAR(m.mean_duration_per_cell, 0.5, 1e-12);
    EXPECT_NEAR(m.dispersion, 0.63, 1e-9);

    // Combined visits: 1 + 2 + 1 on the diagonal, 2 + 1 in the corners
    double expected_entropy = 0.0;
    for (double count : {1.0, 2.0, 1.0, 2.0, 1.0}) {
        double p = count / 7.0;
        expected_entropy -= p * std::log(p);
    }
    EXPECT_NEAR(m.visited_entropy, expected_entropy, 1e-12);
}

TEST(MeasureEngineTest, IdenticalCopiesGiveExactMeans) {
    auto single = getMeasures({corners()}, ratingGrid());

    std::vector<Trajectory> copies;
    for (int i = 0; i < 7; ++i) {
        Trajectory t = corners();
        copies.emplace_back(t.xValues(), t.yValues(), t.timestamps(), "copy" + std::to_string(i));
    }
    auto group = getMeasures(copies, ratingGrid());

    EXPECT_EQ(group.trajectory_count, 7.0);
    auto const& names = GridMeasures::fieldNames();
    auto const a = single.values();
    auto const b = group.values();
    for (size_t i = 1; i < GridMeasures::FIELD_COUNT; ++i) {
        EXPECT_EQ(a[i], b[i]) << names[i];
    }
}

TEST(MeasureEngineTest, OverallCellRangeIsPartitionIndependent) {
    std::vector<Trajectory> all = {
        numeric({0, 1, 2}, {0, 0, 0}, {0, 1, 2, 3}, "a"),
        numeric({2, 3}, {0, 1}, {0, 1, 2}, "b"),
        numeric({0, 0, 4}, {1, 1, 1}, {0, 1, 2, 3}, "c"),
        numeric({3}, {1}, {0, 5}, "d"),
    };
    QuantizationConfig config;
    config.x.min = 0.0;
    config.x.max = 4.0;
    config.y.min = 0.0;
    config.y.max = 1.0;

    auto together = getMeasures(all, config);

    std::vector<std::vector<size_t>> partitions = {{0, 1}, {0, 2}, {1, 3}, {0, 1, 2}};
    for (auto const& part : partitions) {
        std::vector<Trajectory> left;
        std::vector<Trajectory> right;
        for (size_t i = 0; i < all.size(); ++i) {
            bool in_left = std::find(part.begin(), part.end(), i) != part.end();
            (in_left ? left : right).push_back(all[i]);
        }

        Grid left_grid(config);
        left_grid.addTrajectories(left);
        Grid right_grid(config);
        right_grid.addTrajectories(right);

        std::set<Cell> cells = left_grid.visitedCells();
        auto right_cells = right_grid.visitedCells();
        cells.insert(right_cells.begin(), right_cells.end());
        EXPECT_EQ(together.overall_cell_range, static_cast<double>(cells.size()));
    }
}

TEST(MeasureEngineTest, UndefinedDispersionIsFlaggedAndExcluded) {
    // Single-cell grid: every dispersion is undefined
    auto single_cell = getMeasures({numeric({1, 1}, {1, 1}, {0, 1, 2}, "a"),
                                    numeric({1}, {1}, {0, 3}, "b")});
    EXPECT_TRUE(isUndefined(single_cell.dispersion));
    EXPECT_EQ(single_cell.undefined_dispersion_ids, (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(isUndefined(single_cell.mean_duration));

    // Zero-duration member is skipped, the other one is kept
    auto mixed = getMeasures({numeric({0, 1}, {0, 0}, {0, 1, 2}, "spread"),
                              numeric({0}, {0}, {4, 4}, "instant")});
    EXPECT_EQ(mixed.undefined_dispersion_ids, std::vector<std::string>{"instant"});
    EXPECT_DOUBLE_EQ(mixed.dispersion, 1.0);
}

TEST(MeasureEngineTest, PerTrajectoryRowsShareGridCellCount) {
    Grid grid(ratingGrid());
    grid.addTrajectory(diagonal());
    grid.addTrajectory(corners());

    auto rows = getMeasuresPerTrajectory(grid);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].trajectory_ids, std::vector<std::string>{"diagonal"});
    EXPECT_EQ(rows[1].trajectory_ids, std::vector<std::string>{"corners"});
    EXPECT_EQ(rows[0].trajectory_count, 1.0);
    EXPECT_NEAR(rows[0].dispersion, 0.6525, 1e-9);
    EXPECT_NEAR(rows[1].dispersion, 0.6075, 1e-9);
    EXPECT_EQ(rows[1].mean_number_of_visits, 4.0);
}

TEST(VisitEntropyTest, UniformAndEmptyDistributions) {
    std::map<Cell, size_t> uniform = {{{0, 0}, 2}, {{0, 1}, 2}, {{1, 0}, 2}, {{1, 1}, 2}};
    EXPECT_NEAR(visitEntropy(uniform), std::log(4.0), 1e-12);

    std::map<Cell, size_t> single = {{{3, 3}, 9}};
    EXPECT_EQ(visitEntropy(single), 0.0);

    EXPECT_TRUE(isUndefined(visitEntropy({})));
}
