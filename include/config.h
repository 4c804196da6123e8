#pragma once

#include "grid/quantizer.h"
#include "grid/trajectory.h"
#include "id_generator.h"

#include <string>
#include <string_view>
#include <vector>

namespace ssg {

// Measures export format
enum class OutputFormat {
    Csv, // One header row plus one row per record
    Json // Array of records, undefined measures as null
};

struct GridParams {
    int thread_count = 1; // 0 = hardware concurrency
    QuantizationConfig quantization;
};

struct OutputParams {
    OutputFormat format = OutputFormat::Csv;
    std::string path;             // Empty = print to stdout
    bool per_trajectory = false;  // One row per trajectory instead of one per grid
    bool include_states = false;  // Also print merged states
};

// Trajectory as written in an analysis file. The id may be empty, in which
// case one is generated when the trajectories are built.
struct TrajectoryInput {
    std::string id;
    std::vector<AxisValue> x;
    std::vector<AxisValue> y;
    std::vector<double> t;
};

// Analysis file: quantization, output settings and inline trajectories.
//
// Layout:
//   include = ["base.toml"]        # loaded first, overridden by this file
//   [grid]          threads
//   [grid.x] [grid.y]  order, min, max, cell_size
//   [output]        format, path, per_trajectory, states
//   [[trajectories]] id, x, y, t
struct Config {
    GridParams grid;
    OutputParams output;
    std::vector<TrajectoryInput> trajectories;

    // Load from file. A missing file warns and yields defaults; a malformed
    // file or malformed values raise ConfigError.
    static Config load(std::string const& path);

    // Parse TOML text. Includes are resolved relative to `base_path`.
    static Config parse(std::string_view toml_text, std::string const& base_path = ".");

    static Config defaults();

    // Write the settings and trajectories back as TOML.
    // Throws std::runtime_error if the file cannot be opened.
    void save(std::string const& path) const;

    // Apply a "section.key" = value override (e.g. "grid.x.cell_size", "2").
    // Returns false for an unknown key or a value that does not parse.
    bool applyOverride(std::string const& key, std::string const& value);

    // Validate and build every trajectory; unnamed ones get ids from `ids`.
    // Throws ValidationError on malformed trajectory data.
    std::vector<Trajectory> buildTrajectories(IdGenerator& ids) const;
};

} // namespace ssg
