#include "config.h"
#include "enum_utils.h"
#include "grid/grid.h"
#include "id_generator.h"
#include "measures/measure_engine.h"
#include "measures/measures_table.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

void printUsage(char const* program) {
    std::cout << "State Space Grid Measures\n\n"
              << "Quantize trajectories onto a shared grid and compute dwell-state measures.\n\n"
              << "Usage:\n"
              << "  " << program << " <analysis.toml> [options]\n\n"
              << "Options:\n"
              << "  --output <path>        Write measures to path (default: stdout)\n"
              << "  --format <" << enum_utils::choices<ssg::OutputFormat>()
              << ">    Measures format (default: csv)\n"
              << "  --per-trajectory       One row per trajectory instead of one per grid\n"
              << "  --threads <N>          Worker threads (0 = hardware concurrency)\n"
              << "  --set <key=value>      Override a config parameter (repeatable)\n"
              << "  --save-config <path>   Save the config with the resolved quantization\n"
              << "  --states               Print the merged states of every trajectory\n"
              << "  -h, --help             Show this help\n\n"
              << "Examples:\n"
              << "  " << program << " analysis.toml\n"
              << "  " << program << " analysis.toml --per-trajectory --output measures.csv\n"
              << "  " << program << " analysis.toml --set grid.x.cell_size=2 --format json\n";
}

struct Options {
    fs::path config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    fs::path save_config_path;
};

bool parseArgs(int argc, char* argv[], Options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        } else if (arg == "--output" && i + 1 < argc) {
            opts.overrides.emplace_back("output.path", argv[++i]);
        } else if (arg == "--format" && i + 1 < argc) {
            opts.overrides.emplace_back("output.format", argv[++i]);
        } else if (arg == "--per-trajectory") {
            opts.overrides.emplace_back("output.per_trajectory", "true");
        } else if (arg == "--states") {
            opts.overrides.emplace_back("output.states", "true");
        } else if (arg == "--threads" && i + 1 < argc) {
            opts.overrides.emplace_back("grid.threads", argv[++i]);
        } else if (arg == "--set" && i + 1 < argc) {
            std::string kv = argv[++i];
            auto eq_pos = kv.find('=');
            if (eq_pos == std::string::npos) {
                std::cerr << "Invalid --set (expected key=value): " << kv << "\n";
                return false;
            }
            opts.overrides.emplace_back(kv.substr(0, eq_pos), kv.substr(eq_pos + 1));
        } else if (arg == "--save-config" && i + 1 < argc) {
            opts.save_config_path = argv[++i];
        } else if (arg[0] != '-' && opts.config_path.empty()) {
            opts.config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    if (opts.config_path.empty()) {
        std::cerr << "Error: No analysis file specified\n";
        return false;
    }

    return true;
}

void printAxis(char const* name, ssg::AxisQuantizer const& axis) {
    std::cout << "  " << name << ": " << enum_utils::toString(axis.scale()) << ", "
              << axis.cellCount() << " cells [" << axis.min() << ", " << axis.max()
              << "] by " << axis.cellSize() << "\n";
}

void printStates(ssg::Grid& grid) {
    std::cout << "\nStates:\n";
    for (auto const& trajectory : grid.quantizedTrajectories()) {
        std::cout << "  " << trajectory.id() << " (" << trajectory.numVisits() << " visits, "
                  << trajectory.cellRange() << " cells)\n";
        for (auto const& state : trajectory.states()) {
            std::cout << "    (" << state.cell.x << ", " << state.cell.y << ")"
                      << " [" << state.start << ", " << state.end << ")"
                      << " duration=" << state.duration << " events=" << state.event_count
                      << "\n";
        }
    }
}

int run(Options const& opts) {
    ssg::Config config = ssg::Config::load(opts.config_path.string());
    for (auto const& [key, value] : opts.overrides) {
        if (!config.applyOverride(key, value)) {
            return 1;
        }
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    ssg::IdGenerator ids;
    ssg::Grid grid(config.grid.quantization, config.grid.thread_count);
    grid.addTrajectories(config.buildTrajectories(ids));
    grid.resolve();

    std::vector<ssg::measures::GridMeasures> rows;
    if (config.output.per_trajectory) {
        rows = ssg::measures::getMeasuresPerTrajectory(grid);
    } else {
        rows.push_back(ssg::measures::getMeasures(grid));
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    bool const json = config.output.format == ssg::OutputFormat::Json;
    if (config.output.path.empty()) {
        // Measures are the only stdout output unless states were requested
        if (json) {
            ssg::measures::writeJSON(std::cout, rows);
        } else {
            ssg::measures::writeCSV(std::cout, rows);
        }
    } else {
        std::cout << "Grid: " << grid.size() << " trajectories, " << grid.totalCells()
                  << " cells (" << grid.totals().visitedCells() << " visited)\n";
        printAxis("x", grid.quantizer().x());
        printAxis("y", grid.quantizer().y());
        if (auto combined = grid.combinedDispersion()) {
            std::cout << "  Combined dispersion: " << std::fixed << std::setprecision(4)
                      << *combined << std::defaultfloat << std::setprecision(6) << "\n";
        }
        std::cout << "  Processing time: " << duration_ms << " ms\n";

        ssg::measures::exportMeasures(config.output.path, rows, json);
        std::cout << "\nMeasures saved to: " << config.output.path << "\n";
    }

    if (config.output.include_states) {
        printStates(grid);
    }

    if (!opts.save_config_path.empty()) {
        ssg::Config resolved = config;
        resolved.grid.quantization = grid.quantizer().toConfig();
        resolved.save(opts.save_config_path.string());
        std::cerr << "Config saved to: " << opts.save_config_path << "\n";
    }

    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;

    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    if (!fs::exists(opts.config_path)) {
        std::cerr << "Error: Analysis file not found: " << opts.config_path << "\n";
        return 1;
    }

    try {
        return run(opts);
    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
