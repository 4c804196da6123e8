#include "config.h"

#include "enum_utils.h"
#include "errors.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <toml++/toml.hpp>

namespace ssg {

namespace {

OutputFormat parseOutputFormat(std::string const& str) {
    if (auto format = enum_utils::fromString<OutputFormat>(str)) {
        return *format;
    }
    std::cerr << "Unknown output format: " << str << " (expected "
              << enum_utils::choices<OutputFormat>() << "), using csv\n";
    return OutputFormat::Csv;
}

// Safe value extraction helpers
template <typename T> T get_or(toml::table const& tbl, std::string_view key, T default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<T>()) {
            return *val;
        }
    }
    return default_val;
}

std::string get_string_or(toml::table const& tbl, std::string_view key, std::string default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<std::string>()) {
            return *val;
        }
    }
    return default_val;
}

// A number or a string, anything else is rejected
AxisValue parseAxisValue(toml::node const& node, std::string const& where) {
    if (node.is_string()) {
        return *node.value<std::string>();
    }
    if (node.is_number()) {
        return *node.value<double>();
    }
    throw ConfigError(where + ": expected a number or a string");
}

toml::array const& requireArray(toml::node const& node, std::string const& where) {
    auto const* arr = node.as_array();
    if (!arr) {
        throw ConfigError(where + ": expected an array");
    }
    return *arr;
}

std::vector<AxisValue> parseAxisValues(toml::node const& node, std::string const& where) {
    std::vector<AxisValue> values;
    for (auto const& elem : requireArray(node, where)) {
        values.push_back(parseAxisValue(elem, where));
    }
    return values;
}

std::vector<double> parseNumbers(toml::node const& node, std::string const& where) {
    std::vector<double> values;
    for (auto const& elem : requireArray(node, where)) {
        if (!elem.is_number()) {
            throw ConfigError(where + ": expected numbers only");
        }
        values.push_back(*elem.value<double>());
    }
    return values;
}

void loadAxis(AxisConfig& axis, toml::table const& tbl, std::string const& prefix) {
    if (auto node = tbl.get("order")) {
        axis.order = parseAxisValues(*node, prefix + ".order");
    }
    if (auto node = tbl.get("min")) {
        axis.min = parseAxisValue(*node, prefix + ".min");
    }
    if (auto node = tbl.get("max")) {
        axis.max = parseAxisValue(*node, prefix + ".max");
    }
    if (auto node = tbl.get("cell_size")) {
        auto size = node->value<double>();
        if (!size) {
            throw ConfigError(prefix + ".cell_size: expected a number");
        }
        axis.cell_size = *size;
    }
}

TrajectoryInput loadTrajectory(toml::table const& tbl, size_t index) {
    std::string const where = "trajectories[" + std::to_string(index) + "]";

    TrajectoryInput input;
    input.id = get_string_or(tbl, "id", "");

    auto const* x = tbl.get("x");
    auto const* y = tbl.get("y");
    auto const* t = tbl.get("t");
    if (!x || !y || !t) {
        throw ConfigError(where + ": x, y and t are required");
    }
    input.x = parseAxisValues(*x, where + ".x");
    input.y = parseAxisValues(*y, where + ".y");
    input.t = parseNumbers(*t, where + ".t");
    return input;
}

// Load config values from a TOML table into an existing config (for include support)
void loadConfigFromTable(Config& config, toml::table const& tbl) {
    // Grid
    if (auto grid = tbl["grid"].as_table()) {
        config.grid.thread_count = get_or(*grid, "threads", config.grid.thread_count);
        if (auto x = (*grid)["x"].as_table()) {
            loadAxis(config.grid.quantization.x, *x, "grid.x");
        }
        if (auto y = (*grid)["y"].as_table()) {
            loadAxis(config.grid.quantization.y, *y, "grid.y");
        }
    }

    // Output
    if (auto out = tbl["output"].as_table()) {
        if (out->contains("format")) {
            config.output.format = parseOutputFormat(get_string_or(*out, "format", "csv"));
        }
        config.output.path = get_string_or(*out, "path", config.output.path);
        config.output.per_trajectory = get_or(*out, "per_trajectory", config.output.per_trajectory);
        config.output.include_states = get_or(*out, "states", config.output.include_states);
    }

    // Trajectories accumulate across includes
    if (auto node = tbl.get("trajectories")) {
        size_t index = config.trajectories.size();
        for (auto const& elem : requireArray(*node, "trajectories")) {
            auto const* traj = elem.as_table();
            if (!traj) {
                throw ConfigError("trajectories: expected an array of tables");
            }
            config.trajectories.push_back(loadTrajectory(*traj, index++));
        }
    }
}

void loadWithIncludes(Config& config, toml::table const& tbl, std::string const& base_path) {
    // Process includes first (they provide base values that can be overridden)
    if (auto includes = tbl["include"].as_array()) {
        for (auto const& inc : *includes) {
            if (auto inc_path = inc.value<std::string>()) {
                std::filesystem::path full_path;
                if (std::filesystem::path(*inc_path).is_absolute()) {
                    full_path = *inc_path;
                } else {
                    full_path = std::filesystem::path(base_path) / *inc_path;
                }
                if (std::filesystem::exists(full_path)) {
                    try {
                        auto inc_tbl = toml::parse_file(full_path.string());
                        loadConfigFromTable(config, inc_tbl);
                    } catch (toml::parse_error const& err) {
                        throw ConfigError("Error parsing included config " + full_path.string() +
                                          ": " + std::string(err.description()));
                    }
                } else {
                    std::cerr << "Warning: Included config not found: " << full_path << "\n";
                }
            }
        }
    }

    // Load values from this file (override includes)
    loadConfigFromTable(config, tbl);

    if (config.grid.thread_count < 0) {
        std::cerr << "Warning: threads must be non-negative, using default ("
                  << GridParams{}.thread_count << ")\n";
        config.grid.thread_count = GridParams{}.thread_count;
    }
}

// Override values: a full number parses as a number, anything else is a label
AxisValue parseOverrideValue(std::string const& text) {
    char const* begin = text.c_str();
    char* end = nullptr;
    double number = std::strtod(begin, &end);
    if (!text.empty() && end == begin + text.size()) {
        return number;
    }
    return text;
}

std::vector<AxisValue> parseOverrideList(std::string const& text) {
    std::vector<AxisValue> values;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        values.push_back(parseOverrideValue(text.substr(start, comma - start)));
        start = comma + 1;
    }
    return values;
}

bool parseBool(std::string const& value) {
    return value == "true" || value == "1";
}

// ============================================================================
// TOML writing
// ============================================================================

std::string quote(std::string const& str) {
    std::string result = "\"";
    for (char c : str) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += '"';
    return result;
}

void writeValue(std::ostream& out, AxisValue const& value) {
    if (auto const* number = std::get_if<double>(&value)) {
        out << *number;
    } else {
        out << quote(std::get<std::string>(value));
    }
}

template <typename T> void writeArray(std::ostream& out, std::vector<T> const& values) {
    out << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        if constexpr (std::is_same_v<T, AxisValue>) {
            writeValue(out, values[i]);
        } else {
            out << values[i];
        }
    }
    out << "]";
}

void writeAxis(std::ostream& out, AxisConfig const& axis, char const* name) {
    out << "[grid." << name << "]\n";
    if (axis.order) {
        out << "order = ";
        writeArray(out, *axis.order);
        out << "\n";
    }
    if (axis.min) {
        out << "min = ";
        writeValue(out, *axis.min);
        out << "\n";
    }
    if (axis.max) {
        out << "max = ";
        writeValue(out, *axis.max);
        out << "\n";
    }
    if (axis.cell_size) {
        out << "cell_size = " << *axis.cell_size << "\n";
    }
    out << "\n";
}

} // namespace

Config Config::defaults() {
    return Config{};
}

Config Config::load(std::string const& path) {
    Config config;

    if (!std::filesystem::exists(path)) {
        std::cerr << "Config file not found: " << path << ", using defaults\n";
        return config;
    }

    std::string base_path = std::filesystem::path(path).parent_path().string();
    if (base_path.empty()) base_path = ".";

    try {
        auto tbl = toml::parse_file(path);
        loadWithIncludes(config, tbl, base_path);
    } catch (toml::parse_error const& err) {
        throw ConfigError("Error parsing config " + path + ": " + std::string(err.description()));
    }
    return config;
}

Config Config::parse(std::string_view toml_text, std::string const& base_path) {
    Config config;
    try {
        auto tbl = toml::parse(toml_text);
        loadWithIncludes(config, tbl, base_path);
    } catch (toml::parse_error const& err) {
        throw ConfigError("Error parsing config: " + std::string(err.description()));
    }
    return config;
}

bool Config::applyOverride(std::string const& key, std::string const& value) {
    // Parse dot-notation key (e.g., "grid.x.cell_size")
    auto dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        std::cerr << "Invalid parameter key (missing section): " << key << "\n";
        return false;
    }

    std::string section = key.substr(0, dot_pos);
    std::string param = key.substr(dot_pos + 1);

    try {
        // Grid parameters
        if (section == "grid") {
            if (param == "threads") {
                grid.thread_count = std::stoi(value);
            } else if (param.size() > 2 && (param[0] == 'x' || param[0] == 'y') && param[1] == '.') {
                AxisConfig& axis = param[0] == 'x' ? grid.quantization.x : grid.quantization.y;
                std::string axis_param = param.substr(2);
                if (axis_param == "cell_size") {
                    axis.cell_size = std::stod(value);
                } else if (axis_param == "min") {
                    axis.min = parseOverrideValue(value);
                } else if (axis_param == "max") {
                    axis.max = parseOverrideValue(value);
                } else if (axis_param == "order") {
                    axis.order = parseOverrideList(value);
                } else {
                    std::cerr << "Unknown axis parameter: " << axis_param << "\n";
                    return false;
                }
            } else {
                std::cerr << "Unknown grid parameter: " << param << "\n";
                return false;
            }
        }
        // Output parameters
        else if (section == "output") {
            if (param == "format") {
                output.format = parseOutputFormat(value);
            } else if (param == "path") {
                output.path = value;
            } else if (param == "per_trajectory") {
                output.per_trajectory = parseBool(value);
            } else if (param == "states") {
                output.include_states = parseBool(value);
            } else {
                std::cerr << "Unknown output parameter: " << param << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown section: " << section << "\n";
            return false;
        }
    } catch (std::exception const& e) {
        std::cerr << "Error parsing value for " << key << ": " << e.what() << "\n";
        return false;
    }

    return true;
}

void Config::save(std::string const& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Could not open " + path + " for writing");
    }

    file << std::setprecision(17);

    // Grid section
    file << "[grid]\n";
    file << "threads = " << grid.thread_count << "\n";
    file << "\n";
    writeAxis(file, grid.quantization.x, "x");
    writeAxis(file, grid.quantization.y, "y");

    // Output section
    file << "[output]\n";
    file << "format = " << quote(enum_utils::toString(output.format)) << "\n";
    file << "path = " << quote(output.path) << "\n";
    file << "per_trajectory = " << (output.per_trajectory ? "true" : "false") << "\n";
    file << "states = " << (output.include_states ? "true" : "false") << "\n";

    // Trajectories
    for (auto const& traj : trajectories) {
        file << "\n[[trajectories]]\n";
        if (!traj.id.empty()) {
            file << "id = " << quote(traj.id) << "\n";
        }
        file << "x = ";
        writeArray(file, traj.x);
        file << "\ny = ";
        writeArray(file, traj.y);
        file << "\nt = ";
        writeArray(file, traj.t);
        file << "\n";
    }
}

std::vector<Trajectory> Config::buildTrajectories(IdGenerator& ids) const {
    std::vector<Trajectory> result;
    result.reserve(trajectories.size());
    for (auto const& input : trajectories) {
        std::string id = input.id.empty() ? ids.next() : input.id;
        result.emplace_back(input.x, input.y, input.t, std::move(id));
    }
    return result;
}

} // namespace ssg
