#include "measures/measures_table.h"

#include "errors.h"
#include "grid/trajectory.h"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace ssg::measures {

namespace {

constexpr char ID_SEPARATOR = '|';
constexpr char const* TRAJECTORY_IDS = "trajectory_ids";
constexpr char const* UNDEFINED_DISPERSION_IDS = "undefined_dispersion_ids";

std::string joinIds(std::vector<std::string> const& ids) {
    std::string joined;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (!Trajectory::isValidId(ids[i])) {
            throw ValidationError("Trajectory id '" + ids[i] + "' cannot be written to a measures table");
        }
        if (i > 0) {
            joined += ID_SEPARATOR;
        }
        joined += ids[i];
    }
    return joined;
}

std::vector<std::string> splitIds(std::string const& joined) {
    std::vector<std::string> ids;
    if (joined.empty()) {
        return ids;
    }
    std::istringstream in(joined);
    std::string id;
    while (std::getline(in, id, ID_SEPARATOR)) {
        ids.push_back(id);
    }
    if (joined.back() == ID_SEPARATOR) {
        ids.emplace_back();
    }
    return ids;
}

std::vector<std::string> splitColumns(std::string const& line) {
    std::vector<std::string> columns;
    std::string column;
    std::istringstream in(line);
    while (std::getline(in, column, ',')) {
        columns.push_back(column);
    }
    if (!line.empty() && line.back() == ',') {
        columns.emplace_back();
    }
    return columns;
}

std::string csvHeader() {
    std::string header = std::string(TRAJECTORY_IDS) + "," + UNDEFINED_DISPERSION_IDS;
    for (auto name : GridMeasures::fieldNames()) {
        header += ",";
        header += name;
    }
    return header;
}

void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

std::string formatValue(double value) {
    if (isUndefined(value)) {
        return "nan";
    }
    std::ostringstream out;
    out << std::setprecision(17) << value;
    return out.str();
}

double parseValue(std::string const& text) {
    if (text == "nan") {
        return UNDEFINED;
    }
    char const* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (text.empty() || end != begin + text.size()) {
        throw ValidationError("Not a number: '" + text + "'");
    }
    return value;
}

void writeCSV(std::ostream& out, std::vector<GridMeasures> const& rows) {
    // Rows are checked before anything reaches `out`
    std::ostringstream table;
    table << csvHeader() << "\n";
    for (auto const& row : rows) {
        table << joinIds(row.trajectory_ids) << "," << joinIds(row.undefined_dispersion_ids);
        for (double value : row.values()) {
            table << "," << formatValue(value);
        }
        table << "\n";
    }
    out << table.str();
}

std::vector<GridMeasures> readCSV(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        throw ValidationError("Measures table is empty");
    }
    stripCarriageReturn(line);
    if (line != csvHeader()) {
        throw ValidationError("Unexpected measures table header: " + line);
    }

    std::vector<GridMeasures> rows;
    size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        stripCarriageReturn(line);
        if (line.empty()) {
            continue;
        }

        auto columns = splitColumns(line);
        if (columns.size() != GridMeasures::FIELD_COUNT + 2) {
            throw ValidationError("Measures table line " + std::to_string(line_number) +
                                  ": expected " + std::to_string(GridMeasures::FIELD_COUNT + 2) +
                                  " columns, got " + std::to_string(columns.size()));
        }

        std::array<double, GridMeasures::FIELD_COUNT> values;
        for (size_t i = 0; i < GridMeasures::FIELD_COUNT; ++i) {
            values[i] = parseValue(columns[i + 2]);
        }
        GridMeasures row = GridMeasures::fromValues(values);
        row.trajectory_ids = splitIds(columns[0]);
        row.undefined_dispersion_ids = splitIds(columns[1]);
        rows.push_back(std::move(row));
    }
    return rows;
}

void writeFieldTable(std::ostream& out, GridMeasures const& measures) {
    std::string const ids = joinIds(measures.trajectory_ids);
    std::string const undefined_ids = joinIds(measures.undefined_dispersion_ids);

    out << TRAJECTORY_IDS << "," << ids << "\n";
    out << UNDEFINED_DISPERSION_IDS << "," << undefined_ids << "\n";

    auto const values = measures.values();
    auto const& names = GridMeasures::fieldNames();
    for (size_t i = 0; i < GridMeasures::FIELD_COUNT; ++i) {
        out << names[i] << "," << formatValue(values[i]) << "\n";
    }
}

GridMeasures readFieldTable(std::istream& in) {
    GridMeasures measures;
    std::set<std::string> numeric_fields;

    std::string line;
    while (std::getline(in, line)) {
        stripCarriageReturn(line);
        if (line.empty()) {
            continue;
        }

        auto comma = line.find(',');
        if (comma == std::string::npos) {
            throw ValidationError("Field table line without a value: " + line);
        }
        std::string name = line.substr(0, comma);
        std::string value = line.substr(comma + 1);

        if (name == TRAJECTORY_IDS) {
            measures.trajectory_ids = splitIds(value);
        } else if (name == UNDEFINED_DISPERSION_IDS) {
            measures.undefined_dispersion_ids = splitIds(value);
        } else if (measures.setField(name, parseValue(value))) {
            numeric_fields.insert(name);
        } else {
            throw ValidationError("Unknown measures field: " + name);
        }
    }

    if (numeric_fields.size() != GridMeasures::FIELD_COUNT) {
        throw ValidationError("Field table has " + std::to_string(numeric_fields.size()) + " of " +
                              std::to_string(GridMeasures::FIELD_COUNT) + " measures fields");
    }
    return measures;
}

void writeJSON(std::ostream& out, std::vector<GridMeasures> const& rows) {
    nlohmann::json array = nlohmann::json::array();
    for (auto const& row : rows) {
        array.push_back(row.toJSON());
    }
    out << array.dump(2) << "\n";
}

void exportMeasures(std::string const& path, std::vector<GridMeasures> const& rows, bool json) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + path + " for writing");
    }

    if (json) {
        writeJSON(file, rows);
    } else {
        writeCSV(file, rows);
    }
}

} // namespace ssg::measures
