#pragma once

#include "measures/grid_measures.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace ssg::measures {

// Tabular export of GridMeasures records.
//
// CSV layout: header row "trajectory_ids,undefined_dispersion_ids,<field names
// in fixed order>", then one row per record. Id columns join ids with '|'. Numbers are written
// with 17 significant digits so they parse back bit-for-bit; undefined values
// are written as "nan".
//
// Field table layout: the two id lines, then one "name,value" line per numeric
// field, same order and number format.
//
// Writers throw ValidationError for an id that Trajectory::isValidId rejects;
// readers throw ValidationError on a malformed table.

std::string formatValue(double value);
double parseValue(std::string const& text);

void writeCSV(std::ostream& out, std::vector<GridMeasures> const& rows);
std::vector<GridMeasures> readCSV(std::istream& in);

void writeFieldTable(std::ostream& out, GridMeasures const& measures);
GridMeasures readFieldTable(std::istream& in);

// JSON array of GridMeasures::toJSON() records
void writeJSON(std::ostream& out, std::vector<GridMeasures> const& rows);

// Write rows to `path` as CSV (or a JSON array when `json` is set).
// Throws std::runtime_error if the file cannot be opened.
void exportMeasures(std::string const& path, std::vector<GridMeasures> const& rows,
                    bool json = false);

} // namespace ssg::measures
