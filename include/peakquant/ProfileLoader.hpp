// ProfileLoader.hpp
#pragma once
#include "peakquant/Dataset.hpp"
#include <string>

namespace peakquant {

/*  Read a two-column table (x, y) from a delimited text file.
 *
 *  Columns may be separated by commas, semicolons, tabs or blanks.
 *  Lines starting with '#' and lines whose first two fields are not
 *  numbers (e.g. an ImageJ header) are skipped.  Rows are sorted by x;
 *  duplicated x values are rejected.  The dataset name is the file stem.
 *
 *  Throws std::runtime_error if the file cannot be read or holds no data. */
Dataset load_profile(const std::string& path);

/*  Same parser on an in-memory text, for callers that already hold it.   */
Dataset parse_profile(const std::string& text, const std::string& name);

} // namespace peakquant
