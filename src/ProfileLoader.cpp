#include "peakquant/ProfileLoader.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace peakquant {
namespace {

// ----------------------------------------------------------------------------
//  Read (x, y) rows, skip comment lines and anything that does not parse
// ----------------------------------------------------------------------------
std::vector<std::array<double, 2>>
read_xy_table(std::istream& in,
              const std::string& origin,
              char comment_char = '#')
{
    std::vector<std::array<double,2>> rows;
    std::string line;
    std::size_t skipped = 0;
    while (std::getline(in, line))
    {
        // trim leading whitespace
        auto it  = std::find_if_not(line.begin(), line.end(),
                                    [](unsigned char c) { return std::isspace(c); });
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::replace_if(line.begin(), line.end(),
                        [](char c) { return c == ',' || c == ';' || c == '\t'; },
                        ' ');

        std::istringstream ss(line);
        std::array<double,2> row{0.0, 0.0};
        if (!(ss >> row[0] >> row[1])) {          // header or garbage
            ++skipped;
            continue;
        }
        rows.push_back(row);
    }
    if (rows.empty())
        throw std::runtime_error("'" + origin + "' contains no valid data");

    if (skipped > 1)
        std::cerr << "[Loader] " << origin << ": skipped " << skipped
                  << " non-numeric lines\n";
    return rows;
}

// ----------------------------------------------------------------------------
//  Sort rows by x ascending and move into a Dataset
// ----------------------------------------------------------------------------
Dataset to_dataset(const std::vector<std::array<double,2>>& rows,
                   const std::string& name)
{
    const std::size_t n = rows.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(),
                     [&](std::size_t i, std::size_t j)
                     { return rows[i][0] < rows[j][0]; });

    Dataset ds;
    ds.name = name;
    ds.x.resize(static_cast<Index>(n));
    ds.y.resize(static_cast<Index>(n));

    for (std::size_t k = 0; k < n; ++k)
    {
        const auto& r = rows[idx[k]];
        ds.x[static_cast<Index>(k)] = r[0];
        ds.y[static_cast<Index>(k)] = r[1];
        if (k > 0 && !(ds.x[static_cast<Index>(k)] > ds.x[static_cast<Index>(k - 1)]))
            throw std::runtime_error("'" + name + "': duplicated x value " +
                                     std::to_string(r[0]));
    }
    return ds;
}

} // unnamed namespace

// ============================================================================
//  Public loader implementations
// ============================================================================
Dataset parse_profile(const std::string& text, const std::string& name)
{
    std::istringstream in(text);
    return to_dataset(read_xy_table(in, name), name);
}

Dataset load_profile(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    const std::string stem = std::filesystem::path(path).stem().string();
    Dataset ds = to_dataset(read_xy_table(in, path), stem);
    ds.path = path;

    std::cout << "[Loader] " << std::filesystem::path(path).filename().string()
              << " (" << ds.x.size() << " points)\n";
    return ds;
}

} // namespace peakquant
