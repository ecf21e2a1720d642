#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace peakquant {

/*  Parse a JSON file; C and C++ style comments are allowed.
 *  Throws std::runtime_error if the file is missing or malformed.       */
nlohmann::json load_json(const std::string& path);

/*  Replace ${VAR} and ${VAR:-fallback} in every string value, in place. */
void expand_env(nlohmann::json& j);

} // namespace peakquant
