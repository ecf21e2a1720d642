#include "peakquant/JsonUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace peakquant {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open config '" + path + "'");

    nlohmann::json j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false,
                                             /*ignore_comments=*/true);
    if (j.is_discarded())
        throw std::runtime_error("'" + path + "' is not valid JSON");
    return j;
}

/* ------------------------------------------------------------------ */
/*  ${NAME} or ${NAME:-fallback}; an unset NAME without a fallback     */
/*  becomes the empty string and is reported once per occurrence       */
/* ------------------------------------------------------------------ */
static std::string expand_string(const std::string& in)
{
    std::string out;
    out.reserve(in.size());

    std::size_t pos = 0;
    while (pos < in.size()) {
        const std::size_t open = in.find("${", pos);
        if (open == std::string::npos) break;
        const std::size_t close = in.find('}', open + 2);
        if (close == std::string::npos) break;          // unterminated: keep as is

        out.append(in, pos, open - pos);

        std::string name = in.substr(open + 2, close - open - 2);
        std::string fallback;
        bool has_fallback = false;
        const std::size_t sep = name.find(":-");
        if (sep != std::string::npos) {
            fallback     = name.substr(sep + 2);
            name.resize(sep);
            has_fallback = true;
        }

        const char* value = std::getenv(name.c_str());
        if (value && *value)
            out += value;
        else if (has_fallback)
            out += fallback;
        else
            std::cerr << "[Config] environment variable '" << name << "' is not set\n";

        pos = close + 1;
    }
    out.append(in, pos, std::string::npos);
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string())
        j = expand_string(j.get_ref<const std::string&>());
    else if (j.is_structured())
        for (auto& child : j) expand_env(child);
}

} // namespace peakquant
