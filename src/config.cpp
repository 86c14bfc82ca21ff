#include "config.h"

#include <algorithm>
#include <cctype>

std::optional<Resampling> parse_resampling(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "nearest")  return Resampling::Nearest;
    if (lower == "bilinear") return Resampling::Bilinear;
    if (lower == "area")     return Resampling::Area;
    return std::nullopt;
}

const char* to_string(Resampling mode)
{
    switch (mode) {
        case Resampling::Nearest:  return "nearest";
        case Resampling::Bilinear: return "bilinear";
        case Resampling::Area:     return "area";
    }
    return "unknown";
}
