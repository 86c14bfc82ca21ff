#pragma once

#include "interfaces.h"

#include <cstddef>
#include <optional>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// Engine configuration
//
// Output size and zoom bounds are fixed (see interfaces.h); everything else
// can be tuned from the command line.
// ─────────────────────────────────────────────────────────────────────────────

struct CropperConfig {
    Resampling  resampling        = Resampling::Area;
    bool        default_greyscale = true;

    std::string export_prefix     = "portrait_";
    std::size_t max_upload_bytes  = 10u * 1024u * 1024u;   // 10 MB

    int         png_compression   = 6;      // 0-9, passed to the encoder config
    std::string encoder           = "opencv";
    std::string loader            = "opencv";
};

// "nearest" / "bilinear" / "area" → Resampling. nullopt for anything else.
std::optional<Resampling> parse_resampling(const std::string& name);

const char* to_string(Resampling mode);
