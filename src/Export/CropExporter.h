#pragma once

#include "Session/EditSession.h"

#include <set>
#include <string>
#include <utility>

// ─────────────────────────────────────────────────────────────────────────────
// CropExporter
//
// Writes every export-eligible crop of a session into one directory as
// "<prefix><original stem>.<format>". Bundling those files into an archive is
// left to whoever consumes the directory.
// ─────────────────────────────────────────────────────────────────────────────

// "portrait_" + "IMG_0042.jpeg" → "portrait_IMG_0042.png"
std::string export_file_name(const std::string& prefix,
                             const std::string& original_name,
                             const std::string& extension = "png");

class CropExporter {
public:
    CropExporter(std::string output_dir, std::string prefix)
        : output_dir_(std::move(output_dir)), prefix_(std::move(prefix)) {}

    // Create the output directory if needed. Returns false on failure.
    bool        init();

    // Write one item; returns the full path written, or "" on failure.
    std::string write(const ExportItem& item);

    // Write everything the session marks exportable. Returns the count written.
    std::size_t export_all(const EditSession& session);

private:
    std::string           output_dir_;
    std::string           prefix_;
    std::set<std::string> used_names_;   // keeps same-stem inputs from overwriting each other

    std::string unique_name(const std::string& candidate);
};
