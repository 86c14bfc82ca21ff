#include "Export/CropExporter.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

std::string export_file_name(const std::string& prefix,
                             const std::string& original_name,
                             const std::string& extension)
{
    // Only the last extension goes: "a.b.jpg" → "a.b"
    std::string stem = fs::path(original_name).filename().stem().string();
    if (stem.empty()) stem = "image";
    return prefix + stem + "." + extension;
}

bool CropExporter::init()
{
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec || !fs::is_directory(output_dir_)) {
        std::cerr << "[CropExporter] Cannot use output directory " << output_dir_
                  << ": " << ec.message() << "\n";
        return false;
    }
    used_names_.clear();
    std::cout << "[CropExporter] Writing to " << output_dir_
              << " with prefix '" << prefix_ << "'\n";
    return true;
}

std::string CropExporter::unique_name(const std::string& candidate)
{
    if (used_names_.insert(candidate).second) return candidate;

    const fs::path p(candidate);
    for (int n = 2;; ++n) {
        const std::string next = p.stem().string() + "_" + std::to_string(n)
                               + p.extension().string();
        if (used_names_.insert(next).second) return next;
    }
}

std::string CropExporter::write(const ExportItem& item)
{
    if (item.crop.encoded.bytes.empty()) {
        std::cerr << "[CropExporter] " << item.id << " has no encoded bytes.\n";
        return {};
    }

    const std::string file_name = unique_name(
        export_file_name(prefix_, item.name, item.crop.encoded.format));
    const fs::path path = fs::path(output_dir_) / file_name;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "[CropExporter] Cannot open " << path << " for writing.\n";
        return {};
    }
    out.write(reinterpret_cast<const char*>(item.crop.encoded.bytes.data()),
              static_cast<std::streamsize>(item.crop.encoded.bytes.size()));
    if (!out) {
        std::cerr << "[CropExporter] Write error on " << path << "\n";
        return {};
    }

    return path.string();
}

std::size_t CropExporter::export_all(const EditSession& session)
{
    const std::vector<ExportItem> items = session.export_eligible();

    std::size_t written = 0;
    for (const auto& item : items) {
        const std::string path = write(item);
        if (path.empty()) continue;
        ++written;
        std::cout << "[CropExporter] " << item.crop.handle << " → " << path << "\n";
    }

    std::cout << "[CropExporter] Exported " << written << " of " << items.size()
              << " accepted crops.\n";
    return written;
}
