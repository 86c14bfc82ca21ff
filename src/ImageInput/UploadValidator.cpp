#include "ImageInput/UploadValidator.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

bool is_supported_image_type(const std::string& path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

UploadCheck validate_upload(const std::string& path, std::size_t max_bytes)
{
    const std::string name = fs::path(path).filename().string();

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return { UploadStatus::Missing, name + " couldn't be uploaded." };
    }

    if (!is_supported_image_type(path)) {
        return { UploadStatus::UnsupportedType,
                 name + " has an invalid file type. Accepted types: JPG, PNG." };
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return { UploadStatus::Missing, name + " couldn't be uploaded." };
    }
    if (size > max_bytes) {
        return { UploadStatus::TooLarge,
                 name + " is too large. Max size is "
                      + std::to_string(max_bytes / (1024 * 1024)) + "MB." };
    }

    return { UploadStatus::Ok, {} };
}
