#pragma once

#include <cstddef>
#include <string>

// Gatekeeper run on every file before it is decoded: JPEG/PNG only, and no
// larger than the configured limit.

enum class UploadStatus {
    Ok,
    Missing,
    TooLarge,
    UnsupportedType,
};

struct UploadCheck {
    UploadStatus status = UploadStatus::Ok;
    std::string  message;

    bool ok() const { return status == UploadStatus::Ok; }
};

// True for .jpg / .jpeg / .png (case-insensitive).
bool        is_supported_image_type(const std::string& path);

UploadCheck validate_upload(const std::string& path, std::size_t max_bytes);
