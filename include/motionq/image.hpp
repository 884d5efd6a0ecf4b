/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "motionq/types.hpp"

namespace motionq {

enum class ImageFormat : std::uint8_t { Unknown, Jpeg, Png, Heic };

// Owned upload buffer with its sniffed format.
struct InputImage {
    std::string bytes;
    ImageFormat format = ImageFormat::Unknown;
    std::string name = "scene";
    int width = 0;
    int height = 0;
};

struct ImageResult {
    bool ok = false;
    InputImage image;
    ErrorInfo error;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] ImageFormat sniffFormat(const std::string& bytes) noexcept;
[[nodiscard]] const char* toString(ImageFormat format) noexcept;
[[nodiscard]] const char* fileExtension(ImageFormat format) noexcept;

// Best effort; leaves 0x0 when the header does not carry dimensions.
bool readDimensions(const std::string& bytes, ImageFormat format, int& width, int& height) noexcept;

// Validates size and format; the filename only contributes the display name.
[[nodiscard]] ImageResult loadUpload(std::string bytes, const std::string& filename, std::size_t maxBytes);

}
