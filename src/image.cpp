/*
 * motionq - Image-to-Motion Job Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "motionq/image.hpp"
#include "motionq/logger.hpp"
#include <filesystem>

namespace motionq {

namespace {
std::uint32_t readBe32(const std::string& bytes, std::size_t offset) noexcept {
    return (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset])) << 24) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + 1])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + 2])) << 8) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[offset + 3]));
}

std::uint16_t readBe16(const std::string& bytes, std::size_t offset) noexcept {
    return static_cast<std::uint16_t>(
        (static_cast<unsigned char>(bytes[offset]) << 8) | static_cast<unsigned char>(bytes[offset + 1]));
}

bool isJpegSof(unsigned char marker) noexcept {
    // SOF0..SOF15 minus DHT (C4), JPG (C8) and DAC (CC)
    return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
}

// Length of the well-formed UTF-8 sequence at offset, or 0
std::size_t utf8SequenceLength(const std::string& text, std::size_t offset) noexcept {
    unsigned char lead = static_cast<unsigned char>(text[offset]);
    std::size_t length = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;
        if (lead == 0xED) high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;
        if (lead == 0xF4) high = 0x8F;
    } else {
        return 0;
    }
    if (offset + length > text.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < length; ++i) {
        unsigned char c = static_cast<unsigned char>(text[offset + i]);
        if (i == 1 ? (c < low || c > high) : (c < 0x80 || c > 0xBF)) {
            return 0;
        }
    }
    return length;
}

// Malformed UTF-8 and control bytes become '_'
std::string sanitizeName(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t length = utf8SequenceLength(text, pos);
        unsigned char lead = static_cast<unsigned char>(text[pos]);
        if (length == 0 || (length == 1 && (lead < 0x20 || lead == 0x7F))) {
            clean += '_';
            ++pos;
            continue;
        }
        clean.append(text, pos, length);
        pos += length;
    }
    return clean;
}

bool jpegDimensions(const std::string& bytes, int& width, int& height) noexcept {
    std::size_t pos = 2;
    while (pos + 4 <= bytes.size()) {
        if (static_cast<unsigned char>(bytes[pos]) != 0xFF) {
            return false;
        }
        unsigned char marker = static_cast<unsigned char>(bytes[pos + 1]);
        if (marker == 0xFF) {
            ++pos;
            continue;
        }
        if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        std::uint16_t length = readBe16(bytes, pos + 2);
        if (length < 2) {
            return false;
        }
        if (isJpegSof(marker)) {
            if (pos + 9 > bytes.size()) {
                return false;
            }
            height = readBe16(bytes, pos + 5);
            width = readBe16(bytes, pos + 7);
            return true;
        }
        pos += 2 + length;
    }
    return false;
}
}

ImageFormat sniffFormat(const std::string& bytes) noexcept {
    if (bytes.size() >= 3 &&
        static_cast<unsigned char>(bytes[0]) == 0xFF &&
        static_cast<unsigned char>(bytes[1]) == 0xD8 &&
        static_cast<unsigned char>(bytes[2]) == 0xFF) {
        return ImageFormat::Jpeg;
    }
    static const char kPngMagic[] = "\x89PNG\r\n\x1a\n";
    if (bytes.size() >= 8 && bytes.compare(0, 8, kPngMagic, 8) == 0) {
        return ImageFormat::Png;
    }
    // ISO BMFF: size(4) 'ftyp' brand(4)
    if (bytes.size() >= 12 && bytes.compare(4, 4, "ftyp") == 0) {
        std::string brand = bytes.substr(8, 4);
        if (brand == "heic" || brand == "heix" || brand == "hevc" || brand == "hevx" ||
            brand == "heim" || brand == "heis" || brand == "mif1" || brand == "msf1") {
            return ImageFormat::Heic;
        }
    }
    return ImageFormat::Unknown;
}

const char* toString(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Png:  return "png";
        case ImageFormat::Heic: return "heic";
        default: return "unknown";
    }
}

const char* fileExtension(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg: return ".jpg";
        case ImageFormat::Png:  return ".png";
        case ImageFormat::Heic: return ".heic";
        default: return ".bin";
    }
}

bool readDimensions(const std::string& bytes, ImageFormat format, int& width, int& height) noexcept {
    width = 0;
    height = 0;
    switch (format) {
        case ImageFormat::Png:
            // IHDR is always the first chunk
            if (bytes.size() >= 24 && bytes.compare(12, 4, "IHDR") == 0) {
                width = static_cast<int>(readBe32(bytes, 16));
                height = static_cast<int>(readBe32(bytes, 20));
                return width > 0 && height > 0;
            }
            return false;
        case ImageFormat::Jpeg:
            return jpegDimensions(bytes, width, height);
        default:
            return false;
    }
}

ImageResult loadUpload(std::string bytes, const std::string& filename, std::size_t maxBytes) {
    ImageResult result;
    result.error.kind = ErrorKind::InvalidInput;

    if (bytes.empty()) {
        result.error.message = "Image is empty";
        return result;
    }
    if (bytes.size() > maxBytes) {
        result.error.message = "Image exceeds size limit (" + std::to_string(maxBytes) + " bytes)";
        return result;
    }

    ImageFormat format = sniffFormat(bytes);
    if (format == ImageFormat::Unknown) {
        result.error.message = "Unsupported image format (expected JPEG, PNG or HEIC)";
        return result;
    }

    std::string stem = sanitizeName(std::filesystem::path(filename).filename().stem().string());

    result.image.format = format;
    result.image.name = stem.empty() ? "scene" : stem;
    if (!readDimensions(bytes, format, result.image.width, result.image.height)) {
        LOG_DEBUG("Image dimensions unavailable for " + result.image.name + " (" + toString(format) + ")");
    }
    result.image.bytes = std::move(bytes);
    result.ok = true;
    result.error = {};
    return result;
}

}
