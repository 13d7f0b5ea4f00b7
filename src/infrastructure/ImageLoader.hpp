/**
 * @file ImageLoader.hpp
 * @brief Header probing and PNG decoding for embedding raster images.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace docforge::infrastructure {

enum class ImageFormat {
    Unknown,
    Png,
    Jpeg
};

struct ImageInfo {
    ImageFormat format = ImageFormat::Unknown;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    int components = 0; ///< JPEG: 1 (gray), 3 (YCbCr/RGB) or 4 (CMYK). PNG: channels after decoding.
};

/**
 * @struct DecodedImage
 * @brief 8-bit samples, row-major, without filter bytes.
 */
struct DecodedImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    int components = 3;  ///< 1 (gray) or 3 (RGB).
    std::string pixels;  ///< width * height * components bytes.
    std::string alpha;   ///< width * height bytes, empty when fully opaque.
};

class ImageLoader {
public:
    static ImageFormat DetectFormat(const std::string& bytes);

    /** @brief Reads dimensions from the file header. */
    static std::optional<ImageInfo> Probe(const std::string& bytes);

    /**
     * @brief Decodes a non-interlaced PNG of any color type (bit depths 1-16).
     * @return nullopt for corrupt or unsupported input.
     */
    static std::optional<DecodedImage> DecodePng(const std::string& bytes);
};

} // namespace docforge::infrastructure
