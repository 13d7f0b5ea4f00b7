#include "infrastructure/ImageLoader.hpp"

#include <cstring>
#include <cstdlib>
#include <iostream>
#include <vector>
#include <zlib.h>

namespace docforge::infrastructure {

namespace {
    constexpr unsigned char kPngSignature[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

    constexpr std::uint32_t CHUNK_IHDR = 0x49484452;  // 'IHDR'
    constexpr std::uint32_t CHUNK_IDAT = 0x49444154;  // 'IDAT'
    constexpr std::uint32_t CHUNK_IEND = 0x49454E44;  // 'IEND'
    constexpr std::uint32_t CHUNK_PLTE = 0x504C5445;  // 'PLTE'
    constexpr std::uint32_t CHUNK_tRNS = 0x74524E53;  // 'tRNS'

    constexpr std::uint8_t PNG_COLOR_GRAYSCALE = 0;
    constexpr std::uint8_t PNG_COLOR_RGB = 2;
    constexpr std::uint8_t PNG_COLOR_INDEXED = 3;
    constexpr std::uint8_t PNG_COLOR_GRAYSCALE_ALPHA = 4;
    constexpr std::uint8_t PNG_COLOR_RGBA = 6;

    // Guards against absurd headers before allocating.
    constexpr std::uint64_t kMaxPixels = 64ull * 1024 * 1024;

    std::uint8_t Byte(const std::string& s, size_t i) {
        return static_cast<std::uint8_t>(s[i]);
    }

    std::uint32_t ReadBE32(const std::string& s, size_t i) {
        return (static_cast<std::uint32_t>(Byte(s, i)) << 24) | (static_cast<std::uint32_t>(Byte(s, i + 1)) << 16) |
               (static_cast<std::uint32_t>(Byte(s, i + 2)) << 8) | Byte(s, i + 3);
    }

    std::uint16_t ReadBE16(const std::string& s, size_t i) {
        return static_cast<std::uint16_t>((Byte(s, i) << 8) | Byte(s, i + 1));
    }

    int ChannelsFor(std::uint8_t colorType) {
        switch (colorType) {
            case PNG_COLOR_GRAYSCALE: return 1;
            case PNG_COLOR_RGB: return 3;
            case PNG_COLOR_INDEXED: return 1;
            case PNG_COLOR_GRAYSCALE_ALPHA: return 2;
            case PNG_COLOR_RGBA: return 4;
            default: return 0;
        }
    }

    bool ValidDepth(std::uint8_t colorType, std::uint8_t depth) {
        switch (colorType) {
            case PNG_COLOR_GRAYSCALE: return depth == 1 || depth == 2 || depth == 4 || depth == 8 || depth == 16;
            case PNG_COLOR_INDEXED: return depth == 1 || depth == 2 || depth == 4 || depth == 8;
            default: return depth == 8 || depth == 16;
        }
    }

    // Paeth predictor function
    inline std::uint8_t paethPredictor(int a, int b, int c) {
        int p = a + b - c;
        int pa = std::abs(p - a);
        int pb = std::abs(p - b);
        int pc = std::abs(p - c);
        if (pa <= pb && pa <= pc) return static_cast<std::uint8_t>(a);
        if (pb <= pc) return static_cast<std::uint8_t>(b);
        return static_cast<std::uint8_t>(c);
    }

    bool unfilterRow(std::uint8_t filterType, std::uint8_t* curr, const std::uint8_t* prev, size_t bpp, size_t rowBytes) {
        switch (filterType) {
            case 0:
                return true;
            case 1:
                for (size_t i = bpp; i < rowBytes; ++i) curr[i] = static_cast<std::uint8_t>(curr[i] + curr[i - bpp]);
                return true;
            case 2:
                for (size_t i = 0; i < rowBytes; ++i) curr[i] = static_cast<std::uint8_t>(curr[i] + prev[i]);
                return true;
            case 3:
                for (size_t i = 0; i < rowBytes; ++i) {
                    int left = i >= bpp ? curr[i - bpp] : 0;
                    curr[i] = static_cast<std::uint8_t>(curr[i] + ((left + prev[i]) >> 1));
                }
                return true;
            case 4:
                for (size_t i = 0; i < rowBytes; ++i) {
                    int a = i >= bpp ? curr[i - bpp] : 0;
                    int c = i >= bpp ? prev[i - bpp] : 0;
                    curr[i] = static_cast<std::uint8_t>(curr[i] + paethPredictor(a, prev[i], c));
                }
                return true;
            default:
                return false;
        }
    }

    // Returns the sample at index x of an unfiltered row, scaled to 8 bits unless raw is set.
    std::uint8_t Sample(const std::uint8_t* row, size_t x, std::uint8_t depth, bool raw) {
        if (depth == 8) return row[x];
        if (depth == 16) return row[x * 2];
        size_t bit = x * depth;
        std::uint8_t mask = static_cast<std::uint8_t>((1u << depth) - 1);
        std::uint8_t v = static_cast<std::uint8_t>((row[bit / 8] >> (8 - depth - (bit % 8))) & mask);
        return raw ? v : static_cast<std::uint8_t>(v * 255 / mask);
    }
}

ImageFormat ImageLoader::DetectFormat(const std::string& bytes) {
    if (bytes.size() >= 8 && std::memcmp(bytes.data(), kPngSignature, 8) == 0) return ImageFormat::Png;
    if (bytes.size() >= 3 && Byte(bytes, 0) == 0xFF && Byte(bytes, 1) == 0xD8 && Byte(bytes, 2) == 0xFF) return ImageFormat::Jpeg;
    return ImageFormat::Unknown;
}

std::optional<ImageInfo> ImageLoader::Probe(const std::string& bytes) {
    ImageInfo info;
    info.format = DetectFormat(bytes);

    if (info.format == ImageFormat::Png) {
        if (bytes.size() < 33 || ReadBE32(bytes, 12) != CHUNK_IHDR) return std::nullopt;
        info.width = ReadBE32(bytes, 16);
        info.height = ReadBE32(bytes, 20);
        std::uint8_t colorType = Byte(bytes, 25);
        info.components = (colorType == PNG_COLOR_GRAYSCALE || colorType == PNG_COLOR_GRAYSCALE_ALPHA) ? 1 : 3;
        if (info.width == 0 || info.height == 0) return std::nullopt;
        return info;
    }

    if (info.format == ImageFormat::Jpeg) {
        size_t pos = 2;
        while (pos + 4 <= bytes.size()) {
            if (Byte(bytes, pos) != 0xFF) {
                ++pos;
                continue;
            }
            std::uint8_t marker = Byte(bytes, pos + 1);
            if (marker == 0xFF) {
                ++pos; // fill byte
                continue;
            }
            if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
                pos += 2; // standalone markers
                continue;
            }
            if (marker == 0xD9 || marker == 0xDA) break; // EOI / start of scan before any SOF

            std::uint16_t length = ReadBE16(bytes, pos + 2);
            bool isSof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
            if (isSof) {
                if (pos + 10 > bytes.size()) return std::nullopt;
                info.height = ReadBE16(bytes, pos + 5);
                info.width = ReadBE16(bytes, pos + 7);
                info.components = Byte(bytes, pos + 9);
                if (info.width == 0 || info.height == 0) return std::nullopt;
                return info;
            }
            pos += 2 + length;
        }
        return std::nullopt;
    }

    return std::nullopt;
}

std::optional<DecodedImage> ImageLoader::DecodePng(const std::string& bytes) {
    if (DetectFormat(bytes) != ImageFormat::Png) return std::nullopt;

    std::uint32_t width = 0, height = 0;
    std::uint8_t depth = 0, colorType = 0, interlace = 0;
    std::string idat;
    std::string palette;
    std::string transparency;
    bool sawHeader = false;

    size_t pos = 8;
    while (pos + 12 <= bytes.size()) {
        std::uint32_t length = ReadBE32(bytes, pos);
        std::uint32_t type = ReadBE32(bytes, pos + 4);
        if (pos + 12 + static_cast<std::uint64_t>(length) > bytes.size()) {
            std::cerr << "[ImageLoader] Truncated PNG chunk" << std::endl;
            return std::nullopt;
        }
        const size_t data = pos + 8;

        if (type == CHUNK_IHDR) {
            if (length < 13) return std::nullopt;
            width = ReadBE32(bytes, data);
            height = ReadBE32(bytes, data + 4);
            depth = Byte(bytes, data + 8);
            colorType = Byte(bytes, data + 9);
            interlace = Byte(bytes, data + 12);
            sawHeader = true;
        } else if (type == CHUNK_PLTE) {
            palette = bytes.substr(data, length);
        } else if (type == CHUNK_tRNS) {
            transparency = bytes.substr(data, length);
        } else if (type == CHUNK_IDAT) {
            idat.append(bytes, data, length);
        } else if (type == CHUNK_IEND) {
            break;
        }
        pos += 12 + length;
    }

    if (!sawHeader || width == 0 || height == 0 || idat.empty()) return std::nullopt;
    if (!ValidDepth(colorType, depth) || ChannelsFor(colorType) == 0) {
        std::cerr << "[ImageLoader] Unsupported PNG color type/depth: " << int(colorType) << "/" << int(depth) << std::endl;
        return std::nullopt;
    }
    if (interlace != 0) {
        std::cerr << "[ImageLoader] Interlaced PNG is not supported" << std::endl;
        return std::nullopt;
    }
    if (static_cast<std::uint64_t>(width) * height > kMaxPixels) return std::nullopt;
    if (colorType == PNG_COLOR_INDEXED && palette.size() < 3) return std::nullopt;

    const int channels = ChannelsFor(colorType);
    const size_t bitsPerPixel = static_cast<size_t>(channels) * depth;
    const size_t rowBytes = (static_cast<size_t>(width) * bitsPerPixel + 7) / 8;
    const size_t bpp = bitsPerPixel >= 8 ? bitsPerPixel / 8 : 1;

    std::vector<std::uint8_t> raw((rowBytes + 1) * height);
    uLongf rawLen = static_cast<uLongf>(raw.size());
    int rc = uncompress(raw.data(), &rawLen, reinterpret_cast<const Bytef*>(idat.data()), static_cast<uLong>(idat.size()));
    if (rc != Z_OK || rawLen != raw.size()) {
        std::cerr << "[ImageLoader] PNG inflate failed (zlib " << rc << ")" << std::endl;
        return std::nullopt;
    }

    DecodedImage out;
    out.width = width;
    out.height = height;
    out.components = (colorType == PNG_COLOR_GRAYSCALE || colorType == PNG_COLOR_GRAYSCALE_ALPHA) ? 1 : 3;
    out.pixels.reserve(static_cast<size_t>(width) * height * out.components);

    bool hasAlpha = colorType == PNG_COLOR_GRAYSCALE_ALPHA || colorType == PNG_COLOR_RGBA ||
                    (colorType == PNG_COLOR_INDEXED && !transparency.empty());
    if (hasAlpha) out.alpha.reserve(static_cast<size_t>(width) * height);

    std::vector<std::uint8_t> prev(rowBytes, 0);
    for (std::uint32_t y = 0; y < height; ++y) {
        std::uint8_t* line = raw.data() + y * (rowBytes + 1);
        std::uint8_t* row = line + 1;
        if (!unfilterRow(line[0], row, prev.data(), bpp, rowBytes)) {
            std::cerr << "[ImageLoader] Unknown PNG filter type: " << int(line[0]) << std::endl;
            return std::nullopt;
        }

        for (std::uint32_t x = 0; x < width; ++x) {
            switch (colorType) {
                case PNG_COLOR_GRAYSCALE:
                    out.pixels += static_cast<char>(Sample(row, x, depth, false));
                    break;
                case PNG_COLOR_GRAYSCALE_ALPHA:
                    out.pixels += static_cast<char>(Sample(row, x * 2, depth, false));
                    out.alpha += static_cast<char>(Sample(row, x * 2 + 1, depth, false));
                    break;
                case PNG_COLOR_RGB:
                    for (int c = 0; c < 3; ++c) out.pixels += static_cast<char>(Sample(row, x * 3 + c, depth, false));
                    break;
                case PNG_COLOR_RGBA:
                    for (int c = 0; c < 3; ++c) out.pixels += static_cast<char>(Sample(row, x * 4 + c, depth, false));
                    out.alpha += static_cast<char>(Sample(row, x * 4 + 3, depth, false));
                    break;
                case PNG_COLOR_INDEXED: {
                    size_t index = Sample(row, x, depth, true);
                    if (index * 3 + 2 >= palette.size()) index = 0;
                    out.pixels.append(palette, index * 3, 3);
                    if (hasAlpha) {
                        out.alpha += index < transparency.size() ? transparency[index] : static_cast<char>(0xFF);
                    }
                    break;
                }
            }
        }
        std::memcpy(prev.data(), row, rowBytes);
    }

    return out;
}

} // namespace docforge::infrastructure
