/**
 * @file media_processing.cpp
 * @brief Implementation of image processing and media probing
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "rtcomm/media_processing.hpp"
#include "rtcomm/errors.hpp"
#include "rtcomm/utilities.hpp"

#include <stb_image.h>
#include <stb_image_write.h>

#include <algorithm>
#include <climits>
#include <cstring>

namespace rtcomm {
namespace media {

namespace {

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t read_be64(const uint8_t* p) {
    return (static_cast<uint64_t>(read_be32(p)) << 32) | read_be32(p + 4);
}

uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool fits_int(size_t size) {
    return size > 0 && size <= static_cast<size_t>(INT_MAX);
}

/**
 * @brief Walk the ISO-BMFF boxes in [begin, end), descending into containers
 */
void walk_boxes(const uint8_t* begin, const uint8_t* end, MediaMetadata& result) {
    const uint8_t* p = begin;

    while (end - p >= 8) {
        uint64_t box_size = read_be32(p);
        std::string type(reinterpret_cast<const char*>(p + 4), 4);
        size_t header = 8;

        if (box_size == 1) {
            if (end - p < 16) {
                return;
            }
            box_size = read_be64(p + 8);
            header = 16;
        } else if (box_size == 0) {
            box_size = static_cast<uint64_t>(end - p);
        }

        if (box_size < header || box_size > static_cast<uint64_t>(end - p)) {
            return;
        }

        const uint8_t* body = p + header;
        const uint8_t* box_end = p + box_size;
        size_t body_size = static_cast<size_t>(box_end - body);

        if (type == "moov" || type == "trak") {
            walk_boxes(body, box_end, result);
        } else if (type == "mvhd" && body_size >= 4) {
            uint8_t version = body[0];
            uint32_t timescale = 0;
            uint64_t duration = 0;
            if (version == 1 && body_size >= 32) {
                timescale = read_be32(body + 20);
                duration = read_be64(body + 24);
            } else if (version == 0 && body_size >= 20) {
                timescale = read_be32(body + 12);
                duration = read_be32(body + 16);
            }
            if (timescale > 0) {
                result.duration = static_cast<double>(duration) / timescale;
            }
        } else if (type == "tkhd" && body_size >= 8 && !result.dimensions) {
            // Width and height are the trailing two 16.16 fixed-point fields
            uint32_t width = read_be32(box_end - 8) >> 16;
            uint32_t height = read_be32(box_end - 4) >> 16;
            if (width > 0 && height > 0) {
                result.dimensions = Dimensions{static_cast<int>(width), static_cast<int>(height)};
            }
        }

        p = box_end;
    }
}

} // anonymous namespace

// ============================================================================
// Decode / Resize / Encode
// ============================================================================

std::optional<Image> decode_image(const std::vector<uint8_t>& data, int channels) {
    if (!fits_int(data.size())) {
        return std::nullopt;
    }

    int width = 0;
    int height = 0;
    int source_channels = 0;
    unsigned char* pixels = stbi_load_from_memory(
        data.data(), static_cast<int>(data.size()), &width, &height, &source_channels, channels);
    if (!pixels) {
        return std::nullopt;
    }

    Image image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.pixels.assign(pixels, pixels + static_cast<size_t>(width) * height * channels);
    stbi_image_free(pixels);

    return image;
}

Image fit_within(const Image& image, int max_width, int max_height) {
    if (image.width <= 0 || image.height <= 0 || max_width <= 0 || max_height <= 0) {
        return image;
    }

    double ratio = std::min({
        static_cast<double>(max_width) / image.width,
        static_cast<double>(max_height) / image.height,
        1.0
    });
    if (ratio >= 1.0) {
        return image;
    }

    Image scaled;
    scaled.width = std::max(1, static_cast<int>(image.width * ratio));
    scaled.height = std::max(1, static_cast<int>(image.height * ratio));
    scaled.channels = image.channels;
    scaled.pixels.resize(static_cast<size_t>(scaled.width) * scaled.height * scaled.channels);

    // Area average over the source box covered by each destination pixel
    for (int y = 0; y < scaled.height; ++y) {
        int sy0 = static_cast<int>(static_cast<int64_t>(y) * image.height / scaled.height);
        int sy1 = std::max(sy0 + 1, static_cast<int>(static_cast<int64_t>(y + 1) * image.height / scaled.height));

        for (int x = 0; x < scaled.width; ++x) {
            int sx0 = static_cast<int>(static_cast<int64_t>(x) * image.width / scaled.width);
            int sx1 = std::max(sx0 + 1, static_cast<int>(static_cast<int64_t>(x + 1) * image.width / scaled.width));

            for (int c = 0; c < image.channels; ++c) {
                uint64_t sum = 0;
                for (int sy = sy0; sy < sy1; ++sy) {
                    const uint8_t* row = image.pixels.data() +
                        (static_cast<size_t>(sy) * image.width) * image.channels;
                    for (int sx = sx0; sx < sx1; ++sx) {
                        sum += row[static_cast<size_t>(sx) * image.channels + c];
                    }
                }
                uint64_t count = static_cast<uint64_t>(sy1 - sy0) * (sx1 - sx0);
                scaled.pixels[(static_cast<size_t>(y) * scaled.width + x) * scaled.channels + c] =
                    static_cast<uint8_t>(sum / count);
            }
        }
    }

    return scaled;
}

std::vector<uint8_t> encode_image(const Image& image, const std::string& format, double quality) {
    std::vector<uint8_t> out;
    int ok = 0;

    if (format == "jpeg" || format == "jpg") {
        int q = std::clamp(static_cast<int>(quality * 100.0 + 0.5), 1, 100);
        ok = stbi_write_jpg_to_func(append_to_vector, &out, image.width, image.height,
                                    image.channels, image.pixels.data(), q);
    } else if (format == "png") {
        ok = stbi_write_png_to_func(append_to_vector, &out, image.width, image.height,
                                    image.channels, image.pixels.data(), image.width * image.channels);
    } else if (format == "bmp") {
        ok = stbi_write_bmp_to_func(append_to_vector, &out, image.width, image.height,
                                    image.channels, image.pixels.data());
    } else {
        throw RtcError(ErrorCode::InvalidArgument, "Unsupported output format: " + format);
    }

    if (!ok || out.empty()) {
        throw RtcError(ErrorCode::InvalidArgument, "Image encoding failed (" + format + ")");
    }

    return out;
}

// ============================================================================
// Thumbnail / Compression
// ============================================================================

std::string make_thumbnail(const std::vector<uint8_t>& data, int max_dimension, double quality) {
    auto image = decode_image(data, 3);
    if (!image) {
        throw RtcError(ErrorCode::NotAnImage, "Cannot decode image for thumbnail");
    }

    Image thumbnail = fit_within(*image, max_dimension, max_dimension);
    auto jpeg = encode_image(thumbnail, "jpeg", quality);

    return "data:image/jpeg;base64," + utilities::bytes_to_base64(jpeg);
}

std::vector<uint8_t> recompress(const std::vector<uint8_t>& data, const CompressionOptions& options) {
    if (options.quality <= 0.0 || options.quality > 1.0) {
        throw RtcError(ErrorCode::InvalidArgument, "Quality must be in (0, 1]");
    }

    // PNG keeps its alpha channel, JPEG and BMP are written as RGB
    int channels = options.format == "png" ? 4 : 3;
    auto image = decode_image(data, channels);
    if (!image) {
        throw RtcError(ErrorCode::NotAnImage, "Cannot decode image for compression");
    }

    Image scaled = fit_within(*image, options.max_width, options.max_height);
    return encode_image(scaled, options.format, options.quality);
}

// ============================================================================
// Header Probing
// ============================================================================

std::optional<Dimensions> probe_image_dimensions(const std::vector<uint8_t>& data) {
    if (!fits_int(data.size())) {
        return std::nullopt;
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(data.data(), static_cast<int>(data.size()), &width, &height, &channels)) {
        return std::nullopt;
    }
    return Dimensions{width, height};
}

std::optional<double> probe_wav_duration(const std::vector<uint8_t>& data) {
    if (data.size() < 12 ||
        std::memcmp(data.data(), "RIFF", 4) != 0 ||
        std::memcmp(data.data() + 8, "WAVE", 4) != 0) {
        return std::nullopt;
    }

    uint32_t byte_rate = 0;
    size_t offset = 12;

    while (offset + 8 <= data.size()) {
        const uint8_t* chunk = data.data() + offset;
        uint32_t chunk_size = read_le32(chunk + 4);

        if (std::memcmp(chunk, "fmt ", 4) == 0 && chunk_size >= 12 && offset + 20 <= data.size()) {
            byte_rate = read_le32(chunk + 16);
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (byte_rate == 0) {
                return std::nullopt;
            }
            // Truncated files report what is actually present
            uint64_t available = std::min<uint64_t>(chunk_size, data.size() - offset - 8);
            return static_cast<double>(available) / byte_rate;
        }

        // Chunks are word aligned
        offset += 8 + static_cast<size_t>(chunk_size) + (chunk_size & 1u);
    }

    return std::nullopt;
}

MediaMetadata probe_iso_media(const std::vector<uint8_t>& data) {
    MediaMetadata result;
    if (data.size() >= 8) {
        walk_boxes(data.data(), data.data() + data.size(), result);
    }
    return result;
}

std::string format_mime_type(const std::string& format) {
    if (format == "png") return "image/png";
    if (format == "bmp") return "image/bmp";
    return "image/jpeg";
}

std::string format_extension(const std::string& format) {
    if (format == "png") return "png";
    if (format == "bmp") return "bmp";
    return "jpg";
}

} // namespace media
} // namespace rtcomm
