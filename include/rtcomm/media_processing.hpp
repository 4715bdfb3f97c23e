/**
 * @file media_processing.hpp
 * @brief Image thumbnailing, compression and media header probing
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Decoding via stb_image, encoding via stb_image_write
 * - Aspect-preserving area-average downscaling
 * - Container probing for WAV and ISO-BMFF (MP4/MOV)
 */

#pragma once

#include "rtcomm/media_file.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rtcomm {
namespace media {

/**
 * @brief Image re-encoding options
 */
struct CompressionOptions {
    double quality = 0.8;           ///< 0.0 - 1.0 (JPEG only)
    int max_width = 1920;           ///< Bounding box width
    int max_height = 1080;          ///< Bounding box height
    std::string format = "jpeg";    ///< jpeg, png or bmp
};

/**
 * @brief Decoded 8-bit image
 */
struct Image {
    int width = 0;
    int height = 0;
    int channels = 0;               ///< 3 (RGB) or 4 (RGBA)
    std::vector<uint8_t> pixels;    ///< Row-major, tightly packed
};

/**
 * @brief Decode an encoded image (JPEG, PNG, GIF, BMP)
 * @param data Encoded bytes
 * @param channels Desired channel count (3 or 4)
 * @return Image or std::nullopt if the data is not a decodable image
 */
std::optional<Image> decode_image(const std::vector<uint8_t>& data, int channels);

/**
 * @brief Scale an image to fit within a bounding box (never upscales)
 */
Image fit_within(const Image& image, int max_width, int max_height);

/**
 * @brief Encode an image
 * @param image Source pixels
 * @param format jpeg, png or bmp
 * @param quality 0.0 - 1.0 (JPEG only)
 * @return Encoded bytes
 * @throws RtcError InvalidArgument for an unsupported format or encoder failure
 */
std::vector<uint8_t> encode_image(const Image& image, const std::string& format, double quality);

/**
 * @brief Build a JPEG thumbnail data URL ("data:image/jpeg;base64,...")
 * @param data Encoded image bytes
 * @param max_dimension Bounding box side
 * @param quality JPEG quality (0.0 - 1.0)
 * @throws RtcError NotAnImage if the bytes cannot be decoded
 */
std::string make_thumbnail(const std::vector<uint8_t>& data, int max_dimension, double quality);

/**
 * @brief Resize and re-encode an image
 * @throws RtcError NotAnImage or InvalidArgument
 */
std::vector<uint8_t> recompress(const std::vector<uint8_t>& data, const CompressionOptions& options);

/**
 * @brief Read image dimensions from the header without decoding
 */
std::optional<Dimensions> probe_image_dimensions(const std::vector<uint8_t>& data);

/**
 * @brief Duration of a PCM WAV file in seconds
 */
std::optional<double> probe_wav_duration(const std::vector<uint8_t>& data);

/**
 * @brief Duration (mvhd) and video dimensions (tkhd) of an MP4/MOV file
 */
MediaMetadata probe_iso_media(const std::vector<uint8_t>& data);

/**
 * @brief MIME type and file extension for an output format
 */
std::string format_mime_type(const std::string& format);
std::string format_extension(const std::string& format);

} // namespace media
} // namespace rtcomm
