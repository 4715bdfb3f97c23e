/**
 * @file test_media_processing.cpp
 * @brief Unit tests for image processing and media header probing
 *
 * Tests media helpers including:
 * - Aspect-preserving downscaling
 * - Thumbnail data URLs and recompression
 * - Image, WAV and ISO-BMFF header probing
 */

#include <gtest/gtest.h>
#include "rtcomm/media_processing.hpp"
#include "rtcomm/errors.hpp"
#include "rtcomm/utilities.hpp"

using namespace rtcomm;
using namespace rtcomm::media;

namespace {

Image solid_image(int width, int height, int channels, uint8_t value) {
    Image image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.pixels.assign(static_cast<size_t>(width) * height * channels, value);
    return image;
}

void put_be32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

std::vector<uint8_t> box(const std::string& type, const std::vector<uint8_t>& body) {
    std::vector<uint8_t> out;
    put_be32(out, static_cast<uint32_t>(body.size() + 8));
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

// Version 0 mvhd: flags, creation, modification, timescale, duration, padding
std::vector<uint8_t> mvhd(uint32_t timescale, uint32_t duration) {
    std::vector<uint8_t> body;
    put_be32(body, 0);
    put_be32(body, 0);
    put_be32(body, 0);
    put_be32(body, timescale);
    put_be32(body, duration);
    body.resize(body.size() + 80, 0);
    return box("mvhd", body);
}

// tkhd ends with 16.16 fixed-point width and height
std::vector<uint8_t> tkhd(uint32_t width, uint32_t height) {
    std::vector<uint8_t> body(76, 0);
    put_be32(body, width << 16);
    put_be32(body, height << 16);
    return box("tkhd", body);
}

} // anonymous namespace

// ============================================================================
// Resize Tests
// ============================================================================

TEST(MediaProcessingTest, FitWithinPreservesAspect) {
    Image scaled = fit_within(solid_image(800, 400, 3, 10), 200, 200);

    EXPECT_EQ(scaled.width, 200);
    EXPECT_EQ(scaled.height, 100);
    EXPECT_EQ(scaled.channels, 3);
    EXPECT_EQ(scaled.pixels.size(), 200u * 100 * 3);
}

TEST(MediaProcessingTest, FitWithinNeverUpscales) {
    Image small = solid_image(50, 30, 3, 10);
    Image result = fit_within(small, 200, 200);

    EXPECT_EQ(result.width, 50);
    EXPECT_EQ(result.height, 30);
    EXPECT_EQ(result.pixels, small.pixels);
}

TEST(MediaProcessingTest, AreaAverageOfUniformImage) {
    Image scaled = fit_within(solid_image(64, 64, 4, 77), 16, 16);

    ASSERT_EQ(scaled.width, 16);
    for (uint8_t value : scaled.pixels) {
        EXPECT_EQ(value, 77);
    }
}

TEST(MediaProcessingTest, AreaAverageMixesColumns) {
    // Alternating black and white columns average to mid grey
    Image stripes = solid_image(4, 2, 3, 0);
    for (int y = 0; y < 2; ++y) {
        for (int x = 1; x < 4; x += 2) {
            for (int c = 0; c < 3; ++c) {
                stripes.pixels[(static_cast<size_t>(y) * 4 + x) * 3 + c] = 200;
            }
        }
    }

    Image scaled = fit_within(stripes, 2, 2);
    ASSERT_EQ(scaled.width, 2);
    ASSERT_EQ(scaled.height, 1);
    EXPECT_EQ(scaled.pixels[0], 100);
}

// ============================================================================
// Encode / Decode Tests
// ============================================================================

TEST(MediaProcessingTest, PngRoundTrip) {
    Image image = solid_image(10, 6, 3, 0);
    for (size_t i = 0; i < image.pixels.size(); ++i) {
        image.pixels[i] = static_cast<uint8_t>(i * 3);
    }

    auto decoded = decode_image(encode_image(image, "png", 1.0), 3);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->width, 10);
    EXPECT_EQ(decoded->height, 6);
    EXPECT_EQ(decoded->pixels, image.pixels);
}

TEST(MediaProcessingTest, UnsupportedFormatRejected) {
    EXPECT_THROW(encode_image(solid_image(4, 4, 3, 0), "tiff", 0.8), RtcError);
}

TEST(MediaProcessingTest, DecodeRejectsGarbage) {
    std::vector<uint8_t> garbage = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_FALSE(decode_image(garbage, 3).has_value());
    EXPECT_FALSE(decode_image({}, 3).has_value());
    EXPECT_FALSE(probe_image_dimensions(garbage).has_value());
}

// ============================================================================
// Thumbnail / Compression Tests
// ============================================================================

TEST(MediaProcessingTest, ThumbnailDataUrl) {
    auto png = encode_image(solid_image(600, 300, 3, 128), "png", 1.0);
    std::string thumbnail = make_thumbnail(png, 200, 0.7);

    const std::string prefix = "data:image/jpeg;base64,";
    ASSERT_TRUE(utilities::starts_with(thumbnail, prefix));

    auto jpeg = utilities::base64_to_bytes(thumbnail.substr(prefix.size()));
    ASSERT_TRUE(jpeg.has_value());
    auto dimensions = probe_image_dimensions(*jpeg);
    ASSERT_TRUE(dimensions.has_value());
    EXPECT_EQ(dimensions->width, 200);
    EXPECT_EQ(dimensions->height, 100);
}

TEST(MediaProcessingTest, ThumbnailOfNonImage) {
    std::vector<uint8_t> text = {'h', 'e', 'l', 'l', 'o'};

    try {
        make_thumbnail(text, 200, 0.7);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotAnImage);
    }
}

TEST(MediaProcessingTest, RecompressValidatesQuality) {
    auto png = encode_image(solid_image(20, 20, 3, 50), "png", 1.0);

    CompressionOptions options;
    options.quality = 0.0;
    EXPECT_THROW(recompress(png, options), RtcError);

    options.quality = 1.5;
    EXPECT_THROW(recompress(png, options), RtcError);
}

TEST(MediaProcessingTest, RecompressToPngKeepsAlpha) {
    auto png = encode_image(solid_image(40, 20, 4, 90), "png", 1.0);

    CompressionOptions options;
    options.format = "png";
    options.max_width = 20;
    options.max_height = 20;

    auto decoded = decode_image(recompress(png, options), 4);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->width, 20);
    EXPECT_EQ(decoded->height, 10);
    EXPECT_EQ(decoded->pixels[3], 90);
}

TEST(MediaProcessingTest, FormatNames) {
    EXPECT_EQ(format_mime_type("jpeg"), "image/jpeg");
    EXPECT_EQ(format_mime_type("png"), "image/png");
    EXPECT_EQ(format_mime_type("bmp"), "image/bmp");
    EXPECT_EQ(format_extension("jpeg"), "jpg");
    EXPECT_EQ(format_extension("png"), "png");
}

// ============================================================================
// Container Probing Tests
// ============================================================================

TEST(MediaProcessingTest, WavRequiresFormatChunk) {
    std::vector<uint8_t> wav = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E',
                                'd', 'a', 't', 'a', 4, 0, 0, 0, 1, 2, 3, 4};
    EXPECT_FALSE(probe_wav_duration(wav).has_value());

    std::vector<uint8_t> not_wav = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'A', 'V', 'I', ' '};
    EXPECT_FALSE(probe_wav_duration(not_wav).has_value());
}

TEST(MediaProcessingTest, TruncatedWavReportsPresentSamples) {
    // Header claims 8000 bytes at 8000 bytes/s, only 4000 are present
    std::vector<uint8_t> wav = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E',
                                'f', 'm', 't', ' ', 16, 0, 0, 0,
                                1, 0, 1, 0, 0x40, 0x1F, 0, 0, 0x40, 0x1F, 0, 0, 1, 0, 8, 0,
                                'd', 'a', 't', 'a', 0x40, 0x1F, 0, 0};
    wav.resize(wav.size() + 4000, 0x80);

    auto duration = probe_wav_duration(wav);
    ASSERT_TRUE(duration.has_value());
    EXPECT_DOUBLE_EQ(*duration, 0.5);
}

TEST(MediaProcessingTest, IsoDurationAndDimensions) {
    std::vector<uint8_t> ftyp = box("ftyp", {'i', 's', 'o', 'm', 0, 0, 2, 0});
    std::vector<uint8_t> moov = box("moov", concat({
        mvhd(1000, 12500),
        box("trak", tkhd(1280, 720))
    }));
    std::vector<uint8_t> mp4 = concat({ftyp, moov, box("mdat", std::vector<uint8_t>(64, 0))});

    MediaMetadata metadata = probe_iso_media(mp4);
    ASSERT_TRUE(metadata.duration.has_value());
    EXPECT_DOUBLE_EQ(*metadata.duration, 12.5);
    ASSERT_TRUE(metadata.dimensions.has_value());
    EXPECT_EQ(metadata.dimensions->width, 1280);
    EXPECT_EQ(metadata.dimensions->height, 720);
}

TEST(MediaProcessingTest, AudioTrackHasNoDimensions) {
    std::vector<uint8_t> m4a = box("moov", concat({
        mvhd(44100, 88200),
        box("trak", tkhd(0, 0))
    }));

    MediaMetadata metadata = probe_iso_media(m4a);
    ASSERT_TRUE(metadata.duration.has_value());
    EXPECT_DOUBLE_EQ(*metadata.duration, 2.0);
    EXPECT_FALSE(metadata.dimensions.has_value());
}

TEST(MediaProcessingTest, CorruptBoxSizeStopsWalk) {
    std::vector<uint8_t> broken;
    put_be32(broken, 4096);
    broken.insert(broken.end(), {'m', 'o', 'o', 'v'});
    broken.resize(32, 0);

    MediaMetadata metadata = probe_iso_media(broken);
    EXPECT_FALSE(metadata.duration.has_value());
    EXPECT_FALSE(metadata.dimensions.has_value());
}
