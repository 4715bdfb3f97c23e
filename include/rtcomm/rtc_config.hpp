/**
 * @file rtc_config.hpp
 * @brief Limits, runtime configuration and validation helpers for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Compile-time limits (constexpr)
 * - Runtime configuration loaded from JSON
 * - Network quality thresholds and video presets
 * - Identifier and filename validation
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>

namespace rtcomm {
namespace limits {

// ============================================================================
// Size Limits
// ============================================================================

/// Default maximum transferable file size (100MB)
constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 100 * 1024 * 1024;

/// Default chunk size (64KB)
constexpr uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;

/// Smallest accepted chunk size
constexpr uint32_t MIN_CHUNK_SIZE = 1024;

/// Largest accepted chunk size (4MB)
constexpr uint32_t MAX_CHUNK_SIZE = 4 * 1024 * 1024;

/// Maximum identifier length (user id, group id, call id)
constexpr size_t MAX_IDENTIFIER_LENGTH = 128;

/// Maximum filename length
constexpr size_t MAX_FILENAME_LENGTH = 255;

/// Default number of records returned by history queries
constexpr size_t DEFAULT_HISTORY_LIMIT = 50;

/// Thumbnail bounding box
constexpr int THUMBNAIL_MAX_DIMENSION = 200;

/// Thumbnail JPEG quality (0.0 - 1.0)
constexpr double THUMBNAIL_QUALITY = 0.8;

// ============================================================================
// Timing
// ============================================================================

/// Ring/connect timeout
constexpr auto CALL_TIMEOUT = std::chrono::milliseconds(30000);

/// Signal expiry after creation
constexpr auto SIGNAL_EXPIRY = std::chrono::milliseconds(3600000);

/// Signals older than this are removed regardless of expiry
constexpr auto SIGNAL_RETENTION = std::chrono::hours(24);

/// Periodic signal sweep interval
constexpr auto SIGNAL_CLEANUP_INTERVAL = std::chrono::minutes(5);

/// Whole-transfer timeout
constexpr auto FILE_TRANSFER_TIMEOUT = std::chrono::milliseconds(300000);

/// Grace delay before a terminal transfer entry is evicted
constexpr auto TRANSFER_CLEANUP_DELAY = std::chrono::milliseconds(5000);

} // namespace limits

// ============================================================================
// Quality Model
// ============================================================================

/**
 * @brief Network quality classes, best first
 */
enum class NetworkQuality {
    Excellent,
    Good,
    Fair,
    Poor,
    Critical,
    Unknown
};

/**
 * @brief Video quality presets
 */
enum class VideoQualityLevel {
    Low,
    Medium,
    High,
    Ultra
};

/**
 * @brief Capture/encode settings for a quality level
 */
struct VideoPreset {
    int width;          ///< Frame width in pixels
    int height;         ///< Frame height in pixels
    int frame_rate;     ///< Frames per second
    uint32_t bitrate;   ///< Target bitrate in bits per second
};

/**
 * @brief Minimum bandwidth and maximum latency/loss for a network quality class
 */
struct NetworkThreshold {
    double bandwidth_kbps;   ///< Minimum available bandwidth
    double latency_ms;       ///< Maximum round-trip latency
    double packet_loss;      ///< Maximum packet loss in percent
};

/**
 * @brief One network measurement
 */
struct NetworkSample {
    double bandwidth_kbps = 0.0;
    double latency_ms = 0.0;
    double packet_loss = 0.0;
};

/**
 * @brief Feature switches
 */
struct FeatureFlags {
    bool enable_voice_call = true;
    bool enable_video_call = true;
    bool enable_screen_share = true;
    bool enable_file_transfer = true;
    bool enable_group_call = true;
};

/**
 * @brief Allowed file extensions by category
 */
struct SupportedFileTypes {
    std::vector<std::string> image;
    std::vector<std::string> video;
    std::vector<std::string> audio;
    std::vector<std::string> document;
};

/**
 * @brief Runtime configuration for all RTComm components
 *
 * Defaults reproduce the production configuration; any subset can be
 * overridden from a JSON document.
 */
struct RtcConfig {
    // Transfer
    uint64_t max_file_size = limits::DEFAULT_MAX_FILE_SIZE;
    uint32_t file_chunk_size = limits::DEFAULT_CHUNK_SIZE;
    SupportedFileTypes supported_file_types;
    std::chrono::milliseconds file_transfer_timeout = limits::FILE_TRANSFER_TIMEOUT;
    std::chrono::milliseconds transfer_cleanup_delay = limits::TRANSFER_CLEANUP_DELAY;
    size_t max_concurrent_transfers = 3;
    size_t hash_worker_threads = 2;

    // Signaling
    std::chrono::milliseconds signal_expiry = limits::SIGNAL_EXPIRY;
    std::chrono::hours signal_retention = limits::SIGNAL_RETENTION;
    std::chrono::milliseconds signal_cleanup_interval = limits::SIGNAL_CLEANUP_INTERVAL;

    // Calls
    std::chrono::milliseconds call_timeout = limits::CALL_TIMEOUT;
    size_t max_conference_participants = 8;
    VideoQualityLevel default_video_quality = VideoQualityLevel::Medium;
    std::map<NetworkQuality, NetworkThreshold> network_quality_thresholds;
    std::map<VideoQualityLevel, VideoPreset> video_presets;
    FeatureFlags features;

    // Logging
    std::string log_file;
    std::string log_level = "info";

    RtcConfig();

    /**
     * @brief Parse configuration from JSON, starting from defaults
     * @param json_str JSON document
     * @return RtcConfig or std::nullopt if JSON is malformed or invalid
     */
    static std::optional<RtcConfig> from_json(const std::string& json_str);

    /**
     * @brief Serialize configuration to JSON
     */
    std::string to_json() const;

    /**
     * @brief Check value ranges
     * @return Empty string if valid, otherwise a description of the first problem
     */
    std::string validate() const;

    /**
     * @brief Every allowed extension across categories
     */
    std::vector<std::string> all_supported_extensions() const;
};

/**
 * @brief Load configuration from a JSON file
 * @param path File path
 * @return RtcConfig or std::nullopt on read/parse/validation error
 */
std::optional<RtcConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Load configuration from $RTCOMM_CONFIG, falling back to defaults
 * @return Configuration (defaults when unset or unreadable)
 */
RtcConfig load_default_config();

/**
 * @brief Get RTComm data directory ($RTCOMM_DATA_DIR or platform default)
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

// ============================================================================
// Quality Helpers
// ============================================================================

/**
 * @brief Classify a measurement against the configured thresholds
 * @param sample Measurement
 * @param thresholds Per-class thresholds
 * @return Best class whose thresholds are all met, Critical if none
 */
NetworkQuality classify_network_quality(
    const NetworkSample& sample,
    const std::map<NetworkQuality, NetworkThreshold>& thresholds
);

/**
 * @brief Recommended video preset for a network quality class
 */
VideoQualityLevel recommended_video_quality(NetworkQuality quality);

std::string network_quality_to_string(NetworkQuality quality);
std::optional<NetworkQuality> string_to_network_quality(const std::string& str);
std::string video_quality_to_string(VideoQualityLevel level);
std::optional<VideoQualityLevel> string_to_video_quality(const std::string& str);

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric plus "_-:.@" only)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = limits::MAX_IDENTIFIER_LENGTH);

/**
 * @brief Sanitize a received filename to prevent path traversal
 * @param filename Peer-provided filename
 * @return Safe base name (never empty)
 */
std::string sanitize_filename(const std::string& filename);

} // namespace rtcomm
