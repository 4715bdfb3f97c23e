/**
 * @file rtc_config.cpp
 * @brief Implementation of runtime configuration and validation helpers
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/rtc_config.hpp"
#include "rtcomm/utilities.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>

using json = nlohmann::json;

namespace rtcomm {

namespace {

const NetworkQuality kThresholdClasses[] = {
    NetworkQuality::Excellent,
    NetworkQuality::Good,
    NetworkQuality::Fair,
    NetworkQuality::Poor
};

const VideoQualityLevel kVideoLevels[] = {
    VideoQualityLevel::Low,
    VideoQualityLevel::Medium,
    VideoQualityLevel::High,
    VideoQualityLevel::Ultra
};

std::vector<std::string> normalized_extensions(const json& list) {
    std::vector<std::string> result;
    for (const auto& item : list) {
        std::string ext = utilities::to_lowercase(utilities::trim_string(item.get<std::string>()));
        if (!ext.empty() && ext.front() == '.') {
            ext.erase(0, 1);
        }
        if (!ext.empty()) {
            result.push_back(ext);
        }
    }
    return result;
}

} // namespace

// ============================================================================
// Defaults
// ============================================================================

RtcConfig::RtcConfig() {
    supported_file_types.image = {"jpg", "jpeg", "png", "gif", "webp", "bmp"};
    supported_file_types.video = {"mp4", "webm", "mov", "avi", "wmv"};
    supported_file_types.audio = {"mp3", "wav", "ogg", "aac", "m4a"};
    supported_file_types.document = {"pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "txt"};

    network_quality_thresholds[NetworkQuality::Excellent] = {2000.0, 50.0, 0.1};
    network_quality_thresholds[NetworkQuality::Good] = {1000.0, 100.0, 0.5};
    network_quality_thresholds[NetworkQuality::Fair] = {500.0, 200.0, 1.0};
    network_quality_thresholds[NetworkQuality::Poor] = {200.0, 300.0, 2.0};

    video_presets[VideoQualityLevel::Low] = {320, 240, 15, 150000};
    video_presets[VideoQualityLevel::Medium] = {640, 480, 24, 500000};
    video_presets[VideoQualityLevel::High] = {1280, 720, 30, 1000000};
    video_presets[VideoQualityLevel::Ultra] = {1920, 1080, 30, 2000000};
}

std::vector<std::string> RtcConfig::all_supported_extensions() const {
    std::vector<std::string> all;
    for (const auto* list : {&supported_file_types.image, &supported_file_types.video,
                             &supported_file_types.audio, &supported_file_types.document}) {
        all.insert(all.end(), list->begin(), list->end());
    }
    return all;
}

// ============================================================================
// JSON Serialization
// ============================================================================

std::optional<RtcConfig> RtcConfig::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            utilities::log_error("Configuration root must be a JSON object");
            return std::nullopt;
        }

        RtcConfig config;

        config.max_file_size = j.value("max_file_size", config.max_file_size);
        config.file_chunk_size = j.value("file_chunk_size", config.file_chunk_size);
        config.max_concurrent_transfers = j.value("max_concurrent_transfers", config.max_concurrent_transfers);
        config.hash_worker_threads = j.value("hash_worker_threads", config.hash_worker_threads);
        config.max_conference_participants = j.value("max_conference_participants", config.max_conference_participants);

        if (j.contains("call_timeout")) {
            config.call_timeout = std::chrono::milliseconds(j["call_timeout"].get<int64_t>());
        }
        if (j.contains("signal_expiry")) {
            config.signal_expiry = std::chrono::milliseconds(j["signal_expiry"].get<int64_t>());
        }
        if (j.contains("signal_retention_hours")) {
            config.signal_retention = std::chrono::hours(j["signal_retention_hours"].get<int64_t>());
        }
        if (j.contains("signal_cleanup_interval")) {
            config.signal_cleanup_interval = std::chrono::milliseconds(j["signal_cleanup_interval"].get<int64_t>());
        }
        if (j.contains("file_transfer_timeout")) {
            config.file_transfer_timeout = std::chrono::milliseconds(j["file_transfer_timeout"].get<int64_t>());
        }
        if (j.contains("transfer_cleanup_delay")) {
            config.transfer_cleanup_delay = std::chrono::milliseconds(j["transfer_cleanup_delay"].get<int64_t>());
        }

        if (j.contains("supported_file_types")) {
            const auto& types = j["supported_file_types"];
            if (types.contains("image")) config.supported_file_types.image = normalized_extensions(types["image"]);
            if (types.contains("video")) config.supported_file_types.video = normalized_extensions(types["video"]);
            if (types.contains("audio")) config.supported_file_types.audio = normalized_extensions(types["audio"]);
            if (types.contains("document")) config.supported_file_types.document = normalized_extensions(types["document"]);
        }

        if (j.contains("network_quality_thresholds")) {
            const auto& thresholds = j["network_quality_thresholds"];
            for (NetworkQuality quality : kThresholdClasses) {
                std::string key = network_quality_to_string(quality);
                if (!thresholds.contains(key)) {
                    continue;
                }
                auto& target = config.network_quality_thresholds[quality];
                const auto& entry = thresholds[key];
                target.bandwidth_kbps = entry.value("bandwidth", target.bandwidth_kbps);
                target.latency_ms = entry.value("latency", target.latency_ms);
                target.packet_loss = entry.value("packet_loss", target.packet_loss);
            }
        }

        if (j.contains("video_quality")) {
            const auto& presets = j["video_quality"];
            for (VideoQualityLevel level : kVideoLevels) {
                std::string key = video_quality_to_string(level);
                if (!presets.contains(key)) {
                    continue;
                }
                auto& target = config.video_presets[level];
                const auto& entry = presets[key];
                target.width = entry.value("width", target.width);
                target.height = entry.value("height", target.height);
                target.frame_rate = entry.value("frame_rate", target.frame_rate);
                target.bitrate = entry.value("bitrate", target.bitrate);
            }
        }

        if (j.contains("default_video_quality")) {
            auto level = string_to_video_quality(j["default_video_quality"].get<std::string>());
            if (!level) {
                utilities::log_error("Unknown default_video_quality in configuration");
                return std::nullopt;
            }
            config.default_video_quality = *level;
        }

        if (j.contains("features")) {
            const auto& f = j["features"];
            config.features.enable_voice_call = f.value("enable_voice_call", config.features.enable_voice_call);
            config.features.enable_video_call = f.value("enable_video_call", config.features.enable_video_call);
            config.features.enable_screen_share = f.value("enable_screen_share", config.features.enable_screen_share);
            config.features.enable_file_transfer = f.value("enable_file_transfer", config.features.enable_file_transfer);
            config.features.enable_group_call = f.value("enable_group_call", config.features.enable_group_call);
        }

        config.log_file = j.value("log_file", config.log_file);
        config.log_level = j.value("log_level", config.log_level);

        std::string problem = config.validate();
        if (!problem.empty()) {
            utilities::log_error("Invalid configuration: " + problem);
            return std::nullopt;
        }

        return config;

    } catch (const std::exception& e) {
        utilities::log_error("Failed to parse configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::string RtcConfig::to_json() const {
    json j;
    j["max_file_size"] = max_file_size;
    j["file_chunk_size"] = file_chunk_size;
    j["max_concurrent_transfers"] = max_concurrent_transfers;
    j["hash_worker_threads"] = hash_worker_threads;
    j["max_conference_participants"] = max_conference_participants;
    j["call_timeout"] = call_timeout.count();
    j["signal_expiry"] = signal_expiry.count();
    j["signal_retention_hours"] = signal_retention.count();
    j["signal_cleanup_interval"] = signal_cleanup_interval.count();
    j["file_transfer_timeout"] = file_transfer_timeout.count();
    j["transfer_cleanup_delay"] = transfer_cleanup_delay.count();
    j["supported_file_types"] = {
        {"image", supported_file_types.image},
        {"video", supported_file_types.video},
        {"audio", supported_file_types.audio},
        {"document", supported_file_types.document}
    };

    json thresholds = json::object();
    for (const auto& [quality, threshold] : network_quality_thresholds) {
        thresholds[network_quality_to_string(quality)] = {
            {"bandwidth", threshold.bandwidth_kbps},
            {"latency", threshold.latency_ms},
            {"packet_loss", threshold.packet_loss}
        };
    }
    j["network_quality_thresholds"] = thresholds;

    json presets = json::object();
    for (const auto& [level, preset] : video_presets) {
        presets[video_quality_to_string(level)] = {
            {"width", preset.width},
            {"height", preset.height},
            {"frame_rate", preset.frame_rate},
            {"bitrate", preset.bitrate}
        };
    }
    j["video_quality"] = presets;
    j["default_video_quality"] = video_quality_to_string(default_video_quality);

    j["features"] = {
        {"enable_voice_call", features.enable_voice_call},
        {"enable_video_call", features.enable_video_call},
        {"enable_screen_share", features.enable_screen_share},
        {"enable_file_transfer", features.enable_file_transfer},
        {"enable_group_call", features.enable_group_call}
    };
    j["log_file"] = log_file;
    j["log_level"] = log_level;

    return j.dump(2);
}

std::string RtcConfig::validate() const {
    if (max_file_size == 0) {
        return "max_file_size must be positive";
    }
    if (file_chunk_size < limits::MIN_CHUNK_SIZE || file_chunk_size > limits::MAX_CHUNK_SIZE) {
        return "file_chunk_size out of range";
    }
    if (call_timeout.count() <= 0) {
        return "call_timeout must be positive";
    }
    if (signal_expiry.count() <= 0) {
        return "signal_expiry must be positive";
    }
    if (signal_cleanup_interval.count() <= 0) {
        return "signal_cleanup_interval must be positive";
    }
    if (transfer_cleanup_delay.count() < 0) {
        return "transfer_cleanup_delay must not be negative";
    }
    if (hash_worker_threads == 0) {
        return "hash_worker_threads must be positive";
    }
    if (max_conference_participants < 2) {
        return "max_conference_participants must be at least 2";
    }
    if (!utilities::parse_log_level(log_level)) {
        return "unknown log_level '" + log_level + "'";
    }
    return "";
}

// ============================================================================
// Loading
// ============================================================================

std::optional<RtcConfig> load_config(const std::filesystem::path& path) {
    auto content = utilities::read_file(path.string());
    if (!content) {
        return std::nullopt;
    }
    return RtcConfig::from_json(*content);
}

RtcConfig load_default_config() {
    std::string path = utilities::get_env("RTCOMM_CONFIG");
    if (path.empty()) {
        return RtcConfig{};
    }

    auto config = load_config(path);
    if (!config) {
        utilities::log_warn("Falling back to default configuration, could not load " + path);
        return RtcConfig{};
    }

    utilities::log_info("Loaded configuration from " + path);
    return *config;
}

std::filesystem::path get_data_directory() {
    const char* env_data_dir = std::getenv("RTCOMM_DATA_DIR");

    std::filesystem::path data_dir;
    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        data_dir = env_data_dir;
    } else {
#ifdef _WIN32
        data_dir = "C:\\ProgramData\\FSI\\RTComm";
#else
        data_dir = "/opt/fsi/var/rtcomm";
#endif
    }

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

// ============================================================================
// Quality Helpers
// ============================================================================

NetworkQuality classify_network_quality(
    const NetworkSample& sample,
    const std::map<NetworkQuality, NetworkThreshold>& thresholds
) {
    for (NetworkQuality quality : kThresholdClasses) {
        auto it = thresholds.find(quality);
        if (it == thresholds.end()) {
            continue;
        }
        const auto& t = it->second;
        if (sample.bandwidth_kbps >= t.bandwidth_kbps &&
            sample.latency_ms <= t.latency_ms &&
            sample.packet_loss <= t.packet_loss) {
            return quality;
        }
    }
    return NetworkQuality::Critical;
}

VideoQualityLevel recommended_video_quality(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::Excellent: return VideoQualityLevel::Ultra;
        case NetworkQuality::Good:      return VideoQualityLevel::High;
        case NetworkQuality::Fair:      return VideoQualityLevel::Medium;
        case NetworkQuality::Poor:      return VideoQualityLevel::Low;
        case NetworkQuality::Critical:  return VideoQualityLevel::Low;
        case NetworkQuality::Unknown:   return VideoQualityLevel::Medium;
    }
    return VideoQualityLevel::Medium;
}

std::string network_quality_to_string(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::Excellent: return "excellent";
        case NetworkQuality::Good: return "good";
        case NetworkQuality::Fair: return "fair";
        case NetworkQuality::Poor: return "poor";
        case NetworkQuality::Critical: return "critical";
        case NetworkQuality::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<NetworkQuality> string_to_network_quality(const std::string& str) {
    if (str == "excellent") return NetworkQuality::Excellent;
    if (str == "good") return NetworkQuality::Good;
    if (str == "fair") return NetworkQuality::Fair;
    if (str == "poor") return NetworkQuality::Poor;
    if (str == "critical") return NetworkQuality::Critical;
    if (str == "unknown") return NetworkQuality::Unknown;
    return std::nullopt;
}

std::string video_quality_to_string(VideoQualityLevel level) {
    switch (level) {
        case VideoQualityLevel::Low: return "low";
        case VideoQualityLevel::Medium: return "medium";
        case VideoQualityLevel::High: return "high";
        case VideoQualityLevel::Ultra: return "ultra";
    }
    return "medium";
}

std::optional<VideoQualityLevel> string_to_video_quality(const std::string& str) {
    if (str == "low") return VideoQualityLevel::Low;
    if (str == "medium") return VideoQualityLevel::Medium;
    if (str == "high") return VideoQualityLevel::High;
    if (str == "ultra") return VideoQualityLevel::Ultra;
    return std::nullopt;
}

// ============================================================================
// Input Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != ':' && c != '.' && c != '@') {
            return false;
        }
    }

    return true;
}

std::string sanitize_filename(const std::string& filename) {
    // Keep only the last path component
    std::string base = filename;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string sanitized;
    sanitized.reserve(base.size());
    for (char c : base) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '_' || c == '-' || c == ' ' || uc >= 0x80) {
            sanitized += c;
        } else {
            sanitized += '_';
        }
    }

    // No hidden files or ".." remnants
    while (!sanitized.empty() && sanitized.front() == '.') {
        sanitized.erase(0, 1);
    }

    if (sanitized.length() > limits::MAX_FILENAME_LENGTH) {
        std::string ext = utilities::file_extension(sanitized);
        size_t keep = limits::MAX_FILENAME_LENGTH - (ext.empty() ? 0 : ext.size() + 1);
        sanitized = sanitized.substr(0, keep) + (ext.empty() ? "" : "." + ext);
    }

    if (sanitized.empty()) {
        sanitized = "unnamed";
    }

    return sanitized;
}

} // namespace rtcomm
