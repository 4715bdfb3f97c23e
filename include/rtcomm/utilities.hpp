/**
 * @file utilities.hpp
 * @brief Common utility functions for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Shared helpers for the signaling, call and transfer layers. Logging goes
 * through a single spdlog logger named "rtcomm"; digests use OpenSSL and
 * encoding/randomness use libsodium.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace rtcomm {
namespace utilities {

/// Severity passed to log(); maps one-to-one onto spdlog levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Configure the shared logger
 *
 * Optional. The first log call without prior configuration creates a
 * console-only logger whose level comes from RTCOMM_LOG_LEVEL.
 *
 * @param log_file Rotating log file path, empty for console only
 * @param level Messages below this level are discarded
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Parse log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

// ============================================================================
// Time
// ============================================================================

/// Unix time in milliseconds (system clock)
uint64_t current_time_ms();

/// Byte count with one decimal and a binary unit, e.g. "1.5 MB"
std::string format_file_size(uint64_t size);

/// Call length such as "2m 5s"; zero leading components are omitted
std::string format_duration(uint64_t seconds);

// ============================================================================
// Hashing and Encoding
// ============================================================================

/**
 * @brief SHA-256 digest of a byte range as lowercase hex
 * @param data Pointer to bytes (may be null when size is 0)
 * @param size Number of bytes
 * @return 64-character hex string
 */
std::string sha256_hex(const uint8_t* data, size_t size);

/**
 * @brief SHA-256 digest of a byte vector as lowercase hex
 */
std::string sha256_hex(const std::vector<uint8_t>& data);

/**
 * @brief Encode bytes as standard base64
 * @param bytes Input bytes
 * @return Base64 string
 */
std::string bytes_to_base64(const std::vector<uint8_t>& bytes);

/**
 * @brief Decode standard base64
 * @param base64 Base64 string
 * @return Decoded bytes or std::nullopt if malformed
 */
std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

// ============================================================================
// File I/O
// ============================================================================

/**
 * @brief Load a whole file
 * @return Bytes, or std::nullopt (logged) when the file cannot be read
 */
std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path);

/// Replace a file's contents, creating missing parent directories
bool write_file_binary(const std::string& file_path, const std::vector<uint8_t>& content);

/// Text variant of read_file_binary()
std::optional<std::string> read_file(const std::string& file_path);

// ============================================================================
// Strings
// ============================================================================

/// Empty fields between delimiters are kept; a trailing delimiter adds none
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim_string(const std::string& str);
std::string to_lowercase(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

/**
 * @brief Lowercased extension of a file name without the dot
 * @param file_name File name such as "Photo.JPG"
 * @return "jpg", or empty string when there is no extension
 */
std::string file_extension(const std::string& file_name);

// ============================================================================
// Environment and Identifiers
// ============================================================================

/// Environment variable, or default_value when unset or empty
std::string get_env(const std::string& name, const std::string& default_value = "");

/// Random [0-9a-z] string drawn from the libsodium CSPRNG
std::string generate_random_string(size_t length);

/// Random RFC 4122 version 4 UUID in canonical lowercase form
std::string generate_uuid();

} // namespace utilities
} // namespace rtcomm
