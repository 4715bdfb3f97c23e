/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "rtcomm/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <sodium.h>

// OpenSSL for SHA-256
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace rtcomm {
namespace utilities {

namespace {
    constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
    constexpr size_t LOG_FILE_COUNT = 3;

    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    // Caller holds g_logger_mutex
    void build_logger_locked(const std::string& log_file, LogLevel level) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, LOG_FILE_MAX_BYTES, LOG_FILE_COUNT));
        }

        auto logger = std::make_shared<spdlog::logger>("rtcomm", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
        logger->flush_on(spdlog::level::err);

        g_logger = logger;
        spdlog::set_default_logger(logger);
    }

    std::shared_ptr<spdlog::logger> current_logger() {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (!g_logger) {
            // Not configured explicitly: console only, level from the environment
            LogLevel level = parse_log_level(get_env("RTCOMM_LOG_LEVEL", "info")).value_or(LogLevel::INFO);
            try {
                build_logger_locked("", level);
            } catch (const spdlog::spdlog_ex& ex) {
                std::fprintf(stderr, "rtcomm: console logger unavailable: %s\n", ex.what());
            }
        }
        return g_logger;
    }

    void ensure_sodium() {
        static const bool ready = (sodium_init() >= 0);
        if (!ready) {
            throw std::runtime_error("libsodium initialization failed");
        }
    }

    bool is_space(unsigned char ch) {
        return std::isspace(ch) != 0;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    try {
        build_logger_locked(log_file, level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "rtcomm: log initialization failed (%s): %s\n", log_file.c_str(), ex.what());
    }
}

void log(LogLevel level, const std::string& message) {
    if (auto logger = current_logger()) {
        logger->log(to_spdlog_level(level), message);
    }
}

void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void log_info(const std::string& message) { log(LogLevel::INFO, message); }
void log_warn(const std::string& message) { log(LogLevel::WARN, message); }
void log_error(const std::string& message) { log(LogLevel::ERROR, message); }
void log_critical(const std::string& message) { log(LogLevel::CRITICAL, message); }

std::optional<LogLevel> parse_log_level(const std::string& name) {
    static const std::array<std::pair<const char*, LogLevel>, 6> names = {{
        {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},
        {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN},
        {"error", LogLevel::ERROR},
        {"critical", LogLevel::CRITICAL},
    }};

    std::string lower = to_lowercase(trim_string(name));
    for (const auto& [key, level] : names) {
        if (lower == key) {
            return level;
        }
    }
    return std::nullopt;
}

// ============================================================================
// TIME/FORMATTING FUNCTIONS
// ============================================================================

uint64_t current_time_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string format_file_size(uint64_t size) {
    static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(size);
    size_t unit = 0;
    for (; value >= 1024.0 && unit + 1 < units.size(); ++unit) {
        value /= 1024.0;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, units[unit]);
    return buffer;
}

std::string format_duration(uint64_t seconds) {
    const uint64_t hours = seconds / 3600;
    const uint64_t minutes = seconds / 60 % 60;
    const uint64_t secs = seconds % 60;

    std::string out;
    if (hours > 0) {
        out += std::to_string(hours) + "h ";
    }
    if (hours > 0 || minutes > 0) {
        out += std::to_string(minutes) + "m ";
    }
    return out + std::to_string(secs) + "s";
}

// ============================================================================
// HASHING/ENCODING FUNCTIONS
// ============================================================================

std::string sha256_hex(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        (size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1) ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    // libsodium hex encoder: lowercase, two characters per byte plus terminator
    std::string hex(digest_len * 2 + 1, '\0');
    ensure_sodium();
    sodium_bin2hex(hex.data(), hex.size(), digest, digest_len);
    hex.pop_back();
    return hex;
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string bytes_to_base64(const std::vector<uint8_t>& bytes) {
    ensure_sodium();

    std::string encoded(sodium_base64_encoded_len(bytes.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), bytes.data(), bytes.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    // Drop the terminator written by libsodium
    encoded.resize(encoded.size() - 1);
    return encoded;
}

std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64) {
    ensure_sodium();

    std::vector<uint8_t> decoded(base64.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;

    if (sodium_base642bin(decoded.data(), decoded.size(), base64.data(), base64.size(),
                          nullptr, &decoded_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != base64.data() + base64.size()) {
        return std::nullopt;
    }

    decoded.resize(decoded_len);
    return decoded;
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        log_error("Cannot open " + file_path);
        return std::nullopt;
    }

    std::vector<uint8_t> content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        log_error("Read failed: " + file_path);
        return std::nullopt;
    }
    return content;
}

bool write_file_binary(const std::string& file_path, const std::vector<uint8_t>& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            log_error("Cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        log_error("Cannot open " + file_path + " for writing");
        return false;
    }

    file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(file);
}

std::optional<std::string> read_file(const std::string& file_path) {
    auto bytes = read_file_binary(file_path);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    if (str.empty()) {
        return parts;
    }

    size_t begin = 0;
    for (size_t pos = str.find(delimiter); pos != std::string::npos; pos = str.find(delimiter, begin)) {
        parts.push_back(str.substr(begin, pos - begin));
        begin = pos + 1;
    }
    // A trailing delimiter does not produce an empty last field
    if (begin < str.size()) {
        parts.push_back(str.substr(begin));
    }
    return parts;
}

std::string trim_string(const std::string& str) {
    auto first = std::find_if_not(str.begin(), str.end(), is_space);
    auto last = std::find_if_not(str.rbegin(), std::string::const_reverse_iterator(first), is_space).base();
    return std::string(first, last);
}

std::string to_lowercase(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    for (unsigned char ch : str) {
        lower.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), str.begin());
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::string file_extension(const std::string& file_name) {
    auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return "";
    }
    // "archive/name" style paths: a dot before the last separator is not an extension
    auto slash = file_name.find_last_of("/\\");
    if (slash != std::string::npos && slash > dot) {
        return "";
    }
    return to_lowercase(file_name.substr(dot + 1));
}

// ============================================================================
// ENVIRONMENT/IDENTIFIER FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value && *value ? std::string(value) : default_value;
}

std::string generate_random_string(size_t length) {
    static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    ensure_sodium();

    std::string out(length, '0');
    for (char& ch : out) {
        ch = alphabet[randombytes_uniform(sizeof(alphabet) - 1)];
    }
    return out;
}

std::string generate_uuid() {
    ensure_sodium();

    uint8_t bytes[16];
    randombytes_buf(bytes, sizeof(bytes));
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);   // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);   // RFC 4122 variant

    char hex[33];
    sodium_bin2hex(hex, sizeof(hex), bytes, sizeof(bytes));

    std::string uuid(hex);
    for (size_t pos : {20u, 16u, 12u, 8u}) {
        uuid.insert(pos, 1, '-');
    }
    return uuid;
}

} // namespace utilities
} // namespace rtcomm
