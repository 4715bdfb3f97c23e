/**
 * @file media_file.hpp
 * @brief File, chunk and transfer-progress types for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Data model of the chunked transfer engine:
 * - MediaFile (in-memory file with name and MIME type)
 * - FileMetadata / FileChunk with JSON serialization
 * - TransferStatus state values and TransferProgress snapshots
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rtcomm {

/**
 * @brief Allow-list category of a file
 */
enum class FileCategory {
    IMAGE,
    VIDEO,
    AUDIO,
    DOCUMENT,
    UNKNOWN
};

/**
 * @brief Transfer lifecycle states
 */
enum class TransferStatus {
    PREPARING,       ///< Split/registered, nothing sent yet
    TRANSFERRING,    ///< Chunks moving
    PAUSED,          ///< Temporarily halted
    COMPLETED,       ///< Terminal: reassembled and verified
    FAILED,          ///< Terminal: validation or integrity failure
    CANCELLED        ///< Terminal: cancelled by a user
};

/**
 * @brief Pixel dimensions
 */
struct Dimensions {
    int width = 0;
    int height = 0;
};

/**
 * @brief In-memory file
 */
struct MediaFile {
    std::string name;               ///< File name including extension
    std::string mime_type;          ///< MIME type (may be empty)
    std::vector<uint8_t> data;      ///< File content

    /**
     * @brief Load a file from disk (MIME type guessed from extension)
     * @param path File path
     * @return MediaFile or std::nullopt if unreadable
     */
    static std::optional<MediaFile> load(const std::string& path);

    /**
     * @brief Size in bytes
     */
    uint64_t size() const { return data.size(); }
};

/**
 * @brief Metadata describing a chunked transfer
 */
struct FileMetadata {
    std::string transfer_id;                    ///< Transfer identifier
    std::string file_name;                      ///< Original file name
    uint64_t file_size = 0;                     ///< Size in bytes
    std::string file_type;                      ///< Lowercased extension
    std::string mime_type;                      ///< MIME type
    std::string file_hash;                      ///< SHA-256 hex of the whole file
    uint32_t chunk_size = 0;                    ///< Size of every chunk but the last
    uint32_t total_chunks = 0;                  ///< ceil(file_size / chunk_size)
    TransferStatus transfer_status = TransferStatus::PREPARING;
    uint64_t created_at = 0;                    ///< Creation time (ms since epoch)
    std::optional<std::string> thumbnail_data;  ///< JPEG data URL for images
    std::optional<double> duration;             ///< Seconds, audio/video
    std::optional<Dimensions> dimensions;       ///< Image/video size

    std::string to_json() const;
    static std::optional<FileMetadata> from_json(const std::string& json);
};

/**
 * @brief One contiguous slice of a file
 */
struct FileChunk {
    std::string transfer_id;        ///< Transfer identifier
    uint32_t chunk_index = 0;       ///< Position in [0, total_chunks)
    uint32_t chunk_size = 0;        ///< Bytes in this chunk
    std::vector<uint8_t> data;      ///< Chunk content
    std::string hash;               ///< SHA-256 hex of data

    /**
     * @brief Serialize to JSON (data as base64)
     */
    std::string to_json() const;

    /**
     * @brief Deserialize from JSON
     * @return FileChunk or std::nullopt if invalid or size does not match data
     */
    static std::optional<FileChunk> from_json(const std::string& json);
};

/**
 * @brief Read-only snapshot of a transfer
 */
struct TransferProgress {
    std::string transfer_id;
    std::string file_name;
    uint64_t total_size = 0;                ///< File size in bytes
    uint64_t transferred_size = 0;          ///< Bytes in processed chunks
    uint32_t total_chunks = 0;
    uint32_t chunks_processed = 0;
    TransferStatus status = TransferStatus::PREPARING;
    uint64_t started_at = 0;                ///< ms since epoch
    double speed = 0.0;                     ///< Bytes per second
    double estimated_time_remaining = 0.0;  ///< Seconds
    std::optional<std::string> error;       ///< Failure description

    /**
     * @brief Completion percentage (0-100)
     */
    double percentage() const;
};

/**
 * @brief Result of splitting a file
 */
struct SplitResult {
    FileMetadata metadata;
    std::vector<FileChunk> chunks;
};

/**
 * @brief Probed media properties
 */
struct MediaMetadata {
    std::optional<double> duration;         ///< Seconds
    std::optional<Dimensions> dimensions;   ///< Pixels
};

// ============================================================================
// Helpers
// ============================================================================

std::string transfer_status_to_string(TransferStatus status);
std::optional<TransferStatus> string_to_transfer_status(const std::string& str);
std::string file_category_to_string(FileCategory category);

/**
 * @brief Whether a status is terminal (completed, failed, cancelled)
 */
bool is_terminal_status(TransferStatus status);

/**
 * @brief MIME type for a lowercased extension ("application/octet-stream" if unknown)
 */
std::string mime_type_for_extension(const std::string& extension);

} // namespace rtcomm
