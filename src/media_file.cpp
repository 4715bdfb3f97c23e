/**
 * @file media_file.cpp
 * @brief Implementation of transfer data types and serialization
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/media_file.hpp"
#include "rtcomm/utilities.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>

using json = nlohmann::json;

namespace rtcomm {

// ============================================================================
// Status / Category Conversion
// ============================================================================

std::string transfer_status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PREPARING: return "preparing";
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::PAUSED: return "paused";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "failed";
}

std::optional<TransferStatus> string_to_transfer_status(const std::string& str) {
    if (str == "preparing") return TransferStatus::PREPARING;
    if (str == "transferring") return TransferStatus::TRANSFERRING;
    if (str == "paused") return TransferStatus::PAUSED;
    if (str == "completed") return TransferStatus::COMPLETED;
    if (str == "failed") return TransferStatus::FAILED;
    if (str == "cancelled") return TransferStatus::CANCELLED;
    return std::nullopt;
}

std::string file_category_to_string(FileCategory category) {
    switch (category) {
        case FileCategory::IMAGE: return "image";
        case FileCategory::VIDEO: return "video";
        case FileCategory::AUDIO: return "audio";
        case FileCategory::DOCUMENT: return "document";
        case FileCategory::UNKNOWN: return "unknown";
    }
    return "unknown";
}

bool is_terminal_status(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

std::string mime_type_for_extension(const std::string& extension) {
    static const std::map<std::string, std::string> mime_types = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
        {"gif", "image/gif"}, {"webp", "image/webp"}, {"bmp", "image/bmp"},
        {"mp4", "video/mp4"}, {"webm", "video/webm"}, {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"}, {"wmv", "video/x-ms-wmv"},
        {"mp3", "audio/mpeg"}, {"wav", "audio/wav"}, {"ogg", "audio/ogg"},
        {"aac", "audio/aac"}, {"m4a", "audio/mp4"},
        {"pdf", "application/pdf"}, {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"xls", "application/vnd.ms-excel"},
        {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {"ppt", "application/vnd.ms-powerpoint"},
        {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {"txt", "text/plain"}
    };

    auto it = mime_types.find(extension);
    return it != mime_types.end() ? it->second : "application/octet-stream";
}

// ============================================================================
// MediaFile
// ============================================================================

std::optional<MediaFile> MediaFile::load(const std::string& path) {
    auto content = utilities::read_file_binary(path);
    if (!content) {
        return std::nullopt;
    }

    MediaFile file;
    file.name = std::filesystem::path(path).filename().string();
    file.mime_type = mime_type_for_extension(utilities::file_extension(file.name));
    file.data = std::move(*content);
    return file;
}

// ============================================================================
// FileMetadata Serialization
// ============================================================================

std::string FileMetadata::to_json() const {
    json j;
    j["transfer_id"] = transfer_id;
    j["file_name"] = file_name;
    j["file_size"] = file_size;
    j["file_type"] = file_type;
    j["mime_type"] = mime_type;
    j["file_hash"] = file_hash;
    j["chunk_size"] = chunk_size;
    j["total_chunks"] = total_chunks;
    j["transfer_status"] = transfer_status_to_string(transfer_status);
    j["created_at"] = created_at;
    if (thumbnail_data) {
        j["thumbnail_data"] = *thumbnail_data;
    }
    if (duration) {
        j["duration"] = *duration;
    }
    if (dimensions) {
        j["dimensions"] = {{"width", dimensions->width}, {"height", dimensions->height}};
    }
    return j.dump();
}

std::optional<FileMetadata> FileMetadata::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        FileMetadata metadata;
        metadata.transfer_id = j.at("transfer_id").get<std::string>();
        metadata.file_name = j.at("file_name").get<std::string>();
        metadata.file_size = j.at("file_size").get<uint64_t>();
        metadata.file_type = j.value("file_type", "");
        metadata.mime_type = j.value("mime_type", "");
        metadata.file_hash = j.at("file_hash").get<std::string>();
        metadata.chunk_size = j.at("chunk_size").get<uint32_t>();
        metadata.total_chunks = j.at("total_chunks").get<uint32_t>();
        metadata.created_at = j.value("created_at", uint64_t{0});

        auto status = string_to_transfer_status(j.value("transfer_status", "preparing"));
        if (!status) {
            return std::nullopt;
        }
        metadata.transfer_status = *status;

        if (j.contains("thumbnail_data") && j["thumbnail_data"].is_string()) {
            metadata.thumbnail_data = j["thumbnail_data"].get<std::string>();
        }
        if (j.contains("duration") && j["duration"].is_number()) {
            metadata.duration = j["duration"].get<double>();
        }
        if (j.contains("dimensions") && j["dimensions"].is_object()) {
            metadata.dimensions = Dimensions{
                j["dimensions"].value("width", 0),
                j["dimensions"].value("height", 0)
            };
        }

        // Reject metadata that breaks the chunk-count invariant
        if (metadata.chunk_size == 0) {
            return std::nullopt;
        }
        uint64_t expected = (metadata.file_size + metadata.chunk_size - 1) / metadata.chunk_size;
        if (expected != metadata.total_chunks) {
            return std::nullopt;
        }

        return metadata;

    } catch (const std::exception& e) {
        utilities::log_debug("Malformed file metadata: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// FileChunk Serialization
// ============================================================================

std::string FileChunk::to_json() const {
    json j;
    j["transfer_id"] = transfer_id;
    j["chunk_index"] = chunk_index;
    j["chunk_size"] = chunk_size;
    j["data"] = utilities::bytes_to_base64(data);
    j["hash"] = hash;
    return j.dump();
}

std::optional<FileChunk> FileChunk::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        FileChunk chunk;
        chunk.transfer_id = j.at("transfer_id").get<std::string>();
        chunk.chunk_index = j.at("chunk_index").get<uint32_t>();
        chunk.chunk_size = j.at("chunk_size").get<uint32_t>();
        chunk.hash = j.at("hash").get<std::string>();

        auto data = utilities::base64_to_bytes(j.at("data").get<std::string>());
        if (!data || data->size() != chunk.chunk_size) {
            return std::nullopt;
        }
        chunk.data = std::move(*data);

        return chunk;

    } catch (const std::exception& e) {
        utilities::log_debug("Malformed file chunk: " + std::string(e.what()));
        return std::nullopt;
    }
}

// ============================================================================
// TransferProgress
// ============================================================================

double TransferProgress::percentage() const {
    if (total_chunks == 0) {
        return status == TransferStatus::COMPLETED ? 100.0 : 0.0;
    }
    return 100.0 * static_cast<double>(chunks_processed) / static_cast<double>(total_chunks);
}

} // namespace rtcomm
