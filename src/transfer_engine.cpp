/**
 * @file transfer_engine.cpp
 * @brief Implementation of chunked file transfer
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/transfer_engine.hpp"
#include "rtcomm/utilities.hpp"

#include <algorithm>
#include <future>

namespace rtcomm {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

/// Size of chunk_index in a file partitioned by chunk_size
uint64_t expected_chunk_bytes(uint64_t file_size, uint32_t chunk_size, uint32_t total_chunks, uint32_t chunk_index) {
    if (chunk_index + 1 < total_chunks) {
        return chunk_size;
    }
    return file_size - static_cast<uint64_t>(chunk_index) * chunk_size;
}

uint32_t chunk_count(uint64_t file_size, uint32_t chunk_size) {
    return static_cast<uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

} // anonymous namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

TransferEngine::TransferEngine(RtcConfig config)
    : config_(std::move(config))
    , hash_pool_(std::max<size_t>(1, config_.hash_worker_threads))
    , work_guard_(asio::make_work_guard(io_context_)) {

    timer_thread_ = std::thread([this]() {
        io_context_.run();
    });

    utilities::log_debug("TransferEngine created (chunk size " +
                         utilities::format_file_size(config_.file_chunk_size) + ", max file " +
                         utilities::format_file_size(config_.max_file_size) + ")");
}

TransferEngine::~TransferEngine() {
    stopping_ = true;

    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        for (auto& [id, entry] : transfers_) {
            entry.cancelled->store(true);
            release_timer_locked(entry);
        }
        transfers_.clear();
    }

    // Cancelled timers drain, then run() returns
    work_guard_.reset();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    hash_pool_.join();
}

// ============================================================================
// Validation
// ============================================================================

FileCategory TransferEngine::get_file_category(const std::string& file_name) const {
    std::string ext = utilities::file_extension(file_name);
    if (ext.empty()) {
        return FileCategory::UNKNOWN;
    }

    const auto& types = config_.supported_file_types;
    if (contains(types.image, ext)) return FileCategory::IMAGE;
    if (contains(types.video, ext)) return FileCategory::VIDEO;
    if (contains(types.audio, ext)) return FileCategory::AUDIO;
    if (contains(types.document, ext)) return FileCategory::DOCUMENT;
    return FileCategory::UNKNOWN;
}

bool TransferEngine::validate_file_type(const MediaFile& file) const {
    return get_file_category(file.name) != FileCategory::UNKNOWN;
}

bool TransferEngine::validate_file_size(const MediaFile& file) const {
    return file.size() <= config_.max_file_size;
}

SupportedFileTypes TransferEngine::get_supported_file_types() const {
    return config_.supported_file_types;
}

void TransferEngine::validate_or_throw(const std::string& file_name, uint64_t file_size) const {
    if (get_file_category(file_name) == FileCategory::UNKNOWN) {
        std::string ext = utilities::file_extension(file_name);
        throw RtcError(ErrorCode::UnsupportedFileType,
                       "File type not supported: " + (ext.empty() ? std::string("(none)") : ext));
    }

    if (file_size > config_.max_file_size) {
        throw RtcError(ErrorCode::FileTooLarge,
                       "File size " + utilities::format_file_size(file_size) +
                       " exceeds maximum " + utilities::format_file_size(config_.max_file_size));
    }
}

// ============================================================================
// Chunking
// ============================================================================

std::string TransferEngine::generate_transfer_id() const {
    return "transfer-" + std::to_string(utilities::current_time_ms()) + "-" +
           utilities::generate_random_string(9);
}

std::vector<std::string> TransferEngine::hash_in_pool(
    const MediaFile& file,
    uint32_t chunk_size,
    const std::shared_ptr<std::atomic<bool>>& cancelled
) {
    std::vector<std::future<std::string>> futures;

    auto submit = [&](const uint8_t* data, size_t size) {
        auto task = std::make_shared<std::packaged_task<std::string()>>(
            [data, size, cancelled]() -> std::string {
                if (cancelled->load()) {
                    return {};
                }
                return utilities::sha256_hex(data, size);
            });
        futures.push_back(task->get_future());
        asio::post(hash_pool_, [task]() { (*task)(); });
    };

    // Index 0 is the whole file, then one entry per chunk
    submit(file.data.data(), file.data.size());
    for (uint64_t offset = 0; offset < file.data.size(); offset += chunk_size) {
        size_t size = static_cast<size_t>(std::min<uint64_t>(chunk_size, file.data.size() - offset));
        submit(file.data.data() + offset, size);
    }

    // Barrier: every worker is done with the file buffer before anything is rethrown
    for (auto& future : futures) {
        future.wait();
    }

    std::vector<std::string> hashes;
    hashes.reserve(futures.size());
    for (auto& future : futures) {
        hashes.push_back(future.get());
    }

    if (cancelled->load()) {
        throw RtcError(ErrorCode::Cancelled, "Transfer cancelled while hashing");
    }

    return hashes;
}

SplitResult TransferEngine::split_file_to_chunks(const MediaFile& file, std::optional<uint32_t> chunk_size) {
    validate_or_throw(file.name, file.size());

    uint32_t size = chunk_size.value_or(config_.file_chunk_size);
    if (size < limits::MIN_CHUNK_SIZE || size > limits::MAX_CHUNK_SIZE) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid chunk size: " + std::to_string(size));
    }

    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        size_t running = std::count_if(transfers_.begin(), transfers_.end(), [](const auto& item) {
            return item.second.outgoing && !is_terminal_status(item.second.progress.status);
        });
        if (running >= config_.max_concurrent_transfers) {
            throw RtcError(ErrorCode::InvalidState,
                           "Too many concurrent transfers (" + std::to_string(running) + ")");
        }
    }

    std::string transfer_id = generate_transfer_id();
    uint32_t total_chunks = chunk_count(file.size(), size);

    TransferEntry entry;
    entry.outgoing = true;
    entry.chunk_size = size;
    entry.cancelled = std::make_shared<std::atomic<bool>>(false);
    entry.progress.transfer_id = transfer_id;
    entry.progress.file_name = file.name;
    entry.progress.total_size = file.size();
    entry.progress.total_chunks = total_chunks;
    entry.progress.status = TransferStatus::PREPARING;
    entry.progress.started_at = utilities::current_time_ms();

    auto cancelled = entry.cancelled;
    uint64_t created_at = entry.progress.started_at;
    register_entry(transfer_id, std::move(entry));

    std::vector<std::string> hashes;
    try {
        hashes = hash_in_pool(file, size, cancelled);
    } catch (const RtcError&) {
        throw;
    } catch (const std::exception& e) {
        std::optional<TransferProgress> snapshot;
        {
            std::lock_guard<std::mutex> lock(transfers_mutex_);
            auto it = transfers_.find(transfer_id);
            if (it != transfers_.end() && !is_terminal_status(it->second.progress.status)) {
                snapshot = apply_status_locked(transfer_id, it->second, TransferStatus::FAILED, std::string(e.what()));
            }
        }
        if (snapshot) {
            notify_progress(*snapshot);
        }
        notify_error(transfer_id, ErrorCode::IntegrityFailed, e.what());
        throw RtcError(ErrorCode::IntegrityFailed, std::string("Hashing failed: ") + e.what());
    }

    SplitResult result;
    result.chunks.reserve(total_chunks);
    for (uint32_t i = 0; i < total_chunks; ++i) {
        uint64_t offset = static_cast<uint64_t>(i) * size;
        uint64_t bytes = expected_chunk_bytes(file.size(), size, total_chunks, i);

        FileChunk chunk;
        chunk.transfer_id = transfer_id;
        chunk.chunk_index = i;
        chunk.chunk_size = static_cast<uint32_t>(bytes);
        chunk.data.assign(file.data.begin() + offset, file.data.begin() + offset + bytes);
        chunk.hash = hashes[i + 1];
        result.chunks.push_back(std::move(chunk));
    }

    FileMetadata& metadata = result.metadata;
    metadata.transfer_id = transfer_id;
    metadata.file_name = file.name;
    metadata.file_size = file.size();
    metadata.file_type = utilities::file_extension(file.name);
    metadata.mime_type = file.mime_type.empty() ? mime_type_for_extension(metadata.file_type) : file.mime_type;
    metadata.file_hash = hashes[0];
    metadata.chunk_size = size;
    metadata.total_chunks = total_chunks;
    metadata.transfer_status = TransferStatus::PREPARING;
    metadata.created_at = created_at;

    // Enrichment never blocks the transfer
    if (get_file_category(file.name) == FileCategory::IMAGE) {
        try {
            metadata.thumbnail_data = generate_thumbnail(file);
        } catch (const RtcError& e) {
            utilities::log_warn("Thumbnail skipped for " + file.name + ": " + e.what());
        }
    }
    MediaMetadata probed = extract_media_metadata(file);
    metadata.duration = probed.duration;
    metadata.dimensions = probed.dimensions;

    if (cancelled->load()) {
        throw RtcError(ErrorCode::Cancelled, "Transfer cancelled: " + transfer_id);
    }

    utilities::log_info("Prepared transfer " + transfer_id + ": " + file.name + " (" +
                        utilities::format_file_size(file.size()) + ", " +
                        std::to_string(total_chunks) + " chunks)");

    return result;
}

MediaFile TransferEngine::reassemble_file(
    const std::map<uint32_t, FileChunk>& chunks,
    const FileMetadata& metadata
) const {
    // The index set must be exactly [0, total_chunks)
    for (uint32_t i = 0; i < metadata.total_chunks; ++i) {
        if (chunks.find(i) == chunks.end()) {
            throw RtcError(ErrorCode::IncompleteChunks,
                           "Missing chunk " + std::to_string(i) + " of " +
                           std::to_string(metadata.total_chunks));
        }
    }
    if (chunks.size() != metadata.total_chunks) {
        throw RtcError(ErrorCode::IncompleteChunks,
                       "Unexpected chunk index beyond " + std::to_string(metadata.total_chunks));
    }

    std::vector<uint8_t> data;
    data.reserve(static_cast<size_t>(metadata.file_size));
    for (const auto& [index, chunk] : chunks) {
        data.insert(data.end(), chunk.data.begin(), chunk.data.end());
    }

    if (data.size() != metadata.file_size || utilities::sha256_hex(data) != metadata.file_hash) {
        throw RtcError(ErrorCode::IntegrityFailed,
                       "File integrity verification failed for " + metadata.transfer_id);
    }

    MediaFile file;
    file.name = sanitize_filename(metadata.file_name);
    file.mime_type = metadata.mime_type.empty()
        ? mime_type_for_extension(utilities::file_extension(file.name))
        : metadata.mime_type;
    file.data = std::move(data);
    return file;
}

// ============================================================================
// Media
// ============================================================================

std::string TransferEngine::generate_thumbnail(const MediaFile& file) const {
    FileCategory category = get_file_category(file.name);
    if (category != FileCategory::IMAGE) {
        throw RtcError(ErrorCode::NotAnImage,
                       "Thumbnails are only generated for images (" + file.name + " is " +
                       file_category_to_string(category) + ")");
    }
    return media::make_thumbnail(file.data, limits::THUMBNAIL_MAX_DIMENSION, limits::THUMBNAIL_QUALITY);
}

MediaFile TransferEngine::compress_image(const MediaFile& file, const media::CompressionOptions& options) const {
    if (get_file_category(file.name) != FileCategory::IMAGE) {
        throw RtcError(ErrorCode::NotAnImage, "Only images can be compressed: " + file.name);
    }

    MediaFile compressed;
    compressed.data = media::recompress(file.data, options);
    compressed.mime_type = media::format_mime_type(options.format);

    std::string ext = utilities::file_extension(file.name);
    std::string stem = ext.empty() ? file.name : file.name.substr(0, file.name.size() - ext.size() - 1);
    compressed.name = stem + "." + media::format_extension(options.format);

    utilities::log_debug("Compressed " + file.name + ": " + utilities::format_file_size(file.size()) +
                         " -> " + utilities::format_file_size(compressed.size()));
    return compressed;
}

MediaMetadata TransferEngine::extract_media_metadata(const MediaFile& file) const {
    MediaMetadata result;
    std::string ext = utilities::file_extension(file.name);

    switch (get_file_category(file.name)) {
        case FileCategory::IMAGE:
            result.dimensions = media::probe_image_dimensions(file.data);
            break;
        case FileCategory::VIDEO:
            if (ext == "mp4" || ext == "mov") {
                result = media::probe_iso_media(file.data);
            }
            break;
        case FileCategory::AUDIO:
            if (ext == "wav") {
                result.duration = media::probe_wav_duration(file.data);
            } else if (ext == "m4a") {
                result.duration = media::probe_iso_media(file.data).duration;
            }
            break;
        case FileCategory::DOCUMENT:
        case FileCategory::UNKNOWN:
            break;
    }

    return result;
}

// ============================================================================
// Receiving
// ============================================================================

void TransferEngine::begin_receive(const FileMetadata& metadata) {
    if (!validate_identifier(metadata.transfer_id)) {
        throw RtcError(ErrorCode::InvalidArgument, "Invalid transfer id");
    }
    validate_or_throw(metadata.file_name, metadata.file_size);

    if (metadata.chunk_size < limits::MIN_CHUNK_SIZE || metadata.chunk_size > limits::MAX_CHUNK_SIZE ||
        chunk_count(metadata.file_size, metadata.chunk_size) != metadata.total_chunks) {
        throw RtcError(ErrorCode::InvalidArgument, "Inconsistent chunk layout for " + metadata.transfer_id);
    }

    TransferEntry entry;
    entry.chunk_size = metadata.chunk_size;
    entry.cancelled = std::make_shared<std::atomic<bool>>(false);
    entry.metadata = metadata;
    entry.progress.transfer_id = metadata.transfer_id;
    entry.progress.file_name = metadata.file_name;
    entry.progress.total_size = metadata.file_size;
    entry.progress.total_chunks = metadata.total_chunks;
    entry.progress.status = TransferStatus::PREPARING;
    entry.progress.started_at = utilities::current_time_ms();

    register_entry(metadata.transfer_id, std::move(entry));
    utilities::log_info("Receiving " + metadata.file_name + " (" + metadata.transfer_id + ")");

    if (metadata.total_chunks == 0) {
        finish_receive(metadata.transfer_id);
    }
}

bool TransferEngine::add_received_chunk(const FileChunk& chunk) {
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(chunk.transfer_id);
        if (it == transfers_.end()) {
            throw RtcError(ErrorCode::NotFound, "Unknown transfer: " + chunk.transfer_id);
        }

        TransferEntry& entry = it->second;
        if (is_terminal_status(entry.progress.status)) {
            utilities::log_debug("Ignoring chunk for finished transfer " + chunk.transfer_id);
            return false;
        }
        if (!entry.metadata) {
            throw RtcError(ErrorCode::InvalidState, "Transfer " + chunk.transfer_id + " is outgoing");
        }

        const FileMetadata& metadata = *entry.metadata;
        if (chunk.chunk_index >= metadata.total_chunks) {
            utilities::log_warn("Rejected chunk " + std::to_string(chunk.chunk_index) + " of " +
                                chunk.transfer_id + ": index out of range");
            return false;
        }

        uint64_t expected = expected_chunk_bytes(metadata.file_size, metadata.chunk_size,
                                                 metadata.total_chunks, chunk.chunk_index);
        if (chunk.data.size() != expected || chunk.chunk_size != expected) {
            utilities::log_warn("Rejected chunk " + std::to_string(chunk.chunk_index) + " of " +
                                chunk.transfer_id + ": size mismatch");
            return false;
        }
    }

    if (utilities::sha256_hex(chunk.data) != chunk.hash) {
        utilities::log_warn("Rejected chunk " + std::to_string(chunk.chunk_index) + " of " +
                            chunk.transfer_id + ": hash mismatch");
        return false;
    }

    TransferProgress snapshot;
    bool complete = false;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(chunk.transfer_id);
        if (it == transfers_.end() || is_terminal_status(it->second.progress.status)) {
            return false;
        }

        TransferEntry& entry = it->second;
        if (entry.received.count(chunk.chunk_index) > 0) {
            return true;
        }

        entry.received.emplace(chunk.chunk_index, chunk);
        if (entry.progress.status == TransferStatus::PREPARING) {
            apply_status_locked(chunk.transfer_id, entry, TransferStatus::TRANSFERRING, std::nullopt);
        }
        record_processed_locked(entry, chunk.chunk_index, chunk.data.size());

        snapshot = entry.progress;
        complete = entry.processed.size() == entry.progress.total_chunks;
    }

    notify_chunk(chunk.transfer_id, chunk.chunk_index);
    notify_progress(snapshot);

    if (complete) {
        finish_receive(chunk.transfer_id);
    }

    return true;
}

void TransferEngine::finish_receive(const std::string& transfer_id) {
    std::map<uint32_t, FileChunk> chunks;
    FileMetadata metadata;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end() || is_terminal_status(it->second.progress.status)) {
            return;
        }
        chunks = std::move(it->second.received);
        it->second.received.clear();
        metadata = *it->second.metadata;
    }

    std::optional<MediaFile> file;
    std::optional<RtcError> failure;
    try {
        file = reassemble_file(chunks, metadata);
    } catch (const RtcError& e) {
        failure = e;
    }

    std::optional<TransferProgress> snapshot;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end() || is_terminal_status(it->second.progress.status)) {
            // Cancelled while reassembling: discard
            return;
        }
        snapshot = apply_status_locked(
            transfer_id, it->second,
            failure ? TransferStatus::FAILED : TransferStatus::COMPLETED,
            failure ? std::optional<std::string>(failure->what()) : std::nullopt);
    }

    notify_progress(*snapshot);
    if (failure) {
        utilities::log_error("Transfer " + transfer_id + " failed: " + failure->what());
        notify_error(transfer_id, failure->code(), failure->what());
    } else {
        utilities::log_info("Transfer " + transfer_id + " complete: " + file->name);
        notify_complete(*snapshot, file);
    }
}

bool TransferEngine::is_transfer_complete(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return false;
    }
    return it->second.processed.size() == it->second.progress.total_chunks;
}

// ============================================================================
// Status
// ============================================================================

bool TransferEngine::is_legal_transition(TransferStatus from, TransferStatus to) {
    if (is_terminal_status(from)) {
        return false;
    }
    if (is_terminal_status(to)) {
        return true;
    }
    return (from == TransferStatus::PREPARING && to == TransferStatus::TRANSFERRING) ||
           (from == TransferStatus::TRANSFERRING && to == TransferStatus::PAUSED) ||
           (from == TransferStatus::PAUSED && to == TransferStatus::TRANSFERRING);
}

void TransferEngine::mark_chunk_processed(const std::string& transfer_id, uint32_t chunk_index) {
    TransferProgress snapshot;
    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end()) {
            throw RtcError(ErrorCode::NotFound, "Unknown transfer: " + transfer_id);
        }

        TransferEntry& entry = it->second;
        if (is_terminal_status(entry.progress.status)) {
            return;
        }
        if (chunk_index >= entry.progress.total_chunks) {
            throw RtcError(ErrorCode::InvalidArgument, "Chunk index out of range: " + std::to_string(chunk_index));
        }
        if (entry.processed.count(chunk_index) > 0) {
            return;
        }

        if (entry.progress.status == TransferStatus::PREPARING) {
            apply_status_locked(transfer_id, entry, TransferStatus::TRANSFERRING, std::nullopt);
        }
        record_processed_locked(entry, chunk_index,
                                expected_chunk_bytes(entry.progress.total_size, entry.chunk_size,
                                                     entry.progress.total_chunks, chunk_index));

        if (entry.processed.size() == entry.progress.total_chunks) {
            snapshot = apply_status_locked(transfer_id, entry, TransferStatus::COMPLETED, std::nullopt);
            completed = true;
        } else {
            snapshot = entry.progress;
        }
    }

    notify_chunk(transfer_id, chunk_index);
    notify_progress(snapshot);
    if (completed) {
        utilities::log_info("Transfer " + transfer_id + " sent");
        notify_complete(snapshot, std::nullopt);
    }
}

void TransferEngine::update_transfer_status(
    const std::string& transfer_id,
    TransferStatus status,
    const std::optional<std::string>& error
) {
    TransferProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end()) {
            throw RtcError(ErrorCode::NotFound, "Unknown transfer: " + transfer_id);
        }

        TransferEntry& entry = it->second;
        if (entry.progress.status == status) {
            return;
        }
        if (!is_legal_transition(entry.progress.status, status)) {
            throw RtcError(ErrorCode::InvalidState,
                           "Illegal transfer transition " + transfer_status_to_string(entry.progress.status) +
                           " -> " + transfer_status_to_string(status));
        }

        snapshot = apply_status_locked(transfer_id, entry, status, error);
    }

    notify_progress(snapshot);
}

bool TransferEngine::cancel_transfer(const std::string& transfer_id) {
    TransferProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end() || is_terminal_status(it->second.progress.status)) {
            return false;
        }
        snapshot = apply_status_locked(transfer_id, it->second, TransferStatus::CANCELLED, std::nullopt);
    }

    utilities::log_info("Transfer cancelled: " + transfer_id);
    notify_progress(snapshot);
    return true;
}

std::optional<TransferProgress> TransferEngine::get_transfer_progress(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    return it->second.progress;
}

std::vector<TransferProgress> TransferEngine::get_active_transfers() const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    std::vector<TransferProgress> result;
    result.reserve(transfers_.size());
    for (const auto& [id, entry] : transfers_) {
        result.push_back(entry.progress);
    }
    return result;
}

void TransferEngine::clear_all_transfers() {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    for (auto& [id, entry] : transfers_) {
        entry.cancelled->store(true);
        release_timer_locked(entry);
    }
    transfers_.clear();
    utilities::log_debug("All transfers cleared");
}

void TransferEngine::set_event_listeners(const TransferEventListeners& listeners) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (listeners.on_transfer_progress) listeners_.on_transfer_progress = listeners.on_transfer_progress;
    if (listeners.on_transfer_complete) listeners_.on_transfer_complete = listeners.on_transfer_complete;
    if (listeners.on_transfer_error) listeners_.on_transfer_error = listeners.on_transfer_error;
    if (listeners.on_chunk_processed) listeners_.on_chunk_processed = listeners.on_chunk_processed;
}

// ============================================================================
// Entry Bookkeeping
// ============================================================================

void TransferEngine::register_entry(const std::string& transfer_id, TransferEntry entry) {
    TransferProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto [it, inserted] = transfers_.emplace(transfer_id, std::move(entry));
        if (!inserted) {
            throw RtcError(ErrorCode::InvalidState, "Transfer already registered: " + transfer_id);
        }
        arm_timeout_locked(transfer_id, it->second);
        snapshot = it->second.progress;
    }

    notify_progress(snapshot);
}

TransferProgress TransferEngine::apply_status_locked(
    const std::string& transfer_id,
    TransferEntry& entry,
    TransferStatus status,
    const std::optional<std::string>& error
) {
    entry.progress.status = status;
    if (error) {
        entry.progress.error = error;
    }

    if (is_terminal_status(status)) {
        entry.cancelled->store(true);
        entry.received.clear();
        if (status == TransferStatus::COMPLETED) {
            entry.progress.estimated_time_remaining = 0.0;
        }
        schedule_eviction_locked(transfer_id, entry);
    }

    return entry.progress;
}

void TransferEngine::record_processed_locked(TransferEntry& entry, uint32_t chunk_index, uint64_t bytes) {
    entry.processed.insert(chunk_index);

    TransferProgress& progress = entry.progress;
    progress.chunks_processed = static_cast<uint32_t>(entry.processed.size());
    progress.transferred_size += bytes;

    uint64_t now = utilities::current_time_ms();
    uint64_t elapsed_ms = now > progress.started_at ? now - progress.started_at : 0;
    progress.speed = elapsed_ms > 0 ? progress.transferred_size * 1000.0 / elapsed_ms : 0.0;

    uint64_t remaining = progress.total_size > progress.transferred_size
        ? progress.total_size - progress.transferred_size : 0;
    progress.estimated_time_remaining = progress.speed > 0.0 ? remaining / progress.speed : 0.0;
}

// ============================================================================
// Timers
// ============================================================================

void TransferEngine::arm_timeout_locked(const std::string& transfer_id, TransferEntry& entry) {
    release_timer_locked(entry);
    if (stopping_) {
        return;
    }

    auto timer = std::make_shared<asio::steady_timer>(io_context_, config_.file_transfer_timeout);
    const asio::steady_timer* raw = timer.get();
    timer->async_wait([this, transfer_id, raw](const asio::error_code& ec) {
        if (!ec) {
            handle_timeout(transfer_id, raw);
        }
    });
    entry.timer = std::move(timer);
}

void TransferEngine::schedule_eviction_locked(const std::string& transfer_id, TransferEntry& entry) {
    release_timer_locked(entry);
    if (stopping_) {
        return;
    }

    auto timer = std::make_shared<asio::steady_timer>(io_context_, config_.transfer_cleanup_delay);
    const asio::steady_timer* raw = timer.get();
    timer->async_wait([this, transfer_id, raw](const asio::error_code& ec) {
        if (!ec) {
            handle_eviction(transfer_id, raw);
        }
    });
    entry.timer = std::move(timer);
}

void TransferEngine::release_timer_locked(TransferEntry& entry) {
    if (!entry.timer) {
        return;
    }

    // Timers are only touched on the timer thread once armed
    auto timer = std::move(entry.timer);
    asio::post(io_context_, [timer]() {
        timer->cancel();
    });
}

void TransferEngine::handle_timeout(const std::string& transfer_id, const asio::steady_timer* timer) {
    if (stopping_) {
        return;
    }

    TransferProgress snapshot;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(transfer_id);
        if (it == transfers_.end() || it->second.timer.get() != timer ||
            is_terminal_status(it->second.progress.status)) {
            return;
        }
        snapshot = apply_status_locked(transfer_id, it->second, TransferStatus::FAILED,
                                       std::string("Transfer timed out"));
    }

    utilities::log_warn("Transfer timed out: " + transfer_id);
    notify_progress(snapshot);
    notify_error(transfer_id, ErrorCode::Timeout, "Transfer timed out");
}

void TransferEngine::handle_eviction(const std::string& transfer_id, const asio::steady_timer* timer) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end() || it->second.timer.get() != timer ||
        !is_terminal_status(it->second.progress.status)) {
        return;
    }

    transfers_.erase(it);
    utilities::log_debug("Evicted transfer " + transfer_id);
}

// ============================================================================
// Listener Notification
// ============================================================================

TransferEventListeners TransferEngine::listeners_snapshot() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_;
}

void TransferEngine::notify_progress(const TransferProgress& progress) const {
    auto listeners = listeners_snapshot();
    if (!listeners.on_transfer_progress) {
        return;
    }
    try {
        listeners.on_transfer_progress(progress);
    } catch (const std::exception& e) {
        utilities::log_error("on_transfer_progress listener threw: " + std::string(e.what()));
    }
}

void TransferEngine::notify_chunk(const std::string& transfer_id, uint32_t chunk_index) const {
    auto listeners = listeners_snapshot();
    if (!listeners.on_chunk_processed) {
        return;
    }
    try {
        listeners.on_chunk_processed(transfer_id, chunk_index);
    } catch (const std::exception& e) {
        utilities::log_error("on_chunk_processed listener threw: " + std::string(e.what()));
    }
}

void TransferEngine::notify_complete(const TransferProgress& progress, const std::optional<MediaFile>& file) const {
    auto listeners = listeners_snapshot();
    if (!listeners.on_transfer_complete) {
        return;
    }
    try {
        listeners.on_transfer_complete(progress, file);
    } catch (const std::exception& e) {
        utilities::log_error("on_transfer_complete listener threw: " + std::string(e.what()));
    }
}

void TransferEngine::notify_error(const std::string& transfer_id, ErrorCode code, const std::string& message) const {
    auto listeners = listeners_snapshot();
    if (!listeners.on_transfer_error) {
        return;
    }
    try {
        listeners.on_transfer_error(transfer_id, code, message);
    } catch (const std::exception& e) {
        utilities::log_error("on_transfer_error listener threw: " + std::string(e.what()));
    }
}

} // namespace rtcomm
