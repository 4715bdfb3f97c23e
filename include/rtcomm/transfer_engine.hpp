/**
 * @file transfer_engine.hpp
 * @brief Chunked file transfer with end-to-end integrity for RTComm
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides file transfer support with:
 * - Allow-list and size validation
 * - Splitting into fixed-size SHA-256 verified chunks
 * - Parallel chunk hashing on an asio::thread_pool
 * - Barriered reassembly with whole-file hash verification
 * - Thumbnails, image compression and media metadata
 * - Transfer state machine with delayed eviction of finished entries
 */

#pragma once

#include "rtcomm/errors.hpp"
#include "rtcomm/media_file.hpp"
#include "rtcomm/media_processing.hpp"
#include "rtcomm/rtc_config.hpp"

#include <asio.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace rtcomm {

// ============================================================================
// Listener Types
// ============================================================================

/**
 * @brief Listener set for the transfer engine (empty members are not called)
 */
struct TransferEventListeners {
    /// Any progress or status change (snapshot)
    std::function<void(const TransferProgress&)> on_transfer_progress;

    /// Transfer completed; the file is present on the receiving side only
    std::function<void(const TransferProgress&, const std::optional<MediaFile>&)> on_transfer_complete;

    /// Transfer failed (validation, integrity or timeout)
    std::function<void(const std::string& transfer_id, ErrorCode code, const std::string& message)> on_transfer_error;

    /// One chunk sent or received
    std::function<void(const std::string& transfer_id, uint32_t chunk_index)> on_chunk_processed;
};

// ============================================================================
// TransferEngine Class
// ============================================================================

/**
 * @brief TransferEngine - validates, chunks, verifies and reassembles files
 *
 * Store independent. Every transfer is registered under a fresh transfer id
 * when it is split (sender) or announced (receiver) and is mutated only
 * through this class. Terminal entries remain queryable for the configured
 * cleanup delay, then are evicted.
 *
 * Thread-safe for concurrent access
 */
class TransferEngine {
public:
    /**
     * @brief Construct engine
     * @param config Runtime configuration (limits, allow-list, delays)
     */
    explicit TransferEngine(RtcConfig config = RtcConfig{});

    /**
     * @brief Destructor - stops timers and joins the hashing pool
     */
    ~TransferEngine();

    // Disable copy and move
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    TransferEngine(TransferEngine&&) = delete;
    TransferEngine& operator=(TransferEngine&&) = delete;

    // ========================================================================
    // Validation
    // ========================================================================

    /**
     * @brief Check the file extension against the allow-list
     */
    bool validate_file_type(const MediaFile& file) const;

    /**
     * @brief Check the file size against the configured maximum
     */
    bool validate_file_size(const MediaFile& file) const;

    /**
     * @brief Category of a file name by extension
     */
    FileCategory get_file_category(const std::string& file_name) const;

    /**
     * @brief Configured allow-list
     */
    SupportedFileTypes get_supported_file_types() const;

    /**
     * @brief Configured maximum file size in bytes
     */
    uint64_t get_max_file_size() const { return config_.max_file_size; }

    // ========================================================================
    // Chunking
    // ========================================================================

    /**
     * @brief Hash, partition and register a file for sending
     *
     * Registers a TransferProgress entry (status preparing) under a new
     * transfer id. Chunk hashes are computed on the worker pool; a
     * cancellation observed by the workers discards the result.
     *
     * @param file File to send
     * @param chunk_size Chunk size override (defaults to configuration)
     * @return Metadata and chunks
     * @throws RtcError UnsupportedFileType, FileTooLarge, InvalidArgument,
     *         InvalidState (too many concurrent transfers) or Cancelled
     */
    SplitResult split_file_to_chunks(const MediaFile& file, std::optional<uint32_t> chunk_size = std::nullopt);

    /**
     * @brief Concatenate chunks and verify the whole-file hash
     * @param chunks Chunks keyed by index
     * @param metadata Transfer metadata
     * @return Reassembled file
     * @throws RtcError IncompleteChunks or IntegrityFailed
     */
    MediaFile reassemble_file(const std::map<uint32_t, FileChunk>& chunks, const FileMetadata& metadata) const;

    // ========================================================================
    // Media
    // ========================================================================

    /**
     * @brief JPEG data URL thumbnail (200x200 fit)
     * @throws RtcError NotAnImage
     */
    std::string generate_thumbnail(const MediaFile& file) const;

    /**
     * @brief Resize and re-encode an image
     * @throws RtcError NotAnImage or InvalidArgument
     */
    MediaFile compress_image(const MediaFile& file, const media::CompressionOptions& options) const;

    /**
     * @brief Duration for audio/video, dimensions for image/video
     *
     * Unrecognized containers yield empty fields.
     */
    MediaMetadata extract_media_metadata(const MediaFile& file) const;

    // ========================================================================
    // Receiving
    // ========================================================================

    /**
     * @brief Register an incoming transfer
     * @param metadata Sender's metadata
     * @throws RtcError UnsupportedFileType, FileTooLarge, InvalidArgument or InvalidState
     */
    void begin_receive(const FileMetadata& metadata);

    /**
     * @brief Store one received chunk, reassembling when the set is complete
     *
     * A chunk failing its own hash or size check is rejected without
     * failing the transfer. Chunks for finished transfers are ignored.
     *
     * @param chunk Received chunk
     * @return true if accepted (including duplicates)
     * @throws RtcError NotFound for an unknown transfer
     */
    bool add_received_chunk(const FileChunk& chunk);

    /**
     * @brief Whether every chunk index in [0, total_chunks) was processed
     */
    bool is_transfer_complete(const std::string& transfer_id) const;

    // ========================================================================
    // Status
    // ========================================================================

    /**
     * @brief Record a chunk as sent (sender side)
     *
     * The first chunk moves the transfer to transferring; the last one
     * completes it.
     *
     * @throws RtcError NotFound or InvalidArgument
     */
    void mark_chunk_processed(const std::string& transfer_id, uint32_t chunk_index);

    /**
     * @brief Sole mutator of transfer status
     *
     * Legal: preparing->transferring, transferring<->paused, any non-terminal
     * to completed/failed/cancelled. Setting the current status again is a
     * no-op. Terminal statuses schedule eviction. Only failures detected by
     * the engine itself are reported through on_transfer_error.
     *
     * @throws RtcError NotFound or InvalidState
     */
    void update_transfer_status(const std::string& transfer_id, TransferStatus status,
                                const std::optional<std::string>& error = std::nullopt);

    /**
     * @brief Cancel a transfer in any non-terminal state
     * @return true if cancelled, false if unknown or already terminal
     */
    bool cancel_transfer(const std::string& transfer_id);

    std::optional<TransferProgress> get_transfer_progress(const std::string& transfer_id) const;

    /**
     * @brief Snapshot of every tracked transfer
     */
    std::vector<TransferProgress> get_active_transfers() const;

    /**
     * @brief Cancel in-flight work and drop every entry
     */
    void clear_all_transfers();

    /**
     * @brief Merge listeners (set members overwrite, empty members are kept)
     */
    void set_event_listeners(const TransferEventListeners& listeners);

private:
    /**
     * @brief Per-transfer state
     */
    struct TransferEntry {
        TransferProgress progress;
        uint32_t chunk_size = 0;
        std::shared_ptr<std::atomic<bool>> cancelled;   ///< Observed by pool workers
        std::optional<FileMetadata> metadata;           ///< Set on receive side
        bool outgoing = false;
        std::map<uint32_t, FileChunk> received;         ///< Receive-side chunk cache
        std::set<uint32_t> processed;                   ///< Processed chunk indices
        std::shared_ptr<asio::steady_timer> timer;      ///< Timeout, then eviction
    };

    RtcConfig config_;

    /// Workers for chunk hashing
    asio::thread_pool hash_pool_;

    /// Timer context (timeouts and delayed eviction)
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread timer_thread_;
    std::atomic<bool> stopping_{false};

    std::map<std::string, TransferEntry> transfers_;
    mutable std::mutex transfers_mutex_;

    TransferEventListeners listeners_;
    mutable std::mutex listeners_mutex_;

    // ========================================================================
    // Private Methods
    // ========================================================================

    static bool is_legal_transition(TransferStatus from, TransferStatus to);

    std::string generate_transfer_id() const;
    void validate_or_throw(const std::string& file_name, uint64_t file_size) const;
    std::vector<std::string> hash_in_pool(const MediaFile& file, uint32_t chunk_size,
                                          const std::shared_ptr<std::atomic<bool>>& cancelled);

    void register_entry(const std::string& transfer_id, TransferEntry entry);
    void finish_receive(const std::string& transfer_id);

    TransferProgress apply_status_locked(const std::string& transfer_id, TransferEntry& entry,
                                         TransferStatus status, const std::optional<std::string>& error);
    void record_processed_locked(TransferEntry& entry, uint32_t chunk_index, uint64_t bytes);
    void arm_timeout_locked(const std::string& transfer_id, TransferEntry& entry);
    void schedule_eviction_locked(const std::string& transfer_id, TransferEntry& entry);
    void release_timer_locked(TransferEntry& entry);
    void handle_timeout(const std::string& transfer_id, const asio::steady_timer* timer);
    void handle_eviction(const std::string& transfer_id, const asio::steady_timer* timer);

    TransferEventListeners listeners_snapshot() const;
    void notify_progress(const TransferProgress& progress) const;
    void notify_chunk(const std::string& transfer_id, uint32_t chunk_index) const;
    void notify_complete(const TransferProgress& progress, const std::optional<MediaFile>& file) const;
    void notify_error(const std::string& transfer_id, ErrorCode code, const std::string& message) const;
};

} // namespace rtcomm
