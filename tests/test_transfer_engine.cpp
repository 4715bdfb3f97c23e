/**
 * @file test_transfer_engine.cpp
 * @brief Unit tests for TransferEngine
 *
 * Tests file transfer handling including:
 * - Validation and chunk layout
 * - Reassembly and integrity verification
 * - Receive-side chunk acceptance
 * - Status transitions, cancellation and timeouts
 * - Delayed eviction of finished transfers
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "rtcomm/transfer_engine.hpp"
#include "rtcomm/media_processing.hpp"
#include "rtcomm/utilities.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

using namespace rtcomm;

namespace {

MediaFile make_file(const std::string& name, size_t size) {
    MediaFile file;
    file.name = name;
    file.data.resize(size);
    for (size_t i = 0; i < size; ++i) {
        file.data[i] = static_cast<uint8_t>((i * 31 + 7) % 251);
    }
    return file;
}

MediaFile make_png(const std::string& name, int width, int height) {
    media::Image image;
    image.width = width;
    image.height = height;
    image.channels = 3;
    image.pixels.resize(static_cast<size_t>(width) * height * 3);
    for (size_t i = 0; i < image.pixels.size(); ++i) {
        image.pixels[i] = static_cast<uint8_t>(i % 256);
    }

    MediaFile file;
    file.name = name;
    file.mime_type = "image/png";
    file.data = media::encode_image(image, "png", 1.0);
    return file;
}

bool wait_for(const std::function<bool()>& predicate,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

} // anonymous namespace

// Test fixture for transfer engine tests
class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<TransferEngine>(config_);
    }

    void TearDown() override {
        engine_.reset();
    }

    RtcConfig config_;
    std::unique_ptr<TransferEngine> engine_;
};

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(TransferEngineTest, FileCategories) {
    EXPECT_EQ(engine_->get_file_category("photo.PNG"), FileCategory::IMAGE);
    EXPECT_EQ(engine_->get_file_category("clip.mp4"), FileCategory::VIDEO);
    EXPECT_EQ(engine_->get_file_category("note.wav"), FileCategory::AUDIO);
    EXPECT_EQ(engine_->get_file_category("report.pdf"), FileCategory::DOCUMENT);
    EXPECT_EQ(engine_->get_file_category("setup.exe"), FileCategory::UNKNOWN);
    EXPECT_EQ(engine_->get_file_category("Makefile"), FileCategory::UNKNOWN);
}

TEST_F(TransferEngineTest, SupportedTypesFollowConfig) {
    SupportedFileTypes types = engine_->get_supported_file_types();
    EXPECT_NE(std::find(types.image.begin(), types.image.end(), "png"), types.image.end());
    EXPECT_NE(std::find(types.document.begin(), types.document.end(), "pdf"), types.document.end());
    EXPECT_EQ(engine_->get_max_file_size(), config_.max_file_size);
}

TEST_F(TransferEngineTest, UnsupportedTypeRejected) {
    MediaFile file = make_file("setup.exe", 100);
    EXPECT_FALSE(engine_->validate_file_type(file));

    try {
        engine_->split_file_to_chunks(file);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedFileType);
    }
    EXPECT_TRUE(engine_->get_active_transfers().empty());
}

TEST_F(TransferEngineTest, OversizedFileRejected) {
    RtcConfig config;
    config.max_file_size = 2048;
    TransferEngine engine(config);

    MediaFile file = make_file("notes.txt", 4096);
    EXPECT_FALSE(engine.validate_file_size(file));

    try {
        engine.split_file_to_chunks(file);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FileTooLarge);
    }
}

TEST_F(TransferEngineTest, InvalidChunkSizeRejected) {
    MediaFile file = make_file("notes.txt", 4096);

    try {
        engine_->split_file_to_chunks(file, 16);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

// ============================================================================
// Chunking Tests
// ============================================================================

TEST_F(TransferEngineTest, ChunkLayout) {
    MediaFile file = make_file("archive.pdf", 200 * 1024);
    SplitResult split = engine_->split_file_to_chunks(file, 64 * 1024);

    EXPECT_EQ(split.metadata.total_chunks, 4);
    EXPECT_EQ(split.metadata.chunk_size, 64u * 1024);
    EXPECT_EQ(split.metadata.file_size, 200u * 1024);
    EXPECT_EQ(split.metadata.file_type, "pdf");
    EXPECT_EQ(split.metadata.mime_type, "application/pdf");
    EXPECT_EQ(split.metadata.file_hash, utilities::sha256_hex(file.data));

    ASSERT_EQ(split.chunks.size(), 4);
    uint64_t total = 0;
    for (uint32_t i = 0; i < split.chunks.size(); ++i) {
        const FileChunk& chunk = split.chunks[i];
        EXPECT_EQ(chunk.chunk_index, i);
        EXPECT_EQ(chunk.transfer_id, split.metadata.transfer_id);
        EXPECT_EQ(chunk.chunk_size, chunk.data.size());
        EXPECT_EQ(chunk.hash, utilities::sha256_hex(chunk.data));
        total += chunk.chunk_size;
    }
    EXPECT_EQ(split.chunks.back().chunk_size, 8192u);
    EXPECT_EQ(total, file.size());

    auto progress = engine_->get_transfer_progress(split.metadata.transfer_id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::PREPARING);
    EXPECT_EQ(progress->total_chunks, 4);
}

TEST_F(TransferEngineTest, TransferIdFormat) {
    SplitResult split = engine_->split_file_to_chunks(make_file("a.txt", 10));

    EXPECT_TRUE(utilities::starts_with(split.metadata.transfer_id, "transfer-"));
    EXPECT_TRUE(validate_identifier(split.metadata.transfer_id));
}

TEST_F(TransferEngineTest, EmptyFileHasNoChunks) {
    SplitResult split = engine_->split_file_to_chunks(make_file("empty.txt", 0));

    EXPECT_EQ(split.metadata.total_chunks, 0);
    EXPECT_TRUE(split.chunks.empty());
}

TEST_F(TransferEngineTest, ConcurrentTransferLimit) {
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(engine_->split_file_to_chunks(make_file("f.txt", 2048)).metadata.transfer_id);
    }

    try {
        engine_->split_file_to_chunks(make_file("f.txt", 2048));
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }

    EXPECT_TRUE(engine_->cancel_transfer(ids[0]));
    EXPECT_NO_THROW(engine_->split_file_to_chunks(make_file("f.txt", 2048)));
}

TEST_F(TransferEngineTest, ImageSplitCarriesThumbnailAndDimensions) {
    MediaFile image = make_png("photo.png", 640, 480);
    SplitResult split = engine_->split_file_to_chunks(image);

    ASSERT_TRUE(split.metadata.thumbnail_data.has_value());
    EXPECT_TRUE(utilities::starts_with(*split.metadata.thumbnail_data, "data:image/jpeg;base64,"));
    ASSERT_TRUE(split.metadata.dimensions.has_value());
    EXPECT_EQ(split.metadata.dimensions->width, 640);
    EXPECT_EQ(split.metadata.dimensions->height, 480);
}

TEST_F(TransferEngineTest, CorruptImageStillSplits) {
    // A .png that is not a PNG: no thumbnail, but the transfer proceeds
    MediaFile broken = make_file("broken.png", 3000);
    SplitResult split = engine_->split_file_to_chunks(broken);

    EXPECT_FALSE(split.metadata.thumbnail_data.has_value());
    EXPECT_EQ(split.chunks.size(), 1);
}

// ============================================================================
// Reassembly Tests
// ============================================================================

TEST_F(TransferEngineTest, ReassembleRoundTrip) {
    MediaFile file = make_file("report.pdf", 150000);
    SplitResult split = engine_->split_file_to_chunks(file, 32 * 1024);

    std::map<uint32_t, FileChunk> chunks;
    for (const auto& chunk : split.chunks) {
        chunks.emplace(chunk.chunk_index, chunk);
    }

    MediaFile rebuilt = engine_->reassemble_file(chunks, split.metadata);
    EXPECT_EQ(rebuilt.data, file.data);
    EXPECT_EQ(rebuilt.name, "report.pdf");
    EXPECT_EQ(rebuilt.mime_type, "application/pdf");
}

TEST_F(TransferEngineTest, ReassembleMissingChunk) {
    SplitResult split = engine_->split_file_to_chunks(make_file("report.pdf", 5000), 1024);

    std::map<uint32_t, FileChunk> chunks;
    for (const auto& chunk : split.chunks) {
        if (chunk.chunk_index != 2) {
            chunks.emplace(chunk.chunk_index, chunk);
        }
    }

    try {
        engine_->reassemble_file(chunks, split.metadata);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IncompleteChunks);
    }
}

TEST_F(TransferEngineTest, ReassembleExtraChunk) {
    SplitResult split = engine_->split_file_to_chunks(make_file("report.pdf", 2048), 1024);

    std::map<uint32_t, FileChunk> chunks;
    for (const auto& chunk : split.chunks) {
        chunks.emplace(chunk.chunk_index, chunk);
    }
    FileChunk extra = split.chunks[0];
    extra.chunk_index = 7;
    chunks.emplace(7, extra);

    try {
        engine_->reassemble_file(chunks, split.metadata);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IncompleteChunks);
    }
}

TEST_F(TransferEngineTest, ReassembleHashMismatch) {
    SplitResult split = engine_->split_file_to_chunks(make_file("report.pdf", 4096), 1024);

    std::map<uint32_t, FileChunk> chunks;
    for (const auto& chunk : split.chunks) {
        chunks.emplace(chunk.chunk_index, chunk);
    }
    chunks[1].data[0] ^= 0xFF;

    try {
        engine_->reassemble_file(chunks, split.metadata);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IntegrityFailed);
    }
}

TEST_F(TransferEngineTest, ReassembleSanitizesName) {
    SplitResult split = engine_->split_file_to_chunks(make_file("notes.txt", 100));
    split.metadata.file_name = "../../etc/notes.txt";

    std::map<uint32_t, FileChunk> chunks;
    chunks.emplace(0, split.chunks[0]);

    EXPECT_EQ(engine_->reassemble_file(chunks, split.metadata).name, "notes.txt");
}

// ============================================================================
// Receive Tests
// ============================================================================

TEST_F(TransferEngineTest, ReceiveOutOfOrder) {
    TransferEngine sender;
    MediaFile file = make_file("report.pdf", 10000);
    SplitResult split = sender.split_file_to_chunks(file, 2048);

    std::mutex mutex;
    std::optional<MediaFile> received;
    std::vector<uint32_t> processed;
    TransferEventListeners listeners;
    listeners.on_transfer_complete = [&](const TransferProgress& progress, const std::optional<MediaFile>& f) {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(progress.status, TransferStatus::COMPLETED);
        received = f;
    };
    listeners.on_chunk_processed = [&](const std::string&, uint32_t index) {
        std::lock_guard<std::mutex> lock(mutex);
        processed.push_back(index);
    };
    engine_->set_event_listeners(listeners);

    engine_->begin_receive(split.metadata);
    for (auto it = split.chunks.rbegin(); it != split.chunks.rend(); ++it) {
        EXPECT_TRUE(engine_->add_received_chunk(*it));
    }

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->data, file.data);
    EXPECT_EQ(processed.size(), split.chunks.size());

    auto progress = engine_->get_transfer_progress(split.metadata.transfer_id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, TransferStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(progress->percentage(), 100.0);
}

TEST_F(TransferEngineTest, ReceiveRejectsBadChunks) {
    TransferEngine sender;
    SplitResult split = sender.split_file_to_chunks(make_file("report.pdf", 4096), 1024);
    engine_->begin_receive(split.metadata);

    FileChunk tampered = split.chunks[0];
    tampered.data[10] ^= 0x01;
    EXPECT_FALSE(engine_->add_received_chunk(tampered));

    FileChunk out_of_range = split.chunks[0];
    out_of_range.chunk_index = 9;
    EXPECT_FALSE(engine_->add_received_chunk(out_of_range));

    FileChunk short_chunk = split.chunks[1];
    short_chunk.data.pop_back();
    short_chunk.chunk_size = static_cast<uint32_t>(short_chunk.data.size());
    EXPECT_FALSE(engine_->add_received_chunk(short_chunk));

    // Rejections do not fail the transfer
    auto progress = engine_->get_transfer_progress(split.metadata.transfer_id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_FALSE(is_terminal_status(progress->status));
    EXPECT_EQ(progress->chunks_processed, 0);

    EXPECT_TRUE(engine_->add_received_chunk(split.chunks[0]));
    EXPECT_TRUE(engine_->add_received_chunk(split.chunks[0]));
    EXPECT_EQ(engine_->get_transfer_progress(split.metadata.transfer_id)->chunks_processed, 1);
    EXPECT_FALSE(engine_->is_transfer_complete(split.metadata.transfer_id));
}

TEST_F(TransferEngineTest, ReceiveIntegrityFailure) {
    TransferEngine sender;
    SplitResult split = sender.split_file_to_chunks(make_file("report.pdf", 3000), 1024);

    std::mutex mutex;
    std::optional<ErrorCode> error;
    bool completed = false;
    TransferEventListeners listeners;
    listeners.on_transfer_error = [&](const std::string&, ErrorCode code, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        error = code;
    };
    listeners.on_transfer_complete = [&](const TransferProgress&, const std::optional<MediaFile>&) {
        std::lock_guard<std::mutex> lock(mutex);
        completed = true;
    };
    engine_->set_event_listeners(listeners);

    // Every chunk verifies but the announced file hash does not
    FileMetadata metadata = split.metadata;
    metadata.file_hash = std::string(64, '0');
    engine_->begin_receive(metadata);
    for (const auto& chunk : split.chunks) {
        engine_->add_received_chunk(chunk);
    }

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(error, ErrorCode::IntegrityFailed);
    EXPECT_FALSE(completed);
    EXPECT_EQ(engine_->get_transfer_progress(metadata.transfer_id)->status, TransferStatus::FAILED);
}

TEST_F(TransferEngineTest, ReceiveUnknownTransfer) {
    FileChunk chunk;
    chunk.transfer_id = "transfer-unknown";

    try {
        engine_->add_received_chunk(chunk);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST_F(TransferEngineTest, ReceiveRejectsInconsistentMetadata) {
    TransferEngine sender;
    SplitResult split = sender.split_file_to_chunks(make_file("report.pdf", 4096), 1024);
    split.metadata.total_chunks = 3;

    EXPECT_THROW(engine_->begin_receive(split.metadata), RtcError);
}

// ============================================================================
// Sending Progress Tests
// ============================================================================

TEST_F(TransferEngineTest, MarkChunksUntilComplete) {
    SplitResult split = engine_->split_file_to_chunks(make_file("report.pdf", 3000), 1024);
    const std::string& id = split.metadata.transfer_id;

    std::atomic<int> completions{0};
    TransferEventListeners listeners;
    listeners.on_transfer_complete = [&](const TransferProgress&, const std::optional<MediaFile>& file) {
        EXPECT_FALSE(file.has_value());
        completions++;
    };
    engine_->set_event_listeners(listeners);

    engine_->mark_chunk_processed(id, 0);
    EXPECT_EQ(engine_->get_transfer_progress(id)->status, TransferStatus::TRANSFERRING);

    // Duplicate marks are ignored
    engine_->mark_chunk_processed(id, 0);
    EXPECT_EQ(engine_->get_transfer_progress(id)->chunks_processed, 1);
    EXPECT_EQ(engine_->get_transfer_progress(id)->transferred_size, 1024u);

    engine_->mark_chunk_processed(id, 1);
    engine_->mark_chunk_processed(id, 2);

    auto progress = engine_->get_transfer_progress(id);
    EXPECT_EQ(progress->status, TransferStatus::COMPLETED);
    EXPECT_EQ(progress->transferred_size, 3000u);
    EXPECT_EQ(completions.load(), 1);
    EXPECT_TRUE(engine_->is_transfer_complete(id));

    EXPECT_THROW(engine_->mark_chunk_processed("transfer-unknown", 0), RtcError);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST_F(TransferEngineTest, StatusTransitions) {
    SplitResult split = engine_->split_file_to_chunks(make_file("notes.txt", 4096), 1024);
    const std::string& id = split.metadata.transfer_id;

    engine_->update_transfer_status(id, TransferStatus::TRANSFERRING);
    engine_->update_transfer_status(id, TransferStatus::PAUSED);
    engine_->update_transfer_status(id, TransferStatus::TRANSFERRING);

    // Same status is a no-op
    EXPECT_NO_THROW(engine_->update_transfer_status(id, TransferStatus::TRANSFERRING));

    engine_->update_transfer_status(id, TransferStatus::FAILED, std::string("peer vanished"));
    auto progress = engine_->get_transfer_progress(id);
    EXPECT_EQ(progress->status, TransferStatus::FAILED);
    EXPECT_EQ(progress->error, "peer vanished");

    try {
        engine_->update_transfer_status(id, TransferStatus::TRANSFERRING);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidState);
    }
}

TEST_F(TransferEngineTest, IllegalResumeFromPreparing) {
    SplitResult split = engine_->split_file_to_chunks(make_file("notes.txt", 2048));

    EXPECT_THROW(engine_->update_transfer_status(split.metadata.transfer_id, TransferStatus::PAUSED), RtcError);
    EXPECT_THROW(engine_->update_transfer_status("transfer-unknown", TransferStatus::PAUSED), RtcError);
}

TEST_F(TransferEngineTest, CancelIsTerminal) {
    SplitResult split = engine_->split_file_to_chunks(make_file("notes.txt", 2048));
    const std::string& id = split.metadata.transfer_id;

    EXPECT_TRUE(engine_->cancel_transfer(id));
    EXPECT_FALSE(engine_->cancel_transfer(id));
    EXPECT_FALSE(engine_->cancel_transfer("transfer-unknown"));
    EXPECT_EQ(engine_->get_transfer_progress(id)->status, TransferStatus::CANCELLED);

    // Late chunk marks after cancellation are ignored
    EXPECT_NO_THROW(engine_->mark_chunk_processed(id, 0));
    EXPECT_EQ(engine_->get_transfer_progress(id)->chunks_processed, 0);
}

TEST_F(TransferEngineTest, CancelDuringSplit) {
    std::atomic<bool> cancel_requested{false};
    TransferEventListeners listeners;
    listeners.on_transfer_progress = [this, &cancel_requested](const TransferProgress& progress) {
        if (progress.status == TransferStatus::PREPARING && !cancel_requested.exchange(true)) {
            engine_->cancel_transfer(progress.transfer_id);
        }
    };
    engine_->set_event_listeners(listeners);

    try {
        engine_->split_file_to_chunks(make_file("big.pdf", 2 * 1024 * 1024), 64 * 1024);
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Cancelled);
    }

    auto transfers = engine_->get_active_transfers();
    ASSERT_EQ(transfers.size(), 1);
    EXPECT_EQ(transfers[0].status, TransferStatus::CANCELLED);
}

TEST_F(TransferEngineTest, ClearAllTransfers) {
    engine_->split_file_to_chunks(make_file("a.txt", 2048));
    engine_->split_file_to_chunks(make_file("b.txt", 2048));
    ASSERT_EQ(engine_->get_active_transfers().size(), 2);

    engine_->clear_all_transfers();
    EXPECT_TRUE(engine_->get_active_transfers().empty());
}

// ============================================================================
// Timer Tests
// ============================================================================

TEST(TransferEngineTimerTest, FinishedTransferEvicted) {
    RtcConfig config;
    config.transfer_cleanup_delay = std::chrono::milliseconds(50);
    TransferEngine engine(config);

    SplitResult split = engine.split_file_to_chunks(make_file("notes.txt", 2048));
    const std::string id = split.metadata.transfer_id;
    engine.cancel_transfer(id);

    // Still observable right after finishing
    EXPECT_TRUE(engine.get_transfer_progress(id).has_value());
    EXPECT_TRUE(wait_for([&]() { return !engine.get_transfer_progress(id).has_value(); }));
}

TEST(TransferEngineTimerTest, StalledTransferTimesOut) {
    RtcConfig config;
    config.file_transfer_timeout = std::chrono::milliseconds(50);
    config.transfer_cleanup_delay = std::chrono::milliseconds(10000);
    TransferEngine engine(config);

    std::mutex mutex;
    std::optional<ErrorCode> error;
    TransferEventListeners listeners;
    listeners.on_transfer_error = [&](const std::string&, ErrorCode code, const std::string&) {
        std::lock_guard<std::mutex> lock(mutex);
        error = code;
    };
    engine.set_event_listeners(listeners);

    SplitResult split = engine.split_file_to_chunks(make_file("notes.txt", 2048));

    ASSERT_TRUE(wait_for([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return error.has_value();
    }));
    EXPECT_EQ(*error, ErrorCode::Timeout);
    EXPECT_EQ(engine.get_transfer_progress(split.metadata.transfer_id)->status, TransferStatus::FAILED);
}

// ============================================================================
// Media Metadata Tests
// ============================================================================

TEST_F(TransferEngineTest, ThumbnailRequiresImage) {
    try {
        engine_->generate_thumbnail(make_file("notes.txt", 100));
        FAIL() << "Expected RtcError";
    } catch (const RtcError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotAnImage);
    }
}

TEST_F(TransferEngineTest, CompressImageRenames) {
    MediaFile png = make_png("holiday.png", 400, 300);

    media::CompressionOptions options;
    options.max_width = 200;
    options.max_height = 200;
    MediaFile jpeg = engine_->compress_image(png, options);

    EXPECT_EQ(jpeg.name, "holiday.jpg");
    EXPECT_EQ(jpeg.mime_type, "image/jpeg");

    auto dimensions = media::probe_image_dimensions(jpeg.data);
    ASSERT_TRUE(dimensions.has_value());
    EXPECT_EQ(dimensions->width, 200);
    EXPECT_EQ(dimensions->height, 150);
}

TEST_F(TransferEngineTest, WavDuration) {
    // 16kHz mono 8-bit: 16000 bytes per second, two seconds of samples
    std::vector<uint8_t> wav = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E',
                                'f', 'm', 't', ' ', 16, 0, 0, 0,
                                1, 0, 1, 0, 0x80, 0x3E, 0, 0, 0x80, 0x3E, 0, 0, 1, 0, 8, 0,
                                'd', 'a', 't', 'a', 0x00, 0x7D, 0, 0};
    wav.resize(wav.size() + 32000, 0x80);

    MediaFile file;
    file.name = "memo.wav";
    file.data = wav;

    MediaMetadata metadata = engine_->extract_media_metadata(file);
    ASSERT_TRUE(metadata.duration.has_value());
    EXPECT_DOUBLE_EQ(*metadata.duration, 2.0);
    EXPECT_FALSE(metadata.dimensions.has_value());
}

TEST_F(TransferEngineTest, DocumentHasNoMediaMetadata) {
    MediaMetadata metadata = engine_->extract_media_metadata(make_file("notes.txt", 100));

    EXPECT_FALSE(metadata.duration.has_value());
    EXPECT_FALSE(metadata.dimensions.has_value());
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST_F(TransferEngineTest, ChunkJsonRejectsSizeMismatch) {
    SplitResult split = engine_->split_file_to_chunks(make_file("notes.txt", 2048), 1024);

    auto parsed = FileChunk::from_json(split.chunks[0].to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->data, split.chunks[0].data);

    FileChunk lying = split.chunks[0];
    lying.chunk_size = 10;
    EXPECT_FALSE(FileChunk::from_json(lying.to_json()).has_value());
}

TEST_F(TransferEngineTest, MetadataJsonRejectsBadLayout) {
    SplitResult split = engine_->split_file_to_chunks(make_file("notes.txt", 5000), 1024);

    auto parsed = FileMetadata::from_json(split.metadata.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->total_chunks, 5);
    EXPECT_EQ(parsed->file_hash, split.metadata.file_hash);

    FileMetadata bad = split.metadata;
    bad.total_chunks = 4;
    EXPECT_FALSE(FileMetadata::from_json(bad.to_json()).has_value());

    bad.chunk_size = 0;
    EXPECT_FALSE(FileMetadata::from_json(bad.to_json()).has_value());
}
