/**
 * @file call_demo.cpp
 * @brief Two users place a video call and share a file over one signal store
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Signaling through a shared SQLite message store
 * - Ringing, answering and SDP negotiation
 * - Media controls and automatic video quality
 * - Chunked file transfer inside a connected call
 *
 * Usage: call_demo [config.json] [store.db]
 * Without a config argument, $RTCOMM_CONFIG is used when set.
 */

#include "rtcomm/call_session_manager.hpp"
#include "rtcomm/sqlite_message_store.hpp"
#include "rtcomm/utilities.hpp"
#include <iostream>
#include <memory>
#include <thread>
#include <chrono>
#include <atomic>

using namespace rtcomm;
using namespace std::chrono_literals;

/**
 * @brief Stand-in media engine that logs what a real codec layer would do
 */
class ConsoleMediaEngine : public MediaEngine {
public:
    explicit ConsoleMediaEngine(std::string owner) : owner_(std::move(owner)) {}

    void acquire_local_media(const std::string& call_id, const MediaConstraints& constraints) override {
        say("capture on for " + call_id + (constraints.video ? " (audio+video)" : " (audio)"));
    }
    void release_local_media(const std::string& call_id) override { say("capture off for " + call_id); }

    std::string create_offer(const std::string& remote, const MediaConstraints&) override {
        say("offer -> " + remote);
        return "v=0\r\no=" + owner_ + " 1 1 IN IP4 127.0.0.1\r\n";
    }
    std::string create_answer(const std::string& remote, const std::string&) override {
        say("answer -> " + remote);
        return "v=0\r\no=" + owner_ + " 2 1 IN IP4 127.0.0.1\r\n";
    }
    void apply_answer(const std::string& remote, const std::string&) override {
        say("answer from " + remote + " applied");
        answered = true;
    }
    void add_ice_candidate(const std::string&, const IceCandidateData&) override {}
    void close_peer(const std::string& remote) override { say("peer " + remote + " closed"); }

    void set_audio_enabled(bool enabled) override { say(enabled ? "mic on" : "mic off"); }
    void set_video_enabled(bool enabled) override { say(enabled ? "camera on" : "camera off"); }
    void switch_camera() override { say("camera switched"); }
    void start_screen_capture() override { say("screen capture on"); }
    void stop_screen_capture() override { say("screen capture off"); }
    void apply_video_preset(const VideoPreset& preset) override {
        say("preset " + std::to_string(preset.width) + "x" + std::to_string(preset.height));
    }

    std::atomic<bool> answered{false};

private:
    void say(const std::string& text) const {
        std::cout << "  [" << owner_ << " media] " << text << "\n";
    }

    std::string owner_;
};

/**
 * @brief Probe reporting a congested link
 */
class CongestedLink : public NetworkQualityProbe {
public:
    std::optional<NetworkSample> sample(const std::string&) override {
        NetworkSample sample;
        sample.bandwidth_kbps = 400.0;
        sample.latency_ms = 180.0;
        sample.packet_loss = 0.04;
        return sample;
    }
};

struct User {
    std::shared_ptr<ConsoleMediaEngine> media;
    std::shared_ptr<TransferEngine> engine;
    std::shared_ptr<CallSessionManager> manager;
};

User make_user(const std::string& user_id, const std::shared_ptr<MessageStore>& store, const RtcConfig& config) {
    User user;
    user.media = std::make_shared<ConsoleMediaEngine>(user_id);
    user.engine = std::make_shared<TransferEngine>(config);
    auto router = std::make_shared<SignalingRouter>([store]() { return store; }, config);
    user.manager = std::make_shared<CallSessionManager>(
        router, user.engine, std::make_shared<GrantedPermissions>(GrantedPermissions::all()),
        user.media, std::make_shared<CongestedLink>(), config);
    user.manager->initialize(user_id);
    return user;
}

bool wait_until(const std::function<bool()>& predicate) {
    for (int i = 0; i < 300 && !predicate(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

int main(int argc, char** argv) {
    try {
        RtcConfig config = load_default_config();
        if (argc > 1) {
            auto loaded = load_config(argv[1]);
            if (!loaded) {
                std::cerr << "Invalid configuration: " << argv[1] << "\n";
                return 1;
            }
            config = *loaded;
        }
        utilities::initialize_logging(config.log_file,
                                      utilities::parse_log_level(config.log_level).value_or(utilities::LogLevel::INFO));

        std::string store_path = argc > 2 ? argv[2] : ":memory:";
        std::shared_ptr<MessageStore> store = std::make_shared<SqliteMessageStore>(store_path);

        std::cout << "=== RTComm call demo (store: " << store_path << ") ===\n\n";

        User alice = make_user("alice", store, config);
        User bob = make_user("bob", store, config);

        // Bob answers whatever rings
        std::atomic<bool> ringing{false};
        std::string incoming_id;
        CallEventListeners bob_listeners;
        bob_listeners.on_incoming_call = [&](const std::string& call_id, const std::string& from, CallType type) {
            std::cout << "bob: incoming " << SignalHelpers::call_type_to_string(type)
                      << " call from " << from << "\n";
            incoming_id = call_id;
            ringing = true;
        };
        bob_listeners.on_call_ended = [](const std::string&, uint64_t, const std::optional<std::string>& reason) {
            std::cout << "bob: call ended (" << reason.value_or("no reason") << ")\n";
        };
        bob.manager->set_event_listeners(bob_listeners);

        CallEventListeners alice_listeners;
        alice_listeners.on_call_state_changed = [](const std::string&, CallState state, CallState previous) {
            std::cout << "alice: " << call_state_to_string(previous) << " -> " << call_state_to_string(state) << "\n";
        };
        alice_listeners.on_quality_changed = [](const std::string&, VideoQualityLevel level,
                                                std::optional<NetworkQuality> network) {
            std::cout << "alice: video quality " << video_quality_to_string(level);
            if (network) {
                std::cout << " (network " << network_quality_to_string(*network) << ")";
            }
            std::cout << "\n";
        };
        alice.manager->set_event_listeners(alice_listeners);

        std::string call_id = alice.manager->initiate_call("bob", CallType::VIDEO, "Bob");
        if (!wait_until([&]() { return ringing.load(); })) {
            std::cerr << "bob never saw the call\n";
            return 1;
        }
        bob.manager->accept_call(incoming_id);

        if (!wait_until([&]() { return alice.media->answered.load(); })) {
            std::cerr << "negotiation did not complete\n";
            return 1;
        }

        // The transport layer reports the peer connection as up
        alice.manager->handle_connection_state("bob", ConnectionState::CONNECTED);
        bob.manager->handle_connection_state("alice", ConnectionState::CONNECTED);

        alice.manager->toggle_mute(call_id);
        alice.manager->auto_adjust_video_quality(call_id);
        std::this_thread::sleep_for(200ms);

        // Share a generated file
        MediaFile file;
        file.name = "minutes.txt";
        std::string text;
        for (int i = 0; i < 4000; ++i) {
            text += "Line " + std::to_string(i) + " of the meeting minutes.\n";
        }
        file.data.assign(text.begin(), text.end());

        std::atomic<bool> delivered{false};
        TransferEventListeners transfer_listeners;
        transfer_listeners.on_transfer_complete = [&](const TransferProgress& progress, const std::optional<MediaFile>& received) {
            if (received) {
                std::cout << "bob: received " << received->name << " ("
                          << utilities::format_file_size(progress.total_size) << ")\n";
                delivered = true;
            }
        };
        bob.engine->set_event_listeners(transfer_listeners);

        FileMetadata metadata = alice.manager->send_file(call_id, file,
            [&](const FileMetadata& meta, const FileChunk& chunk) {
                if (chunk.chunk_index == 0) {
                    bob.manager->begin_file_receive(incoming_id, meta);
                }
                bob.manager->receive_file_chunk(incoming_id, chunk);
            });
        std::cout << "alice: sent " << metadata.total_chunks << " chunk(s), sha256 "
                  << metadata.file_hash.substr(0, 16) << "...\n";

        alice.manager->end_call(call_id, std::string("demo finished"));
        wait_until([&]() {
            auto session = bob.manager->get_call_session(incoming_id);
            return session && is_terminal_call_state(session->state);
        });

        CallStats stats = alice.manager->get_call_stats();
        std::cout << "\nalice: " << stats.total_calls << " call(s), " << stats.completed_calls
                  << " completed, success rate " << stats.success_rate << "%\n";

        bob.manager->destroy();
        alice.manager->destroy();

        return delivered ? 0 : 1;

    } catch (const RtcError& e) {
        std::cerr << "Error [" << error_code_to_string(e.code()) << "]: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
