/**
 * @file collaborators.hpp
 * @brief External collaborator interfaces consumed by the call session manager
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - PermissionChecker: capability checks before privileged operations
 * - MediaEngine: peer connection and local capture (codec layer)
 * - NetworkQualityProbe: bandwidth / latency / loss measurements
 */

#pragma once

#include "rtcomm/rtc_config.hpp"
#include "rtcomm/signal_types.hpp"

#include <optional>
#include <set>
#include <string>

namespace rtcomm {

// ============================================================================
// Permissions
// ============================================================================

/**
 * @brief Call-control and conference capabilities
 */
enum class Permission {
    VOICE_CALL_INITIATE,
    VIDEO_CALL_INITIATE,
    GROUP_CALL_CREATE,
    GROUP_CALL_JOIN,
    GROUP_CALL_INVITE,
    GROUP_CALL_MANAGE,
    CALL_ANSWER,
    CALL_REJECT,
    CALL_END,
    MICROPHONE_TOGGLE,
    CAMERA_TOGGLE,
    SPEAKER_TOGGLE,
    SCREEN_SHARE,
    FILE_SEND,
    FILE_RECEIVE,
    QUALITY_CONTROL
};

/**
 * @brief Permission identifier ("webrtc_call_answer", ...)
 */
std::string permission_to_string(Permission permission);
std::optional<Permission> string_to_permission(const std::string& str);

/**
 * @brief Capability collaborator
 */
class PermissionChecker {
public:
    virtual ~PermissionChecker() = default;

    /**
     * @brief Check whether the local user holds a capability
     */
    virtual bool has_permission(Permission permission) const = 0;
};

/**
 * @brief Set-backed PermissionChecker
 */
class GrantedPermissions : public PermissionChecker {
public:
    GrantedPermissions() = default;
    explicit GrantedPermissions(std::set<Permission> granted);

    /**
     * @brief Every permission granted
     */
    static GrantedPermissions all();

    bool has_permission(Permission permission) const override;

    void grant(Permission permission);
    void revoke(Permission permission);

private:
    std::set<Permission> granted_;
};

// ============================================================================
// Media Engine
// ============================================================================

/**
 * @brief Peer connection and capture layer
 *
 * Implementations may throw any std::exception; the call session manager
 * treats a throw as a failure of the operation in progress.
 */
class MediaEngine {
public:
    virtual ~MediaEngine() = default;

    virtual void acquire_local_media(const std::string& call_id, const MediaConstraints& constraints) = 0;
    virtual void release_local_media(const std::string& call_id) = 0;

    /// Create an offer for a remote peer, returns SDP
    virtual std::string create_offer(const std::string& remote_user_id, const MediaConstraints& constraints) = 0;

    /// Apply a remote offer and create the answer, returns SDP
    virtual std::string create_answer(const std::string& remote_user_id, const std::string& offer_sdp) = 0;

    virtual void apply_answer(const std::string& remote_user_id, const std::string& answer_sdp) = 0;
    virtual void add_ice_candidate(const std::string& remote_user_id, const IceCandidateData& candidate) = 0;
    virtual void close_peer(const std::string& remote_user_id) = 0;

    virtual void set_audio_enabled(bool enabled) = 0;
    virtual void set_video_enabled(bool enabled) = 0;
    virtual void switch_camera() = 0;
    virtual void start_screen_capture() = 0;
    virtual void stop_screen_capture() = 0;

    virtual void apply_video_preset(const VideoPreset& preset) = 0;
};

// ============================================================================
// Network Quality
// ============================================================================

/**
 * @brief Source of network measurements for a call
 */
class NetworkQualityProbe {
public:
    virtual ~NetworkQualityProbe() = default;

    /**
     * @brief Current measurement, std::nullopt if none is available
     */
    virtual std::optional<NetworkSample> sample(const std::string& call_id) = 0;
};

} // namespace rtcomm
