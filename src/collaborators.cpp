/**
 * @file collaborators.cpp
 * @brief Permission identifiers and the set-backed permission checker
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/collaborators.hpp"

#include <map>

namespace rtcomm {

namespace {

const std::map<Permission, std::string>& permission_names() {
    static const std::map<Permission, std::string> names = {
        {Permission::VOICE_CALL_INITIATE, "webrtc_voice_call_initiate"},
        {Permission::VIDEO_CALL_INITIATE, "webrtc_video_call_initiate"},
        {Permission::GROUP_CALL_CREATE, "webrtc_group_call_create"},
        {Permission::GROUP_CALL_JOIN, "webrtc_group_call_join"},
        {Permission::GROUP_CALL_INVITE, "webrtc_group_call_invite"},
        {Permission::GROUP_CALL_MANAGE, "webrtc_group_call_manage"},
        {Permission::CALL_ANSWER, "webrtc_call_answer"},
        {Permission::CALL_REJECT, "webrtc_call_reject"},
        {Permission::CALL_END, "webrtc_call_end"},
        {Permission::MICROPHONE_TOGGLE, "webrtc_microphone_toggle"},
        {Permission::CAMERA_TOGGLE, "webrtc_camera_toggle"},
        {Permission::SPEAKER_TOGGLE, "webrtc_speaker_toggle"},
        {Permission::SCREEN_SHARE, "webrtc_screen_share"},
        {Permission::FILE_SEND, "webrtc_file_send"},
        {Permission::FILE_RECEIVE, "webrtc_file_receive"},
        {Permission::QUALITY_CONTROL, "webrtc_quality_control"}
    };
    return names;
}

} // anonymous namespace

std::string permission_to_string(Permission permission) {
    return permission_names().at(permission);
}

std::optional<Permission> string_to_permission(const std::string& str) {
    for (const auto& [permission, name] : permission_names()) {
        if (name == str) {
            return permission;
        }
    }
    return std::nullopt;
}

GrantedPermissions::GrantedPermissions(std::set<Permission> granted)
    : granted_(std::move(granted)) {
}

GrantedPermissions GrantedPermissions::all() {
    std::set<Permission> granted;
    for (const auto& [permission, name] : permission_names()) {
        granted.insert(permission);
    }
    return GrantedPermissions(std::move(granted));
}

bool GrantedPermissions::has_permission(Permission permission) const {
    return granted_.count(permission) > 0;
}

void GrantedPermissions::grant(Permission permission) {
    granted_.insert(permission);
}

void GrantedPermissions::revoke(Permission permission) {
    granted_.erase(permission);
}

} // namespace rtcomm
