/**
 * @file mobile_capture.cpp
 * @brief Implementation of the mobile capture path
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "rtcomm/mobile_capture.hpp"
#include "rtcomm/errors.hpp"
#include "rtcomm/utilities.hpp"

#include <cmath>

namespace rtcomm {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

std::string effective_mime(const MediaFile& file) {
    if (!file.mime_type.empty()) {
        return utilities::to_lowercase(file.mime_type);
    }
    return mime_type_for_extension(utilities::file_extension(file.name));
}

} // anonymous namespace

std::string picker_mode_to_string(PickerMode mode) {
    switch (mode) {
        case PickerMode::CAMERA: return "camera";
        case PickerMode::GALLERY: return "gallery";
        case PickerMode::FILE: return "file";
        case PickerMode::AUTO: return "auto";
    }
    return "auto";
}

std::optional<PickerMode> string_to_picker_mode(const std::string& str) {
    if (str == "camera") return PickerMode::CAMERA;
    if (str == "gallery") return PickerMode::GALLERY;
    if (str == "file") return PickerMode::FILE;
    if (str == "auto") return PickerMode::AUTO;
    return std::nullopt;
}

MobileCapture::MobileCapture(std::shared_ptr<TransferEngine> engine, DeviceProfile profile)
    : engine_(std::move(engine))
    , profile_(profile) {
    if (!engine_) {
        throw RtcError(ErrorCode::InvalidArgument, "MobileCapture requires a TransferEngine");
    }
}

PickerMode MobileCapture::resolve_picker_mode(PickerMode mode) const {
    if (mode != PickerMode::AUTO) {
        return mode;
    }
    return profile_.is_mobile && profile_.camera_available ? PickerMode::CAMERA : PickerMode::FILE;
}

std::string MobileCapture::capture_hint(CameraFacing facing) {
    return facing == CameraFacing::FRONT ? "user" : "environment";
}

bool MobileCapture::matches_accept(const MediaFile& file, const std::string& accept) {
    std::string filter = utilities::trim_string(accept);
    if (filter.empty()) {
        return true;
    }

    std::string mime = effective_mime(file);
    std::string ext = utilities::file_extension(file.name);

    for (const auto& raw : utilities::split_string(filter, ',')) {
        std::string pattern = utilities::to_lowercase(utilities::trim_string(raw));
        if (pattern.empty()) {
            continue;
        }
        if (pattern == "*/*" || pattern == "*") {
            return true;
        }
        if (pattern[0] == '.') {
            if (pattern.substr(1) == ext) {
                return true;
            }
        } else if (utilities::ends_with(pattern, "/*")) {
            if (utilities::starts_with(mime, pattern.substr(0, pattern.size() - 1))) {
                return true;
            }
        } else if (pattern == mime) {
            return true;
        }
    }

    return false;
}

MobileValidation MobileCapture::validate_mobile_file(const MediaFile& file) const {
    MobileValidation result;

    if (!engine_->validate_file_type(file)) {
        result.reason = "Unsupported file type";
        result.suggestions = {"Choose a file in a supported format"};
        return result;
    }

    if (!engine_->validate_file_size(file)) {
        auto max_mb = static_cast<long long>(std::lround(engine_->get_max_file_size() / BYTES_PER_MB));
        result.reason = "File exceeds the size limit (" + std::to_string(max_mb) + "MB)";
        result.suggestions = {
            "Lower the image quality",
            "Choose a smaller file",
            "Capture with the camera to compress automatically"
        };
        return result;
    }

    result.valid = true;

    if (profile_.is_mobile) {
        double size_mb = file.size() / BYTES_PER_MB;
        std::string mime = effective_mime(file);

        if (size_mb > 10.0) {
            result.suggestions.push_back("Transfer large files over Wi-Fi");
        }
        if (utilities::starts_with(mime, "image/") && size_mb > 5.0) {
            result.suggestions.push_back("Lower the image quality to shorten the transfer");
        }
        if (utilities::starts_with(mime, "video/") && size_mb > 20.0) {
            result.suggestions.push_back("Compress the video before sending");
        }
    }

    return result;
}

MediaFile MobileCapture::prepare_camera_image(const MediaFile& file, const PickerOptions& options) const {
    media::CompressionOptions compression;
    compression.quality = options.quality;
    compression.max_width = options.max_width;
    compression.max_height = options.max_height;
    compression.format = "jpeg";

    try {
        return engine_->compress_image(file, compression);
    } catch (const RtcError& e) {
        utilities::log_warn("Camera image compression failed, keeping original " + file.name + ": " + e.what());
        return file;
    }
}

PickResult MobileCapture::accept_picked_files(
    PickerMode mode,
    std::vector<MediaFile> files,
    const PickerOptions& options
) const {
    PickResult result;
    result.source = resolve_picker_mode(mode);

    // The camera only ever yields still images
    std::string accept = result.source == PickerMode::CAMERA ? "image/*" : options.accept;

    for (auto& file : files) {
        if (!matches_accept(file, accept)) {
            utilities::log_debug("Picker dropped " + file.name + " (accept " + accept + ")");
            continue;
        }
        result.files.push_back(std::move(file));
    }

    bool multiple = options.multiple && result.source != PickerMode::CAMERA;
    if (!multiple && result.files.size() > 1) {
        result.files.resize(1);
    }

    if (result.source == PickerMode::CAMERA) {
        for (auto& file : result.files) {
            file = prepare_camera_image(file, options);
        }
    }

    result.cancelled = result.files.empty();
    utilities::log_debug("Picker (" + picker_mode_to_string(result.source) + ") accepted " +
                         std::to_string(result.files.size()) + " file(s)");
    return result;
}

} // namespace rtcomm
