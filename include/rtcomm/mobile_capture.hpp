/**
 * @file mobile_capture.hpp
 * @brief Picker-mode resolution and re-validation of captured files
 *
 * RTComm - Real-Time Communication Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Thin layer over the TransferEngine predicates for files coming from a
 * device camera, gallery or file browser. The platform performs the actual
 * capture and hands the resulting files in.
 */

#pragma once

#include "rtcomm/media_file.hpp"
#include "rtcomm/transfer_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rtcomm {

/**
 * @brief Requested picker mode
 */
enum class PickerMode {
    CAMERA,
    GALLERY,
    FILE,
    AUTO    ///< Camera on mobile devices with a camera, file browser otherwise
};

/**
 * @brief Which camera the platform should open
 */
enum class CameraFacing {
    FRONT,
    BACK
};

/**
 * @brief Device capabilities reported by the platform
 */
struct DeviceProfile {
    bool is_mobile = false;
    bool camera_available = false;
};

/**
 * @brief Picker options
 */
struct PickerOptions {
    std::string accept = "*/*";     ///< MIME patterns / extensions, comma separated
    bool multiple = false;          ///< Keep more than one file
    double quality = 0.8;           ///< Camera image quality (0.0 - 1.0)
    int max_width = 1920;           ///< Camera image bounding box
    int max_height = 1080;
    CameraFacing preferred_camera = CameraFacing::BACK;
};

/**
 * @brief Files accepted from one picker interaction
 */
struct PickResult {
    std::vector<MediaFile> files;
    PickerMode source = PickerMode::FILE;   ///< Never AUTO
    bool cancelled = false;
};

/**
 * @brief Outcome of re-validating a picked file
 */
struct MobileValidation {
    bool valid = false;
    std::optional<std::string> reason;      ///< Set when invalid
    std::vector<std::string> suggestions;   ///< Hints for the user
};

std::string picker_mode_to_string(PickerMode mode);
std::optional<PickerMode> string_to_picker_mode(const std::string& str);

/**
 * @brief MobileCapture - capture-path helper bound to one device profile
 */
class MobileCapture {
public:
    MobileCapture(std::shared_ptr<TransferEngine> engine, DeviceProfile profile);

    /**
     * @brief Resolve AUTO to a concrete mode
     */
    PickerMode resolve_picker_mode(PickerMode mode) const;

    /**
     * @brief Platform capture attribute for the preferred camera ("user" / "environment")
     */
    static std::string capture_hint(CameraFacing facing);

    /**
     * @brief Re-validate a picked file with the engine predicates
     * @return Validation result with size and network hints
     */
    MobileValidation validate_mobile_file(const MediaFile& file) const;

    /**
     * @brief Filter and prepare files returned by the platform picker
     *
     * Files not matching the accept filter are dropped. Camera images are
     * re-encoded as JPEG within the option's bounding box, falling back to
     * the original file when compression fails. An empty selection is a
     * cancelled pick.
     *
     * @param mode Requested mode (AUTO is resolved)
     * @param files Files handed over by the platform
     * @param options Picker options
     */
    PickResult accept_picked_files(PickerMode mode, std::vector<MediaFile> files,
                                   const PickerOptions& options = PickerOptions{}) const;

    /**
     * @brief Check a file against an accept filter ("image/*,.pdf")
     */
    static bool matches_accept(const MediaFile& file, const std::string& accept);

    const DeviceProfile& device_profile() const { return profile_; }

private:
    std::shared_ptr<TransferEngine> engine_;
    DeviceProfile profile_;

    MediaFile prepare_camera_image(const MediaFile& file, const PickerOptions& options) const;
};

} // namespace rtcomm
