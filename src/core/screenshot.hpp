#pragma once

#include "retrohost/core_types.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

namespace retrohost {

// Screenshot utility for saving core frames to PNG files
class Screenshot {
public:
    // Convert an XRGB8888 frame to tightly packed RGBA (alpha forced opaque)
    // Returns false for frames without pixels or in another format.
    static bool frame_to_rgba(const VideoFrame& frame, std::vector<uint8_t>& rgba);

    // Save a frame to a PNG file
    // Returns true on success
    static bool save_png(const std::filesystem::path& path, const VideoFrame& frame);

    // Generate a timestamped filename for screenshots
    static std::string generate_filename(const std::string& prefix = "screenshot");
};

} // namespace retrohost
