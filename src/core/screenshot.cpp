#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "screenshot.hpp"
#include <chrono>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <cstring>

namespace retrohost {

bool Screenshot::frame_to_rgba(const VideoFrame& frame, std::vector<uint8_t>& rgba) {
    if (!frame.has_pixels() || frame.format != PixelFormat::XRGB8888 ||
        frame.width == 0 || frame.height == 0) {
        return false;
    }

    const size_t row_bytes = static_cast<size_t>(frame.width) * 4;
    if (frame.pitch < row_bytes || frame.pixels->size() < frame.pitch * (frame.height - 1) + row_bytes) {
        return false;
    }

    rgba.resize(row_bytes * frame.height);
    const uint8_t* src = frame.pixels->data();

    for (unsigned y = 0; y < frame.height; y++) {
        const uint8_t* row = src + y * frame.pitch;
        for (unsigned x = 0; x < frame.width; x++) {
            uint32_t pixel;
            std::memcpy(&pixel, row + x * 4, sizeof(pixel));
            size_t i = (static_cast<size_t>(y) * frame.width + x) * 4;
            // XRGB to RGBA, top byte ignored
            rgba[i + 0] = (pixel >> 16) & 0xFF; // R
            rgba[i + 1] = (pixel >> 8) & 0xFF;  // G
            rgba[i + 2] = pixel & 0xFF;         // B
            rgba[i + 3] = 0xFF;                 // A
        }
    }
    return true;
}

bool Screenshot::save_png(const std::filesystem::path& path, const VideoFrame& frame) {
    std::vector<uint8_t> rgba_data;
    if (!frame_to_rgba(frame, rgba_data)) {
        std::cerr << "[Screenshot] No software frame to save" << std::endl;
        return false;
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
    }
    catch (const std::exception& e) {
        std::cerr << "[Screenshot] Failed to create directory: " << e.what() << std::endl;
        return false;
    }

    int width = static_cast<int>(frame.width);
    int height = static_cast<int>(frame.height);
    int result = stbi_write_png(path.string().c_str(),
                                width, height,
                                4, // RGBA
                                rgba_data.data(),
                                width * 4); // stride

    if (result) {
        std::cout << "[Screenshot] Saved: " << path << std::endl;
    } else {
        std::cerr << "[Screenshot] Failed to save: " << path << std::endl;
    }

    return result != 0;
}

std::string Screenshot::generate_filename(const std::string& prefix) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << prefix << "_"
        << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S")
        << "_" << std::setfill('0') << std::setw(3) << ms.count()
        << ".png";

    return oss.str();
}

} // namespace retrohost
