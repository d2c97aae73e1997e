#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <wildsort/core/types.hpp>

namespace wildsort {

inline std::string lower_extension(const std::filesystem::path &path)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return ext;
}

inline bool is_image(const std::filesystem::path &path)
{
    static const std::unordered_set<std::string> image_exts = {
        ".jpg", ".jpeg", ".png", ".bmp", ".tiff", ".tif", ".webp"
    };

    return image_exts.count(lower_extension(path)) > 0;
}

inline bool is_video(const std::filesystem::path &path)
{
    static const std::unordered_set<std::string> video_exts = {
        ".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv", ".webm"
    };

    return video_exts.count(lower_extension(path)) > 0;
}

inline std::optional<source_kind> media_kind(const std::filesystem::path &path)
{
    if (is_video(path))
        return source_kind::Video;

    if (is_image(path))
        return source_kind::Image;

    return std::nullopt;
}

// Supported media directly inside `folder`, sorted by file name. Throws
// std::filesystem::filesystem_error when the folder can't be listed.
inline std::vector<std::filesystem::path> collect_media(const std::filesystem::path &folder)
{
    std::vector<std::filesystem::path> files;
    for (const auto &entry : std::filesystem::directory_iterator(folder)) {
        if (entry.is_regular_file() && media_kind(entry.path()))
            files.emplace_back(entry.path());
    }

    std::sort(files.begin(), files.end(),
              [](const std::filesystem::path &a, const std::filesystem::path &b) {
                  return a.filename().string() < b.filename().string();
              });

    return files;
}

}
