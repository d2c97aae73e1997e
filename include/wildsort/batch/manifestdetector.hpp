#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <wildsort/core/errors.hpp>
#include <wildsort/core/media.hpp>
#include <wildsort/core/types.hpp>
#include <wildsort/config/configloader.hpp>
#include <wildsort/batch/detector.hpp>

namespace wildsort {

/**
 * Detector that replays detector output recorded in a YAML manifest:
 *
 *   names: {0: Wolf, 1: Deer}
 *   files:
 *     - file: wolf_007.mp4
 *       frames:
 *         - index: 0
 *           detections:
 *             - {class: 0, conf: 0.91, box: [10, 20, 50, 40]}
 *         - index: 1
 *           unreadable: true
 *
 * Files are matched by file name. Video or image is decided by the file extension.
 */
class manifest_detector : public detector {
public:
    struct recorded_frame {
        std::size_t index = 0;
        bool unreadable = false;
        detections_t detections;
    };

    explicit manifest_detector(const YAML::Node &manifest, label_map_t fallbackNames = {});

    static std::unique_ptr<manifest_detector> from_file(const std::filesystem::path &path, label_map_t fallbackNames = {});

    std::unique_ptr<detection_stream> open(const std::filesystem::path &file) override;

    std::size_t file_count() const;
    const label_map_t &names() const;

private:
    std::vector<recorded_frame> parse_frames(const YAML::Node &frames, const std::string &file) const;

    label_map_t m_names;
    std::map<std::string, std::vector<recorded_frame>> m_files;
};

class recorded_stream : public detection_stream {
public:
    recorded_stream(source_kind kind, std::string name, std::vector<manifest_detector::recorded_frame> frames)
        : m_kind(kind)
        , m_name(std::move(name))
        , m_frames(std::move(frames))
    {}

    source_kind kind() const override { return m_kind; }

    std::optional<frame_detections> next() override
    {
        if (m_pos >= m_frames.size())
            return std::nullopt;

        const manifest_detector::recorded_frame &frame = m_frames[m_pos++];
        if (frame.unreadable)
            throw detector_failure(fmt::format("Frame {} of {} could not be read", frame.index, m_name));

        return frame_detections { frame.index, frame.detections };
    }

private:
    source_kind m_kind;
    std::string m_name;
    std::vector<manifest_detector::recorded_frame> m_frames;
    std::size_t m_pos = 0;
};

// Definitions

inline manifest_detector::manifest_detector(const YAML::Node &manifest, label_map_t fallbackNames)
{
    if (!manifest || !manifest.IsMap())
        throw configuration_error("Detection manifest must be a YAML mapping");

    m_names = manifest["names"] ? parse_names(manifest["names"]) : std::move(fallbackNames);

    const YAML::Node files = manifest["files"];
    if (!files || !files.IsSequence())
        throw configuration_error("Detection manifest missing 'files' list");

    try {
        for (const auto &entry : files) {
            if (!entry["file"])
                throw configuration_error("Manifest entry without 'file'");

            const std::string name = std::filesystem::path(entry["file"].as<std::string>()).filename().string();
            if (m_files.count(name))
                throw configuration_error(fmt::format("'{}' is listed twice in the detection manifest", name));

            m_files[name] = parse_frames(entry["frames"], name);
        }
    } catch (const YAML::Exception &e) {
        throw configuration_error(fmt::format("Invalid detection manifest: {}", e.what()));
    }
}

inline std::unique_ptr<manifest_detector> manifest_detector::from_file(const std::filesystem::path &path, label_map_t fallbackNames)
{
    YAML::Node manifest;
    try {
        manifest = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &e) {
        throw configuration_error(fmt::format("Could not parse detection manifest {}: {}", path.string(), e.what()));
    }

    return std::make_unique<manifest_detector>(manifest, std::move(fallbackNames));
}

inline std::vector<manifest_detector::recorded_frame> manifest_detector::parse_frames(const YAML::Node &frames, const std::string &file) const
{
    std::vector<recorded_frame> recorded;
    if (!frames)
        return recorded;

    if (!frames.IsSequence())
        throw configuration_error(fmt::format("'frames' of {} must be a list", file));

    std::size_t next_index = 0;
    for (const auto &node : frames) {
        recorded_frame frame;
        frame.index = node["index"] ? node["index"].as<std::size_t>() : next_index;
        frame.unreadable = node["unreadable"] ? node["unreadable"].as<bool>() : false;
        next_index = frame.index + 1;

        if (const YAML::Node detections = node["detections"]) {
            for (const auto &d : detections) {
                detection det;
                det.species_id = d["class"].as<int>();
                det.species_name = d["name"] ? d["name"].as<std::string>() : label_for(m_names, det.species_id);
                det.conf = d["conf"].as<float>();

                if (const YAML::Node box = d["box"]) {
                    const std::vector<float> xywh = box.as<std::vector<float>>();
                    if (xywh.size() != 4)
                        throw configuration_error(fmt::format("Box in {} frame {} must be [x, y, w, h]", file, frame.index));

                    det.box = cv::Rect2f(xywh[0], xywh[1], xywh[2], xywh[3]);
                }

                frame.detections.emplace_back(std::move(det));
            }
        }

        recorded.emplace_back(std::move(frame));
    }

    return recorded;
}

inline std::unique_ptr<detection_stream> manifest_detector::open(const std::filesystem::path &file)
{
    const std::optional<source_kind> kind = media_kind(file);
    if (!kind)
        throw detector_failure(fmt::format("{} is neither a supported video nor image", file.string()));

    auto it = m_files.find(file.filename().string());
    if (it == m_files.end())
        throw detector_failure(fmt::format("No recorded detections for {}", file.string()));

    logger()->trace("Replaying {} frames for {}", it->second.size(), file.filename().string());
    return std::make_unique<recorded_stream>(kind.value(), file.filename().string(), it->second);
}

inline std::size_t manifest_detector::file_count() const
{
    return m_files.size();
}

inline const label_map_t &manifest_detector::names() const
{
    return m_names;
}

}
