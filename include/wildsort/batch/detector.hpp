#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include <wildsort/core/types.hpp>

namespace wildsort {

// Raw detector output for one file, frame by frame
class detection_stream {
public:
    virtual ~detection_stream() = default;

    virtual source_kind kind() const = 0;

    // Next frame, std::nullopt once exhausted. Throws detector_failure when a frame can't
    // be read; the stream stays usable and the following call moves on to the next frame.
    virtual std::optional<frame_detections> next() = 0;
};

class detector {
public:
    virtual ~detector() = default;

    // Throws detector_failure when the file can't be opened at all.
    virtual std::unique_ptr<detection_stream> open(const std::filesystem::path &file) = 0;

    virtual void set_logger(std::shared_ptr<spdlog::logger> logger);

protected:
    std::shared_ptr<spdlog::logger> &logger();

private:
    std::shared_ptr<spdlog::logger> m_logger = spdlog::default_logger()->clone("wildsort.detector");
};

// Definitions

inline void detector::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    m_logger = logger;
}

inline std::shared_ptr<spdlog::logger> &detector::logger()
{
    return m_logger;
}

}
