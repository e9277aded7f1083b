#pragma once

#include <memory>
#include <string>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>

namespace vs {
    // "auto" picks the first /dev/video0..9 that exists, a bare number N maps to /dev/videoN,
    // anything else is used as a path. Throws std::runtime_error if "auto" finds nothing.
    std::string resolve_webcam_device(const std::string& device);

    std::string build_source_pipeline(const SourceConfig& cfg, const std::string& sink_name);

    std::unique_ptr<IFrameSource> make_frame_source(const SourceConfig& cfg);
}
