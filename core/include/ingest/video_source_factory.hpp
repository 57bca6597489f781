#pragma once

#include <memory>
#include <string>

#include <common/config.hpp>
#include <ingest/gst_video_source.hpp>
#include <pipeline/event_loop.hpp>

namespace ovs {
    // gst-launch description for the configured source, ending in a BGR appsink.
    std::string build_pipeline(const SourceConfig& cfg, const std::string& sink_name);

    std::unique_ptr<GstVideoSource> make_video_source(EventLoop& loop,
                                                      const SourceConfig& cfg,
                                                      const DisplayConfig& display);
}
