#pragma once

#include "dmp_errors.h"
#include "dmp_time.h"
#include <memory>
#include <string>

namespace dmp {

class MediaFileImpl;

// Stream summary of a source media file
struct MediaFileInfo {
    std::string path;
    TimeUS duration_us = 0;

    bool has_video = false;
    int32_t video_width = 0;
    int32_t video_height = 0;

    bool has_audio = false;
    int32_t audio_sample_rate = 0;
    int32_t audio_channels = 0;

    double duration_seconds() const { return us_to_seconds(duration_us); }
};

// An opened media container (video or audio).
// Holds the demuxer open for as long as the object lives.
class MediaFile {
public:
    ~MediaFile();

    MediaFile(const MediaFile&) = delete;
    MediaFile& operator=(const MediaFile&) = delete;

    // FileNotFound, Unsupported (no audio or video stream) or Internal
    static Result<std::shared_ptr<MediaFile>> Open(const std::string& path);

    // Open, summarize and close
    static Result<MediaFileInfo> Probe(const std::string& path);

    const MediaFileInfo& info() const;

    // Internal access for the audio loader (not part of public API)
    MediaFileImpl* impl_ptr() const { return m_impl.get(); }

    // Public for make_shared; use Open() instead
    MediaFile(std::unique_ptr<MediaFileImpl> impl, MediaFileInfo info);

private:
    std::unique_ptr<MediaFileImpl> m_impl;
    MediaFileInfo m_info;
};

} // namespace dmp
