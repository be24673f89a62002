#pragma once

#include "dmp_audio.h"
#include "dmp_errors.h"
#include "dmp_media_file.h"
#include <memory>
#include <string>

namespace dmp {

// Decode the whole audio stream of a file into `out` (resampled and
// channel-mapped by the decoder). Used for previewing saved dubs and for
// playing audio-only sources.
Result<AudioBuffer> LoadAudioFile(const std::string& path, const AudioFormat& out);
Result<AudioBuffer> LoadAudioFile(const std::shared_ptr<MediaFile>& media_file,
                                  const AudioFormat& out);

} // namespace dmp
