#include <dub_media_platform/dmp_base64.h>

extern "C" {
#include <libavutil/base64.h>
}

#include <climits>

namespace dmp {

Result<std::vector<uint8_t>> DecodeBase64(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            continue;
        }
        compact.push_back(c);
    }

    if (compact.empty()) {
        return std::vector<uint8_t>();
    }
    if (compact.size() > static_cast<size_t>(INT_MAX / 3)) {
        return Error::resource_exhausted("Base64 payload too large: " +
                                         std::to_string(compact.size()) + " chars");
    }

    std::vector<uint8_t> out(static_cast<size_t>(AV_BASE64_DECODE_SIZE(compact.size())) + 1);
    int written = av_base64_decode(out.data(), compact.c_str(), static_cast<int>(out.size()));
    if (written < 0) {
        return Error::decode_failed("Invalid base64 audio payload");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

} // namespace dmp
