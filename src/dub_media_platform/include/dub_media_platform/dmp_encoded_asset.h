#pragma once

#include "dmp_errors.h"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dmp {

// Default basename offered when the dub is saved
constexpr const char* DEFAULT_ASSET_BASENAME = "dubbed-audio";

// Immutable container-formatted audio file bytes.
// Copies share the same underlying bytes.
class EncodedAudioAsset {
public:
    EncodedAudioAsset();
    EncodedAudioAsset(std::vector<uint8_t> bytes, std::string mime_type, std::string extension);

    const std::vector<uint8_t>& bytes() const { return *m_bytes; }
    size_t size() const { return m_bytes->size(); }
    bool empty() const { return m_bytes->empty(); }

    const std::string& mime_type() const { return m_mime_type; }
    const std::string& extension() const { return m_extension; }

    // "dubbed-audio.<ext>"
    std::string suggested_filename() const;

    Result<void> WriteToFile(const std::string& path) const;

private:
    std::shared_ptr<const std::vector<uint8_t>> m_bytes;
    std::string m_mime_type;
    std::string m_extension;
};

// Opaque reference to a registered asset. Must be released through the
// store that issued it once nothing refers to it any more.
struct AssetHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    // Stable textual form, e.g. "dmp-asset:3"
    std::string url() const;

    bool operator==(const AssetHandle& o) const { return id == o.id; }
    bool operator!=(const AssetHandle& o) const { return id != o.id; }
};

// Registry of playable assets handed to the presentation layer.
// Thread-safe.
class AssetStore {
public:
    AssetStore() = default;
    ~AssetStore();

    AssetStore(const AssetStore&) = delete;
    AssetStore& operator=(const AssetStore&) = delete;

    AssetHandle Register(EncodedAudioAsset asset);

    // InvalidArg if the handle was never issued or has been released
    Result<EncodedAudioAsset> Resolve(const AssetHandle& handle) const;

    // Returns false if the handle was not live (double release is harmless)
    bool Release(const AssetHandle& handle);

    // Release every live handle; returns how many were released
    size_t ReleaseAll();

    size_t live_count() const;

private:
    mutable std::mutex m_mutex;
    std::map<uint64_t, EncodedAudioAsset> m_assets;
    uint64_t m_next_id = 1;
};

} // namespace dmp
